#pragma once
#include <quartermaster/image/bitmap.hpp>
#include <quartermaster/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace quartermaster::image {

inline constexpr auto kPngMimeType = std::string_view{"image/png"};

/// Encode a grayscale bitmap as PNG. On failure returns std::nullopt and sets
/// `error`.
std::optional<schema::bytes_t> encode_png(const bitmap& image,
                                          std::string& error);

/// Decode any PNG into an 8-bit grayscale bitmap.
std::optional<bitmap> decode_png(const schema::bytes_view_t& bytes,
                                 std::string& error);

}  // namespace quartermaster::image
