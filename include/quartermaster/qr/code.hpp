#pragma once
#include <quartermaster/image/bitmap.hpp>
#include <quartermaster/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quartermaster::qr {

enum class error_correction_t : uint8_t {
  low = 0,
  medium = 1,
  quartile = 2,
  high = 3
};

/// Accepts `L`, `M`, `Q`, `H` in any case.
std::optional<error_correction_t> parse_error_correction(
    std::string_view value);
std::string_view to_string(error_correction_t value);

/// QR Model 2 symbol as produced by libqrencode. `modules` is row-major, one
/// byte per module, non-zero for dark.
struct symbol final {
  uint32_t version{};
  uint32_t size{};
  error_correction_t ecc{error_correction_t::medium};
  std::vector<uint8_t> modules;

  bool dark(uint32_t x, uint32_t y) const;
};

/// Encode `payload` as 8-bit data at the smallest version that fits. Fails
/// when the payload exceeds version 40 capacity.
std::optional<symbol> encode_text(std::string_view payload,
                                  error_correction_t ecc,
                                  std::string& error);

struct render_options final {
  /// Output edge in pixels. Modules scale fractionally so the image is exactly
  /// this wide; too small a width falls back to four pixels per module.
  uint32_t width{400};
  /// Quiet zone in modules.
  uint32_t margin{1};
};

image::bitmap render(const symbol& code, const render_options& options = {});

/// Encode, render and compress `payload` as a PNG image.
std::optional<schema::bytes_t> render_png(std::string_view payload,
                                          error_correction_t ecc,
                                          const render_options& options,
                                          std::string& error);

}  // namespace quartermaster::qr
