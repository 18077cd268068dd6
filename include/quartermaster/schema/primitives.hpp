#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quartermaster::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

inline constexpr duration_milliseconds_t kMillisecondsPerDay = 86'400'000;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

/// Wrap `payload` as a self-contained `data:<mime>;base64,` URI.
std::string make_data_uri(std::string_view mime, const bytes_view_t& payload);

/// Split a base64 data URI back into its payload; std::nullopt when the
/// string is not a base64 data URI.
std::optional<bytes_t> try_from_data_uri(std::string_view uri,
                                         std::string* mime = nullptr);

/// ASCII lower-casing used by every case-insensitive search and header match.
std::string to_lower(std::string_view value);

/// Case-insensitive substring test; an empty needle always matches.
bool contains_ignore_case(std::string_view haystack, std::string_view needle);

std::string_view trim(std::string_view value);

}  // namespace quartermaster::schema
