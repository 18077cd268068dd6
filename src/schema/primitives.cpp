#include <quartermaster/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace quartermaster::schema {

namespace {

constexpr auto kDataUriPrefix = std::string_view{"data:"};
constexpr auto kBase64Marker = std::string_view{";base64,"};

std::optional<uint8_t> decode_base64_char(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<uint8_t>(ch - 'A');
  }
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<uint8_t>(ch - 'a' + 26);
  }
  if (ch >= '0' && ch <= '9') {
    return static_cast<uint8_t>(ch - '0' + 52);
  }
  if (ch == '+') {
    return uint8_t{62};
  }
  if (ch == '/') {
    return uint8_t{63};
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
    }
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    } else {
      out.push_back('=');
    }
    out.push_back('=');
  }

  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
      compact.push_back(ch);
    }
  }
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (size_t i = 0; i < compact.size(); i += 4) {
    const auto is_last_chunk = (i + 4) == compact.size();
    auto value = uint32_t{};
    auto padding = size_t{0};
    for (size_t j = 0; j < 4; ++j) {
      const auto ch = compact[i + j];
      if (ch == '=') {
        if (!is_last_chunk || j < 2) {
          return std::nullopt;
        }
        ++padding;
        value <<= 6u;
        continue;
      }
      if (padding > 0) {
        return std::nullopt;
      }
      auto decoded = decode_base64_char(ch);
      if (!decoded) {
        return std::nullopt;
      }
      value = (value << 6u) | *decoded;
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return out;
}

std::string make_data_uri(const std::string_view mime,
                          const bytes_view_t& payload) {
  auto uri = std::string{kDataUriPrefix};
  uri.append(mime);
  uri.append(kBase64Marker);
  uri.append(to_base64(payload));
  return uri;
}

std::optional<bytes_t> try_from_data_uri(const std::string_view uri,
                                         std::string* mime) {
  if (!uri.starts_with(kDataUriPrefix)) {
    return std::nullopt;
  }
  const auto marker = uri.find(kBase64Marker);
  if (marker == std::string_view::npos) {
    return std::nullopt;
  }
  if (mime != nullptr) {
    *mime = std::string{
        uri.substr(kDataUriPrefix.size(), marker - kDataUriPrefix.size())};
  }
  return try_from_base64(uri.substr(marker + kBase64Marker.size()));
}

std::string to_lower(const std::string_view value) {
  auto out = std::string{value};
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](const unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  return out;
}

bool contains_ignore_case(const std::string_view haystack,
                          const std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace quartermaster::schema
