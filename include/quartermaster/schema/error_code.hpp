#pragma once

#include <quartermaster/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace quartermaster::schema {

// Zero is success; operation results carry these values in `code`.
enum class error_code_t : uint32_t {
  not_found = 1,
  duplicate_id = 2,
  invalid_transition = 3,
  encoding_failed = 4,
  external_service_unavailable = 5,
  invalid_argument = 6,
  storage_unavailable = 7,
};

inline constexpr auto kErrorCodeMappings =
    std::array{std::pair<std::string_view, error_code_t>{
                   "not_found", error_code_t::not_found},
               std::pair<std::string_view, error_code_t>{
                   "duplicate_id", error_code_t::duplicate_id},
               std::pair<std::string_view, error_code_t>{
                   "invalid_transition", error_code_t::invalid_transition},
               std::pair<std::string_view, error_code_t>{
                   "encoding_failed", error_code_t::encoding_failed},
               std::pair<std::string_view, error_code_t>{
                   "external_service_unavailable",
                   error_code_t::external_service_unavailable},
               std::pair<std::string_view, error_code_t>{
                   "invalid_argument", error_code_t::invalid_argument},
               std::pair<std::string_view, error_code_t>{
                   "storage_unavailable", error_code_t::storage_unavailable}};

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace quartermaster::schema
