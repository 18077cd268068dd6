#pragma once
#include <quartermaster/schema/error_code.hpp>
#include <quartermaster/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace quartermaster::schema {

template <uint16_t Version>
struct operation_result;

// Outcome of a mutating operation. `code` zero is success, anything else is an
// error_code_t value.
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<std::string> entity_id;
};

using operation_result_t = operation_result<1>;

operation_result_t make_success(std::string_view codespace,
                                std::string_view entity_id);

operation_result_t make_failure(std::string_view codespace,
                                error_code_t code,
                                std::string_view log,
                                std::string_view info = {});

bool succeeded(const operation_result_t& result);

/// std::nullopt for a successful result.
std::optional<error_code_t> error_of(const operation_result_t& result);

}  // namespace quartermaster::schema
