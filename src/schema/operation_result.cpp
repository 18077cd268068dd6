#include <quartermaster/schema/operation_result.hpp>

namespace quartermaster::schema {

operation_result_t make_success(const std::string_view codespace,
                                const std::string_view entity_id) {
  auto result = operation_result_t{};
  result.codespace = std::string{codespace};
  if (!entity_id.empty()) {
    result.entity_id = std::string{entity_id};
  }
  return result;
}

operation_result_t make_failure(const std::string_view codespace,
                                const error_code_t code,
                                const std::string_view log,
                                const std::string_view info) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.info = std::string{info};
  result.codespace = std::string{codespace};
  return result;
}

bool succeeded(const operation_result_t& result) {
  return result.code == 0;
}

std::optional<error_code_t> error_of(const operation_result_t& result) {
  if (result.code == 0) {
    return std::nullopt;
  }
  return static_cast<error_code_t>(result.code);
}

}  // namespace quartermaster::schema
