#pragma once

#include <quartermaster/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction type.
// Kind of ledger entry. Maintenance entries are log-only and never move the
// asset between states.
namespace quartermaster::schema {

enum class transaction_type_t : uint8_t {
  borrow = 0,
  return_item = 1,
  maintenance_log = 2
};

inline constexpr auto kTransactionTypeMappings =
    std::array{std::pair<std::string_view, transaction_type_t>{
                   "Borrow", transaction_type_t::borrow},
               std::pair<std::string_view, transaction_type_t>{
                   "Return", transaction_type_t::return_item},
               std::pair<std::string_view, transaction_type_t>{
                   "Maintenance", transaction_type_t::maintenance_log}};

template <>
inline std::optional<transaction_type_t> try_from_string<transaction_type_t>(
    const std::string_view value) {
  return from_string(value, kTransactionTypeMappings);
}

inline constexpr std::string_view to_string(const transaction_type_t value) {
  return to_string(value, kTransactionTypeMappings).value_or("unknown");
}

}  // namespace quartermaster::schema
