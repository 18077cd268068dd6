#pragma once
#include <quartermaster/schema/primitives.hpp>
#include <quartermaster/schema/transaction_type.hpp>
#include <optional>
#include <string>

namespace quartermaster::schema {

template <uint16_t Version>
struct transaction;

// Schema type: transaction.
// Immutable ledger entry. Asset and user names are copied at creation time and
// are never re-joined against later edits.
template <>
struct transaction<1> final {
  uint16_t version{1};
  std::string transaction_id;
  uint64_t sequence{};
  std::string asset_id;
  std::string asset_name;
  std::string user_id;
  std::string user_name;
  transaction_type_t type{transaction_type_t::borrow};
  timestamp_milliseconds_t timestamp{};
  std::string signature;
  std::optional<std::string> notes;
};

using transaction_t = transaction<1>;

}  // namespace quartermaster::schema
