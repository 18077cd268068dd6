#pragma once
#include <quartermaster/schema/primitives.hpp>
#include <quartermaster/schema/session_state.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace quartermaster::storage {

using key_value_entry_t =
    std::pair<quartermaster::schema::bytes_t, quartermaster::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quartermaster::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const quartermaster::schema::bytes_view_t& key,
           const T& value);

  /// Load the id counters and ledger clock saved with the last commit.
  std::optional<quartermaster::schema::session_state_t> load_session_state()
      const;

  /// Persist the id counters and ledger clock.
  void save_session_state(
      const quartermaster::schema::session_state_t& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const quartermaster::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const quartermaster::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;

  /// Atomically clear every prefix in `prefixes` and write `entries`.
  void replace_by_prefixes(
      const std::vector<quartermaster::schema::bytes_t>& prefixes,
      const std::vector<key_value_entry_t>& entries) const;
};

}  // namespace quartermaster::storage
