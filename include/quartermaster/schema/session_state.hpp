#pragma once
#include <quartermaster/schema/primitives.hpp>
#include <map>
#include <string>

namespace quartermaster::schema {

template <uint16_t Version>
struct session_state;

// Schema type: session state.
// Id counters keyed by id prefix plus the ledger clock high-water mark.
template <>
struct session_state<1> final {
  uint16_t version{1};
  std::map<std::string, uint64_t> id_counters;
  uint64_t next_sequence{1};
  timestamp_milliseconds_t last_timestamp{};
};

using session_state_t = session_state<1>;

}  // namespace quartermaster::schema
