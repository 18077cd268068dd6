#pragma once
#include <quartermaster/schema/notification_severity.hpp>
#include <quartermaster/schema/primitives.hpp>
#include <string>

namespace quartermaster::schema {

template <uint16_t Version>
struct notification;

// Derived alert; never persisted. `key` is `<kind>-<asset id>`.
template <>
struct notification<1> final {
  uint16_t version{1};
  std::string key;
  std::string title;
  std::string message;
  notification_severity_t severity{notification_severity_t::warning};
  std::string asset_id;
  timestamp_milliseconds_t generated_at{};
};

using notification_t = notification<1>;

}  // namespace quartermaster::schema
