#pragma once

#include <quartermaster/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace quartermaster::schema {

enum class notification_severity_t : uint8_t {
  warning = 1,
  critical = 3,
};

inline constexpr auto kNotificationSeverityMappings =
    std::array{std::pair<std::string_view, notification_severity_t>{
                   "warning", notification_severity_t::warning},
               std::pair<std::string_view, notification_severity_t>{
                   "critical", notification_severity_t::critical}};

inline constexpr std::string_view to_string(
    const notification_severity_t value) {
  return to_string(value, kNotificationSeverityMappings).value_or("unknown");
}

}  // namespace quartermaster::schema
