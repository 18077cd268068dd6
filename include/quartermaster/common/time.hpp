#pragma once

#include <quartermaster/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace quartermaster::common {

/// Source of "now" in milliseconds since the Unix epoch.
///
/// Components take a clock instead of reading the system clock so that tests
/// can pin time (overdue detection, default purchase dates, archive stamps).
using clock_t = std::function<schema::timestamp_milliseconds_t()>;

clock_t system_clock();

struct civil_date final {
  int32_t year{1970};
  uint32_t month{1};
  uint32_t day{1};
};

struct civil_time final {
  civil_date date;
  uint32_t hour{};
  uint32_t minute{};
  uint32_t second{};
};

civil_time to_civil_time(schema::timestamp_milliseconds_t timestamp);

/// Format the UTC calendar day of `timestamp` as `YYYY-MM-DD`.
std::string format_date(schema::timestamp_milliseconds_t timestamp);

/// Parse a `YYYY-MM-DD` day into milliseconds at UTC midnight.
std::optional<schema::timestamp_milliseconds_t> try_parse_date(
    std::string_view value);

}  // namespace quartermaster::common
