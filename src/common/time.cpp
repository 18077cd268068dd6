#include <quartermaster/common/time.hpp>

#include <charconv>
#include <chrono>
#include <cstdio>

namespace quartermaster::common {

namespace {

// Days since 1970-01-01 to a proleptic Gregorian date (H. Hinnant).
civil_date civil_from_days(int64_t days) {
  days += 719468;
  const auto era = (days >= 0 ? days : days - 146096) / 146097;
  const auto day_of_era = static_cast<uint64_t>(days - era * 146097);
  const auto year_of_era =
      (day_of_era - day_of_era / 1460 + day_of_era / 36524 -
       day_of_era / 146096) /
      365;
  const auto day_of_year =
      day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
  const auto shifted_month = (5 * day_of_year + 2) / 153;
  const auto day = day_of_year - (153 * shifted_month + 2) / 5 + 1;
  const auto month = shifted_month < 10 ? shifted_month + 3 : shifted_month - 9;
  const auto year = static_cast<int64_t>(year_of_era) + era * 400 +
                    (month <= 2 ? 1 : 0);
  return civil_date{.year = static_cast<int32_t>(year),
                    .month = static_cast<uint32_t>(month),
                    .day = static_cast<uint32_t>(day)};
}

int64_t days_from_civil(int64_t year, uint32_t month, uint32_t day) {
  year -= month <= 2 ? 1 : 0;
  const auto era = (year >= 0 ? year : year - 399) / 400;
  const auto year_of_era = static_cast<uint64_t>(year - era * 400);
  const auto day_of_year =
      (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const auto day_of_era =
      year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
  return era * 146097 + static_cast<int64_t>(day_of_era) - 719468;
}

std::optional<uint32_t> parse_digits(std::string_view value) {
  auto result = uint32_t{};
  const auto* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, result);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return result;
}

bool is_leap_year(uint32_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

uint32_t days_in_month(uint32_t year, uint32_t month) {
  static constexpr uint32_t kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDays[month - 1];
}

}  // namespace

clock_t system_clock() {
  return [] {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  };
}

civil_time to_civil_time(schema::timestamp_milliseconds_t timestamp) {
  const auto seconds = static_cast<int64_t>(timestamp / 1000);
  const auto days = seconds / 86400;
  const auto seconds_of_day = static_cast<uint32_t>(seconds % 86400);
  return civil_time{.date = civil_from_days(days),
                    .hour = seconds_of_day / 3600,
                    .minute = (seconds_of_day % 3600) / 60,
                    .second = seconds_of_day % 60};
}

std::string format_date(schema::timestamp_milliseconds_t timestamp) {
  const auto date = to_civil_time(timestamp).date;
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year,
                date.month, date.day);
  return buffer;
}

std::optional<schema::timestamp_milliseconds_t> try_parse_date(
    std::string_view value) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
    return std::nullopt;
  }
  auto year = parse_digits(value.substr(0, 4));
  auto month = parse_digits(value.substr(5, 2));
  auto day = parse_digits(value.substr(8, 2));
  if (!year || !month || !day || *year < 1970 || *month < 1 || *month > 12 ||
      *day < 1 || *day > days_in_month(*year, *month)) {
    return std::nullopt;
  }
  const auto days = days_from_civil(*year, *month, *day);
  return static_cast<schema::timestamp_milliseconds_t>(days) *
         schema::kMillisecondsPerDay;
}

}  // namespace quartermaster::common
