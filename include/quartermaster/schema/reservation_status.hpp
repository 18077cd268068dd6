#pragma once

#include <quartermaster/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: reservation status.
// Reservations are advisory; no status here constrains the lifecycle engine.
namespace quartermaster::schema {

enum class reservation_status_t : uint8_t {
  pending = 0,
  confirmed = 1,
  cancelled = 2
};

inline constexpr auto kReservationStatusMappings =
    std::array{std::pair<std::string_view, reservation_status_t>{
                   "Pending", reservation_status_t::pending},
               std::pair<std::string_view, reservation_status_t>{
                   "Confirmed", reservation_status_t::confirmed},
               std::pair<std::string_view, reservation_status_t>{
                   "Cancelled", reservation_status_t::cancelled}};

template <>
inline std::optional<reservation_status_t>
try_from_string<reservation_status_t>(const std::string_view value) {
  return from_string(value, kReservationStatusMappings);
}

inline constexpr std::string_view to_string(const reservation_status_t value) {
  return to_string(value, kReservationStatusMappings).value_or("unknown");
}

}  // namespace quartermaster::schema
