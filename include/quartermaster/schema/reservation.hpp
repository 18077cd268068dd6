#pragma once
#include <quartermaster/schema/primitives.hpp>
#include <quartermaster/schema/reservation_status.hpp>
#include <string>

namespace quartermaster::schema {

template <uint16_t Version>
struct reservation;

// Schema type: reservation.
// Dates are `YYYY-MM-DD`; overlapping reservations are allowed.
template <>
struct reservation<1> final {
  uint16_t version{1};
  std::string reservation_id;
  std::string asset_id;
  std::string user_id;
  std::string start_date;
  std::string end_date;
  reservation_status_t status{reservation_status_t::pending};
};

using reservation_t = reservation<1>;

}  // namespace quartermaster::schema
