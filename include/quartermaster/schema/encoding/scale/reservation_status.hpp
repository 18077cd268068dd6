#pragma once

#include <quartermaster/schema/reservation_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    quartermaster::schema,
    reservation_status_t,
    quartermaster::schema::reservation_status_t::pending,
    quartermaster::schema::reservation_status_t::confirmed,
    quartermaster::schema::reservation_status_t::cancelled)
