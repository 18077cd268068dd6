#pragma once

#include <quartermaster/schema/asset_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    quartermaster::schema,
    asset_status_t,
    quartermaster::schema::asset_status_t::available,
    quartermaster::schema::asset_status_t::borrowed,
    quartermaster::schema::asset_status_t::maintenance,
    quartermaster::schema::asset_status_t::lost)
