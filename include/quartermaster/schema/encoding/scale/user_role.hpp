#pragma once

#include <quartermaster/schema/user_role.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    quartermaster::schema,
    user_role_t,
    quartermaster::schema::user_role_t::admin,
    quartermaster::schema::user_role_t::staff,
    quartermaster::schema::user_role_t::viewer,
    quartermaster::schema::user_role_t::operator_)
