#pragma once

#include <quartermaster/schema/transaction_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    quartermaster::schema,
    transaction_type_t,
    quartermaster::schema::transaction_type_t::borrow,
    quartermaster::schema::transaction_type_t::return_item,
    quartermaster::schema::transaction_type_t::maintenance_log)
