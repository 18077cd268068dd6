#include <gtest/gtest.h>
#include <quartermaster/schema/asset_status.hpp>
#include <quartermaster/schema/error_code.hpp>
#include <quartermaster/schema/notification_severity.hpp>
#include <quartermaster/schema/reservation_status.hpp>
#include <quartermaster/schema/transaction_type.hpp>
#include <quartermaster/schema/user_role.hpp>

using namespace quartermaster::schema;

TEST(enum_types, asset_status_names_round_trip) {
  for (const auto& [name, value] : kAssetStatusMappings) {
    EXPECT_EQ(to_string(value), name);
    EXPECT_EQ(try_from_string<asset_status_t>(name), value);
  }
  EXPECT_EQ(to_string(asset_status_t::borrowed), "Borrowed");
}

TEST(enum_types, parsing_ignores_letter_case) {
  EXPECT_EQ(try_from_string<asset_status_t>("maintenance"),
            asset_status_t::maintenance);
  EXPECT_EQ(try_from_string<asset_status_t>("LOST"), asset_status_t::lost);
  EXPECT_EQ(try_from_string<user_role_t>("operator"), user_role_t::operator_);
  EXPECT_EQ(try_from_string<reservation_status_t>("Confirmed"),
            reservation_status_t::confirmed);
}

TEST(enum_types, unknown_names_are_rejected) {
  EXPECT_FALSE(try_from_string<asset_status_t>("Retired").has_value());
  EXPECT_FALSE(try_from_string<user_role_t>("").has_value());
  EXPECT_FALSE(try_from_string<transaction_type_t>("Borrowed").has_value());
}

TEST(enum_types, ledger_types_use_display_names) {
  EXPECT_EQ(to_string(transaction_type_t::borrow), "Borrow");
  EXPECT_EQ(to_string(transaction_type_t::return_item), "Return");
  EXPECT_EQ(to_string(transaction_type_t::maintenance_log), "Maintenance");
  EXPECT_EQ(try_from_string<transaction_type_t>("return"),
            transaction_type_t::return_item);
}

TEST(enum_types, severity_and_error_names) {
  EXPECT_EQ(to_string(notification_severity_t::warning), "warning");
  EXPECT_EQ(to_string(notification_severity_t::critical), "critical");
  EXPECT_EQ(to_string(error_code_t::not_found), "not_found");
  EXPECT_EQ(to_string(error_code_t::invalid_transition), "invalid_transition");
  EXPECT_EQ(static_cast<uint32_t>(error_code_t::invalid_argument), 6u);
  EXPECT_EQ(to_string(error_code_t::storage_unavailable),
            "storage_unavailable");
}
