#include <gtest/gtest.h>
#include <quartermaster/common/time.hpp>
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/operation_result.hpp>
#include <quartermaster/schema/primitives.hpp>

#include <string>

using namespace quartermaster::schema;

TEST(primitives, base64_round_trips_bytes) {
  auto payload = bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = to_base64(payload);
  EXPECT_EQ(encoded, "AQID/v8=");
  auto decoded = try_from_base64(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, base64_handles_padding_lengths) {
  EXPECT_EQ(to_base64(make_bytes(std::string_view{"f"})), "Zg==");
  EXPECT_EQ(to_base64(make_bytes(std::string_view{"fo"})), "Zm8=");
  EXPECT_EQ(to_base64(make_bytes(std::string_view{"foo"})), "Zm9v");
  EXPECT_EQ(to_base64(bytes_t{}), "");
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(try_from_base64("not base64***").has_value());
  EXPECT_FALSE(try_from_base64("abc").has_value());
  EXPECT_FALSE(try_from_base64("a=bc").has_value());
}

TEST(primitives, data_uri_carries_mime_and_payload) {
  auto payload = bytes_t{0x89, 0x50, 0x4E, 0x47};
  auto uri = make_data_uri("image/png", payload);
  EXPECT_EQ(uri, "data:image/png;base64,iVBORw==");

  auto mime = std::string{};
  auto decoded = try_from_data_uri(uri, &mime);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(mime, "image/png");
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, data_uri_rejects_other_schemes) {
  EXPECT_FALSE(try_from_data_uri("https://example.com/x.png").has_value());
  EXPECT_FALSE(try_from_data_uri("data:text/plain,hello").has_value());
}

TEST(primitives, contains_ignore_case_matches_substrings) {
  EXPECT_TRUE(contains_ignore_case("Sony Alpha a7 IV", "alpha"));
  EXPECT_TRUE(contains_ignore_case("Sony Alpha a7 IV", ""));
  EXPECT_FALSE(contains_ignore_case("Sony", "canon"));
  EXPECT_EQ(to_lower("MacBook"), "macbook");
  EXPECT_EQ(trim("  value\t\r\n"), "value");
}

TEST(primitives, asset_helpers_derive_from_id) {
  EXPECT_EQ(make_qr_code("AST-001"), "qr-AST-001");
  EXPECT_EQ(make_placeholder_image_url("AST-001"),
            "https://picsum.photos/400/300?random=AST-001");

  auto value = asset_t{};
  EXPECT_TRUE(holder_matches_status(value));
  value.status = asset_status_t::borrowed;
  EXPECT_FALSE(holder_matches_status(value));
  value.current_holder = "Alice Chen";
  EXPECT_TRUE(holder_matches_status(value));
  value.status = asset_status_t::lost;
  EXPECT_FALSE(holder_matches_status(value));
}

TEST(primitives, operation_results_report_codes) {
  auto success = make_success("quartermaster.test", "AST-001");
  EXPECT_TRUE(succeeded(success));
  EXPECT_EQ(success.entity_id, std::optional<std::string>{"AST-001"});
  EXPECT_FALSE(error_of(success).has_value());
  EXPECT_FALSE(make_success("quartermaster.test", {}).entity_id.has_value());

  auto failure = make_failure("quartermaster.test", error_code_t::not_found,
                              "asset not found", "AST-404");
  EXPECT_FALSE(succeeded(failure));
  EXPECT_EQ(failure.code, 1u);
  EXPECT_EQ(error_of(failure), error_code_t::not_found);
  EXPECT_EQ(failure.info, "AST-404");
  EXPECT_EQ(failure.codespace, "quartermaster.test");
}

TEST(time, formats_and_parses_dates) {
  namespace common = quartermaster::common;
  EXPECT_EQ(common::format_date(0), "1970-01-01");
  EXPECT_EQ(common::format_date(1718452800000), "2024-06-15");

  auto parsed = common::try_parse_date("2024-06-15");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, 1718409600000u);

  EXPECT_TRUE(common::try_parse_date("2024-02-29").has_value());
  EXPECT_FALSE(common::try_parse_date("2023-02-29").has_value());
  EXPECT_FALSE(common::try_parse_date("2024-13-01").has_value());
  EXPECT_FALSE(common::try_parse_date("2024/06/15").has_value());
  EXPECT_FALSE(common::try_parse_date("").has_value());

  auto civil = common::to_civil_time(1718452800000 + 90'000);
  EXPECT_EQ(civil.hour, 12u);
  EXPECT_EQ(civil.minute, 1u);
  EXPECT_EQ(civil.second, 30u);
}
