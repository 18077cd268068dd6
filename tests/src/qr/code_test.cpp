#include <gtest/gtest.h>
#include <quartermaster/image/png.hpp>
#include <quartermaster/qr/code.hpp>

#include <string>

using namespace quartermaster::schema;
namespace image = quartermaster::image;
namespace qr = quartermaster::qr;

TEST(qr_code, parses_error_correction_levels) {
  EXPECT_EQ(qr::parse_error_correction("L"), qr::error_correction_t::low);
  EXPECT_EQ(qr::parse_error_correction("m"), qr::error_correction_t::medium);
  EXPECT_EQ(qr::parse_error_correction("Q"), qr::error_correction_t::quartile);
  EXPECT_EQ(qr::parse_error_correction("h"), qr::error_correction_t::high);
  EXPECT_FALSE(qr::parse_error_correction("").has_value());
  EXPECT_FALSE(qr::parse_error_correction("MM").has_value());
  EXPECT_FALSE(qr::parse_error_correction("X").has_value());
  EXPECT_EQ(qr::to_string(qr::error_correction_t::quartile), "Q");
}

TEST(qr_code, picks_the_smallest_version) {
  auto error = std::string{};
  auto small = qr::encode_text(std::string(14, 'A'),
                               qr::error_correction_t::medium, error);
  ASSERT_TRUE(small.has_value()) << error;
  EXPECT_EQ(small->version, 1u);
  EXPECT_EQ(small->size, 21u);

  auto larger = qr::encode_text(std::string(15, 'A'),
                                qr::error_correction_t::medium, error);
  ASSERT_TRUE(larger.has_value()) << error;
  EXPECT_EQ(larger->version, 2u);
  EXPECT_EQ(larger->size, 25u);
  EXPECT_EQ(larger->modules.size(), 25u * 25u);
  EXPECT_EQ(larger->ecc, qr::error_correction_t::medium);
}

TEST(qr_code, stronger_correction_needs_a_larger_symbol) {
  auto error = std::string{};
  auto low = qr::encode_text(std::string(17, 'x'), qr::error_correction_t::low,
                             error);
  ASSERT_TRUE(low.has_value()) << error;
  EXPECT_EQ(low->version, 1u);

  auto high = qr::encode_text(std::string(17, 'x'),
                              qr::error_correction_t::high, error);
  ASSERT_TRUE(high.has_value()) << error;
  EXPECT_EQ(high->version, 3u);
}

TEST(qr_code, draws_function_patterns) {
  auto error = std::string{};
  auto code = qr::encode_text("AST-001", qr::error_correction_t::medium, error);
  ASSERT_TRUE(code.has_value()) << error;
  const auto last = code->size - 1;

  EXPECT_TRUE(code->dark(0, 0));
  EXPECT_TRUE(code->dark(3, 3));
  EXPECT_FALSE(code->dark(1, 1));
  EXPECT_FALSE(code->dark(7, 7));
  EXPECT_TRUE(code->dark(last, 0));
  EXPECT_TRUE(code->dark(0, last));
  EXPECT_TRUE(code->dark(8, code->size - 8));
  EXPECT_TRUE(code->dark(6, 8));
  EXPECT_FALSE(code->dark(6, 9));
  EXPECT_TRUE(code->dark(8, 6));
  EXPECT_FALSE(code->dark(9, 6));
}

TEST(qr_code, rejects_empty_payloads) {
  auto error = std::string{};
  EXPECT_FALSE(
      qr::encode_text("", qr::error_correction_t::medium, error).has_value());
  EXPECT_EQ(error, "QR payload is empty");
}

TEST(qr_code, rejects_oversized_payloads) {
  auto error = std::string{};
  auto code = qr::encode_text(std::string(2954, 'x'),
                              qr::error_correction_t::low, error);
  EXPECT_FALSE(code.has_value());
  EXPECT_EQ(error, "payload of 2954 bytes does not fit in a QR symbol");

  auto largest = qr::encode_text(std::string(2953, 'x'),
                                 qr::error_correction_t::low, error);
  ASSERT_TRUE(largest.has_value());
  EXPECT_EQ(largest->version, 40u);
}

TEST(qr_code, renders_to_the_requested_width) {
  auto error = std::string{};
  auto code = qr::encode_text("AST-001", qr::error_correction_t::medium, error);
  ASSERT_TRUE(code.has_value()) << error;

  auto canvas = qr::render(*code, {.width = 400, .margin = 1});
  EXPECT_EQ(canvas.width, 400u);
  EXPECT_EQ(canvas.height, 400u);
  EXPECT_EQ(image::pixel_at(canvas, 0, 0), image::kWhite);
  EXPECT_EQ(image::pixel_at(canvas, 25, 25), image::kBlack);

  auto tiny = qr::render(*code, {.width = 10, .margin = 1});
  EXPECT_EQ(tiny.width, 23u * 4u);
}

TEST(qr_code, render_png_decodes_to_the_same_raster) {
  auto error = std::string{};
  auto png = qr::render_png("AST-002", qr::error_correction_t::medium,
                            {.width = 200, .margin = 2}, error);
  ASSERT_TRUE(png.has_value()) << error;

  auto decoded = image::decode_png(make_bytes_view(*png), error);
  ASSERT_TRUE(decoded.has_value()) << error;
  auto code = qr::encode_text("AST-002", qr::error_correction_t::medium, error);
  ASSERT_TRUE(code.has_value());
  auto expected = qr::render(*code, {.width = 200, .margin = 2});
  EXPECT_EQ(decoded->width, expected.width);
  EXPECT_EQ(decoded->pixels, expected.pixels);
}
