#include <gtest/gtest.h>
#include <quartermaster/config/settings.hpp>
#include <quartermaster/testing/common.hpp>

#include <array>
#include <fstream>
#include <string>

namespace config = quartermaster::config;
namespace po = boost::program_options;
namespace qr = quartermaster::qr;
using quartermaster::schema::kMillisecondsPerDay;
using quartermaster::testing::make_db_path;
using quartermaster::testing::remove_path;

TEST(settings, defaults_are_valid) {
  auto values = config::settings{};
  EXPECT_TRUE(config::validate(values).empty());
  EXPECT_EQ(config::make_deriver_options(values).overdue_after,
            7 * kMillisecondsPerDay);

  auto options = config::make_export_options(values);
  EXPECT_EQ(options.folder, "asset_qrs");
  EXPECT_EQ(options.render.width, 400u);
  EXPECT_EQ(options.render.margin, 1u);
  EXPECT_EQ(options.ecc, qr::error_correction_t::medium);
}

TEST(settings, validate_reports_each_problem) {
  auto values = config::settings{};
  values.database_path.clear();
  values.log_level = "loud";
  values.overdue_days = 0;
  values.qr_width = 0;
  values.qr_error_correction = "Z";
  values.archive_folder = "a/b";
  values.signature_width = 0;

  auto problems = config::validate(values);
  ASSERT_EQ(problems.size(), 7u);
  EXPECT_EQ(problems[0], "database path must not be empty");
  EXPECT_EQ(problems[1], "unknown log level 'loud'");
  EXPECT_EQ(problems[4], "unknown QR error correction level 'Z'");
}

TEST(settings, command_line_overrides_config_file) {
  const auto path = make_db_path("quartermaster_settings") + ".ini";
  {
    auto out = std::ofstream{path};
    out << "overdue-days = 3\n"
        << "qr-ecc = H\n"
        << "archive-folder = labels\n"
        << "unknown-key = ignored\n";
  }

  auto values = config::settings{};
  auto description = po::options_description{"Settings"};
  config::add_settings_options(description, values);

  auto argv = std::array<const char*, 3>{"quartermaster", "--qr-ecc", "L"};
  auto vm = po::variables_map{};
  po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(),
                                   description),
            vm);
  config::merge_config_file(path, description, vm);
  remove_path(path);

  EXPECT_EQ(values.overdue_days, 3u);
  EXPECT_EQ(values.qr_error_correction, "L");
  EXPECT_EQ(values.archive_folder, "labels");
  EXPECT_EQ(values.qr_width, 400u);
  EXPECT_EQ(config::make_deriver_options(values).overdue_after,
            3 * kMillisecondsPerDay);
}

TEST(settings, malformed_config_file_throws) {
  const auto path = make_db_path("quartermaster_settings_bad") + ".ini";
  {
    auto out = std::ofstream{path};
    out << "overdue-days = soon\n";
  }

  auto values = config::settings{};
  auto description = po::options_description{"Settings"};
  config::add_settings_options(description, values);
  auto vm = po::variables_map{};
  EXPECT_THROW(config::merge_config_file(path, description, vm), po::error);
  remove_path(path);
}
