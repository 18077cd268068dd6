#include <spdlog/spdlog.h>
#include <quartermaster/common/critical.hpp>
#include <quartermaster/config/settings.hpp>
#include <algorithm>
#include <array>

namespace po = boost::program_options;

namespace quartermaster::config {

namespace {

constexpr auto kLogLevels = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

}  // namespace

void add_settings_options(po::options_description& description,
                          settings& values) {
  description.add_options()(
      "db", po::value<std::string>(&values.database_path)
                ->default_value(values.database_path),
      "RocksDB database directory")(
      "log-level",
      po::value<std::string>(&values.log_level)
          ->default_value(values.log_level),
      "trace|debug|info|warn|error|critical|off")(
      "log-file",
      po::value<std::string>(&values.log_file)->default_value(values.log_file),
      "also write logs to this file")(
      "overdue-days",
      po::value<uint32_t>(&values.overdue_days)
          ->default_value(values.overdue_days),
      "days after which a borrow is overdue")(
      "qr-width",
      po::value<uint32_t>(&values.qr_width)->default_value(values.qr_width),
      "QR image width in pixels")(
      "qr-margin",
      po::value<uint32_t>(&values.qr_margin)->default_value(values.qr_margin),
      "QR quiet zone in modules")(
      "qr-ecc",
      po::value<std::string>(&values.qr_error_correction)
          ->default_value(values.qr_error_correction),
      "QR error correction level L|M|Q|H")(
      "archive-folder",
      po::value<std::string>(&values.archive_folder)
          ->default_value(values.archive_folder),
      "folder name inside QR archives")(
      "signature-width",
      po::value<uint32_t>(&values.signature_width)
          ->default_value(values.signature_width),
      "signature surface width in pixels")(
      "analyst-command",
      po::value<std::string>(&values.analyst_command)
          ->default_value(values.analyst_command),
      "command run by the insight command with the snapshot path");
}

void merge_config_file(const std::string& path,
                       const po::options_description& description,
                       po::variables_map& vm) {
  po::store(po::parse_config_file<char>(path.c_str(), description, true), vm);
  po::notify(vm);
  spdlog::debug("Loaded configuration from {}", path);
}

std::vector<std::string> validate(const settings& values) {
  auto problems = std::vector<std::string>{};
  if (values.database_path.empty()) {
    problems.emplace_back("database path must not be empty");
  }
  if (std::find(std::begin(kLogLevels), std::end(kLogLevels),
                values.log_level) == std::end(kLogLevels)) {
    problems.push_back("unknown log level '" + values.log_level + "'");
  }
  if (values.overdue_days == 0) {
    problems.emplace_back("overdue threshold must be at least one day");
  }
  if (values.qr_width == 0) {
    problems.emplace_back("QR width must be positive");
  }
  if (!qr::parse_error_correction(values.qr_error_correction)) {
    problems.push_back("unknown QR error correction level '" +
                       values.qr_error_correction + "'");
  }
  if (values.archive_folder.empty() ||
      values.archive_folder.find('/') != std::string::npos) {
    problems.emplace_back("archive folder must be a single path segment");
  }
  if (values.signature_width == 0) {
    problems.emplace_back("signature width must be positive");
  }
  return problems;
}

notify::deriver_options make_deriver_options(const settings& values) {
  return notify::deriver_options{
      .overdue_after = values.overdue_days * schema::kMillisecondsPerDay};
}

qr::batch_export_options make_export_options(const settings& values) {
  auto ecc = qr::parse_error_correction(values.qr_error_correction);
  if (!ecc) {
    common::critical("invalid QR error correction level '{}'",
                     values.qr_error_correction);
  }
  return qr::batch_export_options{
      .folder = values.archive_folder,
      .render = qr::render_options{.width = values.qr_width,
                                   .margin = values.qr_margin},
      .ecc = *ecc};
}

}  // namespace quartermaster::config
