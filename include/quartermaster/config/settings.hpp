#pragma once
#include <boost/program_options.hpp>
#include <quartermaster/notify/deriver.hpp>
#include <quartermaster/qr/batch_export.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace quartermaster::config {

/// Runtime settings shared by every command. Values come from the command
/// line first, then from the optional INI-style config file, then defaults.
struct settings final {
  std::string database_path{"quartermaster.db"};
  std::string log_level{"info"};
  std::string log_file;
  uint32_t overdue_days{7};
  uint32_t qr_width{400};
  uint32_t qr_margin{1};
  std::string qr_error_correction{"M"};
  std::string archive_folder{qr::kDefaultArchiveFolder};
  uint32_t signature_width{300};
  std::string analyst_command;
};

/// Register the settings options, bound to `values`, on `description`.
void add_settings_options(boost::program_options::options_description& description,
                          settings& values);

/// Merge `path` into `vm`; values already present in `vm` win. Unknown keys
/// are ignored. Throws boost::program_options::error on malformed files.
void merge_config_file(
    const std::string& path,
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

/// Human-readable problems with `values`; empty when valid.
std::vector<std::string> validate(const settings& values);

notify::deriver_options make_deriver_options(const settings& values);

/// Requires a valid error correction level; call validate() first.
qr::batch_export_options make_export_options(const settings& values);

}  // namespace quartermaster::config
