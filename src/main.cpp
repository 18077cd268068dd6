#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <quartermaster/bulk/mutator.hpp>
#include <quartermaster/common/logging.hpp>
#include <quartermaster/common/time.hpp>
#include <quartermaster/config/settings.hpp>
#include <quartermaster/csv/codec.hpp>
#include <quartermaster/insight/analyst.hpp>
#include <quartermaster/lifecycle/engine.hpp>
#include <quartermaster/notify/notification_center.hpp>
#include <quartermaster/qr/batch_export.hpp>
#include <quartermaster/schema/error_code.hpp>
#include <quartermaster/signature/pad.hpp>
#include <quartermaster/storage/persistence.hpp>
#include <quartermaster/store/asset_filter.hpp>
#include <quartermaster/store/entity_store.hpp>
#include <quartermaster/store/statistics.hpp>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace quartermaster;

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/// Thrown for malformed command input; reported with exit code 2.
class usage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name) || vm[name].as<std::string>().empty()) {
    throw usage_error{"missing required option --" + name};
  }
  return vm[name].as<std::string>();
}

std::optional<std::string> optional_value(const po::variables_map& vm,
                                          const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

std::vector<std::string> list_value(const po::variables_map& vm,
                                    const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

std::string require_id(const po::variables_map& vm) {
  auto ids = list_value(vm, "id");
  if (ids.size() != 1 || ids.front().empty()) {
    throw usage_error{"expected exactly one --id"};
  }
  return ids.front();
}

template <typename Enum>
Enum parse_enum(const std::string& name, const std::string& value) {
  auto parsed = schema::try_from_string<Enum>(value);
  if (!parsed) {
    throw usage_error{"invalid value '" + value + "' for --" + name};
  }
  return *parsed;
}

std::string read_file(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    throw usage_error{"cannot read " + path};
  }
  auto buffer = std::ostringstream{};
  buffer << input.rdbuf();
  return buffer.str();
}

void write_file(const std::string& path, const schema::bytes_view_t& bytes) {
  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!output) {
    throw usage_error{"cannot write " + path};
  }
  output.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  if (!output) {
    throw usage_error{"failed writing " + path};
  }
}

std::string format_timestamp(const schema::timestamp_milliseconds_t value) {
  auto civil = common::to_civil_time(value);
  char clock[8];
  std::snprintf(clock, sizeof(clock), "%02u:%02u", civil.hour, civil.minute);
  return common::format_date(value) + " " + clock;
}

int report(const schema::operation_result_t& result) {
  if (schema::succeeded(result)) {
    return kExitSuccess;
  }
  auto code = schema::error_of(result);
  std::cerr << "error [" << (code ? schema::to_string(*code) : "unknown")
            << "]: " << result.log;
  if (!result.info.empty()) {
    std::cerr << " (" << result.info << ")";
  }
  std::cerr << '\n';
  return kExitFailure;
}

void apply_features(schema::asset_t& value,
                    const std::vector<std::string>& features) {
  for (const auto& feature : features) {
    auto separator = feature.find('=');
    if (separator == std::string::npos || separator == 0) {
      throw usage_error{"feature must be KEY=VALUE, got '" + feature + "'"};
    }
    auto key = feature.substr(0, separator);
    auto text = feature.substr(separator + 1);
    if (text.empty()) {
      value.custom_features.erase(key);
    } else {
      value.custom_features[key] = text;
    }
  }
}

void apply_asset_fields(schema::asset_t& value, const po::variables_map& vm) {
  if (auto name = optional_value(vm, "name")) {
    value.name = *name;
  }
  if (auto category = optional_value(vm, "category")) {
    value.category = *category;
  }
  if (auto model = optional_value(vm, "model")) {
    value.model = *model;
  }
  if (auto serial = optional_value(vm, "serial")) {
    value.serial_number = *serial;
  }
  if (auto date = optional_value(vm, "purchase-date")) {
    value.purchase_date = *date;
  }
  if (auto image = optional_value(vm, "image-url")) {
    value.image_url = *image;
  }
  if (auto description = optional_value(vm, "description")) {
    value.description = description->empty()
                            ? std::nullopt
                            : std::optional<std::string>{*description};
  }
  apply_features(value, list_value(vm, "feature"));
}

store::asset_filter make_filter(const po::variables_map& vm) {
  auto filter = store::asset_filter{};
  filter.search = optional_value(vm, "search").value_or("");
  if (auto status = optional_value(vm, "status")) {
    filter.status = parse_enum<schema::asset_status_t>("status", *status);
  }
  filter.category = optional_value(vm, "category");
  filter.purchased_from = optional_value(vm, "from");
  filter.purchased_to = optional_value(vm, "to");
  return filter;
}

void print_asset(const schema::asset_t& value) {
  std::cout << value.asset_id << '\t' << schema::to_string(value.status)
            << '\t' << value.name << '\t' << value.category << '\t'
            << value.current_holder.value_or("-") << '\n';
}

std::string make_signature(const po::variables_map& vm,
                           const config::settings& values) {
  auto path = optional_value(vm, "strokes");
  if (!path) {
    return {};
  }
  auto error = std::string{};
  auto strokes = signature::parse_strokes(read_file(*path), error);
  if (!strokes) {
    throw usage_error{*path + ": " + error};
  }
  auto surface = signature::pad{values.signature_width};
  signature::replay(surface, *strokes);
  auto saved = surface.save(error);
  if (!saved) {
    throw usage_error{"signature: " + error};
  }
  return *saved;
}

int run_asset_add(store::entity_store& store, const po::variables_map& vm) {
  auto value = schema::asset_t{};
  value.name = require(vm, "name");
  value.category = std::string{csv::kDefaultCategory};
  value.model = std::string{csv::kDefaultModel};
  value.serial_number = std::string{csv::kDefaultSerialNumber};
  apply_asset_fields(value, vm);
  if (auto status = optional_value(vm, "status")) {
    value.status = parse_enum<schema::asset_status_t>("status", *status);
    value.current_holder = optional_value(vm, "holder");
  }
  auto result = store.insert_asset(std::move(value));
  if (schema::succeeded(result)) {
    std::cout << result.entity_id.value_or("") << '\n';
  }
  return report(result);
}

int run_asset_edit(store::entity_store& store, const po::variables_map& vm) {
  auto id = require_id(vm);
  const auto* existing = store.find_asset(id);
  if (existing == nullptr) {
    return report(schema::make_failure(store::kStoreCodespace,
                                       schema::error_code_t::not_found,
                                       "asset not found", id));
  }
  auto value = *existing;
  apply_asset_fields(value, vm);
  if (auto status = optional_value(vm, "status")) {
    value.status = parse_enum<schema::asset_status_t>("status", *status);
  }
  if (auto holder = optional_value(vm, "holder")) {
    value.current_holder = holder->empty()
                               ? std::nullopt
                               : std::optional<std::string>{*holder};
  }
  auto engine = lifecycle::engine{store};
  auto result = engine.edit_asset(std::move(value));
  if (schema::succeeded(result)) {
    std::cout << id << '\n';
  }
  return report(result);
}

int run_asset_list(store::entity_store& store, const po::variables_map& vm) {
  for (const auto* value : store::filter_assets(store, make_filter(vm))) {
    print_asset(*value);
  }
  return kExitSuccess;
}

int run_transition(store::entity_store& store,
                   const po::variables_map& vm,
                   const config::settings& values,
                   const bool borrowing) {
  auto request = lifecycle::transition_request{};
  request.asset_id = require_id(vm);
  request.user_name = optional_value(vm, "user").value_or("");
  request.signature = make_signature(vm, values);
  request.notes = optional_value(vm, "notes");

  auto engine = lifecycle::engine{store};
  auto result =
      borrowing ? engine.borrow(request) : engine.return_asset(request);
  if (schema::succeeded(result)) {
    std::cout << result.entity_id.value_or("") << '\n';
  }
  return report(result);
}

int run_maintenance(store::entity_store& store, const po::variables_map& vm) {
  auto engine = lifecycle::engine{store};
  auto result = engine.log_maintenance(require_id(vm), require(vm, "user"),
                                       optional_value(vm, "notes"));
  if (schema::succeeded(result)) {
    std::cout << result.entity_id.value_or("") << '\n';
  }
  return report(result);
}

int run_bulk_edit(store::entity_store& store, const po::variables_map& vm) {
  auto ids = list_value(vm, "id");
  if (ids.empty()) {
    throw usage_error{"bulk-edit requires at least one --id"};
  }
  auto patch = bulk::asset_patch{};
  if (auto status = optional_value(vm, "status")) {
    patch.status = parse_enum<schema::asset_status_t>("status", *status);
  }
  patch.category = optional_value(vm, "category");

  auto outcome = bulk::apply_patch(store, ids, patch);
  for (const auto& id : outcome.missing) {
    std::cerr << "missing: " << id << '\n';
  }
  if (schema::succeeded(outcome.result)) {
    std::cout << outcome.result.info << '\n';
  }
  return report(outcome.result);
}

int run_import(store::entity_store& store, const po::variables_map& vm) {
  auto outcome = csv::import_assets(store, read_file(require(vm, "file")));
  if (schema::succeeded(outcome.result)) {
    std::cout << "imported " << outcome.imported << ", skipped "
              << outcome.skipped << '\n';
  }
  return report(outcome.result);
}

int run_export(store::entity_store& store, const po::variables_map& vm) {
  auto selection = store::filter_assets(store, make_filter(vm));
  auto content = csv::export_assets(selection);
  if (!content) {
    return report(schema::make_failure(csv::kCsvCodespace,
                                       schema::error_code_t::invalid_argument,
                                       "no assets to export"));
  }
  auto path = optional_value(vm, "out").value_or(
      csv::make_export_file_name(store.now()));
  write_file(path, schema::make_bytes_view(*content));
  std::cout << path << '\n';
  return kExitSuccess;
}

int run_qr_export(store::entity_store& store,
                  const po::variables_map& vm,
                  const config::settings& values) {
  auto selection = std::vector<const schema::asset_t*>{};
  auto ids = list_value(vm, "id");
  if (ids.empty()) {
    selection = store.assets();
  }
  for (const auto& id : ids) {
    const auto* value = store.find_asset(id);
    if (value == nullptr) {
      return report(schema::make_failure(qr::kExportCodespace,
                                         schema::error_code_t::not_found,
                                         "asset not found", id));
    }
    selection.push_back(value);
  }

  auto exporter = qr::batch_exporter{config::make_export_options(values)};
  exporter.on_state_change([](const qr::export_state_t state) {
    spdlog::debug("QR export {}", qr::to_string(state));
  });
  auto outcome = exporter.run(selection, store.now());
  if (!schema::succeeded(outcome.result)) {
    return report(outcome.result);
  }
  for (const auto& id : outcome.skipped) {
    std::cerr << "skipped: " << id << '\n';
  }
  auto path = optional_value(vm, "out").value_or(outcome.file_name);
  write_file(path, outcome.archive);
  std::cout << path << '\n';
  return kExitSuccess;
}

int run_notifications(store::entity_store& store,
                      const config::settings& values) {
  auto center =
      notify::notification_center{store, config::make_deriver_options(values)};
  for (const auto& notification : center.notifications()) {
    std::cout << schema::to_string(notification.severity) << '\t'
              << notification.title << '\t' << notification.message << '\n';
  }
  return kExitSuccess;
}

int run_ledger(store::entity_store& store, const po::variables_map& vm) {
  auto entries = std::vector<const schema::transaction_t*>{};
  if (vm.contains("id")) {
    auto asset_id = std::optional<std::string>{require_id(vm)};
    if (store.find_asset(*asset_id) == nullptr) {
      return report(schema::make_failure(store::kStoreCodespace,
                                         schema::error_code_t::not_found,
                                         "asset not found", *asset_id));
    }
    entries = store.history(*asset_id);
  } else if (auto search = optional_value(vm, "search")) {
    entries = store.search_ledger(*search);
  } else {
    entries = store.ledger();
  }
  for (const auto* entry : entries) {
    std::cout << format_timestamp(entry->timestamp) << '\t'
              << schema::to_string(entry->type) << '\t' << entry->asset_id
              << '\t' << entry->asset_name << '\t' << entry->user_name << '\t'
              << entry->notes.value_or("") << '\n';
  }
  return kExitSuccess;
}

int run_user_add(store::entity_store& store, const po::variables_map& vm) {
  auto value = schema::user_t{};
  value.name = require(vm, "name");
  value.email = optional_value(vm, "email").value_or("");
  if (auto role = optional_value(vm, "role")) {
    value.role = parse_enum<schema::user_role_t>("role", *role);
  }
  value.department = optional_value(vm, "department");
  value.password = optional_value(vm, "password");
  auto result = store.insert_user(std::move(value));
  if (schema::succeeded(result)) {
    std::cout << result.entity_id.value_or("") << '\n';
  }
  return report(result);
}

int run_user_list(store::entity_store& store, const po::variables_map& vm) {
  auto search = optional_value(vm, "search").value_or("");
  for (const auto* value : store::search_users(store, search)) {
    std::cout << value->user_id << '\t' << value->name << '\t'
              << schema::to_string(value->role) << '\t' << value->email << '\t'
              << value->department.value_or("-") << '\n';
  }
  return kExitSuccess;
}

int run_reservation_add(store::entity_store& store,
                        const po::variables_map& vm) {
  auto value = schema::reservation_t{};
  value.asset_id = require_id(vm);
  value.user_id = require(vm, "user");
  value.start_date = require(vm, "start");
  value.end_date = require(vm, "end");
  if (auto status = optional_value(vm, "status")) {
    value.status = parse_enum<schema::reservation_status_t>("status", *status);
  }
  auto result = store.insert_reservation(std::move(value));
  if (schema::succeeded(result)) {
    std::cout << result.entity_id.value_or("") << '\n';
  }
  return report(result);
}

int run_reservation_list(store::entity_store& store) {
  for (const auto* value : store.reservations()) {
    std::cout << value->reservation_id << '\t' << value->asset_id << '\t'
              << value->user_id << '\t' << value->start_date << '\t'
              << value->end_date << '\t' << schema::to_string(value->status)
              << '\n';
  }
  return kExitSuccess;
}

int run_stats(store::entity_store& store) {
  auto statistics = store::compute_statistics(store.assets());
  std::cout << "total\t" << statistics.total << '\n'
            << "available\t" << statistics.available << '\n'
            << "borrowed\t" << statistics.borrowed << '\n'
            << "maintenance\t" << statistics.maintenance << '\n'
            << "lost\t" << statistics.lost << '\n';
  for (const auto& [category, count] : statistics.categories) {
    std::cout << "category:" << category << '\t' << count << '\n';
  }
  return kExitSuccess;
}

int run_insight(store::entity_store& store, const config::settings& values) {
  auto api_key = insight::api_key_from_environment();
  if (!api_key) {
    std::cout << insight::kMissingKeyMessage << '\n';
    return kExitSuccess;
  }
  if (values.analyst_command.empty()) {
    throw usage_error{"insight requires --analyst-command"};
  }
  auto service = insight::command_analyst{values.analyst_command};
  std::cout << insight::analyze_asset_health(store, service, api_key) << '\n';
  return kExitSuccess;
}

bool mutates(const std::string& command) {
  return command == "asset-add" || command == "asset-edit" ||
         command == "borrow" || command == "return" ||
         command == "maintenance" || command == "bulk-edit" ||
         command == "import" || command == "user-add" ||
         command == "reservation-add" || command == "seed";
}

int dispatch(const std::string& command,
             store::entity_store& store,
             const po::variables_map& vm,
             const config::settings& values) {
  if (command == "asset-add") {
    return run_asset_add(store, vm);
  }
  if (command == "asset-edit") {
    return run_asset_edit(store, vm);
  }
  if (command == "asset-list") {
    return run_asset_list(store, vm);
  }
  if (command == "borrow" || command == "return") {
    return run_transition(store, vm, values, command == "borrow");
  }
  if (command == "maintenance") {
    return run_maintenance(store, vm);
  }
  if (command == "bulk-edit") {
    return run_bulk_edit(store, vm);
  }
  if (command == "import") {
    return run_import(store, vm);
  }
  if (command == "export") {
    return run_export(store, vm);
  }
  if (command == "qr-export") {
    return run_qr_export(store, vm, values);
  }
  if (command == "notifications") {
    return run_notifications(store, values);
  }
  if (command == "ledger") {
    return run_ledger(store, vm);
  }
  if (command == "user-add") {
    return run_user_add(store, vm);
  }
  if (command == "user-list") {
    return run_user_list(store, vm);
  }
  if (command == "reservation-add") {
    return run_reservation_add(store, vm);
  }
  if (command == "reservation-list") {
    return run_reservation_list(store);
  }
  if (command == "stats") {
    return run_stats(store);
  }
  if (command == "insight") {
    return run_insight(store, values);
  }
  if (command == "seed") {
    auto result = store::seed_sample_data(store);
    return report(result);
  }
  throw usage_error{"unknown command '" + command + "'"};
}

int run(const std::string& command,
        const po::variables_map& vm,
        const config::settings& values) {
  auto database = storage::rocksdb_storage_t{};
  auto opened = storage::open_ledger_storage(values.database_path, database);
  if (!schema::succeeded(opened)) {
    return report(opened);
  }
  auto store = store::entity_store{};
  auto loaded = storage::load_store(database, store);
  if (!schema::succeeded(loaded)) {
    return report(loaded);
  }

  auto code = dispatch(command, store, vm, values);
  if (code == kExitSuccess && mutates(command)) {
    storage::save_store(database, store);
  }
  return code;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  quartermaster <command> [options]\n\n"
            << "Commands:\n"
            << "  asset-add asset-edit asset-list\n"
            << "  borrow return maintenance bulk-edit\n"
            << "  import export qr-export\n"
            << "  notifications ledger stats insight\n"
            << "  user-add user-list reservation-add reservation-list seed\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto values = config::settings{};

  auto general = po::options_description{"General options"};
  general.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "command to run")(
      "config", po::value<std::string>(), "INI-style configuration file");

  auto settings_options = po::options_description{"Settings"};
  config::add_settings_options(settings_options, values);

  auto command_options = po::options_description{"Command options"};
  command_options.add_options()(
      "id", po::value<std::vector<std::string>>()->multitoken()->composing(),
      "asset id; repeat for bulk-edit and qr-export")(
      "name", po::value<std::string>(), "asset or user name")(
      "category", po::value<std::string>(), "asset category")(
      "model", po::value<std::string>(), "asset model")(
      "serial", po::value<std::string>(), "asset serial number")(
      "purchase-date", po::value<std::string>(), "purchase date YYYY-MM-DD")(
      "description", po::value<std::string>(), "asset description")(
      "image-url", po::value<std::string>(), "asset image reference")(
      "feature", po::value<std::vector<std::string>>()->composing(),
      "custom feature KEY=VALUE; an empty value removes it")(
      "status", po::value<std::string>(), "asset or reservation status")(
      "holder", po::value<std::string>(), "asset holder name")(
      "user", po::value<std::string>(),
      "user name; user id for reservation-add")(
      "strokes", po::value<std::string>(), "signature stroke file")(
      "notes", po::value<std::string>(), "ledger entry notes")(
      "search", po::value<std::string>(), "free-text search")(
      "from", po::value<std::string>(), "earliest purchase date")(
      "to", po::value<std::string>(), "latest purchase date")(
      "file", po::value<std::string>(), "CSV file to import")(
      "out", po::value<std::string>(), "output file path")(
      "email", po::value<std::string>(), "user email")(
      "role", po::value<std::string>(), "Admin|Staff|Viewer|Operator")(
      "department", po::value<std::string>(), "user department")(
      "password", po::value<std::string>(), "user password")(
      "start", po::value<std::string>(), "reservation start YYYY-MM-DD")(
      "end", po::value<std::string>(), "reservation end YYYY-MM-DD");

  auto options = po::options_description{"quartermaster options"};
  options.add(general).add(settings_options).add(command_options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (vm.contains("config")) {
      config::merge_config_file(vm["config"].as<std::string>(),
                                settings_options, vm);
    }
  } catch (const po::error& e) {
    std::cerr << "error: " << e.what() << '\n';
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return command.empty() && !vm.contains("help") ? kExitUsage : kExitSuccess;
  }

  auto problems = config::validate(values);
  if (!problems.empty()) {
    for (const auto& problem : problems) {
      std::cerr << "error: " << problem << '\n';
    }
    return kExitUsage;
  }

  common::init_logging(values.log_level, values.log_file);
  auto code = kExitSuccess;
  try {
    code = run(command, vm, values);
  } catch (const usage_error& e) {
    std::cerr << "error: " << e.what() << '\n';
    code = kExitUsage;
  }
  spdlog::shutdown();
  return code;
}
