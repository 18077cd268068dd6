#include <spdlog/spdlog.h>
#include <quartermaster/common/time.hpp>
#include <quartermaster/csv/codec.hpp>
#include <algorithm>
#include <array>
#include <set>

using namespace quartermaster::schema;

namespace quartermaster::csv {

namespace {

constexpr auto kFixedColumns =
    std::array<std::string_view, 9>{"ID",     "Asset Name", "Category",
                                    "Model",  "SN",         "Status",
                                    "Holder", "Date",       "Desc"};

struct column_layout final {
  std::optional<size_t> name;
  std::optional<size_t> category;
  std::optional<size_t> model;
  std::optional<size_t> serial_number;
};

column_layout positional_layout() {
  return column_layout{
      .name = 0, .category = 1, .model = 2, .serial_number = 3};
}

column_layout detect_layout(const record_t& header) {
  auto layout = column_layout{};
  for (size_t i = 0; i < header.size(); ++i) {
    auto label = to_lower(trim(header[i]));
    if (!layout.name && (label == "name" || label == "asset name")) {
      layout.name = i;
    } else if (!layout.category && label == "category") {
      layout.category = i;
    } else if (!layout.model && label == "model") {
      layout.model = i;
    } else if (!layout.serial_number &&
               (label == "serial" || label == "sn" ||
                label == "serial number" || label == "serialnumber")) {
      layout.serial_number = i;
    }
  }
  if (!layout.name) {
    return positional_layout();
  }
  return layout;
}

std::string field_at(const record_t& record,
                     const std::optional<size_t>& column) {
  if (!column || *column >= record.size()) {
    return {};
  }
  return std::string{trim(record[*column])};
}

std::string value_or(std::string value, const std::string_view fallback) {
  if (value.empty()) {
    return std::string{fallback};
  }
  return value;
}

bool is_blank(const record_t& record) {
  return std::all_of(std::begin(record), std::end(record),
                     [](const auto& field) { return trim(field).empty(); });
}

void append_row(std::string& out, const std::vector<std::string>& fields) {
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out.append(escape_field(fields[i]));
  }
}

}  // namespace

std::string escape_field(const std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string{field};
  }
  auto quoted = std::string{"\""};
  for (const auto ch : field) {
    if (ch == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(ch);
  }
  quoted.push_back('"');
  return quoted;
}

std::vector<record_t> parse_records(std::string_view content) {
  auto records = std::vector<record_t>{};
  auto record = record_t{};
  auto field = std::string{};
  auto in_quotes = false;
  auto pending = false;

  for (size_t i = 0; i < content.size(); ++i) {
    const auto ch = content[i];
    if (in_quotes) {
      if (ch == '"') {
        if ((i + 1) < content.size() && content[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(ch);
      }
      continue;
    }
    switch (ch) {
      case '"':
        if (trim(field).empty()) {
          field.clear();
          in_quotes = true;
        } else {
          field.push_back(ch);
        }
        pending = true;
        break;
      case ',':
        record.push_back(std::move(field));
        field.clear();
        pending = true;
        break;
      case '\r':
        if ((i + 1) < content.size() && content[i + 1] == '\n') {
          break;
        }
        [[fallthrough]];
      case '\n':
        record.push_back(std::move(field));
        field.clear();
        records.push_back(std::move(record));
        record.clear();
        pending = false;
        break;
      default:
        field.push_back(ch);
        pending = true;
        break;
    }
  }
  if (pending || !field.empty()) {
    record.push_back(std::move(field));
    records.push_back(std::move(record));
  }
  return records;
}

std::vector<std::string> feature_columns(
    const std::vector<const asset_t*>& assets) {
  auto keys = std::set<std::string>{};
  for (const auto* value : assets) {
    for (const auto& [key, _] : value->custom_features) {
      keys.insert(key);
    }
  }
  return {std::begin(keys), std::end(keys)};
}

std::optional<std::string> export_assets(
    const std::vector<const asset_t*>& assets) {
  if (assets.empty()) {
    return std::nullopt;
  }
  auto features = feature_columns(assets);

  auto out = std::string{kUtf8Bom};
  auto header = std::vector<std::string>{std::begin(kFixedColumns),
                                         std::end(kFixedColumns)};
  header.insert(std::end(header), std::begin(features), std::end(features));
  append_row(out, header);

  for (const auto* value : assets) {
    auto row = std::vector<std::string>{value->asset_id,
                                        value->name,
                                        value->category,
                                        value->model,
                                        value->serial_number,
                                        std::string{to_string(value->status)},
                                        value->current_holder.value_or(""),
                                        value->purchase_date,
                                        value->description.value_or("")};
    for (const auto& key : features) {
      auto it = value->custom_features.find(key);
      row.push_back(it != std::end(value->custom_features) ? it->second : "");
    }
    out.push_back('\n');
    append_row(out, row);
  }
  return out;
}

std::string make_export_file_name(const timestamp_milliseconds_t now) {
  return "assets_export_" + common::format_date(now) + ".csv";
}

import_result import_assets(store::entity_store& store,
                            std::string_view content) {
  auto outcome = import_result{};
  if (content.starts_with(kUtf8Bom)) {
    content.remove_prefix(kUtf8Bom.size());
  }
  auto records = parse_records(content);
  if (records.empty()) {
    outcome.result = make_success(kCsvCodespace, {});
    return outcome;
  }

  const auto layout = detect_layout(records.front());
  const auto today = common::format_date(store.now());
  auto created = std::vector<asset_t>{};
  for (size_t i = 1; i < records.size(); ++i) {
    const auto& record = records[i];
    if (is_blank(record)) {
      continue;
    }
    auto name = field_at(record, layout.name);
    if (name.empty()) {
      ++outcome.skipped;
      spdlog::debug("Skipping CSV row {} without a name", i + 1);
      continue;
    }
    auto value = asset_t{};
    value.asset_id = store.generate_id(store::collection_t::assets);
    value.name = std::move(name);
    value.category = value_or(field_at(record, layout.category),
                              kDefaultCategory);
    value.model = value_or(field_at(record, layout.model), kDefaultModel);
    value.serial_number =
        value_or(field_at(record, layout.serial_number), kDefaultSerialNumber);
    value.purchase_date = today;
    value.status = asset_status_t::available;
    value.description = std::string{kImportDescription};
    outcome.asset_ids.push_back(value.asset_id);
    created.push_back(std::move(value));
  }

  outcome.result = store.insert_assets(std::move(created));
  if (!succeeded(outcome.result)) {
    outcome.asset_ids.clear();
    return outcome;
  }
  outcome.result.codespace = std::string{kCsvCodespace};
  outcome.imported = outcome.asset_ids.size();
  spdlog::info("Imported {} asset(s) from CSV, skipped {} row(s)",
               outcome.imported, outcome.skipped);
  return outcome;
}

}  // namespace quartermaster::csv
