#pragma once
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/operation_result.hpp>
#include <quartermaster/store/entity_store.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quartermaster::csv {

inline constexpr auto kCsvCodespace = std::string_view{"quartermaster.csv"};
inline constexpr auto kUtf8Bom = std::string_view{"\xEF\xBB\xBF"};

inline constexpr auto kDefaultCategory = std::string_view{"General"};
inline constexpr auto kDefaultModel = std::string_view{"Standard"};
inline constexpr auto kDefaultSerialNumber = std::string_view{"N/A"};
inline constexpr auto kImportDescription = std::string_view{"CSV Import"};

using record_t = std::vector<std::string>;

/// Quote a field when it contains a delimiter, quote or line break.
std::string escape_field(std::string_view field);

/// Split CSV text into records. Quoted fields may contain delimiters, doubled
/// quotes and line breaks; CRLF line endings are accepted.
std::vector<record_t> parse_records(std::string_view content);

/// Distinct custom feature keys across `assets`, sorted.
std::vector<std::string> feature_columns(
    const std::vector<const schema::asset_t*>& assets);

/// Serialize assets with a UTF-8 BOM and a header row. The fixed columns are
/// followed by one column per custom feature key. Returns std::nullopt when
/// there is nothing to export.
std::optional<std::string> export_assets(
    const std::vector<const schema::asset_t*>& assets);

/// `assets_export_<YYYY-MM-DD>.csv`
std::string make_export_file_name(schema::timestamp_milliseconds_t now);

struct import_result final {
  schema::operation_result_t result;
  size_t imported{};
  /// Data rows rejected for an empty name.
  size_t skipped{};
  std::vector<std::string> asset_ids;
};

/// Create one Available asset per data row.
///
/// The first record is a header. When it names a `name` column the columns
/// are located by header (`name`, `category`, `model`, `serial`/`sn`),
/// otherwise the first four positions are used. Blank lines are ignored.
import_result import_assets(store::entity_store& store,
                            std::string_view content);

}  // namespace quartermaster::csv
