#pragma once

#include <quartermaster/schema/primitives.hpp>

#include <zip.h>

#include <cstdint>
#include <ctime>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace quartermaster::testing {

struct zip_entry final {
  int32_t method{};
  std::time_t modified_at{};
  schema::bytes_t contents;
};

struct zip_discarder final {
  void operator()(zip_t* archive) const { zip_discard(archive); }
};

/// Entries of an archive keyed by name, read back through libzip with
/// consistency checks on. Returns std::nullopt on any structural problem or
/// CRC mismatch.
inline std::optional<std::map<std::string, zip_entry>> read_zip(
    const schema::bytes_t& bytes) {
  auto error = zip_error_t{};
  zip_error_init(&error);
  auto* source = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
  if (source == nullptr) {
    zip_error_fini(&error);
    return std::nullopt;
  }
  auto archive = std::unique_ptr<zip_t, zip_discarder>{
      zip_open_from_source(source, ZIP_RDONLY | ZIP_CHECKCONS, &error)};
  zip_error_fini(&error);
  if (!archive) {
    zip_source_free(source);
    return std::nullopt;
  }

  auto entries = std::map<std::string, zip_entry>{};
  const auto count = zip_get_num_entries(archive.get(), 0);
  for (zip_int64_t i = 0; i < count; ++i) {
    auto stat = zip_stat_t{};
    zip_stat_init(&stat);
    if (zip_stat_index(archive.get(), static_cast<zip_uint64_t>(i), 0,
                       &stat) < 0) {
      return std::nullopt;
    }
    auto entry = zip_entry{};
    entry.method = stat.comp_method;
    entry.modified_at = stat.mtime;
    entry.contents.resize(static_cast<size_t>(stat.size));
    if (stat.size > 0) {
      auto* file =
          zip_fopen_index(archive.get(), static_cast<zip_uint64_t>(i), 0);
      if (file == nullptr) {
        return std::nullopt;
      }
      const auto read = zip_fread(file, entry.contents.data(), stat.size);
      const auto closed = zip_fclose(file);
      if (read < 0 || static_cast<zip_uint64_t>(read) != stat.size ||
          closed != 0) {
        return std::nullopt;
      }
    }
    entries.emplace(stat.name, std::move(entry));
  }
  return entries;
}

}  // namespace quartermaster::testing
