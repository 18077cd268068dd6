#pragma once
#include <quartermaster/schema/primitives.hpp>
#include <zip.h>
#include <ctime>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace quartermaster::archive {

/// In-memory zip archive built with libzip.
///
/// Files are deflated. Every entry carries the same modification stamp.
/// Entry contents are copied and held until `finish`.
class zip_writer final {
 public:
  explicit zip_writer(schema::timestamp_milliseconds_t modified_at);

  /// Add a folder entry; a trailing `/` is appended when missing.
  bool add_directory(std::string_view name, std::string& error);

  bool add_file(std::string_view name,
                const schema::bytes_view_t& contents,
                std::string& error);

  /// Write the central directory and return the archive. The writer accepts
  /// no further entries afterwards; later calls return the same bytes. An
  /// archive without entries is an error.
  std::optional<schema::bytes_t> finish(std::string& error);

  size_t entry_count() const;
  bool finished() const;

 private:
  struct source_deleter final {
    void operator()(zip_source_t* source) const { zip_source_free(source); }
  };
  struct archive_deleter final {
    void operator()(zip_t* archive) const { zip_discard(archive); }
  };

  bool accept(const std::string& name, std::string& error);
  bool stamp(zip_int64_t index, const std::string& name, std::string& error);

  std::time_t modified_at_;
  std::unique_ptr<zip_source_t, source_deleter> source_;
  std::unique_ptr<zip_t, archive_deleter> archive_;
  std::deque<schema::bytes_t> payloads_;
  schema::bytes_t written_;
  size_t entries_{0};
  bool finished_{false};
};

/// `asset_qrs_<YYYY-MM-DD>.zip`
std::string make_archive_file_name(std::string_view stem,
                                   schema::timestamp_milliseconds_t now);

}  // namespace quartermaster::archive
