#include <quartermaster/archive/zip_writer.hpp>
#include <quartermaster/common/critical.hpp>
#include <quartermaster/common/time.hpp>

namespace quartermaster::archive {

namespace {

constexpr zip_uint32_t kDeflateLevel = 9;

std::string describe(zip_t* archive) {
  return zip_error_strerror(zip_get_error(archive));
}

}  // namespace

zip_writer::zip_writer(const schema::timestamp_milliseconds_t modified_at)
    : modified_at_{static_cast<std::time_t>(modified_at / 1000)} {
  auto error = zip_error_t{};
  zip_error_init(&error);
  auto* source = zip_source_buffer_create(nullptr, 0, 0, &error);
  auto* archive = source == nullptr
                      ? nullptr
                      : zip_open_from_source(source, ZIP_TRUNCATE, &error);
  if (archive == nullptr) {
    const auto reason = std::string{zip_error_strerror(&error)};
    zip_error_fini(&error);
    if (source != nullptr) {
      zip_source_free(source);
    }
    common::critical("Failed to create in-memory zip archive: {}", reason);
  }
  zip_error_fini(&error);
  zip_source_keep(source);
  source_.reset(source);
  archive_.reset(archive);
}

bool zip_writer::accept(const std::string& name, std::string& error) {
  if (finished_ || !archive_) {
    error = "archive is already finished";
    return false;
  }
  if (zip_name_locate(archive_.get(), name.c_str(), 0) >= 0) {
    error = "duplicate archive entry '" + name + "'";
    return false;
  }
  return true;
}

bool zip_writer::stamp(const zip_int64_t index,
                       const std::string& name,
                       std::string& error) {
  if (zip_file_set_mtime(archive_.get(), static_cast<zip_uint64_t>(index),
                         modified_at_, 0) < 0) {
    error = "failed to stamp '" + name + "': " + describe(archive_.get());
    return false;
  }
  return true;
}

bool zip_writer::add_directory(const std::string_view name,
                               std::string& error) {
  auto folder = std::string{name};
  if (folder.empty() || folder.back() != '/') {
    folder.push_back('/');
  }
  if (!accept(folder, error)) {
    return false;
  }
  const auto index =
      zip_dir_add(archive_.get(), folder.c_str(), ZIP_FL_ENC_UTF_8);
  if (index < 0) {
    error = "failed to add '" + folder + "': " + describe(archive_.get());
    return false;
  }
  ++entries_;
  return stamp(index, folder, error);
}

bool zip_writer::add_file(const std::string_view name,
                          const schema::bytes_view_t& contents,
                          std::string& error) {
  if (name.empty() || name.back() == '/') {
    error = "file entries need a non-empty name without a trailing '/'";
    return false;
  }
  const auto file = std::string{name};
  if (!accept(file, error)) {
    return false;
  }

  const auto& payload =
      payloads_.emplace_back(std::begin(contents), std::end(contents));
  auto* source = zip_source_buffer(archive_.get(), payload.data(),
                                   payload.size(), 0);
  if (source == nullptr) {
    error = "failed to buffer '" + file + "': " + describe(archive_.get());
    payloads_.pop_back();
    return false;
  }
  const auto index =
      zip_file_add(archive_.get(), file.c_str(), source, ZIP_FL_ENC_UTF_8);
  if (index < 0) {
    error = "failed to add '" + file + "': " + describe(archive_.get());
    zip_source_free(source);
    payloads_.pop_back();
    return false;
  }
  ++entries_;
  if (zip_set_file_compression(archive_.get(),
                               static_cast<zip_uint64_t>(index),
                               ZIP_CM_DEFLATE, kDeflateLevel) < 0) {
    error = "failed to compress '" + file + "': " + describe(archive_.get());
    return false;
  }
  return stamp(index, file, error);
}

std::optional<schema::bytes_t> zip_writer::finish(std::string& error) {
  if (finished_) {
    return written_;
  }
  if (!archive_) {
    error = "archive was already closed after a failed write";
    return std::nullopt;
  }
  if (entries_ == 0) {
    error = "archive has no entries";
    return std::nullopt;
  }

  auto* archive = archive_.release();
  if (zip_close(archive) < 0) {
    error = "failed to write archive: " + describe(archive);
    zip_discard(archive);
    return std::nullopt;
  }

  auto stat = zip_stat_t{};
  zip_stat_init(&stat);
  if (zip_source_stat(source_.get(), &stat) < 0 ||
      zip_source_open(source_.get()) < 0) {
    error = std::string{"failed to read archive: "} +
            zip_error_strerror(zip_source_error(source_.get()));
    return std::nullopt;
  }
  auto bytes = schema::bytes_t(static_cast<size_t>(stat.size));
  const auto read = zip_source_read(source_.get(), bytes.data(), stat.size);
  zip_source_close(source_.get());
  if (read < 0 || static_cast<zip_uint64_t>(read) != stat.size) {
    error = "archive buffer was truncated";
    return std::nullopt;
  }

  payloads_.clear();
  written_ = std::move(bytes);
  finished_ = true;
  return written_;
}

size_t zip_writer::entry_count() const {
  return entries_;
}

bool zip_writer::finished() const {
  return finished_;
}

std::string make_archive_file_name(const std::string_view stem,
                                   const schema::timestamp_milliseconds_t now) {
  auto name = std::string{stem};
  name.push_back('_');
  name.append(common::format_date(now));
  name.append(".zip");
  return name;
}

}  // namespace quartermaster::archive
