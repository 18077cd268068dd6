#pragma once
#include <quartermaster/qr/code.hpp>
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/operation_result.hpp>
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quartermaster::qr {

inline constexpr auto kExportCodespace = std::string_view{"quartermaster.qr"};
inline constexpr auto kDefaultArchiveFolder = std::string_view{"asset_qrs"};

enum class export_state_t : uint8_t { idle = 0, generating = 1, completed = 2 };

std::string_view to_string(export_state_t state);

/// Produces the PNG for one payload; std::nullopt with `error` set on
/// failure.
using code_renderer_t =
    std::function<std::optional<schema::bytes_t>(std::string_view payload,
                                                 std::string& error)>;

using state_listener_t = std::function<void(export_state_t)>;

struct batch_export_options final {
  std::string folder{kDefaultArchiveFolder};
  render_options render;
  error_correction_t ecc{error_correction_t::medium};
};

struct batch_export_result final {
  schema::operation_result_t result;
  schema::bytes_t archive;
  /// `<folder>_<YYYY-MM-DD>.zip`
  std::string file_name;
  size_t encoded{};
  std::vector<std::string> skipped;
};

/// Builds one zip holding `<folder>/<asset id>_qr.png` per asset.
///
/// Items are encoded concurrently and joined before the archive is written.
/// An item that fails to encode is logged and left out. There is no
/// cancellation.
class batch_exporter final {
 public:
  explicit batch_exporter(batch_export_options options = {},
                          code_renderer_t renderer = {});

  batch_export_result run(const std::vector<const schema::asset_t*>& assets,
                          schema::timestamp_milliseconds_t now);

  export_state_t state() const;

  void on_state_change(state_listener_t listener);

 private:
  void set_state(export_state_t state);

  batch_export_options options_;
  code_renderer_t renderer_;
  state_listener_t listener_;
  std::atomic<export_state_t> state_{export_state_t::idle};
};

}  // namespace quartermaster::qr
