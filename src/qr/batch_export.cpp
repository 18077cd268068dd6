#include <spdlog/spdlog.h>
#include <quartermaster/archive/zip_writer.hpp>
#include <quartermaster/qr/batch_export.hpp>
#include <algorithm>
#include <exception>
#include <future>
#include <thread>

using namespace quartermaster::schema;

namespace quartermaster::qr {

namespace {

struct encoded_item final {
  std::optional<bytes_t> png;
  std::string error;
};

}  // namespace

std::string_view to_string(const export_state_t state) {
  switch (state) {
    case export_state_t::idle:
      return "idle";
    case export_state_t::generating:
      return "generating";
    case export_state_t::completed:
      return "completed";
  }
  return "unknown";
}

batch_exporter::batch_exporter(batch_export_options options,
                               code_renderer_t renderer)
    : options_{std::move(options)}, renderer_{std::move(renderer)} {
  if (!renderer_) {
    renderer_ = [render = options_.render, ecc = options_.ecc](
                    const std::string_view payload, std::string& error) {
      return render_png(payload, ecc, render, error);
    };
  }
}

export_state_t batch_exporter::state() const {
  return state_.load();
}

void batch_exporter::on_state_change(state_listener_t listener) {
  listener_ = std::move(listener);
}

void batch_exporter::set_state(const export_state_t state) {
  state_.store(state);
  if (listener_) {
    listener_(state);
  }
}

batch_export_result batch_exporter::run(
    const std::vector<const asset_t*>& assets,
    const timestamp_milliseconds_t now) {
  auto outcome = batch_export_result{};
  if (assets.empty()) {
    outcome.result =
        make_failure(kExportCodespace, error_code_t::invalid_argument,
                     "no assets selected for QR export");
    return outcome;
  }
  set_state(export_state_t::generating);

  const auto workers = std::max<size_t>(1, std::thread::hardware_concurrency());
  auto items = std::vector<encoded_item>(assets.size());
  for (size_t begin = 0; begin < assets.size(); begin += workers) {
    const auto end = std::min(assets.size(), begin + workers);
    auto pending = std::vector<std::future<encoded_item>>{};
    pending.reserve(end - begin);
    for (auto i = begin; i < end; ++i) {
      pending.push_back(std::async(
          std::launch::async, [this, payload = assets[i]->asset_id] {
            auto item = encoded_item{};
            item.png = renderer_(payload, item.error);
            return item;
          }));
    }
    for (auto i = begin; i < end; ++i) {
      try {
        items[i] = pending[i - begin].get();
      } catch (const std::exception& e) {
        items[i].error = e.what();
      }
    }
  }

  auto writer = archive::zip_writer{now};
  auto error = std::string{};
  if (!writer.add_directory(options_.folder, error)) {
    set_state(export_state_t::idle);
    outcome.result = make_failure(kExportCodespace,
                                  error_code_t::encoding_failed,
                                  "failed to create archive folder", error);
    return outcome;
  }
  for (size_t i = 0; i < assets.size(); ++i) {
    const auto& asset_id = assets[i]->asset_id;
    auto& item = items[i];
    if (item.png) {
      auto name = options_.folder + "/" + asset_id + "_qr.png";
      if (writer.add_file(name, make_bytes_view(*item.png), item.error)) {
        ++outcome.encoded;
        continue;
      }
    }
    spdlog::warn("Failed to generate QR for {}: {}", asset_id, item.error);
    outcome.skipped.push_back(asset_id);
  }

  auto written = writer.finish(error);
  if (!written) {
    set_state(export_state_t::idle);
    outcome.result = make_failure(kExportCodespace,
                                  error_code_t::encoding_failed,
                                  "failed to write QR archive", error);
    return outcome;
  }
  outcome.archive = std::move(*written);
  outcome.file_name = archive::make_archive_file_name(options_.folder, now);
  outcome.result = make_success(kExportCodespace, outcome.file_name);
  outcome.result.info = std::to_string(outcome.encoded) + " encoded, " +
                        std::to_string(outcome.skipped.size()) + " skipped";
  spdlog::info("QR batch export wrote {} ({})", outcome.file_name,
               outcome.result.info);
  set_state(export_state_t::completed);
  return outcome;
}

}  // namespace quartermaster::qr
