#pragma once

#include <quartermaster/common/time.hpp>
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/operation_result.hpp>
#include <quartermaster/schema/primitives.hpp>
#include <quartermaster/schema/user.hpp>
#include <quartermaster/store/entity_store.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace quartermaster::testing {

/// 2024-06-15T12:00:00Z.
inline constexpr schema::timestamp_milliseconds_t kFixedNow = 1718452800000;

/// Clock whose value only moves when the test moves it. Copies of clock()
/// observe later changes.
class manual_clock final {
 public:
  explicit manual_clock(
      const schema::timestamp_milliseconds_t start = kFixedNow)
      : value_{std::make_shared<schema::timestamp_milliseconds_t>(start)} {}

  common::clock_t clock() const {
    return [value = value_]() { return *value; };
  }

  schema::timestamp_milliseconds_t now() const { return *value_; }
  void set(const schema::timestamp_milliseconds_t value) { *value_ = value; }
  void advance(const schema::duration_milliseconds_t delta) {
    *value_ += delta;
  }

 private:
  std::shared_ptr<schema::timestamp_milliseconds_t> value_;
};

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline schema::asset_t make_asset(
    std::string id,
    std::string name,
    std::string category,
    const schema::asset_status_t status = schema::asset_status_t::available,
    std::optional<std::string> holder = std::nullopt) {
  auto value = schema::asset_t{};
  value.asset_id = std::move(id);
  value.name = std::move(name);
  value.category = std::move(category);
  value.model = "Model";
  value.serial_number = "SN-" + value.asset_id;
  value.purchase_date = "2024-01-15";
  value.status = status;
  value.current_holder = std::move(holder);
  return value;
}

inline schema::user_t make_user(std::string id,
                                std::string name,
                                std::string email = {}) {
  auto value = schema::user_t{};
  value.user_id = std::move(id);
  value.name = std::move(name);
  value.email = std::move(email);
  return value;
}

/// Two users and the five sample assets, all idle except AST-003 which is in
/// maintenance. Returns false when any insert is rejected.
inline bool populate_sample(store::entity_store& store) {
  auto alice = store.insert_user(
      make_user("U001", "Alice Chen", "alice.c@company.com"));
  auto bob =
      store.insert_user(make_user("U002", "Bob Smith", "bob.s@company.com"));

  auto macbook = make_asset("AST-001", "MacBook Pro 16\"", "Laptop");
  macbook.custom_features = {{"Color", "Space Gray"}, {"RAM", "64GB"}};
  auto camera = make_asset("AST-002", "Sony Alpha a7 IV", "Camera");
  camera.model = "ILCE-7M4";
  camera.serial_number = "SNY887221";
  camera.custom_features = {{"Lens", "24-70mm GM"}};
  auto assets = store.insert_assets(
      {std::move(macbook), std::move(camera),
       make_asset("AST-003", "DJI Mavic 3 Pro", "Drone",
                  schema::asset_status_t::maintenance),
       make_asset("AST-004", "Projector 4K", "Office"),
       make_asset("AST-005", "iPad Pro 12.9\"", "Tablet")});
  return schema::succeeded(alice) && schema::succeeded(bob) &&
         schema::succeeded(assets);
}

}  // namespace quartermaster::testing
