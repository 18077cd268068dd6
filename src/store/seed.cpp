#include <spdlog/spdlog.h>
#include <quartermaster/store/entity_store.hpp>

using namespace quartermaster::schema;

namespace quartermaster::store {

namespace {

user_t make_user(std::string id,
                 std::string name,
                 const user_role_t role,
                 std::string email,
                 std::string department,
                 std::string password) {
  auto value = user_t{};
  value.user_id = std::move(id);
  value.name = std::move(name);
  value.role = role;
  value.email = std::move(email);
  value.department = std::move(department);
  value.password = std::move(password);
  return value;
}

asset_t make_asset(std::string id,
                   std::string name,
                   std::string category,
                   std::string model,
                   std::string serial_number,
                   std::string purchase_date,
                   std::string description,
                   std::map<std::string, std::string> custom_features,
                   const int image_index) {
  auto value = asset_t{};
  value.asset_id = std::move(id);
  value.name = std::move(name);
  value.category = std::move(category);
  value.model = std::move(model);
  value.serial_number = std::move(serial_number);
  value.purchase_date = std::move(purchase_date);
  value.image_url = "https://picsum.photos/400/300?random=" +
                    std::to_string(image_index);
  value.description = std::move(description);
  value.custom_features = std::move(custom_features);
  return value;
}

}  // namespace

operation_result_t seed_sample_data(entity_store& store) {
  static constexpr auto kCodespace = std::string_view{"quartermaster.seed"};
  if (!store.empty()) {
    return make_failure(kCodespace, error_code_t::invalid_argument,
                        "sample data can only be loaded into an empty store");
  }

  auto users = std::vector<user_t>{
      make_user("U001", "Alice Chen", user_role_t::staff,
                "alice.c@company.com", "Design", "123"),
      make_user("U002", "Bob Smith", user_role_t::operator_,
                "bob.s@company.com", "Engineering", "123"),
      make_user("U003", "Carol Admin", user_role_t::admin,
                "carol.d@company.com", "IT Support", "123456"),
      make_user("U004", "David View", user_role_t::viewer,
                "david.v@company.com", "Audit", "123")};
  for (auto& value : users) {
    auto result = store.insert_user(std::move(value));
    if (!succeeded(result)) {
      return result;
    }
  }

  auto assets = std::vector<asset_t>{
      make_asset("AST-001", "MacBook Pro 16\"", "Laptop", "M3 Max",
                 "FVFX1234K9", "2024-01-15", "High performance laptop.",
                 {{"Color", "Space Gray"}, {"RAM", "64GB"}}, 1),
      make_asset("AST-002", "Sony Alpha a7 IV", "Camera", "ILCE-7M4",
                 "SNY887221", "2023-11-20", "Full frame mirrorless.",
                 {{"Lens", "24-70mm GM"}, {"Warranty", "Extended"}}, 2),
      make_asset("AST-003", "DJI Mavic 3 Pro", "Drone", "Mavic 3", "DJI998877",
                 "2024-02-10", "Triple camera drone.", {}, 3),
      make_asset("AST-004", "Projector 4K", "Office", "Epson Pro", "EPS445566",
                 "2023-05-05", "Main meeting room projector.",
                 {{"Resolution", "4K"}, {"Mount", "Ceiling"}}, 4),
      make_asset("AST-005", "iPad Pro 12.9\"", "Tablet", "6th Gen",
                 "APP998811", "2024-03-01", "Design tablet.",
                 {{"Storage", "1TB"}, {"Connectivity", "5G + Wi-Fi"}}, 5)};
  assets[1].status = asset_status_t::borrowed;
  assets[1].current_holder = "Alice Chen";
  assets[2].status = asset_status_t::maintenance;
  auto result = store.insert_assets(std::move(assets));
  if (!succeeded(result)) {
    return result;
  }

  const auto now = store.now();
  auto maintenance = transaction_t{};
  maintenance.transaction_id = "TX-1002";
  maintenance.asset_id = "AST-003";
  maintenance.asset_name = "DJI Mavic 3 Pro";
  maintenance.user_id = "U002";
  maintenance.user_name = "Bob Smith";
  maintenance.type = transaction_type_t::maintenance_log;
  maintenance.timestamp = now - 5 * kMillisecondsPerDay;
  maintenance.notes = "Propeller check";

  auto borrow = transaction_t{};
  borrow.transaction_id = "TX-1001";
  borrow.asset_id = "AST-002";
  borrow.asset_name = "Sony Alpha a7 IV";
  borrow.user_id = "U001";
  borrow.user_name = "Alice Chen";
  borrow.type = transaction_type_t::borrow;
  borrow.timestamp = now - 2 * kMillisecondsPerDay;
  borrow.notes = "Project photoshoot";

  for (auto entry : {maintenance, borrow}) {
    result = store.insert_transaction(std::move(entry));
    if (!succeeded(result)) {
      return result;
    }
  }

  auto reservation = reservation_t{};
  reservation.reservation_id = "RES-001";
  reservation.asset_id = "AST-004";
  reservation.user_id = "U001";
  reservation.start_date = "2024-06-01";
  reservation.end_date = "2024-06-03";
  reservation.status = reservation_status_t::confirmed;
  result = store.insert_reservation(std::move(reservation));
  if (!succeeded(result)) {
    return result;
  }

  spdlog::info("Loaded sample data set");
  return make_success(kCodespace, {});
}

}  // namespace quartermaster::store
