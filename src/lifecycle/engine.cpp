#include <spdlog/spdlog.h>
#include <quartermaster/common/critical.hpp>
#include <quartermaster/lifecycle/engine.hpp>

using namespace quartermaster::schema;

namespace quartermaster::lifecycle {

engine::engine(store::entity_store& store) : store_{store} {}

operation_result_t engine::borrow(const transition_request& request) {
  return transition(request, transaction_type_t::borrow,
                    asset_status_t::available, asset_status_t::borrowed);
}

operation_result_t engine::return_asset(const transition_request& request) {
  return transition(request, transaction_type_t::return_item,
                    asset_status_t::borrowed, asset_status_t::available);
}

operation_result_t engine::transition(const transition_request& request,
                                      const transaction_type_t type,
                                      const asset_status_t required,
                                      const asset_status_t target) {
  const auto* current = store_.find_asset(request.asset_id);
  if (current == nullptr) {
    return make_failure(kLifecycleCodespace, error_code_t::not_found,
                        "asset not found", request.asset_id);
  }
  if (request.user_name.empty()) {
    return make_failure(kLifecycleCodespace, error_code_t::invalid_argument,
                        "user name must not be empty", request.asset_id);
  }
  if (request.signature.empty()) {
    return make_failure(kLifecycleCodespace, error_code_t::invalid_argument,
                        "signature is required", request.asset_id);
  }
  if (current->status != required) {
    auto info = std::string{"asset is "};
    info.append(to_string(current->status));
    info.append(", expected ");
    info.append(to_string(required));
    return make_failure(kLifecycleCodespace, error_code_t::invalid_transition,
                        "invalid transition", info);
  }

  auto entry = make_entry(*current, request.user_name, type);
  entry.signature = request.signature;
  entry.notes = request.notes;

  auto updated = *current;
  updated.status = target;
  if (target == asset_status_t::borrowed) {
    updated.current_holder = request.user_name;
  } else {
    updated.current_holder.reset();
  }

  auto result = store_.record_transition(std::move(updated), std::move(entry));
  if (succeeded(result)) {
    verify_holder(request.asset_id);
    spdlog::info("{} {} by {} ({})", to_string(type), request.asset_id,
                 request.user_name, result.entity_id.value_or(""));
  }
  return result;
}

operation_result_t engine::log_maintenance(const std::string_view asset_id,
                                           const std::string_view user_name,
                                           std::optional<std::string> notes) {
  const auto* current = store_.find_asset(asset_id);
  if (current == nullptr) {
    return make_failure(kLifecycleCodespace, error_code_t::not_found,
                        "asset not found", asset_id);
  }
  if (user_name.empty()) {
    return make_failure(kLifecycleCodespace, error_code_t::invalid_argument,
                        "user name must not be empty", asset_id);
  }
  auto entry =
      make_entry(*current, user_name, transaction_type_t::maintenance_log);
  entry.notes = std::move(notes);

  auto result = store_.record_transition(*current, std::move(entry));
  if (succeeded(result)) {
    verify_holder(asset_id);
  }
  return result;
}

operation_result_t engine::set_status(const std::string_view asset_id,
                                      const asset_status_t status,
                                      std::optional<std::string> holder) {
  const auto* current = store_.find_asset(asset_id);
  if (current == nullptr) {
    return make_failure(kLifecycleCodespace, error_code_t::not_found,
                        "asset not found", asset_id);
  }
  auto updated = *current;
  updated.status = status;
  updated.current_holder = std::move(holder);
  return edit_asset(std::move(updated));
}

operation_result_t engine::edit_asset(asset_t value) {
  auto asset_id = value.asset_id;
  auto result = store_.update_asset(std::move(value));
  if (succeeded(result)) {
    verify_holder(asset_id);
  }
  return result;
}

transaction_t engine::make_entry(const asset_t& value,
                                 const std::string_view user_name,
                                 const transaction_type_t type) const {
  auto entry = transaction_t{};
  entry.asset_id = value.asset_id;
  entry.asset_name = value.name;
  entry.user_name = std::string{user_name};
  const auto* registered = store_.find_user_by_name(user_name);
  entry.user_id = registered != nullptr ? registered->user_id
                                        : std::string{kWalkInUserId};
  entry.type = type;
  return entry;
}

void engine::verify_holder(const std::string_view asset_id) const {
  const auto* value = store_.find_asset(asset_id);
  if (value == nullptr || !holder_matches_status(*value)) {
    common::critical("holder invariant violated for asset {}", asset_id);
  }
}

}  // namespace quartermaster::lifecycle
