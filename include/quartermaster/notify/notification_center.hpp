#pragma once
#include <quartermaster/notify/deriver.hpp>
#include <quartermaster/store/entity_store.hpp>
#include <vector>

namespace quartermaster::notify {

/// Keeps the active alert set in step with an entity store.
///
/// Every asset or transaction change replaces the whole set. The center
/// unsubscribes on destruction and must not outlive the store.
class notification_center final {
 public:
  explicit notification_center(store::entity_store& store,
                               deriver_options options = {});
  ~notification_center();

  notification_center(const notification_center&) = delete;
  notification_center& operator=(const notification_center&) = delete;

  const std::vector<schema::notification_t>& notifications() const;

  /// Number of full recomputes performed so far.
  uint64_t generation() const;

  void refresh();

 private:
  store::entity_store& store_;
  deriver_options options_;
  store::subscription_id_t subscription_{};
  std::vector<schema::notification_t> notifications_;
  uint64_t generation_{};
};

}  // namespace quartermaster::notify
