#include <spdlog/spdlog.h>
#include <quartermaster/notify/notification_center.hpp>

namespace quartermaster::notify {

notification_center::notification_center(store::entity_store& store,
                                         deriver_options options)
    : store_{store}, options_{options} {
  subscription_ = store_.subscribe([this](const store::change_event& event) {
    if (event.touches(store::collection_t::assets) ||
        event.touches(store::collection_t::transactions)) {
      refresh();
    }
  });
  refresh();
}

notification_center::~notification_center() {
  store_.unsubscribe(subscription_);
}

const std::vector<schema::notification_t>&
notification_center::notifications() const {
  return notifications_;
}

uint64_t notification_center::generation() const {
  return generation_;
}

void notification_center::refresh() {
  notifications_ = derive_notifications(store_.assets(), store_.transactions(),
                                        store_.now(), options_);
  ++generation_;
  spdlog::debug("Recomputed {} notification(s)", notifications_.size());
}

}  // namespace quartermaster::notify
