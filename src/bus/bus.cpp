#include "bus/bus.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace conductor {

Bus& Bus::instance() {
  static Bus instance;
  return instance;
}

Bus::SubscriptionId Bus::add_handler(std::type_index type, ErasedHandler handler) {
  std::lock_guard lock(mutex_);
  auto id = next_id_++;
  subscriptions_.push_back(Subscription{id, type, std::move(handler)});
  return id;
}

void Bus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                      [id](const Subscription& s) {
                                        return s.id == id;
                                      }),
                       subscriptions_.end());
}

void Bus::dispatch(std::type_index type, const std::any& event) {
  // Snapshot so handlers may (un)subscribe while being invoked
  std::vector<ErasedHandler> handlers;
  {
    std::lock_guard lock(mutex_);
    for (const auto& s : subscriptions_) {
      if (s.type == type) {
        handlers.push_back(s.handler);
      }
    }
  }

  for (const auto& handler : handlers) {
    try {
      handler(event);
    } catch (const std::exception& e) {
      spdlog::error("[Bus] Subscriber threw: {}", e.what());
    }
  }
}

size_t Bus::subscriber_count() const {
  std::lock_guard lock(mutex_);
  return subscriptions_.size();
}

}  // namespace conductor
