#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <typeindex>
#include <vector>

#include "bus/events.hpp"

namespace conductor {

// Process-wide typed publish/subscribe bus.
// Handlers run synchronously on the publishing thread.
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus& instance();

  template <typename Event>
  SubscriptionId subscribe(std::function<void(const Event&)> handler) {
    return add_handler(std::type_index(typeid(Event)), [handler = std::move(handler)](const std::any& event) {
      handler(std::any_cast<const Event&>(event));
    });
  }

  void unsubscribe(SubscriptionId id);

  template <typename Event>
  void publish(const Event& event) {
    dispatch(std::type_index(typeid(Event)), std::any(event));
  }

  size_t subscriber_count() const;

 private:
  using ErasedHandler = std::function<void(const std::any&)>;

  struct Subscription {
    SubscriptionId id;
    std::type_index type;
    ErasedHandler handler;
  };

  Bus() = default;

  SubscriptionId add_handler(std::type_index type, ErasedHandler handler);
  void dispatch(std::type_index type, const std::any& event);

  mutable std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::vector<Subscription> subscriptions_;
};

}  // namespace conductor
