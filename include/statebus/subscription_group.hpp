#pragma once

#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

#include "statebus/channel.hpp"

namespace statebus {

// Owns the subscriptions of one consumer and cancels them together
class SubscriptionGroup {
 public:
  SubscriptionGroup() = default;
  ~SubscriptionGroup() { cancel_all(); }

  SubscriptionGroup(const SubscriptionGroup&) = delete;
  SubscriptionGroup& operator=(const SubscriptionGroup&) = delete;

  void add(Subscription subscription) {
    std::lock_guard lock(mutex_);
    subscriptions_.push_back(std::move(subscription));
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard lock(mutex_);
    return subscriptions_.size();
  }

  void cancel_all() {
    std::vector<Subscription> cancelled;
    {
      std::lock_guard lock(mutex_);
      cancelled.swap(subscriptions_);
    }
    for (auto& subscription : cancelled) {
      subscription.cancel();
    }
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Subscription> subscriptions_;
};

}  // namespace statebus
