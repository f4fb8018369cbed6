#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

#include "statebus/channel.hpp"
#include "statebus/detail/nullable.hpp"
#include "statebus/detail/type_registry.hpp"
#include "statebus/error.hpp"
#include "statebus/log.hpp"

namespace statebus {

// Type-keyed fan-out of arbitrary events. Every event type gets its own
// channel, created by whichever of publish() or subscribe() touches it
// first. Delivery runs on the publishing thread unless another thread is
// already delivering the same event type.
class EventBus {
 public:
  EventBus() = default;
  ~EventBus() { dispose(); }

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Null optionals and pointers are dropped
  template <typename E>
  void publish(const E& event) {
    ensure_live("publish");
    if (detail::is_null(event)) return;
    channel<E>("publish")->publish(event);
  }

  template <typename E>
  [[nodiscard]] Stream<E> subscribe() {
    ensure_live("subscribe");
    return channel<E>("subscribe")->stream();
  }

  template <typename E>
  [[nodiscard]] Stream<E> subscribe_filtered(
      std::function<bool(const E&)> predicate) {
    ensure_live("subscribe_filtered");
    return channel<E>("subscribe_filtered")->stream().filter(
        std::move(predicate));
  }

  template <typename E>
  [[nodiscard]] Subscription subscribe_action(
      std::function<void(const E&)> handler) {
    ensure_live("subscribe_action");
    return channel<E>("subscribe_action")->stream().subscribe(
        std::move(handler));
  }

  template <typename E>
  [[nodiscard]] Subscription subscribe_action(
      std::function<void(const E&)> handler,
      std::function<bool(const E&)> predicate) {
    ensure_live("subscribe_action");
    return channel<E>("subscribe_action")
        ->stream()
        .filter(std::move(predicate))
        .subscribe(std::move(handler));
  }

  template <typename E>
  [[nodiscard]] std::size_t subscriber_count() const {
    ensure_live("subscriber_count");
    auto existing = channels_.find<E, EventChannel<E>>();
    return existing ? existing->subscriber_count() : 0;
  }

  // Completes every channel; subscribers with an on_completed handler are
  // told. Safe to call more than once.
  void dispose() {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) return;

    std::size_t subscribers = 0;
    for (auto& channel : channels_.drain()) {
      subscribers += channel->subscriber_count();
      channel->close();
    }
    if (subscribers > 0) {
      detail::log(LogLevel::Debug,
                  "EventBus disposed with %zu live subscriber(s)", subscribers);
    }
  }

  [[nodiscard]] bool disposed() const noexcept {
    return disposed_.load(std::memory_order_acquire);
  }

 private:
  void ensure_live(const char* operation) const {
    if (!disposed()) return;
    fail_disposed(operation);
  }

  [[noreturn]] static void fail_disposed(const char* operation) {
    detail::log(LogLevel::Warning, "EventBus::%s called after dispose()",
                operation);
    throw DisposedError("EventBus");
  }

  // The registry closes when dispose() drains it, which also catches a
  // call that passed ensure_live() just before dispose() ran
  template <typename E>
  std::shared_ptr<EventChannel<E>> channel(const char* operation) {
    auto existing = channels_.get_or_add<E, EventChannel<E>>(
        [] { return std::make_shared<EventChannel<E>>(); });
    if (!existing) fail_disposed(operation);
    return existing;
  }

  std::atomic_bool disposed_{false};
  detail::type_registry channels_;
};

}  // namespace statebus
