#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "statebus/detail/type_name.hpp"
#include "statebus/detail/type_registry.hpp"
#include "statebus/log.hpp"

namespace statebus {

namespace detail {

struct cancellable {
  virtual ~cancellable() = default;
  virtual void cancel() noexcept = 0;
  virtual bool active() const noexcept = 0;
};

template <typename T>
class channel_core;

template <typename T>
struct subscriber final : cancellable {
  std::function<void(const T&)> on_next;
  std::function<void()> on_completed;
  std::function<bool(const T&)> filter;
  std::weak_ptr<channel_core<T>> owner;
  std::atomic_bool live{true};
  // First broadcast sequence this subscriber may receive
  std::uint64_t since = 0;

  void cancel() noexcept override {
    if (!live.exchange(false, std::memory_order_acq_rel)) return;
    if (auto core = owner.lock()) {
      core->remove(this);
    }
  }

  bool active() const noexcept override {
    return live.load(std::memory_order_acquire);
  }
};

// Shared multicast core behind EventChannel and ValueChannel.
// Values are queued in publish order and delivered by one thread at a
// time with no lock held, so handlers may call back into any channel.
// A thread that finds delivery already running elsewhere only queues its
// value and returns.
template <typename T>
class channel_core : public std::enable_shared_from_this<channel_core<T>> {
 public:
  using handler_type = std::function<void(const T&)>;
  using predicate_type = std::function<bool(const T&)>;
  using completion_type = std::function<void()>;

  explicit channel_core(std::optional<T> latest = std::nullopt)
      : replay_(latest.has_value()), latest_(std::move(latest)) {}

  channel_core(const channel_core&) = delete;
  channel_core& operator=(const channel_core&) = delete;

  std::shared_ptr<subscriber<T>> subscribe(handler_type on_next,
                                           completion_type on_completed,
                                           predicate_type filter) {
    auto sub = std::make_shared<subscriber<T>>();
    sub->on_next = std::move(on_next);
    sub->on_completed = std::move(on_completed);
    sub->filter = std::move(filter);
    sub->owner = this->weak_from_this();

    bool completed = false;
    {
      std::lock_guard lock(mutex_);
      completed = completed_;
      if (!completed) {
        sub->since = next_sequence_;
        subscribers_.push_back(sub);
        // The replay is queued so it cannot overtake a value still in flight
        if (replay_) {
          queue_.push_back({next_sequence_++, latest_, sub, false});
        }
      }
    }

    if (completed) {
      sub->live.store(false, std::memory_order_release);
      notify_completed(*sub);
    } else if (replay_) {
      drain();
    }
    return sub;
  }

  void publish(const T& value) {
    if (post(value)) drain();
  }

  // Queues value without delivering it. Returns false once completed.
  bool post(const T& value) {
    std::lock_guard lock(mutex_);
    if (completed_) return false;
    if (replay_) latest_ = value;
    queue_.push_back({next_sequence_++, value, nullptr, false});
    return true;
  }

  // Delivers queued values unless another thread is already doing so
  void drain() {
    {
      std::lock_guard lock(mutex_);
      if (draining_) return;
      draining_ = true;
    }
    for (;;) {
      pending entry;
      std::vector<std::shared_ptr<subscriber<T>>> targets;
      try {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) {
          draining_ = false;
          return;
        }
        entry = std::move(queue_.front());
        queue_.pop_front();
        if (entry.last) {
          targets.swap(subscribers_);
        } else if (entry.only) {
          targets.push_back(entry.only);
        } else {
          targets = subscribers_;
        }
      } catch (...) {
        std::lock_guard lock(mutex_);
        draining_ = false;
        throw;
      }

      for (auto& sub : targets) {
        if (entry.last) {
          if (sub->live.exchange(false, std::memory_order_acq_rel)) {
            notify_completed(*sub);
          }
        } else if (entry.sequence >= sub->since) {
          deliver(*sub, *entry.value);
        }
      }
    }
  }

  void complete() {
    {
      std::lock_guard lock(mutex_);
      if (completed_) return;
      completed_ = true;
      queue_.push_back({next_sequence_++, std::nullopt, nullptr, true});
    }
    drain();
  }

  void remove(const subscriber<T>* target) {
    std::lock_guard lock(mutex_);
    std::erase_if(subscribers_,
                  [target](const auto& sub) { return sub.get() == target; });
  }

  [[nodiscard]] bool completed() const {
    std::lock_guard lock(mutex_);
    return completed_;
  }

  [[nodiscard]] std::size_t subscriber_count() const {
    std::lock_guard lock(mutex_);
    return subscribers_.size();
  }

  [[nodiscard]] std::optional<T> latest() const {
    std::lock_guard lock(mutex_);
    return latest_;
  }

 private:
  struct pending {
    std::uint64_t sequence = 0;
    std::optional<T> value;
    // Set for a replay meant for one new subscriber
    std::shared_ptr<subscriber<T>> only;
    // Completion marker
    bool last = false;
  };

  // A failing handler is logged and skipped; the rest still receive the value
  void deliver(subscriber<T>& sub, const T& value) {
    if (!sub.active()) return;
    try {
      if (sub.filter && !sub.filter(value)) return;
      sub.on_next(value);
    } catch (const std::exception& e) {
      detail::log(LogLevel::Error, "subscriber of %.*s threw: %s",
                  type_name_length<T>(), type_name_data<T>(), e.what());
    } catch (...) {
      detail::log(LogLevel::Error,
                  "subscriber of %.*s threw a non-standard exception",
                  type_name_length<T>(), type_name_data<T>());
    }
  }

  void notify_completed(subscriber<T>& sub) {
    if (!sub.on_completed) return;
    try {
      sub.on_completed();
    } catch (const std::exception& e) {
      detail::log(LogLevel::Error, "completion handler of %.*s threw: %s",
                  type_name_length<T>(), type_name_data<T>(), e.what());
    } catch (...) {
      detail::log(LogLevel::Error,
                  "completion handler of %.*s threw a non-standard exception",
                  type_name_length<T>(), type_name_data<T>());
    }
  }

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<subscriber<T>>> subscribers_;
  std::deque<pending> queue_;
  std::uint64_t next_sequence_ = 0;
  bool draining_ = false;
  const bool replay_;
  std::optional<T> latest_;
  bool completed_ = false;
};

}  // namespace detail

// Move-only handle; destroying it cancels the subscription
class Subscription {
 public:
  Subscription() = default;
  explicit Subscription(std::shared_ptr<detail::cancellable> state) noexcept
      : state_(std::move(state)) {}

  ~Subscription() { cancel(); }

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& other) noexcept
      : state_(std::move(other.state_)) {}

  Subscription& operator=(Subscription&& other) noexcept {
    if (this != &other) {
      cancel();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  void cancel() noexcept {
    if (state_) state_->cancel();
  }

  [[nodiscard]] bool active() const noexcept {
    return state_ && state_->active();
  }

 private:
  std::shared_ptr<detail::cancellable> state_;
};

// Subscribable view of a channel, optionally filtered
template <typename T>
class Stream {
 public:
  using value_type = T;
  using Handler = std::function<void(const T&)>;
  using Predicate = std::function<bool(const T&)>;
  using Completion = std::function<void()>;

  explicit Stream(std::shared_ptr<detail::channel_core<T>> core,
                  Predicate filter = {})
      : core_(std::move(core)), filter_(std::move(filter)) {}

  [[nodiscard]] Stream filter(Predicate predicate) const {
    if (!filter_) return Stream(core_, std::move(predicate));
    return Stream(core_, [outer = filter_, inner = std::move(predicate)](
                             const T& value) {
      return outer(value) && inner(value);
    });
  }

  [[nodiscard]] Subscription subscribe(Handler on_next,
                                       Completion on_completed = {}) const {
    return Subscription(core_->subscribe(std::move(on_next),
                                         std::move(on_completed), filter_));
  }

 private:
  std::shared_ptr<detail::channel_core<T>> core_;
  Predicate filter_;
};

// Change-event channel: carries values forward only
template <typename T>
class EventChannel : public detail::closable {
 public:
  EventChannel() : core_(std::make_shared<detail::channel_core<T>>()) {}

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  void publish(const T& value) { core_->publish(value); }

  // Split form of publish() for callers that order values under their own
  // lock and deliver after releasing it
  bool post(const T& value) { return core_->post(value); }
  void drain() { core_->drain(); }

  [[nodiscard]] Stream<T> stream() const { return Stream<T>(core_); }

  void complete() { core_->complete(); }

  [[nodiscard]] bool completed() const { return core_->completed(); }

  [[nodiscard]] std::size_t subscriber_count() const override {
    return core_->subscriber_count();
  }

  void close() override { complete(); }

 private:
  std::shared_ptr<detail::channel_core<T>> core_;
};

// Current-value channel: new subscribers first receive the latest value
template <typename T>
class ValueChannel : public detail::closable {
 public:
  explicit ValueChannel(T initial)
      : core_(std::make_shared<detail::channel_core<T>>(
            std::optional<T>(std::move(initial)))) {}

  ValueChannel(const ValueChannel&) = delete;
  ValueChannel& operator=(const ValueChannel&) = delete;

  void publish(const T& value) { core_->publish(value); }

  bool post(const T& value) { return core_->post(value); }
  void drain() { core_->drain(); }

  [[nodiscard]] T value() const { return *core_->latest(); }

  [[nodiscard]] Stream<T> stream() const { return Stream<T>(core_); }

  void complete() { core_->complete(); }

  [[nodiscard]] bool completed() const { return core_->completed(); }

  [[nodiscard]] std::size_t subscriber_count() const override {
    return core_->subscriber_count();
  }

  void close() override { complete(); }

 private:
  std::shared_ptr<detail::channel_core<T>> core_;
};

}  // namespace statebus
