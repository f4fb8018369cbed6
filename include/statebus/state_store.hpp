#pragma once

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "statebus/change_detector.hpp"
#include "statebus/channel.hpp"
#include "statebus/describe.hpp"
#include "statebus/detail/type_name.hpp"
#include "statebus/detail/type_registry.hpp"
#include "statebus/error.hpp"
#include "statebus/log.hpp"
#include "statebus/state_change.hpp"
#include "statebus/task.hpp"

namespace statebus {

enum class LockGranularity {
  Global,   // one mutation lock for every state type
  PerType,  // unrelated types mutate in parallel
};

struct StoreOptions {
  LockGranularity locking = LockGranularity::Global;
  std::shared_ptr<TaskProvider> tasks;  // default_task_provider() when null
};

// Any handle the store can block on until an asynchronous update finishes
template <typename A>
concept awaitable = requires(A& pending) { pending.get(); };

namespace detail {

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
class state_slot final : public closable {
 public:
  explicit state_slot(std::shared_ptr<T> initial)
      : instance_(std::move(initial)) {}

  [[nodiscard]] std::shared_ptr<T> load() const {
    std::lock_guard lock(instance_mutex_);
    return instance_;
  }

  void store(std::shared_ptr<T> value) {
    std::lock_guard lock(instance_mutex_);
    instance_ = std::move(value);
  }

  void close() override {}

  std::mutex mutation_mutex;
  // Orders stores and posts to this type's channels
  std::mutex notify_mutex;

 private:
  mutable std::mutex instance_mutex_;
  std::shared_ptr<T> instance_;
};

template <typename T, typename F>
void run_update(F& update, T& state) {
  using result_type = std::invoke_result_t<F&, T&>;
  if constexpr (std::is_void_v<result_type>) {
    std::invoke(update, state);
  } else {
    static_assert(awaitable<result_type>,
                  "update functions return void or an awaitable with get()");
    auto pending = std::invoke(update, state);
    pending.get();
  }
}

}  // namespace detail

// Holds one live instance per state type and broadcasts what mutations do
// to it. Notifications are queued in mutation order while the locks are
// held and delivered after they are released, so handlers may call back
// into the store, including mutate() for the same type.
class StateStore {
 public:
  explicit StateStore(StoreOptions options = {})
      : locking_(options.locking),
        tasks_(options.tasks ? std::move(options.tasks)
                             : default_task_provider()) {}

  ~StateStore() { dispose(); }

  StateStore(const StateStore&) = delete;
  StateStore& operator=(const StateStore&) = delete;

  // Default-constructs the instance on first access
  template <typename T>
  [[nodiscard]] std::shared_ptr<T> get() {
    ensure_live("get");
    return slot<T>("get")->load();
  }

  // Installs a new instance and publishes it on the current-value stream.
  // No change detection runs and observe_changes() sees nothing.
  template <typename T>
    requires(!detail::is_shared_ptr<T>::value)
  void replace(T value) {
    replace<T>(std::make_shared<T>(std::move(value)));
  }

  template <typename T>
  void replace(std::shared_ptr<T> value) {
    if (!value) {
      throw std::invalid_argument("StateStore::replace needs a non-null state");
    }
    ensure_live("replace");
    auto target = slot<T>("replace");
    std::shared_ptr<ValueChannel<std::shared_ptr<T>>> current;
    {
      std::lock_guard order(target->notify_mutex);
      target->store(value);
      current = currents_.find<T, ValueChannel<std::shared_ptr<T>>>();
      if (current) current->post(value);
    }
    if (current) current->drain();
  }

  // Runs update against the live instance under the mutation lock. The
  // post-update instance is always published on observe_current(); a
  // StateChange is published and returned only when some field changed.
  // An update returning an awaitable is waited on with the lock held.
  // Subscribers run after the lock is released.
  template <described T, typename F>
    requires std::invocable<F&, T&>
  std::optional<StateChange<T>> mutate(F&& update) {
    ensure_live("mutate");
    auto target = slot<T>("mutate");
    std::shared_ptr<ValueChannel<std::shared_ptr<T>>> current;
    std::shared_ptr<EventChannel<StateChange<T>>> channel;
    std::optional<StateChange<T>> result;
    {
      std::unique_lock lock(locking_ == LockGranularity::Global
                                ? global_mutex_
                                : target->mutation_mutex);
      // dispose() may have run while this call waited for the lock
      ensure_live("mutate");

      auto state = target->load();
      auto before = ChangeDetector<T>::take(*state);
      detail::run_update(update, *state);
      auto changes = ChangeDetector<T>::diff(before, *state);

      std::lock_guard order(target->notify_mutex);
      current = currents_.find<T, ValueChannel<std::shared_ptr<T>>>();
      if (current) current->post(state);
      if (!changes.empty()) {
        result.emplace(std::move(state), std::move(changes));
        channel = changes_.find<T, EventChannel<StateChange<T>>>();
        if (channel) channel->post(*result);
      }
    }

    if (current) current->drain();
    if (channel) channel->drain();
    return result;
  }

  // mutate() on the configured TaskProvider; failures land in the future
  template <described T, typename F>
    requires std::invocable<F&, T&>
  [[nodiscard]] std::future<std::optional<StateChange<T>>> mutate_async(
      F update) {
    ensure_live("mutate_async");
    auto promise =
        std::make_shared<std::promise<std::optional<StateChange<T>>>>();
    auto result = promise->get_future();
    auto done = std::make_shared<std::atomic_bool>(false);

    auto handle = tasks_->create_task(
        [this, promise, done, update = std::move(update)]() mutable {
          try {
            promise->set_value(mutate<T>(update));
          } catch (...) {
            promise->set_exception(std::current_exception());
          }
          done->store(true, std::memory_order_release);
        },
        "statebus.mutate");
    track(std::move(handle), std::move(done));
    return result;
  }

  // Yields the current instance on subscribe, then every later replace()
  // and mutate() result for T
  template <typename T>
  [[nodiscard]] Stream<std::shared_ptr<T>> observe_current() {
    ensure_live("observe_current");
    auto target = slot<T>("observe_current");
    std::lock_guard order(target->notify_mutex);
    auto channel = currents_.get_or_add<T, ValueChannel<std::shared_ptr<T>>>(
        [&target] {
          return std::make_shared<ValueChannel<std::shared_ptr<T>>>(
              target->load());
        });
    if (!channel) fail_disposed("observe_current");
    return channel->stream();
  }

  // Future StateChange records for T; nothing is replayed
  template <described T>
  [[nodiscard]] Stream<StateChange<T>> observe_changes() {
    ensure_live("observe_changes");
    auto channel = changes_.get_or_add<T, EventChannel<StateChange<T>>>(
        [] { return std::make_shared<EventChannel<StateChange<T>>>(); });
    if (!channel) fail_disposed("observe_changes");
    return channel->stream();
  }

  // Completes every channel, joins pending mutate_async() work and drops
  // all state. Safe to call more than once.
  void dispose() {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) return;

    std::size_t subscribers = 0;
    auto channels = currents_.drain();
    for (auto& changes : changes_.drain()) {
      channels.push_back(std::move(changes));
    }
    for (auto& channel : channels) {
      subscribers += channel->subscriber_count();
      channel->close();
    }
    if (subscribers > 0) {
      detail::log(LogLevel::Debug,
                  "StateStore disposed with %zu live subscriber(s)",
                  subscribers);
    }

    std::vector<pending_task> pending;
    {
      std::lock_guard lock(tasks_mutex_);
      pending.swap(pending_);
    }
    for (auto& task : pending) {
      task.handle->join();
    }

    for (auto& state : states_.drain()) {
      state->close();
    }
  }

  [[nodiscard]] bool disposed() const noexcept {
    return disposed_.load(std::memory_order_acquire);
  }

 private:
  struct pending_task {
    std::unique_ptr<TaskHandle> handle;
    std::shared_ptr<std::atomic_bool> done;
  };

  void ensure_live(const char* operation) const {
    if (!disposed()) return;
    fail_disposed(operation);
  }

  [[noreturn]] static void fail_disposed(const char* operation) {
    detail::log(LogLevel::Warning, "StateStore::%s called after dispose()",
                operation);
    throw DisposedError("StateStore");
  }

  // Registries close as dispose() drains them, so a call racing dispose()
  // fails here instead of recreating what was just dropped
  template <typename T>
  std::shared_ptr<detail::state_slot<T>> slot(const char* operation) {
    static_assert(std::is_default_constructible_v<T>,
                  "state types must be default constructible");
    auto existing = states_.get_or_add<T, detail::state_slot<T>>([] {
      return std::make_shared<detail::state_slot<T>>(std::make_shared<T>());
    });
    if (!existing) fail_disposed(operation);
    return existing;
  }

  void track(std::unique_ptr<TaskHandle> handle,
             std::shared_ptr<std::atomic_bool> done) {
    std::lock_guard lock(tasks_mutex_);
    // Finished threads are joined here so the list does not grow unbounded
    std::erase_if(pending_, [](const pending_task& task) {
      return task.done->load(std::memory_order_acquire);
    });
    pending_.push_back({std::move(handle), std::move(done)});
  }

  const LockGranularity locking_;
  std::shared_ptr<TaskProvider> tasks_;
  std::atomic_bool disposed_{false};
  std::mutex global_mutex_;

  detail::type_registry states_;
  detail::type_registry currents_;
  detail::type_registry changes_;

  std::mutex tasks_mutex_;
  std::vector<pending_task> pending_;
};

}  // namespace statebus
