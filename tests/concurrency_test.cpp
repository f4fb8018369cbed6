#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "statebus/event_bus.hpp"
#include "statebus/state_store.hpp"

namespace {

struct Counter {
  int value = 0;
};

constexpr auto describe(statebus::Tag<Counter>) {
  return statebus::define(statebus::field("value", &Counter::value));
}

struct Tally {
  int value = 0;
};

constexpr auto describe(statebus::Tag<Tally>) {
  return statebus::define(statebus::field("value", &Tally::value));
}

struct Ping {
  int id = 0;
};

struct Saved {
  int value = 0;
};

void run_concurrently(int workers, const std::function<void(int)>& work) {
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (int i = 0; i < workers; ++i) {
    threads.emplace_back([&work, i] { work(i); });
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace

TEST_CASE("Concurrent mutations of one type lose no updates") {
  SUBCASE("global lock") {
    statebus::StateStore store;
    run_concurrently(100, [&](int) {
      store.mutate<Counter>([](Counter& c) { c.value += 1; });
    });
    CHECK(store.get<Counter>()->value == 100);
  }

  SUBCASE("per-type lock") {
    statebus::StoreOptions options;
    options.locking = statebus::LockGranularity::PerType;
    statebus::StateStore store(options);
    run_concurrently(100, [&](int) {
      store.mutate<Counter>([](Counter& c) { c.value += 1; });
    });
    CHECK(store.get<Counter>()->value == 100);
  }
}

TEST_CASE("Change notifications follow mutation order") {
  statebus::StateStore store;
  std::vector<int> observed;
  auto subscription = store.observe_changes<Counter>().subscribe(
      [&](const statebus::StateChange<Counter>& c) {
        observed.push_back(*c.changed_properties()[0].new_value_as<int>());
      });

  run_concurrently(20, [&](int) {
    for (int i = 0; i < 5; ++i) {
      store.mutate<Counter>([](Counter& c) { c.value += 1; });
    }
  });

  REQUIRE(observed.size() == 100);
  for (std::size_t i = 0; i < observed.size(); ++i) {
    CHECK(observed[i] == static_cast<int>(i) + 1);
  }
}

TEST_CASE("Per-type locking lets unrelated types proceed") {
  statebus::StoreOptions options;
  options.locking = statebus::LockGranularity::PerType;
  statebus::StateStore store(options);

  std::promise<void> entered;
  std::promise<void> release;
  auto release_signal = release.get_future().share();

  auto slow = std::async(std::launch::async, [&] {
    store.mutate<Counter>([&](Counter& c) {
      entered.set_value();
      release_signal.wait();
      c.value = 1;
    });
  });
  entered.get_future().wait();

  // Would block behind the Counter mutation under the global lock
  auto fast = std::async(std::launch::async, [&] {
    store.mutate<Tally>([](Tally& t) { t.value = 1; });
  });
  CHECK(fast.wait_for(std::chrono::seconds(5)) == std::future_status::ready);

  release.set_value();
  slow.get();
  fast.get();
  CHECK(store.get<Counter>()->value == 1);
  CHECK(store.get<Tally>()->value == 1);
}

TEST_CASE("Global locking serializes unrelated types") {
  statebus::StateStore store;
  std::atomic<int> inside{0};
  std::atomic<int> overlap{0};

  auto guard = [&] {
    if (inside.fetch_add(1) != 0) overlap.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    inside.fetch_sub(1);
  };

  run_concurrently(8, [&](int i) {
    for (int n = 0; n < 10; ++n) {
      if (i % 2 == 0) {
        store.mutate<Counter>([&](Counter& c) {
          guard();
          c.value += 1;
        });
      } else {
        store.mutate<Tally>([&](Tally& t) {
          guard();
          t.value += 1;
        });
      }
    }
  });

  CHECK(overlap.load() == 0);
  CHECK(store.get<Counter>()->value == 40);
  CHECK(store.get<Tally>()->value == 40);
}

TEST_CASE("Concurrent replace keeps get consistent with the last publish") {
  statebus::StateStore store;
  std::mutex seen_mutex;
  std::shared_ptr<Counter> last_seen;
  auto subscription = store.observe_current<Counter>().subscribe(
      [&](const std::shared_ptr<Counter>& c) {
        std::lock_guard lock(seen_mutex);
        last_seen = c;
      });

  run_concurrently(10, [&](int i) {
    for (int n = 0; n < 10; ++n) {
      store.replace(Counter{i * 10 + n});
    }
  });

  std::lock_guard lock(seen_mutex);
  CHECK(last_seen == store.get<Counter>());
}

TEST_CASE("get from many threads yields one instance") {
  statebus::StateStore store;
  std::mutex seen_mutex;
  std::vector<std::shared_ptr<Counter>> seen;

  run_concurrently(16, [&](int) {
    auto instance = store.get<Counter>();
    std::lock_guard lock(seen_mutex);
    seen.push_back(instance);
  });

  for (const auto& instance : seen) {
    CHECK(instance == seen.front());
  }
}

TEST_CASE("Concurrent publishes are all delivered") {
  statebus::EventBus bus;
  std::atomic<int> received{0};
  auto subscription =
      bus.subscribe_action<Ping>([&](const Ping&) { received.fetch_add(1); });

  run_concurrently(10, [&](int i) {
    for (int n = 0; n < 100; ++n) {
      bus.publish(Ping{i * 100 + n});
    }
  });

  CHECK(received.load() == 1000);
}

TEST_CASE("Concurrent subscriptions all receive later events") {
  statebus::EventBus bus;
  std::atomic<int> received{0};
  std::mutex subscriptions_mutex;
  std::vector<statebus::Subscription> subscriptions;

  run_concurrently(50, [&](int) {
    auto subscription =
        bus.subscribe_action<Ping>([&](const Ping&) { received.fetch_add(1); });
    std::lock_guard lock(subscriptions_mutex);
    subscriptions.push_back(std::move(subscription));
  });

  CHECK(bus.subscriber_count<Ping>() == 50);
  bus.publish(Ping{1});
  CHECK(received.load() == 50);
}

TEST_CASE("Cancelling while another thread publishes is safe") {
  statebus::EventBus bus;
  std::atomic<bool> stop{false};
  std::atomic<int> received{0};

  auto publisher = std::async(std::launch::async, [&] {
    int id = 0;
    while (!stop.load()) {
      bus.publish(Ping{id++});
    }
  });

  for (int i = 0; i < 200; ++i) {
    auto subscription =
        bus.subscribe_action<Ping>([&](const Ping&) { received.fetch_add(1); });
    std::this_thread::yield();
  }
  stop.store(true);
  publisher.get();

  CHECK(bus.subscriber_count<Ping>() == 0);
}

TEST_CASE("Store and bus handlers calling into each other do not deadlock") {
  statebus::StateStore store;
  statebus::EventBus bus;

  auto announce = store.observe_changes<Counter>().subscribe(
      [&](const statebus::StateChange<Counter>& c) {
        bus.publish(Saved{c.state()->value});
      });
  auto audit = bus.subscribe_action<Saved>([&](const Saved&) {
    store.mutate<Tally>([](Tally& t) { t.value += 1; });
  });

  auto mutating = std::async(std::launch::async, [&] {
    for (int i = 0; i < 200; ++i) {
      store.mutate<Counter>([](Counter& c) { c.value += 1; });
    }
  });
  auto publishing = std::async(std::launch::async, [&] {
    for (int i = 0; i < 200; ++i) {
      bus.publish(Saved{0});
    }
  });

  REQUIRE(mutating.wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);
  REQUIRE(publishing.wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);
  mutating.get();
  publishing.get();

  CHECK(store.get<Counter>()->value == 200);
  CHECK(store.get<Tally>()->value == 400);
}

TEST_CASE("Subscribing while the bus is disposed never leaves a silent subscriber") {
  statebus::EventBus bus;
  std::atomic<int> completed{0};
  std::atomic<int> refused{0};
  std::mutex subscriptions_mutex;
  std::vector<statebus::Subscription> subscriptions;

  std::promise<void> go;
  auto start = go.get_future().share();
  auto disposing = std::async(std::launch::async, [&] {
    start.wait();
    bus.dispose();
  });

  go.set_value();
  run_concurrently(8, [&](int) {
    for (int n = 0; n < 50; ++n) {
      try {
        auto subscription = bus.subscribe<Ping>().subscribe(
            [](const Ping&) {}, [&] { completed.fetch_add(1); });
        std::lock_guard lock(subscriptions_mutex);
        subscriptions.push_back(std::move(subscription));
      } catch (const statebus::DisposedError&) {
        refused.fetch_add(1);
      }
    }
  });
  disposing.get();

  std::lock_guard lock(subscriptions_mutex);
  CHECK(refused.load() + static_cast<int>(subscriptions.size()) == 400);
  CHECK(completed.load() == static_cast<int>(subscriptions.size()));
  for (const auto& subscription : subscriptions) {
    CHECK_FALSE(subscription.active());
  }
}
