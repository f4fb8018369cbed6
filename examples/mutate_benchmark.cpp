#include <chrono>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <sys/resource.h>
#include <vector>

#include "statebus.hpp"

// Small state with one nested container field
struct InventoryState {
  int revision = 0;
  std::vector<std::string> skus;
  std::map<std::string, int> stock;
};

constexpr auto describe(statebus::Tag<InventoryState>) {
  return statebus::define(statebus::field("revision", &InventoryState::revision),
                          statebus::field("skus", &InventoryState::skus),
                          statebus::field("stock", &InventoryState::stock));
}

struct StockChanged {
  std::string sku;
  int delta = 0;
};

// Get current memory usage in bytes
size_t getCurrentMemoryUsage() {
  struct rusage usage;
  getrusage(RUSAGE_SELF, &usage);
  return static_cast<size_t>(usage.ru_maxrss) * 1024;  // KB to bytes on Linux
}

template <typename Fn>
double run(const char* label, int iterations, Fn&& fn) {
  auto start = std::chrono::high_resolution_clock::now();
  for (int i = 0; i < iterations; i++) {
    fn(i);
  }
  auto end = std::chrono::high_resolution_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  double ns_per_op =
      (static_cast<double>(duration) * 1000.0) / static_cast<double>(iterations);
  std::cout << std::left << std::setw(32) << label << std::right << std::fixed
            << std::setprecision(1) << std::setw(10) << ns_per_op << " ns/op"
            << std::endl;
  return ns_per_op;
}

int main() {
  std::cout << "statebus mutate/publish benchmark" << std::endl;
  std::cout << "=================================" << std::endl;

  const int iterations = 100000;

  statebus::StateStore store;
  statebus::EventBus bus;
  store.mutate<InventoryState>([](InventoryState& s) {
    for (int i = 0; i < 16; i++) {
      auto sku = "sku-" + std::to_string(i);
      s.skus.push_back(sku);
      s.stock[sku] = 100;
    }
  });

  long long observed = 0;
  auto changes = store.observe_changes<InventoryState>().subscribe(
      [&](const statebus::StateChange<InventoryState>& c) {
        observed += static_cast<long long>(c.changed_properties().size());
      });
  long long events = 0;
  auto stock_events = bus.subscribe_action<StockChanged>(
      [&](const StockChanged& e) { events += e.delta; });

  size_t memBefore = getCurrentMemoryUsage();

  run("mutate (no change)", iterations, [&](int) {
    store.mutate<InventoryState>([](InventoryState&) {});
  });
  run("mutate (primitive field)", iterations, [&](int) {
    store.mutate<InventoryState>([](InventoryState& s) { s.revision++; });
  });
  run("mutate (nested map entry)", iterations, [&](int i) {
    store.mutate<InventoryState>(
        [i](InventoryState& s) { s.stock["sku-" + std::to_string(i % 16)]--; });
  });
  run("publish (one subscriber)", iterations,
      [&](int i) { bus.publish(StockChanged{"sku", i % 2}); });

  size_t memAfter = getCurrentMemoryUsage();

  std::cout << "Change records observed: " << observed << std::endl;
  std::cout << "Event deltas summed: " << events << std::endl;
  std::cout << "Peak memory growth: " << (memAfter - memBefore) / 1024 << " KB"
            << std::endl;
  return 0;
}
