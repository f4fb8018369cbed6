#pragma once

#include <memory>

#include "statebus/event_bus.hpp"
#include "statebus/state_store.hpp"

namespace statebus {

// How widely one store/bus pair is shared
enum class Lifetime {
  Session,  // a fresh pair for each caller, e.g. one per user session
  Process,  // one pair for the whole process
};

struct Services {
  std::shared_ptr<StateStore> store;
  std::shared_ptr<EventBus> bus;
};

// Process-wide services are built on first use with that caller's options;
// later options are ignored.
inline Services make_services(Lifetime lifetime, StoreOptions options = {}) {
  if (lifetime == Lifetime::Process) {
    static const Services shared{
        std::make_shared<StateStore>(std::move(options)),
        std::make_shared<EventBus>()};
    return shared;
  }
  return Services{std::make_shared<StateStore>(std::move(options)),
                  std::make_shared<EventBus>()};
}

}  // namespace statebus
