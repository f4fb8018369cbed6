#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "statebus.hpp"

// Two independent consumers share a session's state and events without
// knowing about each other.

struct Address {
  std::string city;
  std::string zip_code;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Address, city, zip_code)

struct SessionState {
  std::string user;
  std::optional<std::string> role;
  Address address;
  std::vector<std::string> recent_pages;
};

constexpr auto describe(statebus::Tag<SessionState>) {
  using statebus::field;
  return statebus::define(field("user", &SessionState::user),
                          field("role", &SessionState::role),
                          field("address", &SessionState::address),
                          field("recent_pages", &SessionState::recent_pages));
}

struct PageVisited {
  std::string path;
};

struct SignedOut {};

class HeaderView {
 public:
  explicit HeaderView(const statebus::Services& services) {
    subscriptions_.add(services.store->observe_current<SessionState>().subscribe(
        [](const std::shared_ptr<SessionState>& s) {
          std::cout << "[header] user="
                    << (s->user.empty() ? "<anonymous>" : s->user)
                    << " role=" << s->role.value_or("-") << std::endl;
        },
        [] { std::cout << "[header] session closed" << std::endl; }));
  }

 private:
  statebus::SubscriptionGroup subscriptions_;
};

class ActivityLog {
 public:
  explicit ActivityLog(const statebus::Services& services)
      : store_(services.store) {
    subscriptions_.add(services.bus->subscribe_action<PageVisited>(
        [this](const PageVisited& visit) {
          store_->mutate<SessionState>([&visit](SessionState& s) {
            s.recent_pages.push_back(visit.path);
          });
        }));
    subscriptions_.add(services.store->observe_changes<SessionState>().subscribe(
        [](const statebus::StateChange<SessionState>& change) {
          for (const auto& property : change.changed_properties()) {
            std::cout << "[activity] " << property.property_name()
                      << " changed" << std::endl;
          }
        }));
    subscriptions_.add(services.bus->subscribe_action<SignedOut>(
        [this](const SignedOut&) { store_->replace(SessionState{}); }));
  }

 private:
  std::shared_ptr<statebus::StateStore> store_;
  statebus::SubscriptionGroup subscriptions_;
};

int main() {
  statebus::set_log_level(statebus::LogLevel::Info);
  auto services = statebus::make_services(statebus::Lifetime::Session);

  HeaderView header(services);
  ActivityLog activity(services);

  services.store->mutate<SessionState>([](SessionState& s) {
    s.user = "grace";
    s.role = "admin";
    s.address = Address{"Arlington", "22201"};
  });

  services.bus->publish(PageVisited{"/reports"});
  services.bus->publish(PageVisited{"/settings"});

  auto moved = services.store->mutate<SessionState>(
      [](SessionState& s) { s.address.city = "Alexandria"; });
  if (moved) {
    const auto* before = moved->find("address")->old_value_as<Address>();
    std::cout << "moved from " << (before ? before->city : "?") << std::endl;
  }

  services.bus->publish(SignedOut{});

  services.bus->dispose();
  services.store->dispose();
  return 0;
}
