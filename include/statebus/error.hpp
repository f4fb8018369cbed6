#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace statebus {

// Thrown by StateStore and EventBus operations once dispose() has run
class DisposedError : public std::logic_error {
 public:
  explicit DisposedError(std::string_view component)
      : std::logic_error(std::string(component) + " used after dispose()"),
        component_(component) {}

  [[nodiscard]] const std::string& component() const noexcept {
    return component_;
  }

 private:
  std::string component_;
};

}  // namespace statebus
