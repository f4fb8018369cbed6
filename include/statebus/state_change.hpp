#pragma once

#include <any>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace statebus {

// One top-level field whose comparison key differed across a mutation.
// An empty std::any stands for a null or unrecoverable value.
class PropertyChange {
 public:
  PropertyChange(std::string property_name, std::any old_value,
                 std::any new_value)
      : property_name_(std::move(property_name)),
        old_value_(std::move(old_value)),
        new_value_(std::move(new_value)) {}

  [[nodiscard]] const std::string& property_name() const noexcept {
    return property_name_;
  }
  [[nodiscard]] const std::any& old_value() const noexcept {
    return old_value_;
  }
  [[nodiscard]] const std::any& new_value() const noexcept {
    return new_value_;
  }

  template <typename V>
  [[nodiscard]] const V* old_value_as() const noexcept {
    return std::any_cast<V>(&old_value_);
  }

  template <typename V>
  [[nodiscard]] const V* new_value_as() const noexcept {
    return std::any_cast<V>(&new_value_);
  }

 private:
  std::string property_name_;
  std::any old_value_;
  std::any new_value_;
};

template <typename T>
class StateChange {
 public:
  StateChange(std::shared_ptr<T> state,
              std::vector<PropertyChange> changed_properties)
      : state_(std::move(state)),
        changed_properties_(std::move(changed_properties)) {}

  [[nodiscard]] const std::shared_ptr<T>& state() const noexcept {
    return state_;
  }

  // In field declaration order
  [[nodiscard]] const std::vector<PropertyChange>& changed_properties()
      const noexcept {
    return changed_properties_;
  }

  [[nodiscard]] const PropertyChange* find(std::string_view name) const {
    for (const auto& change : changed_properties_) {
      if (change.property_name() == name) return &change;
    }
    return nullptr;
  }

  [[nodiscard]] bool contains(std::string_view name) const {
    return find(name) != nullptr;
  }

 private:
  std::shared_ptr<T> state_;
  std::vector<PropertyChange> changed_properties_;
};

}  // namespace statebus
