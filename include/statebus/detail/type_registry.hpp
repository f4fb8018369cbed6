#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace statebus::detail {

// Anything a registry owns can be closed when its owner is disposed
struct closable {
  virtual ~closable() = default;
  virtual void close() = 0;
  virtual std::size_t subscriber_count() const { return 0; }
};

// Concurrent type_index -> value table with atomic insert-if-absent.
// Each registry is used for a single value family, so the value stored
// under typeid(Key) always has the same dynamic type. Once drained it
// stays closed and get_or_add() yields nullptr.
class type_registry {
 public:
  type_registry() = default;
  type_registry(const type_registry&) = delete;
  type_registry& operator=(const type_registry&) = delete;

  template <typename Key, typename Value, typename Factory>
  std::shared_ptr<Value> get_or_add(Factory&& make) {
    static_assert(std::is_base_of_v<closable, Value>,
                  "registry values must derive from detail::closable");
    const std::type_index key(typeid(Key));
    {
      std::shared_lock lock(mutex_);
      if (auto it = entries_.find(key); it != entries_.end()) {
        return std::static_pointer_cast<Value>(it->second);
      }
    }

    std::unique_lock lock(mutex_);
    if (closed_) return nullptr;
    if (auto it = entries_.find(key); it != entries_.end()) {
      return std::static_pointer_cast<Value>(it->second);
    }
    std::shared_ptr<Value> value = std::forward<Factory>(make)();
    entries_.emplace(key, value);
    return value;
  }

  template <typename Key, typename Value>
  [[nodiscard]] std::shared_ptr<Value> find() const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::type_index(typeid(Key)));
    if (it == entries_.end()) return nullptr;
    return std::static_pointer_cast<Value>(it->second);
  }

  [[nodiscard]] std::size_t size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
  }

  [[nodiscard]] bool closed() const {
    std::shared_lock lock(mutex_);
    return closed_;
  }

  // Empties and closes the table, handing back everything it held
  std::vector<std::shared_ptr<closable>> drain() {
    std::vector<std::shared_ptr<closable>> drained;
    std::unique_lock lock(mutex_);
    closed_ = true;
    drained.reserve(entries_.size());
    for (auto& [key, entry] : entries_) {
      drained.push_back(std::move(entry));
    }
    entries_.clear();
    return drained;
  }

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::type_index, std::shared_ptr<closable>> entries_;
  bool closed_ = false;
};

}  // namespace statebus::detail
