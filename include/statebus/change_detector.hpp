#pragma once

#include <any>
#include <concepts>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "statebus/describe.hpp"
#include "statebus/detail/nullable.hpp"
#include "statebus/json.hpp"
#include "statebus/state_change.hpp"

namespace statebus {

// Comparison key of one field, captured before an update
struct FieldSnapshot {
  std::string encoded;  // Compare::Structural
  std::any value;       // Compare::Equality
};

struct Snapshot {
  std::vector<FieldSnapshot> fields;
};

namespace detail {

template <typename V>
std::any to_any(const V& value) {
  if (is_null(value)) return {};
  return std::any(value);
}

template <typename F>
FieldSnapshot capture(const F& field, const typename F::owner_type& state) {
  using value_type = typename F::value_type;
  static_assert(std::is_copy_constructible_v<value_type>,
                "described fields must be copy constructible");

  if constexpr (F::comparison == Compare::Structural) {
    static_assert(encodable<value_type>,
                  "structurally compared fields need an nlohmann::json "
                  "conversion (to_json or adl_serializer)");
    return FieldSnapshot{encode(field.get(state)), {}};
  } else {
    static_assert(std::equality_comparable<value_type>,
                  "Compare::Equality fields need operator==");
    return FieldSnapshot{{}, std::any(field.get(state))};
  }
}

template <typename F>
std::optional<PropertyChange> compare_field(
    const F& field, const FieldSnapshot& before,
    const typename F::owner_type& after) {
  using value_type = typename F::value_type;
  const auto& current = field.get(after);

  if constexpr (F::comparison == Compare::Structural) {
    auto encoded = encode(current);
    if (encoded == before.encoded) return std::nullopt;

    // Reconstruction failure still reports the change, with no old value
    std::any old_value;
    if (auto restored = decode<value_type>(before.encoded)) {
      old_value = to_any(*restored);
    }
    return PropertyChange(std::string(field.name), std::move(old_value),
                          to_any(current));
  } else {
    const auto* previous = std::any_cast<value_type>(&before.value);
    if (previous != nullptr && *previous == current) return std::nullopt;
    return PropertyChange(std::string(field.name),
                          previous ? to_any(*previous) : std::any{},
                          to_any(current));
  }
}

}  // namespace detail

// Stateless per-type diff over the fields listed by describe()
template <described T>
struct ChangeDetector {
  [[nodiscard]] static Snapshot take(const T& state) {
    const auto& table = fields_of<T>();
    Snapshot snapshot;
    snapshot.fields.reserve(table.size);
    table.for_each([&](const auto& field) {
      snapshot.fields.push_back(detail::capture(field, state));
    });
    return snapshot;
  }

  [[nodiscard]] static std::vector<PropertyChange> diff(const Snapshot& before,
                                                        const T& after) {
    const auto& table = fields_of<T>();
    if (before.fields.size() != table.size) {
      throw std::invalid_argument("snapshot was not taken from this type");
    }

    std::vector<PropertyChange> changes;
    std::size_t index = 0;
    table.for_each([&](const auto& field) {
      if (auto change =
              detail::compare_field(field, before.fields[index++], after)) {
        changes.push_back(std::move(*change));
      }
    });
    return changes;
  }
};

}  // namespace statebus
