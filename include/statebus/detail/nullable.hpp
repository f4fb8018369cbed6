#pragma once

#include <memory>
#include <optional>
#include <type_traits>

namespace statebus::detail {

template <typename T>
struct is_nullable : std::is_pointer<T> {};

template <typename T>
struct is_nullable<std::optional<T>> : std::true_type {};

template <typename T>
struct is_nullable<std::shared_ptr<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_nullable_v = is_nullable<std::remove_cvref_t<T>>::value;

template <typename T>
[[nodiscard]] constexpr bool is_null(const T& value) noexcept {
  using type = std::remove_cvref_t<T>;
  if constexpr (!is_nullable_v<type>) {
    return false;
  } else if constexpr (requires { value.has_value(); }) {
    return !value.has_value();
  } else {
    return value == nullptr;
  }
}

}  // namespace statebus::detail
