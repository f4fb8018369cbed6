#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace statebus {

// How a field's before/after values are compared
enum class Compare {
  // Canonical JSON encoding of the whole reachable value; sees in-place
  // edits of nested objects and containers
  Structural,
  // operator== on a copy taken before the update; an unchanged pointer or
  // handle hides edits made through it
  Equality,
};

template <typename T>
struct Tag {
  using type = T;
};

template <typename T>
inline constexpr Tag<T> tag{};

template <typename Owner, typename Member, Compare C = Compare::Structural>
struct Field {
  using owner_type = Owner;
  using value_type = Member;
  static constexpr Compare comparison = C;

  std::string_view name;
  Member Owner::*member;

  [[nodiscard]] constexpr const Member& get(const Owner& owner) const noexcept {
    return owner.*member;
  }
};

template <typename... Fields>
struct Descriptor {
  static constexpr std::size_t size = sizeof...(Fields);
  std::tuple<Fields...> fields;

  template <typename Fn>
  constexpr void for_each(Fn&& fn) const {
    std::apply([&fn](const auto&... field) { (fn(field), ...); }, fields);
  }
};

template <typename Owner, typename Member>
[[nodiscard]] constexpr auto field(std::string_view name,
                                   Member Owner::*member) noexcept {
  return Field<Owner, Member>{name, member};
}

template <Compare C, typename Owner, typename Member>
[[nodiscard]] constexpr auto field(std::string_view name,
                                   Member Owner::*member) noexcept {
  return Field<Owner, Member, C>{name, member};
}

template <typename... Fields>
[[nodiscard]] constexpr auto define(Fields... fields) noexcept {
  return Descriptor<Fields...>{std::tuple<Fields...>{fields...}};
}

// Satisfied when `describe(statebus::Tag<T>)` is reachable through ADL
template <typename T>
concept described = requires { describe(Tag<T>{}); };

// Field table for T, built on first use and reused afterwards
template <typename T>
  requires described<T>
[[nodiscard]] const auto& fields_of() {
  static const auto table = describe(Tag<T>{});
  return table;
}

}  // namespace statebus
