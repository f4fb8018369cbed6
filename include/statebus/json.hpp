#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "statebus/detail/type_name.hpp"
#include "statebus/log.hpp"

// Nullable wrappers encode as JSON null when empty
namespace nlohmann {

template <typename T>
struct adl_serializer<std::optional<T>> {
  static void to_json(json& j, const std::optional<T>& value) {
    if (value) {
      j = *value;
    } else {
      j = nullptr;
    }
  }

  static void from_json(const json& j, std::optional<T>& value) {
    if (j.is_null()) {
      value.reset();
    } else {
      value = j.get<T>();
    }
  }
};

template <typename T>
struct adl_serializer<std::shared_ptr<T>> {
  static void to_json(json& j, const std::shared_ptr<T>& value) {
    if (value) {
      j = *value;
    } else {
      j = nullptr;
    }
  }

  static void from_json(const json& j, std::shared_ptr<T>& value) {
    if (j.is_null()) {
      value.reset();
    } else {
      value = std::make_shared<T>(j.get<T>());
    }
  }
};

}  // namespace nlohmann

namespace statebus {

template <typename T>
concept encodable = std::is_constructible_v<nlohmann::json, const T&>;

namespace detail {

template <typename T>
struct decodable_impl
    : std::bool_constant<std::is_default_constructible_v<T> &&
                         requires(const nlohmann::json& j, T& value) {
                           nlohmann::adl_serializer<T>::from_json(j, value);
                         }> {};

template <typename T>
struct decodable_impl<std::optional<T>> : decodable_impl<T> {};

template <typename T>
struct decodable_impl<std::shared_ptr<T>> : decodable_impl<T> {};

}  // namespace detail

template <typename T>
concept decodable = detail::decodable_impl<std::remove_cvref_t<T>>::value;

// Compact canonical encoding: object keys are sorted by nlohmann::json and
// invalid UTF-8 is replaced instead of throwing
template <encodable T>
[[nodiscard]] std::string encode(const T& value) {
  return nlohmann::json(value).dump(-1, ' ', false,
                                    nlohmann::json::error_handler_t::replace);
}

// Best-effort reconstruction; nullopt when the encoding cannot be converted
// back into T
template <typename T>
[[nodiscard]] std::optional<T> decode(std::string_view encoded) {
  if constexpr (!decodable<T>) {
    detail::log(LogLevel::Debug, "%.*s has no from_json conversion",
                detail::type_name_length<T>(), detail::type_name_data<T>());
    return std::nullopt;
  } else {
    try {
      return nlohmann::json::parse(encoded).template get<T>();
    } catch (const std::exception& e) {
      detail::log(LogLevel::Debug, "cannot reconstruct %.*s: %s",
                  detail::type_name_length<T>(), detail::type_name_data<T>(),
                  e.what());
      return std::nullopt;
    }
  }
}

}  // namespace statebus
