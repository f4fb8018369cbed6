#pragma once

#include <string_view>

namespace statebus::detail {

template <typename T>
consteval std::string_view type_name() {
#if defined(__clang__)
  std::string_view name = __PRETTY_FUNCTION__;
  auto start = name.find("[T = ");
  if (start == std::string_view::npos) return "UNKNOWN";
  start += 5;
  auto end = name.find_last_of(']');
  return name.substr(start, end - start);
#elif defined(__GNUC__)
  std::string_view name = __PRETTY_FUNCTION__;
  auto start = name.find("[with T = ");
  if (start == std::string_view::npos) {
    start = name.find("[T = ");
    if (start == std::string_view::npos) return "UNKNOWN";
    start += 5;
  } else {
    start += 10;
  }
  // gcc appends "; std::string_view = ..." after the template argument
  auto end = name.find(';', start);
  if (end == std::string_view::npos) end = name.find_last_of(']');
  return name.substr(start, end - start);
#else
  return "UNKNOWN";
#endif
}

// printf helpers: type_name() is not null terminated
template <typename T>
constexpr int type_name_length() {
  return static_cast<int>(type_name<T>().size());
}

template <typename T>
constexpr const char* type_name_data() {
  return type_name<T>().data();
}

}  // namespace statebus::detail
