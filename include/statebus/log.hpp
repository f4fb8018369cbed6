#pragma once

#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#ifndef STATEBUS_LOG_LEVEL
#define STATEBUS_LOG_LEVEL 2  // Warning
#endif

namespace statebus {

enum class LogLevel : int {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Off = 4,
};

using LogSink = std::function<void(LogLevel, std::string_view)>;

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Error:
      return "error";
    case LogLevel::Off:
      return "off";
  }
  return "unknown";
}

namespace detail {

struct log_config {
  std::mutex mutex;
  LogLevel level = static_cast<LogLevel>(STATEBUS_LOG_LEVEL);
  LogSink sink;
};

inline log_config& logger() {
  static log_config config;
  return config;
}

inline bool log_enabled(LogLevel level) {
  auto& config = logger();
  std::lock_guard lock(config.mutex);
  return level != LogLevel::Off && level >= config.level;
}

template <typename... Args>
void log(LogLevel level, const char* format, Args... args) {
  if (!log_enabled(level)) return;

  std::string message;
  if constexpr (sizeof...(Args) == 0) {
    message = format;
  } else {
    int length = std::snprintf(nullptr, 0, format, args...);
    if (length < 0) return;
    message.resize(static_cast<std::size_t>(length) + 1);
    std::snprintf(message.data(), message.size(), format, args...);
    message.resize(static_cast<std::size_t>(length));
  }

  LogSink sink;
  {
    auto& config = logger();
    std::lock_guard lock(config.mutex);
    sink = config.sink;
  }
  if (sink) {
    sink(level, message);
    return;
  }
  auto name = to_string(level);
  fprintf(stderr, "statebus: [%.*s] %s\n", static_cast<int>(name.size()),
          name.data(), message.c_str());
}

}  // namespace detail

inline void set_log_level(LogLevel level) {
  auto& config = detail::logger();
  std::lock_guard lock(config.mutex);
  config.level = level;
}

[[nodiscard]] inline LogLevel log_level() {
  auto& config = detail::logger();
  std::lock_guard lock(config.mutex);
  return config.level;
}

// Passing an empty sink restores the stderr default
inline void set_log_sink(LogSink sink) {
  auto& config = detail::logger();
  std::lock_guard lock(config.mutex);
  config.sink = std::move(sink);
}

}  // namespace statebus
