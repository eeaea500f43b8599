#pragma once

#include <unistd.h>
#include <atomic>
#include <cstdio>
#include <optional>
#include <string>

namespace parking {
namespace Logger {
  enum class Level { DEBUG, INFO, WARN, ERROR };

  namespace detail {
    constexpr const char* colors[] = {"\033[90m", "\033[36m", "\033[33m", "\033[31m"};
    constexpr const char* names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};

    inline std::atomic<int> threshold{static_cast<int>(Level::INFO)};

    inline bool enabled(Level level) {
      return static_cast<int>(level) >= threshold.load(std::memory_order_relaxed);
    }

    // One write(2) per line so concurrent threads never interleave output.
    template<typename... Args>
    void log(Level level, const char* tag, const char* message, Args... args) {
      char buf[512];
      const int cap = static_cast<int>(sizeof(buf)) - 1;  // keep room for '\n'
      int n = snprintf(buf, cap, "%s[%s] [%s]\033[0m ",
                       colors[static_cast<int>(level)],
                       names[static_cast<int>(level)],
                       tag);
      if (n < 0) n = 0;
      if (n > cap - 1) n = cap - 1;
      int m;
      if constexpr (sizeof...(Args) == 0) {
        m = snprintf(buf + n, cap - n, "%s", message);
      } else {
        m = snprintf(buf + n, cap - n, message, args...);
      }
      if (m < 0) m = 0;
      if (m > cap - n - 1) m = cap - n - 1;
      n += m;
      buf[n++] = '\n';
      ssize_t written = write(STDOUT_FILENO, buf, n);
      (void)written;
    }
  }

  inline void setLevel(Level level) {
    detail::threshold.store(static_cast<int>(level), std::memory_order_relaxed);
  }

  /** Parse "debug", "info", "warn" or "error" (lower case). */
  inline std::optional<Level> parseLevel(const std::string& name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn") return Level::WARN;
    if (name == "error") return Level::ERROR;
    return std::nullopt;
  }

  template<typename... Args>
  void debug(const char* tag, const char* message, Args... args) {
    if (detail::enabled(Level::DEBUG)) detail::log(Level::DEBUG, tag, message, args...);
  }

  template<typename... Args>
  void info(const char* tag, const char* message, Args... args) {
    if (detail::enabled(Level::INFO)) detail::log(Level::INFO, tag, message, args...);
  }

  template<typename... Args>
  void warn(const char* tag, const char* message, Args... args) {
    if (detail::enabled(Level::WARN)) detail::log(Level::WARN, tag, message, args...);
  }

  template<typename... Args>
  void error(const char* tag, const char* message, Args... args) {
    if (detail::enabled(Level::ERROR)) detail::log(Level::ERROR, tag, message, args...);
  }
} // namespace Logger
} // namespace parking
