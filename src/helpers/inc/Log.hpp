#ifndef CANHOST_HELPERS_LOG_HPP
#define CANHOST_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Leveled diagnostic output to stderr.
 *
 * Thin level filter over fmt::print(stderr, ...). One process-wide threshold;
 * messages above it are discarded before formatting.
 *
 * Output format: "[level] message\n".
 *
 * @note NOT RT-SAFE: Formatting allocates. Threshold checks are lock-free.
 */

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace canhost {
namespace helpers {
namespace log {

/* ----------------------------- Level ----------------------------- */

/**
 * @brief Message severity, most severe first.
 */
enum class Level : std::uint8_t {
  ERROR = 0, ///< Operation failed and could not be completed
  WARN,      ///< Operation failed, caller informed through status
  INFO,      ///< Notable lifecycle events
  DEBUG,     ///< Per-call detail
};

/// @brief Convert Level to string.
[[nodiscard]] inline const char* toString(Level level) noexcept {
  switch (level) {
  case Level::ERROR:
    return "error";
  case Level::WARN:
    return "warn";
  case Level::INFO:
    return "info";
  case Level::DEBUG:
    return "debug";
  default:
    return "unknown";
  }
}

/**
 * @brief Parse a level name ("error", "warn", "info", "debug").
 * @param text Level name.
 * @param out Parsed level (untouched on failure).
 * @return true on success.
 */
[[nodiscard]] inline bool parseLevel(std::string_view text, Level& out) noexcept {
  if (text == "error") {
    out = Level::ERROR;
  } else if (text == "warn" || text == "warning") {
    out = Level::WARN;
  } else if (text == "info") {
    out = Level::INFO;
  } else if (text == "debug") {
    out = Level::DEBUG;
  } else {
    return false;
  }
  return true;
}

/* ----------------------------- Threshold ----------------------------- */

namespace detail {

inline std::atomic<Level>& threshold() noexcept {
  static std::atomic<Level> level{Level::WARN};
  return level;
}

} // namespace detail

/// @brief Set the process-wide threshold.
inline void setLevel(Level level) noexcept {
  detail::threshold().store(level, std::memory_order_relaxed);
}

/// @brief Current threshold.
[[nodiscard]] inline Level level() noexcept {
  return detail::threshold().load(std::memory_order_relaxed);
}

/// @brief True if messages at this level are emitted.
[[nodiscard]] inline bool enabled(Level lvl) noexcept {
  return static_cast<std::uint8_t>(lvl) <= static_cast<std::uint8_t>(level());
}

/* ----------------------------- Output ----------------------------- */

template <typename... Args>
inline void write(Level lvl, fmt::format_string<Args...> fmtStr, Args&&... args) {
  if (!enabled(lvl)) {
    return;
  }
  fmt::print(stderr, "[{}] {}\n", toString(lvl), fmt::format(fmtStr, std::forward<Args>(args)...));
}

template <typename... Args> inline void error(fmt::format_string<Args...> f, Args&&... args) {
  write(Level::ERROR, f, std::forward<Args>(args)...);
}

template <typename... Args> inline void warn(fmt::format_string<Args...> f, Args&&... args) {
  write(Level::WARN, f, std::forward<Args>(args)...);
}

template <typename... Args> inline void info(fmt::format_string<Args...> f, Args&&... args) {
  write(Level::INFO, f, std::forward<Args>(args)...);
}

template <typename... Args> inline void debug(fmt::format_string<Args...> f, Args&&... args) {
  write(Level::DEBUG, f, std::forward<Args>(args)...);
}

} // namespace log
} // namespace helpers
} // namespace canhost

#endif // CANHOST_HELPERS_LOG_HPP
