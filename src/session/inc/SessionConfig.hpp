#ifndef CANHOST_SESSION_SESSION_CONFIG_HPP
#define CANHOST_SESSION_SESSION_CONFIG_HPP
/**
 * @file SessionConfig.hpp
 * @brief Settings for opening, starting, and driving a channel session.
 *
 * Plain value type. Tools fill it from command-line flags; library users
 * build it directly or start from a preset.
 */

#include "src/transport/inc/Bitrate.hpp"
#include "src/transport/inc/CanApiTransport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace canhost {

namespace session {

/* ----------------------------- Constants ----------------------------- */

/// Default number of channels probed by scan().
inline constexpr std::int32_t DEFAULT_SCAN_LIMIT = 8;

/// Upper bound accepted for the scan limit.
inline constexpr std::int32_t MAX_SCAN_LIMIT = 256;

/// Default monitor poll timeout.
inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{100};

/* ----------------------------- SessionConfig ----------------------------- */

/**
 * @brief Channel session settings.
 */
struct SessionConfig {
  std::string libraryPath{transport::DEFAULT_DRIVER_LIBRARY}; ///< Driver library name or path
  std::int32_t channel{0};                                   ///< Channel index to open
  bool monitorMode{false};                                   ///< Listen-only
  transport::BitrateIndex bitrate{transport::BitrateIndex::INDEX_250K}; ///< Preset
  std::uint16_t txTimeoutMs{0};                              ///< Send timeout (0 = non-blocking)
  std::uint16_t rxTimeoutMs{1000};                           ///< Receive timeout
  std::int32_t scanLimit{DEFAULT_SCAN_LIMIT};                ///< Channels probed by scan
  std::chrono::milliseconds pollInterval{DEFAULT_POLL_INTERVAL}; ///< Monitor poll timeout
  std::chrono::milliseconds monitorDuration{30000};          ///< Monitor run time

  /// @brief Default settings.
  [[nodiscard]] static SessionConfig defaults();

  /// @brief Listen-only preset (monitor mode, no transmit timeout).
  [[nodiscard]] static SessionConfig listenOnly();

  /**
   * @brief Check all fields for consistency.
   * @param error Receives a description of the first problem found.
   * @return true if the configuration is usable.
   */
  [[nodiscard]] bool validate(std::string& error) const;

  /// @brief Human-readable summary.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

} // namespace session

} // namespace canhost

#endif // CANHOST_SESSION_SESSION_CONFIG_HPP
