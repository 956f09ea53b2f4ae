/**
 * @file SessionConfig.cpp
 * @brief SessionConfig presets and validation.
 */

#include "src/session/inc/SessionConfig.hpp"

#include <fmt/core.h>

namespace canhost {

namespace session {

SessionConfig SessionConfig::defaults() { return SessionConfig{}; }

SessionConfig SessionConfig::listenOnly() {
  SessionConfig cfg{};
  cfg.monitorMode = true;
  cfg.txTimeoutMs = 0;
  return cfg;
}

bool SessionConfig::validate(std::string& error) const {
  if (libraryPath.empty()) {
    error = "Driver library path is empty";
    return false;
  }
  if (channel < 0) {
    error = fmt::format("Channel must be >= 0 (got {})", channel);
    return false;
  }
  if (!transport::isValidBitrateIndex(static_cast<std::int32_t>(bitrate))) {
    error = fmt::format("Bit-rate index {} is not a known preset",
                        static_cast<std::int32_t>(bitrate));
    return false;
  }
  if (scanLimit < 1 || scanLimit > MAX_SCAN_LIMIT) {
    error = fmt::format("Scan limit must be 1..{} (got {})", MAX_SCAN_LIMIT, scanLimit);
    return false;
  }
  if (pollInterval.count() <= 0) {
    error = "Poll interval must be positive";
    return false;
  }
  if (monitorDuration.count() < 0) {
    error = "Monitor duration must not be negative";
    return false;
  }
  return true;
}

std::string SessionConfig::toString() const {
  return fmt::format("library={} channel={} mode={} bitrate={} tx-timeout={}ms rx-timeout={}ms "
                     "scan-limit={} poll={}ms duration={}ms",
                     libraryPath, channel, monitorMode ? "monitor" : "normal",
                     transport::toString(bitrate), txTimeoutMs, rxTimeoutMs, scanLimit,
                     pollInterval.count(), monitorDuration.count());
}

} // namespace session

} // namespace canhost
