#ifndef CANHOST_SESSION_SESSION_ARGS_HPP
#define CANHOST_SESSION_SESSION_ARGS_HPP
/**
 * @file SessionArgs.hpp
 * @brief Command-line flags shared by all CAN tools.
 *
 * Registers --library, --channel, --bitrate, --monitor-mode and --log-level
 * in a tool's ArgMap and applies parsed values onto a SessionConfig. Keys
 * from SESSION_ARG_BASE upward are reserved for these flags.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/session/inc/SessionConfig.hpp"

#include <cstdint>
#include <string>

namespace canhost {

namespace session {

/// Argument keys owned by the shared flag set.
enum SessionArgKey : std::uint8_t {
  SESSION_ARG_BASE = 200,
  ARG_LIBRARY = SESSION_ARG_BASE,
  ARG_CHANNEL,
  ARG_BITRATE,
  ARG_MONITOR_MODE,
  ARG_LOG_LEVEL,
};

/// @brief Add the shared flags to a tool's ArgMap.
void addSessionArgs(helpers::args::ArgMap& map);

/**
 * @brief Apply shared flags onto a config and set the log threshold.
 * @param pargs Parsed arguments.
 * @param cfg Config to update (fields without a flag keep their value).
 * @param error Receives a description of the first bad value.
 * @return true if every given value parsed and cfg validates.
 */
[[nodiscard]] bool applySessionArgs(const helpers::args::ParsedArgs& pargs, SessionConfig& cfg,
                                    std::string& error);

} // namespace session

} // namespace canhost

#endif // CANHOST_SESSION_SESSION_ARGS_HPP
