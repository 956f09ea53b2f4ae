/**
 * @file SessionArgs.cpp
 * @brief Shared CAN tool flags.
 */

#include "src/session/inc/SessionArgs.hpp"
#include "src/helpers/inc/Log.hpp"

#include <fmt/core.h>

namespace canhost {

namespace session {

namespace args = canhost::helpers::args;
namespace log = canhost::helpers::log;

void addSessionArgs(args::ArgMap& map) {
  map[ARG_LIBRARY] = {"--library", 1, false, "Driver library name or path (libuvcankvl.so.1)"};
  map[ARG_CHANNEL] = {"--channel", 1, false, "Channel index (default 0)"};
  map[ARG_BITRATE] = {"--bitrate", 1, false, "Bit rate: 1M 800K 500K 250K 125K 100K 50K 20K 10K "
                                             "or index 0..-8 (default 250K)"};
  map[ARG_MONITOR_MODE] = {"--monitor-mode", 0, false, "Open the channel listen-only"};
  map[ARG_LOG_LEVEL] = {"--log-level", 1, false, "error, warn, info or debug (default warn)"};
}

bool applySessionArgs(const args::ParsedArgs& pargs, SessionConfig& cfg, std::string& error) {
  if (args::has(pargs, ARG_LOG_LEVEL)) {
    const std::string_view TEXT = args::value(pargs, ARG_LOG_LEVEL);
    log::Level lvl{};
    if (!log::parseLevel(TEXT, lvl)) {
      error = fmt::format("Invalid log level '{}'", TEXT);
      return false;
    }
    log::setLevel(lvl);
  }

  if (args::has(pargs, ARG_LIBRARY)) {
    cfg.libraryPath = std::string{args::value(pargs, ARG_LIBRARY)};
  }

  if (args::has(pargs, ARG_CHANNEL)) {
    const std::string_view TEXT = args::value(pargs, ARG_CHANNEL);
    if (!args::parseInt(TEXT, cfg.channel)) {
      error = fmt::format("Invalid channel '{}'", TEXT);
      return false;
    }
  }

  if (args::has(pargs, ARG_BITRATE)) {
    const std::string_view TEXT = args::value(pargs, ARG_BITRATE);
    if (!transport::parseBitrate(TEXT, cfg.bitrate)) {
      error = fmt::format("Unknown bit rate '{}'", TEXT);
      return false;
    }
  }

  if (args::has(pargs, ARG_MONITOR_MODE)) {
    cfg.monitorMode = true;
  }

  return cfg.validate(error);
}

} // namespace session

} // namespace canhost
