/**
 * @file can-monitor.cpp
 * @brief Print CAN traffic on a channel for a fixed time.
 *
 * Runs the session monitor loop and prints one line per received frame.
 * Ctrl+C ends the run early and still prints the summary.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/session/inc/ChannelSession.hpp"
#include "src/session/inc/SessionArgs.hpp"
#include "src/transport/inc/CanApiTransport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = canhost::helpers::args;
namespace session = canhost::session;
namespace transport = canhost::transport;

namespace {

/* ----------------------------- Signal Handling ----------------------------- */

std::atomic<bool> g_stop{false};

void signalHandler(int /*signum*/) { g_stop.store(true); }

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_DURATION = 1,
  ARG_POLL = 2,
  ARG_MAX = 3,
  ARG_QUIET = 4,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION = "Print CAN frames received on a channel.\n\n"
                                         "Press Ctrl+C to stop.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_DURATION] = {"--duration", 1, false, "Run time in seconds (default 30)"};
  map[ARG_POLL] = {"--poll", 1, false, "Receive poll interval in ms (default 100)"};
  map[ARG_MAX] = {"--max", 1, false, "Stop after this many frames (default unlimited)"};
  map[ARG_QUIET] = {"--quiet", 0, false, "Print only the summary"};
  session::addSessionArgs(map);
  return map;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  const std::vector<std::string_view> ARGS = args::toViews(argc, argv);
  args::ParsedArgs pargs;

  std::string error;
  if (!args::parseArgs(ARGS, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (args::has(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  session::SessionConfig cfg = session::SessionConfig::defaults();

  std::uint32_t seconds = 0;
  if (args::has(pargs, ARG_DURATION)) {
    if (!args::parseInt(args::value(pargs, ARG_DURATION), seconds)) {
      fmt::print(stderr, "Error: Invalid duration '{}'\n", args::value(pargs, ARG_DURATION));
      return 1;
    }
    cfg.monitorDuration = std::chrono::seconds(seconds);
  }
  std::uint32_t pollMs = 0;
  if (args::has(pargs, ARG_POLL)) {
    if (!args::parseInt(args::value(pargs, ARG_POLL), pollMs)) {
      fmt::print(stderr, "Error: Invalid poll interval '{}'\n", args::value(pargs, ARG_POLL));
      return 1;
    }
    cfg.pollInterval = std::chrono::milliseconds(pollMs);
  }
  std::size_t maxFrames = 0;
  if (args::has(pargs, ARG_MAX) && !args::parseInt(args::value(pargs, ARG_MAX), maxFrames)) {
    fmt::print(stderr, "Error: Invalid frame limit '{}'\n", args::value(pargs, ARG_MAX));
    return 1;
  }
  if (!session::applySessionArgs(pargs, cfg, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  const bool QUIET = args::has(pargs, ARG_QUIET);

  transport::CanApiTransport driver{cfg.libraryPath};
  if (driver.load() != transport::ERR_NONE) {
    fmt::print(stderr, "Error: Cannot load driver '{}': {}\n", cfg.libraryPath,
               driver.lastLoadError());
    return 1;
  }

  session::ChannelSession channel{driver};

  transport::Status st = channel.open(cfg.channel, cfg.monitorMode);
  if (!st.ok()) {
    fmt::print(stderr, "Error: Open channel {} failed: {}\n", cfg.channel, st.toString());
    return 1;
  }
  st = channel.start(cfg.bitrate);
  if (!st.ok()) {
    fmt::print(stderr, "Error: Start at {} failed: {}\n", transport::toString(cfg.bitrate),
               st.toString());
    return 1;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  fmt::print("Monitoring channel {} at {} for {} s ({} mode)\n", cfg.channel,
             transport::toString(cfg.bitrate),
             std::chrono::duration_cast<std::chrono::seconds>(cfg.monitorDuration).count(),
             cfg.monitorMode ? "monitor" : "normal");

  session::MonitorConfig mon = session::MonitorConfig::forDuration(cfg.monitorDuration);
  mon.pollInterval = cfg.pollInterval;
  mon.cancel = &g_stop;

  std::size_t seen = 0;
  const auto T0 = std::chrono::steady_clock::now();
  const session::MonitorSummary SUMMARY =
      channel.monitor(mon, [&](const transport::CanFrame& frame) {
        ++seen;
        if (!QUIET) {
          const auto ELAPSED = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - T0);
          fmt::print("{:>10.6f}  ch{}  {}\n", static_cast<double>(ELAPSED.count()) / 1e6,
                     cfg.channel, frame.toString());
        }
        return maxFrames == 0 || seen < maxFrames;
      });

  fmt::print("\n{}\n", SUMMARY.toString());

  const transport::Status CLOSE_ST = channel.close();
  if (!CLOSE_ST.ok()) {
    fmt::print(stderr, "Error: Close failed: {}\n", CLOSE_ST.toString());
    return 1;
  }
  return (SUMMARY.reason == session::MonitorStopReason::TRANSPORT_ERROR) ? 1 : 0;
}
