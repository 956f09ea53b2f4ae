/**
 * @file can-scan.cpp
 * @brief List available CAN channels on the installed driver.
 *
 * Probes channels 0..limit-1 without binding them and prints the free ones.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/session/inc/ChannelSession.hpp"
#include "src/session/inc/SessionArgs.hpp"
#include "src/transport/inc/CanApiTransport.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = canhost::helpers::args;
namespace format = canhost::helpers::format;
namespace session = canhost::session;
namespace transport = canhost::transport;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_LIMIT = 2,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION = "List free CAN channels on the CAN API driver.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_LIMIT] = {"--limit", 1, false, "Number of channels to probe (default 8)"};
  session::addSessionArgs(map);
  return map;
}

/* ----------------------------- Output ----------------------------- */

void printHuman(const std::vector<std::int32_t>& channels, const std::string& version,
                std::int32_t limit) {
  fmt::print("=== CAN Channels ({} of {} probed) ===\n", channels.size(), limit);
  if (!version.empty()) {
    fmt::print("Driver: {}\n", version);
  }
  fmt::print("\n");

  if (channels.empty()) {
    fmt::print("No free CAN channels found.\n");
    return;
  }
  for (const std::int32_t CH : channels) {
    fmt::print("  channel {}\n", CH);
  }
}

void printJson(const std::vector<std::int32_t>& channels, const std::string& version,
               std::int32_t limit) {
  fmt::print("{{\n");
  fmt::print("  \"driver\": \"{}\",\n", format::jsonEscape(version));
  fmt::print("  \"probed\": {},\n", limit);
  fmt::print("  \"channels\": [");
  for (std::size_t i = 0; i < channels.size(); ++i) {
    fmt::print("{}{}", i > 0 ? ", " : "", channels[i]);
  }
  fmt::print("]\n");
  fmt::print("}}\n");
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
  if (args::has(pargs, ARG_LIMIT) && !args::parseInt(args::value(pargs, ARG_LIMIT), cfg.scanLimit)) {
    fmt::print(stderr, "Error: Invalid limit '{}'\n", args::value(pargs, ARG_LIMIT));
    return 1;
  }
  if (!session::applySessionArgs(pargs, cfg, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  transport::CanApiTransport driver{cfg.libraryPath};
  if (driver.load() != transport::ERR_NONE) {
    fmt::print(stderr, "Error: Cannot load driver '{}': {}\n", cfg.libraryPath,
               driver.lastLoadError());
    return 1;
  }

  session::ChannelSession channel{driver};
  const std::vector<std::int32_t> CHANNELS = channel.scan(cfg.scanLimit);
  const std::string VERSION = channel.driverVersion();

  if (args::has(pargs, ARG_JSON)) {
    printJson(CHANNELS, VERSION, cfg.scanLimit);
  } else {
    printHuman(CHANNELS, VERSION, cfg.scanLimit);
  }
  return 0;
}
