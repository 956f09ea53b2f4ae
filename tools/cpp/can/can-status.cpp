/**
 * @file can-status.cpp
 * @brief Show controller status, bus load and bit timing of a channel.
 *
 * Opens and starts the channel, reads the three driver queries once and
 * closes again.
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
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Display CAN controller status, bus load and active bit timing.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  session::addSessionArgs(map);
  return map;
}

/// One snapshot of the three queries.
struct Snapshot {
  transport::Result<transport::BusStatus> status;
  transport::Result<transport::BusLoad> load;
  transport::Result<transport::BitrateInfo> bitrate;
};

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const session::SessionConfig& cfg, const std::string& version,
                const Snapshot& snap) {
  fmt::print("=== Channel {} ===\n", cfg.channel);
  if (!version.empty()) {
    fmt::print("  Driver:      {}\n", version);
  }
  fmt::print("  Preset:      {} ({} bit/s)\n", transport::toString(cfg.bitrate),
             transport::bitsPerSecond(cfg.bitrate));
  fmt::print("  Mode:        {}\n", cfg.monitorMode ? "monitor" : "normal");

  if (const transport::BusStatus* s = snap.status.get()) {
    fmt::print("  Status:      {}\n", s->toString());
    if (s->hasFault()) {
      fmt::print("               WARNING - fault bits set\n");
    }
  } else {
    fmt::print("  Status:      unavailable ({})\n", snap.status.status().toString());
  }

  if (const transport::BusLoad* l = snap.load.get()) {
    fmt::print("  Bus load:    {}\n", l->toString());
  } else {
    fmt::print("  Bus load:    unavailable ({})\n", snap.load.status().toString());
  }

  if (const transport::BitrateInfo* b = snap.bitrate.get()) {
    fmt::print("  Bit timing:  {}\n", b->toString());
  } else {
    fmt::print("  Bit timing:  unavailable ({})\n", snap.bitrate.status().toString());
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const session::SessionConfig& cfg, const std::string& version,
               const Snapshot& snap) {
  fmt::print("{{\n");
  fmt::print("  \"channel\": {},\n", cfg.channel);
  fmt::print("  \"driver\": \"{}\",\n", format::jsonEscape(version));
  fmt::print("  \"bitrateIndex\": {},\n", static_cast<std::int32_t>(cfg.bitrate));

  if (const transport::BusStatus* s = snap.status.get()) {
    fmt::print("  \"status\": {{\"raw\": {}, \"busOff\": {}, \"warning\": {}, \"busError\": {}}},\n",
               s->raw, s->busOff(), s->warningLevel(), s->busError());
  } else {
    fmt::print("  \"status\": {{\"error\": {}}},\n", snap.status.status().code);
  }

  if (const transport::BusLoad* l = snap.load.get()) {
    fmt::print("  \"busLoad\": {{\"percent\": {:.1f}}},\n", l->percent);
  } else {
    fmt::print("  \"busLoad\": {{\"error\": {}}},\n", snap.load.status().code);
  }

  if (const transport::BitrateInfo* b = snap.bitrate.get()) {
    fmt::print("  \"bitrate\": {{\"speed\": {:.0f}, \"samplePoint\": {:.3f}, \"frequency\": {}, "
               "\"brp\": {}, \"tseg1\": {}, \"tseg2\": {}, \"sjw\": {}}}\n",
               b->speed, b->samplePoint, b->timing.frequency, b->timing.brp, b->timing.tseg1,
               b->timing.tseg2, b->timing.sjw);
  } else {
    fmt::print("  \"bitrate\": {{\"error\": {}}}\n", snap.bitrate.status().code);
  }
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

  const Snapshot SNAP{channel.getStatus(), channel.getBusload(), channel.getBitrate()};
  const std::string VERSION = channel.driverVersion();

  if (args::has(pargs, ARG_JSON)) {
    printJson(cfg, VERSION, SNAP);
  } else {
    printHuman(cfg, VERSION, SNAP);
  }

  const transport::Status CLOSE_ST = channel.close();
  if (!CLOSE_ST.ok()) {
    fmt::print(stderr, "Error: Close failed: {}\n", CLOSE_ST.toString());
    return 1;
  }
  return 0;
}
