/**
 * @file can-send.cpp
 * @brief Transmit CAN frames on a channel.
 *
 * Opens and starts the channel, sends the frame --count times, optionally
 * waits for one reply frame, then closes. Payloads longer than 8 bytes are
 * truncated.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/session/inc/ChannelSession.hpp"
#include "src/session/inc/SessionArgs.hpp"
#include "src/transport/inc/CanApiTransport.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <thread>
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
  ARG_ID = 1,
  ARG_DATA = 2,
  ARG_EXT = 3,
  ARG_RTR = 4,
  ARG_TIMEOUT = 5,
  ARG_COUNT = 6,
  ARG_GAP = 7,
  ARG_REPLY = 8,
  ARG_REPLY_TIMEOUT = 9,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Send a CAN frame.\n\n"
    "Example: can-send --id 0x123 --data \"11 22 33\" --bitrate 500K";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_ID] = {"--id", 1, true, "Identifier (decimal or 0x hex)"};
  map[ARG_DATA] = {"--data", 1, false, "Payload hex bytes, e.g. \"DE AD BE EF\" (max 8)"};
  map[ARG_EXT] = {"--ext", 0, false, "Use a 29-bit identifier"};
  map[ARG_RTR] = {"--rtr", 0, false, "Send a remote request"};
  map[ARG_TIMEOUT] = {"--timeout", 1, false, "Transmit timeout in ms (default 0 = non-blocking)"};
  map[ARG_COUNT] = {"--count", 1, false, "Number of frames to send (default 1)"};
  map[ARG_GAP] = {"--gap", 1, false, "Delay between frames in ms (default 0)"};
  map[ARG_REPLY] = {"--reply", 0, false, "Wait for one frame after sending and print it"};
  map[ARG_REPLY_TIMEOUT] = {"--reply-timeout", 1, false, "Reply wait in ms (default 1000)"};
  session::addSessionArgs(map);
  return map;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  const std::vector<std::string_view> ARGS = args::toViews(argc, argv);
  args::ParsedArgs pargs;

  // --help must work without the required --id
  for (const std::string_view TOK : ARGS) {
    if (TOK == "--help") {
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }
  }

  std::string error;
  if (!args::parseArgs(ARGS, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  session::SessionConfig cfg = session::SessionConfig::defaults();
  if (!session::applySessionArgs(pargs, cfg, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  std::uint32_t id = 0;
  if (!args::parseInt(args::value(pargs, ARG_ID), id)) {
    fmt::print(stderr, "Error: Invalid identifier '{}'\n", args::value(pargs, ARG_ID));
    return 1;
  }

  std::vector<std::uint8_t> payload;
  if (args::has(pargs, ARG_DATA) && !format::parseHexBytes(args::value(pargs, ARG_DATA), payload)) {
    fmt::print(stderr, "Error: Invalid payload '{}'\n", args::value(pargs, ARG_DATA));
    return 1;
  }
  if (payload.size() > transport::CAN_MAX_DLC) {
    fmt::print(stderr, "Warning: payload has {} bytes, sending the first {}\n", payload.size(),
               transport::CAN_MAX_DLC);
  }

  std::uint16_t timeoutMs = cfg.txTimeoutMs;
  std::uint32_t count = 1;
  std::uint32_t gapMs = 0;
  if (args::has(pargs, ARG_TIMEOUT) && !args::parseInt(args::value(pargs, ARG_TIMEOUT), timeoutMs)) {
    fmt::print(stderr, "Error: Invalid timeout '{}'\n", args::value(pargs, ARG_TIMEOUT));
    return 1;
  }
  if (args::has(pargs, ARG_COUNT) && !args::parseInt(args::value(pargs, ARG_COUNT), count)) {
    fmt::print(stderr, "Error: Invalid count '{}'\n", args::value(pargs, ARG_COUNT));
    return 1;
  }
  if (args::has(pargs, ARG_GAP) && !args::parseInt(args::value(pargs, ARG_GAP), gapMs)) {
    fmt::print(stderr, "Error: Invalid gap '{}'\n", args::value(pargs, ARG_GAP));
    return 1;
  }
  if (args::has(pargs, ARG_REPLY_TIMEOUT) &&
      !args::parseInt(args::value(pargs, ARG_REPLY_TIMEOUT), cfg.rxTimeoutMs)) {
    fmt::print(stderr, "Error: Invalid reply timeout '{}'\n",
               args::value(pargs, ARG_REPLY_TIMEOUT));
    return 1;
  }
  const bool WANT_REPLY = args::has(pargs, ARG_REPLY);

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

  const bool EXTENDED = args::has(pargs, ARG_EXT);
  const bool REMOTE = args::has(pargs, ARG_RTR);
  const transport::CanFrame FRAME = transport::makeFrame(id, payload, EXTENDED, REMOTE);

  std::uint32_t sent = 0;
  for (std::uint32_t i = 0; i < count; ++i) {
    st = channel.send(FRAME, timeoutMs);
    if (!st.ok()) {
      fmt::print(stderr, "Error: Send {} failed: {}\n", FRAME.toString(), st.toString());
      break;
    }
    ++sent;
    if (gapMs > 0 && i + 1 < count) {
      std::this_thread::sleep_for(std::chrono::milliseconds(gapMs));
    }
  }

  fmt::print("Sent {} of {} frame(s): {}\n", sent, count, FRAME.toString());

  bool replyOk = true;
  if (WANT_REPLY && sent == count) {
    const auto REPLY = channel.receive(cfg.rxTimeoutMs);
    if (REPLY.ok()) {
      fmt::print("Reply: {}\n", REPLY.value().toString());
    } else if (REPLY.status().isRxEmpty()) {
      fmt::print(stderr, "Error: No reply within {} ms\n", cfg.rxTimeoutMs);
      replyOk = false;
    } else {
      fmt::print(stderr, "Error: Receive failed: {}\n", REPLY.status().toString());
      replyOk = false;
    }
  }

  const transport::Status CLOSE_ST = channel.close();
  if (!CLOSE_ST.ok()) {
    fmt::print(stderr, "Error: Close failed: {}\n", CLOSE_ST.toString());
    return 1;
  }
  return (sent == count && replyOk) ? 0 : 1;
}
