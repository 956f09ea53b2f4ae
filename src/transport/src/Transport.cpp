/**
 * @file Transport.cpp
 * @brief Value-type helpers shared by transport implementations.
 */

#include "src/transport/inc/Transport.hpp"

#include <fmt/core.h>

namespace canhost {

namespace transport {

/* ----------------------------- OpMode Methods ----------------------------- */

std::uint8_t OpMode::toByte() const noexcept {
  std::uint8_t mode = MODE_DEFAULT;
  if (monitor) {
    mode |= MODE_MON;
  }
  if (errorFrames) {
    mode |= MODE_ERR;
  }
  if (noRemote) {
    mode |= MODE_NRTR;
  }
  if (noExtended) {
    mode |= MODE_NXTD;
  }
  if (shared) {
    mode |= MODE_SHRD;
  }
  return mode;
}

OpMode OpMode::listenOnly() noexcept {
  OpMode mode{};
  mode.monitor = true;
  return mode;
}

/* ----------------------------- Board State ----------------------------- */

const char* boardStateToString(std::int32_t boardState) noexcept {
  switch (boardState) {
  case BOARD_PRESENT:
    return "present";
  case BOARD_OCCUPIED:
    return "occupied";
  case BOARD_NOT_PRESENT:
    return "not-present";
  case BOARD_NOT_TESTABLE:
    return "not-testable";
  default:
    return "unknown";
  }
}

/* ----------------------------- BusStatus Methods ----------------------------- */

bool BusStatus::hasFault() const noexcept {
  return busOff() || warningLevel() || busError() || messageLost() || queueOverrun();
}

std::string BusStatus::toString() const {
  std::string out = fmt::format("0x{:02X}", raw);

  if (raw == 0) {
    out += " ok";
    return out;
  }

  if (stopped())
    out += " stopped";
  if (busOff())
    out += " bus-off";
  if (warningLevel())
    out += " warning";
  if (busError())
    out += " bus-error";
  if (txBusy())
    out += " tx-busy";
  if (rxEmpty())
    out += " rx-empty";
  if (messageLost())
    out += " msg-lost";
  if (queueOverrun())
    out += " queue-overrun";

  return out;
}

/* ----------------------------- BusLoad Methods ----------------------------- */

std::string BusLoad::toString() const {
  return fmt::format("{:.1f}% (status {})", percent, status.toString());
}

} // namespace transport

} // namespace canhost
