/**
 * @file Status.cpp
 * @brief Status code classification and descriptions.
 */

#include "src/transport/inc/Status.hpp"

#include <fmt/core.h>

namespace canhost {

namespace transport {

/* ----------------------------- ErrorKind ----------------------------- */

const char* toString(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::NONE:
    return "none";
  case ErrorKind::NOT_INITIALIZED:
    return "not-initialized";
  case ErrorKind::ALREADY_BOUND:
    return "already-bound";
  case ErrorKind::INVALID_BITRATE:
    return "invalid-bitrate";
  case ErrorKind::RX_EMPTY:
    return "rx-empty";
  case ErrorKind::TX_TIMEOUT:
    return "tx-timeout";
  case ErrorKind::BUS_OFF:
    return "bus-off";
  case ErrorKind::TX_FAILURE:
    return "tx-failure";
  case ErrorKind::CONTROLLER_STATE:
    return "controller-state";
  case ErrorKind::LIBRARY:
    return "library";
  case ErrorKind::TRANSPORT_FAILURE:
  default:
    return "transport-failure";
  }
}

ErrorKind classify(std::int32_t code) noexcept {
  if (code >= 0) {
    return ErrorKind::NONE;
  }

  switch (code) {
  case ERR_NOT_INIT:
    return ErrorKind::NOT_INITIALIZED;
  case ERR_ALREADY_INIT:
    return ErrorKind::ALREADY_BOUND;
  case ERR_BAUDRATE:
    return ErrorKind::INVALID_BITRATE;
  case ERR_RX_EMPTY:
    return ErrorKind::RX_EMPTY;
  case ERR_TX_BUSY:
  case ERR_TIMEOUT:
    return ErrorKind::TX_TIMEOUT;
  case ERR_BUS_OFF:
    return ErrorKind::BUS_OFF;
  case ERR_WARNING:
  case ERR_BUS_ERROR:
    return ErrorKind::TX_FAILURE;
  case ERR_ONLINE:
  case ERR_OFFLINE:
    return ErrorKind::CONTROLLER_STATE;
  case ERR_LIBRARY:
    return ErrorKind::LIBRARY;
  default:
    break;
  }

  // Message lost and last-error-code range
  if (code <= ERR_MSG_LOST && code >= ERR_LEC_CRC) {
    return ErrorKind::TX_FAILURE;
  }

  return ErrorKind::TRANSPORT_FAILURE;
}

const char* describe(std::int32_t code) noexcept {
  if (code >= 0) {
    return "no error";
  }
  if (code <= ERR_VENDOR) {
    return "vendor-specific error";
  }

  switch (code) {
  case ERR_BUS_OFF:
    return "bus off";
  case ERR_WARNING:
    return "error warning level";
  case ERR_BUS_ERROR:
    return "bus error";
  case ERR_ONLINE:
    return "controller online";
  case ERR_OFFLINE:
    return "controller offline";
  case ERR_MSG_LOST:
    return "message lost";
  case ERR_LEC_STUFF:
    return "stuff error";
  case ERR_LEC_FORM:
    return "form error";
  case ERR_LEC_ACK:
    return "acknowledge error";
  case ERR_LEC_BIT1:
    return "recessive bit error";
  case ERR_LEC_BIT0:
    return "dominant bit error";
  case ERR_LEC_CRC:
    return "checksum error";
  case ERR_TX_BUSY:
    return "transmitter busy";
  case ERR_RX_EMPTY:
    return "receiver empty";
  case ERR_QUEUE_OVR:
    return "queue overrun";
  case ERR_TIMEOUT:
    return "timed out";
  case ERR_RESOURCE:
    return "resource allocation failed";
  case ERR_BAUDRATE:
    return "illegal bit-rate";
  case ERR_HANDLE:
    return "illegal handle";
  case ERR_ILLPARA:
    return "illegal parameter";
  case ERR_NULLPTR:
    return "null pointer";
  case ERR_NOT_INIT:
    return "not initialized";
  case ERR_ALREADY_INIT:
    return "already initialized";
  case ERR_LIBRARY:
    return "library not loaded";
  case ERR_NOT_SUPP:
    return "not supported";
  case ERR_FATAL:
    return "fatal error";
  default:
    return "unknown error";
  }
}

/* ----------------------------- Status Methods ----------------------------- */

std::string Status::toString() const {
  if (ok()) {
    return fmt::format("{} (ok)", code);
  }
  return fmt::format("{} ({}: {})", code, transport::toString(kind()), describe(code));
}

} // namespace transport

} // namespace canhost
