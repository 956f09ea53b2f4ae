/**
 * @file CanFrame.cpp
 * @brief Frame construction, normalization, and formatting.
 */

#include "src/transport/inc/CanFrame.hpp"
#include "src/helpers/inc/Format.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace canhost {

namespace transport {

/* ----------------------------- CanFrame Methods ----------------------------- */

std::span<const std::uint8_t> CanFrame::payload() const noexcept {
  const std::size_t LEN = std::min<std::size_t>(dlc, CAN_MAX_DLC);
  return {data.data(), LEN};
}

bool CanFrame::hasValidId() const noexcept {
  const std::uint32_t MASK = flags.extended ? CAN_XTD_ID_MASK : CAN_STD_ID_MASK;
  return (id & ~MASK) == 0;
}

std::string CanFrame::toString() const {
  std::string out = fmt::format("{} [{}]", helpers::format::canId(id, flags.extended), dlc);

  if (flags.remote) {
    out += " remote";
  } else if (dlc > 0) {
    out += ' ';
    out += helpers::format::hexBytes(payload());
  }

  if (flags.statusMessage) {
    out += " (status)";
  }

  return out;
}

/* ----------------------------- API ----------------------------- */

CanFrame makeFrame(std::uint32_t id, std::span<const std::uint8_t> data, bool extended,
                   bool remote) noexcept {
  CanFrame frame{};
  frame.id = id;
  frame.flags.extended = extended;
  frame.flags.remote = remote;

  const std::size_t LEN = std::min(data.size(), CAN_MAX_DLC);
  std::copy_n(data.begin(), LEN, frame.data.begin());
  frame.dlc = static_cast<std::uint8_t>(LEN);

  return frame;
}

CanFrame makeFrame(std::uint32_t id, std::initializer_list<std::uint8_t> data, bool extended,
                   bool remote) noexcept {
  return makeFrame(id, std::span<const std::uint8_t>(data.begin(), data.size()), extended,
                   remote);
}

void normalizeForTransmit(CanFrame& frame) noexcept {
  if (frame.dlc > CAN_MAX_DLC) {
    frame.dlc = static_cast<std::uint8_t>(CAN_MAX_DLC);
  }
  std::fill(frame.data.begin() + frame.dlc, frame.data.end(), std::uint8_t{0});

  frame.flags.fd = false;
  frame.flags.bitrateSwitch = false;
  frame.flags.errorState = false;
  frame.flags.statusMessage = false;
  frame.timestamp = std::chrono::nanoseconds{0};
}

} // namespace transport

} // namespace canhost
