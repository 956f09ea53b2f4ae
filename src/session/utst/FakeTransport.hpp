#ifndef CANHOST_SESSION_UTST_FAKE_TRANSPORT_HPP
#define CANHOST_SESSION_UTST_FAKE_TRANSPORT_HPP
/**
 * @file FakeTransport.hpp
 * @brief Recording ITransport for session tests.
 *
 * Every call is appended to calls (by name) before the scripted result is
 * returned, so tests can assert both "not called" and call order.
 */

#include "src/transport/inc/Transport.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace canhost {

namespace session {

namespace test {

class FakeTransport final : public transport::ITransport {
public:
  /* ------------------------- Scripted results ------------------------- */

  std::map<std::int32_t, transport::ProbeResult> probeResults; ///< Missing = not present
  std::int32_t initResult{transport::ERR_NONE};
  std::int32_t startResult{transport::ERR_NONE};
  std::int32_t stopResult{transport::ERR_NONE};
  std::int32_t releaseResult{transport::ERR_NONE};
  std::int32_t writeResult{transport::ERR_NONE};
  std::int32_t readResult{transport::ERR_RX_EMPTY};
  transport::CanFrame readFrame{};
  std::int32_t statusResult{transport::ERR_NONE};
  transport::BusStatus statusValue{};
  std::int32_t busloadResult{transport::ERR_NONE};
  transport::BusLoad busloadValue{};
  std::int32_t bitrateResult{transport::ERR_NONE};
  transport::BitrateInfo bitrateValue{};
  std::string versionText{"fake 1.0"};

  /// Overrides readResult/readFrame when set.
  std::function<std::int32_t(transport::CanFrame&, std::uint16_t)> readHandler;

  /* ------------------------- Recorded calls ------------------------- */

  std::vector<std::string> calls;
  std::vector<std::int32_t> probedChannels;
  std::int32_t lastChannel{transport::CHANNEL_NONE};
  transport::OpMode lastMode{};
  transport::BitrateIndex lastBitrate{transport::BitrateIndex::INDEX_250K};
  std::vector<transport::CanFrame> written;
  std::vector<std::uint16_t> writeTimeouts;
  std::vector<std::uint16_t> readTimeouts;

  [[nodiscard]] std::size_t count(const std::string& name) const {
    std::size_t n = 0;
    for (const auto& C : calls) {
      if (C == name) {
        ++n;
      }
    }
    return n;
  }

  /* ------------------------- ITransport ------------------------- */

  transport::ProbeResult probe(std::int32_t channel, transport::OpMode /*mode*/) noexcept override {
    calls.emplace_back("probe");
    probedChannels.push_back(channel);
    auto it = probeResults.find(channel);
    if (it == probeResults.end()) {
      return transport::ProbeResult{transport::ERR_NONE, transport::BOARD_NOT_PRESENT};
    }
    return it->second;
  }

  std::int32_t initialize(std::int32_t channel, transport::OpMode mode) noexcept override {
    calls.emplace_back("initialize");
    lastChannel = channel;
    lastMode = mode;
    return initResult;
  }

  std::int32_t start(transport::BitrateIndex bitrate) noexcept override {
    calls.emplace_back("start");
    lastBitrate = bitrate;
    return startResult;
  }

  std::int32_t stop() noexcept override {
    calls.emplace_back("stop");
    return stopResult;
  }

  std::int32_t release() noexcept override {
    calls.emplace_back("release");
    return releaseResult;
  }

  std::int32_t write(const transport::CanFrame& frame, std::uint16_t timeoutMs) noexcept override {
    calls.emplace_back("write");
    written.push_back(frame);
    writeTimeouts.push_back(timeoutMs);
    return writeResult;
  }

  std::int32_t read(transport::CanFrame& out, std::uint16_t timeoutMs) noexcept override {
    calls.emplace_back("read");
    readTimeouts.push_back(timeoutMs);
    if (readHandler) {
      return readHandler(out, timeoutMs);
    }
    if (readResult == transport::ERR_NONE) {
      out = readFrame;
    }
    return readResult;
  }

  std::int32_t queryStatus(transport::BusStatus& out) noexcept override {
    calls.emplace_back("queryStatus");
    out = statusValue;
    return statusResult;
  }

  std::int32_t queryBusload(transport::BusLoad& out) noexcept override {
    calls.emplace_back("queryBusload");
    out = busloadValue;
    return busloadResult;
  }

  std::int32_t queryBitrate(transport::BitrateInfo& out) noexcept override {
    calls.emplace_back("queryBitrate");
    out = bitrateValue;
    return bitrateResult;
  }

  std::string version() const override { return versionText; }
};

} // namespace test

} // namespace session

} // namespace canhost

#endif // CANHOST_SESSION_UTST_FAKE_TRANSPORT_HPP
