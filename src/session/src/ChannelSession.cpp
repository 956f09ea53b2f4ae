/**
 * @file ChannelSession.cpp
 * @brief Channel lifecycle, frame I/O and monitor loop.
 */

#include "src/session/inc/ChannelSession.hpp"
#include "src/helpers/inc/Log.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace canhost {

namespace session {

namespace log = canhost::helpers::log;

using transport::BitrateIndex;
using transport::CanFrame;
using transport::Result;
using transport::Status;

/* ----------------------------- Enum Strings ----------------------------- */

const char* toString(SessionState state) noexcept {
  switch (state) {
  case SessionState::CLOSED:
    return "closed";
  case SessionState::INITIALIZED:
    return "initialized";
  case SessionState::STARTED:
    return "started";
  }
  return "unknown";
}

const char* toString(MonitorStopReason reason) noexcept {
  switch (reason) {
  case MonitorStopReason::DURATION_ELAPSED:
    return "duration-elapsed";
  case MonitorStopReason::CALLBACK_STOP:
    return "callback-stop";
  case MonitorStopReason::CANCELLED:
    return "cancelled";
  case MonitorStopReason::TRANSPORT_ERROR:
    return "transport-error";
  case MonitorStopReason::NOT_STARTED:
    return "not-started";
  }
  return "unknown";
}

/* ----------------------------- Monitor Types ----------------------------- */

MonitorConfig MonitorConfig::forDuration(std::chrono::milliseconds duration) noexcept {
  MonitorConfig cfg{};
  cfg.duration = duration;
  return cfg;
}

std::string MonitorSummary::toString() const {
  std::string out = fmt::format("{} frames in {} ms ({})", frames, elapsed.count(),
                                session::toString(reason));
  if (!lastStatus.ok()) {
    out += fmt::format(" status {}", lastStatus.toString());
  }
  return out;
}

/* ----------------------------- Lifecycle ----------------------------- */

ChannelSession::ChannelSession(transport::ITransport& transport) noexcept : transport_(transport) {}

ChannelSession::~ChannelSession() {
  const Status ST = close();
  if (!ST.ok()) {
    log::error("Channel teardown failed: {}", ST.toString());
  }
}

Status ChannelSession::open(std::int32_t channel, bool monitorMode) noexcept {
  if (state_ != SessionState::CLOSED) {
    log::debug("Channel {} still bound, closing before open", channel_);
    const Status ST = close();
    if (!ST.ok()) {
      log::warn("Closing channel before re-open failed: {}", ST.toString());
    }
  }

  transport::OpMode mode{};
  mode.monitor = monitorMode;

  const Status ST{transport_.initialize(channel, mode)};
  if (!ST.ok()) {
    log::warn("Open channel {} failed: {}", channel, ST.toString());
    return ST;
  }

  channel_ = channel;
  state_ = SessionState::INITIALIZED;
  log::debug("Channel {} opened ({} mode)", channel, monitorMode ? "monitor" : "normal");
  return ST;
}

Status ChannelSession::start(BitrateIndex bitrate) noexcept {
  if (state_ == SessionState::CLOSED) {
    return Status{transport::ERR_NOT_INIT};
  }
  if (!transport::isValidBitrateIndex(static_cast<std::int32_t>(bitrate))) {
    return Status{transport::ERR_BAUDRATE};
  }

  const Status ST{transport_.start(bitrate)};
  if (!ST.ok()) {
    log::warn("Start channel {} at {} failed: {}", channel_, transport::toString(bitrate),
              ST.toString());
    return ST;
  }

  state_ = SessionState::STARTED;
  log::debug("Channel {} started at {}", channel_, transport::toString(bitrate));
  return ST;
}

Status ChannelSession::close() noexcept {
  if (state_ == SessionState::CLOSED) {
    return Status{};
  }

  Status last{};
  if (state_ == SessionState::STARTED) {
    const Status ST{transport_.stop()};
    if (!ST.ok()) {
      last = ST;
    }
  }

  // Release runs even when stop failed; the handle must not leak.
  const Status ST{transport_.release()};
  if (!ST.ok()) {
    last = ST;
  }

  log::debug("Channel {} closed", channel_);
  channel_ = transport::CHANNEL_NONE;
  state_ = SessionState::CLOSED;
  return last;
}

/* ----------------------------- Discovery ----------------------------- */

std::vector<std::int32_t> ChannelSession::scan(std::int32_t maxChannels) const {
  std::vector<std::int32_t> found;
  for (std::int32_t ch = 0; ch < maxChannels; ++ch) {
    const transport::ProbeResult PROBE = transport_.probe(ch, transport::OpMode::defaults());
    log::debug("Probe channel {}: status {} board {}", ch, PROBE.status,
               transport::boardStateToString(PROBE.boardState));
    if (PROBE.isAvailable()) {
      found.push_back(ch);
    }
  }
  return found;
}

/* ----------------------------- Frame I/O ----------------------------- */

Status ChannelSession::send(std::uint32_t id, std::span<const std::uint8_t> data, bool extended,
                            bool remote, std::uint16_t timeoutMs) noexcept {
  if (state_ != SessionState::STARTED) {
    return Status{transport::ERR_NOT_INIT};
  }
  return send(transport::makeFrame(id, data, extended, remote), timeoutMs);
}

Status ChannelSession::send(const CanFrame& frame, std::uint16_t timeoutMs) noexcept {
  if (state_ != SessionState::STARTED) {
    return Status{transport::ERR_NOT_INIT};
  }

  CanFrame out = frame;
  transport::normalizeForTransmit(out);

  const Status ST{transport_.write(out, timeoutMs)};
  if (!ST.ok()) {
    log::warn("Send {} failed: {}", out.toString(), ST.toString());
  }
  return ST;
}

Result<CanFrame> ChannelSession::receive(std::uint16_t timeoutMs) noexcept {
  if (state_ != SessionState::STARTED) {
    return Result<CanFrame>::failure(Status{transport::ERR_NOT_INIT});
  }

  CanFrame frame{};
  const Status ST{transport_.read(frame, timeoutMs)};
  if (!ST.ok()) {
    if (!ST.isRxEmpty()) {
      log::warn("Receive on channel {} failed: {}", channel_, ST.toString());
    }
    return Result<CanFrame>::failure(ST);
  }
  return Result<CanFrame>::success(frame);
}

MonitorSummary ChannelSession::monitor(const MonitorConfig& config, const FrameCallback& callback) {
  using Clock = std::chrono::steady_clock;
  using std::chrono::milliseconds;

  MonitorSummary summary{};
  if (state_ != SessionState::STARTED) {
    summary.reason = MonitorStopReason::NOT_STARTED;
    summary.lastStatus = Status{transport::ERR_NOT_INIT};
    return summary;
  }

  const auto T0 = Clock::now();
  const auto DEADLINE = T0 + config.duration;
  const milliseconds MAX_POLL{transport::TIMEOUT_INFINITE - 1};

  auto now = T0;
  while (true) {
    if (config.cancel != nullptr && config.cancel->load(std::memory_order_acquire)) {
      summary.reason = MonitorStopReason::CANCELLED;
      break;
    }
    now = Clock::now();
    if (now >= DEADLINE) {
      summary.reason = MonitorStopReason::DURATION_ELAPSED;
      break;
    }

    const milliseconds REMAINING = std::chrono::ceil<milliseconds>(DEADLINE - now);
    milliseconds poll = std::min(config.pollInterval, REMAINING);
    poll = std::clamp(poll, milliseconds{1}, MAX_POLL);

    CanFrame frame{};
    const Status ST{transport_.read(frame, static_cast<std::uint16_t>(poll.count()))};
    if (ST.isRxEmpty()) {
      ++summary.emptyPolls;
      continue;
    }
    if (!ST.ok()) {
      log::warn("Monitor on channel {} stopped: {}", channel_, ST.toString());
      summary.reason = MonitorStopReason::TRANSPORT_ERROR;
      summary.lastStatus = ST;
      break;
    }

    // Counted before the callback so a stopping frame is included.
    ++summary.frames;
    if (callback && !callback(frame)) {
      summary.reason = MonitorStopReason::CALLBACK_STOP;
      break;
    }
  }

  summary.elapsed = std::chrono::duration_cast<milliseconds>(Clock::now() - T0);
  log::debug("Monitor on channel {}: {}", channel_, summary.toString());
  return summary;
}

/* ----------------------------- Queries ----------------------------- */

Result<transport::BusStatus> ChannelSession::getStatus() noexcept {
  if (state_ == SessionState::CLOSED) {
    return Result<transport::BusStatus>::failure(Status{transport::ERR_NOT_INIT});
  }
  transport::BusStatus status{};
  const Status ST{transport_.queryStatus(status)};
  if (!ST.ok()) {
    return Result<transport::BusStatus>::failure(ST);
  }
  return Result<transport::BusStatus>::success(status);
}

Result<transport::BusLoad> ChannelSession::getBusload() noexcept {
  if (state_ == SessionState::CLOSED) {
    return Result<transport::BusLoad>::failure(Status{transport::ERR_NOT_INIT});
  }
  transport::BusLoad load{};
  const Status ST{transport_.queryBusload(load)};
  if (!ST.ok()) {
    return Result<transport::BusLoad>::failure(ST);
  }
  return Result<transport::BusLoad>::success(load);
}

Result<transport::BitrateInfo> ChannelSession::getBitrate() noexcept {
  if (state_ == SessionState::CLOSED) {
    return Result<transport::BitrateInfo>::failure(Status{transport::ERR_NOT_INIT});
  }
  transport::BitrateInfo info{};
  const Status ST{transport_.queryBitrate(info)};
  if (!ST.ok()) {
    return Result<transport::BitrateInfo>::failure(ST);
  }
  return Result<transport::BitrateInfo>::success(info);
}

std::string ChannelSession::driverVersion() const { return transport_.version(); }

} // namespace session

} // namespace canhost
