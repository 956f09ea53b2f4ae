#ifndef CANHOST_SESSION_CHANNEL_SESSION_HPP
#define CANHOST_SESSION_CHANNEL_SESSION_HPP
/**
 * @file ChannelSession.hpp
 * @brief Channel lifecycle state machine and frame I/O on top of ITransport.
 * @note NOT thread-safe: No internal locking. Use one session per thread or
 *       serialize access externally.
 *
 * Lifecycle:
 *
 *   CLOSED --open()--> INITIALIZED --start()--> STARTED
 *      ^                    |                      |
 *      +------close()-------+-------close()--------+
 *
 *  - I/O (send, receive, monitor) is legal only while STARTED.
 *  - Queries (status, bus load, bit rate) are legal while not CLOSED.
 *  - open() on a bound session closes the previous binding first.
 *  - close() runs stop and release even if one fails, and is a no-op when
 *    already CLOSED. The destructor calls close().
 *
 * Precondition violations are reported as ERR_NOT_INIT / ERR_BAUDRATE without
 * touching the transport. Every other status is the transport's, unchanged.
 *
 * All calls are synchronous. The only blocking points are the transport's
 * read and write, bounded by the timeout passed in.
 */

#include "src/transport/inc/Status.hpp"
#include "src/transport/inc/Transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace canhost {

namespace session {

/* ----------------------------- SessionState ----------------------------- */

/**
 * @brief Channel session state.
 */
enum class SessionState : std::uint8_t {
  CLOSED = 0,  ///< No channel bound
  INITIALIZED, ///< Channel bound, controller stopped
  STARTED,     ///< Controller running, I/O allowed
};

/// @brief Convert SessionState to string.
/// @return "closed", "initialized" or "started".
[[nodiscard]] const char* toString(SessionState state) noexcept;

/* ----------------------------- Monitor Types ----------------------------- */

/// Per-frame monitor callback. Returning false ends monitoring.
using FrameCallback = std::function<bool(const transport::CanFrame&)>;

/**
 * @brief Why a monitor run ended.
 */
enum class MonitorStopReason : std::uint8_t {
  DURATION_ELAPSED = 0, ///< Ran for the full duration
  CALLBACK_STOP,        ///< Callback returned false
  CANCELLED,            ///< Cancellation flag was raised
  TRANSPORT_ERROR,      ///< Read returned a status other than RX_EMPTY
  NOT_STARTED,          ///< Session was not STARTED, nothing read
};

/// @brief Convert MonitorStopReason to string.
[[nodiscard]] const char* toString(MonitorStopReason reason) noexcept;

/**
 * @brief Monitor run parameters.
 */
struct MonitorConfig {
  std::chrono::milliseconds duration{30000}; ///< Total run time
  std::chrono::milliseconds pollInterval{100}; ///< Read timeout per poll
  const std::atomic<bool>* cancel{nullptr};  ///< Optional; checked between polls

  /// @brief Config running for the given duration with the default poll interval.
  [[nodiscard]] static MonitorConfig forDuration(std::chrono::milliseconds duration) noexcept;
};

/**
 * @brief Outcome of a monitor run. Never an error: a transport failure or a
 *        cancellation still reports the frames delivered before it.
 */
struct MonitorSummary {
  std::size_t frames{0};                 ///< Frames delivered to the callback
  std::size_t emptyPolls{0};             ///< Polls that returned RX_EMPTY
  MonitorStopReason reason{MonitorStopReason::DURATION_ELAPSED};
  transport::Status lastStatus{};        ///< Status that ended the run (ok otherwise)
  std::chrono::milliseconds elapsed{0};  ///< Wall time spent in the loop

  /// @brief Human-readable summary, e.g. "12 frames in 1000 ms (duration-elapsed)".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ChannelSession ----------------------------- */

class ChannelSession {
public:
  /// @param transport Bound driver instance; must outlive the session.
  explicit ChannelSession(transport::ITransport& transport) noexcept;

  /// Closes the channel if still bound.
  ~ChannelSession();

  ChannelSession(const ChannelSession&) = delete;
  ChannelSession& operator=(const ChannelSession&) = delete;
  ChannelSession(ChannelSession&&) = delete;
  ChannelSession& operator=(ChannelSession&&) = delete;

  /* ------------------------- Lifecycle ------------------------- */

  /**
   * @brief Bind a channel (CLOSED -> INITIALIZED).
   * @param channel Channel index.
   * @param monitorMode Open in listen-only mode.
   * @return Transport status; on failure the session stays CLOSED.
   *
   * A bound session is fully closed first, so at most one handle is held.
   */
  [[nodiscard]] transport::Status open(std::int32_t channel, bool monitorMode = false) noexcept;

  /**
   * @brief Start the controller (INITIALIZED -> STARTED).
   * @param bitrate Preset selector, validated before use.
   * @return ERR_NOT_INIT when CLOSED, ERR_BAUDRATE for unknown presets,
   *         otherwise the transport status.
   */
  [[nodiscard]] transport::Status start(transport::BitrateIndex bitrate) noexcept;

  /**
   * @brief Stop and release the channel (any state -> CLOSED).
   * @return Last non-zero status of stop/release, ok if both succeeded or
   *         the session was already CLOSED.
   */
  transport::Status close() noexcept;

  /* ------------------------- Discovery ------------------------- */

  /**
   * @brief Probe channels 0..maxChannels-1.
   * @return Available channel indices in ascending order, possibly empty.
   * @note Does not change session state.
   */
  [[nodiscard]] std::vector<std::int32_t> scan(std::int32_t maxChannels) const;

  /* ------------------------- Frame I/O ------------------------- */

  /**
   * @brief Transmit one frame.
   * @param id Identifier.
   * @param data Payload; bytes beyond the 8th are dropped.
   * @param extended 29-bit identifier.
   * @param remote Remote request.
   * @param timeoutMs 0 = non-blocking best effort.
   * @return ERR_NOT_INIT when not STARTED, otherwise the transport status.
   */
  [[nodiscard]] transport::Status send(std::uint32_t id, std::span<const std::uint8_t> data,
                                       bool extended = false, bool remote = false,
                                       std::uint16_t timeoutMs = 0) noexcept;

  /// @brief Transmit a prepared frame (normalized: dlc <= 8, FD flags cleared).
  [[nodiscard]] transport::Status send(const transport::CanFrame& frame,
                                       std::uint16_t timeoutMs = 0) noexcept;

  /**
   * @brief Receive one frame.
   * @param timeoutMs Maximum wait.
   * @return Frame, or a failed result: ERR_NOT_INIT when not STARTED,
   *         ERR_RX_EMPTY when nothing arrived, any other code on a fault.
   */
  [[nodiscard]] transport::Result<transport::CanFrame> receive(std::uint16_t timeoutMs) noexcept;

  /**
   * @brief Poll for frames until the duration elapses.
   * @param config Duration, poll interval, cancellation flag.
   * @param callback Called per frame; false stops. May be empty.
   * @return Summary with the number of frames delivered.
   *
   * RX_EMPTY keeps polling; any other failure ends the run. The poll timeout
   * is clamped to the remaining time, so the run overshoots the duration by
   * at most one poll interval.
   */
  [[nodiscard]] MonitorSummary monitor(const MonitorConfig& config, const FrameCallback& callback);

  /* ------------------------- Queries ------------------------- */

  [[nodiscard]] transport::Result<transport::BusStatus> getStatus() noexcept;
  [[nodiscard]] transport::Result<transport::BusLoad> getBusload() noexcept;
  [[nodiscard]] transport::Result<transport::BitrateInfo> getBitrate() noexcept;

  /* ------------------------- Accessors ------------------------- */

  [[nodiscard]] SessionState state() const noexcept { return state_; }
  [[nodiscard]] std::int32_t channel() const noexcept { return channel_; }
  [[nodiscard]] bool isOpen() const noexcept { return state_ != SessionState::CLOSED; }
  [[nodiscard]] bool isStarted() const noexcept { return state_ == SessionState::STARTED; }

  /// @brief Driver version string from the transport.
  [[nodiscard]] std::string driverVersion() const;

private:
  transport::ITransport& transport_;
  SessionState state_{SessionState::CLOSED};
  std::int32_t channel_{transport::CHANNEL_NONE};
};

} // namespace session

} // namespace canhost

#endif // CANHOST_SESSION_CHANNEL_SESSION_HPP
