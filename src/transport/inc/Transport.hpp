#ifndef CANHOST_TRANSPORT_TRANSPORT_HPP
#define CANHOST_TRANSPORT_TRANSPORT_HPP
/**
 * @file Transport.hpp
 * @brief Driver-agnostic transport binding interface.
 * @note NOT thread-safe: One transport instance is bound to one channel and
 *       driven by a single session; callers serialize access.
 *
 * ITransport is the fixed function contract between the channel session and
 * the hardware driver:
 *  - Lifecycle: probe, initialize, start, stop, release
 *  - I/O: write one frame, read one frame with timeout
 *  - Queries: status register, bus load, active bit rate
 *
 * Every call is a pass-through. No retries, no timing logic, no state
 * checks beyond what the driver itself performs. Return values are raw
 * driver status codes (see CanApiDefs.hpp).
 */

#include "src/transport/inc/Bitrate.hpp"
#include "src/transport/inc/CanApiDefs.hpp"
#include "src/transport/inc/CanFrame.hpp"

#include <cstdint>
#include <string>

namespace canhost {

namespace transport {

/* ----------------------------- OpMode ----------------------------- */

/**
 * @brief Operation mode requested at probe/initialize time.
 *
 * FD-related mode bits are intentionally absent: only classic CAN is
 * supported.
 */
struct OpMode {
  bool monitor{false};     ///< Listen-only, no ACK or transmit
  bool errorFrames{false}; ///< Deliver error frames
  bool noRemote{false};    ///< Suppress remote frames
  bool noExtended{false};  ///< Suppress extended-id frames
  bool shared{false};      ///< Shared channel access

  /// @brief Driver mode byte.
  [[nodiscard]] std::uint8_t toByte() const noexcept;

  /// @brief Default (classic CAN, normal) mode.
  [[nodiscard]] static OpMode defaults() noexcept { return OpMode{}; }

  /// @brief Listen-only mode.
  [[nodiscard]] static OpMode listenOnly() noexcept;
};

/* ----------------------------- ProbeResult ----------------------------- */

/**
 * @brief Result of a non-destructive channel probe.
 */
struct ProbeResult {
  std::int32_t status{ERR_NONE};               ///< Driver status of the probe call
  std::int32_t boardState{BOARD_NOT_PRESENT};  ///< BOARD_* value

  /// @brief True if the board reports the channel present and free.
  /// @note Keys on the board state only; the call status is informational.
  [[nodiscard]] bool isAvailable() const noexcept { return boardState == BOARD_PRESENT; }
};

/// @brief Board state as string ("present", "occupied", ...).
[[nodiscard]] const char* boardStateToString(std::int32_t boardState) noexcept;

/* ----------------------------- BusStatus ----------------------------- */

/**
 * @brief Decoded controller status register.
 */
struct BusStatus {
  std::uint8_t raw{0}; ///< STAT_* bit mask as reported

  [[nodiscard]] bool busOff() const noexcept { return (raw & STAT_BUS_OFF) != 0; }
  [[nodiscard]] bool warningLevel() const noexcept { return (raw & STAT_WARNING) != 0; }
  [[nodiscard]] bool busError() const noexcept { return (raw & STAT_BUS_ERROR) != 0; }
  [[nodiscard]] bool txBusy() const noexcept { return (raw & STAT_TX_BUSY) != 0; }
  [[nodiscard]] bool rxEmpty() const noexcept { return (raw & STAT_RX_EMPTY) != 0; }
  [[nodiscard]] bool messageLost() const noexcept { return (raw & STAT_MSG_LOST) != 0; }
  [[nodiscard]] bool queueOverrun() const noexcept { return (raw & STAT_QUEUE_OVR) != 0; }
  [[nodiscard]] bool stopped() const noexcept { return (raw & STAT_STOPPED) != 0; }

  /// @brief True if any fault bit (bus-off, warning, bus error, loss, overrun) is set.
  [[nodiscard]] bool hasFault() const noexcept;

  /// @brief Human-readable summary, e.g. "0x60 bus-off warning".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- BusLoad ----------------------------- */

/**
 * @brief Bus load sample with the status register read alongside it.
 */
struct BusLoad {
  double percent{0.0}; ///< Bus load, 0..100
  BusStatus status{};  ///< Status register at sample time

  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ITransport ----------------------------- */

/**
 * @brief Abstract transport binding.
 *
 * Implementations: CanApiTransport (CAN API V3 shared library). Tests supply
 * recording fakes.
 */
class ITransport {
public:
  virtual ~ITransport() = default;

  /// @brief Test whether a channel exists and is free. Never binds it.
  [[nodiscard]] virtual ProbeResult probe(std::int32_t channel, OpMode mode) noexcept = 0;

  /// @brief Bind the driver instance to a channel. ERR_ALREADY_INIT if bound.
  [[nodiscard]] virtual std::int32_t initialize(std::int32_t channel, OpMode mode) noexcept = 0;

  /// @brief Start the controller. ERR_NOT_INIT without a bound channel.
  [[nodiscard]] virtual std::int32_t start(BitrateIndex bitrate) noexcept = 0;

  /// @brief Stop the controller. Safe when never started.
  [[nodiscard]] virtual std::int32_t stop() noexcept = 0;

  /// @brief Release the bound channel. Safe when never bound.
  [[nodiscard]] virtual std::int32_t release() noexcept = 0;

  /// @brief Transmit one frame. timeoutMs 0 = non-blocking.
  [[nodiscard]] virtual std::int32_t write(const CanFrame& frame,
                                           std::uint16_t timeoutMs) noexcept = 0;

  /// @brief Receive one frame. ERR_RX_EMPTY when none arrived in time.
  [[nodiscard]] virtual std::int32_t read(CanFrame& out, std::uint16_t timeoutMs) noexcept = 0;

  /// @brief Read the controller status register.
  [[nodiscard]] virtual std::int32_t queryStatus(BusStatus& out) noexcept = 0;

  /// @brief Read the bus load.
  [[nodiscard]] virtual std::int32_t queryBusload(BusLoad& out) noexcept = 0;

  /// @brief Read the active bit rate.
  [[nodiscard]] virtual std::int32_t queryBitrate(BitrateInfo& out) noexcept = 0;

  /// @brief Driver version string, empty if unavailable.
  [[nodiscard]] virtual std::string version() const = 0;

  ITransport(const ITransport&) = delete;
  ITransport& operator=(const ITransport&) = delete;

protected:
  ITransport() = default;
};

} // namespace transport

} // namespace canhost

#endif // CANHOST_TRANSPORT_TRANSPORT_HPP
