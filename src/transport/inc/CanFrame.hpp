#ifndef CANHOST_TRANSPORT_CAN_FRAME_HPP
#define CANHOST_TRANSPORT_CAN_FRAME_HPP
/**
 * @file CanFrame.hpp
 * @brief Classic CAN 2.0 frame and construction helpers.
 * @note Thread-safe: Plain value type, no shared state.
 *
 * Payloads are bounded to 8 bytes. Oversized input is truncated to its first
 * 8 bytes, never rejected. FD flags exist only so received frames can be
 * inspected; frames built for transmission always carry them cleared.
 */

#include "src/transport/inc/CanApiDefs.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>

namespace canhost {

namespace transport {

/* ----------------------------- CanFrameFlags ----------------------------- */

/**
 * @brief Frame-kind flags.
 */
struct CanFrameFlags {
  bool extended{false};      ///< 29-bit identifier
  bool remote{false};        ///< Remote transmission request
  bool fd{false};            ///< CAN FD format (cleared on transmit)
  bool bitrateSwitch{false}; ///< FD bit-rate switch (cleared on transmit)
  bool errorState{false};    ///< FD error state indicator (cleared on transmit)
  bool statusMessage{false}; ///< Driver status message, not bus traffic

  /// @brief True if any FD-only flag is set.
  [[nodiscard]] bool hasFdFlags() const noexcept { return fd || bitrateSwitch || errorState; }

  friend bool operator==(const CanFrameFlags&, const CanFrameFlags&) = default;
};

/* ----------------------------- CanFrame ----------------------------- */

/**
 * @brief One classic CAN frame.
 */
struct CanFrame {
  std::uint32_t id{0};                       ///< 11- or 29-bit identifier
  std::array<std::uint8_t, CAN_MAX_DLC> data{}; ///< Payload (first dlc bytes valid)
  std::uint8_t dlc{0};                       ///< Payload length, 0..8
  CanFrameFlags flags{};                     ///< Frame-kind flags
  std::chrono::nanoseconds timestamp{0};     ///< Driver timestamp (receive only)

  /// @brief Valid payload bytes.
  [[nodiscard]] std::span<const std::uint8_t> payload() const noexcept;

  /// @brief True if the identifier fits the width selected by flags.extended.
  [[nodiscard]] bool hasValidId() const noexcept;

  /// @brief Human-readable summary, e.g. "0x123 [3] 11 22 33".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Build a transmit frame.
 * @param id Identifier, passed through verbatim.
 * @param data Payload; only the first 8 bytes are used.
 * @param extended 29-bit identifier flag.
 * @param remote Remote request flag.
 * @return Frame with dlc = min(data.size(), 8) and FD flags cleared.
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] CanFrame makeFrame(std::uint32_t id, std::span<const std::uint8_t> data,
                                 bool extended = false, bool remote = false) noexcept;

/// @brief makeFrame overload for brace-enclosed payloads.
[[nodiscard]] CanFrame makeFrame(std::uint32_t id, std::initializer_list<std::uint8_t> data,
                                 bool extended = false, bool remote = false) noexcept;

/**
 * @brief Bring a caller-supplied frame into transmit shape.
 * @param frame Frame to normalize in place.
 *
 * Clamps dlc to 8, zeroes unused payload bytes, clears FD and status flags.
 * @note RT-SAFE: No allocation.
 */
void normalizeForTransmit(CanFrame& frame) noexcept;

} // namespace transport

} // namespace canhost

#endif // CANHOST_TRANSPORT_CAN_FRAME_HPP
