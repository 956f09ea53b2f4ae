#ifndef CANHOST_TRANSPORT_CAN_API_DEFS_HPP
#define CANHOST_TRANSPORT_CAN_API_DEFS_HPP
/**
 * @file CanApiDefs.hpp
 * @brief Constants of the CAN API V3 driver contract.
 *
 * Status codes, board states, operation-mode bits, status-register bits and
 * timeout sentinels shared by every transport and by the channel session.
 * Values match the driver's published definitions so codes can be passed
 * through to callers unchanged.
 *
 * @note RT-SAFE: Compile-time constants only.
 */

#include <cstddef>
#include <cstdint>

namespace canhost {

namespace transport {

/* ----------------------------- Status Codes ----------------------------- */

inline constexpr std::int32_t ERR_NONE = 0;          ///< Success
inline constexpr std::int32_t ERR_BUS_OFF = -1;      ///< Controller is bus-off
inline constexpr std::int32_t ERR_WARNING = -2;      ///< Error warning level reached
inline constexpr std::int32_t ERR_BUS_ERROR = -3;    ///< Bus error
inline constexpr std::int32_t ERR_ONLINE = -8;       ///< Controller already started
inline constexpr std::int32_t ERR_OFFLINE = -9;      ///< Controller not started
inline constexpr std::int32_t ERR_MSG_LOST = -10;    ///< Message lost
inline constexpr std::int32_t ERR_LEC_STUFF = -11;   ///< Stuff error
inline constexpr std::int32_t ERR_LEC_FORM = -12;    ///< Form error
inline constexpr std::int32_t ERR_LEC_ACK = -13;     ///< Acknowledge error
inline constexpr std::int32_t ERR_LEC_BIT1 = -14;    ///< Recessive bit error
inline constexpr std::int32_t ERR_LEC_BIT0 = -15;    ///< Dominant bit error
inline constexpr std::int32_t ERR_LEC_CRC = -16;     ///< CRC error
inline constexpr std::int32_t ERR_TX_BUSY = -20;     ///< Transmitter busy
inline constexpr std::int32_t ERR_RX_EMPTY = -30;    ///< Receiver empty (read timed out)
inline constexpr std::int32_t ERR_QUEUE_OVR = -40;   ///< Receive queue overrun
inline constexpr std::int32_t ERR_TIMEOUT = -50;     ///< Generic timeout
inline constexpr std::int32_t ERR_RESOURCE = -90;    ///< Resource allocation failed
inline constexpr std::int32_t ERR_BAUDRATE = -91;    ///< Illegal bit-rate selector
inline constexpr std::int32_t ERR_HANDLE = -92;      ///< Illegal driver handle
inline constexpr std::int32_t ERR_ILLPARA = -93;     ///< Illegal parameter
inline constexpr std::int32_t ERR_NULLPTR = -94;     ///< Null pointer argument
inline constexpr std::int32_t ERR_NOT_INIT = -95;    ///< Not initialized
inline constexpr std::int32_t ERR_ALREADY_INIT = -96; ///< Already initialized (bound)
inline constexpr std::int32_t ERR_LIBRARY = -97;     ///< Driver library not loaded
inline constexpr std::int32_t ERR_NOT_SUPP = -98;    ///< Operation not supported
inline constexpr std::int32_t ERR_FATAL = -99;       ///< Other driver error
inline constexpr std::int32_t ERR_VENDOR = -100;     ///< Vendor-specific errors start here

/* ----------------------------- Board States ----------------------------- */

/// Board state reported by probe: channel present and available.
inline constexpr std::int32_t BOARD_PRESENT = 0;

/// Board state reported by probe: channel present but in use.
inline constexpr std::int32_t BOARD_OCCUPIED = 1;

/// Board state reported by probe: channel not present.
inline constexpr std::int32_t BOARD_NOT_PRESENT = -1;

/// Board state reported by probe: driver cannot test the channel.
inline constexpr std::int32_t BOARD_NOT_TESTABLE = -2;

/* ----------------------------- Operation Mode ----------------------------- */

inline constexpr std::uint8_t MODE_DEFAULT = 0x00; ///< Classic CAN, normal mode
inline constexpr std::uint8_t MODE_MON = 0x01;     ///< Monitor (listen-only) mode
inline constexpr std::uint8_t MODE_ERR = 0x02;     ///< Error frame reception
inline constexpr std::uint8_t MODE_NRTR = 0x04;    ///< Suppress remote frames
inline constexpr std::uint8_t MODE_NXTD = 0x08;    ///< Suppress extended frames
inline constexpr std::uint8_t MODE_SHRD = 0x10;    ///< Shared access
inline constexpr std::uint8_t MODE_NISO = 0x20;    ///< Non-ISO CAN FD (never set here)
inline constexpr std::uint8_t MODE_BRSE = 0x40;    ///< Bit-rate switching (never set here)
inline constexpr std::uint8_t MODE_FDOE = 0x80;    ///< CAN FD operation (never set here)

/* ----------------------------- Status Register ----------------------------- */

inline constexpr std::uint8_t STAT_QUEUE_OVR = 0x01; ///< Receive queue overrun
inline constexpr std::uint8_t STAT_MSG_LOST = 0x02;  ///< Message lost
inline constexpr std::uint8_t STAT_RX_EMPTY = 0x04;  ///< Receive queue empty
inline constexpr std::uint8_t STAT_TX_BUSY = 0x08;   ///< Transmitter busy
inline constexpr std::uint8_t STAT_BUS_ERROR = 0x10; ///< Bus error (LEC)
inline constexpr std::uint8_t STAT_WARNING = 0x20;   ///< Error warning level
inline constexpr std::uint8_t STAT_BUS_OFF = 0x40;   ///< Bus-off
inline constexpr std::uint8_t STAT_STOPPED = 0x80;   ///< Controller stopped

/* ----------------------------- Limits ----------------------------- */

/// Classic CAN maximum payload length.
inline constexpr std::size_t CAN_MAX_DLC = 8;

/// Standard (11-bit) identifier mask.
inline constexpr std::uint32_t CAN_STD_ID_MASK = 0x7FFU;

/// Extended (29-bit) identifier mask.
inline constexpr std::uint32_t CAN_XTD_ID_MASK = 0x1FFFFFFFU;

/// Timeout value: return immediately.
inline constexpr std::uint16_t TIMEOUT_NONBLOCKING = 0;

/// Timeout value: block until the operation completes.
inline constexpr std::uint16_t TIMEOUT_INFINITE = 65535;

/// Unbound channel sentinel.
inline constexpr std::int32_t CHANNEL_NONE = -1;

} // namespace transport

} // namespace canhost

#endif // CANHOST_TRANSPORT_CAN_API_DEFS_HPP
