#ifndef CANHOST_TRANSPORT_STATUS_HPP
#define CANHOST_TRANSPORT_STATUS_HPP
/**
 * @file Status.hpp
 * @brief Status codes, error classification, and tagged results.
 *
 * A Status wraps the signed code returned by the driver. Zero and positive
 * values mean success; negative values are passed through verbatim and only
 * classified (never rewritten) so callers can pick a recovery path.
 *
 * Result<T> is the tagged return type of every query that carries a payload:
 * it holds either the payload or the failing Status, never both.
 */

#include "src/transport/inc/CanApiDefs.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace canhost {

namespace transport {

/* ----------------------------- ErrorKind ----------------------------- */

/**
 * @brief Coarse classification of a status code.
 */
enum class ErrorKind : std::uint8_t {
  NONE = 0,          ///< Success
  NOT_INITIALIZED,   ///< Operation needs a prior open/start
  ALREADY_BOUND,     ///< Driver instance already bound to a channel
  INVALID_BITRATE,   ///< Bit-rate selector not in the preset table
  RX_EMPTY,          ///< No frame within the receive window
  TX_TIMEOUT,        ///< Transmission did not complete in time
  BUS_OFF,           ///< Controller went bus-off
  TX_FAILURE,        ///< Bus rejected the frame (error level, LEC)
  CONTROLLER_STATE,  ///< Controller online/offline mismatch
  LIBRARY,           ///< Driver library missing or incomplete
  TRANSPORT_FAILURE, ///< Any other driver error
};

/// @brief Convert ErrorKind to string.
/// @param kind Error kind.
/// @return String representation (e.g., "rx-empty").
[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

/// @brief Classify a raw status code.
/// @param code Driver status code.
/// @return Matching ErrorKind (NONE for code >= 0).
/// @note RT-SAFE: Pure function.
[[nodiscard]] ErrorKind classify(std::int32_t code) noexcept;

/// @brief Short description of a raw status code (e.g., "receiver empty").
[[nodiscard]] const char* describe(std::int32_t code) noexcept;

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Signed driver status code with classification helpers.
 */
struct Status {
  std::int32_t code{ERR_NONE}; ///< Raw code, passed through unchanged

  /// @brief True for zero or positive codes.
  [[nodiscard]] bool ok() const noexcept { return code >= 0; }

  /// @brief Classification of the code.
  [[nodiscard]] ErrorKind kind() const noexcept { return classify(code); }

  /// @brief True when a read timed out without a frame.
  [[nodiscard]] bool isRxEmpty() const noexcept { return code == ERR_RX_EMPTY; }

  /// @brief Human-readable summary, e.g. "-30 (rx-empty: receiver empty)".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;

  friend bool operator==(const Status&, const Status&) = default;
};

/* ----------------------------- Result ----------------------------- */

/**
 * @brief Tagged result: either a payload or the failing Status.
 * @tparam T Payload type.
 */
template <typename T> class Result {
public:
  /// @brief Build a successful result.
  [[nodiscard]] static Result success(T value) { return Result(std::move(value)); }

  /// @brief Build a failed result. A non-negative code is coerced to ERR_FATAL.
  [[nodiscard]] static Result failure(Status status) {
    if (status.ok()) {
      status.code = ERR_FATAL;
    }
    return Result(status);
  }

  [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(state_); }

  explicit operator bool() const noexcept { return ok(); }

  /// @brief Status of the operation (code 0 on success).
  [[nodiscard]] Status status() const noexcept {
    if (const Status* st = std::get_if<Status>(&state_)) {
      return *st;
    }
    return Status{};
  }

  /// @brief Payload access.
  /// @throws std::bad_variant_access if the result failed.
  [[nodiscard]] const T& value() const& { return std::get<T>(state_); }
  [[nodiscard]] T& value() & { return std::get<T>(state_); }
  [[nodiscard]] T&& value() && { return std::get<T>(std::move(state_)); }

  /// @brief Payload pointer, nullptr if the result failed.
  [[nodiscard]] const T* get() const noexcept { return std::get_if<T>(&state_); }

private:
  explicit Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
  explicit Result(Status status) : state_(std::in_place_index<1>, status) {}

  std::variant<T, Status> state_;
};

} // namespace transport

} // namespace canhost

#endif // CANHOST_TRANSPORT_STATUS_HPP
