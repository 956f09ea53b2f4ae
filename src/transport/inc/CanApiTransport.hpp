#ifndef CANHOST_TRANSPORT_CAN_API_TRANSPORT_HPP
#define CANHOST_TRANSPORT_CAN_API_TRANSPORT_HPP
/**
 * @file CanApiTransport.hpp
 * @brief Transport binding over a CAN API V3 driver shared library.
 * @note Linux-only: Uses dlopen/dlsym.
 * @note NOT thread-safe: One instance drives one channel from one thread.
 *
 * The driver library is resolved at runtime from a caller-supplied name or
 * path (e.g., "libuvcankvl.so.1"), so binaries start on machines without the
 * vendor package installed. Loading happens on first use or explicitly via
 * load(). Missing libraries or symbols surface as ERR_LIBRARY.
 *
 * Usage:
 * @code
 *   CanApiTransport drv{"libuvcankvl.so.1"};
 *   ChannelSession session{drv};
 *   auto channels = session.scan(8);
 * @endcode
 */

#include "src/transport/inc/Transport.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace canhost {

namespace transport {

/// Default Kvaser driver library name on Linux.
inline constexpr const char* DEFAULT_DRIVER_LIBRARY = "libuvcankvl.so.1";

/* ----------------------------- CanApiTransport ----------------------------- */

class CanApiTransport final : public ITransport {
public:
  /// @param libraryPath Library name (searched by the dynamic loader) or path.
  explicit CanApiTransport(std::string libraryPath);

  /// Releases a still-bound handle and unloads the library.
  ~CanApiTransport() override;

  CanApiTransport(const CanApiTransport&) = delete;
  CanApiTransport& operator=(const CanApiTransport&) = delete;

  /**
   * @brief Load the driver library and resolve all entry points.
   * @return ERR_NONE, or ERR_LIBRARY with lastLoadError() describing why.
   * @note Idempotent once successful.
   */
  [[nodiscard]] std::int32_t load() noexcept;

  [[nodiscard]] bool isLoaded() const noexcept { return lib_ != nullptr; }

  /// @brief True while a driver handle is held.
  [[nodiscard]] bool isBound() const noexcept { return handle_ >= 0; }

  /// @brief dlerror() text of the last failed load, empty otherwise.
  [[nodiscard]] const std::string& lastLoadError() const noexcept { return loadError_; }

  [[nodiscard]] const std::string& libraryPath() const noexcept { return libraryPath_; }

  /* ------------------------- ITransport ------------------------- */

  [[nodiscard]] ProbeResult probe(std::int32_t channel, OpMode mode) noexcept override;
  [[nodiscard]] std::int32_t initialize(std::int32_t channel, OpMode mode) noexcept override;
  [[nodiscard]] std::int32_t start(BitrateIndex bitrate) noexcept override;
  [[nodiscard]] std::int32_t stop() noexcept override;
  [[nodiscard]] std::int32_t release() noexcept override;
  [[nodiscard]] std::int32_t write(const CanFrame& frame, std::uint16_t timeoutMs) noexcept override;
  [[nodiscard]] std::int32_t read(CanFrame& out, std::uint16_t timeoutMs) noexcept override;
  [[nodiscard]] std::int32_t queryStatus(BusStatus& out) noexcept override;
  [[nodiscard]] std::int32_t queryBusload(BusLoad& out) noexcept override;
  [[nodiscard]] std::int32_t queryBitrate(BitrateInfo& out) noexcept override;
  [[nodiscard]] std::string version() const override;

private:
  struct Api; // Resolved entry points, defined in the .cpp

  void unload() noexcept;

  std::string libraryPath_;
  std::string loadError_;
  void* lib_{nullptr};
  std::unique_ptr<Api> api_;
  int handle_{-1};
};

} // namespace transport

} // namespace canhost

#endif // CANHOST_TRANSPORT_CAN_API_TRANSPORT_HPP
