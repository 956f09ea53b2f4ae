/**
 * @file CanApiTransport.cpp
 * @brief CAN API V3 binding via runtime symbol resolution.
 */

#include "src/transport/inc/CanApiTransport.hpp"
#include "src/helpers/inc/Log.hpp"

#include <dlfcn.h>
#include <time.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <utility>

#include <fmt/core.h>

namespace canhost {

namespace transport {

namespace log = canhost::helpers::log;

namespace {

/* ----------------------------- Driver ABI ----------------------------- */

// Layouts follow the driver's C headers (built with CAN FD support, so the
// message buffer holds 64 bytes even though only 8 are ever used here).

constexpr std::size_t API_MAX_DATA = 64;

constexpr std::uint8_t MSG_FLAG_XTD = 0x01;
constexpr std::uint8_t MSG_FLAG_RTR = 0x02;
constexpr std::uint8_t MSG_FLAG_FDF = 0x04;
constexpr std::uint8_t MSG_FLAG_BRS = 0x08;
constexpr std::uint8_t MSG_FLAG_ESI = 0x10;
constexpr std::uint8_t MSG_FLAG_STS = 0x80;

struct ApiMessage {
  std::uint32_t id;
  std::uint8_t flags;
  std::uint8_t dlc;
  std::uint8_t data[API_MAX_DATA];
  struct timespec timestamp;
};

struct ApiNominalTiming {
  std::uint16_t brp;
  std::uint16_t tseg1;
  std::uint16_t tseg2;
  std::uint16_t sjw;
  std::uint8_t sam;
};

struct ApiDataTiming {
  std::uint16_t brp;
  std::uint16_t tseg1;
  std::uint16_t tseg2;
  std::uint16_t sjw;
};

struct ApiBitTiming {
  std::int32_t frequency;
  ApiNominalTiming nominal;
  ApiDataTiming data;
};

union ApiBitrate {
  std::int32_t index;
  ApiBitTiming btr;
};

struct ApiSpeedPhase {
  bool enabled;
  float speed;
  float samplepoint;
};

struct ApiSpeed {
  ApiSpeedPhase nominal;
  ApiSpeedPhase data;
};

using FnTest = int (*)(std::int32_t, std::uint8_t, const void*, int*);
using FnInit = int (*)(std::int32_t, std::uint8_t, const void*);
using FnExit = int (*)(int);
using FnStart = int (*)(int, const ApiBitrate*);
using FnReset = int (*)(int);
using FnWrite = int (*)(int, const ApiMessage*, std::uint16_t);
using FnRead = int (*)(int, ApiMessage*, std::uint16_t);
using FnStatus = int (*)(int, std::uint8_t*);
using FnBusload = int (*)(int, std::uint8_t*, std::uint8_t*);
using FnBitrate = int (*)(int, ApiBitrate*, ApiSpeed*);
using FnVersion = char* (*)();

template <typename Fn> bool resolveSymbol(void* lib, const char* name, Fn& out) noexcept {
  out = reinterpret_cast<Fn>(::dlsym(lib, name));
  return out != nullptr;
}

/* ----------------------------- Conversion ----------------------------- */

ApiMessage toApiMessage(const CanFrame& frame) noexcept {
  ApiMessage msg{};
  msg.id = frame.id;
  if (frame.flags.extended) {
    msg.flags |= MSG_FLAG_XTD;
  }
  if (frame.flags.remote) {
    msg.flags |= MSG_FLAG_RTR;
  }

  const std::size_t LEN = std::min<std::size_t>(frame.dlc, CAN_MAX_DLC);
  std::memcpy(msg.data, frame.data.data(), LEN);
  msg.dlc = static_cast<std::uint8_t>(LEN);
  return msg;
}

CanFrame fromApiMessage(const ApiMessage& msg) noexcept {
  CanFrame frame{};
  frame.id = msg.id;
  frame.flags.extended = (msg.flags & MSG_FLAG_XTD) != 0;
  frame.flags.remote = (msg.flags & MSG_FLAG_RTR) != 0;
  frame.flags.fd = (msg.flags & MSG_FLAG_FDF) != 0;
  frame.flags.bitrateSwitch = (msg.flags & MSG_FLAG_BRS) != 0;
  frame.flags.errorState = (msg.flags & MSG_FLAG_ESI) != 0;
  frame.flags.statusMessage = (msg.flags & MSG_FLAG_STS) != 0;

  // Classic CAN only: anything longer is cut to 8 bytes
  const std::size_t LEN = std::min<std::size_t>(msg.dlc, CAN_MAX_DLC);
  std::memcpy(frame.data.data(), msg.data, LEN);
  frame.dlc = static_cast<std::uint8_t>(LEN);

  frame.timestamp = std::chrono::seconds{msg.timestamp.tv_sec} +
                    std::chrono::nanoseconds{msg.timestamp.tv_nsec};
  return frame;
}

} // namespace

/* ----------------------------- Api ----------------------------- */

struct CanApiTransport::Api {
  FnTest test{nullptr};
  FnInit init{nullptr};
  FnExit exit{nullptr};
  FnStart start{nullptr};
  FnReset reset{nullptr};
  FnWrite write{nullptr};
  FnRead read{nullptr};
  FnStatus status{nullptr};
  FnBusload busload{nullptr};
  FnBitrate bitrate{nullptr};
  FnVersion version{nullptr}; ///< Optional
};

/* ----------------------------- Lifecycle ----------------------------- */

CanApiTransport::CanApiTransport(std::string libraryPath)
    : libraryPath_(std::move(libraryPath)) {}

CanApiTransport::~CanApiTransport() {
  if (handle_ >= 0 && api_) {
    const int RC = api_->exit(handle_);
    if (RC < 0) {
      log::warn("CanApiTransport: releasing handle {} on destruction failed: {}", handle_, RC);
    }
    handle_ = -1;
  }
  unload();
}

std::int32_t CanApiTransport::load() noexcept {
  if (lib_ != nullptr) {
    return ERR_NONE;
  }

  loadError_.clear();
  ::dlerror();

  void* lib = ::dlopen(libraryPath_.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (lib == nullptr) {
    const char* ERR = ::dlerror();
    loadError_ = (ERR != nullptr) ? ERR : "dlopen failed";
    log::warn("CanApiTransport: cannot load '{}': {}", libraryPath_, loadError_);
    return ERR_LIBRARY;
  }

  auto api = std::make_unique<Api>();
  const char* missing = nullptr;
  if (!resolveSymbol(lib, "can_test", api->test)) {
    missing = "can_test";
  } else if (!resolveSymbol(lib, "can_init", api->init)) {
    missing = "can_init";
  } else if (!resolveSymbol(lib, "can_exit", api->exit)) {
    missing = "can_exit";
  } else if (!resolveSymbol(lib, "can_start", api->start)) {
    missing = "can_start";
  } else if (!resolveSymbol(lib, "can_reset", api->reset)) {
    missing = "can_reset";
  } else if (!resolveSymbol(lib, "can_write", api->write)) {
    missing = "can_write";
  } else if (!resolveSymbol(lib, "can_read", api->read)) {
    missing = "can_read";
  } else if (!resolveSymbol(lib, "can_status", api->status)) {
    missing = "can_status";
  } else if (!resolveSymbol(lib, "can_busload", api->busload)) {
    missing = "can_busload";
  } else if (!resolveSymbol(lib, "can_bitrate", api->bitrate)) {
    missing = "can_bitrate";
  }

  if (missing != nullptr) {
    loadError_ = fmt::format("symbol '{}' not found in '{}'", missing, libraryPath_);
    log::warn("CanApiTransport: {}", loadError_);
    ::dlclose(lib);
    return ERR_LIBRARY;
  }

  static_cast<void>(resolveSymbol(lib, "can_version", api->version));

  lib_ = lib;
  api_ = std::move(api);
  log::debug("CanApiTransport: loaded '{}'", libraryPath_);
  return ERR_NONE;
}

void CanApiTransport::unload() noexcept {
  api_.reset();
  if (lib_ != nullptr) {
    ::dlclose(lib_);
    lib_ = nullptr;
  }
}

/* ----------------------------- ITransport ----------------------------- */

ProbeResult CanApiTransport::probe(std::int32_t channel, OpMode mode) noexcept {
  ProbeResult result{};
  result.status = load();
  if (result.status != ERR_NONE) {
    return result;
  }

  int state = BOARD_NOT_PRESENT;
  result.status = api_->test(channel, mode.toByte(), nullptr, &state);
  result.boardState = state;
  return result;
}

std::int32_t CanApiTransport::initialize(std::int32_t channel, OpMode mode) noexcept {
  if (const std::int32_t RC = load(); RC != ERR_NONE) {
    return RC;
  }
  if (handle_ >= 0) {
    return ERR_ALREADY_INIT;
  }

  const int RC = api_->init(channel, mode.toByte(), nullptr);
  if (RC < 0) {
    return RC;
  }

  handle_ = RC;
  return ERR_NONE;
}

std::int32_t CanApiTransport::start(BitrateIndex bitrate) noexcept {
  if (handle_ < 0) {
    return ERR_NOT_INIT;
  }

  ApiBitrate param{};
  param.index = static_cast<std::int32_t>(bitrate);
  return api_->start(handle_, &param);
}

std::int32_t CanApiTransport::stop() noexcept {
  if (handle_ < 0) {
    return ERR_NOT_INIT;
  }
  return api_->reset(handle_);
}

std::int32_t CanApiTransport::release() noexcept {
  if (handle_ < 0) {
    return ERR_NOT_INIT;
  }

  // The handle is gone afterwards whatever the driver reports
  const int RC = api_->exit(handle_);
  handle_ = -1;
  return RC;
}

std::int32_t CanApiTransport::write(const CanFrame& frame, std::uint16_t timeoutMs) noexcept {
  if (handle_ < 0) {
    return ERR_NOT_INIT;
  }

  const ApiMessage MSG = toApiMessage(frame);
  return api_->write(handle_, &MSG, timeoutMs);
}

std::int32_t CanApiTransport::read(CanFrame& out, std::uint16_t timeoutMs) noexcept {
  if (handle_ < 0) {
    return ERR_NOT_INIT;
  }

  ApiMessage msg{};
  const int RC = api_->read(handle_, &msg, timeoutMs);
  if (RC < 0) {
    return RC;
  }

  // Non-negative codes are success; the message is valid for all of them.
  out = fromApiMessage(msg);
  return RC;
}

std::int32_t CanApiTransport::queryStatus(BusStatus& out) noexcept {
  if (handle_ < 0) {
    return ERR_NOT_INIT;
  }

  std::uint8_t raw = 0;
  const int RC = api_->status(handle_, &raw);
  if (RC >= 0) {
    out.raw = raw;
  }
  return RC;
}

std::int32_t CanApiTransport::queryBusload(BusLoad& out) noexcept {
  if (handle_ < 0) {
    return ERR_NOT_INIT;
  }

  std::uint8_t load = 0;
  std::uint8_t raw = 0;
  const int RC = api_->busload(handle_, &load, &raw);
  if (RC >= 0) {
    out.percent = static_cast<double>(load);
    out.status.raw = raw;
  }
  return RC;
}

std::int32_t CanApiTransport::queryBitrate(BitrateInfo& out) noexcept {
  if (handle_ < 0) {
    return ERR_NOT_INIT;
  }

  ApiBitrate param{};
  ApiSpeed speed{};
  const int RC = api_->bitrate(handle_, &param, &speed);
  if (RC < 0) {
    return RC;
  }

  out.timing.frequency = param.btr.frequency;
  out.timing.brp = param.btr.nominal.brp;
  out.timing.tseg1 = param.btr.nominal.tseg1;
  out.timing.tseg2 = param.btr.nominal.tseg2;
  out.timing.sjw = param.btr.nominal.sjw;
  out.timing.sam = param.btr.nominal.sam;
  out.speed = static_cast<double>(speed.nominal.speed);
  out.samplePoint = static_cast<double>(speed.nominal.samplepoint);
  return RC;
}

std::string CanApiTransport::version() const {
  if (!api_ || api_->version == nullptr) {
    return {};
  }
  const char* VERSION = api_->version();
  return (VERSION != nullptr) ? std::string(VERSION) : std::string();
}

} // namespace transport

} // namespace canhost
