/**
 * @file FakeCanApiDriver.cpp
 * @brief In-memory CAN API V3 driver, built as a shared library for tests.
 *
 * Exports the can_* entry points CanApiTransport resolves, plus fake_canapi_*
 * control functions the tests reach through dlsym. Channels 0..7 exist; a
 * presence mask selects which of them report a board. Transmitted frames are
 * recorded, received frames come from an injected queue.
 */

#include <time.h>

#include <cstdint>
#include <cstring>
#include <deque>

namespace {

/* ----------------------------- ABI ----------------------------- */

constexpr int FAKE_CHANNELS = 8;

constexpr int RC_NONE = 0;
constexpr int RC_OFFLINE = -9;
constexpr int RC_RX_EMPTY = -30;
constexpr int RC_RESOURCE = -90;
constexpr int RC_BAUDRATE = -91;
constexpr int RC_HANDLE = -92;
constexpr int RC_ILLPARA = -93;
constexpr int RC_NULLPTR = -94;

constexpr int BOARD_PRESENT = 0;
constexpr int BOARD_OCCUPIED = 1;
constexpr int BOARD_NOT_PRESENT = -1;

constexpr std::uint8_t MODE_MON = 0x01;
constexpr std::uint8_t STAT_STOPPED = 0x80;

struct Message {
  std::uint32_t id;
  std::uint8_t flags;
  std::uint8_t dlc;
  std::uint8_t data[64];
  struct timespec timestamp;
};

struct NominalTiming {
  std::uint16_t brp;
  std::uint16_t tseg1;
  std::uint16_t tseg2;
  std::uint16_t sjw;
  std::uint8_t sam;
};

struct DataTiming {
  std::uint16_t brp;
  std::uint16_t tseg1;
  std::uint16_t tseg2;
  std::uint16_t sjw;
};

struct BitTiming {
  std::int32_t frequency;
  NominalTiming nominal;
  DataTiming data;
};

union Bitrate {
  std::int32_t index;
  BitTiming btr;
};

struct SpeedPhase {
  bool enabled;
  float speed;
  float samplepoint;
};

struct Speed {
  SpeedPhase nominal;
  SpeedPhase data;
};

/* ----------------------------- State ----------------------------- */

struct Channel {
  bool open{false};
  bool started{false};
  std::uint8_t mode{0};
  std::int32_t bitrateIndex{0};
};

struct Driver {
  std::uint32_t presentMask{0};
  Channel channels[FAKE_CHANNELS]{};
  std::deque<Message> rx;
  std::uint32_t txCount{0};
  Message lastTx{};
  int lastReadTimeout{-1};
  int successCode{RC_NONE}; ///< Returned by read and the queries on success
};

Driver& driver() {
  static Driver d;
  return d;
}

bool isPresent(std::int32_t ch) {
  return ch >= 0 && ch < FAKE_CHANNELS && (driver().presentMask & (1U << ch)) != 0;
}

// Handle value equals channel index.
Channel* channelFor(int handle) {
  if (handle < 0 || handle >= FAKE_CHANNELS || !driver().channels[handle].open) {
    return nullptr;
  }
  return &driver().channels[handle];
}

const std::uint32_t SPEEDS[9] = {1000000, 800000, 500000, 250000, 125000,
                                 100000,  50000,  20000,  10000};

} // namespace

extern "C" {

/* ----------------------------- CAN API ----------------------------- */

int can_test(std::int32_t channel, std::uint8_t /*mode*/, const void* /*param*/, int* result) {
  if (result != nullptr) {
    if (!isPresent(channel)) {
      *result = BOARD_NOT_PRESENT;
    } else {
      *result = driver().channels[channel].open ? BOARD_OCCUPIED : BOARD_PRESENT;
    }
  }
  return RC_NONE;
}

int can_init(std::int32_t channel, std::uint8_t mode, const void* /*param*/) {
  if (!isPresent(channel)) {
    return RC_RESOURCE;
  }
  Channel& c = driver().channels[channel];
  if (c.open) {
    return RC_RESOURCE;
  }
  c = Channel{};
  c.open = true;
  c.mode = mode;
  return channel;
}

int can_exit(int handle) {
  Channel* c = channelFor(handle);
  if (c == nullptr) {
    return RC_HANDLE;
  }
  *c = Channel{};
  return RC_NONE;
}

int can_start(int handle, const Bitrate* bitrate) {
  Channel* c = channelFor(handle);
  if (c == nullptr) {
    return RC_HANDLE;
  }
  if (bitrate == nullptr) {
    return RC_NULLPTR;
  }
  if (bitrate->index > 0 || bitrate->index < -8) {
    return RC_BAUDRATE;
  }
  c->bitrateIndex = bitrate->index;
  c->started = true;
  return RC_NONE;
}

int can_reset(int handle) {
  Channel* c = channelFor(handle);
  if (c == nullptr) {
    return RC_HANDLE;
  }
  c->started = false;
  return RC_NONE;
}

int can_write(int handle, const Message* msg, std::uint16_t /*timeout*/) {
  Channel* c = channelFor(handle);
  if (c == nullptr) {
    return RC_HANDLE;
  }
  if (msg == nullptr) {
    return RC_NULLPTR;
  }
  if (!c->started) {
    return RC_OFFLINE;
  }
  if ((c->mode & MODE_MON) != 0) {
    return RC_ILLPARA;
  }
  driver().lastTx = *msg;
  ++driver().txCount;
  return RC_NONE;
}

int can_read(int handle, Message* msg, std::uint16_t timeout) {
  Channel* c = channelFor(handle);
  if (c == nullptr) {
    return RC_HANDLE;
  }
  if (msg == nullptr) {
    return RC_NULLPTR;
  }
  if (!c->started) {
    return RC_OFFLINE;
  }
  driver().lastReadTimeout = timeout;
  if (driver().rx.empty()) {
    return RC_RX_EMPTY;
  }
  *msg = driver().rx.front();
  driver().rx.pop_front();
  return driver().successCode;
}

int can_status(int handle, std::uint8_t* status) {
  Channel* c = channelFor(handle);
  if (c == nullptr) {
    return RC_HANDLE;
  }
  if (status != nullptr) {
    *status = c->started ? 0 : STAT_STOPPED;
  }
  return driver().successCode;
}

int can_busload(int handle, std::uint8_t* load, std::uint8_t* status) {
  Channel* c = channelFor(handle);
  if (c == nullptr) {
    return RC_HANDLE;
  }
  if (load != nullptr) {
    *load = c->started ? 42 : 0;
  }
  if (status != nullptr) {
    *status = c->started ? 0 : STAT_STOPPED;
  }
  return driver().successCode;
}

int can_bitrate(int handle, Bitrate* bitrate, Speed* speed) {
  Channel* c = channelFor(handle);
  if (c == nullptr) {
    return RC_HANDLE;
  }
  if (bitrate != nullptr) {
    std::memset(bitrate, 0, sizeof(*bitrate));
    bitrate->btr.frequency = 80000000;
    bitrate->btr.nominal.brp = static_cast<std::uint16_t>(80000000 / SPEEDS[-c->bitrateIndex] / 80);
    bitrate->btr.nominal.tseg1 = 69;
    bitrate->btr.nominal.tseg2 = 10;
    bitrate->btr.nominal.sjw = 10;
    bitrate->btr.nominal.sam = 0;
  }
  if (speed != nullptr) {
    std::memset(speed, 0, sizeof(*speed));
    speed->nominal.enabled = true;
    speed->nominal.speed = static_cast<float>(SPEEDS[-c->bitrateIndex]);
    speed->nominal.samplepoint = 0.875F;
  }
  return c->started ? driver().successCode : RC_OFFLINE;
}

char* can_version() {
  static char text[] = "Fake CAN API V3 driver 1.0";
  return text;
}

/* ----------------------------- Test Control ----------------------------- */

void fake_canapi_reset() {
  driver() = Driver{};
}

void fake_canapi_set_present(std::uint32_t mask) { driver().presentMask = mask; }

void fake_canapi_set_success_code(int code) { driver().successCode = code; }

void fake_canapi_inject_rx(std::uint32_t id, std::uint8_t flags, std::uint8_t dlc,
                           const std::uint8_t* data) {
  Message msg{};
  msg.id = id;
  msg.flags = flags;
  msg.dlc = dlc;
  if (data != nullptr) {
    std::memcpy(msg.data, data, dlc <= 64 ? dlc : 64);
  }
  msg.timestamp.tv_sec = 12;
  msg.timestamp.tv_nsec = 345000;
  driver().rx.push_back(msg);
}

std::uint32_t fake_canapi_tx_count() { return driver().txCount; }

void fake_canapi_last_tx(std::uint32_t* id, std::uint8_t* flags, std::uint8_t* dlc,
                         std::uint8_t* data8) {
  const Message& M = driver().lastTx;
  *id = M.id;
  *flags = M.flags;
  *dlc = M.dlc;
  std::memcpy(data8, M.data, 8);
}

int fake_canapi_last_read_timeout() { return driver().lastReadTimeout; }

} // extern "C"
