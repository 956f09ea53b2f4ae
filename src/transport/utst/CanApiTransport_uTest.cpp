/**
 * @file CanApiTransport_uTest.cpp
 * @brief Unit tests for the CAN API V3 binding against an in-memory driver.
 *
 * The fake driver is a shared library built next to this test; its path comes
 * from CANHOST_FAKE_DRIVER_PATH. Tests drive it through its fake_canapi_*
 * control functions.
 */

#include "src/session/inc/ChannelSession.hpp"
#include "src/transport/inc/CanApiTransport.hpp"

#include <gtest/gtest.h>

#include <dlfcn.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#ifndef CANHOST_FAKE_DRIVER_PATH
#error "CANHOST_FAKE_DRIVER_PATH must name the fake CAN API driver library"
#endif

using canhost::session::ChannelSession;
using canhost::session::MonitorConfig;
using canhost::session::MonitorStopReason;
using canhost::transport::BitrateIndex;
using canhost::transport::BitrateInfo;
using canhost::transport::BOARD_NOT_PRESENT;
using canhost::transport::BOARD_OCCUPIED;
using canhost::transport::BOARD_PRESENT;
using canhost::transport::BusLoad;
using canhost::transport::BusStatus;
using canhost::transport::CanApiTransport;
using canhost::transport::CanFrame;
using canhost::transport::makeFrame;
using canhost::transport::OpMode;
using canhost::transport::ProbeResult;

namespace ct = canhost::transport;

namespace {

/* ----------------------------- Fake Driver Control ----------------------------- */

using FnReset = void (*)();
using FnSetPresent = void (*)(std::uint32_t);
using FnInjectRx = void (*)(std::uint32_t, std::uint8_t, std::uint8_t, const std::uint8_t*);
using FnTxCount = std::uint32_t (*)();
using FnLastTx = void (*)(std::uint32_t*, std::uint8_t*, std::uint8_t*, std::uint8_t*);
using FnLastReadTimeout = int (*)();
using FnSetSuccessCode = void (*)(int);

class CanApiTransportTest : public ::testing::Test {
protected:
  void SetUp() override {
    lib_ = ::dlopen(CANHOST_FAKE_DRIVER_PATH, RTLD_NOW | RTLD_LOCAL);
    ASSERT_NE(lib_, nullptr) << ::dlerror();

    reset_ = reinterpret_cast<FnReset>(::dlsym(lib_, "fake_canapi_reset"));
    setPresent_ = reinterpret_cast<FnSetPresent>(::dlsym(lib_, "fake_canapi_set_present"));
    injectRx_ = reinterpret_cast<FnInjectRx>(::dlsym(lib_, "fake_canapi_inject_rx"));
    txCount_ = reinterpret_cast<FnTxCount>(::dlsym(lib_, "fake_canapi_tx_count"));
    lastTx_ = reinterpret_cast<FnLastTx>(::dlsym(lib_, "fake_canapi_last_tx"));
    lastReadTimeout_ =
        reinterpret_cast<FnLastReadTimeout>(::dlsym(lib_, "fake_canapi_last_read_timeout"));
    ASSERT_NE(reset_, nullptr);
    ASSERT_NE(setPresent_, nullptr);
    ASSERT_NE(injectRx_, nullptr);
    ASSERT_NE(txCount_, nullptr);
    ASSERT_NE(lastTx_, nullptr);
    setSuccessCode_ =
        reinterpret_cast<FnSetSuccessCode>(::dlsym(lib_, "fake_canapi_set_success_code"));
    ASSERT_NE(lastReadTimeout_, nullptr);
    ASSERT_NE(setSuccessCode_, nullptr);

    reset_();
    setPresent_(0x01); // channel 0 only
  }

  void TearDown() override {
    if (lib_ != nullptr) {
      ::dlclose(lib_);
    }
  }

  void* lib_{nullptr};
  FnReset reset_{nullptr};
  FnSetPresent setPresent_{nullptr};
  FnInjectRx injectRx_{nullptr};
  FnTxCount txCount_{nullptr};
  FnLastTx lastTx_{nullptr};
  FnLastReadTimeout lastReadTimeout_{nullptr};
  FnSetSuccessCode setSuccessCode_{nullptr};
};

} // namespace

/* ----------------------------- Loading ----------------------------- */

/** @test Missing library reports ERR_LIBRARY with a reason */
TEST(CanApiTransportLoadTest, MissingLibrary) {
  CanApiTransport drv{"libcanhost-does-not-exist.so.9"};
  EXPECT_EQ(drv.load(), ct::ERR_LIBRARY);
  EXPECT_FALSE(drv.isLoaded());
  EXPECT_FALSE(drv.lastLoadError().empty());
  EXPECT_EQ(drv.libraryPath(), "libcanhost-does-not-exist.so.9");
}

/** @test Operations on an unloadable library fail with ERR_LIBRARY */
TEST(CanApiTransportLoadTest, OperationsWithoutLibrary) {
  CanApiTransport drv{"libcanhost-does-not-exist.so.9"};
  EXPECT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_LIBRARY);
  EXPECT_EQ(drv.probe(0, OpMode::defaults()).status, ct::ERR_LIBRARY);
  EXPECT_FALSE(drv.probe(0, OpMode::defaults()).isAvailable());
  EXPECT_TRUE(drv.version().empty());
}

/** @test A library without the CAN API entry points is rejected */
TEST(CanApiTransportLoadTest, LibraryWithoutSymbols) {
  CanApiTransport drv{"libm.so.6"};
  EXPECT_EQ(drv.load(), ct::ERR_LIBRARY);
  EXPECT_FALSE(drv.isLoaded());
  EXPECT_NE(drv.lastLoadError().find("can_test"), std::string::npos);
}

/** @test The fake driver loads and reports its version */
TEST_F(CanApiTransportTest, LoadsFakeDriver) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  EXPECT_EQ(drv.load(), ct::ERR_NONE);
  EXPECT_TRUE(drv.isLoaded());
  EXPECT_EQ(drv.load(), ct::ERR_NONE);
  EXPECT_EQ(drv.version(), "Fake CAN API V3 driver 1.0");
}

/* ----------------------------- Lifecycle ----------------------------- */

/** @test Probe reports present, occupied and absent boards */
TEST_F(CanApiTransportTest, Probe) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};

  ProbeResult res = drv.probe(0, OpMode::defaults());
  EXPECT_EQ(res.status, ct::ERR_NONE);
  EXPECT_EQ(res.boardState, BOARD_PRESENT);
  EXPECT_TRUE(res.isAvailable());

  res = drv.probe(1, OpMode::defaults());
  EXPECT_EQ(res.boardState, BOARD_NOT_PRESENT);
  EXPECT_FALSE(res.isAvailable());

  ASSERT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);
  res = drv.probe(0, OpMode::defaults());
  EXPECT_EQ(res.boardState, BOARD_OCCUPIED);
  EXPECT_FALSE(res.isAvailable());
}

/** @test Double initialize fails with ERR_ALREADY_INIT */
TEST_F(CanApiTransportTest, InitializeTwice) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  EXPECT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);
  EXPECT_TRUE(drv.isBound());
  EXPECT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_ALREADY_INIT);
  EXPECT_EQ(drv.release(), ct::ERR_NONE);
  EXPECT_FALSE(drv.isBound());
}

/** @test Driver errors from initialize pass through */
TEST_F(CanApiTransportTest, InitializeAbsentChannel) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  EXPECT_EQ(drv.initialize(3, OpMode::defaults()), ct::ERR_RESOURCE);
  EXPECT_FALSE(drv.isBound());
}

/** @test Calls without a bound channel report ERR_NOT_INIT */
TEST_F(CanApiTransportTest, UnboundCalls) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  CanFrame frame{};
  BusStatus status{};
  BusLoad load{};
  BitrateInfo info{};
  EXPECT_EQ(drv.start(BitrateIndex::INDEX_250K), ct::ERR_NOT_INIT);
  EXPECT_EQ(drv.stop(), ct::ERR_NOT_INIT);
  EXPECT_EQ(drv.release(), ct::ERR_NOT_INIT);
  EXPECT_EQ(drv.write(frame, 0), ct::ERR_NOT_INIT);
  EXPECT_EQ(drv.read(frame, 0), ct::ERR_NOT_INIT);
  EXPECT_EQ(drv.queryStatus(status), ct::ERR_NOT_INIT);
  EXPECT_EQ(drv.queryBusload(load), ct::ERR_NOT_INIT);
  EXPECT_EQ(drv.queryBitrate(info), ct::ERR_NOT_INIT);
}

/** @test Destroying a bound transport frees the channel */
TEST_F(CanApiTransportTest, DestructorReleases) {
  {
    CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
    ASSERT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);
  }
  CanApiTransport other{CANHOST_FAKE_DRIVER_PATH};
  EXPECT_TRUE(other.probe(0, OpMode::defaults()).isAvailable());
}

/* ----------------------------- Frame I/O ----------------------------- */

/** @test Written frames reach the driver with flags mapped */
TEST_F(CanApiTransportTest, WriteMapsFrame) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ASSERT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);
  ASSERT_EQ(drv.start(BitrateIndex::INDEX_500K), ct::ERR_NONE);

  EXPECT_EQ(drv.write(makeFrame(0x18DAF110, {0xDE, 0xAD}, true), 10), ct::ERR_NONE);
  EXPECT_EQ(txCount_(), 1U);

  std::uint32_t id = 0;
  std::uint8_t flags = 0;
  std::uint8_t dlc = 0;
  std::array<std::uint8_t, 8> data{};
  lastTx_(&id, &flags, &dlc, data.data());
  EXPECT_EQ(id, 0x18DAF110U);
  EXPECT_EQ(flags, 0x01);
  EXPECT_EQ(dlc, 2U);
  EXPECT_EQ(data[0], 0xDE);
  EXPECT_EQ(data[1], 0xAD);
}

/** @test Reads return injected frames, then RX_EMPTY */
TEST_F(CanApiTransportTest, ReadInjectedFrame) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ASSERT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);
  ASSERT_EQ(drv.start(BitrateIndex::INDEX_250K), ct::ERR_NONE);

  const std::array<std::uint8_t, 3> PAYLOAD{0x01, 0x02, 0x03};
  injectRx_(0x123, 0x02, 3, PAYLOAD.data());

  CanFrame frame{};
  EXPECT_EQ(drv.read(frame, 50), ct::ERR_NONE);
  EXPECT_EQ(frame.id, 0x123U);
  EXPECT_TRUE(frame.flags.remote);
  EXPECT_FALSE(frame.flags.extended);
  EXPECT_EQ(frame.dlc, 3U);
  EXPECT_EQ(frame.data[2], 0x03);
  EXPECT_EQ(frame.timestamp, std::chrono::seconds{12} + std::chrono::nanoseconds{345000});
  EXPECT_EQ(lastReadTimeout_(), 50);

  EXPECT_EQ(drv.read(frame, 0), ct::ERR_RX_EMPTY);
}

/** @test A positive driver code still delivers the frame and passes through */
TEST_F(CanApiTransportTest, ReadPositiveCodeDeliversFrame) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ASSERT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);
  ASSERT_EQ(drv.start(BitrateIndex::INDEX_250K), ct::ERR_NONE);

  setSuccessCode_(1);
  const std::array<std::uint8_t, 2> PAYLOAD{0xCA, 0xFE};
  injectRx_(0x456, 0x00, 2, PAYLOAD.data());

  CanFrame frame{};
  EXPECT_EQ(drv.read(frame, 10), 1);
  EXPECT_EQ(frame.id, 0x456U);
  EXPECT_EQ(frame.dlc, 2U);
  EXPECT_EQ(frame.data[1], 0xFE);

  EXPECT_EQ(drv.read(frame, 0), ct::ERR_RX_EMPTY);
}

/** @test Over-long driver frames are cut to 8 bytes */
TEST_F(CanApiTransportTest, ReadClampsLongFrame) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ASSERT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);
  ASSERT_EQ(drv.start(BitrateIndex::INDEX_250K), ct::ERR_NONE);

  std::array<std::uint8_t, 16> payload{};
  for (std::size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<std::uint8_t>(0xA0 + i);
  }
  injectRx_(0x200, 0x04, 16, payload.data());

  CanFrame frame{};
  EXPECT_EQ(drv.read(frame, 0), ct::ERR_NONE);
  EXPECT_EQ(frame.dlc, ct::CAN_MAX_DLC);
  EXPECT_EQ(frame.data[7], 0xA7);
  EXPECT_TRUE(frame.flags.fd);
}

/** @test Listen-only channels refuse to transmit */
TEST_F(CanApiTransportTest, MonitorModeRejectsWrite) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ASSERT_EQ(drv.initialize(0, OpMode::listenOnly()), ct::ERR_NONE);
  ASSERT_EQ(drv.start(BitrateIndex::INDEX_250K), ct::ERR_NONE);
  EXPECT_EQ(drv.write(makeFrame(0x1, {}), 0), ct::ERR_ILLPARA);
  EXPECT_EQ(txCount_(), 0U);
}

/* ----------------------------- Queries ----------------------------- */

/** @test Status, bus load and bit timing are decoded */
TEST_F(CanApiTransportTest, Queries) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ASSERT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);

  BusStatus status{};
  EXPECT_EQ(drv.queryStatus(status), ct::ERR_NONE);
  EXPECT_TRUE(status.stopped());

  ASSERT_EQ(drv.start(BitrateIndex::INDEX_250K), ct::ERR_NONE);
  EXPECT_EQ(drv.queryStatus(status), ct::ERR_NONE);
  EXPECT_EQ(status.raw, 0U);

  BusLoad load{};
  EXPECT_EQ(drv.queryBusload(load), ct::ERR_NONE);
  EXPECT_DOUBLE_EQ(load.percent, 42.0);

  BitrateInfo info{};
  EXPECT_EQ(drv.queryBitrate(info), ct::ERR_NONE);
  EXPECT_DOUBLE_EQ(info.speed, 250000.0);
  EXPECT_NEAR(info.samplePoint, 0.875, 1e-6);
  EXPECT_EQ(info.timing.frequency, 80000000);
  EXPECT_EQ(info.timing.brp, 4U);
  EXPECT_EQ(info.timing.quantaPerBit(), 80U);
}

/** @test Queries decode their output when the driver answers with a positive code */
TEST_F(CanApiTransportTest, QueriesPositiveCode) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ASSERT_EQ(drv.initialize(0, OpMode::defaults()), ct::ERR_NONE);
  ASSERT_EQ(drv.start(BitrateIndex::INDEX_500K), ct::ERR_NONE);
  setSuccessCode_(2);

  BusStatus status{};
  status.raw = 0xFF;
  EXPECT_EQ(drv.queryStatus(status), 2);
  EXPECT_EQ(status.raw, 0U);

  BusLoad load{};
  EXPECT_EQ(drv.queryBusload(load), 2);
  EXPECT_DOUBLE_EQ(load.percent, 42.0);

  BitrateInfo info{};
  EXPECT_EQ(drv.queryBitrate(info), 2);
  EXPECT_DOUBLE_EQ(info.speed, 500000.0);
  EXPECT_EQ(info.timing.brp, 2U);
}

/** @test A session treats positive read codes as delivered frames */
TEST_F(CanApiTransportTest, SessionReceivePositiveCode) {
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ChannelSession session{drv};
  ASSERT_TRUE(session.open(0, false).ok());
  ASSERT_TRUE(session.start(BitrateIndex::INDEX_250K).ok());

  setSuccessCode_(1);
  const std::array<std::uint8_t, 1> PAYLOAD{0x5A};
  injectRx_(0x7AB, 0x00, 1, PAYLOAD.data());

  const auto RES = session.receive(10);
  ASSERT_TRUE(RES.ok());
  EXPECT_EQ(RES.value().id, 0x7ABU);
  EXPECT_EQ(RES.value().data[0], 0x5A);
}

/* ----------------------------- Session Integration ----------------------------- */

/** @test Full lifecycle through a session on the fake driver */
TEST_F(CanApiTransportTest, SessionRoundTrip) {
  setPresent_(0x24); // channels 2 and 5
  CanApiTransport drv{CANHOST_FAKE_DRIVER_PATH};
  ChannelSession session{drv};

  EXPECT_EQ(session.scan(8), (std::vector<std::int32_t>{2, 5}));

  ASSERT_TRUE(session.open(5).ok());
  ASSERT_TRUE(session.start(BitrateIndex::INDEX_125K).ok());
  EXPECT_TRUE(session.send(0x321, std::array<std::uint8_t, 2>{0x10, 0x20}).ok());
  EXPECT_EQ(txCount_(), 1U);

  const std::array<std::uint8_t, 1> PAYLOAD{0x55};
  injectRx_(0x100, 0x00, 1, PAYLOAD.data());
  injectRx_(0x101, 0x00, 1, PAYLOAD.data());

  const auto RES = session.receive(10);
  ASSERT_TRUE(RES.ok());
  EXPECT_EQ(RES.value().id, 0x100U);

  const auto SUM = session.monitor(MonitorConfig::forDuration(std::chrono::milliseconds{50}),
                                   [](const CanFrame&) { return true; });
  EXPECT_EQ(SUM.frames, 1U);
  EXPECT_EQ(SUM.reason, MonitorStopReason::DURATION_ELAPSED);

  const auto RATE = session.getBitrate();
  ASSERT_TRUE(RATE.ok());
  EXPECT_DOUBLE_EQ(RATE.value().speed, 125000.0);

  EXPECT_TRUE(session.close().ok());
  EXPECT_TRUE(drv.probe(5, OpMode::defaults()).isAvailable());
}
