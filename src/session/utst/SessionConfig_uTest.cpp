/**
 * @file SessionConfig_uTest.cpp
 * @brief Unit tests for session settings and the shared tool flags.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/session/inc/SessionArgs.hpp"
#include "src/session/inc/SessionConfig.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

using canhost::session::addSessionArgs;
using canhost::session::applySessionArgs;
using canhost::session::DEFAULT_POLL_INTERVAL;
using canhost::session::DEFAULT_SCAN_LIMIT;
using canhost::session::MAX_SCAN_LIMIT;
using canhost::session::SessionConfig;
using canhost::transport::BitrateIndex;

namespace args = canhost::helpers::args;
namespace logging = canhost::helpers::log;

using namespace std::chrono_literals;

/* ----------------------------- Presets ----------------------------- */

/** @test Defaults match the Kvaser driver and 250 kbit/s */
TEST(SessionConfigTest, Defaults) {
  const SessionConfig CFG = SessionConfig::defaults();
  EXPECT_EQ(CFG.libraryPath, "libuvcankvl.so.1");
  EXPECT_EQ(CFG.channel, 0);
  EXPECT_FALSE(CFG.monitorMode);
  EXPECT_EQ(CFG.bitrate, BitrateIndex::INDEX_250K);
  EXPECT_EQ(CFG.txTimeoutMs, 0U);
  EXPECT_EQ(CFG.rxTimeoutMs, 1000U);
  EXPECT_EQ(CFG.scanLimit, DEFAULT_SCAN_LIMIT);
  EXPECT_EQ(CFG.pollInterval, DEFAULT_POLL_INTERVAL);
  EXPECT_EQ(CFG.monitorDuration, 30s);

  std::string error;
  EXPECT_TRUE(CFG.validate(error)) << error;
}

/** @test Listen-only preset sets monitor mode */
TEST(SessionConfigTest, ListenOnly) {
  const SessionConfig CFG = SessionConfig::listenOnly();
  EXPECT_TRUE(CFG.monitorMode);
  EXPECT_EQ(CFG.txTimeoutMs, 0U);
}

/* ----------------------------- Validation ----------------------------- */

/** @test Each invalid field is reported */
TEST(SessionConfigTest, ValidateRejectsBadFields) {
  std::string error;

  SessionConfig cfg{};
  cfg.libraryPath.clear();
  EXPECT_FALSE(cfg.validate(error));
  EXPECT_FALSE(error.empty());

  cfg = SessionConfig{};
  cfg.channel = -1;
  EXPECT_FALSE(cfg.validate(error));
  EXPECT_NE(error.find("Channel"), std::string::npos);

  cfg = SessionConfig{};
  cfg.bitrate = static_cast<BitrateIndex>(-12);
  EXPECT_FALSE(cfg.validate(error));

  cfg = SessionConfig{};
  cfg.scanLimit = 0;
  EXPECT_FALSE(cfg.validate(error));
  cfg.scanLimit = MAX_SCAN_LIMIT + 1;
  EXPECT_FALSE(cfg.validate(error));
  cfg.scanLimit = MAX_SCAN_LIMIT;
  EXPECT_TRUE(cfg.validate(error));

  cfg = SessionConfig{};
  cfg.pollInterval = 0ms;
  EXPECT_FALSE(cfg.validate(error));

  cfg = SessionConfig{};
  cfg.monitorDuration = -1ms;
  EXPECT_FALSE(cfg.validate(error));
}

/** @test Summary names the key settings */
TEST(SessionConfigTest, ToString) {
  const std::string TEXT = SessionConfig::defaults().toString();
  EXPECT_NE(TEXT.find("libuvcankvl.so.1"), std::string::npos);
  EXPECT_NE(TEXT.find("channel=0"), std::string::npos);
  EXPECT_NE(TEXT.find("bitrate=250K"), std::string::npos);
}

/* ----------------------------- Shared Flags ----------------------------- */

namespace {

bool parseAndApply(const std::vector<std::string_view>& argv, SessionConfig& cfg,
                   std::string& error) {
  args::ArgMap map;
  addSessionArgs(map);
  args::ParsedArgs pargs;
  if (!args::parseArgs(argv, map, pargs, error)) {
    return false;
  }
  return applySessionArgs(pargs, cfg, error);
}

} // namespace

/** @test No flags keeps the defaults */
TEST(SessionArgsTest, EmptyKeepsDefaults) {
  SessionConfig cfg{};
  std::string error;
  EXPECT_TRUE(parseAndApply({}, cfg, error)) << error;
  EXPECT_EQ(cfg.channel, 0);
  EXPECT_EQ(cfg.bitrate, BitrateIndex::INDEX_250K);
}

/** @test All shared flags apply */
TEST(SessionArgsTest, AppliesFlags) {
  SessionConfig cfg{};
  std::string error;
  const logging::Level SAVED = logging::level();

  EXPECT_TRUE(parseAndApply({"--library", "/opt/lib/libfake.so", "--channel", "2", "--bitrate",
                             "500K", "--monitor-mode", "--log-level", "debug"},
                            cfg, error))
      << error;
  EXPECT_EQ(cfg.libraryPath, "/opt/lib/libfake.so");
  EXPECT_EQ(cfg.channel, 2);
  EXPECT_EQ(cfg.bitrate, BitrateIndex::INDEX_500K);
  EXPECT_TRUE(cfg.monitorMode);
  EXPECT_EQ(logging::level(), logging::Level::DEBUG);

  logging::setLevel(SAVED);
}

/** @test Bit rate accepts a raw index */
TEST(SessionArgsTest, RawBitrateIndex) {
  SessionConfig cfg{};
  std::string error;
  EXPECT_TRUE(parseAndApply({"--bitrate", "-8"}, cfg, error)) << error;
  EXPECT_EQ(cfg.bitrate, BitrateIndex::INDEX_10K);
}

/** @test Bad values are rejected with a message */
TEST(SessionArgsTest, RejectsBadValues) {
  std::string error;

  SessionConfig cfg{};
  EXPECT_FALSE(parseAndApply({"--bitrate", "333K"}, cfg, error));
  EXPECT_NE(error.find("333K"), std::string::npos);

  cfg = SessionConfig{};
  EXPECT_FALSE(parseAndApply({"--channel", "abc"}, cfg, error));

  cfg = SessionConfig{};
  EXPECT_FALSE(parseAndApply({"--channel", "-3"}, cfg, error));

  cfg = SessionConfig{};
  EXPECT_FALSE(parseAndApply({"--log-level", "loud"}, cfg, error));

  cfg = SessionConfig{};
  EXPECT_FALSE(parseAndApply({"--chanel", "1"}, cfg, error));
  EXPECT_NE(error.find("--chanel"), std::string::npos);
}
