/**
 * @file Helpers_uTest.cpp
 * @brief Unit tests for argument parsing, hex formatting and log levels.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace args = canhost::helpers::args;
namespace hexfmt = canhost::helpers::format;
namespace logging = canhost::helpers::log;

/* ----------------------------- parseArgs ----------------------------- */

namespace {

enum : std::uint8_t { KEY_FLAG = 0, KEY_VALUE = 1, KEY_NEEDED = 2 };

args::ArgMap testMap(bool requireNeeded) {
  args::ArgMap map;
  map[KEY_FLAG] = {"--flag", 0, false, "A switch"};
  map[KEY_VALUE] = {"--value", 1, false, "One value"};
  map[KEY_NEEDED] = {"--needed", 1, requireNeeded, "Required value"};
  return map;
}

} // namespace

/** @test Empty input is valid when nothing is required */
TEST(ArgsTest, EmptyInput) {
  args::ParsedArgs pargs;
  EXPECT_TRUE(args::parseArgs({}, testMap(false), pargs));
  EXPECT_TRUE(pargs.empty());
}

/** @test Flags and values are captured */
TEST(ArgsTest, CapturesValues) {
  const std::vector<std::string_view> ARGV{"--flag", "--value", "-7", "--needed", "x"};
  args::ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(args::parseArgs(ARGV, testMap(true), pargs, error)) << error;
  EXPECT_TRUE(args::has(pargs, KEY_FLAG));
  EXPECT_EQ(args::value(pargs, KEY_VALUE), "-7");
  EXPECT_EQ(args::value(pargs, KEY_NEEDED), "x");
  EXPECT_EQ(args::value(pargs, 99, "fallback"), "fallback");
}

/** @test Missing required flag, missing value and unknown flags fail */
TEST(ArgsTest, Errors) {
  args::ParsedArgs pargs;
  std::string error;

  EXPECT_FALSE(args::parseArgs(std::vector<std::string_view>{"--flag"}, testMap(true), pargs,
                               error));
  EXPECT_NE(error.find("--needed"), std::string::npos);

  EXPECT_FALSE(args::parseArgs(std::vector<std::string_view>{"--value"}, testMap(false), pargs,
                               error));
  EXPECT_NE(error.find("--value"), std::string::npos);

  EXPECT_FALSE(args::parseArgs(std::vector<std::string_view>{"--bogus"}, testMap(false), pargs,
                               error));
  EXPECT_NE(error.find("--bogus"), std::string::npos);

  EXPECT_FALSE(args::parseArgs(std::vector<std::string_view>{"stray"}, testMap(false), pargs,
                               error));
}

/* ----------------------------- parseInt ----------------------------- */

/** @test Decimal, hex and negative values */
TEST(ArgsTest, ParseInt) {
  std::int32_t i = 0;
  EXPECT_TRUE(args::parseInt("42", i));
  EXPECT_EQ(i, 42);
  EXPECT_TRUE(args::parseInt("-8", i));
  EXPECT_EQ(i, -8);
  EXPECT_TRUE(args::parseInt("0x7FF", i));
  EXPECT_EQ(i, 0x7FF);
  EXPECT_TRUE(args::parseInt("-2147483648", i));
  EXPECT_EQ(i, INT32_MIN);

  std::uint32_t u = 0;
  EXPECT_TRUE(args::parseInt("0x1FFFFFFF", u));
  EXPECT_EQ(u, 0x1FFFFFFFU);
}

/** @test Out-of-range and malformed input leaves the output untouched */
TEST(ArgsTest, ParseIntRejects) {
  std::uint16_t u16 = 7;
  EXPECT_FALSE(args::parseInt("65536", u16));
  EXPECT_FALSE(args::parseInt("-1", u16));
  EXPECT_FALSE(args::parseInt("", u16));
  EXPECT_FALSE(args::parseInt("0x", u16));
  EXPECT_FALSE(args::parseInt("12ab", u16));
  EXPECT_EQ(u16, 7U);

  std::int32_t i = 3;
  EXPECT_FALSE(args::parseInt("-2147483649", i));
  EXPECT_EQ(i, 3);
}

/* ----------------------------- Format ----------------------------- */

/** @test Identifier width follows the frame format */
TEST(FormatTest, CanId) {
  EXPECT_EQ(hexfmt::canId(0x12, false), "0x012");
  EXPECT_EQ(hexfmt::canId(0x12, true), "0x00000012");
}

/** @test Bytes are upper-case, space separated */
TEST(FormatTest, HexBytes) {
  const std::array<std::uint8_t, 3> DATA{0xDE, 0x0A, 0xFF};
  EXPECT_EQ(hexfmt::hexBytes(DATA), "DE 0A FF");
  EXPECT_EQ(hexfmt::hexBytes({}), "");
}

/** @test Payload strings with and without separators */
TEST(FormatTest, ParseHexBytes) {
  std::vector<std::uint8_t> out;
  EXPECT_TRUE(hexfmt::parseHexBytes("DEADbeef", out));
  EXPECT_EQ(out, (std::vector<std::uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
  EXPECT_TRUE(hexfmt::parseHexBytes("11 22:33-44", out));
  EXPECT_EQ(out.size(), 4U);
  EXPECT_TRUE(hexfmt::parseHexBytes("", out));
  EXPECT_TRUE(out.empty());

  EXPECT_FALSE(hexfmt::parseHexBytes("ABC", out));
  EXPECT_FALSE(hexfmt::parseHexBytes("A BC", out));
  EXPECT_FALSE(hexfmt::parseHexBytes("zz", out));
}

/** @test JSON escaping of quotes, backslashes and control characters */
TEST(FormatTest, JsonEscape) {
  EXPECT_EQ(hexfmt::jsonEscape("Driver 1.0"), "Driver 1.0");
  EXPECT_EQ(hexfmt::jsonEscape("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(hexfmt::jsonEscape("C:\\drv"), "C:\\\\drv");
  EXPECT_EQ(hexfmt::jsonEscape("a\nb\tc"), "a\\nb\\tc");
  EXPECT_EQ(hexfmt::jsonEscape(std::string_view("\x01", 1)), "\\u0001");
  EXPECT_EQ(hexfmt::jsonEscape(""), "");
}

/* ----------------------------- Log ----------------------------- */

/** @test Level names parse and the threshold filters */
TEST(LogTest, Levels) {
  const logging::Level SAVED = logging::level();

  logging::Level lvl{};
  EXPECT_TRUE(logging::parseLevel("info", lvl));
  EXPECT_EQ(lvl, logging::Level::INFO);
  EXPECT_TRUE(logging::parseLevel("warning", lvl));
  EXPECT_EQ(lvl, logging::Level::WARN);
  EXPECT_FALSE(logging::parseLevel("verbose", lvl));

  logging::setLevel(logging::Level::WARN);
  EXPECT_TRUE(logging::enabled(logging::Level::ERROR));
  EXPECT_TRUE(logging::enabled(logging::Level::WARN));
  EXPECT_FALSE(logging::enabled(logging::Level::DEBUG));

  logging::setLevel(logging::Level::DEBUG);
  EXPECT_TRUE(logging::enabled(logging::Level::DEBUG));

  logging::setLevel(SAVED);
}
