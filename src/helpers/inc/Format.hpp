#ifndef CANHOST_HELPERS_FORMAT_HPP
#define CANHOST_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Formatting and parsing helpers for CAN identifiers and payloads.
 *
 * Provides consistent hex formatting across CLI tools and diagnostic output.
 * Uses fmt library for string formatting.
 *
 * @note NOT RT-SAFE: Formatting functions return std::string (heap allocation).
 *       Use only in cold paths (CLI output, logging, etc.).
 */

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

namespace canhost {
namespace helpers {
namespace format {

/* ----------------------------- Formatting ----------------------------- */

/**
 * @brief Format a CAN identifier.
 * @param id Identifier value.
 * @param extended True for 29-bit identifiers.
 * @return "0x123" (3 digits) or "0x1234ABCD" (8 digits).
 * @note NOT RT-SAFE: Returns std::string.
 */
[[nodiscard]] inline std::string canId(std::uint32_t id, bool extended) {
  if (extended) {
    return fmt::format("0x{:08X}", id);
  }
  return fmt::format("0x{:03X}", id);
}

/**
 * @brief Format bytes as space-separated upper-case hex pairs.
 * @param bytes Bytes to format.
 * @return Formatted string (e.g., "DE AD BE EF"), empty for no bytes.
 * @note NOT RT-SAFE: Returns std::string.
 */
[[nodiscard]] inline std::string hexBytes(std::span<const std::uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 3);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    fmt::format_to(std::back_inserter(out), "{:02X}", bytes[i]);
  }
  return out;
}

/**
 * @brief Escape text for use inside a JSON string literal.
 * @param text Raw text (e.g., a driver version string).
 * @return Text with quotes, backslashes and control characters escaped.
 *         Surrounding quotes are not added.
 * @note NOT RT-SAFE: Returns std::string.
 */
[[nodiscard]] inline std::string jsonEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char C : text) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(C));
      } else {
        out.push_back(C);
      }
    }
  }
  return out;
}

/* ----------------------------- Parsing ----------------------------- */

namespace detail {

/// Hex digit value, or -1 for non-hex characters.
[[nodiscard]] constexpr int hexValue(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace detail

/**
 * @brief Parse a hex payload string.
 * @param text Hex digits, optionally separated by ' ', ':', ',', '.' or '-'
 *             (e.g., "DEADBEEF", "de:ad:be:ef", "11 22 33").
 * @param out Parsed bytes (cleared first).
 * @return true on success; false on an odd digit count or a non-hex character.
 *
 * Length is not limited here; frame construction truncates to 8 bytes.
 */
[[nodiscard]] inline bool parseHexBytes(std::string_view text, std::vector<std::uint8_t>& out) {
  out.clear();

  int high = -1;
  for (const char C : text) {
    if (C == ' ' || C == ':' || C == ',' || C == '.' || C == '-') {
      if (high >= 0) {
        return false; // separator inside a byte
      }
      continue;
    }

    const int VAL = detail::hexValue(C);
    if (VAL < 0) {
      return false;
    }

    if (high < 0) {
      high = VAL;
    } else {
      out.push_back(static_cast<std::uint8_t>((high << 4) | VAL));
      high = -1;
    }
  }

  return high < 0;
}

} // namespace format
} // namespace helpers
} // namespace canhost

#endif // CANHOST_HELPERS_FORMAT_HPP
