#ifndef CANHOST_HELPERS_ARGS_HPP
#define CANHOST_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the CAN tools.
 *
 * Fixed-arity parser: a matched flag consumes the next nargs tokens as its
 * values. Unknown "--" flags are rejected so typos do not silently fall back
 * to defaults. Numeric helpers accept decimal and 0x-prefixed hex.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <charconv>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace canhost {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--channel"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to flag definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/// Optional error message target.
using ErrorRef = std::optional<std::reference_wrapper<std::string>>;

namespace detail {

inline void setError(ErrorRef error, std::string msg) {
  if (error) {
    error->get() = std::move(msg);
  }
}

/// Split a leading "0x"/"0X" off a numeric token.
inline std::string_view stripHexPrefix(std::string_view text, int& base) noexcept {
  base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    base = 16;
    text.remove_prefix(2);
  }
  return text;
}

} // namespace detail

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse arguments according to a flag map.
 *
 * @param args   Argument list without the program name (views must outlive pargs).
 * @param map    Accepted flags.
 * @param pargs  Output values per key (entries are overwritten per key).
 * @param error  Optional error message target.
 * @return true on success. An empty argument list is valid.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, ErrorRef error = std::nullopt) {
  std::unordered_map<std::string_view, std::uint8_t> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, KV.first);
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (TOK.size() > 2 && TOK.substr(0, 2) == "--") {
        detail::setError(error, fmt::format("Unknown option '{}'", TOK));
        return false;
      }
      detail::setError(error, fmt::format("Unexpected argument '{}'", TOK));
      return false;
    }

    const std::uint8_t KEY = it->second;
    const ArgDef& DEF = map.at(KEY);

    if (i + static_cast<std::size_t>(DEF.nargs) >= N && DEF.nargs > 0) {
      detail::setError(error, fmt::format("Option '{}' expects {} value(s)", DEF.flag, DEF.nargs));
      return false;
    }

    auto& out = pargs[KEY];
    out.clear();
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      detail::setError(error, fmt::format("Missing required option '{}'", KV.second.flag));
      return false;
    }
  }

  return true;
}

/// @brief Collect argv[1..argc) as views.
[[nodiscard]] inline std::vector<std::string_view> toViews(int argc, char* argv[]) {
  std::vector<std::string_view> out;
  if (argc > 1) {
    out.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      out.emplace_back(argv[i]);
    }
  }
  return out;
}

/// @brief True if the flag was given.
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.find(key) != pargs.end();
}

/// @brief First value of a flag, or fallback when absent or valueless.
[[nodiscard]] inline std::string_view value(const ParsedArgs& pargs, std::uint8_t key,
                                            std::string_view fallback = {}) noexcept {
  auto it = pargs.find(key);
  if (it == pargs.end() || it->second.empty()) {
    return fallback;
  }
  return it->second.front();
}

/**
 * @brief Parse a signed integer (decimal, "0x" hex, optional leading '-').
 * @param text Token.
 * @param out Parsed value (untouched on failure).
 * @return true if the whole token was consumed and fits in T.
 */
template <typename T> [[nodiscard]] bool parseInt(std::string_view text, T& out) noexcept {
  static_assert(std::numeric_limits<T>::is_integer, "parseInt needs an integer type");

  bool negative = false;
  if (!text.empty() && text.front() == '-') {
    if (!std::numeric_limits<T>::is_signed) {
      return false;
    }
    negative = true;
    text.remove_prefix(1);
  }

  int base = 10;
  text = detail::stripHexPrefix(text, base);
  if (text.empty()) {
    return false;
  }

  std::uint64_t magnitude = 0;
  const char* end = text.data() + text.size();
  const auto RES = std::from_chars(text.data(), end, magnitude, base);
  if (RES.ec != std::errc{} || RES.ptr != end) {
    return false;
  }

  if constexpr (std::numeric_limits<T>::is_signed) {
    if (negative) {
      // |min| = max + 1
      const std::uint64_t LIMIT = static_cast<std::uint64_t>(std::numeric_limits<T>::max()) + 1;
      if (magnitude > LIMIT) {
        return false;
      }
      out = (magnitude == 0) ? T{0} : static_cast<T>(-static_cast<std::int64_t>(magnitude - 1) - 1);
      return true;
    }
  }

  if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
    return false;
  }
  out = static_cast<T>(magnitude);
  return true;
}

/* ----------------------------- Help ----------------------------- */

/**
 * @brief Print usage text generated from the flag map.
 * @param progName    Program name (typically argv[0]).
 * @param description One-line tool description.
 * @param map         Flags to document, printed sorted by name.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    std::string flagStr{def->flag};
    for (std::uint8_t k = 0; k < def->nargs; ++k) {
      flagStr += " <value>";
    }
    fmt::print("  {:<24}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace canhost

#endif // CANHOST_HELPERS_ARGS_HPP
