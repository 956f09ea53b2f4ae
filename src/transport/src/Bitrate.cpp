/**
 * @file Bitrate.cpp
 * @brief Bit-rate preset table lookups and parsing.
 */

#include "src/transport/inc/Bitrate.hpp"

#include <cctype>
#include <charconv>
#include <limits>

#include <fmt/core.h>

namespace canhost {

namespace transport {

namespace {

/* ----------------------------- Preset Table ----------------------------- */

struct PresetEntry {
  BitrateIndex index;
  std::uint32_t bps;
  const char* name;
};

constexpr std::array<PresetEntry, 9> PRESET_TABLE{{
    {BitrateIndex::INDEX_1M, 1000000, "1M"},
    {BitrateIndex::INDEX_800K, 800000, "800K"},
    {BitrateIndex::INDEX_500K, 500000, "500K"},
    {BitrateIndex::INDEX_250K, 250000, "250K"},
    {BitrateIndex::INDEX_125K, 125000, "125K"},
    {BitrateIndex::INDEX_100K, 100000, "100K"},
    {BitrateIndex::INDEX_50K, 50000, "50K"},
    {BitrateIndex::INDEX_20K, 20000, "20K"},
    {BitrateIndex::INDEX_10K, 10000, "10K"},
}};

const PresetEntry* findPreset(std::int32_t selector) noexcept {
  for (const PresetEntry& ENTRY : PRESET_TABLE) {
    if (static_cast<std::int32_t>(ENTRY.index) == selector) {
      return &ENTRY;
    }
  }
  return nullptr;
}

/// Parse "<digits>K" / "<digits>M" (case-insensitive) into bit/s.
bool parseRateSuffix(std::string_view text, std::uint32_t& bps) noexcept {
  if (text.size() < 2) {
    return false;
  }

  const char UNIT = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
  std::uint32_t scale = 0;
  if (UNIT == 'K') {
    scale = 1000;
  } else if (UNIT == 'M') {
    scale = 1000000;
  } else {
    return false;
  }

  const std::string_view DIGITS = text.substr(0, text.size() - 1);
  std::uint32_t value = 0;
  const auto [PTR, EC] = std::from_chars(DIGITS.data(), DIGITS.data() + DIGITS.size(), value);
  if (EC != std::errc{} || PTR != DIGITS.data() + DIGITS.size()) {
    return false;
  }
  if (value > std::numeric_limits<std::uint32_t>::max() / scale) {
    return false;
  }

  bps = value * scale;
  return true;
}

} // namespace

/* ----------------------------- API ----------------------------- */

bool isValidBitrateIndex(std::int32_t selector) noexcept { return findPreset(selector) != nullptr; }

std::uint32_t bitsPerSecond(BitrateIndex index) noexcept {
  const PresetEntry* entry = findPreset(static_cast<std::int32_t>(index));
  return (entry != nullptr) ? entry->bps : 0;
}

const char* toString(BitrateIndex index) noexcept {
  const PresetEntry* entry = findPreset(static_cast<std::int32_t>(index));
  return (entry != nullptr) ? entry->name : "invalid";
}

bool parseBitrate(std::string_view text, BitrateIndex& out) noexcept {
  if (text.empty()) {
    return false;
  }

  // Raw index ("-2", "0")
  std::int32_t selector = 0;
  const auto [PTR, EC] = std::from_chars(text.data(), text.data() + text.size(), selector);
  if (EC == std::errc{} && PTR == text.data() + text.size()) {
    if (!isValidBitrateIndex(selector)) {
      return false;
    }
    out = static_cast<BitrateIndex>(selector);
    return true;
  }

  // Preset name ("500K", "1M", "1000k")
  std::uint32_t bps = 0;
  if (!parseRateSuffix(text, bps)) {
    return false;
  }
  for (const PresetEntry& ENTRY : PRESET_TABLE) {
    if (ENTRY.bps == bps) {
      out = ENTRY.index;
      return true;
    }
  }
  return false;
}

/* ----------------------------- BitTiming Methods ----------------------------- */

std::uint32_t BitTiming::quantaPerBit() const noexcept {
  if (tseg1 == 0 && tseg2 == 0) {
    return 0;
  }
  return 1U + tseg1 + tseg2;
}

/* ----------------------------- BitrateInfo Methods ----------------------------- */

bool BitrateInfo::isConfigured() const noexcept { return speed > 0.0; }

std::string BitrateInfo::toString() const {
  if (!isConfigured()) {
    return "not configured";
  }

  std::string out = fmt::format("{:.0f} kbit/s, SP {:.1f}%", speed / 1000.0, samplePoint * 100.0);
  if (timing.frequency > 0) {
    out += fmt::format(" (f={} Hz brp={} tseg1={} tseg2={} sjw={})", timing.frequency, timing.brp,
                       timing.tseg1, timing.tseg2, timing.sjw);
  }
  return out;
}

} // namespace transport

} // namespace canhost
