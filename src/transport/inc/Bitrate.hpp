#ifndef CANHOST_TRANSPORT_BITRATE_HPP
#define CANHOST_TRANSPORT_BITRATE_HPP
/**
 * @file Bitrate.hpp
 * @brief Bit-rate preset table and active bit-timing report.
 * @note Thread-safe: All functions are stateless.
 *
 * Bit rates are selected by index into the driver's preset table, never by a
 * raw baud value. Index 0 is 1 Mbit/s and each step down selects the next
 * slower preset, ending at -8 (10 kbit/s).
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace canhost {

namespace transport {

/* ----------------------------- BitrateIndex ----------------------------- */

/**
 * @brief Bit-rate preset selector.
 */
enum class BitrateIndex : std::int32_t {
  INDEX_1M = 0,    ///< 1000 kbit/s
  INDEX_800K = -1, ///< 800 kbit/s
  INDEX_500K = -2, ///< 500 kbit/s
  INDEX_250K = -3, ///< 250 kbit/s
  INDEX_125K = -4, ///< 125 kbit/s
  INDEX_100K = -5, ///< 100 kbit/s
  INDEX_50K = -6,  ///< 50 kbit/s
  INDEX_20K = -7,  ///< 20 kbit/s
  INDEX_10K = -8,  ///< 10 kbit/s
};

/// All presets, fastest first.
inline constexpr std::array<BitrateIndex, 9> BITRATE_PRESETS{
    BitrateIndex::INDEX_1M,   BitrateIndex::INDEX_800K, BitrateIndex::INDEX_500K,
    BitrateIndex::INDEX_250K, BitrateIndex::INDEX_125K, BitrateIndex::INDEX_100K,
    BitrateIndex::INDEX_50K,  BitrateIndex::INDEX_20K,  BitrateIndex::INDEX_10K,
};

/// @brief Check a raw selector against the preset table.
/// @param selector Signed index.
/// @return true if selector is one of 0..-8.
[[nodiscard]] bool isValidBitrateIndex(std::int32_t selector) noexcept;

/// @brief Bit rate in bit/s for a preset, 0 for invalid selectors.
[[nodiscard]] std::uint32_t bitsPerSecond(BitrateIndex index) noexcept;

/// @brief Convert BitrateIndex to string.
/// @return Short name (e.g., "500K"), "invalid" for unknown selectors.
[[nodiscard]] const char* toString(BitrateIndex index) noexcept;

/**
 * @brief Parse a bit-rate preset from text.
 * @param text Preset name ("1M", "1000K", "500K", "500k", ...) or raw
 *             index ("-2", "0").
 * @param out Parsed selector (untouched on failure).
 * @return true if text names a preset in the table.
 */
[[nodiscard]] bool parseBitrate(std::string_view text, BitrateIndex& out) noexcept;

/* ----------------------------- BitTiming ----------------------------- */

/**
 * @brief Controller timing registers reported by the driver.
 */
struct BitTiming {
  std::int32_t frequency{0}; ///< Controller clock in Hz
  std::uint16_t brp{0};      ///< Bit-rate prescaler
  std::uint16_t tseg1{0};    ///< Time segment 1
  std::uint16_t tseg2{0};    ///< Time segment 2
  std::uint16_t sjw{0};      ///< Synchronization jump width
  std::uint8_t sam{0};       ///< Sampling mode (0 = single, 1 = triple)

  /// @brief Time quanta per bit (1 + tseg1 + tseg2), 0 if not reported.
  [[nodiscard]] std::uint32_t quantaPerBit() const noexcept;
};

/* ----------------------------- BitrateInfo ----------------------------- */

/**
 * @brief Active bit rate as reported by the driver.
 */
struct BitrateInfo {
  BitTiming timing{};      ///< Nominal timing registers
  double speed{0.0};       ///< Nominal bit rate in bit/s
  double samplePoint{0.0}; ///< Sample point as fraction (0.875 = 87.5%)

  /// @brief True if the driver reported a non-zero speed.
  [[nodiscard]] bool isConfigured() const noexcept;

  /// @brief Human-readable summary, e.g. "500 kbit/s, SP 87.5%".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

} // namespace transport

} // namespace canhost

#endif // CANHOST_TRANSPORT_BITRATE_HPP
