/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLOR_UTILS_HPP
#define COLOR_UTILS_HPP

/**
 * @file ColorUtils.hpp
 * @brief Packed RGBA helpers shared by the spawner and the renderer
 *
 * Colors are packed as 0xRRGGBBAA, matching the particle color layout.
 */

#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace AuraEngine {

/**
 * @brief One palette entry with its relative selection weight
 */
struct WeightedColor {
  uint32_t color{0xFFFFFFFF};
  float weight{1.0f};
};

// Emotion palettes rarely exceed a handful of entries
using EmotionPalette = boost::container::small_vector<WeightedColor, 8>;

namespace ColorUtils {

constexpr uint32_t WHITE = 0xFFFFFFFF;

constexpr uint8_t red(uint32_t c) { return (c >> 24) & 0xFF; }
constexpr uint8_t green(uint32_t c) { return (c >> 16) & 0xFF; }
constexpr uint8_t blue(uint32_t c) { return (c >> 8) & 0xFF; }
constexpr uint8_t alpha(uint32_t c) { return c & 0xFF; }

constexpr uint32_t pack(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
  return (static_cast<uint32_t>(r) << 24) | (static_cast<uint32_t>(g) << 16) |
         (static_cast<uint32_t>(b) << 8) | static_cast<uint32_t>(a);
}

constexpr uint32_t withAlpha(uint32_t c, uint8_t a) {
  return (c & 0xFFFFFF00) | a;
}

/**
 * @brief Linear blend of two packed colors, factor clamped to [0, 1]
 */
uint32_t interpolateColor(uint32_t color1, uint32_t color2, float factor);

/**
 * @brief Scales HSL saturation of a color, keeping hue, lightness and alpha
 * @param multiplier Saturation factor; the result is clamped to [0, 1]
 */
uint32_t adjustSaturation(uint32_t color, float multiplier);

/**
 * @brief Applies adjustSaturation to every palette entry
 */
EmotionPalette applySaturation(const EmotionPalette &palette, float multiplier);

/**
 * @brief Weighted pick from a palette
 * @param unitRandom Uniform sample in [0, 1)
 * @param fallback Returned for an empty palette or all-zero weights
 */
uint32_t selectWeightedColor(const EmotionPalette &palette, float unitRandom,
                             uint32_t fallback = WHITE);

/**
 * @brief Parses "#RRGGBB", "RRGGBB" or "#RRGGBBAA"
 * @return Packed color, or std::nullopt for malformed input
 */
std::optional<uint32_t> parseHexColor(std::string_view hex);

} // namespace ColorUtils
} // namespace AuraEngine

#endif // COLOR_UTILS_HPP
