/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ColorUtils.hpp"
#include <algorithm>
#include <cmath>

namespace AuraEngine {
namespace ColorUtils {

namespace {

struct HSL {
  float h; // [0, 1)
  float s;
  float l;
};

HSL rgbToHsl(float r, float g, float b) {
  const float maxC = std::max({r, g, b});
  const float minC = std::min({r, g, b});
  const float l = (maxC + minC) * 0.5f;
  const float delta = maxC - minC;

  if (delta < 1e-6f) {
    return {0.0f, 0.0f, l};
  }

  const float s = l > 0.5f ? delta / (2.0f - maxC - minC) : delta / (maxC + minC);
  float h;
  if (maxC == r) {
    h = (g - b) / delta + (g < b ? 6.0f : 0.0f);
  } else if (maxC == g) {
    h = (b - r) / delta + 2.0f;
  } else {
    h = (r - g) / delta + 4.0f;
  }
  return {h / 6.0f, s, l};
}

float hueToChannel(float p, float q, float t) {
  if (t < 0.0f) t += 1.0f;
  if (t > 1.0f) t -= 1.0f;
  if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
  if (t < 0.5f) return q;
  if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
  return p;
}

uint8_t toByte(float v) {
  return static_cast<uint8_t>(std::clamp(std::lround(v * 255.0f), 0L, 255L));
}

int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

uint32_t interpolateColor(uint32_t color1, uint32_t color2, float factor) {
  const float f = std::isfinite(factor) ? std::clamp(factor, 0.0f, 1.0f) : 0.0f;

  auto lerp = [f](uint8_t a, uint8_t b) {
    return static_cast<uint8_t>(a + (static_cast<int>(b) - a) * f);
  };

  return pack(lerp(red(color1), red(color2)), lerp(green(color1), green(color2)),
              lerp(blue(color1), blue(color2)),
              lerp(alpha(color1), alpha(color2)));
}

uint32_t adjustSaturation(uint32_t color, float multiplier) {
  if (!std::isfinite(multiplier) || multiplier == 1.0f) {
    return color;
  }

  const HSL hsl = rgbToHsl(red(color) / 255.0f, green(color) / 255.0f,
                           blue(color) / 255.0f);
  const float s = std::clamp(hsl.s * multiplier, 0.0f, 1.0f);

  float r, g, b;
  if (s <= 0.0f) {
    r = g = b = hsl.l;
  } else {
    const float q = hsl.l < 0.5f ? hsl.l * (1.0f + s) : hsl.l + s - hsl.l * s;
    const float p = 2.0f * hsl.l - q;
    r = hueToChannel(p, q, hsl.h + 1.0f / 3.0f);
    g = hueToChannel(p, q, hsl.h);
    b = hueToChannel(p, q, hsl.h - 1.0f / 3.0f);
  }

  return pack(toByte(r), toByte(g), toByte(b), alpha(color));
}

EmotionPalette applySaturation(const EmotionPalette &palette, float multiplier) {
  EmotionPalette result;
  result.reserve(palette.size());
  for (const auto &entry : palette) {
    result.push_back({adjustSaturation(entry.color, multiplier), entry.weight});
  }
  return result;
}

uint32_t selectWeightedColor(const EmotionPalette &palette, float unitRandom,
                             uint32_t fallback) {
  float total = 0.0f;
  for (const auto &entry : palette) {
    if (entry.weight > 0.0f && std::isfinite(entry.weight)) {
      total += entry.weight;
    }
  }
  if (total <= 0.0f) {
    return fallback;
  }

  float target = std::clamp(unitRandom, 0.0f, 1.0f) * total;
  for (const auto &entry : palette) {
    if (!(entry.weight > 0.0f) || !std::isfinite(entry.weight)) {
      continue;
    }
    if (target < entry.weight) {
      return entry.color;
    }
    target -= entry.weight;
  }

  // unitRandom == 1 lands past the last bucket
  for (auto it = palette.rbegin(); it != palette.rend(); ++it) {
    if (it->weight > 0.0f && std::isfinite(it->weight)) {
      return it->color;
    }
  }
  return fallback;
}

std::optional<uint32_t> parseHexColor(std::string_view hex) {
  if (!hex.empty() && hex.front() == '#') {
    hex.remove_prefix(1);
  }
  if (hex.size() != 6 && hex.size() != 8) {
    return std::nullopt;
  }

  uint32_t value = 0;
  for (char c : hex) {
    const int digit = hexDigit(c);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4) | static_cast<uint32_t>(digit);
  }

  if (hex.size() == 6) {
    value = (value << 8) | 0xFF;
  }
  return value;
}

} // namespace ColorUtils
} // namespace AuraEngine
