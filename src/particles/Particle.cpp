/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/Particle.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace AuraEngine {

namespace {

constexpr std::array<const char *, static_cast<size_t>(BehaviorType::COUNT)>
    BEHAVIOR_NAMES{{"ambient", "rising", "falling", "burst", "orbiting",
                    "scattering", "repelling", "aggressive", "glitchy", "spaz",
                    "resting", "meditation_swirl"}};

bool repairScalar(float &value, float replacement) {
  if (std::isfinite(value)) {
    return false;
  }
  value = replacement;
  return true;
}

} // namespace

const char *behaviorTypeToString(BehaviorType type) {
  const auto index = static_cast<size_t>(type);
  if (index >= BEHAVIOR_NAMES.size()) {
    return "ambient";
  }
  return BEHAVIOR_NAMES[index];
}

std::optional<BehaviorType> parseBehaviorType(std::string_view name) {
  for (size_t i = 0; i < BEHAVIOR_NAMES.size(); ++i) {
    if (name == BEHAVIOR_NAMES[i]) {
      return static_cast<BehaviorType>(i);
    }
  }
  return std::nullopt;
}

BehaviorType behaviorTypeFromString(std::string_view name) {
  return parseBehaviorType(name).value_or(BehaviorType::Ambient);
}

void Particle::reset(float x, float y, BehaviorType type, float scale,
                     float sizeMult) {
  position = Vector2D(x, y);
  velocity = Vector2D(0.0f, 0.0f);
  z = 0.0f;

  life = 1.0f;
  maxLife = 1.0f;
  lifeDecay = 0.01f;
  age = 0.0f;
  fadeInTime = 0.15f;
  fadeOutTime = 0.3f;

  scaleFactor = std::isfinite(scale) && scale > 0.0f ? scale : 1.0f;
  sizeMultiplier = std::isfinite(sizeMult) && sizeMult > 0.0f ? sizeMult : 1.0f;
  size = 4.0f * scaleFactor * sizeMultiplier;
  baseSize = size;
  opacity = 0.0f;
  baseOpacity = 0.5f;
  color = 0xFFFFFFFF;
  hasGlow = false;
  glowSizeMultiplier = 0.0f;
  isCellShaded = false;

  behavior = type;
  gestureBehavior = 0;
  behaviorState = std::monostate{};
  cachedGradient.reset();
  cachedGradientKey = 0;
}

void Particle::randomizeTraits(std::mt19937 &rng) {
  std::uniform_real_distribution<float> unit(0.0f, 1.0f);

  // 4-10 px before scaling
  size = (4.0f + unit(rng) * 6.0f) * scaleFactor * sizeMultiplier;
  baseSize = size;

  // 30-70% peak opacity keeps the field ethereal
  baseOpacity = 0.3f + unit(rng) * 0.4f;

  z = unit(rng) * 2.0f - 1.0f;

  // A third of particles glow, a third are cell shaded
  hasGlow = unit(rng) < 0.333f;
  glowSizeMultiplier = hasGlow ? 1.33f + unit(rng) * 0.33f : 0.0f;
  isCellShaded = unit(rng) < 0.333f;
}

void Particle::clearTransient() {
  behaviorState = std::monostate{};
  cachedGradient.reset();
  cachedGradientKey = 0;
  gestureBehavior = 0;
}

void Particle::updateLifecycle(float dt) {
  if (dt > 0.0f) {
    life = std::max(0.0f, life - lifeDecay * dt);
  }
  age = maxLife > 0.0f ? std::clamp(1.0f - getLifeRatio(), 0.0f, 1.0f) : 1.0f;
  updateOpacity();
}

void Particle::updateOpacity() {
  float lifeFactor = 1.0f;
  const float fadeOutLife = fadeOutTime * maxLife;

  if (age < fadeInTime && fadeInTime > 0.0f) {
    lifeFactor = age / fadeInTime;
  } else if (life < fadeOutLife && fadeOutLife > 0.0f) {
    lifeFactor = life / fadeOutLife;
  }

  opacity = baseOpacity * std::clamp(lifeFactor, 0.0f, 1.0f);
}

int Particle::sanitize(const Vector2D &fallbackPosition) {
  int repaired = 0;

  if (!position.isFinite()) {
    position = fallbackPosition.isFinite() ? fallbackPosition : Vector2D();
    velocity = Vector2D();
    ++repaired;
  }
  if (!velocity.isFinite()) {
    velocity = Vector2D();
    ++repaired;
  }

  repaired += repairScalar(z, 0.0f);
  repaired += repairScalar(baseSize, 4.0f * scaleFactor * sizeMultiplier);
  repaired += repairScalar(size, baseSize);
  repaired += repairScalar(opacity, 0.0f);
  repaired += repairScalar(age, 1.0f);
  // A particle whose life is unknown is retired on the next cull
  repaired += repairScalar(life, 0.0f);

  if (auto *orbit = std::get_if<OrbitState>(&behaviorState)) {
    repaired += repairScalar(orbit->angle, 0.0f);
    repaired += repairScalar(orbit->radius, 0.0f);
  } else if (auto *swirl = std::get_if<SwirlState>(&behaviorState)) {
    repaired += repairScalar(swirl->angle, 0.0f);
    repaired += repairScalar(swirl->radius, 0.0f);
    repaired += repairScalar(swirl->breathPhase, 0.0f);
  } else if (auto *glitch = std::get_if<GlitchState>(&behaviorState)) {
    repaired += repairScalar(glitch->orbit.angle, 0.0f);
    repaired += repairScalar(glitch->beatPhase, 0.0f);
    repaired += repairScalar(glitch->rgbPhase, 0.0f);
    repaired += repairScalar(glitch->dropIntensity, 0.0f);
  }

  return repaired;
}

} // namespace AuraEngine
