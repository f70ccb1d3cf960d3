/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticleBehavior.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace AuraEngine {

void ParticleBehavior::step(Particle &particle, float dt,
                            BehaviorContext &ctx) const {
  if (!(dt > 0.0f)) {
    return;
  }
  update(particle, dt, ctx);
  particle.velocity *= std::pow(getDecay(), dt);
}

float ParticleBehavior::approachFactor(float smoothing, float dt) {
  if (!(dt > 0.0f)) {
    return 0.0f;
  }
  const float s = std::clamp(smoothing, 0.0f, 0.999f);
  return 1.0f - std::pow(1.0f - s, dt);
}

void ParticleBehavior::trackTarget(Particle &particle, const Vector2D &target,
                                   float smoothing, float dt) {
  if (!(dt > 0.0f)) {
    return;
  }
  const float k = approachFactor(smoothing, dt);
  particle.velocity = (target - particle.position) * (k / dt);
}

Vector2D ParticleBehavior::outwardDirection(const Particle &particle,
                                            const Vector2D &center) {
  return (particle.position - center).normalized();
}

float ParticleBehavior::launchAngle(const SpawnPoint &spawn,
                                    const BehaviorContext &ctx) {
  if (spawn.angle && std::isfinite(*spawn.angle)) {
    return *spawn.angle;
  }
  const float dx = spawn.x - ctx.center.getX();
  const float dy = spawn.y - ctx.center.getY();
  if (dx * dx + dy * dy > 1.0f) {
    return std::atan2(dy, dx);
  }
  return std::uniform_real_distribution<float>(
      0.0f, 2.0f * std::numbers::pi_v<float>)(ctx.rng);
}

void ParticleBehavior::applyPalette(Particle &particle, BehaviorContext &ctx) {
  if (!ctx.palette.empty()) {
    particle.color =
        ColorUtils::selectWeightedColor(ctx.palette, ctx.unit(), particle.color);
  }
}

float ParticleBehavior::wrapAngle(float angle) {
  constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;
  const float wrapped = std::fmod(angle, TWO_PI);
  return wrapped < 0.0f ? wrapped + TWO_PI : wrapped;
}

} // namespace AuraEngine
