/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/behaviors/OrbitalBehaviors.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace AuraEngine {

namespace {

float angleFrom(const Vector2D &center, const Vector2D &point) {
  const Vector2D d = point - center;
  return d.lengthSquared() > 0.0f ? std::atan2(d.getY(), d.getX()) : 0.0f;
}

} // namespace

void OrbitingBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                                  [[maybe_unused]] const SpawnPoint &spawn) {
  applyPalette(particle, ctx);
  particle.behaviorState = std::monostate{};
  ensureState(particle, ctx);
  particle.velocity = Vector2D();
  particle.lifeDecay =
      ctx.random(m_tuning.orbitLifeDecayMin, m_tuning.orbitLifeDecayMax);
}

OrbitState &OrbitingBehavior::ensureState(Particle &particle,
                                          BehaviorContext &ctx) const {
  if (auto *state = std::get_if<OrbitState>(&particle.behaviorState)) {
    return *state;
  }

  // Also reached when a gesture override switches a particle to orbiting
  OrbitState state;
  state.angle = angleFrom(ctx.center, particle.position);
  state.radius = std::max(m_tuning.orbitMinRadius,
                          Vector2D::distance(ctx.center, particle.position));
  state.speed = ctx.random(m_tuning.orbitSpeedMin, m_tuning.orbitSpeedMax);
  if (ctx.chance(0.5f)) {
    state.speed = -state.speed;
  }
  return particle.behaviorState.emplace<OrbitState>(state);
}

void OrbitingBehavior::update(Particle &particle, float dt,
                              BehaviorContext &ctx) const {
  OrbitState &orbit = ensureState(particle, ctx);
  orbit.angle = wrapAngle(orbit.angle + orbit.speed * dt);

  const Vector2D target = ctx.center + Vector2D::fromAngle(orbit.angle, orbit.radius);
  trackTarget(particle, target, m_tuning.orbitSmoothing, dt);
}

void MeditationSwirlBehavior::initialize(Particle &particle,
                                         BehaviorContext &ctx,
                                         const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  SwirlState state;
  state.angle = spawn.angle.value_or(angleFrom(ctx.attractor, particle.position));
  state.radius = ctx.random(m_tuning.swirlRadiusMin, m_tuning.swirlRadiusMax);
  state.speed = ctx.random(m_tuning.swirlSpeedMin, m_tuning.swirlSpeedMax);
  state.breathPhase = ctx.random(0.0f, 2.0f * std::numbers::pi_v<float>);
  particle.behaviorState = state;

  particle.velocity = Vector2D();
  particle.lifeDecay = m_tuning.swirlLifeDecay;
}

SwirlState &MeditationSwirlBehavior::ensureState(Particle &particle,
                                                 BehaviorContext &ctx) const {
  if (auto *state = std::get_if<SwirlState>(&particle.behaviorState)) {
    return *state;
  }

  SwirlState state;
  state.angle = angleFrom(ctx.attractor, particle.position);
  state.radius = std::clamp(Vector2D::distance(ctx.attractor, particle.position),
                            m_tuning.swirlRadiusMin, m_tuning.swirlRadiusMax);
  state.speed = ctx.random(m_tuning.swirlSpeedMin, m_tuning.swirlSpeedMax);
  return particle.behaviorState.emplace<SwirlState>(state);
}

void MeditationSwirlBehavior::update(Particle &particle, float dt,
                                     BehaviorContext &ctx) const {
  SwirlState &swirl = ensureState(particle, ctx);
  swirl.angle = wrapAngle(swirl.angle + swirl.speed * dt);
  swirl.breathPhase = wrapAngle(swirl.breathPhase + m_tuning.swirlBreathRate * dt);

  const float radius =
      swirl.radius * (1.0f + m_tuning.swirlBreathDepth * std::sin(swirl.breathPhase));
  const Vector2D target = ctx.attractor + Vector2D::fromAngle(swirl.angle, radius);
  trackTarget(particle, target, m_tuning.swirlSmoothing, dt);
}

} // namespace AuraEngine
