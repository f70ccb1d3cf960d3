/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/behaviors/DriftBehaviors.hpp"

namespace AuraEngine {

void AmbientBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                                 const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  const float speed = ctx.random(m_tuning.ambientSpeedMin, m_tuning.ambientSpeedMax);
  particle.velocity = Vector2D::fromAngle(launchAngle(spawn, ctx), speed);
  particle.lifeDecay =
      ctx.random(m_tuning.ambientLifeDecayMin, m_tuning.ambientLifeDecayMax);
}

void AmbientBehavior::update(Particle &particle, float dt,
                             BehaviorContext &ctx) const {
  const float w = m_tuning.ambientWander * dt;
  particle.velocity += Vector2D(ctx.random(-w, w), ctx.random(-w, w));
}

void RestingBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                                 const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  const float speed = ctx.random(m_tuning.restingSpeedMin, m_tuning.restingSpeedMax);
  particle.velocity = Vector2D::fromAngle(launchAngle(spawn, ctx), speed);
  particle.lifeDecay =
      ctx.random(m_tuning.restingLifeDecayMin, m_tuning.restingLifeDecayMax);
}

void RestingBehavior::update(Particle &particle, float dt,
                             BehaviorContext &ctx) const {
  const float w = m_tuning.restingWander * dt;
  particle.velocity += Vector2D(ctx.random(-w, w), ctx.random(-w, w));
}

VerticalDriftBehavior::VerticalDriftBehavior(BehaviorType type,
                                             const DriftTuning &tuning)
    : m_type(type),
      m_direction(type == BehaviorType::Rising ? -1.0f : 1.0f),
      m_tuning(tuning) {}

void VerticalDriftBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                                       [[maybe_unused]] const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  const float spread = m_tuning.lateralSpread;
  particle.velocity = Vector2D(
      ctx.random(-spread, spread),
      m_direction * ctx.random(m_tuning.verticalSpeedMin, m_tuning.verticalSpeedMax));
  particle.lifeDecay =
      ctx.random(m_tuning.verticalLifeDecayMin, m_tuning.verticalLifeDecayMax);
}

void VerticalDriftBehavior::update(Particle &particle, float dt,
                                   [[maybe_unused]] BehaviorContext &ctx) const {
  particle.velocity += Vector2D(0.0f, m_direction * m_tuning.verticalAcceleration * dt);
}

} // namespace AuraEngine
