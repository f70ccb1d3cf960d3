/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/behaviors/RadialBehaviors.hpp"

namespace AuraEngine {

void BurstBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                               const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  const float speed = ctx.random(m_tuning.burstSpeedMin, m_tuning.burstSpeedMax);
  particle.velocity = Vector2D::fromAngle(launchAngle(spawn, ctx), speed);
  particle.lifeDecay =
      ctx.random(m_tuning.burstLifeDecayMin, m_tuning.burstLifeDecayMax);
}

// Pure ballistic motion; decay does the work
void BurstBehavior::update([[maybe_unused]] Particle &particle,
                           [[maybe_unused]] float dt,
                           [[maybe_unused]] BehaviorContext &ctx) const {}

void ScatteringBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                                    const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  const float speed = ctx.random(m_tuning.scatterSpeedMin, m_tuning.scatterSpeedMax);
  particle.velocity = Vector2D::fromAngle(launchAngle(spawn, ctx), speed);
  particle.lifeDecay = m_tuning.scatterLifeDecay;
}

void ScatteringBehavior::update(Particle &particle, float dt,
                                BehaviorContext &ctx) const {
  particle.velocity +=
      outwardDirection(particle, ctx.center) * (m_tuning.scatterAcceleration * dt);
}

void RepellingBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                                   const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  const float speed = ctx.random(m_tuning.repelSpeedMin, m_tuning.repelSpeedMax);
  particle.velocity = Vector2D::fromAngle(launchAngle(spawn, ctx), speed);
  particle.lifeDecay = m_tuning.repelLifeDecay;
}

void RepellingBehavior::update(Particle &particle, float dt,
                               BehaviorContext &ctx) const {
  particle.velocity +=
      outwardDirection(particle, ctx.center) * (m_tuning.repelAcceleration * dt);
}

void RepellingBehavior::enforceInvariants(Particle &particle,
                                          const BehaviorContext &ctx) const {
  const Vector2D radial = particle.position - ctx.center;
  const float radialSq = radial.lengthSquared();
  if (radialSq <= 0.0f) {
    return;
  }

  const float inward = particle.velocity.dot(radial);
  if (inward >= 0.0f) {
    return;
  }

  // Keep the tangential part only
  particle.velocity -= radial * (inward / radialSq);

  // Rounding can leave a residue of the wrong sign
  if (particle.velocity.dot(radial) < 0.0f) {
    particle.velocity = Vector2D();
  }
}

} // namespace AuraEngine
