/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RADIAL_BEHAVIORS_HPP
#define RADIAL_BEHAVIORS_HPP

#include "particles/BehaviorTuning.hpp"
#include "particles/ParticleBehavior.hpp"

namespace AuraEngine {

// Fast one-shot outward launch with strong decay and short life
class BurstBehavior : public ParticleBehavior {
public:
  explicit BurstBehavior(const RadialTuning &tuning = RadialTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::Burst; }
  float getDecay() const override { return m_tuning.burstDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  RadialTuning m_tuning;
};

// Outward radial acceleration from the origin
class ScatteringBehavior : public ParticleBehavior {
public:
  explicit ScatteringBehavior(const RadialTuning &tuning = RadialTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::Scattering; }
  float getDecay() const override { return m_tuning.scatterDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  RadialTuning m_tuning;
};

/**
 * @brief Outward radial acceleration that never moves back toward the origin
 *
 * enforceInvariants() removes any inward radial velocity component, so
 * dot(position - center, velocity) >= 0 holds after every update.
 */
class RepellingBehavior : public ParticleBehavior {
public:
  explicit RepellingBehavior(const RadialTuning &tuning = RadialTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  void enforceInvariants(Particle &particle,
                         const BehaviorContext &ctx) const override;
  BehaviorType getType() const override { return BehaviorType::Repelling; }
  float getDecay() const override { return m_tuning.repelDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  RadialTuning m_tuning;
};

} // namespace AuraEngine

#endif // RADIAL_BEHAVIORS_HPP
