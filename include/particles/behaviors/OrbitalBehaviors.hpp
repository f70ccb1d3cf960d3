/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ORBITAL_BEHAVIORS_HPP
#define ORBITAL_BEHAVIORS_HPP

#include "particles/BehaviorTuning.hpp"
#include "particles/ParticleBehavior.hpp"

namespace AuraEngine {

/**
 * @brief Circles the origin at the radius it spawned at
 *
 * Each frame the orbit point advances by speed * dt and the particle is pulled
 * toward it with an exponential approach, so distance from the origin stays
 * close to the orbit radius.
 */
class OrbitingBehavior : public ParticleBehavior {
public:
  explicit OrbitingBehavior(const OrbitalTuning &tuning = OrbitalTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::Orbiting; }
  float getDecay() const override { return m_tuning.orbitDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  OrbitState &ensureState(Particle &particle, BehaviorContext &ctx) const;

  OrbitalTuning m_tuning;
};

/**
 * @brief Slow breathing orbit around the attractor point
 *
 * The attractor may move between frames; particles follow it.
 */
class MeditationSwirlBehavior : public ParticleBehavior {
public:
  explicit MeditationSwirlBehavior(const OrbitalTuning &tuning = OrbitalTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::MeditationSwirl; }
  float getDecay() const override { return m_tuning.swirlDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  SwirlState &ensureState(Particle &particle, BehaviorContext &ctx) const;

  OrbitalTuning m_tuning;
};

} // namespace AuraEngine

#endif // ORBITAL_BEHAVIORS_HPP
