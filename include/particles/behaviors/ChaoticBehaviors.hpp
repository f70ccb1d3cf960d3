/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHAOTIC_BEHAVIORS_HPP
#define CHAOTIC_BEHAVIORS_HPP

#include "particles/BehaviorTuning.hpp"
#include "particles/ParticleBehavior.hpp"

namespace AuraEngine {

// Random kicks every frame on top of a fast launch
class AggressiveBehavior : public ParticleBehavior {
public:
  explicit AggressiveBehavior(const ChaoticTuning &tuning = ChaoticTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::Aggressive; }
  float getDecay() const override { return m_tuning.aggressiveDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  ChaoticTuning m_tuning;
};

// Larger kicks plus random direction reversals
class SpazBehavior : public ParticleBehavior {
public:
  explicit SpazBehavior(const ChaoticTuning &tuning = ChaoticTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::Spaz; }
  float getDecay() const override { return m_tuning.spazDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  ChaoticTuning m_tuning;
};

/**
 * @brief Elliptical orbit interrupted by digital glitches
 *
 * The stutter timer freezes the particle and may jump it on release. The
 * glitch timer offsets the orbit target for a short window. Beat phase drives
 * periodic drops and the size pulse. Timers are milliseconds.
 */
class GlitchyBehavior : public ParticleBehavior {
public:
  explicit GlitchyBehavior(const ChaoticTuning &tuning = ChaoticTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::Glitchy; }
  float getDecay() const override { return m_tuning.glitchDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  GlitchState &ensureState(Particle &particle, BehaviorContext &ctx) const;
  void updateTimers(Particle &particle, GlitchState &state, float dt,
                    BehaviorContext &ctx) const;

  ChaoticTuning m_tuning;
};

} // namespace AuraEngine

#endif // CHAOTIC_BEHAVIORS_HPP
