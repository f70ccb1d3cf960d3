/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DRIFT_BEHAVIORS_HPP
#define DRIFT_BEHAVIORS_HPP

#include "particles/BehaviorTuning.hpp"
#include "particles/ParticleBehavior.hpp"

namespace AuraEngine {

// Slow outward drift with a gentle random wander
class AmbientBehavior : public ParticleBehavior {
public:
  explicit AmbientBehavior(const DriftTuning &tuning = DriftTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::Ambient; }
  float getDecay() const override { return m_tuning.ambientDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  DriftTuning m_tuning;
};

// Near-zero net force; cumulative drift stays within a few pixels
class RestingBehavior : public ParticleBehavior {
public:
  explicit RestingBehavior(const DriftTuning &tuning = DriftTuning{})
      : m_tuning(tuning) {}

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return BehaviorType::Resting; }
  float getDecay() const override { return m_tuning.restingDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  DriftTuning m_tuning;
};

/**
 * @brief Constant vertical acceleration until decay reaches terminal speed
 *
 * Terminal speed is acceleration * decay / (1 - decay). Rising and falling
 * differ only in the sign of the acceleration.
 */
class VerticalDriftBehavior : public ParticleBehavior {
public:
  VerticalDriftBehavior(BehaviorType type, const DriftTuning &tuning);

  void initialize(Particle &particle, BehaviorContext &ctx,
                  const SpawnPoint &spawn) override;
  BehaviorType getType() const override { return m_type; }
  float getDecay() const override { return m_tuning.verticalDecay; }

protected:
  void update(Particle &particle, float dt, BehaviorContext &ctx) const override;

private:
  BehaviorType m_type;
  float m_direction; // -1 up, +1 down (screen space)
  DriftTuning m_tuning;
};

class RisingBehavior : public VerticalDriftBehavior {
public:
  explicit RisingBehavior(const DriftTuning &tuning = DriftTuning{})
      : VerticalDriftBehavior(BehaviorType::Rising, tuning) {}
};

class FallingBehavior : public VerticalDriftBehavior {
public:
  explicit FallingBehavior(const DriftTuning &tuning = DriftTuning{})
      : VerticalDriftBehavior(BehaviorType::Falling, tuning) {}
};

} // namespace AuraEngine

#endif // DRIFT_BEHAVIORS_HPP
