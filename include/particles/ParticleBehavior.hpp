/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_BEHAVIOR_HPP
#define PARTICLE_BEHAVIOR_HPP

#include "particles/Particle.hpp"
#include "utils/ColorUtils.hpp"
#include "utils/Vector2D.hpp"
#include <optional>
#include <random>
#include <string>

namespace AuraEngine {

/**
 * @brief Where a particle was placed by the spawner
 * angle is set when the spawn position implies an outward direction
 */
struct SpawnPoint {
  float x{0.0f};
  float y{0.0f};
  std::optional<float> angle;
};

/**
 * @brief Per-frame inputs shared by every behavior evaluation
 *
 * Owned by ParticleSystem for the duration of one update or spawn call.
 */
struct BehaviorContext {
  Vector2D center;    // character origin
  Vector2D attractor; // swirl target, equals center when none is set
  std::mt19937 &rng;
  const EmotionPalette &palette;

  BehaviorContext(const Vector2D &c, const Vector2D &a, std::mt19937 &r,
                  const EmotionPalette &p)
      : center(c), attractor(a), rng(r), palette(p) {}

  float random(float lo, float hi) {
    return std::uniform_real_distribution<float>(lo, hi)(rng);
  }
  float unit() { return random(0.0f, 1.0f); }
  bool chance(float probability) { return unit() < probability; }
};

class ParticleBehavior {
public:
  virtual ~ParticleBehavior() = default;

  /**
   * @brief Sets initial velocity, lifetime and behavior state for a spawn
   * Called once after the particle is placed and its traits are drawn.
   */
  virtual void initialize(Particle &particle, BehaviorContext &ctx,
                          const SpawnPoint &spawn) = 0;

  /**
   * @brief Runs the behavior rule for dt normalized frames, then applies
   * velocity decay^dt. Does nothing for dt <= 0.
   */
  void step(Particle &particle, float dt, BehaviorContext &ctx) const;

  /**
   * @brief Re-establishes behavior guarantees after integration and
   * containment have moved the particle
   */
  virtual void enforceInvariants([[maybe_unused]] Particle &particle,
                                 [[maybe_unused]] const BehaviorContext &ctx) const {}

  virtual BehaviorType getType() const = 0;

  // Per-frame velocity retention, strictly below 1
  virtual float getDecay() const = 0;

  std::string getName() const { return behaviorTypeToString(getType()); }

protected:
  virtual void update(Particle &particle, float dt, BehaviorContext &ctx) const = 0;

  // 1 - (1 - smoothing)^dt, the share of a gap closed over dt frames
  static float approachFactor(float smoothing, float dt);

  // Sets velocity so that integrating over dt closes approachFactor of the gap
  static void trackTarget(Particle &particle, const Vector2D &target,
                          float smoothing, float dt);

  static Vector2D outwardDirection(const Particle &particle,
                                   const Vector2D &center);

  // Spawn angle when provided, otherwise the direction away from center
  static float launchAngle(const SpawnPoint &spawn, const BehaviorContext &ctx);

  static void applyPalette(Particle &particle, BehaviorContext &ctx);

  static float wrapAngle(float angle);
};

} // namespace AuraEngine

#endif // PARTICLE_BEHAVIOR_HPP
