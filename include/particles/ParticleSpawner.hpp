/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_SPAWNER_HPP
#define PARTICLE_SPAWNER_HPP

/**
 * @file ParticleSpawner.hpp
 * @brief Decides how many particles to introduce each tick and where
 *
 * Count modes:
 * - Explicit: exactly N, bounded by the cap
 * - Maintain-minimum: top up to minParticles regardless of rate
 * - Rate: time-accumulated particles per second, accumulator clamped to 3
 *
 * Positions depend on the behavior and scale with the glow radius,
 * 2.5 x the orb radius (min(surface) / 12).
 */

#include "particles/ParticleBehavior.hpp"
#include <cstddef>
#include <optional>
#include <random>
#include <string_view>

namespace AuraEngine {

struct SpawnRequest {
  std::optional<int> count;     // explicit mode when set
  int minParticles{0};
  float ratePerSecond{0.0f};
  float dtMs{0.0f};
  size_t rateLimit{0};          // extra cap for rate mode (maxOverride)
};

struct SpawnSurface {
  float width{0.0f};
  float height{0.0f};
  float margin{30.0f};
};

class ParticleSpawner {
public:
  static constexpr float MAX_ACCUMULATOR = 3.0f;
  static constexpr float MAX_ACCUMULATED_DT_MS = 50.0f;

  /**
   * @brief Number of particles to spawn this call
   * @param activeCount Particles currently alive
   * @param cap Effective soft cap (already bounded by the hard cap)
   * Only rate mode touches the accumulator.
   */
  size_t computeSpawnCount(const SpawnRequest &request, size_t activeCount,
                           size_t cap);

  /**
   * @brief Rate mode in isolation: accumulates rate x min(dt, 50) / 1000
   * and returns floor(accumulator), subtracting what it returns
   */
  int calculateSpawnRate(float ratePerSecond, float dtMs);

  /**
   * @brief Behavior-dependent spawn point around origin, clamped to surface
   * @param emotion Only "suspicion" and "surprise" change burst placement
   * @param attractor Swirl center for meditation_swirl
   */
  SpawnPoint getSpawnPosition(BehaviorType behavior, const Vector2D &origin,
                              const SpawnSurface &surface, std::mt19937 &rng,
                              std::string_view emotion = {},
                              const Vector2D *attractor = nullptr) const;

  static Vector2D clampToSurface(float x, float y, const SpawnSurface &surface);

  static float orbRadius(const SpawnSurface &surface);
  static float glowRadius(const SpawnSurface &surface) {
    return orbRadius(surface) * 2.5f;
  }

  void resetAccumulator() { m_spawnAccumulator = 0.0f; }
  float getAccumulator() const { return m_spawnAccumulator; }

private:
  float m_spawnAccumulator{0.0f};
};

} // namespace AuraEngine

#endif // PARTICLE_SPAWNER_HPP
