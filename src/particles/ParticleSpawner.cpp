/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticleSpawner.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace AuraEngine {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

SpawnPoint ring(const Vector2D &center, float angle, float radius,
                bool keepAngle) {
  SpawnPoint point;
  point.x = center.getX() + std::cos(angle) * radius;
  point.y = center.getY() + std::sin(angle) * radius;
  if (keepAngle) {
    point.angle = angle;
  }
  return point;
}

} // namespace

size_t ParticleSpawner::computeSpawnCount(const SpawnRequest &request,
                                          size_t activeCount, size_t cap) {
  const size_t room = cap > activeCount ? cap - activeCount : 0;

  if (request.count) {
    if (*request.count <= 0) {
      return 0;
    }
    return std::min(static_cast<size_t>(*request.count), room);
  }

  size_t total = 0;
  if (request.minParticles > 0) {
    const size_t target = std::min(static_cast<size_t>(request.minParticles), cap);
    if (target > activeCount) {
      total = target - activeCount;
    }
  }

  size_t current = activeCount + total;
  const size_t rateCap =
      request.rateLimit > 0 ? std::min(cap, request.rateLimit) : cap;
  if (current >= rateCap || !(request.ratePerSecond > 0.0f) ||
      !std::isfinite(request.ratePerSecond)) {
    return total;
  }

  const float dtMs = std::isfinite(request.dtMs) ? std::max(0.0f, request.dtMs) : 0.0f;
  m_spawnAccumulator += request.ratePerSecond *
                        std::min(dtMs, MAX_ACCUMULATED_DT_MS) / 1000.0f;
  m_spawnAccumulator = std::min(m_spawnAccumulator, MAX_ACCUMULATOR);

  while (m_spawnAccumulator >= 1.0f && current < rateCap) {
    m_spawnAccumulator -= 1.0f;
    ++current;
    ++total;
  }
  return total;
}

int ParticleSpawner::calculateSpawnRate(float ratePerSecond, float dtMs) {
  if (!(ratePerSecond > 0.0f) || !std::isfinite(ratePerSecond)) {
    return 0;
  }

  const float dt = std::isfinite(dtMs) ? std::max(0.0f, dtMs) : 0.0f;
  m_spawnAccumulator += ratePerSecond * std::min(dt, MAX_ACCUMULATED_DT_MS) / 1000.0f;
  m_spawnAccumulator = std::min(m_spawnAccumulator, MAX_ACCUMULATOR);

  int toSpawn = 0;
  while (m_spawnAccumulator >= 1.0f) {
    ++toSpawn;
    m_spawnAccumulator -= 1.0f;
  }
  return toSpawn;
}

float ParticleSpawner::orbRadius(const SpawnSurface &surface) {
  return std::max(0.0f, std::min(surface.width, surface.height)) / 12.0f;
}

Vector2D ParticleSpawner::clampToSurface(float x, float y,
                                         const SpawnSurface &surface) {
  const float m = surface.margin;
  return Vector2D(std::max(m, std::min(surface.width - m, x)),
                  std::max(m, std::min(surface.height - m, y)));
}

SpawnPoint ParticleSpawner::getSpawnPosition(BehaviorType behavior,
                                             const Vector2D &origin,
                                             const SpawnSurface &surface,
                                             std::mt19937 &rng,
                                             std::string_view emotion,
                                             const Vector2D *attractor) const {
  std::uniform_real_distribution<float> unit(0.0f, 1.0f);
  const float orb = orbRadius(surface);
  const float glow = orb * 2.5f;
  const float angle = unit(rng) * TWO_PI;

  SpawnPoint point{origin.getX(), origin.getY(), std::nullopt};

  switch (behavior) {
  case BehaviorType::Ambient:
  case BehaviorType::Resting:
    // Glow edge, moving outward
    point = ring(origin, angle, glow * 0.9f, true);
    break;

  case BehaviorType::Rising:
  case BehaviorType::Falling: {
    const float m = surface.margin;
    const float minRadius = glow * 1.1f;
    const float edge = std::min(
        {origin.getX() - m, surface.width - origin.getX() - m,
         origin.getY() - m, surface.height - origin.getY() - m});
    const float maxRadius = std::max(minRadius, std::min(glow * 1.5f, edge));
    point = ring(origin, angle, minRadius + unit(rng) * (maxRadius - minRadius), false);
    break;
  }

  case BehaviorType::Aggressive:
    point = ring(origin, angle, glow + unit(rng) * orb, false);
    break;

  case BehaviorType::Scattering:
    break;

  case BehaviorType::Burst:
    if (emotion == "suspicion") {
      point = ring(origin, angle, orb * 1.5f, false);
    } else if (emotion == "surprise") {
      point = ring(origin, angle, orb * 1.2f, false);
    }
    break;

  case BehaviorType::Repelling:
    point = ring(origin, angle, glow * 0.9f, false);
    break;

  case BehaviorType::Orbiting:
    point = ring(origin, angle, glow * 1.2f + unit(rng) * glow * 0.5f, false);
    break;

  case BehaviorType::Glitchy:
    point = ring(origin, angle, glow * 3.0f + unit(rng) * glow * 4.0f, false);
    break;

  case BehaviorType::Spaz:
    point = ring(origin, angle, glow * 2.0f + unit(rng) * glow * 3.0f, false);
    break;

  case BehaviorType::MeditationSwirl:
    point = ring(attractor ? *attractor : origin, angle,
                 glow * (0.5f + unit(rng) * 0.5f), true);
    break;

  default:
    break;
  }

  const Vector2D clamped = clampToSurface(point.x, point.y, surface);
  point.x = clamped.getX();
  point.y = clamped.getY();
  return point;
}

} // namespace AuraEngine
