/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticleSystem.hpp"
#include "core/Logger.hpp"
#include "particles/BehaviorTuning.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <limits>
#include <numbers>

namespace AuraEngine {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;
constexpr size_t MAX_GESTURE_NAMES = std::numeric_limits<uint8_t>::max();

uint32_t resolveSeed(uint32_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device device;
  return device();
}

float finiteOr(float value, float fallback) {
  return std::isfinite(value) ? value : fallback;
}

} // namespace

ParticleSystem::ParticleSystem(const ParticleSystemConfig &config)
    : m_config(config),
      m_pool(std::max<size_t>(1, config.maxParticles)),
      m_rng(resolveSeed(config.seed)),
      m_maxParticles(std::max<size_t>(1, config.maxParticles)),
      m_absoluteMaxParticles(std::max<size_t>(1, config.maxParticles) * 2) {
  // Slots never exceed active + pooled, so pointers into the arena stay
  // stable and spawning never reallocates
  m_active.reserve(m_absoluteMaxParticles);
  m_pool.reserve(m_absoluteMaxParticles + m_pool.getCapacity());

  PARTICLE_INFO(std::format("ParticleSystem created (max {}, hard cap {}, pool {})",
                            m_maxParticles, m_absoluteMaxParticles,
                            m_pool.getCapacity()));
}

ParticleSystem::~ParticleSystem() = default;

// ---------------------------------------------------------------------------
// Spawning
// ---------------------------------------------------------------------------

void ParticleSystem::spawn(BehaviorType behavior, std::string_view emotion,
                           float ratePerSecond, float originX, float originY,
                           float dtMs, const SpawnOptions &options) {
  try {
    if (!std::isfinite(originX) || !std::isfinite(originY)) {
      PARTICLE_DEBUG("Spawn ignored: non-finite origin");
      return;
    }
    spawnInternal(behavior, emotion, ratePerSecond, Vector2D(originX, originY),
                  dtMs, options);
  } catch (const std::exception &e) {
    PARTICLE_ERROR(std::format("Exception in ParticleSystem::spawn: {}", e.what()));
  }
}

void ParticleSystem::spawnForEmotion(const EmotionProfile &emotion, float originX,
                                     float originY, float dtMs,
                                     const SpawnOptions &options) {
  SpawnOptions resolved = options;
  if (!resolved.emotionColors) {
    if (!emotion.palette.empty()) {
      resolved.emotionColors = emotion.palette;
    } else {
      resolved.emotionColors = EmotionPalette{WeightedColor{emotion.primaryColor, 1.0f}};
    }
  }
  spawn(emotion.particleBehavior, emotion.name, emotion.particleRate, originX,
        originY, dtMs, resolved);
}

void ParticleSystem::spawnInternal(BehaviorType behavior, std::string_view emotion,
                                   float ratePerSecond, const Vector2D &origin,
                                   float dtMs, const SpawnOptions &options) {
  m_lastOrigin = origin;
  m_scaleFactor = options.scaleFactor > 0.0f ? finiteOr(options.scaleFactor, 1.0f) : 1.0f;
  m_sizeMultiplier =
      options.sizeMultiplier > 0.0f ? finiteOr(options.sizeMultiplier, 1.0f) : 1.0f;

  bool paletteChanged = false;
  if (options.emotionColors) {
    m_basePalette = *options.emotionColors;
    paletteChanged = true;
  }
  if (options.undertone) {
    m_currentUndertone = *options.undertone;
    paletteChanged = true;
  }
  if (paletteChanged) {
    refreshPalette();
  }

  SpawnRequest request;
  request.count = options.count;
  request.minParticles = options.minParticles;
  request.ratePerSecond = ratePerSecond;
  request.dtMs = dtMs;
  request.rateLimit = options.maxOverride.value_or(0);

  const size_t toSpawn =
      m_spawner.computeSpawnCount(request, m_active.size(), effectiveCap());
  for (size_t i = 0; i < toSpawn; ++i) {
    spawnSingleParticle(behavior, origin, emotion);
  }
}

void ParticleSystem::burst(int count, BehaviorType behavior, float originX,
                           float originY) {
  if (count <= 0 || !std::isfinite(originX) || !std::isfinite(originY)) {
    return;
  }

  try {
    const Vector2D origin(originX, originY);
    m_lastOrigin = origin;

    const size_t cap = effectiveCap();
    const size_t room = cap > m_active.size() ? cap - m_active.size() : 0;
    const size_t actual = std::min(static_cast<size_t>(count), room);
    for (size_t i = 0; i < actual; ++i) {
      spawnSingleParticle(behavior, origin, {});
    }
  } catch (const std::exception &e) {
    PARTICLE_ERROR(std::format("Exception in ParticleSystem::burst: {}", e.what()));
  }
}

void ParticleSystem::spawnSingleParticle(BehaviorType behavior,
                                         const Vector2D &origin,
                                         std::string_view emotion) {
  const Vector2D *attractor = m_attractor ? &*m_attractor : nullptr;
  const SpawnPoint spawnPoint = m_spawner.getSpawnPosition(
      behavior, origin, spawnSurface(origin), m_rng, emotion, attractor);

  const ParticleHandle handle = m_pool.acquire(spawnPoint.x, spawnPoint.y, behavior,
                                               m_scaleFactor, m_sizeMultiplier);
  Particle *particle = m_pool.get(handle);
  if (!particle) {
    PARTICLE_ERROR("Pool returned an invalid handle");
    return;
  }

  particle->randomizeTraits(m_rng);
  BehaviorContext ctx(origin, m_attractor.value_or(origin), m_rng, m_currentPalette);
  m_behaviors.get(behavior).initialize(*particle, ctx, spawnPoint);
  particle->gestureBehavior = m_activeGesture;
  particle->updateOpacity();

  m_active.push_back(handle);
  ++m_totalParticlesCreated;
}

void ParticleSystem::refreshPalette() {
  if (m_currentUndertone) {
    m_currentPalette =
        ColorUtils::applySaturation(m_basePalette, m_currentUndertone->saturation);
  } else {
    m_currentPalette = m_basePalette;
  }
}

// ---------------------------------------------------------------------------
// Simulation
// ---------------------------------------------------------------------------

void ParticleSystem::update(float dtMs, float originX, float originY,
                            const std::optional<GestureMotion> &gestureMotion,
                            float gestureProgress,
                            const std::optional<UndertoneModifier> &undertone) {
  try {
    updateInternal(dtMs, resolveOrigin(originX, originY), gestureMotion,
                   gestureProgress, undertone);
  } catch (const std::exception &e) {
    PARTICLE_ERROR(std::format("Exception in ParticleSystem::update: {}", e.what()));
  }
}

void ParticleSystem::updateInternal(float dtMs, const Vector2D &origin,
                                    const std::optional<GestureMotion> &gestureMotion,
                                    float gestureProgress,
                                    const std::optional<UndertoneModifier> &undertone) {
  applyPendingCommands();

  const float safeDtMs = std::isfinite(dtMs) && dtMs > 0.0f ? dtMs : 0.0f;
  const float dt = safeDtMs / FRAME_MS;
  const float progress = std::clamp(finiteOr(gestureProgress, 0.0f), 0.0f, 1.0f);

  BehaviorContext ctx(origin, m_attractor.value_or(origin), m_rng, m_currentPalette);

  int repaired = 0;
  for (const ParticleHandle &handle : m_active) {
    Particle *particle = m_pool.get(handle);
    if (!particle) {
      continue;
    }
    updateParticle(*particle, dt, ctx, gestureMotion, progress, undertone);
    repaired += particle->sanitize(origin);
  }

  removeDeadParticles();

  if (m_active.size() > m_maxParticles) {
    trimToCount(m_maxParticles);
  }

  // Reported once the frame's bookkeeping is complete
  if (repaired > 0) {
    PARTICLE_WARN(std::format("Repaired {} non-finite particle fields", repaired));
  }
}

void ParticleSystem::updateParticle(Particle &particle, float dt,
                                    BehaviorContext &ctx,
                                    const std::optional<GestureMotion> &gestureMotion,
                                    float gestureProgress,
                                    const std::optional<UndertoneModifier> &undertone) {
  particle.updateLifecycle(dt);

  if (gestureMotion && gestureMotion->isActive && dt > 0.0f) {
    applyGestureMotion(particle, *gestureMotion, gestureProgress, dt, ctx.center);
  }

  const ParticleBehavior &behavior = m_behaviors.get(effectiveBehavior(particle));
  behavior.step(particle, dt, ctx);

  float displacementScale = 1.0f;
  if (undertone) {
    displacementScale = std::clamp(finiteOr(undertone->velocityMultiplier, 1.0f), 0.0f, 2.0f);
    if (std::isfinite(undertone->sizeMultiplier) && undertone->sizeMultiplier > 0.0f) {
      particle.size = particle.baseSize * undertone->sizeMultiplier;
    }
    if (std::isfinite(undertone->opacityMultiplier)) {
      particle.opacity =
          std::clamp(particle.opacity * undertone->opacityMultiplier, 0.0f, 1.0f);
    }
  }

  particle.position += particle.velocity * (dt * displacementScale);

  if (m_containment) {
    Containment::apply(particle, *m_containment);
  }
  behavior.enforceInvariants(particle, ctx);
}

void ParticleSystem::applyGestureMotion(Particle &particle,
                                        const GestureMotion &motion,
                                        float progress, float dt,
                                        const Vector2D &center) const {
  const float strength = finiteOr(motion.strength, 1.0f);

  switch (motion.type) {
  case GestureMotionType::Pulse: {
    // Expand then contract with the core; decay bounds the impulse
    const float pulse = std::sin(progress * TWO_PI) * 0.3f * strength;
    particle.velocity += (particle.position - center).normalized() * (pulse * dt);
    break;
  }
  case GestureMotionType::Wave: {
    const float wave =
        std::sin(progress * TWO_PI + particle.position.getX() * 0.01f) * 10.0f * strength;
    particle.position += Vector2D(0.0f, wave * dt * 0.1f);
    break;
  }
  case GestureMotionType::Gather:
    if (progress < 0.5f) {
      const float gather = progress * 2.0f * strength;
      particle.velocity += (center - particle.position) * (gather * 0.001f * dt);
    }
    break;
  }
}

// ---------------------------------------------------------------------------
// Gesture overrides
// ---------------------------------------------------------------------------

void ParticleSystem::setGestureBehavior(std::string_view name, bool enabled) {
  m_pendingCommands.push_back(ApplyBehaviorOverride{std::string(name), enabled});
}

void ParticleSystem::applyPendingCommands() {
  if (m_pendingCommands.empty()) {
    return;
  }

  for (const ApplyBehaviorOverride &command : m_pendingCommands) {
    const uint8_t id = command.active ? internGestureName(command.name) : 0;
    m_activeGesture = id;
    for (const ParticleHandle &handle : m_active) {
      if (Particle *particle = m_pool.get(handle)) {
        particle->gestureBehavior = id;
      }
    }
    PARTICLE_DEBUG(std::format("Gesture override '{}' {} on {} particles",
                               command.name, command.active ? "applied" : "cleared",
                               m_active.size()));
  }
  m_pendingCommands.clear();
}

uint8_t ParticleSystem::internGestureName(std::string_view name) {
  for (size_t i = 0; i < m_gestureNames.size(); ++i) {
    if (m_gestureNames[i].name == name) {
      return static_cast<uint8_t>(i + 1);
    }
  }

  if (m_gestureNames.size() >= MAX_GESTURE_NAMES) {
    PARTICLE_WARN(std::format("Gesture name table full, ignoring '{}'", name));
    return 0;
  }

  m_gestureNames.push_back(GestureEntry{std::string(name), parseBehaviorType(name)});
  return static_cast<uint8_t>(m_gestureNames.size());
}

BehaviorType ParticleSystem::effectiveBehavior(const Particle &particle) const {
  if (particle.gestureBehavior != 0 &&
      particle.gestureBehavior <= m_gestureNames.size()) {
    const GestureEntry &entry = m_gestureNames[particle.gestureBehavior - 1];
    if (entry.behavior) {
      return *entry.behavior;
    }
  }
  return particle.behavior;
}

std::string_view ParticleSystem::getGestureBehaviorName(const Particle &particle) const {
  if (particle.gestureBehavior == 0 ||
      particle.gestureBehavior > m_gestureNames.size()) {
    return {};
  }
  return m_gestureNames[particle.gestureBehavior - 1].name;
}

// ---------------------------------------------------------------------------
// Capacity and cleanup
// ---------------------------------------------------------------------------

void ParticleSystem::setMaxParticles(int maxParticles) {
  m_maxParticles = static_cast<size_t>(std::max(1, maxParticles));

  if (m_active.size() > m_maxParticles) {
    [[maybe_unused]] const size_t before = m_active.size();
    trimToCount(m_maxParticles);
    PARTICLE_DEBUG(std::format("Max particles set to {}, trimmed {} particles",
                               m_maxParticles, before - m_active.size()));
  }
}

void ParticleSystem::clear() {
  for (const ParticleHandle &handle : m_active) {
    if (m_pool.release(handle)) {
      ++m_totalParticlesDestroyed;
    }
  }
  m_active.clear();
  m_spawner.resetAccumulator();
}

void ParticleSystem::destroy() {
  clear();
  m_pool.clear();
  m_pendingCommands.clear();
  m_activeGesture = 0;
  m_totalParticlesCreated = 0;
  m_totalParticlesDestroyed = 0;
  PARTICLE_INFO("ParticleSystem destroyed");
}

size_t ParticleSystem::cleanupDeadParticles() { return removeDeadParticles(); }

size_t ParticleSystem::performCleanup() {
  const size_t removed = removeDeadParticles();
  const size_t trimmed = m_pool.trim();
  if (removed > 0 || trimmed > 0) {
    PARTICLE_DEBUG(std::format("Cleanup removed {} dead particles, trimmed {} pooled",
                               removed, trimmed));
  }
  return removed;
}

void ParticleSystem::removeParticle(std::ptrdiff_t index) {
  if (index < 0 || static_cast<size_t>(index) >= m_active.size()) {
    return;
  }
  if (m_pool.release(m_active[static_cast<size_t>(index)])) {
    ++m_totalParticlesDestroyed;
  }
  m_active.erase(m_active.begin() + index);
}

void ParticleSystem::refreshPool() {
  m_pool.clear();
  m_pool.resetHitCounters();
  for (const ParticleHandle &handle : m_active) {
    if (Particle *particle = m_pool.get(handle)) {
      particle->life = 0.0f;
    }
  }
  PARTICLE_INFO(std::format("Pool refreshed, {} particles scheduled for replacement",
                            m_active.size()));
}

size_t ParticleSystem::removeDeadParticles() {
  // Stable compaction keeps spawn order for the survivors
  size_t write = 0;
  for (size_t read = 0; read < m_active.size(); ++read) {
    const ParticleHandle handle = m_active[read];
    const Particle *particle = m_pool.get(handle);
    if (particle && particle->isAlive()) {
      m_active[write++] = handle;
    } else if (m_pool.release(handle)) {
      ++m_totalParticlesDestroyed;
    }
  }

  const size_t removed = m_active.size() - write;
  m_active.resize(write);
  return removed;
}

void ParticleSystem::trimToCount(size_t count) {
  if (m_active.size() <= count) {
    return;
  }

  // Oldest particles sit at the front
  const size_t excess = m_active.size() - count;
  for (size_t i = 0; i < excess; ++i) {
    if (m_pool.release(m_active[i])) {
      ++m_totalParticlesDestroyed;
    }
  }
  m_active.erase(m_active.begin(),
                 m_active.begin() + static_cast<std::ptrdiff_t>(excess));
}

size_t ParticleSystem::effectiveCap() const {
  return std::min(m_maxParticles, m_absoluteMaxParticles);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

ParticleStats ParticleSystem::getStats() const {
  ParticleStats stats;
  stats.activeParticles = m_active.size();
  stats.maxParticles = m_maxParticles;
  stats.poolSize = m_pool.size();
  stats.poolHits = m_pool.getPoolHits();
  stats.poolMisses = m_pool.getPoolMisses();
  stats.poolEfficiency =
      static_cast<float>(stats.poolHits) /
      static_cast<float>(std::max<uint64_t>(1, stats.poolHits + stats.poolMisses));
  stats.spawnAccumulator = m_spawner.getAccumulator();
  stats.totalParticlesCreated = m_totalParticlesCreated;
  stats.totalParticlesDestroyed = m_totalParticlesDestroyed;
  return stats;
}

size_t ParticleSystem::countByBehavior(BehaviorType behavior) const {
  size_t count = 0;
  forEachParticle([&count, behavior](const Particle &particle) {
    if (particle.behavior == behavior) {
      ++count;
    }
  });
  return count;
}

bool ParticleSystem::validateParticles() const {
  for (const ParticleHandle &handle : m_active) {
    const Particle *particle = m_pool.get(handle);
    if (!particle || !particle->isAlive() || particle->life > particle->maxLife ||
        !particle->position.isFinite() || !particle->velocity.isFinite()) {
      return false;
    }
  }
  return true;
}

const Particle *ParticleSystem::particleAt(size_t index) const {
  return index < m_active.size() ? m_pool.get(m_active[index]) : nullptr;
}

Particle *ParticleSystem::particleAt(size_t index) {
  return index < m_active.size() ? m_pool.get(m_active[index]) : nullptr;
}

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------

bool ParticleSystem::setContainmentBounds(const ContainmentBounds &bounds) {
  if (!bounds.isValid()) {
    PARTICLE_WARN("Ignoring invalid containment bounds");
    return false;
  }
  m_containment = bounds;
  return true;
}

void ParticleSystem::setAttractor(float x, float y) {
  if (std::isfinite(x) && std::isfinite(y)) {
    m_attractor = Vector2D(x, y);
  }
}

void ParticleSystem::setSurfaceSize(float width, float height) {
  m_config.surfaceWidth = finiteOr(width, 0.0f);
  m_config.surfaceHeight = finiteOr(height, 0.0f);
}

SpawnSurface ParticleSystem::spawnSurface(const Vector2D &origin) const {
  SpawnSurface surface;
  surface.width = m_config.surfaceWidth > 0.0f ? m_config.surfaceWidth
                                               : origin.getX() * 2.0f;
  surface.height = m_config.surfaceHeight > 0.0f ? m_config.surfaceHeight
                                                 : origin.getY() * 2.0f;
  surface.margin = std::max(0.0f, finiteOr(m_config.spawnMargin, 30.0f));
  return surface;
}

Vector2D ParticleSystem::resolveOrigin(float originX, float originY) {
  if (std::isfinite(originX) && std::isfinite(originY)) {
    m_lastOrigin = Vector2D(originX, originY);
  }
  return m_lastOrigin;
}

} // namespace AuraEngine
