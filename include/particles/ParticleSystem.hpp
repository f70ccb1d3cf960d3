/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_SYSTEM_HPP
#define PARTICLE_SYSTEM_HPP

/**
 * @file ParticleSystem.hpp
 * @brief Aura particle field orchestrator
 *
 * Composes the pool, spawner, behavior evaluators and containment for one
 * character. Every particle is owned by the pool arena; the active list holds
 * handles in spawn order (oldest first).
 *
 * Frame flow:
 * 1. spawn() introduces particles for the current emotion
 * 2. update() advances physics, removes the dead and enforces the soft cap
 * 3. ParticleRenderer reads the active list
 *
 * Single-threaded. Separate characters use separate instances.
 */

#include "particles/BehaviorRegistry.hpp"
#include "particles/Containment.hpp"
#include "particles/Particle.hpp"
#include "particles/ParticlePool.hpp"
#include "particles/ParticleSpawner.hpp"
#include "utils/ColorUtils.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace AuraEngine {

/**
 * @brief Construction-time settings
 */
struct ParticleSystemConfig {
  size_t maxParticles{50};  // initial soft cap; also the pool capacity
  float surfaceWidth{0.0f}; // <= 0 means 2 x origin x
  float surfaceHeight{0.0f};
  float spawnMargin{30.0f};
  uint32_t seed{0};         // 0 draws from std::random_device
};

struct UndertoneProfile {
  std::string name;
  float saturation{1.0f}; // HSL saturation multiplier for the palette
};

/**
 * @brief Optional spawn() parameters
 * count selects explicit mode; otherwise minParticles and the rate apply.
 */
struct SpawnOptions {
  std::optional<int> count;
  int minParticles{0};
  std::optional<size_t> maxOverride; // rate-mode limit below the soft cap
  float scaleFactor{1.0f};
  float sizeMultiplier{1.0f};
  std::optional<EmotionPalette> emotionColors;
  std::optional<UndertoneProfile> undertone;
};

enum class GestureMotionType : uint8_t { Pulse, Wave, Gather };

struct GestureMotion {
  GestureMotionType type{GestureMotionType::Pulse};
  float strength{1.0f};
  bool isActive{true};
};

/**
 * @brief Per-frame undertone adjustments
 * velocityMultiplier scales this frame's displacement, not the stored
 * velocity, so repeated frames cannot compound it.
 */
struct UndertoneModifier {
  float velocityMultiplier{1.0f};
  float sizeMultiplier{1.0f};
  float opacityMultiplier{1.0f};
};

/**
 * @brief Emotion data consumed by spawnForEmotion()
 */
struct EmotionProfile {
  std::string name;
  uint32_t primaryColor{ColorUtils::WHITE};
  float glowIntensity{1.0f};
  float particleRate{0.0f};
  BehaviorType particleBehavior{BehaviorType::Ambient};
  float coreSize{1.0f};
  float breathRate{1.0f};
  float breathDepth{0.0f};
  EmotionPalette palette; // empty means primaryColor only
};

struct ParticleStats {
  size_t activeParticles{0};
  size_t maxParticles{0};
  size_t poolSize{0};
  uint64_t poolHits{0};
  uint64_t poolMisses{0};
  float poolEfficiency{0.0f};
  float spawnAccumulator{0.0f};
  uint64_t totalParticlesCreated{0};
  uint64_t totalParticlesDestroyed{0};
};

/**
 * @brief Queued gesture override, applied at the start of update()
 */
struct ApplyBehaviorOverride {
  std::string name;
  bool active{false};
};

class ParticleSystem {
public:
  explicit ParticleSystem(const ParticleSystemConfig &config = ParticleSystemConfig{});
  ~ParticleSystem();

  ParticleSystem(const ParticleSystem &) = delete;
  ParticleSystem &operator=(const ParticleSystem &) = delete;

  /**
   * @brief Unified spawn entry point
   * @param emotion Emotion name, only affects burst placement
   * @param ratePerSecond Rate-mode particles per second; <= 0 disables rate mode
   * @param dtMs Frame time used for rate accumulation
   */
  void spawn(BehaviorType behavior, std::string_view emotion, float ratePerSecond,
             float originX, float originY, float dtMs,
             const SpawnOptions &options = SpawnOptions{});

  /**
   * @brief spawn() driven by an emotion profile's rate, behavior and palette
   * options.emotionColors, when set, wins over the profile palette.
   */
  void spawnForEmotion(const EmotionProfile &emotion, float originX, float originY,
                       float dtMs, const SpawnOptions &options = SpawnOptions{});

  /**
   * @brief Advances every active particle by dtMs
   * Zero, negative or non-finite dtMs freezes motion for this call.
   */
  void update(float dtMs, float originX, float originY,
              const std::optional<GestureMotion> &gestureMotion = std::nullopt,
              float gestureProgress = 0.0f,
              const std::optional<UndertoneModifier> &undertone = std::nullopt);

  // Immediate spawn at a point, capped by the soft cap
  void burst(int count, BehaviorType behavior, float originX, float originY);

  /**
   * @brief Queues a gesture override for every active particle
   * A name that matches a behavior makes tagged particles use that behavior's
   * rule until the override is cleared. Particles spawned while an override is
   * active inherit it.
   */
  void setGestureBehavior(std::string_view name, bool enabled);

  // Clamps to >= 1 and trims the oldest particles immediately
  void setMaxParticles(int maxParticles);

  void clear();
  void destroy();

  // Removes particles with life <= 0, returns how many
  size_t cleanupDeadParticles();
  size_t performCleanup();

  // Out-of-range indices are ignored
  void removeParticle(std::ptrdiff_t index);

  // Empties the pool and retires every active particle on the next update
  void refreshPool();

  ParticleStats getStats() const;
  size_t countByBehavior(BehaviorType behavior) const;
  bool validateParticles() const;

  bool setContainmentBounds(const ContainmentBounds &bounds);
  void clearContainmentBounds() { m_containment.reset(); }
  const std::optional<ContainmentBounds> &getContainmentBounds() const {
    return m_containment;
  }

  void setAttractor(float x, float y);
  void clearAttractor() { m_attractor.reset(); }
  const std::optional<Vector2D> &getAttractor() const { return m_attractor; }

  void setSurfaceSize(float width, float height);

  // Active particle access, oldest first
  size_t getActiveCount() const { return m_active.size(); }
  const Particle *particleAt(size_t index) const;
  Particle *particleAt(size_t index);

  template <typename Fn> void forEachParticle(Fn &&fn) const {
    for (const ParticleHandle &handle : m_active) {
      if (const Particle *particle = m_pool.get(handle)) {
        fn(*particle);
      }
    }
  }

  // Name of the particle's gesture override, empty when none
  std::string_view getGestureBehaviorName(const Particle &particle) const;
  bool hasPendingCommands() const { return !m_pendingCommands.empty(); }

  size_t getMaxParticles() const { return m_maxParticles; }
  size_t getAbsoluteMaxParticles() const { return m_absoluteMaxParticles; }
  size_t getPoolCapacity() const { return m_pool.getCapacity(); }
  const EmotionPalette &getCurrentPalette() const { return m_currentPalette; }

private:
  struct GestureEntry {
    std::string name;
    std::optional<BehaviorType> behavior;
  };

  void spawnInternal(BehaviorType behavior, std::string_view emotion,
                     float ratePerSecond, const Vector2D &origin, float dtMs,
                     const SpawnOptions &options);
  void spawnSingleParticle(BehaviorType behavior, const Vector2D &origin,
                           std::string_view emotion);
  void updateInternal(float dtMs, const Vector2D &origin,
                      const std::optional<GestureMotion> &gestureMotion,
                      float gestureProgress,
                      const std::optional<UndertoneModifier> &undertone);
  void updateParticle(Particle &particle, float dt, BehaviorContext &ctx,
                      const std::optional<GestureMotion> &gestureMotion,
                      float gestureProgress,
                      const std::optional<UndertoneModifier> &undertone);
  void applyGestureMotion(Particle &particle, const GestureMotion &motion,
                          float progress, float dt, const Vector2D &center) const;
  void applyPendingCommands();
  uint8_t internGestureName(std::string_view name);
  BehaviorType effectiveBehavior(const Particle &particle) const;
  void refreshPalette();

  size_t removeDeadParticles();
  void trimToCount(size_t count);
  size_t effectiveCap() const;
  SpawnSurface spawnSurface(const Vector2D &origin) const;
  Vector2D resolveOrigin(float originX, float originY);

  ParticleSystemConfig m_config;
  ParticlePool m_pool;
  BehaviorRegistry m_behaviors;
  ParticleSpawner m_spawner;
  std::mt19937 m_rng;

  std::vector<ParticleHandle> m_active; // spawn order, oldest first
  size_t m_maxParticles;
  const size_t m_absoluteMaxParticles;

  std::optional<ContainmentBounds> m_containment;
  std::optional<Vector2D> m_attractor;
  Vector2D m_lastOrigin;

  EmotionPalette m_basePalette;
  EmotionPalette m_currentPalette;
  std::optional<UndertoneProfile> m_currentUndertone;
  float m_scaleFactor{1.0f};
  float m_sizeMultiplier{1.0f};

  // Interned override names, id = index + 1
  boost::container::small_vector<GestureEntry, 8> m_gestureNames;
  uint8_t m_activeGesture{0};
  boost::container::small_vector<ApplyBehaviorOverride, 4> m_pendingCommands;

  uint64_t m_totalParticlesCreated{0};
  uint64_t m_totalParticlesDestroyed{0};
};

} // namespace AuraEngine

#endif // PARTICLE_SYSTEM_HPP
