/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_HPP
#define PARTICLE_HPP

/**
 * @file Particle.hpp
 * @brief Single aura particle: kinematics, lifetime, behavior tag and the
 * behavior-local transient state
 */

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <variant>

namespace AuraEngine {

/**
 * @brief Behavior variant selected per spawn
 */
enum class BehaviorType : uint8_t {
  Ambient = 0,
  Rising = 1,
  Falling = 2,
  Burst = 3,
  Orbiting = 4,
  Scattering = 5,
  Repelling = 6,
  Aggressive = 7,
  Glitchy = 8,
  Spaz = 9,
  Resting = 10,
  MeditationSwirl = 11,
  COUNT = 12
};

const char *behaviorTypeToString(BehaviorType type);

/**
 * @brief Maps a behavior name ("ambient", "meditation_swirl", ...) to its enum
 * @return Ambient for unknown names
 */
BehaviorType behaviorTypeFromString(std::string_view name);
std::optional<BehaviorType> parseBehaviorType(std::string_view name);

// Behavior-local state, one alternative per behavior family
struct OrbitState {
  float angle{0.0f};
  float radius{0.0f};
  float speed{0.0f}; // radians per normalized frame
};

struct SwirlState {
  float angle{0.0f};
  float radius{0.0f};
  float speed{0.0f};
  float breathPhase{0.0f};
};

struct GlitchState {
  OrbitState orbit;

  float glitchTimer{0.0f};
  float nextGlitch{0.0f};
  float glitchDuration{0.0f};
  bool isGlitching{false};
  Vector2D glitchOffset;

  float stutterTimer{0.0f};
  float nextStutter{0.0f};
  bool isFrozen{false};

  float beatPhase{0.0f};
  float beatFrequency{0.0f};
  float dropIntensity{0.0f};

  bool rgbSplit{false};
  float rgbPhase{0.0f};
};

using BehaviorState =
    std::variant<std::monostate, OrbitState, SwirlState, GlitchState>;

struct Particle {
  // Kinematics
  Vector2D position;
  Vector2D velocity;
  float z{0.0f}; // depth in [-1, 1]; negative renders behind the core

  // Lifecycle
  float life{1.0f};     // remaining life, <= 0 means dead
  float maxLife{1.0f};
  float lifeDecay{0.01f}; // life lost per normalized frame
  float age{0.0f};        // normalized lifetime progress [0, 1]
  float fadeInTime{0.15f};
  float fadeOutTime{0.3f};

  // Appearance
  float size{4.0f};
  float baseSize{4.0f};
  float opacity{0.0f};
  float baseOpacity{0.5f};
  float scaleFactor{1.0f};
  float sizeMultiplier{1.0f};
  uint32_t color{0xFFFFFFFF};
  bool hasGlow{false};
  float glowSizeMultiplier{0.0f};
  bool isCellShaded{false};

  // Behavior
  BehaviorType behavior{BehaviorType::Ambient};
  uint8_t gestureBehavior{0}; // interned override id, 0 = none
  BehaviorState behaviorState;

  // Render cache
  std::optional<uint32_t> cachedGradient;
  uint32_t cachedGradientKey{0};

  /**
   * @brief Reinitializes every field for a fresh spawn at (x, y)
   * Appearance randomization is left to randomizeTraits().
   */
  void reset(float x, float y, BehaviorType type, float scale = 1.0f,
             float sizeMult = 1.0f);

  /**
   * @brief Draws size, opacity, depth and glow/cell-shading traits
   */
  void randomizeTraits(std::mt19937 &rng);

  /**
   * @brief Drops behavior state and render caches (pool return)
   */
  void clearTransient();

  /**
   * @brief Advances life/age by dt normalized frames and refreshes opacity
   */
  void updateLifecycle(float dt);
  void updateOpacity();

  /**
   * @brief Repairs non-finite scalars in place
   * @param fallbackPosition Position used when x or y is not finite
   * @return Number of fields repaired
   */
  int sanitize(const Vector2D &fallbackPosition);

  bool isAlive() const { return life > 0.0f; }
  float getLifeRatio() const { return maxLife > 0 ? life / maxLife : 0.0f; }
  float getDepthAdjustedSize() const { return size * (1.0f + z * 0.25f); }
  bool hasGestureOverride() const { return gestureBehavior != 0; }
};

} // namespace AuraEngine

#endif // PARTICLE_HPP
