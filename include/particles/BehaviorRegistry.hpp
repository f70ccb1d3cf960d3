/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEHAVIOR_REGISTRY_HPP
#define BEHAVIOR_REGISTRY_HPP

#include "particles/BehaviorTuning.hpp"
#include "particles/ParticleBehavior.hpp"
#include <array>
#include <memory>

namespace AuraEngine {

/**
 * @brief Owns one evaluator per BehaviorType
 *
 * Evaluators are stateless apart from their tuning; all per-particle state
 * lives in Particle::behaviorState, so one registry serves every particle.
 */
class BehaviorRegistry {
public:
  BehaviorRegistry();
  BehaviorRegistry(const DriftTuning &drift, const RadialTuning &radial,
                   const OrbitalTuning &orbital, const ChaoticTuning &chaotic);

  // Falls back to the ambient evaluator for out-of-range values
  ParticleBehavior &get(BehaviorType type);
  const ParticleBehavior &get(BehaviorType type) const;

private:
  static constexpr size_t BEHAVIOR_COUNT = static_cast<size_t>(BehaviorType::COUNT);

  std::array<std::unique_ptr<ParticleBehavior>, BEHAVIOR_COUNT> m_behaviors;
};

} // namespace AuraEngine

#endif // BEHAVIOR_REGISTRY_HPP
