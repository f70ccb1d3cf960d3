/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/BehaviorRegistry.hpp"
#include "particles/behaviors/ChaoticBehaviors.hpp"
#include "particles/behaviors/DriftBehaviors.hpp"
#include "particles/behaviors/OrbitalBehaviors.hpp"
#include "particles/behaviors/RadialBehaviors.hpp"

namespace AuraEngine {

namespace {

constexpr size_t slot(BehaviorType type) { return static_cast<size_t>(type); }

} // namespace

BehaviorRegistry::BehaviorRegistry()
    : BehaviorRegistry(DriftTuning{}, RadialTuning{}, OrbitalTuning{},
                       ChaoticTuning{}) {}

BehaviorRegistry::BehaviorRegistry(const DriftTuning &drift,
                                   const RadialTuning &radial,
                                   const OrbitalTuning &orbital,
                                   const ChaoticTuning &chaotic) {
  m_behaviors[slot(BehaviorType::Ambient)] = std::make_unique<AmbientBehavior>(drift);
  m_behaviors[slot(BehaviorType::Resting)] = std::make_unique<RestingBehavior>(drift);
  m_behaviors[slot(BehaviorType::Rising)] = std::make_unique<RisingBehavior>(drift);
  m_behaviors[slot(BehaviorType::Falling)] = std::make_unique<FallingBehavior>(drift);

  m_behaviors[slot(BehaviorType::Burst)] = std::make_unique<BurstBehavior>(radial);
  m_behaviors[slot(BehaviorType::Scattering)] =
      std::make_unique<ScatteringBehavior>(radial);
  m_behaviors[slot(BehaviorType::Repelling)] =
      std::make_unique<RepellingBehavior>(radial);

  m_behaviors[slot(BehaviorType::Orbiting)] =
      std::make_unique<OrbitingBehavior>(orbital);
  m_behaviors[slot(BehaviorType::MeditationSwirl)] =
      std::make_unique<MeditationSwirlBehavior>(orbital);

  m_behaviors[slot(BehaviorType::Aggressive)] =
      std::make_unique<AggressiveBehavior>(chaotic);
  m_behaviors[slot(BehaviorType::Spaz)] = std::make_unique<SpazBehavior>(chaotic);
  m_behaviors[slot(BehaviorType::Glitchy)] = std::make_unique<GlitchyBehavior>(chaotic);
}

ParticleBehavior &BehaviorRegistry::get(BehaviorType type) {
  const size_t index = slot(type);
  return *m_behaviors[index < BEHAVIOR_COUNT ? index : slot(BehaviorType::Ambient)];
}

const ParticleBehavior &BehaviorRegistry::get(BehaviorType type) const {
  const size_t index = slot(type);
  return *m_behaviors[index < BEHAVIOR_COUNT ? index : slot(BehaviorType::Ambient)];
}

} // namespace AuraEngine
