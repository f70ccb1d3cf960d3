/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ParticleBehaviorTest
#include <boost/test/unit_test.hpp>

#include "particles/BehaviorRegistry.hpp"
#include "particles/Containment.hpp"
#include "particles/behaviors/ChaoticBehaviors.hpp"
#include "particles/behaviors/DriftBehaviors.hpp"
#include "particles/behaviors/OrbitalBehaviors.hpp"
#include "particles/behaviors/RadialBehaviors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

using namespace AuraEngine;

struct ParticleBehaviorFixture {
  ParticleBehaviorFixture()
      : center(400.0f, 300.0f), rng(1234),
        ctx(center, center, rng, palette) {}

  Particle makeParticle(BehaviorType type, float x, float y) {
    Particle particle;
    particle.reset(x, y, type);
    particle.randomizeTraits(rng);
    registry.get(type).initialize(particle, ctx, SpawnPoint{x, y, std::nullopt});
    return particle;
  }

  // Same order as the orchestrator: behavior, integrate, invariants
  void advance(Particle &particle, float dt) {
    const ParticleBehavior &behavior = registry.get(particle.behavior);
    behavior.step(particle, dt, ctx);
    particle.position += particle.velocity * dt;
    behavior.enforceInvariants(particle, ctx);
  }

  Vector2D center;
  EmotionPalette palette;
  std::mt19937 rng;
  BehaviorContext ctx;
  BehaviorRegistry registry;
};

// Test that the registry hands out the evaluator for each type
BOOST_FIXTURE_TEST_CASE(TestRegistryCoversAllTypes, ParticleBehaviorFixture) {
  for (int b = 0; b < static_cast<int>(BehaviorType::COUNT); ++b) {
    const auto type = static_cast<BehaviorType>(b);
    const ParticleBehavior &behavior = registry.get(type);
    BOOST_CHECK(behavior.getType() == type);
    BOOST_CHECK_EQUAL(behavior.getName(), behaviorTypeToString(type));
    BOOST_CHECK_GT(behavior.getDecay(), 0.0f);
    BOOST_CHECK_LT(behavior.getDecay(), 1.0f);
  }

  // Out-of-range values fall back to ambient
  BOOST_CHECK(registry.get(static_cast<BehaviorType>(200)).getType() ==
              BehaviorType::Ambient);
}

BOOST_AUTO_TEST_CASE(TestBehaviorNames) {
  BOOST_CHECK(parseBehaviorType("meditation_swirl") == BehaviorType::MeditationSwirl);
  BOOST_CHECK(parseBehaviorType("spaz") == BehaviorType::Spaz);
  BOOST_CHECK(!parseBehaviorType("hover").has_value());
  BOOST_CHECK(behaviorTypeFromString("hover") == BehaviorType::Ambient);
  BOOST_CHECK_EQUAL(std::string(behaviorTypeToString(BehaviorType::Falling)), "falling");
}

// Test that falling particles end up lower on screen
BOOST_FIXTURE_TEST_CASE(TestFallingMovesDown, ParticleBehaviorFixture) {
  std::vector<Particle> particles;
  float initialY = 0.0f;
  for (int i = 0; i < 10; ++i) {
    particles.push_back(makeParticle(BehaviorType::Falling, 380.0f + i * 4.0f, 300.0f));
    initialY += particles.back().position.getY();
  }

  float finalY = 0.0f;
  for (auto &particle : particles) {
    for (int frame = 0; frame < 10; ++frame) {
      advance(particle, 16.0f / 16.67f);
    }
    BOOST_CHECK_GT(particle.velocity.getY(), 0.0f);
    finalY += particle.position.getY();
  }
  BOOST_CHECK_GE(finalY / 10.0f, initialY / 10.0f);
}

BOOST_FIXTURE_TEST_CASE(TestRisingMovesUp, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Rising, 400.0f, 300.0f);
  for (int frame = 0; frame < 30; ++frame) {
    advance(particle, 1.0f);
  }
  BOOST_CHECK_LT(particle.position.getY(), 300.0f);
  BOOST_CHECK_LT(particle.velocity.getY(), 0.0f);
}

// Test that vertical speed levels off instead of growing forever
BOOST_FIXTURE_TEST_CASE(TestFallingReachesTerminalSpeed, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Falling, 400.0f, 300.0f);
  for (int frame = 0; frame < 2000; ++frame) {
    advance(particle, 1.0f);
  }
  const DriftTuning tuning;
  const float terminal = tuning.verticalAcceleration * tuning.verticalDecay /
                         (1.0f - tuning.verticalDecay);
  BOOST_CHECK_CLOSE(particle.velocity.getY(), terminal, 1.0f);
}

// Test that repelling particles never head back toward the center
BOOST_FIXTURE_TEST_CASE(TestRepellingNeverMovesInward, ParticleBehaviorFixture) {
  ContainmentBounds bounds{300.0f, 200.0f, 200.0f, 200.0f, 0.8f};
  std::vector<Particle> particles;
  for (int i = 0; i < 8; ++i) {
    const float angle = static_cast<float>(i) * 0.785f;
    particles.push_back(makeParticle(BehaviorType::Repelling,
                                     400.0f + std::cos(angle) * 40.0f,
                                     300.0f + std::sin(angle) * 40.0f));
  }

  const ParticleBehavior &repelling = registry.get(BehaviorType::Repelling);
  for (int frame = 0; frame < 15; ++frame) {
    for (auto &particle : particles) {
      repelling.step(particle, 1.0f, ctx);
      particle.position += particle.velocity;
      // Bouncing off the walls flips velocity inward; invariants run after
      Containment::apply(particle, bounds);
      repelling.enforceInvariants(particle, ctx);

      const Vector2D radial = particle.position - center;
      BOOST_CHECK_GE(radial.dot(particle.velocity), -1e-3f);
    }
  }
}

BOOST_FIXTURE_TEST_CASE(TestRepellingStripsInwardComponent, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Repelling, 500.0f, 300.0f);
  particle.velocity = Vector2D(-3.0f, 2.0f);

  registry.get(BehaviorType::Repelling).enforceInvariants(particle, ctx);

  BOOST_CHECK_SMALL(particle.velocity.getX(), 0.0001f);
  BOOST_CHECK_CLOSE(particle.velocity.getY(), 2.0f, 0.001f);
}

// Test that resting particles barely move over many ticks
BOOST_FIXTURE_TEST_CASE(TestRestingDriftStaysSmall, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Resting, 450.0f, 320.0f);
  const Vector2D start = particle.position;
  for (int frame = 0; frame < 300; ++frame) {
    advance(particle, 1.0f);
  }
  BOOST_CHECK_LT(Vector2D::distance(start, particle.position), 10.0f);
}

// Test that orbiting keeps a steady distance from the center
BOOST_FIXTURE_TEST_CASE(TestOrbitDistanceIsStable, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Orbiting, 500.0f, 300.0f);
  const auto *orbit = std::get_if<OrbitState>(&particle.behaviorState);
  BOOST_REQUIRE(orbit != nullptr);
  const float radius = orbit->radius;
  BOOST_CHECK_CLOSE(radius, 100.0f, 0.01f);

  float minDistance = std::numeric_limits<float>::max();
  float maxDistance = 0.0f;
  for (int frame = 0; frame < 600; ++frame) {
    advance(particle, 1.0f);
    const float d = Vector2D::distance(particle.position, center);
    minDistance = std::min(minDistance, d);
    maxDistance = std::max(maxDistance, d);
  }
  BOOST_CHECK_GT(minDistance, radius * 0.85f);
  BOOST_CHECK_LT(maxDistance, radius * 1.05f);
}

// Test that orbiting state survives variable frame times
BOOST_FIXTURE_TEST_CASE(TestOrbitFrameRateIndependent, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Orbiting, 400.0f, 200.0f);
  const float dts[] = {0.5f, 2.0f, 1.0f, 3.0f, 0.25f};
  for (int frame = 0; frame < 400; ++frame) {
    advance(particle, dts[frame % 5]);
  }
  const float d = Vector2D::distance(particle.position, center);
  BOOST_CHECK(d > 70.0f && d < 105.0f);
}

// Test that the swirl follows a moving attractor
BOOST_FIXTURE_TEST_CASE(TestSwirlFollowsAttractor, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::MeditationSwirl, 460.0f, 300.0f);
  BOOST_REQUIRE(std::holds_alternative<SwirlState>(particle.behaviorState));

  for (int frame = 0; frame < 200; ++frame) {
    ctx.attractor = Vector2D(400.0f + frame * 1.0f, 300.0f);
    advance(particle, 1.0f);
  }
  BOOST_CHECK_LT(Vector2D::distance(particle.position, ctx.attractor), 150.0f);
  BOOST_CHECK_GT(particle.position.getX(), 450.0f);
}

// Test that a gesture override switching behavior builds its own state
BOOST_FIXTURE_TEST_CASE(TestOverrideBuildsMissingState, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Ambient, 450.0f, 300.0f);
  BOOST_CHECK(std::holds_alternative<std::monostate>(particle.behaviorState));

  registry.get(BehaviorType::Orbiting).step(particle, 1.0f, ctx);
  const auto *orbit = std::get_if<OrbitState>(&particle.behaviorState);
  BOOST_REQUIRE(orbit != nullptr);
  BOOST_CHECK_GE(orbit->radius, OrbitalTuning{}.orbitMinRadius);
}

// Test that a huge frame time keeps every behavior finite
BOOST_FIXTURE_TEST_CASE(TestHugeFrameTimeStaysFinite, ParticleBehaviorFixture) {
  const float dt = 10000.0f / 16.67f;
  for (int b = 0; b < static_cast<int>(BehaviorType::COUNT); ++b) {
    Particle particle = makeParticle(static_cast<BehaviorType>(b), 420.0f, 310.0f);
    for (int frame = 0; frame < 3; ++frame) {
      advance(particle, dt);
      BOOST_CHECK(particle.position.isFinite());
      BOOST_CHECK(particle.velocity.isFinite());
      BOOST_CHECK(std::isfinite(particle.size));
    }
  }
}

// Test that a non-positive dt leaves the particle untouched
BOOST_FIXTURE_TEST_CASE(TestZeroDtIsNoOp, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Aggressive, 450.0f, 300.0f);
  const Vector2D velocity = particle.velocity;

  registry.get(BehaviorType::Aggressive).step(particle, 0.0f, ctx);
  registry.get(BehaviorType::Aggressive).step(particle, -5.0f, ctx);
  registry.get(BehaviorType::Aggressive)
      .step(particle, std::numeric_limits<float>::quiet_NaN(), ctx);

  BOOST_CHECK_EQUAL(particle.velocity.getX(), velocity.getX());
  BOOST_CHECK_EQUAL(particle.velocity.getY(), velocity.getY());
}

BOOST_FIXTURE_TEST_CASE(TestPaletteTintsSpawns, ParticleBehaviorFixture) {
  palette.push_back(WeightedColor{0x336699FF, 1.0f});
  for (int b = 0; b < static_cast<int>(BehaviorType::COUNT); ++b) {
    Particle particle = makeParticle(static_cast<BehaviorType>(b), 420.0f, 310.0f);
    BOOST_CHECK_EQUAL(particle.color, 0x336699FFu);
  }
}

// Test that containment clamps and reflects with restitution
BOOST_AUTO_TEST_CASE(TestContainmentBounce) {
  ContainmentBounds bounds{0.0f, 0.0f, 100.0f, 100.0f, 0.5f};
  BOOST_CHECK(bounds.isValid());

  Particle particle;
  particle.reset(120.0f, -10.0f, BehaviorType::Ambient);
  particle.velocity = Vector2D(4.0f, -2.0f);

  BOOST_CHECK(Containment::apply(particle, bounds));
  BOOST_CHECK_EQUAL(particle.position.getX(), 100.0f);
  BOOST_CHECK_EQUAL(particle.position.getY(), 0.0f);
  BOOST_CHECK_CLOSE(particle.velocity.getX(), -2.0f, 0.001f);
  BOOST_CHECK_CLOSE(particle.velocity.getY(), 1.0f, 0.001f);

  // Inside: untouched
  particle.reset(50.0f, 50.0f, BehaviorType::Ambient);
  particle.velocity = Vector2D(1.0f, 1.0f);
  BOOST_CHECK(!Containment::apply(particle, bounds));
  BOOST_CHECK_EQUAL(particle.velocity.getX(), 1.0f);

  ContainmentBounds broken{0.0f, 0.0f, -5.0f, 10.0f};
  BOOST_CHECK(!broken.isValid());
  ContainmentBounds nan{std::numeric_limits<float>::quiet_NaN(), 0.0f, 5.0f, 5.0f};
  BOOST_CHECK(!nan.isValid());
}

// Test lifecycle: life only decreases and opacity fades in then out
BOOST_AUTO_TEST_CASE(TestLifecycleMonotonic) {
  Particle particle;
  particle.reset(0.0f, 0.0f, BehaviorType::Ambient);
  particle.lifeDecay = 0.05f;

  float lastLife = particle.life;
  float peakOpacity = 0.0f;
  for (int frame = 0; frame < 30; ++frame) {
    particle.updateLifecycle(1.0f);
    BOOST_CHECK_LE(particle.life, lastLife);
    BOOST_CHECK(particle.age >= 0.0f && particle.age <= 1.0f);
    BOOST_CHECK_LE(particle.opacity, particle.baseOpacity + 0.0001f);
    peakOpacity = std::max(peakOpacity, particle.opacity);
    lastLife = particle.life;
  }
  BOOST_CHECK(!particle.isAlive());
  BOOST_CHECK_EQUAL(particle.opacity, 0.0f);
  BOOST_CHECK_CLOSE(peakOpacity, particle.baseOpacity, 0.01f);

  // Negative dt never restores life
  particle.updateLifecycle(-10.0f);
  BOOST_CHECK_EQUAL(particle.life, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestSanitizeRepairsNonFinite) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  Particle particle;
  particle.reset(10.0f, 10.0f, BehaviorType::Orbiting);
  particle.behaviorState = OrbitState{nan, 50.0f, 0.02f};
  particle.position = Vector2D(nan, 5.0f);
  particle.size = std::numeric_limits<float>::infinity();
  particle.opacity = nan;

  const int repaired = particle.sanitize(Vector2D(7.0f, 8.0f));
  BOOST_CHECK_EQUAL(repaired, 4);
  BOOST_CHECK_EQUAL(particle.position.getX(), 7.0f);
  BOOST_CHECK_EQUAL(particle.position.getY(), 8.0f);
  BOOST_CHECK(std::isfinite(particle.size));
  BOOST_CHECK_EQUAL(particle.opacity, 0.0f);
  BOOST_CHECK_EQUAL(std::get<OrbitState>(particle.behaviorState).angle, 0.0f);

  // A clean particle reports nothing
  BOOST_CHECK_EQUAL(particle.sanitize(Vector2D()), 0);
}

// Test that glitch timers count the same milliseconds as the system clock
BOOST_FIXTURE_TEST_CASE(TestGlitchTimersUseFrameLength, ParticleBehaviorFixture) {
  Particle particle = makeParticle(BehaviorType::Glitchy, 430.0f, 300.0f);
  auto *state = std::get_if<GlitchState>(&particle.behaviorState);
  BOOST_REQUIRE(state != nullptr);

  state->glitchTimer = 0.0f;
  state->nextGlitch = 1.0e6f;
  state->isGlitching = false;
  state->stutterTimer = 0.0f;
  state->nextStutter = 1.0e6f;
  state->isFrozen = false;

  // 60 normalized frames are one second of wall time
  for (int frame = 0; frame < 60; ++frame) {
    advance(particle, 1.0f);
  }

  state = std::get_if<GlitchState>(&particle.behaviorState);
  BOOST_REQUIRE(state != nullptr);
  BOOST_CHECK_CLOSE(state->glitchTimer, 60.0f * FRAME_MS, 0.01f);
  BOOST_CHECK_CLOSE(state->stutterTimer, 60.0f * FRAME_MS, 0.01f);
  BOOST_CHECK_CLOSE(60.0f * FRAME_MS, 1000.2f, 0.01f);
}
