/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/behaviors/ChaoticBehaviors.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace AuraEngine {

namespace {

constexpr float PI = std::numbers::pi_v<float>;
constexpr float TWO_PI = 2.0f * PI;

Vector2D randomKick(BehaviorContext &ctx, float magnitude) {
  return Vector2D::fromAngle(ctx.random(0.0f, TWO_PI), ctx.random(0.0f, magnitude));
}

} // namespace

void AggressiveBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                                    const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  const float speed =
      ctx.random(m_tuning.aggressiveSpeedMin, m_tuning.aggressiveSpeedMax);
  particle.velocity = Vector2D::fromAngle(launchAngle(spawn, ctx), speed);
  particle.lifeDecay =
      ctx.random(m_tuning.aggressiveLifeDecayMin, m_tuning.aggressiveLifeDecayMax);
}

void AggressiveBehavior::update(Particle &particle, float dt,
                                BehaviorContext &ctx) const {
  particle.velocity += randomKick(ctx, m_tuning.aggressiveJitter * dt);
}

void SpazBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                              const SpawnPoint &spawn) {
  applyPalette(particle, ctx);

  const float speed = ctx.random(m_tuning.spazSpeedMin, m_tuning.spazSpeedMax);
  particle.velocity = Vector2D::fromAngle(launchAngle(spawn, ctx), speed);
  particle.lifeDecay =
      ctx.random(m_tuning.spazLifeDecayMin, m_tuning.spazLifeDecayMax);
}

void SpazBehavior::update(Particle &particle, float dt,
                          BehaviorContext &ctx) const {
  const float flipChance =
      1.0f - std::pow(1.0f - m_tuning.spazFlipChance, std::min(dt, 60.0f));
  if (ctx.chance(flipChance)) {
    particle.velocity = particle.velocity.perpendicular() * (ctx.chance(0.5f) ? 1.0f : -1.0f);
  }
  particle.velocity += randomKick(ctx, m_tuning.spazJitter * dt);
}

void GlitchyBehavior::initialize(Particle &particle, BehaviorContext &ctx,
                                 [[maybe_unused]] const SpawnPoint &spawn) {
  applyPalette(particle, ctx);
  particle.behaviorState = std::monostate{};
  ensureState(particle, ctx);

  particle.velocity = Vector2D();
  particle.lifeDecay = m_tuning.glitchLifeDecay;
  particle.hasGlow = ctx.chance(0.5f);
  particle.glowSizeMultiplier = particle.hasGlow ? 2.0f + ctx.unit() : 0.0f;
}

GlitchState &GlitchyBehavior::ensureState(Particle &particle,
                                          BehaviorContext &ctx) const {
  if (auto *state = std::get_if<GlitchState>(&particle.behaviorState)) {
    return *state;
  }

  GlitchState state;
  state.orbit.angle = ctx.random(0.0f, TWO_PI);
  state.orbit.radius =
      ctx.random(m_tuning.glitchOrbitRadiusMin, m_tuning.glitchOrbitRadiusMax);
  state.orbit.speed =
      ctx.random(m_tuning.glitchOrbitSpeedMin, m_tuning.glitchOrbitSpeedMax);

  state.nextGlitch = ctx.random(100.0f, 600.0f);
  state.nextStutter = ctx.random(50.0f, 250.0f);

  state.beatPhase = ctx.random(0.0f, TWO_PI);
  state.beatFrequency = ctx.random(0.05f, 0.08f);

  state.rgbSplit = ctx.chance(0.4f);
  state.rgbPhase = ctx.random(0.0f, TWO_PI);
  return particle.behaviorState.emplace<GlitchState>(state);
}

void GlitchyBehavior::updateTimers(Particle &particle, GlitchState &state,
                                   float dt, BehaviorContext &ctx) const {
  const float elapsedMs = dt * FRAME_MS;
  state.glitchTimer += elapsedMs;
  state.stutterTimer += elapsedMs;

  if (state.stutterTimer > state.nextStutter) {
    state.stutterTimer = 0.0f;
    if (!state.isFrozen) {
      state.isFrozen = true;
      state.nextStutter = ctx.random(20.0f, 60.0f);
    } else {
      state.isFrozen = false;
      state.nextStutter = ctx.random(100.0f, 400.0f);
      if (ctx.chance(m_tuning.glitchJumpChance)) {
        const float j = m_tuning.glitchJumpRange * 0.5f;
        particle.position += Vector2D(ctx.random(-j, j), ctx.random(-j, j));
      }
    }
  }

  if (!state.isGlitching && state.glitchTimer > state.nextGlitch) {
    const float o = m_tuning.glitchOffsetRange * 0.5f;
    state.isGlitching = true;
    state.glitchDuration = ctx.random(50.0f, 150.0f);
    state.glitchOffset = Vector2D(ctx.random(-o, o), ctx.random(-o, o));
    state.glitchTimer = 0.0f;
    if (ctx.chance(0.5f)) {
      applyPalette(particle, ctx);
    }
  } else if (state.isGlitching && state.glitchTimer > state.glitchDuration) {
    state.isGlitching = false;
    state.glitchTimer = 0.0f;
    state.nextGlitch = ctx.random(200.0f, 1000.0f);
    state.glitchOffset = Vector2D();
  }

  // Drop cycle repeats every 4 pi of beat phase
  state.beatPhase = std::fmod(state.beatPhase + state.beatFrequency * dt, 4.0f * PI);
  if (state.beatPhase < PI * 0.5f) {
    state.dropIntensity = std::min(1.0f, state.dropIntensity + dt * 0.1f);
  } else {
    state.dropIntensity = std::max(0.0f, state.dropIntensity - dt * 0.05f);
  }
}

void GlitchyBehavior::update(Particle &particle, float dt,
                             BehaviorContext &ctx) const {
  GlitchState &state = ensureState(particle, ctx);
  updateTimers(particle, state, dt, ctx);

  const float beat = std::sin(state.beatPhase) * 0.5f + 0.5f;

  if (state.isFrozen) {
    particle.velocity = Vector2D(ctx.random(-0.25f, 0.25f), ctx.random(-0.25f, 0.25f));
  } else {
    state.orbit.angle =
        wrapAngle(state.orbit.angle + state.orbit.speed * dt * (1.0f + beat * 0.5f));

    const float wobble =
        state.orbit.radius *
        (1.0f + state.dropIntensity * 0.3f * std::sin(state.beatPhase * 4.0f));
    Vector2D target = ctx.center + Vector2D(std::cos(state.orbit.angle) * wobble,
                                            std::sin(state.orbit.angle) * wobble * 0.6f);

    if (state.isGlitching) {
      target += state.glitchOffset * (ctx.unit() * 0.5f);
    }
    if (state.rgbSplit) {
      const float split = 3.0f * (1.0f + state.dropIntensity);
      target += Vector2D(std::sin(state.rgbPhase) * split, std::cos(state.rgbPhase) * split);
      state.rgbPhase = wrapAngle(state.rgbPhase + 0.1f * dt);
    }
    if (state.dropIntensity > 0.8f && ctx.chance(0.1f)) {
      target += Vector2D(ctx.random(-5.0f, 5.0f), ctx.random(-5.0f, 5.0f));
    }

    const float smoothing =
        state.isGlitching ? m_tuning.glitchSmoothingActive : m_tuning.glitchSmoothing;
    trackTarget(particle, target, smoothing, dt);
    particle.velocity += Vector2D(ctx.random(-beat, beat), ctx.random(-beat, beat));
  }

  if (ctx.chance(0.02f)) {
    particle.opacity = particle.baseOpacity * (0.1f + ctx.unit() * 0.9f);
  }
  particle.size =
      particle.baseSize * (1.0f + beat * 0.3f + state.dropIntensity * 0.5f);
}

} // namespace AuraEngine
