/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticleRenderer.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleSystem.hpp"
#include "utils/ColorUtils.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <numbers>

namespace AuraEngine {

namespace {

constexpr float PI = std::numbers::pi_v<float>;
constexpr float TWO_PI = 2.0f * PI;
constexpr float ENVELOPE_RELEASE = 0.1f; // final share of progress spent easing out

float intensityOr(float value, float fallback) {
  return std::isfinite(value) && value > 0.0f ? value : fallback;
}

bool drawOrder(const Particle *a, const Particle *b) {
  if (a->isCellShaded != b->isCellShaded) {
    return a->isCellShaded;
  }
  if (a->hasGlow != b->hasGlow) {
    return a->hasGlow;
  }
  return a->color < b->color;
}

} // namespace

float ParticleRenderer::overlayEnvelope(float progress) {
  if (!std::isfinite(progress) || progress >= 1.0f) {
    return 0.0f;
  }
  return std::clamp((1.0f - progress) / ENVELOPE_RELEASE, 0.0f, 1.0f);
}

OverlayModulation ParticleRenderer::computeOverlay(const Particle &particle,
                                                   const GestureTransform &transform,
                                                   const Vector2D &surfaceCenter) {
  OverlayModulation result;
  result.glowSizeMultiplier = particle.glowSizeMultiplier;

  const float envelope = overlayEnvelope(transform.progress);
  if (envelope <= 0.0f) {
    return result;
  }

  const float x = particle.position.getX();
  const float y = particle.position.getY();
  const float t = std::isfinite(transform.time) ? transform.time : 0.0f;
  float glow = 1.0f;

  if (transform.fireflyEffect) {
    const float phase = std::fmod(x * 0.01f + y * 0.01f + particle.size * 0.1f, TWO_PI);
    const float intensity = intensityOr(transform.particleGlow, 2.0f);
    glow = 0.3f + std::max(0.0f, std::sin(t * 3.0f + phase)) * intensity;
  }

  if (transform.flickerEffect) {
    const float phase = std::fmod(x * 0.02f + y * 0.02f, TWO_PI);
    const float intensity = intensityOr(transform.particleGlow, 2.0f);
    glow = 0.5f + std::sin(t * 12.0f + phase) * intensity * 0.5f;
  }

  if (transform.shimmerEffect) {
    const float distance = Vector2D::distance(particle.position, surfaceCenter);
    const float intensity = intensityOr(transform.particleGlow, 1.2f);
    const float wave = std::sin(t * 3.0f - distance / 200.0f + transform.shimmerWave);
    glow = 1.0f + wave * 0.15f * intensity;
  }

  if (transform.glowEffect) {
    const float progress = std::clamp(transform.glowProgress, 0.0f, 1.0f);
    const float intensity = intensityOr(transform.particleGlow, 2.0f);
    const float distance = Vector2D::distance(particle.position, surfaceCenter);
    const float radiateDelay = std::min(distance / 300.0f * 0.3f, 0.5f);
    const float local = std::max(0.0f, (progress - radiateDelay) / (1.0f - radiateDelay));
    const float burst = std::sin(local * PI) * envelope;

    result.forceGlow = true;
    result.glowSizeMultiplier =
        std::max(3.0f, particle.glowSizeMultiplier) + burst * intensity * 3.0f;
    result.sizeScale = 1.0f + burst * 0.3f;
  }

  result.glow = 1.0f + (glow - 1.0f) * envelope;
  return result;
}

RenderStats ParticleRenderer::render(const ParticleSystem &system,
                                     DrawingSurface &surface,
                                     const GestureTransform *transform) {
  RenderStats stats = renderBackground(system, surface, transform);
  stats += renderForeground(system, surface, transform);
  return stats;
}

RenderStats ParticleRenderer::renderBackground(const ParticleSystem &system,
                                               DrawingSurface &surface,
                                               const GestureTransform *transform) {
  return renderLayer(system, surface, RenderLayer::Background, transform);
}

RenderStats ParticleRenderer::renderForeground(const ParticleSystem &system,
                                               DrawingSurface &surface,
                                               const GestureTransform *transform) {
  return renderLayer(system, surface, RenderLayer::Foreground, transform);
}

RenderStats ParticleRenderer::renderLayer(const ParticleSystem &system,
                                          DrawingSurface &surface, RenderLayer layer,
                                          const GestureTransform *transform) {
  RenderStats stats;
  if (system.getActiveCount() == 0) {
    return stats;
  }

  try {
    const float width = surface.width();
    const float height = surface.height();
    const bool foreground = layer == RenderLayer::Foreground;

    m_visible.clear();
    system.forEachParticle([&](const Particle &particle) {
      if ((particle.z >= 0.0f) != foreground) {
        return;
      }
      if (!particle.isAlive() || !particle.position.isFinite() ||
          !std::isfinite(particle.size) || !std::isfinite(particle.opacity)) {
        ++stats.skipped;
        return;
      }
      const float x = particle.position.getX();
      const float y = particle.position.getY();
      if (x < -CULL_MARGIN || x > width + CULL_MARGIN || y < -CULL_MARGIN ||
          y > height + CULL_MARGIN) {
        ++stats.culled;
        return;
      }
      m_visible.push_back(&particle);
    });

    if (m_visible.empty()) {
      return stats;
    }

    std::stable_sort(m_visible.begin(), m_visible.end(), drawOrder);

    const Vector2D center(width * 0.5f, height * 0.5f);
    m_hasFillStyle = false;

    surface.save();
    for (const Particle *particle : m_visible) {
      drawParticle(*particle, surface, transform, center, stats);
    }
    surface.restore();
  } catch (const std::exception &e) {
    RENDERER_ERROR(std::format("Exception in ParticleRenderer::renderLayer: {}", e.what()));
  }

  return stats;
}

void ParticleRenderer::drawParticle(const Particle &particle, DrawingSurface &surface,
                                    const GestureTransform *transform,
                                    const Vector2D &center, RenderStats &stats) {
  OverlayModulation overlay;
  overlay.glowSizeMultiplier = particle.glowSizeMultiplier;
  if (transform) {
    overlay = computeOverlay(particle, *transform, center);
  }

  const float x = particle.position.getX();
  const float y = particle.position.getY();
  const float size =
      std::max(0.1f, particle.getDepthAdjustedSize() * overlay.sizeScale);
  const float glow = std::max(0.0f, overlay.glow);

  if (!m_hasFillStyle || m_lastFillStyle != particle.color) {
    surface.setFillStyle(particle.color);
    m_lastFillStyle = particle.color;
    m_hasFillStyle = true;
    ++stats.fillStyleChanges;
  }

  if (particle.isCellShaded) {
    // Flat disc with a darker outline
    surface.setGlobalAlpha(std::clamp(particle.opacity, 0.0f, 1.0f));
    surface.beginPath();
    surface.arc(x, y, size);
    surface.fill();
    surface.setStrokeStyle(ColorUtils::interpolateColor(
        particle.color, ColorUtils::withAlpha(0x00000000, ColorUtils::alpha(particle.color)),
        0.5f));
    surface.stroke();
    ++stats.drawn;
    return;
  }

  if (particle.hasGlow || overlay.forceGlow || glow > 1.0f) {
    const float multiplier =
        overlay.glowSizeMultiplier > 0.0f ? overlay.glowSizeMultiplier : 1.5f;
    const float glowRadius = std::max(0.1f, size * multiplier * glow);

    surface.setBlendMode(BlendMode::Screen);
    surface.setGlobalAlpha(std::clamp(particle.opacity * 0.15f * glow, 0.0f, 1.0f));
    surface.beginPath();
    surface.arc(x, y, glowRadius);
    surface.fill();

    surface.setGlobalAlpha(std::clamp(particle.opacity * 0.25f * glow, 0.0f, 1.0f));
    surface.beginPath();
    surface.arc(x, y, glowRadius * 0.6f);
    surface.fill();
    surface.setBlendMode(BlendMode::Normal);
  }

  surface.setGlobalAlpha(std::clamp(
      particle.opacity * particle.baseOpacity * 0.6f * std::min(2.0f, glow), 0.0f, 1.0f));
  surface.beginPath();
  surface.arc(x, y, size);
  surface.fill();
  ++stats.drawn;
}

} // namespace AuraEngine
