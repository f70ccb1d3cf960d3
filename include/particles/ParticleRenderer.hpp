/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_RENDERER_HPP
#define PARTICLE_RENDERER_HPP

/**
 * @file ParticleRenderer.hpp
 * @brief Draw submission for a ParticleSystem onto a DrawingSurface
 *
 * Particles are split by depth: z < 0 draws in the background pass (behind
 * the character core), z >= 0 in the foreground pass. Within a pass,
 * particles are sorted by render traits so fill style changes only when the
 * color actually differs. The renderer never modifies simulation state.
 */

#include "particles/Particle.hpp"
#include "utils/Vector2D.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace AuraEngine {

class ParticleSystem;

enum class BlendMode : uint8_t { Normal, Screen };

/**
 * @brief Minimal 2D canvas capability used by the renderer
 */
class DrawingSurface {
public:
  virtual ~DrawingSurface() = default;

  virtual void save() = 0;
  virtual void restore() = 0;

  virtual void setFillStyle(uint32_t color) = 0;
  virtual void setStrokeStyle(uint32_t color) = 0;
  virtual void setGlobalAlpha(float alpha) = 0;
  virtual void setBlendMode(BlendMode mode) = 0;

  virtual void beginPath() = 0;
  // Full circle around (x, y)
  virtual void arc(float x, float y, float radius) = 0;
  virtual void fill() = 0;
  virtual void stroke() = 0;

  virtual float width() const = 0;
  virtual float height() const = 0;
};

/**
 * @brief Per-frame overlay effects driven by gestures
 *
 * Each enabled effect computes a multiplicative glow/size modulation. The
 * modulation is blended toward 1 by an envelope that reaches exactly zero at
 * progress >= 1, so a finished gesture leaves no residue.
 */
struct GestureTransform {
  bool fireflyEffect{false};
  bool flickerEffect{false};
  bool shimmerEffect{false};
  bool glowEffect{false};

  float time{0.0f};          // seconds
  float particleGlow{0.0f};  // effect intensity, 0 selects the effect default
  float shimmerWave{0.0f};
  float glowProgress{0.0f};  // radial glow burst progress [0, 1]
  float progress{0.0f};      // gesture progress driving the envelope
};

/**
 * @brief Resolved overlay modulation for one particle
 */
struct OverlayModulation {
  float glow{1.0f};      // opacity / glow radius factor
  float sizeScale{1.0f};
  float glowSizeMultiplier{0.0f};
  bool forceGlow{false};
};

struct RenderStats {
  size_t drawn{0};
  size_t culled{0};  // outside the surface margin
  size_t skipped{0}; // dead or non-finite
  size_t fillStyleChanges{0};

  RenderStats &operator+=(const RenderStats &other) {
    drawn += other.drawn;
    culled += other.culled;
    skipped += other.skipped;
    fillStyleChanges += other.fillStyleChanges;
    return *this;
  }
};

enum class RenderLayer : uint8_t { Background, Foreground };

class ParticleRenderer {
public:
  static constexpr float CULL_MARGIN = 50.0f;

  RenderStats render(const ParticleSystem &system, DrawingSurface &surface,
                     const GestureTransform *transform = nullptr);
  RenderStats renderBackground(const ParticleSystem &system, DrawingSurface &surface,
                               const GestureTransform *transform = nullptr);
  RenderStats renderForeground(const ParticleSystem &system, DrawingSurface &surface,
                               const GestureTransform *transform = nullptr);
  RenderStats renderLayer(const ParticleSystem &system, DrawingSurface &surface,
                          RenderLayer layer,
                          const GestureTransform *transform = nullptr);

  /**
   * @brief Overlay modulation for a particle at the current frame
   * @param surfaceCenter Origin of the shimmer and glow waves
   */
  static OverlayModulation computeOverlay(const Particle &particle,
                                          const GestureTransform &transform,
                                          const Vector2D &surfaceCenter);

  // 1 while the gesture runs, easing to exactly 0 at progress >= 1
  static float overlayEnvelope(float progress);

private:
  void drawParticle(const Particle &particle, DrawingSurface &surface,
                    const GestureTransform *transform,
                    const Vector2D &surfaceCenter, RenderStats &stats);

  std::vector<const Particle *> m_visible; // reused between frames
  uint32_t m_lastFillStyle{0};
  bool m_hasFillStyle{false};
};

} // namespace AuraEngine

#endif // PARTICLE_RENDERER_HPP
