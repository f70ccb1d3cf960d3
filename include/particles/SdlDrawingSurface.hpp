/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_DRAWING_SURFACE_HPP
#define SDL_DRAWING_SURFACE_HPP

#include "particles/ParticleRenderer.hpp"
#include <SDL3/SDL.h>
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <vector>

namespace AuraEngine {

/**
 * @brief DrawingSurface over an SDL_Renderer
 *
 * Circles are tessellated into triangle fans and submitted with
 * SDL_RenderGeometry, batched until the vertex buffer fills or draw state
 * changes. The renderer is borrowed and must outlive the surface.
 */
class SdlDrawingSurface : public DrawingSurface {
public:
  /**
   * @param width,height Logical surface size; 0 queries the renderer output
   */
  explicit SdlDrawingSurface(SDL_Renderer *renderer, float width = 0.0f,
                             float height = 0.0f);
  ~SdlDrawingSurface() override;

  SdlDrawingSurface(const SdlDrawingSurface &) = delete;
  SdlDrawingSurface &operator=(const SdlDrawingSurface &) = delete;

  void save() override;
  void restore() override;

  void setFillStyle(uint32_t color) override;
  void setStrokeStyle(uint32_t color) override;
  void setGlobalAlpha(float alpha) override;
  void setBlendMode(BlendMode mode) override;

  void beginPath() override;
  void arc(float x, float y, float radius) override;
  void fill() override;
  void stroke() override;

  float width() const override;
  float height() const override;

  // Submits any pending geometry
  void flush();

private:
  struct State {
    uint32_t fillColor{0xFFFFFFFF};
    uint32_t strokeColor{0x000000FF};
    float alpha{1.0f};
    BlendMode blend{BlendMode::Normal};
  };

  struct Circle {
    float x;
    float y;
    float radius;
  };

  static constexpr size_t MAX_VERTICES_PER_BATCH = 6144;

  SDL_FColor vertexColor(uint32_t color) const;
  void applyBlendMode();
  static int segmentsFor(float radius);

  SDL_Renderer *m_renderer;
  float m_width;
  float m_height;

  State m_state;
  std::vector<State> m_stateStack;
  boost::container::small_vector<Circle, 4> m_path;
  std::vector<SDL_Vertex> m_vertices;
  std::vector<SDL_FPoint> m_outline;
  SDL_BlendMode m_screenBlend;
};

} // namespace AuraEngine

#endif // SDL_DRAWING_SURFACE_HPP
