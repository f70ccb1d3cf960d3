/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/SdlDrawingSurface.hpp"
#include "core/Logger.hpp"
#include "utils/ColorUtils.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace AuraEngine {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

} // namespace

SdlDrawingSurface::SdlDrawingSurface(SDL_Renderer *renderer, float width,
                                     float height)
    : m_renderer(renderer), m_width(width), m_height(height) {
  m_vertices.reserve(MAX_VERTICES_PER_BATCH);

  // Screen: 1 - (1 - src) * (1 - dst) with premultiplied source color
  m_screenBlend = SDL_ComposeCustomBlendMode(
      SDL_BLENDFACTOR_ONE, SDL_BLENDFACTOR_ONE_MINUS_SRC_COLOR,
      SDL_BLENDOPERATION_ADD, SDL_BLENDFACTOR_ONE,
      SDL_BLENDFACTOR_ONE_MINUS_SRC_ALPHA, SDL_BLENDOPERATION_ADD);

  if (!m_renderer) {
    RENDERER_ERROR("SdlDrawingSurface created without a renderer");
    return;
  }

  if (m_width <= 0.0f || m_height <= 0.0f) {
    int w = 0;
    int h = 0;
    if (SDL_GetCurrentRenderOutputSize(m_renderer, &w, &h)) {
      m_width = static_cast<float>(w);
      m_height = static_cast<float>(h);
    } else {
      RENDERER_ERROR(std::format("Failed to query render output size: {}", SDL_GetError()));
    }
  }
  applyBlendMode();
}

SdlDrawingSurface::~SdlDrawingSurface() { flush(); }

void SdlDrawingSurface::save() { m_stateStack.push_back(m_state); }

void SdlDrawingSurface::restore() {
  if (m_stateStack.empty()) {
    return;
  }
  flush();
  m_state = m_stateStack.back();
  m_stateStack.pop_back();
  applyBlendMode();
}

void SdlDrawingSurface::setFillStyle(uint32_t color) { m_state.fillColor = color; }

void SdlDrawingSurface::setStrokeStyle(uint32_t color) {
  m_state.strokeColor = color;
}

void SdlDrawingSurface::setGlobalAlpha(float alpha) {
  m_state.alpha = std::isfinite(alpha) ? std::clamp(alpha, 0.0f, 1.0f) : 0.0f;
}

void SdlDrawingSurface::setBlendMode(BlendMode mode) {
  if (mode == m_state.blend) {
    return;
  }
  // Blend mode applies to the whole batch
  flush();
  m_state.blend = mode;
  applyBlendMode();
}

void SdlDrawingSurface::beginPath() { m_path.clear(); }

void SdlDrawingSurface::arc(float x, float y, float radius) {
  if (std::isfinite(x) && std::isfinite(y) && std::isfinite(radius) && radius > 0.0f) {
    m_path.push_back(Circle{x, y, radius});
  }
}

void SdlDrawingSurface::fill() {
  if (!m_renderer || m_state.alpha <= 0.0f) {
    return;
  }

  const SDL_FColor color = vertexColor(m_state.fillColor);
  for (const Circle &circle : m_path) {
    const int segments = segmentsFor(circle.radius);
    if (m_vertices.size() + static_cast<size_t>(segments) * 3 > MAX_VERTICES_PER_BATCH) {
      flush();
    }

    const SDL_FPoint centre{circle.x, circle.y};
    SDL_FPoint previous{circle.x + circle.radius, circle.y};
    for (int i = 1; i <= segments; ++i) {
      const float angle = TWO_PI * static_cast<float>(i) / static_cast<float>(segments);
      const SDL_FPoint next{circle.x + std::cos(angle) * circle.radius,
                            circle.y + std::sin(angle) * circle.radius};
      m_vertices.push_back(SDL_Vertex{centre, color, SDL_FPoint{0.0f, 0.0f}});
      m_vertices.push_back(SDL_Vertex{previous, color, SDL_FPoint{0.0f, 0.0f}});
      m_vertices.push_back(SDL_Vertex{next, color, SDL_FPoint{0.0f, 0.0f}});
      previous = next;
    }
  }
}

void SdlDrawingSurface::stroke() {
  if (!m_renderer || m_state.alpha <= 0.0f || m_path.empty()) {
    return;
  }

  // Lines draw immediately, so pending fills must land first
  flush();

  const SDL_FColor color = vertexColor(m_state.strokeColor);
  SDL_SetRenderDrawColorFloat(m_renderer, color.r, color.g, color.b, color.a);

  for (const Circle &circle : m_path) {
    const int segments = segmentsFor(circle.radius);
    m_outline.clear();
    for (int i = 0; i <= segments; ++i) {
      const float angle = TWO_PI * static_cast<float>(i) / static_cast<float>(segments);
      m_outline.push_back(SDL_FPoint{circle.x + std::cos(angle) * circle.radius,
                                     circle.y + std::sin(angle) * circle.radius});
    }
    if (!SDL_RenderLines(m_renderer, m_outline.data(),
                         static_cast<int>(m_outline.size()))) {
      RENDERER_ERROR(std::format("SDL_RenderLines failed: {}", SDL_GetError()));
      return;
    }
  }
}

float SdlDrawingSurface::width() const { return m_width; }

float SdlDrawingSurface::height() const { return m_height; }

void SdlDrawingSurface::flush() {
  if (m_vertices.empty() || !m_renderer) {
    m_vertices.clear();
    return;
  }

  if (!SDL_RenderGeometry(m_renderer, nullptr, m_vertices.data(),
                          static_cast<int>(m_vertices.size()), nullptr, 0)) {
    RENDERER_ERROR(std::format("SDL_RenderGeometry failed: {}", SDL_GetError()));
  }
  m_vertices.clear();
}

SDL_FColor SdlDrawingSurface::vertexColor(uint32_t color) const {
  const float a = (ColorUtils::alpha(color) / 255.0f) * m_state.alpha;
  float r = ColorUtils::red(color) / 255.0f;
  float g = ColorUtils::green(color) / 255.0f;
  float b = ColorUtils::blue(color) / 255.0f;
  if (m_state.blend == BlendMode::Screen) {
    r *= a;
    g *= a;
    b *= a;
  }
  return SDL_FColor{r, g, b, a};
}

void SdlDrawingSurface::applyBlendMode() {
  if (!m_renderer) {
    return;
  }
  const SDL_BlendMode mode =
      m_state.blend == BlendMode::Screen ? m_screenBlend : SDL_BLENDMODE_BLEND;
  if (!SDL_SetRenderDrawBlendMode(m_renderer, mode)) {
    RENDERER_ERROR(std::format("SDL_SetRenderDrawBlendMode failed: {}", SDL_GetError()));
  }
}

int SdlDrawingSurface::segmentsFor(float radius) {
  return static_cast<int>(std::clamp(radius * 0.5f, 0.0f, 40.0f)) + 8;
}

} // namespace AuraEngine
