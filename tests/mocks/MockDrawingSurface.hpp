/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_DRAWING_SURFACE_HPP
#define MOCK_DRAWING_SURFACE_HPP

#include "particles/ParticleRenderer.hpp"
#include <cstdint>
#include <vector>

// Records every call made by the renderer
class MockDrawingSurface : public AuraEngine::DrawingSurface {
public:
    MockDrawingSurface(float w = 800.0f, float h = 600.0f) : m_width(w), m_height(h) {}

    void save() override { ++saveCount; }
    void restore() override { ++restoreCount; }

    void setFillStyle(uint32_t color) override { fillStyles.push_back(color); }
    void setStrokeStyle(uint32_t color) override { strokeStyles.push_back(color); }
    void setGlobalAlpha(float alpha) override { alphas.push_back(alpha); }
    void setBlendMode(AuraEngine::BlendMode mode) override { blendModes.push_back(mode); }

    void beginPath() override { ++beginPathCount; }
    void arc(float x, float y, float radius) override { arcs.push_back(Arc{x, y, radius}); }
    void fill() override { ++fillCount; }
    void stroke() override { ++strokeCount; }

    float width() const override { return m_width; }
    float height() const override { return m_height; }

    void reset() {
        saveCount = restoreCount = beginPathCount = fillCount = strokeCount = 0;
        fillStyles.clear();
        strokeStyles.clear();
        alphas.clear();
        blendModes.clear();
        arcs.clear();
    }

    struct Arc {
        float x;
        float y;
        float radius;
    };

    // Mock control
    int saveCount = 0;
    int restoreCount = 0;
    int beginPathCount = 0;
    int fillCount = 0;
    int strokeCount = 0;
    std::vector<uint32_t> fillStyles;
    std::vector<uint32_t> strokeStyles;
    std::vector<float> alphas;
    std::vector<AuraEngine::BlendMode> blendModes;
    std::vector<Arc> arcs;

private:
    float m_width;
    float m_height;
};

#endif // MOCK_DRAWING_SURFACE_HPP
