/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTAINMENT_HPP
#define CONTAINMENT_HPP

#include "particles/Particle.hpp"

namespace AuraEngine {

/**
 * @brief Axis-aligned region particles are kept inside
 * restitution scales the reflected velocity component on a bounce; 0 clamps
 * without bouncing.
 */
struct ContainmentBounds {
  float x{0.0f};
  float y{0.0f};
  float width{0.0f};
  float height{0.0f};
  float restitution{0.8f};

  float left() const { return x; }
  float top() const { return y; }
  float right() const { return x + width; }
  float bottom() const { return y + height; }

  // Finite, non-negative extent
  bool isValid() const;
  bool contains(const Vector2D &point) const;
};

namespace Containment {

/**
 * @brief Clamps the particle into bounds and reflects the velocity component
 * that carried it out
 * @return true if the particle was outside the bounds
 */
bool apply(Particle &particle, const ContainmentBounds &bounds);

} // namespace Containment

} // namespace AuraEngine

#endif // CONTAINMENT_HPP
