/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/Containment.hpp"
#include <algorithm>
#include <cmath>

namespace AuraEngine {

bool ContainmentBounds::isValid() const {
  return std::isfinite(x) && std::isfinite(y) && std::isfinite(width) &&
         std::isfinite(height) && width >= 0.0f && height >= 0.0f &&
         std::isfinite(restitution);
}

bool ContainmentBounds::contains(const Vector2D &point) const {
  return point.getX() >= left() && point.getX() <= right() &&
         point.getY() >= top() && point.getY() <= bottom();
}

namespace Containment {

bool apply(Particle &particle, const ContainmentBounds &bounds) {
  if (!particle.position.isFinite()) {
    return false;
  }

  const float restitution = std::clamp(bounds.restitution, 0.0f, 1.0f);
  float px = particle.position.getX();
  float py = particle.position.getY();
  float vx = particle.velocity.getX();
  float vy = particle.velocity.getY();
  bool hit = false;

  if (px < bounds.left()) {
    px = bounds.left();
    vx = std::abs(vx) * restitution;
    hit = true;
  } else if (px > bounds.right()) {
    px = bounds.right();
    vx = -std::abs(vx) * restitution;
    hit = true;
  }

  if (py < bounds.top()) {
    py = bounds.top();
    vy = std::abs(vy) * restitution;
    hit = true;
  } else if (py > bounds.bottom()) {
    py = bounds.bottom();
    vy = -std::abs(vy) * restitution;
    hit = true;
  }

  if (hit) {
    particle.position = Vector2D(px, py);
    particle.velocity = Vector2D(vx, vy);
  }
  return hit;
}

} // namespace Containment

} // namespace AuraEngine
