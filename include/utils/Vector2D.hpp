/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>

namespace AuraEngine {

// Screen-space 2D vector, y pointing down
class Vector2D {
public:
  Vector2D() = default;
  Vector2D(float x, float y) : m_x(x), m_y(y) {}

  static Vector2D fromAngle(float radians, float magnitude = 1.0f) {
    return Vector2D(std::cos(radians) * magnitude, std::sin(radians) * magnitude);
  }

  float getX() const { return m_x; }
  float getY() const { return m_y; }

  float lengthSquared() const { return m_x * m_x + m_y * m_y; }
  float length() const { return std::sqrt(lengthSquared()); }
  float dot(const Vector2D &other) const { return m_x * other.m_x + m_y * other.m_y; }

  // Unit vector; (1, 0) when too short to have a direction
  Vector2D normalized() const {
    const float lenSq = lengthSquared();
    if (!(lenSq >= 0.0001f)) {
      return Vector2D(1.0f, 0.0f);
    }
    const float invLen = 1.0f / std::sqrt(lenSq);
    return Vector2D(m_x * invLen, m_y * invLen);
  }

  // Rotated 90 degrees counter-clockwise
  Vector2D perpendicular() const { return Vector2D(-m_y, m_x); }

  bool isFinite() const { return std::isfinite(m_x) && std::isfinite(m_y); }

  Vector2D operator+(const Vector2D &other) const {
    return Vector2D(m_x + other.m_x, m_y + other.m_y);
  }
  Vector2D operator-(const Vector2D &other) const {
    return Vector2D(m_x - other.m_x, m_y - other.m_y);
  }
  Vector2D operator*(float scalar) const { return Vector2D(m_x * scalar, m_y * scalar); }

  Vector2D &operator+=(const Vector2D &other) {
    m_x += other.m_x;
    m_y += other.m_y;
    return *this;
  }
  Vector2D &operator-=(const Vector2D &other) {
    m_x -= other.m_x;
    m_y -= other.m_y;
    return *this;
  }
  Vector2D &operator*=(float scalar) {
    m_x *= scalar;
    m_y *= scalar;
    return *this;
  }

  static float distanceSquared(const Vector2D &a, const Vector2D &b) {
    return (a - b).lengthSquared();
  }
  static float distance(const Vector2D &a, const Vector2D &b) {
    return std::sqrt(distanceSquared(a, b));
  }

private:
  float m_x{0.0f};
  float m_y{0.0f};
};

} // namespace AuraEngine

#endif // VECTOR_2D_HPP
