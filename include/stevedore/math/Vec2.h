#pragma once

#include <cmath>
#include <ostream>

namespace stevedore::math {

// Waypoint coordinates inside one star system (flat, integer-ish grid units).
struct Vec2d {
  double x = 0.0;
  double y = 0.0;

  constexpr Vec2d() = default;
  constexpr Vec2d(double x_, double y_) : x(x_), y(y_) {}

  constexpr Vec2d operator+(const Vec2d& rhs) const { return {x + rhs.x, y + rhs.y}; }
  constexpr Vec2d operator-(const Vec2d& rhs) const { return {x - rhs.x, y - rhs.y}; }
  constexpr Vec2d operator*(double s) const { return {x * s, y * s}; }

  constexpr bool operator==(const Vec2d& rhs) const { return x == rhs.x && y == rhs.y; }

  double lengthSquared() const { return x*x + y*y; }
  double length() const { return std::sqrt(lengthSquared()); }
};

inline double distance(const Vec2d& a, const Vec2d& b) {
  return (a - b).length();
}

inline std::ostream& operator<<(std::ostream& os, const Vec2d& v) {
  os << "(" << v.x << ", " << v.y << ")";
  return os;
}

} // namespace stevedore::math
