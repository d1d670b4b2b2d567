#pragma once
#include <cmath>

namespace orbitwarp {

// 2D vector in world units (the same units the game's physics uses).
struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x_, double y_) : x(x_), y(y_) {}

  Vec2 operator+(const Vec2& rhs) const { return {x + rhs.x, y + rhs.y}; }
  Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }
  Vec2 operator*(double s) const { return {x * s, y * s}; }

  // Exact equality; intended for stored/serialized coordinates.
  bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }

  double length() const { return std::sqrt(x * x + y * y); }
};

inline double distance(const Vec2& a, const Vec2& b) { return (b - a).length(); }

} // namespace orbitwarp
