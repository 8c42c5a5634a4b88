#pragma once

namespace splinerig::core::math {

struct Vec2 {
    double x{0.0};
    double y{0.0};
};

inline Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(const Vec2& a, double s) { return Vec2{a.x * s, a.y * s}; }

} // namespace splinerig::core::math
