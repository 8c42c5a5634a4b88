#pragma once

#include "../math/types.hpp"

#include <optional>
#include <vector>

namespace splinerig::core::anim {

using math::Vec2;

// Sample on an animation path. Transforms always produce new points.
struct Point {
    double x{0.0};
    double y{0.0};
    std::optional<double> rotation{};
    std::optional<double> scale{};
    bool isControl{false};
    bool highlighted{false};

    Point() = default;
    Point(double px, double py) : x(px), y(py) {}

    Vec2 position() const { return Vec2{x, y}; }
    Point withPosition(const Vec2& p) const {
        Point out = *this;
        out.x = p.x;
        out.y = p.y;
        return out;
    }
    bool samePosition(const Point& o) const { return x == o.x && y == o.y; }
};

using Path = std::vector<Point>;

// Interpolates x/y and rotation; remaining attributes come from a.
inline Point lerpPoint(const Point& a, const Point& b, double t) {
    Point out = a;
    out.x = a.x + (b.x - a.x) * t;
    out.y = a.y + (b.y - a.y) * t;
    if (a.rotation || b.rotation) {
        const double r0 = a.rotation.value_or(0.0);
        const double r1 = b.rotation.value_or(0.0);
        out.rotation = r0 + (r1 - r0) * t;
    }
    return out;
}

} // namespace splinerig::core::anim
