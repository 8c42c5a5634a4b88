#include "driver_chain.hpp"

#include "../math/mat2.hpp"

#include <algorithm>
#include <cmath>

namespace splinerig::core::drivers {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

Path rotatePath(const Path& path, double degrees) {
    if (path.empty() || degrees == 0.0) return path;
    const auto rot = math::Mat2::rotation(degrees * kPi / 180.0);
    const Vec2 pivot = path.front().position();
    Path out;
    out.reserve(path.size());
    for (const auto& p : path) {
        out.push_back(p.withPosition(rot.transformAbout(p.position(), pivot)));
    }
    return out;
}

Path smoothPath(const Path& path, double smooth) {
    const double s = std::clamp(smooth, 0.0, 1.0);
    if (s == 0.0 || path.size() < 3) return path;
    Path out = path;
    for (std::size_t i = 1; i + 1 < path.size(); ++i) {
        const Vec2 prev = path[i - 1].position();
        const Vec2 self = path[i].position();
        const Vec2 next = path[i + 1].position();
        out[i] = path[i].withPosition(self * (1.0 - s) + (prev + next) * (s * 0.5));
    }
    return out;
}

Path transformDriverPath(const Path& raw, const anim::DriverSpec& relation) {
    Path out = rotatePath(raw, relation.rotateDegrees);
    if (relation.smooth > 0.0) out = smoothPath(out, relation.smooth);
    return out;
}

Path applyDriverOffset(const Path& driven, const Path& motion, double deltaScale) {
    if (motion.empty()) return driven;
    const Vec2 reference = motion.front().position();
    Path out;
    out.reserve(driven.size());
    for (std::size_t i = 0; i < driven.size(); ++i) {
        const Vec2 delta = motion[std::min(i, motion.size() - 1)].position() - reference;
        out.push_back(driven[i].withPosition(driven[i].position() + delta * deltaScale));
    }
    return out;
}

} // namespace splinerig::core::drivers
