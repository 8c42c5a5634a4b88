#include "curve.hpp"

#include "../debug_log.hpp"

#include <cstddef>
#include <vector>

namespace splinerig::core::anim {

namespace {

struct Knot {
    const Point* point{nullptr};
    bool primary{true}; // copy that carries the source point's tags
};

std::vector<Knot> expandCorners(const Path& controls, int copies) {
    std::vector<Knot> out;
    out.reserve(controls.size() * static_cast<std::size_t>(copies));
    for (const auto& p : controls) {
        if (!p.highlighted || copies <= 1) {
            out.push_back(Knot{&p, true});
            continue;
        }
        for (int c = 0; c < copies; ++c) {
            // doubled: the second copy is the corner; tripled: the middle one
            bool primary = copies == 2 ? c == 1 : c == copies / 2;
            out.push_back(Knot{&p, primary});
        }
    }
    return out;
}

Point untagged(Point p) {
    p.isControl = false;
    p.highlighted = false;
    return p;
}

Point tagged(const Knot& k, Point sample) {
    if (k.primary) {
        sample.isControl = k.point->isControl;
        sample.highlighted = k.point->highlighted;
    }
    return sample;
}

} // namespace

std::optional<Interpolation> parseInterpolation(const std::string& name) {
    if (name == "linear" || name == "box") return Interpolation::Linear;
    if (name == "cardinal") return Interpolation::Cardinal;
    if (name == "basis") return Interpolation::Basis;
    if (name == "points") return Interpolation::Points;
    return std::nullopt;
}

const char* interpolationName(Interpolation interp) {
    switch (interp) {
    case Interpolation::Linear: return "linear";
    case Interpolation::Cardinal: return "cardinal";
    case Interpolation::Basis: return "basis";
    case Interpolation::Points: return "points";
    }
    return "linear";
}

Path LinearCurve::densify(const Path& controls) const {
    return controls;
}

Path CardinalCurve::densify(const Path& controls) const {
    if (controls.size() < 2) return controls;
    const auto knots = expandCorners(controls, 2);
    const std::size_t len = knots.size();

    Path out;
    out.reserve(1 + (len - 1) * static_cast<std::size_t>(steps_));
    out.push_back(*knots.front().point);
    out.back().isControl = knots.front().point->isControl;

    for (std::size_t i = 0; i + 1 < len; ++i) {
        const Point& p0 = *knots[i == 0 ? 0 : i - 1].point;
        const Point& p1 = *knots[i].point;
        const Point& p2 = *knots[i + 1].point;
        const Point& p3 = *knots[i + 2 < len ? i + 2 : len - 1].point;
        for (int step = 1; step <= steps_; ++step) {
            if (step == steps_) {
                out.push_back(tagged(knots[i + 1], untagged(p2)));
                continue;
            }
            const double lt = static_cast<double>(step) / static_cast<double>(steps_);
            const double lt2 = lt * lt;
            const double lt3 = lt2 * lt;
            const double ax = 2.0 * p1.x;
            const double ay = 2.0 * p1.y;
            const double bx = p2.x - p0.x;
            const double by = p2.y - p0.y;
            const double cx = 2.0 * p0.x - 5.0 * p1.x + 4.0 * p2.x - p3.x;
            const double cy = 2.0 * p0.y - 5.0 * p1.y + 4.0 * p2.y - p3.y;
            const double dx = -p0.x + 3.0 * p1.x - 3.0 * p2.x + p3.x;
            const double dy = -p0.y + 3.0 * p1.y - 3.0 * p2.y + p3.y;
            Point sample = untagged(lerpPoint(p1, p2, lt));
            sample.x = 0.5 * (ax + bx * lt + cx * lt2 + dx * lt3);
            sample.y = 0.5 * (ay + by * lt + cy * lt2 + dy * lt3);
            out.push_back(sample);
        }
    }
    SPLR_DBG_LOG("cardinal densify controls=%zu knots=%zu samples=%zu",
                 controls.size(), len, out.size());
    return out;
}

Path BasisCurve::densify(const Path& controls) const {
    if (controls.size() < 2) return controls;
    const auto knots = expandCorners(controls, 3);
    const std::size_t m = knots.size();

    // pad[j]: two leading and two trailing copies of the end knots
    auto pad = [&](std::size_t j) -> const Knot& {
        if (j < 2) return knots.front();
        if (j - 2 >= m) return knots.back();
        return knots[j - 2];
    };

    Path out;
    out.reserve((m + 1) * static_cast<std::size_t>(steps_) + 1);
    for (std::size_t i = 0; i <= m; ++i) {
        const Point& p0 = *pad(i).point;
        const Point& p1 = *pad(i + 1).point;
        const Point& p2 = *pad(i + 2).point;
        const Point& p3 = *pad(i + 3).point;
        for (int step = 0; step <= steps_; ++step) {
            if (i > 0 && step == 0) continue;
            const double t = static_cast<double>(step) / static_cast<double>(steps_);
            const double t2 = t * t;
            const double t3 = t2 * t;
            const double b0 = (1.0 - t) * (1.0 - t) * (1.0 - t) / 6.0;
            const double b1 = (3.0 * t3 - 6.0 * t2 + 4.0) / 6.0;
            const double b2 = (-3.0 * t3 + 3.0 * t2 + 3.0 * t + 1.0) / 6.0;
            const double b3 = t3 / 6.0;
            Point sample = untagged(lerpPoint(p1, p2, t));
            sample.x = p0.x * b0 + p1.x * b1 + p2.x * b2 + p3.x * b3;
            sample.y = p0.y * b0 + p1.y * b1 + p2.y * b2 + p3.y * b3;
            // end of segment i is centred on knot i; interior knots map there
            if (step == steps_ && i >= 1 && i + 1 < m) {
                sample = tagged(knots[i], sample);
            }
            out.push_back(sample);
        }
    }

    // the clamped ends interpolate the first and last control exactly
    out.front() = controls.front();
    out.back() = controls.back();
    SPLR_DBG_LOG("basis densify controls=%zu knots=%zu samples=%zu",
                 controls.size(), m, out.size());
    return out;
}

std::unique_ptr<Curve> createCurve(Interpolation interp, int stepsPerSegment) {
    switch (interp) {
    case Interpolation::Cardinal: return std::make_unique<CardinalCurve>(stepsPerSegment);
    case Interpolation::Basis: return std::make_unique<BasisCurve>(stepsPerSegment);
    case Interpolation::Points: return std::make_unique<LinearCurve>(stepsPerSegment, Interpolation::Points);
    case Interpolation::Linear: break;
    }
    return std::make_unique<LinearCurve>(stepsPerSegment);
}

} // namespace splinerig::core::anim
