#include "resample.hpp"

#include "error.hpp"
#include "../debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace splinerig::core::anim {

namespace {

struct MajorSegment {
    std::size_t startIdx{0};
    std::size_t endIdx{0};
    double length{0.0};
    double distanceBefore{0.0};
    std::size_t startFrame{0};
    std::size_t frameCount{0};
};

Point pointAtDistance(const Path& points, const std::vector<double>& lengths,
                      const std::vector<double>& cumulative, double distance) {
    // cumulative[k] is the distance from the start to points[k]
    auto it = std::lower_bound(cumulative.begin() + 1, cumulative.end(), distance);
    std::size_t idx = static_cast<std::size_t>(it - (cumulative.begin() + 1));
    idx = std::min(idx, points.size() - 2);
    const double into = distance - cumulative[idx];
    const double t = std::clamp(into / lengths[idx], 0.0, 1.0);
    Point out = lerpPoint(points[idx], points[idx + 1], t);
    out.isControl = false;
    out.highlighted = false;
    return out;
}

} // namespace

std::vector<double> segmentLengths(const Path& points) {
    std::vector<double> lengths;
    if (points.size() < 2) return lengths;
    lengths.reserve(points.size() - 1);
    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        const double dx = points[i + 1].x - points[i].x;
        const double dy = points[i + 1].y - points[i].y;
        const double len = std::sqrt(dx * dx + dy * dy);
        lengths.push_back(len > 0.0 ? len : kMinSegmentLength);
    }
    return lengths;
}

std::vector<std::size_t> allocateFrames(const std::vector<double>& weights, std::size_t frames) {
    std::vector<std::size_t> out(weights.size(), 0);
    if (weights.empty()) return out;
    const double sum = std::accumulate(weights.begin(), weights.end(), 0.0);

    std::vector<double> exact(weights.size());
    for (std::size_t i = 0; i < weights.size(); ++i) {
        exact[i] = sum > 0.0 ? weights[i] / sum * static_cast<double>(frames)
                             : static_cast<double>(frames) / static_cast<double>(weights.size());
    }

    std::size_t assigned = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        out[i] = static_cast<std::size_t>(std::floor(exact[i]));
        assigned += out[i];
    }

    std::vector<std::size_t> order(weights.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return exact[a] - std::floor(exact[a]) > exact[b] - std::floor(exact[b]);
    });
    for (std::size_t k = 0; assigned < frames; ++k) {
        ++out[order[k % order.size()]];
        ++assigned;
    }
    return out;
}

std::vector<std::size_t> majorBreakpoints(const Path& points, Interpolation interpolation) {
    std::vector<std::size_t> idx;
    if (points.empty()) return idx;
    for (std::size_t i = 0; i < points.size(); ++i) {
        const bool major = interpolation == Interpolation::Basis ? points[i].highlighted : points[i].isControl;
        if (major) idx.push_back(i);
    }
    if (idx.empty()) {
        idx.resize(points.size());
        std::iota(idx.begin(), idx.end(), 0);
    }
    idx.push_back(0);
    idx.push_back(points.size() - 1);
    std::sort(idx.begin(), idx.end());
    idx.erase(std::unique(idx.begin(), idx.end()), idx.end());
    return idx;
}

Path resampleArcLength(const Path& points, std::size_t targetFrames, const EasingSpec& easing,
                       Interpolation interpolation) {
    if (targetFrames == 0) {
        throw EngineError(ErrorKind::InvalidFrameCount, "", "resample target frame count must be positive");
    }
    if (points.empty()) {
        throw EngineError(ErrorKind::EmptyPath, "", "cannot resample an empty path");
    }
    if (points.size() == 1) return Path(targetFrames, points.front());
    if (targetFrames == 1) return Path{points.front()};

    const auto lengths = segmentLengths(points);
    std::vector<double> cumulative(points.size(), 0.0);
    for (std::size_t i = 0; i < lengths.size(); ++i) cumulative[i + 1] = cumulative[i] + lengths[i];
    const double total = cumulative.back();

    std::vector<MajorSegment> majors;
    if (easing.segmentation != Segmentation::Full) {
        const auto bps = majorBreakpoints(points, interpolation);
        std::vector<double> weights;
        for (std::size_t k = 0; k + 1 < bps.size(); ++k) {
            MajorSegment seg;
            seg.startIdx = bps[k];
            seg.endIdx = bps[k + 1];
            seg.distanceBefore = cumulative[seg.startIdx];
            seg.length = cumulative[seg.endIdx] - cumulative[seg.startIdx];
            majors.push_back(seg);
            weights.push_back(seg.length);
        }
        const auto budget = allocateFrames(weights, targetFrames);
        std::size_t frame = 0;
        for (std::size_t k = 0; k < majors.size(); ++k) {
            majors[k].startFrame = frame;
            majors[k].frameCount = budget[k];
            frame += budget[k];
        }
        SPLR_DBG_LOG("resample segmentation=%s majors=%zu frames=%zu",
                     segmentationName(easing.segmentation), majors.size(), targetFrames);
    }

    Path out;
    out.reserve(targetFrames);
    std::size_t current = 0;
    for (std::size_t i = 0; i < targetFrames; ++i) {
        double distance = 0.0;
        if (majors.empty()) {
            const double t = static_cast<double>(i) / static_cast<double>(targetFrames - 1);
            distance = ease(easing.function, t, easing.strength) * total;
        } else {
            while (current + 1 < majors.size() &&
                   i >= majors[current].startFrame + majors[current].frameCount) {
                ++current;
            }
            const MajorSegment& seg = majors[current];
            const std::size_t local = i >= seg.startFrame ? i - seg.startFrame : 0;
            double t = 0.0;
            if (seg.frameCount > 1) {
                t = std::min(1.0, static_cast<double>(local) / static_cast<double>(seg.frameCount - 1));
            } else if (seg.frameCount == 1) {
                t = 1.0;
            }
            EasingKind kind = easing.function;
            if (easing.segmentation == Segmentation::Alternate && current % 2 == 1) {
                kind = inverseEasing(kind);
            }
            distance = seg.distanceBefore + ease(kind, t, easing.strength) * seg.length;
        }
        out.push_back(pointAtDistance(points, lengths, cumulative, distance));
    }

    out.front() = points.front();
    out.back() = points.back();
    return out;
}

Path applyAcceleration(const Path& points, double acceleration) {
    if (std::fabs(acceleration) < 0.001) return points;
    if (points.size() <= 2) return points;

    const double a = std::clamp(acceleration, -0.99, 0.99);
    const double exponent = a > 0.0 ? std::max(0.01, 1.0 - a) : 1.0 + std::fabs(a);
    const std::size_t n = points.size();

    Path out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(n - 1);
        const double remapT = std::clamp(std::pow(t, exponent), 0.0, 1.0);
        const double source = remapT * static_cast<double>(n - 1);
        const std::size_t lo = std::min(static_cast<std::size_t>(source), n - 1);
        const std::size_t hi = std::min(lo + 1, n - 1);
        if (lo == hi) {
            out.push_back(points[lo]);
        } else {
            out.push_back(lerpPoint(points[lo], points[hi], source - static_cast<double>(lo)));
        }
    }
    out.front() = points.front();
    out.back() = points.back();
    return out;
}

} // namespace splinerig::core::anim
