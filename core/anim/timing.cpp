#include "timing.hpp"

#include <algorithm>
#include <cstdlib>

namespace splinerig::core::anim {

std::size_t animatedFrameCount(std::size_t totalFrames, const PauseFrames& pauses) {
    const std::size_t held = static_cast<std::size_t>(pauses.start) + static_cast<std::size_t>(pauses.end);
    if (held >= totalFrames) return 1;
    return totalFrames - held;
}

std::size_t frameIndex(std::size_t frame, std::size_t totalFrames, const PauseFrames& pauses) {
    const std::size_t animated = animatedFrameCount(totalFrames, pauses);
    if (frame < pauses.start) return 0;
    if (frame + pauses.end >= totalFrames) return animated - 1;
    return std::min(frame - pauses.start, animated - 1);
}

OffsetResult applyOffsetTiming(const Path& points, int32_t offset) {
    OffsetResult out;
    out.points = points;
    if (offset == 0 || points.empty()) return out;

    std::size_t magnitude = static_cast<std::size_t>(std::abs(static_cast<long long>(offset)));
    if (magnitude >= points.size()) {
        magnitude = points.size() - 1;
        out.clamped = true;
    }
    out.points.resize(points.size() - magnitude);
    if (offset > 0) {
        out.startAdjust = static_cast<uint32_t>(magnitude);
    } else {
        out.endAdjust = static_cast<uint32_t>(magnitude);
    }
    return out;
}

Path expandToFrames(const Path& animated, std::size_t totalFrames, const PauseFrames& pauses) {
    Path out;
    if (animated.empty()) return out;
    out.reserve(totalFrames);
    for (std::size_t f = 0; f < totalFrames; ++f) {
        const std::size_t idx = std::min(frameIndex(f, totalFrames, pauses), animated.size() - 1);
        out.push_back(animated[idx]);
    }
    return out;
}

Path repeatLoop(const Path& points, int count) {
    if (count <= 1 || points.size() < 2) return points;
    Path loop = points;
    if (!points.front().samePosition(points.back())) loop.push_back(points.front());

    Path out = loop;
    out.reserve(loop.size() + (loop.size() - 1) * static_cast<std::size_t>(count - 1));
    for (int r = 1; r < count; ++r) {
        out.insert(out.end(), loop.begin() + 1, loop.end());
    }
    return out;
}

} // namespace splinerig::core::anim
