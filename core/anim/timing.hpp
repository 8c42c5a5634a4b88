#pragma once

#include "point.hpp"

#include <cstddef>
#include <cstdint>

namespace splinerig::core::anim {

struct PauseFrames {
    uint32_t start{0};
    uint32_t end{0};
};

struct TimingSpec {
    uint32_t startPause{0};
    uint32_t endPause{0};
    int32_t offset{0};
    double acceleration{0.0};
};

// Frames left for motion once both holds are taken out; never less than 1.
std::size_t animatedFrameCount(std::size_t totalFrames, const PauseFrames& pauses);

// Index into the animated path shown at output frame `frame`.
std::size_t frameIndex(std::size_t frame, std::size_t totalFrames, const PauseFrames& pauses);

struct OffsetResult {
    Path points{};
    uint32_t startAdjust{0};
    uint32_t endAdjust{0};
    bool clamped{false};
};

// Drops the last |offset| samples (clamped to size-1) and returns the number
// of hold frames they turn into: at the start for offset > 0, at the end for
// offset < 0.
OffsetResult applyOffsetTiming(const Path& points, int32_t offset);

// Expands a sampled path to totalFrames using the pause holds.
Path expandToFrames(const Path& animated, std::size_t totalFrames, const PauseFrames& pauses);

// Closes the path and repeats the loop; count <= 1 or fewer than two points is a no-op.
Path repeatLoop(const Path& points, int count);

} // namespace splinerig::core::anim
