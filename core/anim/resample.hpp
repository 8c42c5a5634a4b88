#pragma once

#include "curve.hpp"
#include "easing.hpp"
#include "point.hpp"

#include <cstddef>
#include <vector>

namespace splinerig::core::anim {

// Zero-length segments are floored to this length.
constexpr double kMinSegmentLength = 1e-9;

// Per-segment Euclidean lengths, floored to kMinSegmentLength.
std::vector<double> segmentLengths(const Path& points);

// Largest-remainder split of `frames` proportional to `weights`; sums to `frames` exactly.
std::vector<std::size_t> allocateFrames(const std::vector<double>& weights, std::size_t frames);

// Indices of the breakpoints that split the path into major segments for
// Each/Alternate segmentation. Always contains the first and last index.
std::vector<std::size_t> majorBreakpoints(const Path& points, Interpolation interpolation);

// Maps a path of any length onto exactly targetFrames samples spaced along arc
// length by the easing. First and last samples equal the input endpoints.
// Throws EngineError(InvalidFrameCount) for targetFrames == 0 and
// EngineError(EmptyPath) for an empty input.
Path resampleArcLength(const Path& points, std::size_t targetFrames, const EasingSpec& easing,
                       Interpolation interpolation = Interpolation::Linear);

// Power-law time warp over an already resampled path. acceleration is clamped
// to [-0.99, 0.99]; |acceleration| < 0.001 returns the input unchanged.
Path applyAcceleration(const Path& points, double acceleration);

} // namespace splinerig::core::anim
