#pragma once

#include "error.hpp"
#include "layer.hpp"

#include <cstddef>

namespace splinerig::core::anim {

struct BakedLayer {
    Path frames{};
    PauseFrames pauses{};
};

// Raw points after looping, with control tags filled in for Each/Alternate.
Path prepareRawPoints(const LayerSpec& spec);

// Runs densify -> resample -> accelerate -> offset -> pause expansion on
// `raw` with the timing of `spec`. The result has exactly totalFrames samples.
BakedLayer bakeLayer(const LayerSpec& spec, const Path& raw, std::size_t totalFrames,
                     int stepsPerSegment, Diagnostics* diagnostics = nullptr);

} // namespace splinerig::core::anim
