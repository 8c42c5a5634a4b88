#pragma once

#include "serde.hpp"

namespace splinerig::core {

struct EngineConfig {
    // Densifier subdivisions between two control points.
    int stepsPerSegment{3};
    // Decimal places kept on ingested coordinates; negative keeps full precision.
    int coordinatePrecision{4};
    int defaultTotalFrames{41};

    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);
};

} // namespace splinerig::core
