#include "bake.hpp"

#include "resample.hpp"
#include "../debug_log.hpp"

#include <algorithm>
#include <limits>

namespace splinerig::core::anim {

namespace {

uint32_t saturatingAdd(uint32_t a, uint32_t b) {
    return a > std::numeric_limits<uint32_t>::max() - b ? std::numeric_limits<uint32_t>::max() : a + b;
}

} // namespace

Path prepareRawPoints(const LayerSpec& spec) {
    Path raw = repeatLoop(spec.rawPoints, spec.repeat);
    if (spec.easing.segmentation == Segmentation::Full) return raw;
    const bool anyControl = std::any_of(raw.begin(), raw.end(), [](const Point& p) { return p.isControl; });
    if (!anyControl) {
        for (auto& p : raw) p.isControl = true;
    }
    return raw;
}

BakedLayer bakeLayer(const LayerSpec& spec, const Path& raw, std::size_t totalFrames,
                     int stepsPerSegment, Diagnostics* diagnostics) {
    if (totalFrames == 0) {
        throw EngineError(ErrorKind::InvalidFrameCount, spec.name, "total frame count must be positive");
    }
    if (raw.empty()) {
        throw EngineError(ErrorKind::EmptyPath, spec.name, "layer '" + spec.name + "' has no control points");
    }

    const Interpolation interp = spec.effectiveInterpolation();
    Path dense = raw;
    if (interp != Interpolation::Points) {
        dense = createCurve(interp, stepsPerSegment)->densify(raw);
    }

    BakedLayer out;
    out.pauses = PauseFrames{spec.timing.startPause, spec.timing.endPause};
    const std::size_t animated = animatedFrameCount(totalFrames, out.pauses);

    Path path = resampleArcLength(dense, animated, spec.easing, interp);
    path = applyAcceleration(path, spec.timing.acceleration);

    auto offset = applyOffsetTiming(path, spec.timing.offset);
    if (offset.clamped && diagnostics) {
        report(*diagnostics, ErrorKind::OffsetClamped, spec.name,
               "offset " + std::to_string(spec.timing.offset) + " clamped to " +
                   std::to_string(offset.startAdjust + offset.endAdjust));
    }
    out.pauses.start = saturatingAdd(out.pauses.start, offset.startAdjust);
    out.pauses.end = saturatingAdd(out.pauses.end, offset.endAdjust);

    out.frames = expandToFrames(offset.points, totalFrames, out.pauses);
    SPLR_DBG_LOG("bake layer=%s raw=%zu dense=%zu animated=%zu pauses=%u/%u",
                 spec.name.c_str(), raw.size(), dense.size(), animated, out.pauses.start, out.pauses.end);
    return out;
}

} // namespace splinerig::core::anim
