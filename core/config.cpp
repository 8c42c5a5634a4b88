#include "config.hpp"

#include "debug_log.hpp"

namespace splinerig::core {

serde::SerdeException EngineConfig::deserializeFromFghj(const serde::Fghj& data) {
    try {
        if (auto steps = data.get_optional<int>("steps_per_segment")) {
            if (*steps < 1) return std::string("config.steps_per_segment must be at least 1");
            stepsPerSegment = *steps;
        }
        if (auto precision = data.get_optional<int>("coordinate_precision")) coordinatePrecision = *precision;
        if (auto frames = data.get_optional<int>("frames")) {
            if (*frames < 1) return std::string("config.frames must be positive");
            defaultTotalFrames = *frames;
        }
    } catch (const std::exception& ex) {
        return std::string(ex.what());
    }
    SPLR_DBG_LOG("config steps=%d precision=%d frames=%d", stepsPerSegment, coordinatePrecision,
                 defaultTotalFrames);
    return std::nullopt;
}

} // namespace splinerig::core
