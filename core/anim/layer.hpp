#pragma once

#include "curve.hpp"
#include "easing.hpp"
#include "point.hpp"
#include "timing.hpp"

#include <optional>
#include <string>

namespace splinerig::core::anim {

enum class LayerType {
    Spline,
    Handdraw,
    Box,
};

std::optional<LayerType> parseLayerType(const std::string& name);
const char* layerTypeName(LayerType type);

struct DriverSpec {
    std::string target{};
    double rotateDegrees{0.0};
    double smooth{0.0};
    double deltaScale{1.0};
};

struct LayerSpec {
    std::string name{};
    LayerType type{LayerType::Spline};
    Path rawPoints{};
    Interpolation interpolation{Interpolation::Linear};
    EasingSpec easing{};
    TimingSpec timing{};
    std::optional<DriverSpec> driver{};
    int repeat{1};
    double scale{1.0};
    bool visible{true};

    // Handdraw strokes are always sampled as polylines.
    Interpolation effectiveInterpolation() const {
        return type == LayerType::Handdraw ? Interpolation::Linear : interpolation;
    }
};

// Output of a resolution: exactly totalFrames world-space samples.
struct ResolvedLayer {
    std::string name{};
    LayerType type{LayerType::Spline};
    Path frames{};
    PauseFrames pauses{};
    double scale{1.0};
    bool visible{true};
};

} // namespace splinerig::core::anim
