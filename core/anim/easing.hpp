#pragma once

#include <optional>
#include <string>

namespace splinerig::core::anim {

enum class EasingKind {
    Linear,
    In,
    Out,
    InOut,
    OutIn,
};

enum class Segmentation {
    Full,
    Each,
    Alternate,
};

struct EasingSpec {
    EasingKind function{EasingKind::InOut};
    Segmentation segmentation{Segmentation::Full};
    double strength{1.0};
};

// Maps t in [0,1] to eased time. strength 1 is classic quadratic easing.
double ease(EasingKind kind, double t, double strength = 1.0);

// Mirror kind used on odd segments under Segmentation::Alternate.
EasingKind inverseEasing(EasingKind kind);

double easeIn(double t, double strength);
double easeOut(double t, double strength);
double easeInOut(double t, double strength);
double easeOutIn(double t, double strength);

std::optional<EasingKind> parseEasingKind(const std::string& name);
std::optional<Segmentation> parseSegmentation(const std::string& name);
const char* easingKindName(EasingKind kind);
const char* segmentationName(Segmentation seg);

} // namespace splinerig::core::anim
