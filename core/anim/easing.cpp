#include "easing.hpp"

#include <algorithm>
#include <cmath>

namespace splinerig::core::anim {

double easeIn(double t, double strength) {
    return std::pow(t, 2.0 * strength);
}

double easeOut(double t, double strength) {
    return 1.0 - std::pow(1.0 - t, 2.0 * strength);
}

double easeInOut(double t, double strength) {
    const double k = std::pow(2.0, 2.0 * strength - 1.0);
    if (t < 0.5) return k * std::pow(t, 2.0 * strength);
    return 1.0 - k * std::pow(1.0 - t, 2.0 * strength);
}

double easeOutIn(double t, double strength) {
    if (t < 0.5) return 0.5 * (1.0 - std::pow(1.0 - 2.0 * t, 2.0 * strength));
    return 0.5 + 0.5 * std::pow(2.0 * t - 1.0, 2.0 * strength);
}

double ease(EasingKind kind, double t, double strength) {
    t = std::clamp(t, 0.0, 1.0);
    switch (kind) {
    case EasingKind::Linear: return t;
    case EasingKind::In: return easeIn(t, strength);
    case EasingKind::Out: return easeOut(t, strength);
    case EasingKind::InOut: return easeInOut(t, strength);
    case EasingKind::OutIn: return easeOutIn(t, strength);
    }
    return t;
}

EasingKind inverseEasing(EasingKind kind) {
    switch (kind) {
    case EasingKind::In: return EasingKind::Out;
    case EasingKind::Out: return EasingKind::In;
    case EasingKind::InOut: return EasingKind::OutIn;
    case EasingKind::OutIn: return EasingKind::InOut;
    case EasingKind::Linear: break;
    }
    return EasingKind::Linear;
}

std::optional<EasingKind> parseEasingKind(const std::string& name) {
    if (name == "linear") return EasingKind::Linear;
    if (name == "in" || name == "ease_in") return EasingKind::In;
    if (name == "out" || name == "ease_out") return EasingKind::Out;
    if (name == "in_out" || name == "ease_in_out") return EasingKind::InOut;
    if (name == "out_in" || name == "ease_out_in") return EasingKind::OutIn;
    return std::nullopt;
}

std::optional<Segmentation> parseSegmentation(const std::string& name) {
    if (name == "full") return Segmentation::Full;
    if (name == "each") return Segmentation::Each;
    if (name == "alternate") return Segmentation::Alternate;
    return std::nullopt;
}

const char* easingKindName(EasingKind kind) {
    switch (kind) {
    case EasingKind::Linear: return "linear";
    case EasingKind::In: return "in";
    case EasingKind::Out: return "out";
    case EasingKind::InOut: return "in_out";
    case EasingKind::OutIn: return "out_in";
    }
    return "linear";
}

const char* segmentationName(Segmentation seg) {
    switch (seg) {
    case Segmentation::Full: return "full";
    case Segmentation::Each: return "each";
    case Segmentation::Alternate: return "alternate";
    }
    return "full";
}

} // namespace splinerig::core::anim
