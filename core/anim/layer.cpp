#include "layer.hpp"

namespace splinerig::core::anim {

std::optional<LayerType> parseLayerType(const std::string& name) {
    if (name == "spline" || name.empty()) return LayerType::Spline;
    if (name == "handdraw") return LayerType::Handdraw;
    if (name == "box") return LayerType::Box;
    return std::nullopt;
}

const char* layerTypeName(LayerType type) {
    switch (type) {
    case LayerType::Spline: return "spline";
    case LayerType::Handdraw: return "handdraw";
    case LayerType::Box: return "box";
    }
    return "spline";
}

} // namespace splinerig::core::anim
