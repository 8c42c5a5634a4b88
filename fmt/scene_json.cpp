#include "scene_json.hpp"

namespace splinerig::core::fmt {

namespace {

serde::Fghj serializePoint(const anim::Point& p) {
    serde::Fghj node;
    node.put("x", p.x);
    node.put("y", p.y);
    if (p.rotation) node.put("rotation", *p.rotation);
    if (p.scale) node.put("scale", *p.scale);
    return node;
}

serde::Fghj serializeLayer(const anim::ResolvedLayer& layer) {
    serde::Fghj node;
    node.put("type", anim::layerTypeName(layer.type));
    node.put("visible", layer.visible);
    node.put("scale", layer.scale);
    node.put("start_pause", layer.pauses.start);
    node.put("end_pause", layer.pauses.end);
    serde::Fghj frames;
    for (const auto& p : layer.frames) frames.push_back({"", serializePoint(p)});
    node.add_child("frames", frames);
    return node;
}

} // namespace

serde::Fghj serializeResult(const SceneResult& result) {
    serde::Fghj root;
    root.put("frames", result.totalFrames);

    serde::Fghj layers;
    for (const auto& layer : result.layers) {
        // names may contain '.', so bypass path splitting
        layers.push_back({layer.name, serializeLayer(layer)});
    }
    root.add_child("layers", layers);

    serde::Fghj order;
    for (const auto& name : result.processingOrder) {
        serde::Fghj entry;
        entry.put_value(name);
        order.push_back({"", entry});
    }
    root.add_child("order", order);

    serde::Fghj diagnostics;
    for (const auto& d : result.diagnostics) {
        serde::Fghj entry;
        entry.put("kind", anim::errorKindName(d.kind));
        entry.put("layer", d.layer);
        entry.put("message", d.message);
        diagnostics.push_back({"", entry});
    }
    root.add_child("diagnostics", diagnostics);
    return root;
}

std::string toJson(const SceneResult& result, bool pretty) {
    return serde::writeJson(serializeResult(result), pretty);
}

} // namespace splinerig::core::fmt
