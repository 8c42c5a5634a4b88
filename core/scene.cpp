#include "scene.hpp"

#include "anim/bake.hpp"
#include "debug_log.hpp"
#include "drivers/driver_chain.hpp"
#include "drivers/driver_graph.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace splinerig::core {

using anim::Diagnostics;
using anim::ErrorKind;
using anim::LayerSpec;
using anim::Path;

namespace {

double roundTo(double value, int precision) {
    if (precision < 0) return value;
    const double factor = std::pow(10.0, precision);
    return std::round(value * factor) / factor;
}

Path readPoints(const serde::Fghj& store, const std::string& layer, int precision, Diagnostics& diagnostics) {
    Path out;
    std::size_t index = 0;
    for (const auto& kv : store) {
        const auto& node = kv.second;
        auto x = node.get_optional<double>("x");
        auto y = node.get_optional<double>("y");
        if (!x || !y || !std::isfinite(*x) || !std::isfinite(*y)) {
            anim::report(diagnostics, ErrorKind::MalformedPoint, layer,
                         "point " + std::to_string(index) + " has no numeric x/y; skipped");
            ++index;
            continue;
        }
        anim::Point p(roundTo(*x, precision), roundTo(*y, precision));
        p.highlighted = node.get<bool>("highlighted", false);
        p.isControl = node.get<bool>("is_control", false);
        if (auto r = node.get_optional<double>("boxR")) p.rotation = *r;
        if (auto s = node.get_optional<double>("boxScale")) p.scale = *s;
        out.push_back(p);
        ++index;
    }
    return out;
}

uint32_t readPause(const serde::Fghj& node, const std::string& key) {
    const int v = node.get<int>(key, 0);
    return v > 0 ? static_cast<uint32_t>(v) : 0u;
}

// Fills `spec` from one entry of "layers". Unknown enum names reject the document.
serde::SerdeException readLayer(const serde::Fghj& node, std::size_t index, const EngineConfig& config,
                                LayerSpec& spec, Diagnostics& diagnostics) {
    spec.name = node.get<std::string>("name", "");
    if (spec.name.empty()) spec.name = "layer" + std::to_string(index);
    spec.visible = node.get<bool>("on", true);

    const auto typeName = node.get<std::string>("type", "spline");
    auto type = anim::parseLayerType(typeName);
    if (!type) return "layer '" + spec.name + "': unknown type '" + typeName + "'";
    spec.type = *type;

    const auto interpName = node.get<std::string>("interpolation", "linear");
    auto interp = anim::parseInterpolation(interpName);
    if (!interp) return "layer '" + spec.name + "': unknown interpolation '" + interpName + "'";
    spec.interpolation = *interp;

    if (auto easingName = node.get_optional<std::string>("easing")) {
        auto kind = anim::parseEasingKind(*easingName);
        if (!kind) return "layer '" + spec.name + "': unknown easing '" + *easingName + "'";
        spec.easing.function = *kind;
    }
    if (auto cfg = node.get_child_optional("easingConfig")) {
        if (auto path = cfg->get_optional<std::string>("path")) {
            auto seg = anim::parseSegmentation(*path);
            if (!seg) return "layer '" + spec.name + "': unknown easing path '" + *path + "'";
            spec.easing.segmentation = *seg;
        }
        spec.easing.strength = cfg->get<double>("strength", spec.easing.strength);
        if (!(spec.easing.strength > 0.0)) return "layer '" + spec.name + "': easing strength must be positive";
        spec.timing.acceleration = cfg->get<double>("acceleration", 0.0);
    }

    spec.timing.startPause = readPause(node, "a_pause");
    spec.timing.endPause = readPause(node, "z_pause");
    spec.timing.offset = node.get<int32_t>("offset", 0);
    spec.repeat = node.get<int>("repeat", 1);
    spec.scale = node.get<double>("scale", 1.0);

    if (auto driven = node.get_child_optional("driven")) {
        const auto target = driven->get<std::string>("driver", "");
        if (!target.empty()) {
            anim::DriverSpec relation;
            relation.target = target;
            relation.rotateDegrees = driven->get<double>("rotate", 0.0);
            relation.deltaScale = driven->get<double>("d_scale", 1.0);
            relation.smooth = driven->get<double>("smooth", 0.0);
            spec.driver = relation;
        }
    }

    if (auto store = node.get_child_optional("points_store")) {
        if (store->empty() && !store->data().empty()) {
            // the editor keeps the point list as an embedded JSON string
            serde::Fghj inner;
            if (auto err = serde::parseJson(store->data(), inner)) {
                anim::report(diagnostics, ErrorKind::MalformedPoint, spec.name, "points_store: " + *err);
            } else {
                spec.rawPoints = readPoints(inner, spec.name, config.coordinatePrecision, diagnostics);
            }
        } else {
            spec.rawPoints = readPoints(*store, spec.name, config.coordinatePrecision, diagnostics);
        }
    }
    return std::nullopt;
}

} // namespace

const anim::ResolvedLayer* SceneResult::find(const std::string& name) const {
    auto it = std::find_if(layers.begin(), layers.end(), [&](const auto& l) { return l.name == name; });
    return it == layers.end() ? nullptr : &*it;
}

const LayerSpec* Scene::findLayer(const std::string& name) const {
    auto it = std::find_if(layers_.begin(), layers_.end(), [&](const auto& l) { return l.name == name; });
    return it == layers_.end() ? nullptr : &*it;
}

serde::SerdeException Scene::deserializeFromFghj(const serde::Fghj& data) {
    EngineConfig config = config_;
    std::vector<LayerSpec> layers;
    Diagnostics diagnostics;
    try {
        if (auto cfg = data.get_child_optional("config")) {
            if (auto err = config.deserializeFromFghj(*cfg)) return err;
        }
        if (auto frames = data.get_optional<int>("frames")) {
            if (*frames < 1) return std::string("frames must be positive");
            config.defaultTotalFrames = *frames;
        }
        if (auto layerNode = data.get_child_optional("layers")) {
            std::size_t index = 0;
            for (const auto& child : *layerNode) {
                LayerSpec spec;
                if (auto err = readLayer(child.second, index++, config, spec, diagnostics)) return err;
                if (spec.rawPoints.empty()) {
                    anim::report(diagnostics, ErrorKind::EmptyPath, spec.name, "layer has no usable points; omitted");
                    continue;
                }
                layers.push_back(std::move(spec));
            }
        }
    } catch (const std::exception& ex) {
        return std::string(ex.what());
    }
    SPLR_DBG_LOG("scene.deserialize layers=%zu diagnostics=%zu", layers.size(), diagnostics.size());
    config_ = config;
    layers_ = std::move(layers);
    ingestion_ = std::move(diagnostics);
    return std::nullopt;
}

SceneResult Scene::resolve(int totalFrames) const {
    if (totalFrames <= 0) {
        throw anim::EngineError(ErrorKind::InvalidFrameCount, "",
                                "total frame count must be positive, got " + std::to_string(totalFrames));
    }
    const auto frames = static_cast<std::size_t>(totalFrames);
    const int steps = config_.stepsPerSegment;

    SceneResult result;
    result.totalFrames = frames;
    result.diagnostics = ingestion_;

    auto graph = drivers::DriverGraph::build(layers_, result.diagnostics);
    const auto order = graph.topologicalOrder();

    std::vector<Path> raw(layers_.size());
    std::vector<std::optional<anim::BakedLayer>> intrinsic(layers_.size());
    drivers::ResolvedPaths world;

    for (std::size_t idx : order) {
        const auto& spec = layers_[idx];
        raw[idx] = anim::prepareRawPoints(spec);
        intrinsic[idx] = anim::bakeLayer(spec, raw[idx], frames, steps, &result.diagnostics);
        Path resolved = intrinsic[idx]->frames;

        if (auto driverIdx = graph.driverOf(idx)) {
            const auto& driverSpec = layers_[*driverIdx];
            const auto& relation = *spec.driver;
            Path motion = world[driverSpec.name];
            if (drivers::reshapesDriver(relation)) {
                // re-run the driver's own pipeline on the reshaped raw path, keeping
                // whatever the driver inherited from further up the chain
                const Path reshaped = drivers::transformDriverPath(raw[*driverIdx], relation);
                const auto rebaked = anim::bakeLayer(driverSpec, reshaped, frames, steps);
                const Path& own = intrinsic[*driverIdx]->frames;
                for (std::size_t i = 0; i < motion.size(); ++i) {
                    const auto inherited = motion[i].position() - own[i].position();
                    motion[i] = rebaked.frames[i].withPosition(rebaked.frames[i].position() + inherited);
                }
            }
            resolved = drivers::applyDriverOffset(resolved, motion, relation.deltaScale);
        }

        world[spec.name] = std::move(resolved);
        result.processingOrder.push_back(spec.name);
        SPLR_DBG_LOG("resolved layer=%s driver=%s", spec.name.c_str(),
                     spec.driver ? spec.driver->target.c_str() : "-");
    }

    result.layers.reserve(layers_.size());
    for (std::size_t idx = 0; idx < layers_.size(); ++idx) {
        const auto& spec = layers_[idx];
        anim::ResolvedLayer layer;
        layer.name = spec.name;
        layer.type = spec.type;
        layer.frames = std::move(world[spec.name]);
        layer.pauses = intrinsic[idx]->pauses;
        layer.scale = spec.scale;
        layer.visible = spec.visible;
        result.layers.push_back(std::move(layer));
    }
    return result;
}

} // namespace splinerig::core
