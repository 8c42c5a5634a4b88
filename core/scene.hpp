#pragma once

#include "anim/error.hpp"
#include "anim/layer.hpp"
#include "config.hpp"
#include "serde.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace splinerig::core {

struct SceneResult {
    std::size_t totalFrames{0};
    // Same order as the scene's layers.
    std::vector<anim::ResolvedLayer> layers{};
    anim::Diagnostics diagnostics{};
    // Layer names in the order they were resolved (drivers first).
    std::vector<std::string> processingOrder{};

    const anim::ResolvedLayer* find(const std::string& name) const;
};

// Set of animation layers resolved together. Resolution is a pure function of
// the layers and config; the scene itself is never modified by it.
class Scene {
public:
    Scene() = default;
    explicit Scene(EngineConfig config) : config_(config) {}

    void addLayer(anim::LayerSpec spec) { layers_.push_back(std::move(spec)); }
    const std::vector<anim::LayerSpec>& layers() const { return layers_; }
    const anim::LayerSpec* findLayer(const std::string& name) const;

    EngineConfig& config() { return config_; }
    const EngineConfig& config() const { return config_; }

    // Recoverable problems found while loading a document.
    const anim::Diagnostics& ingestionDiagnostics() const { return ingestion_; }

    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);

    SceneResult resolve() const { return resolve(config_.defaultTotalFrames); }
    // Throws anim::EngineError on fatal conditions; nothing is returned in that case.
    SceneResult resolve(int totalFrames) const;

private:
    EngineConfig config_{};
    std::vector<anim::LayerSpec> layers_{};
    anim::Diagnostics ingestion_{};
};

} // namespace splinerig::core
