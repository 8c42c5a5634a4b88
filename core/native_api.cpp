#include "native_api.hpp"

#include "../fmt/scene_json.hpp"
#include "anim/error.hpp"
#include "debug_log.hpp"
#include "log.hpp"
#include "scene.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

using splinerig::core::Scene;
using splinerig::core::SceneResult;
namespace anim = splinerig::core::anim;
namespace fmt = splinerig::core::fmt;
namespace serde = splinerig::core::serde;
namespace splog = splinerig::core::log;

namespace {

struct SceneCtx {
    std::shared_ptr<const Scene> scene{};
    std::shared_ptr<const SceneResult> result{};
    std::string resultJson{};
    std::string lastError{};
};

std::mutex gMutex;
std::unordered_map<void*, std::unique_ptr<SceneCtx>> gScenes;

std::shared_ptr<const SceneResult> publishedResult(void* handle) {
    std::lock_guard<std::mutex> lock(gMutex);
    auto it = gScenes.find(handle);
    if (it == gScenes.end() || !it->second) return nullptr;
    return it->second->result;
}

void setLastError(void* handle, const std::string& message) {
    std::lock_guard<std::mutex> lock(gMutex);
    auto it = gScenes.find(handle);
    if (it != gScenes.end() && it->second) it->second->lastError = message;
}

} // namespace

extern "C" {

SplrResult splrLoadScene(const char* jsonUtf8, void** outScene) {
    if (!jsonUtf8 || !outScene) return SplrResult::InvalidArgument;
    *outScene = nullptr;
    serde::SerdeException error;
    std::shared_ptr<Scene> scene;
    try {
        scene = fmt::loadJsonFromMemory<Scene>(jsonUtf8, &error);
    } catch (const std::exception& ex) {
        error = std::string(ex.what());
    }
    if (!scene) {
        splog::message("scene load failed: " + error.value_or("unknown error"));
        return SplrResult::Failure;
    }
    auto ctx = std::make_unique<SceneCtx>();
    ctx->scene = scene;
    void* handle = ctx.get();
    {
        std::lock_guard<std::mutex> lock(gMutex);
        gScenes[handle] = std::move(ctx);
    }
    SPLR_DBG_LOG("native.load handle=%p layers=%zu", handle, scene->layers().size());
    *outScene = handle;
    return SplrResult::Ok;
}

void splrDestroyScene(void* scene) {
    std::lock_guard<std::mutex> lock(gMutex);
    gScenes.erase(scene);
}

SplrResult splrResolveScene(void* sceneHandle, int totalFrames) {
    std::shared_ptr<const Scene> scene;
    {
        std::lock_guard<std::mutex> lock(gMutex);
        auto it = gScenes.find(sceneHandle);
        if (it == gScenes.end() || !it->second) return SplrResult::InvalidArgument;
        scene = it->second->scene;
    }
    if (totalFrames <= 0) {
        setLastError(sceneHandle, "total frame count must be positive");
        return SplrResult::InvalidArgument;
    }

    std::shared_ptr<const SceneResult> result;
    std::string json;
    try {
        auto resolved = std::make_shared<SceneResult>(scene->resolve(totalFrames));
        json = fmt::toJson(*resolved);
        result = std::move(resolved);
    } catch (const anim::EngineError& ex) {
        splog::message(ex.what());
        setLastError(sceneHandle, ex.what());
        return ex.kind() == anim::ErrorKind::Cycle ? SplrResult::DriverCycle : SplrResult::Failure;
    } catch (const std::exception& ex) {
        splog::message(ex.what());
        setLastError(sceneHandle, ex.what());
        return SplrResult::Failure;
    }

    std::lock_guard<std::mutex> lock(gMutex);
    auto it = gScenes.find(sceneHandle);
    if (it == gScenes.end() || !it->second) return SplrResult::InvalidArgument;
    it->second->result = std::move(result);
    it->second->resultJson = std::move(json);
    it->second->lastError.clear();
    return SplrResult::Ok;
}

SplrResult splrGetLayerCount(void* scene, size_t* outCount) {
    if (!outCount) return SplrResult::InvalidArgument;
    *outCount = 0;
    auto result = publishedResult(scene);
    if (!result) return SplrResult::Failure;
    *outCount = result->layers.size();
    return SplrResult::Ok;
}

SplrResult splrGetLayerName(void* scene, size_t index, const char** outName, size_t* outLength) {
    if (!outName || !outLength) return SplrResult::InvalidArgument;
    auto result = publishedResult(scene);
    if (!result) return SplrResult::Failure;
    if (index >= result->layers.size()) return SplrResult::InvalidArgument;
    // the string lives as long as the published result, i.e. until the next resolve or destroy
    const auto& name = result->layers[index].name;
    *outName = name.c_str();
    *outLength = name.size();
    return SplrResult::Ok;
}

SplrResult splrGetLayerFrames(void* scene, size_t index, SplrFramePoint* buffer, size_t capacity, size_t* outCount) {
    if (!outCount) return SplrResult::InvalidArgument;
    *outCount = 0;
    auto result = publishedResult(scene);
    if (!result) return SplrResult::Failure;
    if (index >= result->layers.size()) return SplrResult::InvalidArgument;
    const auto& frames = result->layers[index].frames;
    *outCount = frames.size();
    if (!buffer) return SplrResult::Ok;
    if (capacity < frames.size()) return SplrResult::InvalidArgument;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        buffer[i].x = frames[i].x;
        buffer[i].y = frames[i].y;
        buffer[i].rotation = frames[i].rotation.value_or(0.0);
        buffer[i].hasRotation = frames[i].rotation.has_value();
    }
    return SplrResult::Ok;
}

SplrResult splrGetResultJson(void* scene, const char** outJson, size_t* outLength) {
    if (!outJson || !outLength) return SplrResult::InvalidArgument;
    std::lock_guard<std::mutex> lock(gMutex);
    auto it = gScenes.find(scene);
    if (it == gScenes.end() || !it->second) return SplrResult::InvalidArgument;
    if (!it->second->result) return SplrResult::Failure;
    *outJson = it->second->resultJson.c_str();
    *outLength = it->second->resultJson.size();
    return SplrResult::Ok;
}

SplrResult splrGetLastError(void* scene, const char** outMessage, size_t* outLength) {
    if (!outMessage || !outLength) return SplrResult::InvalidArgument;
    std::lock_guard<std::mutex> lock(gMutex);
    auto it = gScenes.find(scene);
    if (it == gScenes.end() || !it->second) return SplrResult::InvalidArgument;
    *outMessage = it->second->lastError.c_str();
    *outLength = it->second->lastError.size();
    return SplrResult::Ok;
}

void splrSetLogCallback(SplrLogFn callback, void* userData) {
    if (!callback) {
        splog::setSink({});
        return;
    }
    splog::setSink([callback, userData](const std::string& message) { callback(message.c_str(), message.size(), userData); });
}

} // extern "C"
