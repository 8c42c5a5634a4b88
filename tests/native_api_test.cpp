#include "../core/native_api.hpp"

#include <cassert>
#include <cmath>
#include <string>
#include <vector>

namespace {

const char* kChainJson = R"({"frames":5,"layers":[
  {"name":"A","easing":"linear","points_store":[{"x":0,"y":0},{"x":10,"y":0}]},
  {"name":"B","easing":"linear","points_store":[{"x":5,"y":5}],"driven":{"driver":"A","d_scale":1.0}}]})";

const char* kCycleJson = R"({"layers":[
  {"name":"A","points_store":[{"x":0,"y":0}],"driven":{"driver":"C"}},
  {"name":"B","points_store":[{"x":0,"y":0}],"driven":{"driver":"A"}},
  {"name":"C","points_store":[{"x":0,"y":0}],"driven":{"driver":"B"}}]})";

std::vector<std::string> gLogLines;

void captureLog(const char* message, size_t length, void* userData) {
    auto* lines = static_cast<std::vector<std::string>*>(userData);
    lines->emplace_back(message, length);
}

void testResolveAndRead() {
    void* scene = nullptr;
    assert(splrLoadScene(kChainJson, &scene) == SplrResult::Ok);
    assert(scene);

    size_t count = 0;
    assert(splrGetLayerCount(scene, &count) == SplrResult::Failure);

    assert(splrResolveScene(scene, 5) == SplrResult::Ok);
    assert(splrGetLayerCount(scene, &count) == SplrResult::Ok);
    assert(count == 2);

    const char* name = nullptr;
    size_t nameLength = 0;
    assert(splrGetLayerName(scene, 1, &name, &nameLength) == SplrResult::Ok);
    assert(std::string(name, nameLength) == "B");
    assert(splrGetLayerName(scene, 2, &name, &nameLength) == SplrResult::InvalidArgument);

    size_t frames = 0;
    assert(splrGetLayerFrames(scene, 1, nullptr, 0, &frames) == SplrResult::Ok);
    assert(frames == 5);
    std::vector<SplrFramePoint> buffer(frames);
    assert(splrGetLayerFrames(scene, 1, buffer.data(), 2, &frames) == SplrResult::InvalidArgument);
    assert(splrGetLayerFrames(scene, 1, buffer.data(), buffer.size(), &frames) == SplrResult::Ok);
    assert(std::fabs(buffer[4].x - 15.0) < 1e-9);
    assert(std::fabs(buffer[4].y - 5.0) < 1e-9);
    assert(!buffer[4].hasRotation);

    const char* json = nullptr;
    size_t jsonLength = 0;
    assert(splrGetResultJson(scene, &json, &jsonLength) == SplrResult::Ok);
    assert(std::string(json, jsonLength).find("\"B\"") != std::string::npos);

    splrDestroyScene(scene);
    assert(splrGetLayerCount(scene, &count) == SplrResult::Failure);
    assert(splrResolveScene(scene, 5) == SplrResult::InvalidArgument);
}

void testCycleReportsDriverCycle() {
    gLogLines.clear();
    splrSetLogCallback(&captureLog, &gLogLines);

    void* scene = nullptr;
    assert(splrLoadScene(kCycleJson, &scene) == SplrResult::Ok);
    assert(splrResolveScene(scene, 10) == SplrResult::DriverCycle);

    size_t count = 0;
    assert(splrGetLayerCount(scene, &count) == SplrResult::Failure);
    const char* message = nullptr;
    size_t length = 0;
    assert(splrGetLastError(scene, &message, &length) == SplrResult::Ok);
    assert(std::string(message, length).find("A -> B -> C -> A") != std::string::npos);
    assert(!gLogLines.empty());

    splrDestroyScene(scene);
    splrSetLogCallback(nullptr, nullptr);
}

int gNesting = 0;
SplrResult gNestedLoad = SplrResult::Ok;

// Logs from inside the callback by loading a broken document once.
void reentrantLog(const char* message, size_t length, void* userData) {
    captureLog(message, length, userData);
    if (gNesting > 0) return;
    ++gNesting;
    void* nested = nullptr;
    gNestedLoad = splrLoadScene("{ not json", &nested);
    --gNesting;
}

void testLogCallbackMayReenter() {
    gLogLines.clear();
    splrSetLogCallback(&reentrantLog, &gLogLines);

    void* scene = nullptr;
    assert(splrLoadScene("{ not json", &scene) == SplrResult::Failure);
    assert(scene == nullptr);
    assert(gNestedLoad == SplrResult::Failure);
    assert(gLogLines.size() == 2);
    for (const auto& line : gLogLines) assert(line.find("scene load failed") != std::string::npos);

    assert(splrLoadScene(kChainJson, &scene) == SplrResult::Ok);
    assert(splrResolveScene(scene, 5) == SplrResult::Ok);
    splrDestroyScene(scene);
    splrSetLogCallback(nullptr, nullptr);
}

void testArgumentChecks() {
    void* scene = nullptr;
    assert(splrLoadScene(nullptr, &scene) == SplrResult::InvalidArgument);
    assert(splrLoadScene("{}", nullptr) == SplrResult::InvalidArgument);

    splrSetLogCallback(&captureLog, &gLogLines);
    assert(splrLoadScene("[broken", &scene) == SplrResult::Failure);
    assert(scene == nullptr);

    assert(splrLoadScene(kChainJson, &scene) == SplrResult::Ok);
    assert(splrResolveScene(scene, 0) == SplrResult::InvalidArgument);
    assert(splrGetLayerCount(scene, nullptr) == SplrResult::InvalidArgument);
    splrDestroyScene(scene);
    splrSetLogCallback(nullptr, nullptr);
}

} // namespace

int main() {
    testResolveAndRead();
    testCycleReportsDriverCycle();
    testArgumentChecks();
    testLogCallbackMayReenter();
    return 0;
}
