#include "../core/anim/bake.hpp"
#include "../core/log.hpp"
#include "../core/scene.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using namespace splinerig::core;
using namespace splinerig::core::anim;

namespace {

bool nearlyEqual(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

LayerSpec linearLayer(const std::string& name, Path points) {
    LayerSpec spec;
    spec.name = name;
    spec.rawPoints = std::move(points);
    spec.easing.function = EasingKind::Linear;
    return spec;
}

void testEveryLayerHasTotalFrames() {
    Scene scene;
    scene.addLayer(linearLayer("A", Path{Point(0, 0), Point(10, 0), Point(10, 10)}));
    scene.addLayer(linearLayer("B", Path{Point(3, 3)}));
    auto c = linearLayer("C", Path{Point(0, 0), Point(5, 5)});
    c.interpolation = Interpolation::Basis;
    c.easing.function = EasingKind::OutIn;
    c.timing.acceleration = 0.4;
    scene.addLayer(c);
    for (int frames : {1, 2, 41, 300}) {
        auto result = scene.resolve(frames);
        assert(result.totalFrames == static_cast<std::size_t>(frames));
        assert(result.layers.size() == 3);
        for (const auto& layer : result.layers) assert(layer.frames.size() == static_cast<std::size_t>(frames));
    }
}

void testPauses() {
    Scene scene;
    auto a = linearLayer("A", Path{Point(0, 0), Point(40, 0)});
    a.timing.startPause = 2;
    a.timing.endPause = 3;
    scene.addLayer(a);
    auto result = scene.resolve(10);
    const auto& f = result.layers[0].frames;
    assert(f[0].x == 0.0 && f[2].x == 0.0);
    assert(nearlyEqual(f[3].x, 10.0));
    assert(f[6].x == 40.0 && f[9].x == 40.0);
    assert(result.layers[0].pauses.start == 2 && result.layers[0].pauses.end == 3);
}

void testPositiveOffsetWaitsAtStart() {
    Scene scene;
    auto a = linearLayer("A", Path{Point(0, 0), Point(40, 0)});
    a.timing.offset = 5;
    scene.addLayer(a);
    auto result = scene.resolve(11);
    const auto& layer = result.layers[0];
    assert(layer.pauses.start == 5 && layer.pauses.end == 0);
    assert(layer.frames[4].x == 0.0);
    assert(nearlyEqual(layer.frames[6].x, 4.0));
    assert(nearlyEqual(layer.frames[10].x, 20.0));
}

void testNegativeOffsetHoldsAtEnd() {
    Scene scene;
    auto a = linearLayer("A", Path{Point(0, 0), Point(40, 0)});
    a.timing.offset = -5;
    scene.addLayer(a);
    auto result = scene.resolve(11);
    const auto& layer = result.layers[0];
    assert(layer.pauses.end == 5);
    assert(nearlyEqual(layer.frames[5].x, 20.0));
    assert(nearlyEqual(layer.frames[10].x, 20.0));
}

void testOffsetClampIsReported() {
    Scene scene;
    auto a = linearLayer("A", Path{Point(0, 0), Point(40, 0)});
    a.timing.offset = 100;
    scene.addLayer(a);
    auto result = scene.resolve(11);
    assert(result.diagnostics.size() == 1);
    assert(result.diagnostics[0].kind == ErrorKind::OffsetClamped);
    assert(result.layers[0].pauses.start == 10);
    for (const auto& p : result.layers[0].frames) assert(p.x == 0.0);
}

void testHugePausesDoNotWrap() {
    constexpr uint32_t kMax = std::numeric_limits<uint32_t>::max();
    Scene scene;
    auto a = linearLayer("A", Path{Point(2, 3), Point(40, 0)});
    a.timing.startPause = kMax;
    a.timing.endPause = kMax - 1;
    a.timing.offset = 5;
    scene.addLayer(a);
    auto b = linearLayer("B", Path{Point(7, 1), Point(40, 0)});
    b.timing.endPause = kMax;
    b.timing.offset = -5;
    scene.addLayer(b);
    auto result = scene.resolve(12);
    assert(result.layers[0].pauses.start == kMax);
    assert(result.layers[0].pauses.end == kMax - 1);
    assert(result.layers[1].pauses.end == kMax);
    for (const auto& layer : result.layers) assert(layer.frames.size() == 12);
    for (const auto& p : result.layers[0].frames) assert(p.x == 2.0 && p.y == 3.0);
    for (const auto& p : result.layers[1].frames) assert(p.x == 7.0 && p.y == 1.0);
}

void testInvalidFrameCount() {
    Scene scene;
    scene.addLayer(linearLayer("A", Path{Point(0, 0)}));
    for (int frames : {0, -3}) {
        bool threw = false;
        try {
            scene.resolve(frames);
        } catch (const EngineError& e) {
            threw = e.kind() == ErrorKind::InvalidFrameCount;
        }
        assert(threw);
    }
}

void testEmptyLayerIsFatal() {
    Scene scene;
    scene.addLayer(linearLayer("A", Path{}));
    bool threw = false;
    try {
        scene.resolve(5);
    } catch (const EngineError& e) {
        threw = e.kind() == ErrorKind::EmptyPath && e.layer() == "A";
    }
    assert(threw);
}

void testHanddrawIgnoresSplineInterpolation() {
    Scene scene;
    auto a = linearLayer("A", Path{Point(0, 0), Point(10, 0), Point(10, 10)});
    a.type = LayerType::Handdraw;
    a.interpolation = Interpolation::Cardinal;
    scene.addLayer(a);
    auto result = scene.resolve(5);
    const auto& f = result.layers[0].frames;
    assert(nearlyEqual(f[1].x, 5.0) && nearlyEqual(f[1].y, 0.0));
    assert(nearlyEqual(f[3].x, 10.0) && nearlyEqual(f[3].y, 5.0));
    assert(result.layers[0].type == LayerType::Handdraw);
}

void testRepeatLoops() {
    Scene scene;
    auto a = linearLayer("A", Path{Point(0, 0), Point(10, 0)});
    a.repeat = 2;
    scene.addLayer(a);
    auto result = scene.resolve(5);
    const auto& f = result.layers[0].frames;
    assert(nearlyEqual(f[1].x, 10.0));
    assert(nearlyEqual(f[2].x, 0.0));
    assert(nearlyEqual(f[3].x, 10.0));
    assert(f[4].x == 0.0);
}

void testBoxRotationInterpolates() {
    Scene scene;
    Point p0(0, 0);
    p0.rotation = 0.0;
    p0.scale = 2.0;
    Point p1(10, 0);
    p1.rotation = 90.0;
    auto box = linearLayer("Box", Path{p0, p1});
    box.type = LayerType::Box;
    box.scale = 1.5;
    scene.addLayer(box);
    auto result = scene.resolve(3);
    const auto& layer = result.layers[0];
    assert(layer.frames[1].rotation && nearlyEqual(*layer.frames[1].rotation, 45.0));
    assert(layer.frames[1].scale && *layer.frames[1].scale == 2.0);
    assert(layer.scale == 1.5);
}

void testHiddenLayerStillDrives() {
    Scene scene;
    auto a = linearLayer("A", Path{Point(0, 0), Point(10, 0)});
    a.visible = false;
    scene.addLayer(a);
    auto b = linearLayer("B", Path{Point(0, 0)});
    b.driver = DriverSpec{"A", 0.0, 0.0, 1.0};
    scene.addLayer(b);
    auto result = scene.resolve(3);
    assert(!result.find("A")->visible);
    assert(result.find("B")->visible);
    assert(nearlyEqual(result.find("B")->frames[2].x, 10.0));
}

void testEachSegmentationTagsRawPoints() {
    auto spec = linearLayer("A", Path{Point(0, 0), Point(10, 0), Point(30, 0)});
    spec.easing.segmentation = Segmentation::Each;
    auto raw = prepareRawPoints(spec);
    for (const auto& p : raw) assert(p.isControl);

    spec.easing.segmentation = Segmentation::Full;
    raw = prepareRawPoints(spec);
    for (const auto& p : raw) assert(!p.isControl);
}

void testCardinalEachKeepsControlBreakpoints() {
    Scene scene;
    auto a = linearLayer("A", Path{Point(0, 0), Point(10, 0), Point(30, 0)});
    a.interpolation = Interpolation::Cardinal;
    a.easing.segmentation = Segmentation::Each;
    scene.addLayer(a);
    auto result = scene.resolve(31);
    const auto& f = result.layers[0].frames;
    assert(nearlyEqual(f[9].x, 10.0, 1e-9));
    assert(nearlyEqual(f[10].x, 10.0, 1e-9));
}

void testDefaultFramesFromConfig() {
    EngineConfig config;
    config.defaultTotalFrames = 12;
    Scene scene(config);
    scene.addLayer(linearLayer("A", Path{Point(0, 0), Point(1, 1)}));
    auto result = scene.resolve();
    assert(result.totalFrames == 12);
    assert(scene.findLayer("A") && !scene.findLayer("Z"));
    assert(result.find("Z") == nullptr);
}

} // namespace

int main() {
    splinerig::core::log::setSink([](const std::string&) {});
    testEveryLayerHasTotalFrames();
    testPauses();
    testPositiveOffsetWaitsAtStart();
    testNegativeOffsetHoldsAtEnd();
    testOffsetClampIsReported();
    testHugePausesDoNotWrap();
    testInvalidFrameCount();
    testEmptyLayerIsFatal();
    testHanddrawIgnoresSplineInterpolation();
    testRepeatLoops();
    testBoxRotationInterpolates();
    testHiddenLayerStillDrives();
    testEachSegmentationTagsRawPoints();
    testCardinalEachKeepsControlBreakpoints();
    testDefaultFramesFromConfig();
    return 0;
}
