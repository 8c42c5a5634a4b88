#include "../core/anim/timing.hpp"

#include <cassert>
#include <cmath>

using namespace splinerig::core::anim;

namespace {

Path line(std::size_t n) {
    Path out;
    for (std::size_t i = 0; i < n; ++i) out.emplace_back(static_cast<double>(i), 0.0);
    return out;
}

void testAnimatedFrameCount() {
    assert(animatedFrameCount(41, PauseFrames{5, 6}) == 30);
    assert(animatedFrameCount(41, PauseFrames{0, 0}) == 41);
    assert(animatedFrameCount(10, PauseFrames{6, 4}) == 1);
    assert(animatedFrameCount(10, PauseFrames{30, 20}) == 1);
}

void testFrameIndexHolds() {
    const PauseFrames pauses{2, 3};
    const std::size_t total = 10;
    assert(frameIndex(0, total, pauses) == 0);
    assert(frameIndex(1, total, pauses) == 0);
    assert(frameIndex(2, total, pauses) == 0);
    assert(frameIndex(3, total, pauses) == 1);
    assert(frameIndex(6, total, pauses) == 4);
    assert(frameIndex(7, total, pauses) == 4);
    assert(frameIndex(9, total, pauses) == 4);
}

void testOffsetRoundTrip() {
    const std::size_t total = 30;
    const PauseFrames pauses{3, 2};
    const std::size_t animated = animatedFrameCount(total, pauses);
    const Path path = line(animated);

    for (int32_t offset : {7, -7, 1, -1}) {
        auto res = applyOffsetTiming(path, offset);
        assert(!res.clamped);
        const std::size_t start = pauses.start + res.startAdjust;
        const std::size_t end = pauses.end + res.endAdjust;
        assert(res.points.size() + start + end == total);
        assert(res.points.size() == animatedFrameCount(total, PauseFrames{static_cast<uint32_t>(start),
                                                                          static_cast<uint32_t>(end)}));
        assert(res.points.front().samePosition(path.front()));
        if (offset > 0) {
            assert(res.startAdjust == static_cast<uint32_t>(offset) && res.endAdjust == 0);
        } else {
            assert(res.endAdjust == static_cast<uint32_t>(-offset) && res.startAdjust == 0);
        }
    }
}

void testOffsetClamp() {
    auto res = applyOffsetTiming(line(10), 50);
    assert(res.clamped);
    assert(res.points.size() == 1);
    assert(res.startAdjust == 9);

    auto neg = applyOffsetTiming(line(10), -10);
    assert(neg.clamped);
    assert(neg.endAdjust == 9);

    auto none = applyOffsetTiming(line(4), 0);
    assert(none.points.size() == 4 && !none.clamped);
    assert(applyOffsetTiming(Path{}, 3).points.empty());
}

void testExpandToFrames() {
    const Path animated = line(5);
    auto frames = expandToFrames(animated, 10, PauseFrames{2, 3});
    assert(frames.size() == 10);
    assert(frames[0].x == 0.0 && frames[2].x == 0.0);
    assert(frames[3].x == 1.0);
    assert(frames[6].x == 4.0 && frames[9].x == 4.0);
}

void testRepeatLoop() {
    Path tri{Point(0, 0), Point(1, 0), Point(1, 1)};
    auto looped = repeatLoop(tri, 3);
    assert(looped.size() == 10);
    assert(looped[3].samePosition(Point(0, 0)));
    assert(looped[4].samePosition(Point(1, 0)));
    assert(looped.back().samePosition(Point(0, 0)));

    Path closed{Point(0, 0), Point(2, 0), Point(0, 0)};
    assert(repeatLoop(closed, 2).size() == 5);
    assert(repeatLoop(tri, 1).size() == 3);
    assert(repeatLoop(Path{Point(1, 1)}, 4).size() == 1);
}

} // namespace

int main() {
    testAnimatedFrameCount();
    testFrameIndexHolds();
    testOffsetRoundTrip();
    testOffsetClamp();
    testExpandToFrames();
    testRepeatLoop();
    return 0;
}
