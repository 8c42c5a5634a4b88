#include "log.hpp"

#include <cstdio>
#include <mutex>
#include <utility>

namespace splinerig::core::log {

namespace {
Sink gSink{};
std::mutex gMutex;
} // namespace

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(gMutex);
    gSink = std::move(sink);
}

void message(const std::string& text) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(gMutex);
        sink = gSink;
    }
    // called unlocked: a sink may re-enter the library and log again
    if (sink) {
        sink(text);
        return;
    }
    std::fprintf(stderr, "[splinerig] %s\n", text.c_str());
}

} // namespace splinerig::core::log
