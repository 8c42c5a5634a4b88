#pragma once

#include <cstddef>
#include <cstdint>

extern "C" {

enum class SplrResult : int {
    Ok = 0,
    InvalidArgument = 1,
    Failure = 2,
    DriverCycle = 3,
};

using SplrLogFn = void (*)(const char* message, size_t length, void* userData);

struct SplrFramePoint {
    double x;
    double y;
    double rotation;
    bool hasRotation;
};

// Scene handles
SplrResult splrLoadScene(const char* jsonUtf8, void** outScene);
void splrDestroyScene(void* scene);

// Resolution. Results become visible to the getters only once complete.
SplrResult splrResolveScene(void* scene, int totalFrames);
SplrResult splrGetLayerCount(void* scene, size_t* outCount);
SplrResult splrGetLayerName(void* scene, size_t index, const char** outName, size_t* outLength);
// With a null buffer only outCount is written.
SplrResult splrGetLayerFrames(void* scene, size_t index, SplrFramePoint* buffer, size_t capacity, size_t* outCount);
SplrResult splrGetResultJson(void* scene, const char** outJson, size_t* outLength);
SplrResult splrGetLastError(void* scene, const char** outMessage, size_t* outLength);

void splrSetLogCallback(SplrLogFn callback, void* userData);

} // extern "C"
