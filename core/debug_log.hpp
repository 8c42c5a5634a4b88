#pragma once

#include <cstdio>

// Trace lines are prefixed and newline-terminated here; call sites pass the body only.
#ifdef SPLR_ENABLE_DEBUG_LOG
#define SPLR_DBG_LOG(format, ...) std::fprintf(stderr, "[splinerig] " format "\n" __VA_OPT__(, ) __VA_ARGS__)
#else
#define SPLR_DBG_LOG(format, ...) static_cast<void>(0)
#endif
