#pragma once

#include <cstdio>

#ifndef FENCE_ENABLE_LOGGING
#define FENCE_ENABLE_LOGGING 0
#endif

#if FENCE_ENABLE_LOGGING
#define FENCE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[fence] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define FENCE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[fence][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define FENCE_LOG_ERROR(...) \
    do { \
        std::fprintf(stderr, "[fence][error] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define FENCE_LOG_DEBUG(...) do { } while (0)
#define FENCE_LOG_WARN(...) do { } while (0)
#define FENCE_LOG_ERROR(...) do { } while (0)
#endif
