#pragma once

#include <cstdio>

#ifndef REFLOW_ENABLE_LOGGING
#define REFLOW_ENABLE_LOGGING 0
#endif

#if REFLOW_ENABLE_LOGGING
#define REFLOW_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[reflow] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define REFLOW_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[reflow:warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define REFLOW_LOG_DEBUG(...) do { } while (0)
#define REFLOW_LOG_WARN(...) do { } while (0)
#endif
