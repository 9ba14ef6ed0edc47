#pragma once

#include <cstdio>

#ifndef SHAPEEDIT_ENABLE_LOGGING
#define SHAPEEDIT_ENABLE_LOGGING 0
#endif

#if SHAPEEDIT_ENABLE_LOGGING
#define SHAPEEDIT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[shapeedit] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define SHAPEEDIT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[shapeedit] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define SHAPEEDIT_LOG_DEBUG(...) do { } while (0)
#define SHAPEEDIT_LOG_WARN(...) do { } while (0)
#endif
