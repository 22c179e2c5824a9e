#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef PONG_ENABLE_DEBUG
#define PONG_ENABLE_DEBUG 1
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Match lifecycle goes to stderr so it never mixes with profiler output
#define DEBUG_MSG(level, x) do { \
    if (PONG_ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cerr << x; \
    } \
} while(0)
