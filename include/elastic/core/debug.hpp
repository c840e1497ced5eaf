#pragma once

#include <iostream>

// Configured from CMake (ELASTIC_ENABLE_DEBUG); off unless requested
#ifndef ELASTIC_ENABLE_DEBUG
#define ELASTIC_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (ELASTIC_ENABLE_DEBUG && (level) <= CURRENT_DEBUG_LEVEL) { \
        std::cerr << x; \
    } \
} while(0)
