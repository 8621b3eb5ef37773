#pragma once

// Debug configuration
// Set to 1 to enable verbose per-job tracing, 0 for production builds
#ifndef BLAT_DEBUG
#define BLAT_DEBUG 0
#endif

// Debug logging macro - compiles to nothing when BLAT_DEBUG is 0
#if BLAT_DEBUG
#include "blat/logger/Logger.hpp"
#include <sstream>
#define BLAT_DEBUG_LOG(msg) \
    do { \
        std::ostringstream oss; \
        oss << msg; \
        blat::Logger::getInstance().logDebug(oss.str()); \
    } while(0)
#else
#define BLAT_DEBUG_LOG(msg) ((void)0)
#endif
