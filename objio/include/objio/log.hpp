#pragma once

#include <iostream>

// ============================================================================
// Log Level Control
// ============================================================================
// Higher number = more verbose
#define OBJIO_LOG_LEVEL_SILENT  0  // No logs
#define OBJIO_LOG_LEVEL_ERROR   1  // Errors only
#define OBJIO_LOG_LEVEL_WARN    2  // Warnings + errors
#define OBJIO_LOG_LEVEL_INFO    3  // Store setup, sweeps, warnings, errors (default)
#define OBJIO_LOG_LEVEL_VERBOSE 4  // Every fetch, close, acquire and release

// Override from the build (-DOBJIO_LOG_LEVEL=4) or before including this header
#ifndef OBJIO_LOG_LEVEL
#define OBJIO_LOG_LEVEL OBJIO_LOG_LEVEL_INFO
#endif

// Messages are stream expressions: OBJIO_LOG_INFO("[store] " << name << " ready")
#define OBJIO_LOG_VERBOSE(msg) do { if (OBJIO_LOG_LEVEL >= OBJIO_LOG_LEVEL_VERBOSE) { std::cout << msg << std::endl; } } while (0)
#define OBJIO_LOG_INFO(msg)    do { if (OBJIO_LOG_LEVEL >= OBJIO_LOG_LEVEL_INFO)    { std::cout << msg << std::endl; } } while (0)
#define OBJIO_LOG_WARN(msg)    do { if (OBJIO_LOG_LEVEL >= OBJIO_LOG_LEVEL_WARN)    { std::cerr << "[WARN] " << msg << std::endl; } } while (0)
#define OBJIO_LOG_ERROR(msg)   do { if (OBJIO_LOG_LEVEL >= OBJIO_LOG_LEVEL_ERROR)   { std::cerr << "[ERROR] " << msg << std::endl; } } while (0)

namespace objio {

inline const char* log_level_name() {
#if OBJIO_LOG_LEVEL == OBJIO_LOG_LEVEL_SILENT
    return "SILENT";
#elif OBJIO_LOG_LEVEL == OBJIO_LOG_LEVEL_ERROR
    return "ERROR";
#elif OBJIO_LOG_LEVEL == OBJIO_LOG_LEVEL_WARN
    return "WARN";
#elif OBJIO_LOG_LEVEL == OBJIO_LOG_LEVEL_INFO
    return "INFO";
#elif OBJIO_LOG_LEVEL == OBJIO_LOG_LEVEL_VERBOSE
    return "VERBOSE";
#else
    return "UNKNOWN";
#endif
}

} // namespace objio
