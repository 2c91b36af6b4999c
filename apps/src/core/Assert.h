#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), DICETUNE_ASSERT is never compiled out.
 * Use for internal invariants that indicate bugs if violated, never for
 * validating user input or oracle output.
 *
 * When an assertion fails:
 * - Logs a CRITICAL message with file, line, and condition
 * - Aborts the program immediately
 *
 * Example:
 *   DICETUNE_ASSERT(next.size() == populationSize,
 *                   "Next generation must have exactly N individuals");
 */
#define DICETUNE_ASSERT(condition, message)                                                 \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
