// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief spdlog macros used by every sigseg component
 *
 * A failing sink must never fail a segment request, so each macro swallows
 * whatever the logger throws. TRACE and DEBUG only exist in builds without
 * NDEBUG; the runtime threshold comes from SIGSEG_LOG_LEVEL.
 */

#pragma once

// Compile-time floor for the SPDLOG_* macros, see the spdlog FAQ on removing debug statements.
#if !defined(SPDLOG_ACTIVE_LEVEL) && defined(NDEBUG)
#   define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif !defined(SPDLOG_ACTIVE_LEVEL)
#   define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>

#define SIGSEG_LOG_NOTHROW(statement) \
    do                                \
    {                                 \
        try                           \
        {                             \
            statement;                \
        }                             \
        catch (...)                   \
        {}                            \
    }                                 \
    while (false)

/** Per request detail: cache lookups, queue depth. */
#define SIGSEG_TRACE(...)    SIGSEG_LOG_NOTHROW(SPDLOG_TRACE(__VA_ARGS__))
/** Misses, evictions, scheduled and discarded prefetches. */
#define SIGSEG_DEBUG(...)    SIGSEG_LOG_NOTHROW(SPDLOG_DEBUG(__VA_ARGS__))
/** Recording lifecycle: open, close, segment length changes. */
#define SIGSEG_INFO(...)     SIGSEG_LOG_NOTHROW(SPDLOG_INFO(__VA_ARGS__))
#define SIGSEG_WARN(...)     SIGSEG_LOG_NOTHROW(SPDLOG_WARN(__VA_ARGS__))
/** Failed opens and reads. */
#define SIGSEG_ERROR(...)    SIGSEG_LOG_NOTHROW(SPDLOG_ERROR(__VA_ARGS__))
#define SIGSEG_CRITICAL(...) SIGSEG_LOG_NOTHROW(SPDLOG_CRITICAL(__VA_ARGS__))

namespace sigseg::lib
{
    /**
     * Reads SIGSEG_LOG_LEVEL once per process and hands it to spdlog's
     * level parser ("debug", "off,sigseg=trace", ...). Repeated calls do nothing.
     */
    void initializeLogging();
}
