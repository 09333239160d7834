// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Runtime configuration of the spdlog-based logging macros
 *
 * The macros themselves live in Logging.hpp.  This translation unit applies
 * the SIGSEG_LOG_LEVEL environment variable once per process; the C API calls
 * initializeLogging() when the first instance is created.
 */

#include "sigseg-internal/Logging.hpp"
#include <cstdlib>
#include <mutex>
#include <string>
#include <spdlog/cfg/helpers.h>

namespace sigseg::lib
{
    namespace
    {
        constexpr auto const LOG_LEVEL_ENV_VAR = "SIGSEG_LOG_LEVEL";

        std::once_flag loggingInitFlag;
    }

    void initializeLogging()
    {
        std::call_once(loggingInitFlag,
            []
            {
                if (auto const* level = std::getenv(LOG_LEVEL_ENV_VAR); (level != nullptr) && (*level != '\0'))
                {
                    spdlog::cfg::helpers::load_levels(std::string{level});
                }
            });
    }
}
