// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ManagerOptionsParser.hpp
 * @brief Parse File Manager construction options from JSON
 *
 * Options are passed to sigsegCreateInstance() as a JSON object.  Every field
 * is optional, absent fields keep their defaults:
 *
 * {
 *   "prefetchDepth": 3,             // segments read ahead per served segment, 0 disables
 *   "cacheCapacityMultiplier": 5,   // cache capacity = max(1, depth * multiplier), 0 disables
 *   "workerCount": 4,               // prefetch threads, 0 disables
 *   "maxPendingPrefetch": 256,      // prefetch queue bound
 *   "shutdownGraceMs": 2000         // wait for running prefetch reads on shutdown
 * }
 *
 * Unknown fields are ignored.
 */

#pragma once

#include <cstddef>
#include <string>
#include <picojson/picojson.h>

namespace sigseg::lib
{
    /**
     * File Manager configuration, fixed for the lifetime of the manager.
     */
    struct FileManagerOptions
    {
        std::size_t prefetchDepth = 3;
        std::size_t cacheCapacityMultiplier = 5;
        std::size_t workerCount = 4;
        std::size_t maxPendingPrefetch = 256;
        std::size_t shutdownGraceMs = 2000;
    };

    /**
     * Parses options JSON into FileManagerOptions.
     *
     * Thread-safety: Immutable after construction.
     */
    class ManagerOptionsParser
    {
    public:
        /** No options, all defaults. */
        ManagerOptionsParser() = default;

        /**
         * Parse a JSON string of options.  An empty string means all defaults.
         *
         * @throws std::invalid_argument if the JSON is malformed, the root is not
         *         an object, or a known field is not a non-negative integer.
         */
        explicit ManagerOptionsParser(std::string const& in_options);

        [[nodiscard]]
        FileManagerOptions const& getOptions() const noexcept;

    private:
        [[nodiscard]]
        static std::size_t readCount(picojson::object const& root, char const* field, std::size_t defaultValue);

        FileManagerOptions _options;
    };
}
