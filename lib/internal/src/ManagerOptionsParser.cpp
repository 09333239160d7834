// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ManagerOptionsParser.cpp
 * @brief Parses File Manager options from JSON
 */

#include "sigseg-internal/ManagerOptionsParser.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <fmt/format.h>
#include "sigseg-internal/Logging.hpp"

namespace sigseg::lib
{
    ManagerOptionsParser::ManagerOptionsParser(std::string const& in_options)
    {
        if (in_options.empty())
        {
            return;
        }

        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_options);
        if (!err.empty())
        {
            throw std::invalid_argument{"Invalid JSON options. " + err};
        }

        if (!jsonValue.is<picojson::object>())
        {
            throw std::invalid_argument{"Expected a JSON object"};
        }
        auto const& root = jsonValue.get<picojson::object>();

        _options.prefetchDepth = readCount(root, "prefetchDepth", _options.prefetchDepth);
        _options.cacheCapacityMultiplier = readCount(root, "cacheCapacityMultiplier", _options.cacheCapacityMultiplier);
        _options.workerCount = readCount(root, "workerCount", _options.workerCount);
        _options.maxPendingPrefetch = readCount(root, "maxPendingPrefetch", _options.maxPendingPrefetch);
        _options.shutdownGraceMs = readCount(root, "shutdownGraceMs", _options.shutdownGraceMs);

        SIGSEG_DEBUG("Manager options: prefetchDepth={} cacheCapacityMultiplier={} workerCount={} maxPendingPrefetch={} shutdownGraceMs={}",
            _options.prefetchDepth,
            _options.cacheCapacityMultiplier,
            _options.workerCount,
            _options.maxPendingPrefetch,
            _options.shutdownGraceMs);
    }

    FileManagerOptions const& ManagerOptionsParser::getOptions() const noexcept
    {
        return _options;
    }

    std::size_t ManagerOptionsParser::readCount(picojson::object const& root, char const* field, std::size_t defaultValue)
    {
        auto const it = root.find(field);
        if (it == root.end())
        {
            return defaultValue;
        }

        if (!it->second.is<double>())
        {
            throw std::invalid_argument{fmt::format("{} must be a number.", field)};
        }

        auto const v = it->second.get<double>();
        if (!std::isfinite(v) || (v < 0.0) || (std::floor(v) != v))
        {
            throw std::invalid_argument{fmt::format("{} must be a non-negative integer, got {}.", field, v)};
        }
        if (v > static_cast<double>(std::numeric_limits<std::uint32_t>::max()))
        {
            throw std::invalid_argument{fmt::format("{} is too large.", field)};
        }
        return static_cast<std::size_t>(v);
    }
}
