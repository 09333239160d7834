// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "sigseg-internal/SegmentIndexer.hpp"
#include <algorithm>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include "sigseg-internal/Exception.hpp"

namespace sigseg::lib
{
    TimeRange segmentRange(TimeRange const& bounds, double seconds, std::int64_t index)
    {
        auto const count = segmentCount(bounds, seconds);
        if ((index < 0) || (index >= count))
        {
            throw Exception::outOfRange("Segment index {} is outside [0, {}).", index, count);
        }

        auto const lengthUs = segmentLengthUs(seconds);
        auto const start = bounds.start + index * lengthUs;
        return TimeRange{start, std::min(start + lengthUs, bounds.end)};
    }

    std::string formatTimestamp(std::int64_t microseconds)
    {
        auto seconds = microseconds / MICROSECONDS_PER_SECOND;
        auto fraction = microseconds % MICROSECONDS_PER_SECOND;
        if (fraction < 0)
        {
            fraction += MICROSECONDS_PER_SECOND;
            --seconds;
        }
        return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06} UTC", fmt::gmtime(static_cast<std::time_t>(seconds)), fraction);
    }
}
