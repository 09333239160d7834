// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SegmentIndexer.hpp
 * @brief Map segment indices to absolute time ranges
 *
 * A recording covers the time range [start, end) in absolute microseconds.
 * Configuring a segment length of S seconds divides that range into
 * fixed windows:
 *
 *   segment i = [start + i*S*1e6, start + (i+1)*S*1e6), clipped to end
 *
 * Only whole segments are counted: count = floor((end - start) / (S*1e6)).
 *
 * Example: a 3600 s recording with S = 60 has 60 segments; with S = 45.5
 * it has 79 segments and the trailing 5.5 s are not addressable.
 *
 * Segment lengths are converted to whole microseconds once (rounded to
 * nearest) so that every boundary is computed in exact integer arithmetic.
 *
 * All functions are pure and safe to call from any thread.
 */

#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace sigseg::lib
{
    constexpr std::int64_t MICROSECONDS_PER_SECOND = 1'000'000;

    /**
     * Half-open absolute time range in microseconds.
     */
    struct TimeRange
    {
        std::int64_t start;
        std::int64_t end;

        [[nodiscard]]
        constexpr std::int64_t duration() const noexcept
        {
            return end - start;
        }

        [[nodiscard]]
        constexpr bool valid() const noexcept
        {
            return end > start;
        }

        [[nodiscard]]
        constexpr bool operator==(TimeRange const& other) const noexcept
        {
            return (start == other.start) && (end == other.end);
        }
    };

    /**
     * Convert a segment length in seconds to whole microseconds.
     * @return The rounded length, 0 if \p seconds is not positive, or the
     *         largest int64 value if the length does not fit in one.
     */
    constexpr std::int64_t segmentLengthUs(double seconds) noexcept
    {
        if (!(seconds > 0.0))
        {
            return 0;
        }
        auto const scaled = seconds * static_cast<double>(MICROSECONDS_PER_SECOND) + 0.5;
        // 2^63, exactly representable as a double.
        if (scaled >= 9'223'372'036'854'775'808.0)
        {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(scaled);
    }

    /**
     * Number of whole segments of \p seconds that fit in \p bounds.
     * @return 0 if \p seconds <= 0 or \p bounds is empty.
     */
    constexpr std::int64_t segmentCount(TimeRange const& bounds, double seconds) noexcept
    {
        auto const lengthUs = segmentLengthUs(seconds);
        if ((lengthUs <= 0) || !bounds.valid())
        {
            return 0;
        }
        return bounds.duration() / lengthUs;
    }

    /**
     * Absolute time range of segment \p index.
     *
     * @throws Exception (SIGSEG_ERR_OUT_OF_RANGE) if \p index < 0 or
     *         \p index >= segmentCount(bounds, seconds).
     */
    TimeRange segmentRange(TimeRange const& bounds, double seconds, std::int64_t index);

    /** "YYYY-mm-dd HH:MM:SS.uuuuuu UTC" for microseconds since the Unix epoch, negative values included. */
    std::string formatTimestamp(std::int64_t microseconds);
}
