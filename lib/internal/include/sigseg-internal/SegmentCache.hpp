// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SegmentCache.hpp
 * @brief Bounded per-file store of segment data tagged with a generation
 *
 * Every entry remembers the generation of its file's configuration at the
 * time it was read.  A lookup only succeeds when the stored generation equals
 * the caller's, so bumping a file's generation invalidates the whole cache
 * without touching it.  Stale entries stay in place until they are replaced
 * or evicted.
 *
 * EVICTION:
 * - The total number of entries never exceeds capacity().
 * - When an insertion needs room, stale entries go first, then the least
 *   recently accessed live entry.
 * - Within each class the oldest access wins, ties go to the lowest index.
 *
 * Recency is a logical clock incremented on every put() and touch().
 *
 * Thread-safety: none.  The owning ManagedFile serializes all calls under its
 * own lock.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include "sigseg-internal/RecordingReader.hpp"

namespace sigseg::lib
{
    struct CacheEntry
    {
        std::int64_t segmentIndex;
        std::uint64_t generation;
        std::shared_ptr<SegmentData const> data;
        std::uint64_t lastAccess;
    };

    class SegmentCache
    {
    public:
        /**
         * Capacity derived from the manager options.
         * @return 0 if \p multiplier is 0, otherwise max(1, prefetchDepth * multiplier).
         */
        [[nodiscard]]
        static std::size_t capacityFor(std::size_t prefetchDepth, std::size_t multiplier) noexcept;

        explicit SegmentCache(std::size_t capacity);

        /**
         * Look up segment \p index for \p generation.
         * Does not update recency, see touch().
         *
         * @return The cached data, or nullptr on a miss (absent or stale).
         */
        [[nodiscard]]
        std::shared_ptr<SegmentData const> get(std::int64_t index, std::uint64_t generation) const;

        /** True if get() would hit. */
        [[nodiscard]]
        bool contains(std::int64_t index, std::uint64_t generation) const noexcept;

        /**
         * Mark segment \p index as most recently used.  No-op if absent.
         */
        void touch(std::int64_t index) noexcept;

        /**
         * Insert or replace segment \p index.
         *
         * @return The number of entries evicted to make room (0 or 1).  Nothing
         *         is stored when the capacity is 0.
         */
        std::size_t put(std::int64_t index, std::uint64_t generation, std::shared_ptr<SegmentData const> data);

        /** Number of stored entries, stale ones included. */
        [[nodiscard]]
        std::size_t size() const noexcept;

        /** Number of entries stored for \p generation. */
        [[nodiscard]]
        std::size_t liveSize(std::uint64_t generation) const noexcept;

        [[nodiscard]]
        std::size_t capacity() const noexcept;

        void clear() noexcept;

    private:
        /** Remove the eviction victim for an insertion under \p generation. */
        void evictOne(std::uint64_t generation);

        std::size_t _capacity;
        std::uint64_t _clock;
        std::map<std::int64_t, CacheEntry> _entries;
    };
}
