// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ManagedFile.hpp
 * @brief State of one open recording: configuration, cache and in-flight reads
 *
 * A ManagedFile is created by FileManager::open() and lives in the registry
 * until FileManager::close().  It owns:
 *
 *   - the shared reader handle (released on close)
 *   - the segmentation configuration (segment length, active channels)
 *   - a generation counter bumped on every configuration change
 *   - the SegmentCache for the current and older generations
 *   - the table of demand reads currently in flight
 *
 * LOCKING:
 * One mutex guards every mutable member.  Reader I/O always happens outside
 * the lock: the reader pointer, the channel list and the time range are copied
 * under the lock, the read runs unlocked and the lock is taken again to check
 * the generation and store the result.
 *
 * SINGLE FLIGHT:
 * Concurrent demand misses for the same (generation, index) share one read.
 * The first caller performs it, later callers wait on its shared future and
 * receive the same data or the same ReadError.
 *
 * CLOSE:
 * close() drops the reader reference and the cache.  Reads still running
 * keep their own reference, finish normally and find the file closed when
 * they come back, so close() never waits for I/O.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "sigseg-internal/RecordingReader.hpp"
#include "sigseg-internal/SegmentCache.hpp"
#include "sigseg-internal/SegmentIndexer.hpp"

namespace sigseg::lib
{
    /**
     * Snapshot of an open file's metadata and configuration.
     */
    struct FileInfo
    {
        std::string path;
        /** All channels of the recording, in storage order. */
        std::vector<ChannelInfo> channels;
        std::vector<std::string> activeChannels;
        /** Earliest start and latest end across the active channels. */
        TimeRange timeBounds;
        /** 0 while no segmentation is configured. */
        double segmentSeconds;
        std::int64_t segmentCount;
        std::uint64_t generation;

        [[nodiscard]]
        std::vector<std::string> channelNames() const;

        [[nodiscard]]
        double durationSeconds() const noexcept;
    };

    /**
     * Cache counters of one open file, since it was opened.
     */
    struct CacheStatistics
    {
        std::uint64_t hits;
        std::uint64_t misses;
        std::uint64_t prefetchStored;
        std::uint64_t prefetchDiscarded;
        std::uint64_t evictions;
        std::size_t liveEntries;
        std::size_t capacity;
    };

    /**
     * Indices worth prefetching after a served segment, with the generation
     * they were computed under.
     */
    struct PrefetchPlan
    {
        std::uint64_t generation;
        std::vector<std::int64_t> indices;
    };

    class ManagedFile
    {
    public:
        /**
         * @param path Registry key.
         * @param reader Open reader.  Its channel list must not be empty.
         * @param cacheCapacity Maximum number of cached segments, 0 disables caching.
         */
        ManagedFile(std::string path, std::shared_ptr<RecordingReader> reader, std::size_t cacheCapacity);

        ManagedFile(ManagedFile const&) = delete;
        ManagedFile& operator=(ManagedFile const&) = delete;

        [[nodiscard]]
        std::string const& getPath() const noexcept;

        [[nodiscard]]
        bool isOpen() const;

        [[nodiscard]]
        FileInfo info() const;

        [[nodiscard]]
        std::vector<std::string> activeChannels() const;

        [[nodiscard]]
        CacheStatistics statistics() const;

        /**
         * @return 0 if closed or no segment length is configured.
         */
        [[nodiscard]]
        std::int64_t segmentCount() const;

        [[nodiscard]]
        std::uint64_t generation() const;

        /**
         * Configure the segment length and start a new generation.
         *
         * @return The new segment count.
         * @throws Exception (SIGSEG_ERR_INVALID_ARG) if \p seconds is not a positive finite number.
         * @throws Exception (SIGSEG_ERR_NOT_OPEN) if the file was closed.
         */
        std::int64_t setSegmentSeconds(double seconds);

        /**
         * Select the channels returned by readSegment(), in the given order,
         * and start a new generation.  The time bounds follow the new set.
         *
         * @throws Exception (SIGSEG_ERR_INVALID_ARG) if \p channels is empty,
         *         names an unknown channel or names a channel twice.
         * @throws Exception (SIGSEG_ERR_NOT_OPEN) if the file was closed.
         */
        void setActiveChannels(std::vector<std::string> const& channels);

        /**
         * Serve segment \p index from the cache or from the reader.
         *
         * A read that completes after the generation changed is returned to
         * its caller but not cached.
         *
         * @throws Exception with SIGSEG_ERR_NOT_OPEN, SIGSEG_ERR_NOT_SEGMENTED,
         *         SIGSEG_ERR_OUT_OF_RANGE or SIGSEG_ERR_READ.
         */
        [[nodiscard]]
        std::shared_ptr<SegmentData const> readSegment(std::int64_t index);

        /**
         * Indices index+1 .. index+depth that are in range, not cached and not
         * being read for the current generation.
         */
        [[nodiscard]]
        PrefetchPlan prefetchCandidates(std::int64_t index, std::size_t depth) const;

        /**
         * Read segment \p index into the cache on behalf of the prefetcher.
         *
         * The result is discarded silently when the file was closed or the
         * generation moved away from \p generation, before or after the read.
         * Read failures are logged and not cached.
         *
         * @return true if the segment was stored.
         */
        bool prefetchSegment(std::int64_t index, std::uint64_t generation);

        /**
         * Release the reader reference and drop the cache.  Idempotent.
         */
        void close();

    private:
        struct InflightRead
        {
            std::uint64_t generation;
            std::uint64_t token;
            std::shared_future<std::shared_ptr<SegmentData const>> result;
        };

        /** Requires _mutex. */
        void recomputeBounds();

        /** Requires _mutex. */
        [[nodiscard]]
        std::int64_t segmentCountLocked() const noexcept;

        /** Requires _mutex. */
        [[nodiscard]]
        bool isInflightLocked(std::int64_t index) const noexcept;

        std::string const _path;
        std::vector<ChannelInfo> const _channels;

        mutable std::mutex _mutex;
        std::shared_ptr<RecordingReader> _reader;
        std::vector<std::string> _activeChannels;
        TimeRange _timeBounds;
        double _segmentSeconds;
        std::uint64_t _generation;
        SegmentCache _cache;
        std::map<std::int64_t, InflightRead> _inflight;
        std::uint64_t _nextToken;

        std::uint64_t _hits;
        std::uint64_t _misses;
        std::uint64_t _prefetchStored;
        std::uint64_t _prefetchDiscarded;
        std::uint64_t _evictions;
    };
}
