// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file FileManager.hpp
 * @brief Registry of open recordings serving cached and prefetched segments
 *
 * The FileManager is the entry point of the service layer.  It owns:
 *
 *   - the registry path -> ManagedFile, guarded by a registry mutex that is
 *     only held for insert, remove and lookup
 *   - the reader factory used to open recordings
 *   - the PrefetchScheduler shared by all files
 *
 * State machine per path:  CLOSED -> OPEN -> SEGMENTED -> CLOSED
 * (setActiveChannels is accepted in both OPEN and SEGMENTED.)
 *
 * Every operation on a path resolves the ManagedFile under the registry mutex
 * and then works on that file only, so operations on different files never
 * wait for each other.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "sigseg-internal/ManagedFile.hpp"
#include "sigseg-internal/ManagerOptionsParser.hpp"
#include "sigseg-internal/PrefetchScheduler.hpp"
#include "sigseg-internal/RecordingReader.hpp"

namespace sigseg::lib
{
    class FileManager
    {
    public:
        ///
        /// Creates a FileManager and starts its prefetch pool.
        ///
        /// \param[in] factory Opens readers for recording paths.
        /// \param[in] options Prefetch and cache configuration.
        ///
        FileManager(std::shared_ptr<RecordingReaderFactory> factory, FileManagerOptions const& options);

        FileManager(FileManager const&) = delete;
        FileManager& operator=(FileManager const&) = delete;

        /// Shuts the manager down.
        ~FileManager();

        ///
        /// Open a recording.  Opening an already open path returns its current info without side effects.
        ///
        /// \param[in] path The recording path, also the registry key.
        /// \return The file info snapshot.
        /// \throws Exception (SIGSEG_ERR_OPEN) if the recording cannot be opened.  Nothing is registered in that case.
        ///
        FileInfo open(std::string const& path);

        ///
        /// Close a recording: cancel its queued prefetch units, drop its cache, release its reader
        /// and unregister it.  No-op if the path is not open.  Never waits for in-flight reads.
        ///
        void close(std::string const& path);

        ///
        /// Configure the segment length and invalidate everything cached under the previous configuration.
        ///
        /// \return The new segment count.
        /// \throws Exception (SIGSEG_ERR_NOT_OPEN, SIGSEG_ERR_INVALID_ARG)
        ///
        std::int64_t setSegmentSeconds(std::string const& path, double seconds);

        ///
        /// Select the channels served by getSegment(), in order, and invalidate the cache.
        ///
        /// \throws Exception (SIGSEG_ERR_NOT_OPEN, SIGSEG_ERR_INVALID_ARG)
        ///
        void setActiveChannels(std::string const& path, std::vector<std::string> const& channels);

        ///
        /// \return The segment count, 0 if the path is not open or no segment length is configured.
        ///
        [[nodiscard]]
        std::int64_t getNumberOfSegments(std::string const& path) const noexcept;

        ///
        /// Serve one segment and schedule the prefetch of the following ones.
        ///
        /// \return One sample array per active channel, in active channel order.
        /// \throws Exception (SIGSEG_ERR_NOT_OPEN, SIGSEG_ERR_NOT_SEGMENTED, SIGSEG_ERR_OUT_OF_RANGE, SIGSEG_ERR_READ)
        ///
        [[nodiscard]]
        std::shared_ptr<SegmentData const> getSegment(std::string const& path, std::int64_t index);

        /// Snapshot of the open paths, sorted.
        [[nodiscard]]
        std::vector<std::string> listOpenFiles() const;

        /// \throws Exception (SIGSEG_ERR_NOT_OPEN)
        [[nodiscard]]
        FileInfo getFileInfo(std::string const& path) const;

        /// \throws Exception (SIGSEG_ERR_NOT_OPEN)
        [[nodiscard]]
        std::vector<std::string> getActiveChannels(std::string const& path) const;

        /// \throws Exception (SIGSEG_ERR_NOT_OPEN)
        [[nodiscard]]
        CacheStatistics getCacheStatistics(std::string const& path) const;

        ///
        /// Stop the prefetch pool, then close every open file.  Idempotent.
        /// Files opened afterwards are served without prefetching.
        ///
        void shutdown();

        ///
        /// Block until no prefetch unit is queued or running.
        ///
        void waitForPrefetch() const;

        [[nodiscard]]
        FileManagerOptions const& getOptions() const noexcept;

    private:
        /// \return The registered file, or nullptr.
        [[nodiscard]]
        std::shared_ptr<ManagedFile> find(std::string const& path) const;

        /// \throws Exception (SIGSEG_ERR_NOT_OPEN) if \p path is not registered.
        [[nodiscard]]
        std::shared_ptr<ManagedFile> get(std::string const& path) const;

        std::shared_ptr<RecordingReaderFactory> _factory;
        FileManagerOptions const _options;
        std::size_t const _cacheCapacity;
        PrefetchScheduler _scheduler;

        mutable std::mutex _mutex;
        std::map<std::string, std::shared_ptr<ManagedFile>> _files;
    };
}
