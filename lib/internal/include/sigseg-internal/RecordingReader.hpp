// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file RecordingReader.hpp
 * @brief Abstract handle to one multichannel recording in storage
 *
 * RecordingReader is the boundary between the segment cache and the storage
 * format.  The File Manager only relies on three capabilities:
 *
 *   - channel metadata (names, sampling rates, per-channel time bounds),
 *     available right after the reader has been created
 *   - readRange(): per-channel sample arrays for an absolute time range
 *   - close(): idempotent resource release
 *
 * ARCHITECTURE:
 *
 *   RecordingReader (this file - abstract base)
 *     |
 *     +-- PosixRecordingReader  (".sigrec" directories, pread based)
 *     +-- test doubles          (in-memory, counting, fault injecting)
 *
 * Thread-safety:
 * - Metadata accessors are immutable after construction.
 * - readRange() must tolerate concurrent calls from different threads: the
 *   File Manager issues demand reads and prefetch reads on the same reader
 *   in parallel, always outside of its own locks.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sigseg::lib
{
    /**
     * Metadata of one channel as reported by the storage.
     * Times are absolute microseconds, end is exclusive.
     */
    struct ChannelInfo
    {
        std::string name;
        double samplingRate;
        std::int64_t startTime;
        std::int64_t endTime;
        std::uint64_t sampleCount;
    };

    /** Samples of one channel. */
    using SampleArray = std::vector<double>;

    /** Per-channel sample arrays, ordered like the channel list they were read for. */
    using SegmentData = std::vector<SampleArray>;

    /**
     * Abstract base class for recording readers.
     *
     * Polymorphic (has virtual destructor and pure virtual methods).
     */
    class RecordingReader
    {
    public:
        /**
         * Path the reader was opened from.
         */
        [[nodiscard]]
        std::string const& getPath() const noexcept;

        /**
         * Channel metadata in storage order.
         */
        [[nodiscard]]
        virtual std::vector<ChannelInfo> const& getChannels() const = 0;

        /**
         * Read the samples of \p channels whose sample slots fall in [start, end).
         *
         * @param channels Channel names, in the order the arrays must be returned.
         * @param start Absolute start time in microseconds (inclusive).
         * @param end Absolute end time in microseconds (exclusive).
         * @return One array per requested channel.
         * @throws Exception (SIGSEG_ERR_READ) or any std::exception on storage failure.
         */
        [[nodiscard]]
        virtual SegmentData readRange(std::vector<std::string> const& channels, std::int64_t start, std::int64_t end) const = 0;

        /**
         * Release the storage resources.  Idempotent.
         */
        virtual void close() noexcept = 0;

        virtual ~RecordingReader();

    protected:
        explicit RecordingReader(std::string path);

    private:
        std::string _path;
    };

    /**
     * Creates readers for recording paths.
     * Abstract base class; concrete implementation: PosixRecordingReaderFactory.
     */
    class RecordingReaderFactory
    {
    public:
        /**
         * Open the recording at \p path.
         *
         * @throws Exception (SIGSEG_ERR_OPEN) or any std::exception if the
         *         recording is missing or its metadata is invalid.
         */
        [[nodiscard]]
        virtual std::unique_ptr<RecordingReader> openRecording(std::string const& path) const = 0;

        virtual ~RecordingReaderFactory();

    protected:
        RecordingReaderFactory();
    };
}
