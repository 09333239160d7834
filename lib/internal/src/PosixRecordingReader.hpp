// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "sigseg-internal/RecordingReader.hpp"
#include "sigseg-internal/RecordingFormat.hpp"

namespace sigseg::lib
{
    /**
     * Reader for ".sigrec" recording directories.
     *
     * Keeps one read-only file descriptor per channel and reads with pread(),
     * so concurrent readRange() calls do not share a file offset.
     * Sample slots outside a channel's coverage are returned as NaN.
     */
    class PosixRecordingReader final : public RecordingReader
    {
    public:
        /**
         * Open the recording directory \p path.
         *
         * @throws Exception (SIGSEG_ERR_OPEN) if the descriptor is missing or
         *         invalid or a sample file is missing or too short.
         */
        explicit PosixRecordingReader(std::string const& path);

        ~PosixRecordingReader() override;

        [[nodiscard]]
        std::vector<ChannelInfo> const& getChannels() const override;

        [[nodiscard]]
        SegmentData readRange(std::vector<std::string> const& channels, std::int64_t start, std::int64_t end) const override;

        void close() noexcept override;

    private:
        [[nodiscard]]
        SampleArray readChannel(std::size_t channel, std::int64_t start, std::int64_t end) const;

        RecordingDescriptor _descriptor;
        std::vector<ChannelInfo> _channels;
        std::vector<int> _fds;
    };
}
