// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file RecordingFormat.hpp
 * @brief Descriptor parsing and writing of ".sigrec" recording directories
 *
 * Example recording.json:
 * {
 *   "channels": [
 *     { "name": "Fp1", "samplingRate": 512, "startTime": 0, "sampleCount": 1843200, "file": "0.f64" },
 *     { "name": "Fp2", "samplingRate": 512, "startTime": 0, "sampleCount": 1843200, "file": "1.f64" }
 *   ]
 * }
 *
 * startTime is the absolute time of the first sample in microseconds.
 * Sample i of a channel sits at startTime + i * 1e6 / samplingRate.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sigseg::lib
{
    struct ChannelDescriptor
    {
        std::string name;
        double samplingRate;
        std::int64_t startTime;
        std::uint64_t sampleCount;
        std::string file;
    };

    struct RecordingDescriptor
    {
        std::vector<ChannelDescriptor> channels;
    };

    /**
     * Parse and validate a descriptor.
     *
     * @throws std::invalid_argument if the JSON is malformed, a field is missing
     *         or has the wrong type, the channel list is empty, a sampling rate
     *         is not positive or a channel name is duplicated.
     */
    [[nodiscard]]
    RecordingDescriptor parseRecordingDescriptor(std::string const& json);

    [[nodiscard]]
    std::string serializeRecordingDescriptor(RecordingDescriptor const& descriptor);

    /**
     * Exclusive end time of a channel: startTime + sampleCount / samplingRate seconds.
     */
    [[nodiscard]]
    std::int64_t channelEndTime(ChannelDescriptor const& channel) noexcept;

    /**
     * Samples of one channel to write with writeRecording().
     */
    struct ChannelSamples
    {
        std::string name;
        double samplingRate;
        std::int64_t startTime;
        std::vector<double> samples;
    };

    /**
     * Create a recording directory with one sample file per channel.
     * Existing files with the same names are overwritten.
     *
     * @throws std::invalid_argument if the channel set is invalid.
     * @throws std::system_error or std::filesystem::filesystem_error on I/O failure.
     */
    void writeRecording(std::filesystem::path const& directory, std::vector<ChannelSamples> const& channels);
}
