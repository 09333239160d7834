// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_posix_reader.cpp
 * @brief Tests for ".sigrec" recording directories and the pread based reader
 *
 * The fixture writes 4 channels of 60 s at 100 Hz starting at t = 1000 s.
 * Sample i of channel c holds c * 1'000'000 + i.
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <catch2/catch_test_macros.hpp>
#include "sigseg-internal/Exception.hpp"
#include "sigseg-internal/FileManager.hpp"
#include "sigseg-internal/PathUtils.hpp"
#include "sigseg-internal/PosixRecordingReaderFactory.hpp"
#include "sigseg-internal/RecordingFormat.hpp"
#include "Utils.hpp"

using namespace sigseg::lib;
using sigseg::tests::RecordingFixture;
using sigseg::tests::statusOf;

namespace
{
    constexpr auto T0 = std::int64_t{1'000'000'000};
    constexpr auto SECOND = std::int64_t{1'000'000};

    void writeText(std::filesystem::path const& path, std::string const& text)
    {
        auto out = std::ofstream{path, std::ios::trunc};
        out << text;
    }
}

TEST_CASE_METHOD(RecordingFixture, "Recording metadata is read from the descriptor", "[posix]")
{
    auto const reader = PosixRecordingReaderFactory{}.openRecording(recording.string());
    REQUIRE(reader->getPath() == recording.string());

    auto const& channels = reader->getChannels();
    REQUIRE(channels.size() == 4);
    REQUIRE(channels[0].name == "ch0");
    REQUIRE(channels[3].name == "ch3");
    for (auto const& channel : channels)
    {
        REQUIRE(channel.samplingRate == 100.0);
        REQUIRE(channel.startTime == T0);
        REQUIRE(channel.endTime == T0 + 60 * SECOND);
        REQUIRE(channel.sampleCount == 6000);
    }
}

TEST_CASE_METHOD(RecordingFixture, "Ranges return exact grid samples", "[posix]")
{
    auto const reader = PosixRecordingReaderFactory{}.openRecording(recording.string());

    auto const data = reader->readRange({"ch2", "ch0"}, T0 + 10 * SECOND, T0 + 20 * SECOND);
    REQUIRE(data.size() == 2);
    REQUIRE(data[0].size() == 1000);
    REQUIRE(data[1].size() == 1000);
    REQUIRE(data[0].front() == 2'001'000.0);
    REQUIRE(data[0].back() == 2'001'999.0);
    REQUIRE(data[1].front() == 1000.0);

    // A start between two grid instants begins at the next slot.
    auto const offGrid = reader->readRange({"ch1"}, T0 + 5'001, T0 + 30'000);
    REQUIRE(offGrid[0].size() == 2);
    REQUIRE(offGrid[0][0] == 1'000'001.0);
    REQUIRE(offGrid[0][1] == 1'000'002.0);

    REQUIRE(reader->readRange({"ch1"}, T0 + SECOND, T0 + SECOND)[0].empty());
}

TEST_CASE_METHOD(RecordingFixture, "Slots outside the coverage are NaN", "[posix]")
{
    auto const reader = PosixRecordingReaderFactory{}.openRecording(recording.string());

    auto const tail = reader->readRange({"ch3"}, T0 + 59 * SECOND, T0 + 61 * SECOND);
    REQUIRE(tail[0].size() == 200);
    REQUIRE(tail[0][99] == 3'005'999.0);
    REQUIRE(std::isnan(tail[0][100]));
    REQUIRE(std::isnan(tail[0][199]));

    auto const head = reader->readRange({"ch0"}, T0 - SECOND, T0 + SECOND);
    REQUIRE(head[0].size() == 200);
    REQUIRE(std::isnan(head[0][0]));
    REQUIRE(std::isnan(head[0][99]));
    REQUIRE(head[0][100] == 0.0);

    auto const outside = reader->readRange({"ch0"}, T0 + 120 * SECOND, T0 + 121 * SECOND);
    REQUIRE(outside[0].size() == 100);
    REQUIRE(std::isnan(outside[0][50]));
}

TEST_CASE_METHOD(RecordingFixture, "Unknown channels fail the read", "[posix]")
{
    auto const reader = PosixRecordingReaderFactory{}.openRecording(recording.string());
    REQUIRE(statusOf([&]() { static_cast<void>(reader->readRange({"ch0", "EKG"}, T0, T0 + SECOND)); }) == SIGSEG_ERR_READ);
}

TEST_CASE_METHOD(RecordingFixture, "Reads after close fail and close is idempotent", "[posix]")
{
    auto const reader = PosixRecordingReaderFactory{}.openRecording(recording.string());
    reader->close();
    reader->close();
    REQUIRE(statusOf([&]() { static_cast<void>(reader->readRange({"ch0"}, T0, T0 + SECOND)); }) == SIGSEG_ERR_READ);
}

TEST_CASE_METHOD(RecordingFixture, "Broken recordings fail to open", "[posix]")
{
    auto const factory = PosixRecordingReaderFactory{};
    auto const open = [&factory](std::filesystem::path const& path)
    {
        return statusOf([&]() { static_cast<void>(factory.openRecording(path.string())); });
    };

    SECTION("Missing directory")
    {
        REQUIRE(open(root / "missing.sigrec") == SIGSEG_ERR_OPEN);
    }

    SECTION("Missing descriptor")
    {
        std::filesystem::remove(makeRecordingDescriptorFilePath(recording));
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("Corrupt descriptor")
    {
        writeText(makeRecordingDescriptorFilePath(recording), "{\"channels\": [");
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("No channels")
    {
        writeText(makeRecordingDescriptorFilePath(recording), R"({"channels": []})");
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("Duplicate channel names")
    {
        writeText(makeRecordingDescriptorFilePath(recording),
            R"({"channels": [)"
            R"({"name": "a", "samplingRate": 100, "startTime": 0, "sampleCount": 10, "file": "0.f64"},)"
            R"({"name": "a", "samplingRate": 100, "startTime": 0, "sampleCount": 10, "file": "1.f64"}]})");
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("Invalid sampling rate")
    {
        writeText(makeRecordingDescriptorFilePath(recording),
            R"({"channels": [{"name": "a", "samplingRate": 0, "startTime": 0, "sampleCount": 10, "file": "0.f64"}]})");
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("Start time beyond 64 bit microseconds")
    {
        writeText(makeRecordingDescriptorFilePath(recording),
            R"({"channels": [{"name": "a", "samplingRate": 100, "startTime": 1e30, "sampleCount": 10, "file": "0.f64"}]})");
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("Sample count whose byte size overflows")
    {
        writeText(makeRecordingDescriptorFilePath(recording),
            R"({"channels": [{"name": "a", "samplingRate": 100, "startTime": 0, "sampleCount": 2305843009213693952, "file": "0.f64"}]})");
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("End time beyond 64 bit microseconds")
    {
        writeText(makeRecordingDescriptorFilePath(recording),
            R"({"channels": [{"name": "a", "samplingRate": 0.001, "startTime": 0, "sampleCount": 1e15, "file": "0.f64"}]})");
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("Short sample file")
    {
        std::filesystem::resize_file(makeChannelDataFilePath(recording, "2.f64"), 100);
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }

    SECTION("Missing sample file")
    {
        std::filesystem::remove(makeChannelDataFilePath(recording, "1.f64"));
        REQUIRE(open(recording) == SIGSEG_ERR_OPEN);
    }
}

TEST_CASE_METHOD(RecordingFixture, "Segments of staggered channels are NaN padded", "[posix]")
{
    auto const path = root / "staggered.sigrec";
    writeRecording(path,
        {
            ChannelSamples{"early", 10.0, T0,               std::vector<double>(600, 1.0)},
            ChannelSamples{"late",  10.0, T0 + 30 * SECOND, std::vector<double>(600, 2.0)},
        });

    auto options = FileManagerOptions{};
    options.workerCount = 0;
    auto manager = FileManager{std::make_shared<PosixRecordingReaderFactory>(), options};

    auto const info = manager.open(path.string());
    REQUIRE(info.timeBounds.start == T0);
    REQUIRE(info.timeBounds.end == T0 + 90 * SECOND);
    REQUIRE(manager.setSegmentSeconds(path.string(), 30.0) == 3);

    auto const first = manager.getSegment(path.string(), 0);
    REQUIRE((*first)[0].size() == 300);
    REQUIRE((*first)[0][0] == 1.0);
    REQUIRE(std::isnan((*first)[1][0]));
    REQUIRE(std::isnan((*first)[1][299]));

    auto const last = manager.getSegment(path.string(), 2);
    REQUIRE(std::isnan((*last)[0][0]));
    REQUIRE((*last)[1][299] == 2.0);
}

TEST_CASE("Descriptors survive a write and parse cycle", "[posix]")
{
    auto const descriptor = RecordingDescriptor{{
        ChannelDescriptor{"Fp1", 512.0, 1'700'000'000'000'000, 1'843'200, "0.f64"},
        ChannelDescriptor{"Fp2", 256.0, 1'700'000'000'000'000, 921'600,   "1.f64"},
    }};

    auto const parsed = parseRecordingDescriptor(serializeRecordingDescriptor(descriptor));
    REQUIRE(parsed.channels.size() == 2);
    REQUIRE(parsed.channels[1].name == "Fp2");
    REQUIRE(parsed.channels[1].samplingRate == 256.0);
    REQUIRE(parsed.channels[1].startTime == 1'700'000'000'000'000);
    REQUIRE(parsed.channels[1].sampleCount == 921'600);
    REQUIRE(channelEndTime(parsed.channels[0]) == 1'700'000'000'000'000 + 3600 * SECOND);
}

TEST_CASE("Host paths are remapped under a mount root", "[posix]")
{
    REQUIRE(remapHostPath("/data/eeg.sigrec", "/host") == "/host/data/eeg.sigrec");
    REQUIRE(remapHostPath("/data/eeg.sigrec", "/host/") == "/host/data/eeg.sigrec");
    REQUIRE(remapHostPath("/data/eeg.sigrec", "") == "/data/eeg.sigrec");
    REQUIRE(remapHostPath("/data/eeg.sigrec", "/") == "/data/eeg.sigrec");
    REQUIRE(remapHostPath("data/eeg.sigrec", "/host") == "data/eeg.sigrec");
}
