// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_c_api.cpp
 * @brief Tests of the C API boundary against recordings on disk
 *
 * This test suite validates:
 *   - Instance creation with default, custom and malformed options
 *   - Every failure kind surfacing as its own status code
 *   - The required size protocol of the JSON buffer functions
 *   - Segment handles staying valid after the cache dropped the segment
 *
 * These tests use the RecordingFixture: 4 channels of 60 s at 100 Hz.
 */

#include <cmath>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <picojson/picojson.h>
#include <sigseg/sigseg.h>
#include "Utils.hpp"

using sigseg::tests::RecordingFixture;

namespace
{
    picojson::object parseObject(std::string const& json)
    {
        auto value = picojson::value{};
        REQUIRE(picojson::parse(value, json).empty());
        REQUIRE(value.is<picojson::object>());
        return value.get<picojson::object>();
    }

    std::string getFileInfo(sigsegInstance instance, std::string const& path)
    {
        auto size = size_t{0};
        REQUIRE(sigsegGetFileInfo(instance, path.c_str(), nullptr, &size) == SIGSEG_ERR_BUFFER_TOO_SMALL);
        auto buffer = std::vector<char>(size);
        REQUIRE(sigsegGetFileInfo(instance, path.c_str(), buffer.data(), &size) == SIGSEG_STATUS_OK);
        REQUIRE(size == buffer.size());
        return std::string{buffer.data()};
    }
}

TEST_CASE("Library version", "[c api]")
{
    auto version = sigsegVersionType{};
    REQUIRE(sigsegGetVersion(&version) == SIGSEG_STATUS_OK);
    REQUIRE(version.full != nullptr);
    REQUIRE(std::string{version.full}.find(std::to_string(version.major)) == 0);
    REQUIRE(sigsegGetVersion(nullptr) == SIGSEG_ERR_INVALID_ARG);
}

TEST_CASE("Instance options", "[c api]")
{
    for (auto const options : {static_cast<char const*>(nullptr), "", "{}", R"({"prefetchDepth": 0, "workerCount": 0})"})
    {
        auto const instance = sigsegCreateInstance(options);
        REQUIRE(instance != nullptr);
        REQUIRE(sigsegDestroyInstance(instance) == SIGSEG_STATUS_OK);
    }

    REQUIRE(sigsegCreateInstance("{") == nullptr);
    REQUIRE(sigsegCreateInstance("[]") == nullptr);
    REQUIRE(sigsegCreateInstance(R"({"prefetchDepth": -3})") == nullptr);
}

TEST_CASE("Null instances are rejected", "[c api]")
{
    auto count = uint64_t{0};
    auto size = size_t{0};
    auto segment = sigsegSegment{};
    REQUIRE(sigsegShutdown(nullptr) == SIGSEG_ERR_INVALID_INSTANCE);
    REQUIRE(sigsegDestroyInstance(nullptr) == SIGSEG_ERR_INVALID_INSTANCE);
    REQUIRE(sigsegOpenFile(nullptr, "/x") == SIGSEG_ERR_INVALID_INSTANCE);
    REQUIRE(sigsegCloseFile(nullptr, "/x") == SIGSEG_ERR_INVALID_INSTANCE);
    REQUIRE(sigsegSetSegmentSeconds(nullptr, "/x", 1.0, &count) == SIGSEG_ERR_INVALID_INSTANCE);
    REQUIRE(sigsegGetNumberOfSegments(nullptr, "/x", &count) == SIGSEG_ERR_INVALID_INSTANCE);
    REQUIRE(sigsegListOpenFiles(nullptr, nullptr, &size) == SIGSEG_ERR_INVALID_INSTANCE);
    REQUIRE(sigsegGetSegment(nullptr, "/x", 0, &segment) == SIGSEG_ERR_INVALID_INSTANCE);
}

TEST_CASE_METHOD(RecordingFixture, "Segments through the C API", "[c api]")
{
    auto const instance = sigsegCreateInstance(R"({"prefetchDepth": 2, "workerCount": 2})");
    REQUIRE(instance != nullptr);
    auto const path = recording.string();

    REQUIRE(sigsegOpenFile(instance, path.c_str()) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegOpenFile(instance, path.c_str()) == SIGSEG_STATUS_OK);

    auto count = uint64_t{42};
    REQUIRE(sigsegGetNumberOfSegments(instance, path.c_str(), &count) == SIGSEG_STATUS_OK);
    REQUIRE(count == 0);
    REQUIRE(sigsegSetSegmentSeconds(instance, path.c_str(), 20.0, &count) == SIGSEG_STATUS_OK);
    REQUIRE(count == 3);

    char const* const names[] = {"ch3", "ch1"};
    REQUIRE(sigsegSetActiveChannels(instance, path.c_str(), names, 2) == SIGSEG_STATUS_OK);

    auto segment = sigsegSegment{};
    REQUIRE(sigsegGetSegment(instance, path.c_str(), 1, &segment) == SIGSEG_STATUS_OK);

    auto channels = size_t{0};
    REQUIRE(sigsegSegmentGetChannelCount(segment, &channels) == SIGSEG_STATUS_OK);
    REQUIRE(channels == 2);

    double const* samples = nullptr;
    auto sampleCount = size_t{0};
    REQUIRE(sigsegSegmentGetChannel(segment, 0, &samples, &sampleCount) == SIGSEG_STATUS_OK);
    REQUIRE(sampleCount == 2000);
    REQUIRE(samples[0] == 3'002'000.0);
    REQUIRE(sigsegSegmentGetChannel(segment, 1, &samples, &sampleCount) == SIGSEG_STATUS_OK);
    REQUIRE(samples[1999] == 1'003'999.0);
    REQUIRE(sigsegSegmentGetChannel(segment, 2, &samples, &sampleCount) == SIGSEG_ERR_OUT_OF_RANGE);

    // The handle owns its samples: closing the file does not invalidate them.
    REQUIRE(sigsegCloseFile(instance, path.c_str()) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegSegmentGetChannel(segment, 0, &samples, &sampleCount) == SIGSEG_STATUS_OK);
    REQUIRE(samples[0] == 3'002'000.0);
    REQUIRE(sigsegReleaseSegment(segment) == SIGSEG_STATUS_OK);

    REQUIRE(sigsegDestroyInstance(instance) == SIGSEG_STATUS_OK);
}

TEST_CASE_METHOD(RecordingFixture, "Failures map to status codes", "[c api]")
{
    auto const instance = sigsegCreateInstance("");
    REQUIRE(instance != nullptr);
    auto const path = recording.string();
    auto segment = sigsegSegment{};
    auto count = uint64_t{0};

    REQUIRE(sigsegOpenFile(instance, (root / "missing.sigrec").string().c_str()) == SIGSEG_ERR_OPEN);
    REQUIRE(sigsegOpenFile(instance, nullptr) == SIGSEG_ERR_INVALID_ARG);
    REQUIRE(sigsegGetSegment(instance, path.c_str(), 0, &segment) == SIGSEG_ERR_NOT_OPEN);
    REQUIRE(sigsegSetSegmentSeconds(instance, path.c_str(), 10.0, &count) == SIGSEG_ERR_NOT_OPEN);

    REQUIRE(sigsegOpenFile(instance, path.c_str()) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegGetSegment(instance, path.c_str(), 0, &segment) == SIGSEG_ERR_NOT_SEGMENTED);
    REQUIRE(sigsegSetSegmentSeconds(instance, path.c_str(), 0.0, &count) == SIGSEG_ERR_INVALID_ARG);
    REQUIRE(sigsegSetSegmentSeconds(instance, path.c_str(), -5.0, &count) == SIGSEG_ERR_INVALID_ARG);
    REQUIRE(sigsegSetSegmentSeconds(instance, path.c_str(), NAN, &count) == SIGSEG_ERR_INVALID_ARG);

    REQUIRE(sigsegSetSegmentSeconds(instance, path.c_str(), 60.0, nullptr) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegGetSegment(instance, path.c_str(), 1, &segment) == SIGSEG_ERR_OUT_OF_RANGE);
    REQUIRE(sigsegGetSegment(instance, path.c_str(), -1, &segment) == SIGSEG_ERR_OUT_OF_RANGE);
    REQUIRE(sigsegGetSegment(instance, path.c_str(), 0, nullptr) == SIGSEG_ERR_INVALID_ARG);

    char const* const unknown[] = {"ch0", "EKG"};
    REQUIRE(sigsegSetActiveChannels(instance, path.c_str(), unknown, 2) == SIGSEG_ERR_INVALID_ARG);
    REQUIRE(sigsegSetActiveChannels(instance, path.c_str(), unknown, 0) == SIGSEG_ERR_INVALID_ARG);
    REQUIRE(sigsegSetActiveChannels(instance, path.c_str(), nullptr, 1) == SIGSEG_ERR_INVALID_ARG);

    REQUIRE(sigsegSegmentGetChannelCount(nullptr, nullptr) == SIGSEG_ERR_INVALID_ARG);
    REQUIRE(sigsegReleaseSegment(nullptr) == SIGSEG_ERR_INVALID_ARG);

    REQUIRE(sigsegDestroyInstance(instance) == SIGSEG_STATUS_OK);
}

TEST_CASE_METHOD(RecordingFixture, "JSON results follow the required size protocol", "[c api]")
{
    auto const instance = sigsegCreateInstance("");
    REQUIRE(instance != nullptr);
    auto const path = recording.string();
    auto const other = writeTestRecording("other.sigrec", 1, 10.0, 50.0, 0).string();

    REQUIRE(sigsegOpenFile(instance, path.c_str()) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegOpenFile(instance, other.c_str()) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegSetSegmentSeconds(instance, path.c_str(), 25.0, nullptr) == SIGSEG_STATUS_OK);

    // The trailing 10 s do not make a whole segment.

    auto const info = parseObject(getFileInfo(instance, path));
    REQUIRE(info.at("path").get<std::string>() == path);
    REQUIRE(info.at("segmentCount").get<double>() == 2.0);
    REQUIRE(info.at("segmentSeconds").get<double>() == 25.0);
    REQUIRE(info.at("generation").get<double>() == 1.0);
    REQUIRE(info.at("channels").get<picojson::array>().size() == 4);
    REQUIRE(info.at("activeChannels").get<picojson::array>().size() == 4);
    auto const& bounds = info.at("timeBounds").get<picojson::object>();
    REQUIRE(bounds.at("durationSeconds").get<double>() == 60.0);

    // A buffer one byte short is rejected and the required size reported.
    auto size = size_t{0};
    REQUIRE(sigsegListOpenFiles(instance, nullptr, &size) == SIGSEG_ERR_BUFFER_TOO_SMALL);
    auto const required = size;
    auto buffer = std::vector<char>(required);
    size = required - 1;
    REQUIRE(sigsegListOpenFiles(instance, buffer.data(), &size) == SIGSEG_ERR_BUFFER_TOO_SMALL);
    REQUIRE(size == required);
    REQUIRE(sigsegListOpenFiles(instance, buffer.data(), &size) == SIGSEG_STATUS_OK);

    auto list = picojson::value{};
    REQUIRE(picojson::parse(list, std::string{buffer.data()}).empty());
    REQUIRE(list.get<picojson::array>().size() == 2);

    size = 0;
    REQUIRE(sigsegGetFileInfo(instance, "/not/open", nullptr, &size) == SIGSEG_ERR_NOT_OPEN);
    REQUIRE(sigsegGetFileInfo(instance, path.c_str(), nullptr, nullptr) == SIGSEG_ERR_INVALID_ARG);

    REQUIRE(sigsegDestroyInstance(instance) == SIGSEG_STATUS_OK);
}

TEST_CASE_METHOD(RecordingFixture, "Shutdown closes every file and keeps the instance usable", "[c api]")
{
    auto const instance = sigsegCreateInstance("");
    REQUIRE(instance != nullptr);
    auto const path = recording.string();

    REQUIRE(sigsegOpenFile(instance, path.c_str()) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegShutdown(instance) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegShutdown(instance) == SIGSEG_STATUS_OK);

    auto size = size_t{16};
    auto buffer = std::vector<char>(size);
    REQUIRE(sigsegListOpenFiles(instance, buffer.data(), &size) == SIGSEG_STATUS_OK);
    REQUIRE(std::string{buffer.data()} == "[]");

    // Served without prefetching from now on.
    REQUIRE(sigsegOpenFile(instance, path.c_str()) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegSetSegmentSeconds(instance, path.c_str(), 30.0, nullptr) == SIGSEG_STATUS_OK);
    auto segment = sigsegSegment{};
    REQUIRE(sigsegGetSegment(instance, path.c_str(), 1, &segment) == SIGSEG_STATUS_OK);
    REQUIRE(sigsegReleaseSegment(segment) == SIGSEG_STATUS_OK);

    REQUIRE(sigsegDestroyInstance(instance) == SIGSEG_STATUS_OK);
}
