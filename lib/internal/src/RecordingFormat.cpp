// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file RecordingFormat.cpp
 * @brief Reads and writes recording descriptors with picojson
 */

#include "sigseg-internal/RecordingFormat.hpp"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <set>
#include <stdexcept>
#include <system_error>
#include <fmt/format.h>
#include <picojson/picojson.h>
#include "sigseg-internal/PathUtils.hpp"
#include "sigseg-internal/SegmentIndexer.hpp"

namespace sigseg::lib
{
    namespace
    {
        // 2^63 and 2^60 as doubles: bounds of int64 microseconds and of a sample count whose byte size fits in int64.
        constexpr auto INT64_LIMIT = 9'223'372'036'854'775'808.0;
        constexpr auto SAMPLE_COUNT_LIMIT = 1'152'921'504'606'846'976.0;

        picojson::value const& requireField(picojson::object const& object, char const* field, std::size_t channel)
        {
            auto const it = object.find(field);
            if (it == object.end())
            {
                throw std::invalid_argument{fmt::format("Channel {} has no '{}' field.", channel, field)};
            }
            return it->second;
        }

        double requireNumber(picojson::object const& object, char const* field, std::size_t channel)
        {
            auto const& value = requireField(object, field, channel);
            if (!value.is<double>())
            {
                throw std::invalid_argument{fmt::format("Field '{}' of channel {} must be a number.", field, channel)};
            }
            return value.get<double>();
        }

        std::string requireString(picojson::object const& object, char const* field, std::size_t channel)
        {
            auto const& value = requireField(object, field, channel);
            if (!value.is<std::string>())
            {
                throw std::invalid_argument{fmt::format("Field '{}' of channel {} must be a string.", field, channel)};
            }
            return value.get<std::string>();
        }

        void validate(RecordingDescriptor const& descriptor)
        {
            if (descriptor.channels.empty())
            {
                throw std::invalid_argument{"A recording needs at least one channel."};
            }

            auto names = std::set<std::string>{};
            for (auto const& channel : descriptor.channels)
            {
                if (channel.name.empty())
                {
                    throw std::invalid_argument{"Channel names must not be empty."};
                }
                if (!names.insert(channel.name).second)
                {
                    throw std::invalid_argument{fmt::format("Duplicate channel name '{}'.", channel.name)};
                }
                if (!std::isfinite(channel.samplingRate) || (channel.samplingRate <= 0.0))
                {
                    throw std::invalid_argument{fmt::format("Channel '{}' has an invalid sampling rate {}.", channel.name, channel.samplingRate)};
                }

                auto const endTime = static_cast<double>(channel.startTime) +
                                     static_cast<double>(channel.sampleCount) / channel.samplingRate * static_cast<double>(MICROSECONDS_PER_SECOND);
                if (!(endTime < INT64_LIMIT))
                {
                    throw std::invalid_argument{fmt::format("Channel '{}' ends beyond the representable time range.", channel.name)};
                }
            }
        }

        void putLittleEndian(char* out, double value) noexcept
        {
            auto bits = std::uint64_t{0};
            std::memcpy(&bits, &value, sizeof(bits));
            for (auto i = 0; i < 8; ++i)
            {
                out[i] = static_cast<char>((bits >> (8 * i)) & 0xFFU);
            }
        }
    }

    RecordingDescriptor parseRecordingDescriptor(std::string const& json)
    {
        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, json);
        if (!err.empty())
        {
            throw std::invalid_argument{"Invalid recording descriptor. " + err};
        }
        if (!jsonValue.is<picojson::object>())
        {
            throw std::invalid_argument{"Expected a JSON object"};
        }

        auto const& root = jsonValue.get<picojson::object>();
        auto const channelsIt = root.find("channels");
        if ((channelsIt == root.end()) || !channelsIt->second.is<picojson::array>())
        {
            throw std::invalid_argument{"Recording descriptor needs a 'channels' array."};
        }

        auto descriptor = RecordingDescriptor{};
        auto const& channels = channelsIt->second.get<picojson::array>();
        for (auto i = std::size_t{0}; i < channels.size(); ++i)
        {
            if (!channels[i].is<picojson::object>())
            {
                throw std::invalid_argument{fmt::format("Channel {} must be a JSON object.", i)};
            }
            auto const& object = channels[i].get<picojson::object>();

            auto const startTime = requireNumber(object, "startTime", i);
            auto const sampleCount = requireNumber(object, "sampleCount", i);
            if (!std::isfinite(startTime) || (std::floor(startTime) != startTime))
            {
                throw std::invalid_argument{fmt::format("startTime of channel {} must be an integer number of microseconds.", i)};
            }
            if ((startTime < -INT64_LIMIT) || (startTime >= INT64_LIMIT))
            {
                throw std::invalid_argument{fmt::format("startTime {} of channel {} is outside the 64 bit microsecond range.", startTime, i)};
            }
            if (!std::isfinite(sampleCount) || (sampleCount < 0.0) || (std::floor(sampleCount) != sampleCount))
            {
                throw std::invalid_argument{fmt::format("sampleCount of channel {} must be a non-negative integer.", i)};
            }
            if (sampleCount >= SAMPLE_COUNT_LIMIT)
            {
                throw std::invalid_argument{fmt::format("sampleCount {} of channel {} is too large.", sampleCount, i)};
            }

            descriptor.channels.push_back(ChannelDescriptor{requireString(object, "name", i),
                requireNumber(object, "samplingRate", i),
                static_cast<std::int64_t>(startTime),
                static_cast<std::uint64_t>(sampleCount),
                requireString(object, "file", i)});
        }

        validate(descriptor);
        return descriptor;
    }

    std::string serializeRecordingDescriptor(RecordingDescriptor const& descriptor)
    {
        auto channels = picojson::array{};
        for (auto const& channel : descriptor.channels)
        {
            auto object = picojson::object{};
            object["name"] = picojson::value{channel.name};
            object["samplingRate"] = picojson::value{channel.samplingRate};
            object["startTime"] = picojson::value{static_cast<double>(channel.startTime)};
            object["sampleCount"] = picojson::value{static_cast<double>(channel.sampleCount)};
            object["file"] = picojson::value{channel.file};
            channels.emplace_back(std::move(object));
        }

        auto root = picojson::object{};
        root["channels"] = picojson::value{std::move(channels)};
        return picojson::value{std::move(root)}.serialize(true);
    }

    std::int64_t channelEndTime(ChannelDescriptor const& channel) noexcept
    {
        auto const durationUs = static_cast<double>(channel.sampleCount) / channel.samplingRate * static_cast<double>(MICROSECONDS_PER_SECOND);
        return channel.startTime + static_cast<std::int64_t>(std::llround(durationUs));
    }

    void writeRecording(std::filesystem::path const& directory, std::vector<ChannelSamples> const& channels)
    {
        auto descriptor = RecordingDescriptor{};
        for (auto i = std::size_t{0}; i < channels.size(); ++i)
        {
            auto const& channel = channels[i];
            descriptor.channels.push_back(ChannelDescriptor{channel.name,
                channel.samplingRate,
                channel.startTime,
                channel.samples.size(),
                fmt::format("{}{}", i, CHANNEL_DATA_FILE_SUFFIX)});
        }
        validate(descriptor);

        std::filesystem::create_directories(directory);

        for (auto i = std::size_t{0}; i < channels.size(); ++i)
        {
            auto const path = makeChannelDataFilePath(directory, descriptor.channels[i].file);
            auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
            if (!out)
            {
                throw std::system_error{errno, std::generic_category(), fmt::format("Failed to create '{}'", path.string())};
            }

            auto buffer = std::vector<char>(channels[i].samples.size() * sizeof(double));
            for (auto j = std::size_t{0}; j < channels[i].samples.size(); ++j)
            {
                putLittleEndian(buffer.data() + j * sizeof(double), channels[i].samples[j]);
            }
            out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (!out)
            {
                throw std::system_error{EIO, std::generic_category(), fmt::format("Failed to write '{}'", path.string())};
            }
        }

        auto const descriptorPath = makeRecordingDescriptorFilePath(directory);
        auto out = std::ofstream{descriptorPath, std::ios::trunc};
        out << serializeRecordingDescriptor(descriptor);
        if (!out)
        {
            throw std::system_error{EIO, std::generic_category(), fmt::format("Failed to write '{}'", descriptorPath.string())};
        }
    }
}
