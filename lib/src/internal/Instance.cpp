// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "Instance.hpp"
#include <cstring>
#include <utility>
#include <picojson/picojson.h>
#include "sigseg-internal/Logging.hpp"
#include "sigseg-internal/PosixRecordingReaderFactory.hpp"

namespace sigseg::lib
{
    Instance::Instance(FileManagerOptions const& options)
        : Instance{std::make_shared<PosixRecordingReaderFactory>(), options}
    {}

    Instance::Instance(std::shared_ptr<RecordingReaderFactory> factory, FileManagerOptions const& options)
        : _manager{std::move(factory), options}
    {}

    FileManager& Instance::getFileManager() noexcept
    {
        return _manager;
    }

    Instance* to_Instance(sigsegInstance instance) noexcept
    {
        return reinterpret_cast<Instance*>(instance);
    }

    sigsegInstance to_sigsegInstance(Instance* instance) noexcept
    {
        return reinterpret_cast<sigsegInstance>(instance);
    }

    Segment* to_Segment(sigsegSegment segment) noexcept
    {
        return reinterpret_cast<Segment*>(segment);
    }

    sigsegSegment to_sigsegSegment(Segment* segment) noexcept
    {
        return reinterpret_cast<sigsegSegment>(segment);
    }

    std::string fileInfoToJson(FileInfo const& info)
    {
        auto channels = picojson::array{};
        for (auto const& channel : info.channels)
        {
            auto object = picojson::object{};
            object["name"] = picojson::value{channel.name};
            object["samplingRate"] = picojson::value{channel.samplingRate};
            object["startTime"] = picojson::value{static_cast<double>(channel.startTime)};
            object["endTime"] = picojson::value{static_cast<double>(channel.endTime)};
            object["sampleCount"] = picojson::value{static_cast<double>(channel.sampleCount)};
            channels.emplace_back(std::move(object));
        }

        auto active = picojson::array{};
        for (auto const& name : info.activeChannels)
        {
            active.emplace_back(name);
        }

        auto bounds = picojson::object{};
        bounds["start"] = picojson::value{static_cast<double>(info.timeBounds.start)};
        bounds["end"] = picojson::value{static_cast<double>(info.timeBounds.end)};
        bounds["durationSeconds"] = picojson::value{info.durationSeconds()};

        auto root = picojson::object{};
        root["path"] = picojson::value{info.path};
        root["channels"] = picojson::value{std::move(channels)};
        root["activeChannels"] = picojson::value{std::move(active)};
        root["timeBounds"] = picojson::value{std::move(bounds)};
        root["segmentSeconds"] = picojson::value{info.segmentSeconds};
        root["segmentCount"] = picojson::value{static_cast<double>(info.segmentCount)};
        root["generation"] = picojson::value{static_cast<double>(info.generation)};
        return picojson::value{std::move(root)}.serialize();
    }

    std::string stringsToJson(std::vector<std::string> const& values)
    {
        auto array = picojson::array{};
        for (auto const& value : values)
        {
            array.emplace_back(value);
        }
        return picojson::value{std::move(array)}.serialize();
    }

    sigsegStatus copyToBuffer(std::string const& text, char* out_buffer, std::size_t* inout_size) noexcept
    {
        if (inout_size == nullptr)
        {
            return SIGSEG_ERR_INVALID_ARG;
        }

        auto const required = text.size() + 1;
        if ((out_buffer == nullptr) || (*inout_size < required))
        {
            *inout_size = required;
            return SIGSEG_ERR_BUFFER_TOO_SMALL;
        }

        std::memcpy(out_buffer, text.c_str(), required);
        *inout_size = required;
        return SIGSEG_STATUS_OK;
    }
}
