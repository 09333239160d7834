// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "sigseg/sigseg.h"
#include <exception>
#include <string>
#include <vector>
#include "internal/Instance.hpp"
#include "sigseg-internal/Exception.hpp"
#include "sigseg-internal/Logging.hpp"
#include "sigseg-internal/ManagerOptionsParser.hpp"

using namespace sigseg::lib;

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegGetVersion(sigsegVersionType* out_version)
{
    if (out_version == nullptr)
    {
        return SIGSEG_ERR_INVALID_ARG;
    }

    out_version->major = SIGSEG_VERSION_MAJOR;
    out_version->minor = SIGSEG_VERSION_MINOR;
    out_version->bugfix = SIGSEG_VERSION_PATCH;
    out_version->build = SIGSEG_VERSION_BUILD;
    out_version->full = SIGSEG_VERSION_FULL;
    return SIGSEG_STATUS_OK;
}

extern "C"
SIGSEG_EXPORT
sigsegInstance sigsegCreateInstance(char const* in_options)
{
    try
    {
        initializeLogging();

        auto const parser = ManagerOptionsParser{(in_options != nullptr) ? std::string{in_options} : std::string{}};
        return to_sigsegInstance(new Instance{parser.getOptions()});
    }
    catch (std::exception const& e)
    {
        SIGSEG_ERROR("Failed to create instance: {}", e.what());
        return nullptr;
    }
    catch (...)
    {
        SIGSEG_ERROR("Failed to create instance: unknown error.");
        return nullptr;
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegShutdown(sigsegInstance in_instance)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            instance->getFileManager().shutdown();
            return SIGSEG_STATUS_OK;
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegDestroyInstance(sigsegInstance in_instance)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            delete instance;
            return SIGSEG_STATUS_OK;
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegOpenFile(sigsegInstance in_instance, char const* in_path)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            if (in_path == nullptr)
            {
                return SIGSEG_ERR_INVALID_ARG;
            }
            static_cast<void>(instance->getFileManager().open(in_path));
            return SIGSEG_STATUS_OK;
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegCloseFile(sigsegInstance in_instance, char const* in_path)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            if (in_path == nullptr)
            {
                return SIGSEG_ERR_INVALID_ARG;
            }
            instance->getFileManager().close(in_path);
            return SIGSEG_STATUS_OK;
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegSetSegmentSeconds(sigsegInstance in_instance, char const* in_path, double in_seconds, uint64_t* out_count)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            if (in_path == nullptr)
            {
                return SIGSEG_ERR_INVALID_ARG;
            }
            auto const count = instance->getFileManager().setSegmentSeconds(in_path, in_seconds);
            if (out_count != nullptr)
            {
                *out_count = static_cast<uint64_t>(count);
            }
            return SIGSEG_STATUS_OK;
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegSetActiveChannels(sigsegInstance in_instance, char const* in_path, char const* const* in_names, size_t in_count)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            if ((in_path == nullptr) || ((in_names == nullptr) && (in_count != 0)))
            {
                return SIGSEG_ERR_INVALID_ARG;
            }

            auto channels = std::vector<std::string>{};
            channels.reserve(in_count);
            for (auto i = size_t{0}; i < in_count; ++i)
            {
                if (in_names[i] == nullptr)
                {
                    return SIGSEG_ERR_INVALID_ARG;
                }
                channels.emplace_back(in_names[i]);
            }

            instance->getFileManager().setActiveChannels(in_path, channels);
            return SIGSEG_STATUS_OK;
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegGetNumberOfSegments(sigsegInstance in_instance, char const* in_path, uint64_t* out_count)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            if ((in_path == nullptr) || (out_count == nullptr))
            {
                return SIGSEG_ERR_INVALID_ARG;
            }
            *out_count = static_cast<uint64_t>(instance->getFileManager().getNumberOfSegments(in_path));
            return SIGSEG_STATUS_OK;
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegGetFileInfo(sigsegInstance in_instance, char const* in_path, char* out_buffer, size_t* inout_size)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            if ((in_path == nullptr) || (inout_size == nullptr))
            {
                return SIGSEG_ERR_INVALID_ARG;
            }
            return copyToBuffer(fileInfoToJson(instance->getFileManager().getFileInfo(in_path)), out_buffer, inout_size);
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegListOpenFiles(sigsegInstance in_instance, char* out_buffer, size_t* inout_size)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            if (inout_size == nullptr)
            {
                return SIGSEG_ERR_INVALID_ARG;
            }
            return copyToBuffer(stringsToJson(instance->getFileManager().listOpenFiles()), out_buffer, inout_size);
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}
