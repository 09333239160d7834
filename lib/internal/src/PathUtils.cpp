// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "sigseg-internal/PathUtils.hpp"

namespace sigseg::lib
{
    std::filesystem::path makeRecordingDescriptorFilePath(std::filesystem::path const& recordingDirectory)
    {
        return recordingDirectory / RECORDING_DESCRIPTOR_FILE_NAME;
    }

    std::filesystem::path makeChannelDataFilePath(std::filesystem::path const& recordingDirectory, std::string const& fileName)
    {
        return recordingDirectory / fileName;
    }

    std::string remapHostPath(std::string const& path, std::string const& mountRoot)
    {
        if (mountRoot.empty() || path.empty() || (path.front() != '/'))
        {
            return path;
        }

        auto root = mountRoot;
        while ((root.size() > 1) && (root.back() == '/'))
        {
            root.pop_back();
        }
        if (root == "/")
        {
            return path;
        }
        return root + path;
    }
}
