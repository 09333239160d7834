// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PathUtils.hpp
 * @brief Recording directory layout and host path remapping
 *
 * A recording is a directory:
 *
 *   <name>.sigrec/
 *     ├── recording.json     # channel descriptors
 *     ├── <channel file>     # raw little-endian float64 samples, one file per channel
 *     └── ...
 */

#pragma once

#include <filesystem>
#include <string>

namespace sigseg::lib
{
    constexpr auto const RECORDING_DIRECTORY_SUFFIX = ".sigrec";          // Suffix of recording directories
    constexpr auto const RECORDING_DESCRIPTOR_FILE_NAME = "recording.json"; // Channel metadata
    constexpr auto const CHANNEL_DATA_FILE_SUFFIX = ".f64";               // Suffix of sample files written by writeRecording()

    /** Construct the path to the descriptor JSON file of a recording directory. */
    std::filesystem::path makeRecordingDescriptorFilePath(std::filesystem::path const& recordingDirectory);

    /** Construct the path to a channel sample file named in the descriptor. */
    std::filesystem::path makeChannelDataFilePath(std::filesystem::path const& recordingDirectory, std::string const& fileName);

    /**
     * Translate a host path into the path seen inside a container.
     *
     * When \p mountRoot is not empty and \p path is absolute, the result is
     * \p mountRoot followed by \p path.  Relative paths and an empty mount
     * root leave \p path unchanged.
     *
     * Example: remapHostPath("/data/eeg.sigrec", "/host") == "/host/data/eeg.sigrec"
     */
    std::string remapHostPath(std::string const& path, std::string const& mountRoot);
}
