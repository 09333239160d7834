// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file RecordingReader.cpp
 * @brief Base class implementation for recording readers and their factory
 */

#include "sigseg-internal/RecordingReader.hpp"
#include <utility>

namespace sigseg::lib
{
    RecordingReader::RecordingReader(std::string path)
        : _path{std::move(path)}
    {}

    RecordingReader::~RecordingReader() = default;

    std::string const& RecordingReader::getPath() const noexcept
    {
        return _path;
    }

    RecordingReaderFactory::RecordingReaderFactory() = default;

    RecordingReaderFactory::~RecordingReaderFactory() = default;
}
