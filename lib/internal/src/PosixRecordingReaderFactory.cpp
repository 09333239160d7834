// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "sigseg-internal/PosixRecordingReaderFactory.hpp"
#include "PosixRecordingReader.hpp"

namespace sigseg::lib
{
    PosixRecordingReaderFactory::PosixRecordingReaderFactory() = default;

    PosixRecordingReaderFactory::~PosixRecordingReaderFactory() = default;

    std::unique_ptr<RecordingReader> PosixRecordingReaderFactory::openRecording(std::string const& path) const
    {
        return std::make_unique<PosixRecordingReader>(path);
    }
}
