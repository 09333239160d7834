// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PosixRecordingReaderFactory.hpp
 * @brief Factory opening ".sigrec" directories with PosixRecordingReader
 */

#pragma once

#include "sigseg-internal/RecordingReader.hpp"

namespace sigseg::lib
{
    struct PosixRecordingReaderFactory : RecordingReaderFactory
    {
        PosixRecordingReaderFactory();

        virtual std::unique_ptr<RecordingReader> openRecording(std::string const& path) const override;

        ~PosixRecordingReaderFactory();
    };
}
