// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Instance.hpp
 * @brief C++ objects behind the opaque handles of the C API
 *
 * sigsegInstance points to an Instance, sigsegSegment to a Segment.  The
 * to_*() helpers convert between both sides; they never throw and return
 * nullptr for a null handle.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <sigseg/sigseg.h>
#include "sigseg-internal/FileManager.hpp"

namespace sigseg::lib
{
    class Instance
    {
    public:
        /** Instance reading ".sigrec" directories. */
        explicit Instance(FileManagerOptions const& options);

        Instance(std::shared_ptr<RecordingReaderFactory> factory, FileManagerOptions const& options);

        [[nodiscard]]
        FileManager& getFileManager() noexcept;

    private:
        FileManager _manager;
    };

    /**
     * Samples handed out by sigsegGetSegment().  Shares ownership with the
     * cache, so evicting the entry does not invalidate a segment still held.
     */
    struct Segment
    {
        std::shared_ptr<SegmentData const> data;
    };

    [[nodiscard]]
    Instance* to_Instance(sigsegInstance instance) noexcept;

    [[nodiscard]]
    sigsegInstance to_sigsegInstance(Instance* instance) noexcept;

    [[nodiscard]]
    Segment* to_Segment(sigsegSegment segment) noexcept;

    [[nodiscard]]
    sigsegSegment to_sigsegSegment(Segment* segment) noexcept;

    /** JSON document describing an open recording. */
    [[nodiscard]]
    std::string fileInfoToJson(FileInfo const& info);

    /** JSON array of strings. */
    [[nodiscard]]
    std::string stringsToJson(std::vector<std::string> const& values);

    /**
     * Copy \p text with its terminating NUL into a caller buffer.
     * Writes the required size to \p inout_size in every case.
     *
     * @return SIGSEG_ERR_BUFFER_TOO_SMALL if \p out_buffer cannot hold the text.
     */
    sigsegStatus copyToBuffer(std::string const& text, char* out_buffer, std::size_t* inout_size) noexcept;
}
