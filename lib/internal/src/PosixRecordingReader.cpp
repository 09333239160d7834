// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PosixRecordingReader.cpp
 * @brief pread based reader for ".sigrec" recording directories
 *
 * Slot arithmetic for a channel starting at t0 with rate fs:
 *
 *   first = ceil((start - t0) * fs / 1e6)
 *   last  = ceil((end   - t0) * fs / 1e6)
 *
 * The returned array always has last - first entries.  Slots before 0 or at
 * or after sampleCount are NaN.
 */

#include "PosixRecordingReader.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include "sigseg-internal/Exception.hpp"
#include "sigseg-internal/Logging.hpp"
#include "sigseg-internal/PathUtils.hpp"
#include "sigseg-internal/SegmentIndexer.hpp"

namespace sigseg::lib
{
    namespace
    {
        constexpr auto const SAMPLE_SIZE = sizeof(double);

        // Absorbs rounding noise so that exact grid instants are not pushed to the next slot.
        constexpr auto const SLOT_EPSILON = 1e-9;

        std::int64_t slotAt(std::int64_t time, std::int64_t t0, double rate) noexcept
        {
            auto const position = static_cast<double>(time - t0) * rate / static_cast<double>(MICROSECONDS_PER_SECOND);
            return static_cast<std::int64_t>(std::ceil(position - SLOT_EPSILON));
        }

        double getLittleEndian(unsigned char const* in) noexcept
        {
            auto bits = std::uint64_t{0};
            for (auto i = 0; i < 8; ++i)
            {
                bits |= static_cast<std::uint64_t>(in[i]) << (8 * i);
            }
            auto value = 0.0;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }

        std::string readTextFile(std::filesystem::path const& path)
        {
            auto in = std::ifstream{path};
            if (!in)
            {
                throw Exception::openError("Cannot read '{}'.", path.string());
            }
            return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        }
    }

    PosixRecordingReader::PosixRecordingReader(std::string const& path)
        : RecordingReader{path}
        , _descriptor{}
        , _channels{}
        , _fds{}
    {
        auto const directory = std::filesystem::path{path};
        if (!std::filesystem::is_directory(directory))
        {
            throw Exception::openError("'{}' is not a recording directory.", path);
        }

        try
        {
            _descriptor = parseRecordingDescriptor(readTextFile(makeRecordingDescriptorFilePath(directory)));
        }
        catch (std::invalid_argument const& e)
        {
            throw Exception::openError("Invalid descriptor in '{}': {}", path, e.what());
        }

        for (auto const& channel : _descriptor.channels)
        {
            auto const dataPath = makeChannelDataFilePath(directory, channel.file);
            auto const fd = ::open(dataPath.string().c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0)
            {
                auto const error = errno;
                close();
                throw Exception::openError("Cannot open sample file '{}': {}", dataPath.string(), std::strerror(error));
            }
            _fds.push_back(fd);

            struct ::stat st;
            if ((::fstat(fd, &st) != 0) || (static_cast<std::uint64_t>(st.st_size) < channel.sampleCount * SAMPLE_SIZE))
            {
                close();
                throw Exception::openError("Sample file '{}' is shorter than {} samples.", dataPath.string(), channel.sampleCount);
            }

            _channels.push_back(ChannelInfo{channel.name, channel.samplingRate, channel.startTime, channelEndTime(channel), channel.sampleCount});
        }

        SIGSEG_DEBUG("Opened recording '{}' with {} channels.", path, _channels.size());
    }

    PosixRecordingReader::~PosixRecordingReader()
    {
        close();
    }

    std::vector<ChannelInfo> const& PosixRecordingReader::getChannels() const
    {
        return _channels;
    }

    SegmentData PosixRecordingReader::readRange(std::vector<std::string> const& channels, std::int64_t start, std::int64_t end) const
    {
        auto result = SegmentData{};
        result.reserve(channels.size());
        for (auto const& name : channels)
        {
            auto const it = std::find_if(_channels.begin(), _channels.end(), [&name](auto const& c) { return c.name == name; });
            if (it == _channels.end())
            {
                throw Exception::readError("Recording '{}' has no channel named '{}'.", getPath(), name);
            }
            result.push_back(readChannel(static_cast<std::size_t>(std::distance(_channels.begin(), it)), start, end));
        }
        return result;
    }

    SampleArray PosixRecordingReader::readChannel(std::size_t channel, std::int64_t start, std::int64_t end) const
    {
        auto const& info = _channels[channel];
        auto const fd = _fds.at(channel);
        if (fd < 0)
        {
            throw Exception::readError("Recording '{}' is closed.", getPath());
        }

        auto const first = slotAt(start, info.startTime, info.samplingRate);
        auto const last = std::max(first, slotAt(end, info.startTime, info.samplingRate));
        auto samples = SampleArray(static_cast<std::size_t>(last - first), std::numeric_limits<double>::quiet_NaN());

        auto const sampleCount = static_cast<std::int64_t>(info.sampleCount);
        auto const readFirst = std::clamp<std::int64_t>(first, 0, sampleCount);
        auto const readLast = std::clamp<std::int64_t>(last, 0, sampleCount);
        if (readFirst >= readLast)
        {
            return samples;
        }

        auto buffer = std::vector<unsigned char>(static_cast<std::size_t>(readLast - readFirst) * SAMPLE_SIZE);
        auto done = std::size_t{0};
        while (done < buffer.size())
        {
            auto const offset = static_cast<off_t>(readFirst * static_cast<std::int64_t>(SAMPLE_SIZE) + static_cast<std::int64_t>(done));
            auto const n = ::pread(fd, buffer.data() + done, buffer.size() - done, offset);
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw Exception::readError("Failed to read channel '{}' of '{}': {}", info.name, getPath(), std::strerror(errno));
            }
            if (n == 0)
            {
                throw Exception::readError("Unexpected end of file in channel '{}' of '{}'.", info.name, getPath());
            }
            done += static_cast<std::size_t>(n);
        }

        auto const base = static_cast<std::size_t>(readFirst - first);
        for (auto i = std::size_t{0}; i < buffer.size() / SAMPLE_SIZE; ++i)
        {
            samples[base + i] = getLittleEndian(buffer.data() + i * SAMPLE_SIZE);
        }
        return samples;
    }

    void PosixRecordingReader::close() noexcept
    {
        for (auto& fd : _fds)
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }
    }
}
