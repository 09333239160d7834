// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <fmt/format.h>
#include "sigseg-internal/Exception.hpp"
#include "sigseg-internal/RecordingFormat.hpp"
#include "sigseg-internal/SegmentIndexer.hpp"

namespace sigseg::tests
{
    namespace
    {
        std::int64_t slotAt(std::int64_t time, std::int64_t t0, double rate)
        {
            auto const position = static_cast<double>(time - t0) * rate / static_cast<double>(lib::MICROSECONDS_PER_SECOND);
            return static_cast<std::int64_t>(std::ceil(position - 1e-9));
        }
    }

    void FakeRecordingState::blockReads(std::size_t passThrough)
    {
        auto const lock = std::lock_guard{_mutex};
        _blocked = true;
        _passThrough = passThrough;
    }

    void FakeRecordingState::releaseReads()
    {
        {
            auto const lock = std::lock_guard{_mutex};
            _blocked = false;
        }
        _cv.notify_all();
    }

    void FakeRecordingState::waitForBlockedReads(std::size_t count)
    {
        auto lock = std::unique_lock{_mutex};
        _cv.wait(lock, [this, count]() { return _waiting >= count; });
    }

    void FakeRecordingState::enterRead()
    {
        auto lock = std::unique_lock{_mutex};
        if (_blocked && (_passThrough > 0))
        {
            --_passThrough;
            return;
        }
        ++_waiting;
        _cv.notify_all();
        _cv.wait(lock, [this]() { return !_blocked; });
        --_waiting;
    }

    FakeRecordingReader::FakeRecordingReader(std::string path, std::shared_ptr<FakeRecordingState> state)
        : lib::RecordingReader{std::move(path)}
        , _state{std::move(state)}
    {}

    std::vector<lib::ChannelInfo> const& FakeRecordingReader::getChannels() const
    {
        return _state->channels;
    }

    lib::SegmentData FakeRecordingReader::readRange(std::vector<std::string> const& channels, std::int64_t start, std::int64_t end) const
    {
        ++_state->reads;
        _state->enterRead();
        if (_state->failReads)
        {
            throw std::runtime_error{"simulated storage failure"};
        }

        auto result = lib::SegmentData{};
        for (auto const& name : channels)
        {
            auto const it = std::find_if(_state->channels.begin(), _state->channels.end(), [&name](auto const& c) { return c.name == name; });
            if (it == _state->channels.end())
            {
                throw lib::Exception::readError("No channel named '{}'.", name);
            }

            auto const index = static_cast<std::size_t>(it - _state->channels.begin());
            auto const first = slotAt(start, it->startTime, it->samplingRate);
            auto const last = std::max(first, slotAt(end, it->startTime, it->samplingRate));
            auto samples = lib::SampleArray{};
            samples.reserve(static_cast<std::size_t>(last - first));
            for (auto slot = first; slot < last; ++slot)
            {
                samples.push_back(fakeSample(index, slot));
            }
            result.push_back(std::move(samples));
        }
        return result;
    }

    void FakeRecordingReader::close() noexcept
    {
        ++_state->closes;
    }

    std::shared_ptr<FakeRecordingState> FakeRecordingReaderFactory::add(std::string const& path, std::vector<lib::ChannelInfo> channels)
    {
        auto state = std::make_shared<FakeRecordingState>();
        state->channels = std::move(channels);

        auto const lock = std::lock_guard{_mutex};
        _recordings[path] = state;
        return state;
    }

    std::unique_ptr<lib::RecordingReader> FakeRecordingReaderFactory::openRecording(std::string const& path) const
    {
        auto state = std::shared_ptr<FakeRecordingState>{};
        {
            auto const lock = std::lock_guard{_mutex};
            auto const it = _recordings.find(path);
            if (it == _recordings.end())
            {
                throw std::runtime_error{fmt::format("No such recording: {}", path)};
            }
            state = it->second;
        }
        ++_opens;
        return std::make_unique<FakeRecordingReader>(path, std::move(state));
    }

    std::size_t FakeRecordingReaderFactory::opens() const noexcept
    {
        return _opens;
    }

    std::vector<lib::ChannelInfo> makeChannels(std::size_t count, double seconds, double rate, std::int64_t start)
    {
        auto channels = std::vector<lib::ChannelInfo>{};
        auto const sampleCount = static_cast<std::uint64_t>(std::llround(seconds * rate));
        auto const end = start + static_cast<std::int64_t>(std::llround(seconds * static_cast<double>(lib::MICROSECONDS_PER_SECOND)));
        for (auto i = std::size_t{0}; i < count; ++i)
        {
            channels.push_back(lib::ChannelInfo{fmt::format("ch{}", i), rate, start, end, sampleCount});
        }
        return channels;
    }

    double fakeSample(std::size_t channel, std::int64_t slot)
    {
        return static_cast<double>(channel) * 1e9 + static_cast<double>(slot);
    }

    auto makeTempDirectory() -> std::filesystem::path
    {
        static auto counter = std::atomic<unsigned>{0};
        auto const name = fmt::format("sigseg-tests-{}-{}-{}",
            ::getpid(),
            std::chrono::steady_clock::now().time_since_epoch().count(),
            counter.fetch_add(1));
        auto const path = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(path);
        return path;
    }

    RecordingFixture::RecordingFixture()
        : root{makeTempDirectory()}
        , recording{}
    {
        recording = writeTestRecording("default.sigrec", 4, 60.0, 100.0, 1'000'000'000);
    }

    RecordingFixture::~RecordingFixture()
    {
        auto ec = std::error_code{};
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path RecordingFixture::writeTestRecording(std::string const& name, std::size_t channels, double seconds, double rate,
        std::int64_t start)
    {
        auto const sampleCount = static_cast<std::size_t>(std::llround(seconds * rate));
        auto data = std::vector<lib::ChannelSamples>{};
        for (auto c = std::size_t{0}; c < channels; ++c)
        {
            auto samples = std::vector<double>(sampleCount);
            for (auto i = std::size_t{0}; i < sampleCount; ++i)
            {
                // Integral values keep comparisons exact.
                samples[i] = static_cast<double>(c * 1'000'000 + i);
            }
            data.push_back(lib::ChannelSamples{fmt::format("ch{}", c), rate, start, std::move(samples)});
        }

        auto const path = root / name;
        lib::writeRecording(path, data);
        return path;
    }
}
