// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "sigseg-internal/Exception.hpp"
#include "sigseg-internal/RecordingReader.hpp"

namespace sigseg::tests
{
    //
    // Observable state shared by a fake reader and the test that created it.
    //
    struct FakeRecordingState
    {
        std::vector<lib::ChannelInfo> channels;

        std::atomic<std::size_t> reads{0};
        std::atomic<std::size_t> closes{0};
        std::atomic<bool> failReads{false};

        /// Hold every read after the next \p passThrough ones until releaseReads() is called.
        void blockReads(std::size_t passThrough = 0);
        void releaseReads();
        /// Wait until \p count reads are held by blockReads().
        void waitForBlockedReads(std::size_t count);

        /// Called by the reader.  Honors blockReads().
        void enterRead();

    private:
        std::mutex _mutex;
        std::condition_variable _cv;
        bool _blocked = false;
        std::size_t _passThrough = 0;
        std::size_t _waiting = 0;
    };

    //
    // In-memory reader.  Sample k of the array returned for channel c holds
    // c * 1e9 + (absolute slot of that sample), so tests can tell exactly which
    // window of which channel they got.
    //
    class FakeRecordingReader : public lib::RecordingReader
    {
    public:
        FakeRecordingReader(std::string path, std::shared_ptr<FakeRecordingState> state);

        [[nodiscard]]
        std::vector<lib::ChannelInfo> const& getChannels() const override;

        [[nodiscard]]
        lib::SegmentData readRange(std::vector<std::string> const& channels, std::int64_t start, std::int64_t end) const override;

        void close() noexcept override;

    private:
        std::shared_ptr<FakeRecordingState> _state;
    };

    //
    // Factory serving registered fake recordings.  Unknown paths fail like a missing file.
    //
    class FakeRecordingReaderFactory : public lib::RecordingReaderFactory
    {
    public:
        /// Register a recording and return its shared state.
        std::shared_ptr<FakeRecordingState> add(std::string const& path, std::vector<lib::ChannelInfo> channels);

        [[nodiscard]]
        std::unique_ptr<lib::RecordingReader> openRecording(std::string const& path) const override;

        [[nodiscard]]
        std::size_t opens() const noexcept;

    private:
        mutable std::mutex _mutex;
        std::map<std::string, std::shared_ptr<FakeRecordingState>> _recordings;
        mutable std::atomic<std::size_t> _opens{0};
    };

    /// \p count channels named "ch0", "ch1", ... all covering [start, start + seconds).
    std::vector<lib::ChannelInfo> makeChannels(std::size_t count, double seconds, double rate, std::int64_t start = 0);

    /// Value stored by FakeRecordingReader for \p slot of channel \p channel.
    double fakeSample(std::size_t channel, std::int64_t slot);

    //
    // RAII helper writing a ".sigrec" recording to a unique temporary directory
    // and removing it again.
    //
    class RecordingFixture
    {
    public:
        /// 4 channels of 60 s at 100 Hz, starting at t = 1000 s.
        RecordingFixture();
        ~RecordingFixture();

    protected:
        /// The temporary directory holding all recordings of the fixture.
        std::filesystem::path root;
        /// The default recording.
        std::filesystem::path recording;

        /// Write an additional recording named \p name under root.
        std::filesystem::path writeTestRecording(std::string const& name, std::size_t channels, double seconds, double rate, std::int64_t start);
    };

    /// Run \p f and return the status of the Exception it throws, SIGSEG_STATUS_OK if none.
    template<typename F>
    sigsegStatus statusOf(F&& f)
    {
        try
        {
            f();
            return SIGSEG_STATUS_OK;
        }
        catch (lib::Exception const& e)
        {
            return e.status();
        }
    }

    // Helper to make a unique temp directory
    auto makeTempDirectory() -> std::filesystem::path;

} // namespace sigseg::tests
