// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "sigseg-internal/FileManager.hpp"
#include <chrono>
#include <exception>
#include <utility>
#include "sigseg-internal/Exception.hpp"
#include "sigseg-internal/Logging.hpp"

namespace sigseg::lib
{
    namespace
    {
        /**
         * Readers are shared with in-flight reads.  Whoever drops the last
         * reference closes the reader.
         */
        std::shared_ptr<RecordingReader> shareReader(std::unique_ptr<RecordingReader> reader)
        {
            return std::shared_ptr<RecordingReader>{reader.release(),
                [](RecordingReader* r)
                {
                    r->close();
                    delete r;
                }};
        }
    }

    FileManager::FileManager(std::shared_ptr<RecordingReaderFactory> factory, FileManagerOptions const& options)
        : _factory{std::move(factory)}
        , _options{options}
        , _cacheCapacity{SegmentCache::capacityFor(options.prefetchDepth, options.cacheCapacityMultiplier)}
        , _scheduler{options.workerCount,
              options.prefetchDepth,
              options.maxPendingPrefetch,
              std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(options.shutdownGraceMs)}}
        , _mutex{}
        , _files{}
    {
        if (!_factory)
        {
            throw Exception::invalidArgument("A recording reader factory is required.");
        }
        SIGSEG_INFO("File manager started: prefetch depth {}, cache capacity {}, {} prefetch workers.",
            _options.prefetchDepth,
            _cacheCapacity,
            _scheduler.enabled() ? _options.workerCount : 0);
    }

    FileManager::~FileManager()
    {
        shutdown();
    }

    FileInfo FileManager::open(std::string const& path)
    {
        if (auto const existing = find(path); existing)
        {
            SIGSEG_DEBUG("'{}' is already open.", path);
            return existing->info();
        }

        // Open outside the registry lock, readers parse metadata from storage.
        auto file = std::shared_ptr<ManagedFile>{};
        try
        {
            file = std::make_shared<ManagedFile>(path, shareReader(_factory->openRecording(path)), _cacheCapacity);
        }
        catch (Exception const& e)
        {
            if (e.status() == SIGSEG_ERR_OPEN)
            {
                throw;
            }
            throw Exception::openError("Failed to open '{}': {}", path, e.what());
        }
        catch (std::exception const& e)
        {
            throw Exception::openError("Failed to open '{}': {}", path, e.what());
        }

        {
            auto const lock = std::lock_guard{_mutex};
            auto const [it, inserted] = _files.emplace(path, file);
            if (!inserted)
            {
                // Lost a race against a concurrent open of the same path.
                file->close();
                file = it->second;
            }
            else
            {
                SIGSEG_INFO("Opened '{}'.", path);
            }
        }
        return file->info();
    }

    void FileManager::close(std::string const& path)
    {
        auto file = std::shared_ptr<ManagedFile>{};
        {
            auto const lock = std::lock_guard{_mutex};
            auto const it = _files.find(path);
            if (it == _files.end())
            {
                return;
            }
            file = std::move(it->second);
            _files.erase(it);
        }

        _scheduler.cancel(path);
        file->close();
    }

    std::int64_t FileManager::setSegmentSeconds(std::string const& path, double seconds)
    {
        return get(path)->setSegmentSeconds(seconds);
    }

    void FileManager::setActiveChannels(std::string const& path, std::vector<std::string> const& channels)
    {
        get(path)->setActiveChannels(channels);
    }

    std::int64_t FileManager::getNumberOfSegments(std::string const& path) const noexcept
    {
        try
        {
            auto const file = find(path);
            return file ? file->segmentCount() : 0;
        }
        catch (std::exception const& e)
        {
            SIGSEG_ERROR("Failed to query the segment count of '{}': {}", path, e.what());
            return 0;
        }
    }

    std::shared_ptr<SegmentData const> FileManager::getSegment(std::string const& path, std::int64_t index)
    {
        auto const file = get(path);
        auto data = file->readSegment(index);
        _scheduler.onServed(file, index);
        return data;
    }

    std::vector<std::string> FileManager::listOpenFiles() const
    {
        auto const lock = std::lock_guard{_mutex};
        auto paths = std::vector<std::string>{};
        paths.reserve(_files.size());
        for (auto const& [path, file] : _files)
        {
            paths.push_back(path);
        }
        return paths;
    }

    FileInfo FileManager::getFileInfo(std::string const& path) const
    {
        return get(path)->info();
    }

    std::vector<std::string> FileManager::getActiveChannels(std::string const& path) const
    {
        return get(path)->activeChannels();
    }

    CacheStatistics FileManager::getCacheStatistics(std::string const& path) const
    {
        return get(path)->statistics();
    }

    void FileManager::shutdown()
    {
        _scheduler.stop();

        auto files = std::map<std::string, std::shared_ptr<ManagedFile>>{};
        {
            auto const lock = std::lock_guard{_mutex};
            files.swap(_files);
        }
        for (auto const& [path, file] : files)
        {
            file->close();
        }
        if (!files.empty())
        {
            SIGSEG_INFO("File manager shut down, closed {} files.", files.size());
        }
    }

    void FileManager::waitForPrefetch() const
    {
        _scheduler.waitIdle();
    }

    FileManagerOptions const& FileManager::getOptions() const noexcept
    {
        return _options;
    }

    std::shared_ptr<ManagedFile> FileManager::find(std::string const& path) const
    {
        auto const lock = std::lock_guard{_mutex};
        auto const it = _files.find(path);
        return (it != _files.end()) ? it->second : nullptr;
    }

    std::shared_ptr<ManagedFile> FileManager::get(std::string const& path) const
    {
        if (auto file = find(path); file)
        {
            return file;
        }
        throw Exception::notOpen("Recording '{}' is not open.", path);
    }
}
