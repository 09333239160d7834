// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ManagedFile.cpp
 * @brief Per-file segment serving, reconfiguration and prefetch validation
 */

#include "sigseg-internal/ManagedFile.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <set>
#include <utility>
#include "sigseg-internal/Exception.hpp"
#include "sigseg-internal/Logging.hpp"
#include "ScopeExit.hpp"

namespace sigseg::lib
{
    namespace
    {
        /**
         * Map a failure of RecordingReader::readRange() to SIGSEG_ERR_READ.
         * Must be called from inside a catch block.
         */
        std::exception_ptr asReadError(std::string const& path, std::int64_t index)
        {
            try
            {
                throw;
            }
            catch (Exception const& e)
            {
                if (e.status() == SIGSEG_ERR_READ)
                {
                    return std::current_exception();
                }
                return std::make_exception_ptr(Exception::readError("Failed to read segment {} of '{}': {}", index, path, e.what()));
            }
            catch (std::exception const& e)
            {
                return std::make_exception_ptr(Exception::readError("Failed to read segment {} of '{}': {}", index, path, e.what()));
            }
            catch (...)
            {
                return std::current_exception();
            }
        }
    }

    std::vector<std::string> FileInfo::channelNames() const
    {
        auto names = std::vector<std::string>{};
        names.reserve(channels.size());
        for (auto const& channel : channels)
        {
            names.push_back(channel.name);
        }
        return names;
    }

    double FileInfo::durationSeconds() const noexcept
    {
        return static_cast<double>(timeBounds.duration()) / static_cast<double>(MICROSECONDS_PER_SECOND);
    }

    ManagedFile::ManagedFile(std::string path, std::shared_ptr<RecordingReader> reader, std::size_t cacheCapacity)
        : _path{std::move(path)}
        , _channels{reader->getChannels()}
        , _mutex{}
        , _reader{std::move(reader)}
        , _activeChannels{}
        , _timeBounds{0, 0}
        , _segmentSeconds{0.0}
        , _generation{0}
        , _cache{cacheCapacity}
        , _inflight{}
        , _nextToken{0}
        , _hits{0}
        , _misses{0}
        , _prefetchStored{0}
        , _prefetchDiscarded{0}
        , _evictions{0}
    {
        if (_channels.empty())
        {
            throw Exception::openError("Recording '{}' has no channels.", _path);
        }
        for (auto const& channel : _channels)
        {
            _activeChannels.push_back(channel.name);
        }
        recomputeBounds();
    }

    std::string const& ManagedFile::getPath() const noexcept
    {
        return _path;
    }

    bool ManagedFile::isOpen() const
    {
        auto const lock = std::lock_guard{_mutex};
        return static_cast<bool>(_reader);
    }

    FileInfo ManagedFile::info() const
    {
        auto const lock = std::lock_guard{_mutex};
        return FileInfo{_path, _channels, _activeChannels, _timeBounds, _segmentSeconds, segmentCountLocked(), _generation};
    }

    std::vector<std::string> ManagedFile::activeChannels() const
    {
        auto const lock = std::lock_guard{_mutex};
        return _activeChannels;
    }

    CacheStatistics ManagedFile::statistics() const
    {
        auto const lock = std::lock_guard{_mutex};
        return CacheStatistics{_hits, _misses, _prefetchStored, _prefetchDiscarded, _evictions, _cache.liveSize(_generation), _cache.capacity()};
    }

    std::int64_t ManagedFile::segmentCount() const
    {
        auto const lock = std::lock_guard{_mutex};
        return _reader ? segmentCountLocked() : 0;
    }

    std::uint64_t ManagedFile::generation() const
    {
        auto const lock = std::lock_guard{_mutex};
        return _generation;
    }

    std::int64_t ManagedFile::setSegmentSeconds(double seconds)
    {
        if (!std::isfinite(seconds) || (seconds <= 0.0))
        {
            throw Exception::invalidArgument("Segment length must be a positive number of seconds, got {}.", seconds);
        }
        if (segmentLengthUs(seconds) <= 0)
        {
            throw Exception::invalidArgument("Segment length {} s is shorter than one microsecond.", seconds);
        }

        auto const lock = std::lock_guard{_mutex};
        if (!_reader)
        {
            throw Exception::notOpen("Recording '{}' is not open.", _path);
        }

        _segmentSeconds = seconds;
        ++_generation;
        auto const count = segmentCountLocked();
        SIGSEG_INFO("'{}': segment length set to {} s, {} segments (generation {}).", _path, seconds, count, _generation);
        return count;
    }

    void ManagedFile::setActiveChannels(std::vector<std::string> const& channels)
    {
        if (channels.empty())
        {
            throw Exception::invalidArgument("At least one active channel is required for '{}'.", _path);
        }

        auto seen = std::set<std::string>{};
        for (auto const& name : channels)
        {
            auto const known = std::any_of(_channels.begin(), _channels.end(), [&name](auto const& c) { return c.name == name; });
            if (!known)
            {
                throw Exception::invalidArgument("Recording '{}' has no channel named '{}'.", _path, name);
            }
            if (!seen.insert(name).second)
            {
                throw Exception::invalidArgument("Channel '{}' is listed more than once.", name);
            }
        }

        auto const lock = std::lock_guard{_mutex};
        if (!_reader)
        {
            throw Exception::notOpen("Recording '{}' is not open.", _path);
        }

        _activeChannels = channels;
        recomputeBounds();
        ++_generation;
        SIGSEG_INFO("'{}': {} active channels, {} segments (generation {}).", _path, _activeChannels.size(), segmentCountLocked(), _generation);
    }

    std::shared_ptr<SegmentData const> ManagedFile::readSegment(std::int64_t index)
    {
        auto reader = std::shared_ptr<RecordingReader>{};
        auto channels = std::vector<std::string>{};
        auto range = TimeRange{0, 0};
        auto generation = std::uint64_t{0};
        auto token = std::uint64_t{0};
        auto promise = std::promise<std::shared_ptr<SegmentData const>>{};
        auto pending = std::shared_future<std::shared_ptr<SegmentData const>>{};
        {
            auto const lock = std::lock_guard{_mutex};
            if (!_reader)
            {
                throw Exception::notOpen("Recording '{}' is not open.", _path);
            }
            if (_segmentSeconds <= 0.0)
            {
                throw Exception::notSegmented("No segment length configured for '{}'.", _path);
            }
            range = segmentRange(_timeBounds, _segmentSeconds, index);

            if (auto data = _cache.get(index, _generation); data)
            {
                _cache.touch(index);
                ++_hits;
                SIGSEG_TRACE("'{}': cache hit for segment {}.", _path, index);
                return data;
            }
            ++_misses;

            if (auto const it = _inflight.find(index); (it != _inflight.end()) && (it->second.generation == _generation))
            {
                pending = it->second.result;
                SIGSEG_TRACE("'{}': joining in-flight read of segment {}.", _path, index);
            }
            else
            {
                reader = _reader;
                channels = _activeChannels;
                generation = _generation;
                token = ++_nextToken;
                _inflight[index] = InflightRead{generation, token, promise.get_future().share()};
            }
        }

        // Wait outside the lock, the leader needs it to finish.
        if (pending.valid())
        {
            return pending.get();
        }

        auto const release = onScopeExit(
            [this, index, token]()
            {
                auto const lock = std::lock_guard{_mutex};
                if (auto const it = _inflight.find(index); (it != _inflight.end()) && (it->second.token == token))
                {
                    _inflight.erase(it);
                }
            });

        SIGSEG_DEBUG("'{}': cache miss, reading segment {} [{}, {}).", _path, index, range.start, range.end);
        auto data = std::shared_ptr<SegmentData const>{};
        try
        {
            data = std::make_shared<SegmentData const>(reader->readRange(channels, range.start, range.end));
        }
        catch (std::exception const&)
        {
            auto const error = asReadError(_path, index);
            SIGSEG_ERROR("'{}': read of segment {} failed.", _path, index);
            promise.set_exception(error);
            std::rethrow_exception(error);
        }

        {
            auto const lock = std::lock_guard{_mutex};
            if (_reader && (_generation == generation))
            {
                _evictions += _cache.put(index, generation, data);
            }
            else
            {
                SIGSEG_DEBUG("'{}': configuration changed during read of segment {}, result not cached.", _path, index);
            }
        }

        promise.set_value(data);
        return data;
    }

    PrefetchPlan ManagedFile::prefetchCandidates(std::int64_t index, std::size_t depth) const
    {
        auto const lock = std::lock_guard{_mutex};
        auto plan = PrefetchPlan{_generation, {}};
        if (!_reader)
        {
            return plan;
        }

        auto const count = segmentCountLocked();
        for (auto i = std::size_t{1}; i <= depth; ++i)
        {
            auto const candidate = index + static_cast<std::int64_t>(i);
            if ((candidate < 0) || (candidate >= count))
            {
                break;
            }
            if (!_cache.contains(candidate, _generation) && !isInflightLocked(candidate))
            {
                plan.indices.push_back(candidate);
            }
        }
        return plan;
    }

    bool ManagedFile::prefetchSegment(std::int64_t index, std::uint64_t generation)
    {
        auto reader = std::shared_ptr<RecordingReader>{};
        auto channels = std::vector<std::string>{};
        auto range = TimeRange{0, 0};
        {
            auto const lock = std::lock_guard{_mutex};
            if (!_reader || (_generation != generation))
            {
                ++_prefetchDiscarded;
                SIGSEG_DEBUG("'{}': dropping stale prefetch of segment {} (generation {}).", _path, index, generation);
                return false;
            }
            if ((_cache.capacity() == 0) || _cache.contains(index, generation) || isInflightLocked(index))
            {
                return false;
            }
            if ((index < 0) || (index >= segmentCountLocked()))
            {
                return false;
            }
            range = segmentRange(_timeBounds, _segmentSeconds, index);
            reader = _reader;
            channels = _activeChannels;
        }

        auto data = std::shared_ptr<SegmentData const>{};
        try
        {
            data = std::make_shared<SegmentData const>(reader->readRange(channels, range.start, range.end));
        }
        catch (std::exception const& e)
        {
            SIGSEG_WARN("'{}': prefetch of segment {} failed: {}", _path, index, e.what());
            return false;
        }

        auto const lock = std::lock_guard{_mutex};
        if (!_reader || (_generation != generation))
        {
            ++_prefetchDiscarded;
            SIGSEG_DEBUG("'{}': discarding prefetched segment {}, generation {} is stale.", _path, index, generation);
            return false;
        }
        _evictions += _cache.put(index, generation, std::move(data));
        ++_prefetchStored;
        SIGSEG_TRACE("'{}': prefetched segment {}.", _path, index);
        return true;
    }

    void ManagedFile::close()
    {
        auto reader = std::shared_ptr<RecordingReader>{};
        {
            auto const lock = std::lock_guard{_mutex};
            reader = std::move(_reader);
            _cache.clear();
        }
        if (reader)
        {
            SIGSEG_INFO("Closed '{}'.", _path);
        }
        // Reads still in flight hold their own reference; the last one out closes the reader.
    }

    void ManagedFile::recomputeBounds()
    {
        auto start = std::numeric_limits<std::int64_t>::max();
        auto end = std::numeric_limits<std::int64_t>::min();
        for (auto const& name : _activeChannels)
        {
            auto const it = std::find_if(_channels.begin(), _channels.end(), [&name](auto const& c) { return c.name == name; });
            if (it != _channels.end())
            {
                start = std::min(start, it->startTime);
                end = std::max(end, it->endTime);
            }
        }
        _timeBounds = (start <= end) ? TimeRange{start, end} : TimeRange{0, 0};
    }

    std::int64_t ManagedFile::segmentCountLocked() const noexcept
    {
        return lib::segmentCount(_timeBounds, _segmentSeconds);
    }

    bool ManagedFile::isInflightLocked(std::int64_t index) const noexcept
    {
        auto const it = _inflight.find(index);
        return (it != _inflight.end()) && (it->second.generation == _generation);
    }
}
