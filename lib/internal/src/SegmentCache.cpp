// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "sigseg-internal/SegmentCache.hpp"
#include <algorithm>
#include <utility>
#include "sigseg-internal/Logging.hpp"

namespace sigseg::lib
{
    std::size_t SegmentCache::capacityFor(std::size_t prefetchDepth, std::size_t multiplier) noexcept
    {
        if (multiplier == 0)
        {
            return 0;
        }
        return std::max<std::size_t>(1, prefetchDepth * multiplier);
    }

    SegmentCache::SegmentCache(std::size_t capacity)
        : _capacity{capacity}
        , _clock{0}
        , _entries{}
    {}

    std::shared_ptr<SegmentData const> SegmentCache::get(std::int64_t index, std::uint64_t generation) const
    {
        if (auto const it = _entries.find(index); (it != _entries.end()) && (it->second.generation == generation))
        {
            return it->second.data;
        }
        return {};
    }

    bool SegmentCache::contains(std::int64_t index, std::uint64_t generation) const noexcept
    {
        auto const it = _entries.find(index);
        return (it != _entries.end()) && (it->second.generation == generation);
    }

    void SegmentCache::touch(std::int64_t index) noexcept
    {
        if (auto const it = _entries.find(index); it != _entries.end())
        {
            it->second.lastAccess = ++_clock;
        }
    }

    std::size_t SegmentCache::put(std::int64_t index, std::uint64_t generation, std::shared_ptr<SegmentData const> data)
    {
        if (_capacity == 0)
        {
            return 0;
        }

        if (auto const it = _entries.find(index); it != _entries.end())
        {
            it->second = CacheEntry{index, generation, std::move(data), ++_clock};
            return 0;
        }

        auto evicted = std::size_t{0};
        if (_entries.size() >= _capacity)
        {
            evictOne(generation);
            ++evicted;
        }
        _entries.emplace(index, CacheEntry{index, generation, std::move(data), ++_clock});
        return evicted;
    }

    void SegmentCache::evictOne(std::uint64_t generation)
    {
        // Map order is ascending index, so a strict comparison keeps the lowest index on ties.
        auto victim = _entries.end();
        for (auto it = _entries.begin(); it != _entries.end(); ++it)
        {
            if (victim == _entries.end())
            {
                victim = it;
                continue;
            }

            auto const itStale = (it->second.generation != generation);
            auto const victimStale = (victim->second.generation != generation);
            if ((itStale && !victimStale) || ((itStale == victimStale) && (it->second.lastAccess < victim->second.lastAccess)))
            {
                victim = it;
            }
        }

        if (victim != _entries.end())
        {
            SIGSEG_TRACE("Evicting segment {} (generation {}, last access {}).",
                victim->second.segmentIndex,
                victim->second.generation,
                victim->second.lastAccess);
            _entries.erase(victim);
        }
    }

    std::size_t SegmentCache::size() const noexcept
    {
        return _entries.size();
    }

    std::size_t SegmentCache::liveSize(std::uint64_t generation) const noexcept
    {
        return static_cast<std::size_t>(
            std::count_if(_entries.begin(), _entries.end(), [generation](auto const& kv) { return kv.second.generation == generation; }));
    }

    std::size_t SegmentCache::capacity() const noexcept
    {
        return _capacity;
    }

    void SegmentCache::clear() noexcept
    {
        _entries.clear();
    }
}
