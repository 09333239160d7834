// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "sigseg-internal/PrefetchScheduler.hpp"
#include <algorithm>
#include <exception>
#include <utility>
#include "sigseg-internal/Logging.hpp"
#include "ScopeExit.hpp"

namespace sigseg::lib
{
    PrefetchScheduler::PrefetchScheduler(std::size_t workerCount, std::size_t prefetchDepth, std::size_t maxPending,
        std::chrono::milliseconds stopGrace)
        : _prefetchDepth{prefetchDepth}
        , _maxPending{maxPending}
        , _stopGrace{stopGrace}
        , _state{std::make_shared<State>()}
        , _workers{}
    {
        if ((prefetchDepth == 0) || (maxPending == 0))
        {
            workerCount = 0;
        }

        _state->exited.assign(workerCount, false);
        _workers.reserve(workerCount);
        for (auto i = std::size_t{0}; i < workerCount; ++i)
        {
            _workers.emplace_back(&PrefetchScheduler::workerLoop, _state, i);
        }
        SIGSEG_DEBUG("Prefetch pool started with {} workers, depth {}, queue bound {}.", _workers.size(), _prefetchDepth, _maxPending);
    }

    PrefetchScheduler::~PrefetchScheduler()
    {
        stop();
    }

    bool PrefetchScheduler::enabled() const noexcept
    {
        return !_workers.empty();
    }

    std::size_t PrefetchScheduler::onServed(std::shared_ptr<ManagedFile> const& file, std::int64_t index)
    {
        if (!enabled())
        {
            return 0;
        }

        auto const plan = file->prefetchCandidates(index, _prefetchDepth);
        auto queued = std::size_t{0};
        for (auto const candidate : plan.indices)
        {
            if (schedule(file, plan.generation, candidate))
            {
                ++queued;
            }
        }
        return queued;
    }

    bool PrefetchScheduler::schedule(std::shared_ptr<ManagedFile> const& file, std::uint64_t generation, std::int64_t index)
    {
        if (!enabled())
        {
            return false;
        }

        auto key = UnitKey{file->getPath(), generation, index};
        {
            auto const lock = std::lock_guard{_state->mutex};
            if (_state->stopping || (_state->scheduled.count(key) != 0))
            {
                return false;
            }
            if (_state->queue.size() >= _maxPending)
            {
                SIGSEG_DEBUG("Prefetch queue full, dropping segment {} of '{}'.", index, file->getPath());
                return false;
            }
            _state->scheduled.insert(key);
            _state->queue.push_back(Unit{std::move(key), file});
        }
        SIGSEG_TRACE("Scheduled prefetch of segment {} of '{}' (generation {}).", index, file->getPath(), generation);
        _state->workAvailable.notify_one();
        return true;
    }

    std::size_t PrefetchScheduler::cancel(std::string const& path)
    {
        auto dropped = std::size_t{0};
        {
            auto const lock = std::lock_guard{_state->mutex};
            auto& queue = _state->queue;
            auto const it = std::remove_if(queue.begin(),
                queue.end(),
                [this, &path, &dropped](Unit const& unit)
                {
                    if (std::get<0>(unit.key) != path)
                    {
                        return false;
                    }
                    _state->scheduled.erase(unit.key);
                    ++dropped;
                    return true;
                });
            queue.erase(it, queue.end());
        }
        if (dropped != 0)
        {
            SIGSEG_DEBUG("Cancelled {} queued prefetch units of '{}'.", dropped, path);
            _state->idle.notify_all();
        }
        return dropped;
    }

    void PrefetchScheduler::stop()
    {
        {
            auto const lock = std::lock_guard{_state->mutex};
            _state->stopping = true;
            for (auto const& unit : _state->queue)
            {
                _state->scheduled.erase(unit.key);
            }
            _state->queue.clear();
        }
        _state->workAvailable.notify_all();
        _state->idle.notify_all();

        auto exited = std::vector<bool>{};
        {
            auto lock = std::unique_lock{_state->mutex};
            _state->workerExited.wait_for(lock,
                _stopGrace,
                [this]() { return std::all_of(_state->exited.begin(), _state->exited.end(), [](bool done) { return done; }); });
            exited = _state->exited;
        }

        for (auto i = std::size_t{0}; i < _workers.size(); ++i)
        {
            auto& worker = _workers[i];
            if (!worker.joinable())
            {
                continue;
            }
            if (exited[i])
            {
                worker.join();
            }
            else
            {
                SIGSEG_WARN("Prefetch worker {} is still reading after {} ms, detaching it.", i, _stopGrace.count());
                worker.detach();
            }
        }
    }

    void PrefetchScheduler::waitIdle() const
    {
        auto lock = std::unique_lock{_state->mutex};
        _state->idle.wait(lock, [this]() { return _state->stopping || (_state->queue.empty() && (_state->running == 0)); });
    }

    std::size_t PrefetchScheduler::pendingCount() const
    {
        auto const lock = std::lock_guard{_state->mutex};
        return _state->queue.size();
    }

    void PrefetchScheduler::workerLoop(std::shared_ptr<State> state, std::size_t worker)
    {
        auto const markExited = onScopeExit(
            [&state, worker]()
            {
                {
                    auto const lock = std::lock_guard{state->mutex};
                    state->exited[worker] = true;
                }
                state->workerExited.notify_all();
            });

        while (true)
        {
            auto unit = Unit{};
            {
                auto lock = std::unique_lock{state->mutex};
                state->workAvailable.wait(lock, [&state]() { return state->stopping || !state->queue.empty(); });
                if (state->stopping)
                {
                    return;
                }
                unit = std::move(state->queue.front());
                state->queue.pop_front();
                ++state->running;
            }

            auto const done = onScopeExit(
                [&state, &unit]()
                {
                    {
                        auto const lock = std::lock_guard{state->mutex};
                        state->scheduled.erase(unit.key);
                        --state->running;
                    }
                    state->idle.notify_all();
                });

            auto const file = unit.file.lock();
            if (!file)
            {
                continue;
            }

            try
            {
                file->prefetchSegment(std::get<2>(unit.key), std::get<1>(unit.key));
            }
            catch (std::exception const& e)
            {
                SIGSEG_WARN("Prefetch of segment {} of '{}' failed: {}", std::get<2>(unit.key), std::get<0>(unit.key), e.what());
            }
        }
    }
}
