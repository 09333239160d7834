// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PrefetchScheduler.hpp
 * @brief Bounded worker pool reading segments ahead of the client
 *
 * After a segment is served, onServed() queues prefetch units for the next
 * prefetchDepth indices that are neither cached nor being read.  A fixed set
 * of worker threads drains the queue in FIFO order and hands every unit to
 * ManagedFile::prefetchSegment(), which validates the captured generation
 * before and after the read.
 *
 * BOUNDS:
 * - At most maxPending units wait in the queue.  Units scheduled while it is
 *   full are dropped, prefetch being speculative.
 * - A unit is identified by (path, generation, index).  Scheduling a unit
 *   that is already queued or running is a no-op.
 *
 * The scheduler never performs I/O on the caller's thread and demand reads
 * never go through it, so a saturated pool cannot block a client.
 *
 * Units hold weak references to their file: a closed and unregistered file
 * is not kept alive by queued work.
 *
 * Workers co-own the queue state rather than the scheduler.  stop() gives
 * running units a bounded grace period and detaches the workers still stuck
 * in a read afterwards; those finish on their own and touch nothing but the
 * shared state and their file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <vector>
#include "sigseg-internal/ManagedFile.hpp"

namespace sigseg::lib
{
    class PrefetchScheduler
    {
    public:
        static constexpr auto DEFAULT_STOP_GRACE = std::chrono::milliseconds{2000};

        /**
         * Start \p workerCount worker threads.
         *
         * @param workerCount Pool size, 0 disables prefetching.
         * @param prefetchDepth Indices scheduled ahead per onServed(), 0 disables prefetching.
         * @param maxPending Queue bound.
         * @param stopGrace How long stop() waits for running units.
         */
        PrefetchScheduler(std::size_t workerCount, std::size_t prefetchDepth, std::size_t maxPending,
            std::chrono::milliseconds stopGrace = DEFAULT_STOP_GRACE);

        PrefetchScheduler(PrefetchScheduler const&) = delete;
        PrefetchScheduler& operator=(PrefetchScheduler const&) = delete;

        /** Stops the pool, see stop(). */
        ~PrefetchScheduler();

        /**
         * Queue prefetch units following the segment \p index just served from \p file.
         * Returns immediately.
         *
         * @return The number of units queued.
         */
        std::size_t onServed(std::shared_ptr<ManagedFile> const& file, std::int64_t index);

        /**
         * Queue a single unit.
         * @return false if disabled, stopped, duplicate or the queue is full.
         */
        bool schedule(std::shared_ptr<ManagedFile> const& file, std::uint64_t generation, std::int64_t index);

        /**
         * Drop every queued unit of \p path.  Running units are not interrupted.
         * @return The number of units dropped.
         */
        std::size_t cancel(std::string const& path);

        /**
         * Drop all queued units and join the workers that finish their current
         * unit within the grace period.  The others are detached.  Idempotent.
         */
        void stop();

        /**
         * Block until no unit is queued or running, or until the scheduler is stopped.
         */
        void waitIdle() const;

        [[nodiscard]]
        bool enabled() const noexcept;

        /** Units queued and not yet started. */
        [[nodiscard]]
        std::size_t pendingCount() const;

    private:
        using UnitKey = std::tuple<std::string, std::uint64_t, std::int64_t>;

        struct Unit
        {
            UnitKey key;
            std::weak_ptr<ManagedFile> file;
        };

        struct State
        {
            std::mutex mutex;
            std::condition_variable workAvailable;
            std::condition_variable idle;
            std::condition_variable workerExited;
            std::deque<Unit> queue;
            /** Keys of queued and running units. */
            std::set<UnitKey> scheduled;
            std::size_t running = 0;
            bool stopping = false;
            /** One flag per worker, set when its loop returns. */
            std::vector<bool> exited;
        };

        static void workerLoop(std::shared_ptr<State> state, std::size_t worker);

        std::size_t const _prefetchDepth;
        std::size_t const _maxPending;
        std::chrono::milliseconds const _stopGrace;

        std::shared_ptr<State> _state;
        std::vector<std::thread> _workers;
    };
}
