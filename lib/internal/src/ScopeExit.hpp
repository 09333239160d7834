// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ScopeExit.hpp
 * @brief Runs cleanup when leaving a scope, on both normal and exceptional exits
 *
 * Releases in-flight read slots and queued prefetch keys:
 *
 *   auto const release = onScopeExit([&]() { forget(key); });
 */

#pragma once

#include <type_traits>
#include <utility>

namespace sigseg::lib
{
    template<typename Cleanup>
    class ScopeExit final
    {
    public:
        explicit constexpr ScopeExit(Cleanup cleanup) noexcept(std::is_nothrow_move_constructible_v<Cleanup>)
            : _cleanup{std::move(cleanup)}
        {}

        ScopeExit(ScopeExit const&) = delete;
        ScopeExit& operator=(ScopeExit const&) = delete;

        ~ScopeExit() noexcept(std::is_nothrow_invocable_v<Cleanup&>)
        {
            _cleanup();
        }

    private:
        Cleanup _cleanup;
    };

    template<typename Cleanup>
    [[nodiscard("The cleanup runs immediately unless the returned guard is kept alive.")]]
    constexpr ScopeExit<std::decay_t<Cleanup>> onScopeExit(Cleanup&& cleanup)
    {
        return ScopeExit<std::decay_t<Cleanup>>{std::forward<Cleanup>(cleanup)};
    }
}
