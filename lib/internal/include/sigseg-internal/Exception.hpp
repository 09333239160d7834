// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.hpp
 * @brief The single exception type thrown inside sigseg
 *
 * Everything below the C API throws sigseg::lib::Exception. The entry points
 * in lib/src catch at the boundary and return the carried sigsegStatus, so
 * each factory names exactly one status:
 *
 * ```cpp
 * throw Exception::outOfRange("Segment {} of '{}' does not exist, {} segments", index, path, count);
 * ```
 */

#pragma once

#include <stdexcept>
#include <string>
#include <fmt/format.h>
#include <sigseg/sigseg.h>

namespace sigseg::lib
{
    class Exception : public std::runtime_error
    {
    public:
        Exception(std::string const& msg, sigsegStatus status);

        /** Path, descriptor or sample files unusable. */
        template<typename... T>
        static Exception openError(fmt::format_string<T...> fmt, T&&... args)
        {
            return withStatus(SIGSEG_ERR_OPEN, fmt, std::forward<T>(args)...);
        }

        template<typename... T>
        static Exception notOpen(fmt::format_string<T...> fmt, T&&... args)
        {
            return withStatus(SIGSEG_ERR_NOT_OPEN, fmt, std::forward<T>(args)...);
        }

        /** No segment length has been set for the recording yet. */
        template<typename... T>
        static Exception notSegmented(fmt::format_string<T...> fmt, T&&... args)
        {
            return withStatus(SIGSEG_ERR_NOT_SEGMENTED, fmt, std::forward<T>(args)...);
        }

        template<typename... T>
        static Exception invalidArgument(fmt::format_string<T...> fmt, T&&... args)
        {
            return withStatus(SIGSEG_ERR_INVALID_ARG, fmt, std::forward<T>(args)...);
        }

        template<typename... T>
        static Exception outOfRange(fmt::format_string<T...> fmt, T&&... args)
        {
            return withStatus(SIGSEG_ERR_OUT_OF_RANGE, fmt, std::forward<T>(args)...);
        }

        /** Storage failed while reading a recording that opened fine. */
        template<typename... T>
        static Exception readError(fmt::format_string<T...> fmt, T&&... args)
        {
            return withStatus(SIGSEG_ERR_READ, fmt, std::forward<T>(args)...);
        }

        [[nodiscard]]
        sigsegStatus status() const noexcept;

    private:
        template<typename... T>
        static Exception withStatus(sigsegStatus status, fmt::format_string<T...> fmt, T&&... args)
        {
            return Exception{fmt::format(fmt, std::forward<T>(args)...), status};
        }

        sigsegStatus _status;
    };

    /**
     * Status for the exception currently being handled. Only valid inside a
     * catch block. std::invalid_argument becomes SIGSEG_ERR_INVALID_ARG and
     * anything that is not an Exception becomes SIGSEG_ERR_UNKNOWN.
     */
    sigsegStatus statusFromCurrentException() noexcept;
}
