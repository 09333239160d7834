// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.cpp
 * @brief Implementation of the sigseg exception type
 */

#include "sigseg-internal/Exception.hpp"
#include <stdexcept>
#include "sigseg-internal/Logging.hpp"

namespace sigseg::lib
{
    Exception::Exception(std::string const& msg, sigsegStatus status)
        : std::runtime_error{msg}
        , _status{status}
    {}

    sigsegStatus Exception::status() const noexcept
    {
        return _status;
    }

    sigsegStatus statusFromCurrentException() noexcept
    {
        try
        {
            throw;
        }
        catch (Exception const& e)
        {
            return e.status();
        }
        catch (std::invalid_argument const& e)
        {
            SIGSEG_ERROR("Invalid argument: {}", e.what());
            return SIGSEG_ERR_INVALID_ARG;
        }
        catch (std::exception const& e)
        {
            SIGSEG_ERROR("Unexpected failure: {}", e.what());
            return SIGSEG_ERR_UNKNOWN;
        }
        catch (...)
        {
            SIGSEG_ERROR("Unexpected failure of unknown type.");
            return SIGSEG_ERR_UNKNOWN;
        }
    }
}
