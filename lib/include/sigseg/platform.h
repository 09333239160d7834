// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.h
 * @brief Symbol visibility for the sigseg shared library.
 *
 * The library is built with hidden visibility; only functions tagged with
 * SIGSEG_EXPORT appear in libsigseg.so.
 */

#pragma once

#if defined(__GNUC__) || defined(__clang__)
#   define SIGSEG_EXPORT __attribute__((visibility("default")))
#else
#   define SIGSEG_EXPORT
#endif
