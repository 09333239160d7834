// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file sigseg.h
 * @brief sigseg SDK entry point -- instance lifecycle, status codes and segment access.
 *
 * sigseg serves fixed-length, time-windowed segments of multichannel
 * physiological recordings.  A sigsegInstance owns the registry of open
 * recordings, a per-recording segment cache and a background prefetch pool.
 * This header is the boundary consumed by service layers (RPC servers,
 * language bindings); every function returns a sigsegStatus and never lets
 * an exception escape.
 *
 * Typical usage:
 * @code
 *     #include <sigseg/sigseg.h>
 *
 *     sigsegInstance inst = sigsegCreateInstance("{\"prefetchDepth\": 3}");
 *     sigsegOpenFile(inst, "/data/patient01.sigrec");
 *
 *     uint64_t count = 0;
 *     sigsegSetSegmentSeconds(inst, "/data/patient01.sigrec", 60.0, &count);
 *
 *     sigsegSegment segment;
 *     if (sigsegGetSegment(inst, "/data/patient01.sigrec", 0, &segment) == SIGSEG_STATUS_OK)
 *     {
 *         double const* samples;
 *         size_t sampleCount;
 *         sigsegSegmentGetChannel(segment, 0, &samples, &sampleCount);
 *         sigsegReleaseSegment(segment);
 *     }
 *
 *     sigsegDestroyInstance(inst);
 * @endcode
 */

#pragma once

#ifdef __cplusplus
#   include <cstddef>
#   include <cstdint>
#else
#   include <stddef.h>
#   include <stdint.h>
#endif

#include <sigseg/platform.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /* ======================================================================
     * Status codes
     * ==================================================================== */

    /**
     * Universal return-code enum for the sigseg SDK.
     *
     * Any value other than SIGSEG_STATUS_OK indicates that the operation did
     * not succeed and that any [out] parameters should be considered
     * uninitialised.
     */
    typedef enum sigsegStatus
    {
        SIGSEG_STATUS_OK,             /**< Success.                                                             */
        SIGSEG_ERR_UNKNOWN,           /**< An unexpected internal error occurred.                               */
        SIGSEG_ERR_OPEN,              /**< The recording could not be opened or its metadata is corrupt.        */
        SIGSEG_ERR_NOT_OPEN,          /**< The path does not refer to an open recording.                        */
        SIGSEG_ERR_NOT_SEGMENTED,     /**< No segment length has been configured for the recording yet.         */
        SIGSEG_ERR_INVALID_ARG,       /**< One or more arguments are NULL or otherwise invalid.                 */
        SIGSEG_ERR_OUT_OF_RANGE,      /**< The segment index is outside [0, number of segments).                */
        SIGSEG_ERR_READ,              /**< The underlying storage failed while reading samples.                 */
        SIGSEG_ERR_INVALID_INSTANCE,  /**< The instance handle is NULL or has already been destroyed.           */
        SIGSEG_ERR_BUFFER_TOO_SMALL,  /**< The caller-supplied buffer cannot hold the result; see *size.        */
    } sigsegStatus;

    /* ======================================================================
     * SDK version
     * ==================================================================== */

    typedef struct sigsegVersionType
    {
        uint16_t    major;
        uint16_t    minor;
        uint16_t    bugfix;
        uint16_t    build;
        char const* full; /**< Human-readable version string.  Owned by the library. */
    } sigsegVersionType;

    /**
     * Retrieve the version of the sigseg SDK that is currently linked.
     *
     * @param[out] out_version  Must not be NULL.
     * @return SIGSEG_STATUS_OK, or SIGSEG_ERR_INVALID_ARG if \p out_version is NULL.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegGetVersion(sigsegVersionType* out_version);

    /* ======================================================================
     * Instance lifecycle
     * ==================================================================== */

    /** Opaque handle to a sigseg instance.  Created by sigsegCreateInstance(). */
    typedef struct sigsegInstance_t* sigsegInstance;

    /**
     * Create a new instance (a File Manager with its own prefetch pool).
     *
     * @param[in] in_options  Optional JSON object.  NULL or "" selects all defaults.
     *                        Recognised keys (all non-negative numbers):
     *                        "prefetchDepth" (3), "cacheCapacityMultiplier" (5),
     *                        "workerCount" (4), "maxPendingPrefetch" (256).
     * @return A valid instance, or NULL if the options are malformed.
     */
    SIGSEG_EXPORT
    sigsegInstance sigsegCreateInstance(char const* in_options);

    /**
     * Stop the prefetch pool and close every open recording.
     * Idempotent; the instance stays valid and can open files again.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegShutdown(sigsegInstance in_instance);

    /**
     * Shut the instance down and release it.  The handle must not be reused.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegDestroyInstance(sigsegInstance in_instance);

    /* ======================================================================
     * Recording management
     * ==================================================================== */

    /**
     * Open a recording.  Opening an already open path is a successful no-op.
     *
     * @return SIGSEG_STATUS_OK, SIGSEG_ERR_OPEN if the recording cannot be read.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegOpenFile(sigsegInstance in_instance, char const* in_path);

    /**
     * Close a recording.  Closing a path that is not open succeeds.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegCloseFile(sigsegInstance in_instance, char const* in_path);

    /**
     * Configure the segment length and return the resulting number of segments.
     *
     * @param[in]  in_seconds  Segment length in seconds.  Must be > 0.
     * @param[out] out_count   Optional.  Receives the number of segments.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegSetSegmentSeconds(sigsegInstance in_instance, char const* in_path, double in_seconds, uint64_t* out_count);

    /**
     * Select the channels returned by subsequent segment reads, in the given order.
     *
     * @param[in] in_names  Array of \p in_count channel names.  Must be non-empty and
     *                      every name must exist in the recording.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegSetActiveChannels(sigsegInstance in_instance, char const* in_path, char const* const* in_names, size_t in_count);

    /**
     * Get the number of segments.  Yields 0 for closed or unsegmented recordings.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegGetNumberOfSegments(sigsegInstance in_instance, char const* in_path, uint64_t* out_count);

    /**
     * Get recording metadata as a JSON document.
     *
     * @param[out]   out_buffer  Destination buffer, may be NULL when *inout_size is 0.
     * @param[inout] inout_size  In: capacity of \p out_buffer.  Out: bytes required
     *                           including the terminating NUL.
     * @return SIGSEG_ERR_BUFFER_TOO_SMALL if the buffer is too small (required size written).
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegGetFileInfo(sigsegInstance in_instance, char const* in_path, char* out_buffer, size_t* inout_size);

    /**
     * List open recordings as a JSON array of paths.  Same buffer protocol as sigsegGetFileInfo().
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegListOpenFiles(sigsegInstance in_instance, char* out_buffer, size_t* inout_size);

    /* ======================================================================
     * Segment access
     * ==================================================================== */

    /** Opaque handle to the samples of one segment.  Released with sigsegReleaseSegment(). */
    typedef struct sigsegSegment_t* sigsegSegment;

    /**
     * Read one segment.  Served from the cache when possible; a miss reads
     * synchronously from storage.  Either way neighbouring segments are
     * scheduled for background prefetch.
     *
     * @return SIGSEG_ERR_NOT_OPEN, SIGSEG_ERR_NOT_SEGMENTED, SIGSEG_ERR_OUT_OF_RANGE or
     *         SIGSEG_ERR_READ on failure.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegGetSegment(sigsegInstance in_instance, char const* in_path, int64_t in_index, sigsegSegment* out_segment);

    /** Number of channel arrays in the segment (active channels at read time). */
    SIGSEG_EXPORT
    sigsegStatus sigsegSegmentGetChannelCount(sigsegSegment in_segment, size_t* out_count);

    /**
     * Access the samples of one channel.  The pointer stays valid until the
     * segment is released.
     */
    SIGSEG_EXPORT
    sigsegStatus sigsegSegmentGetChannel(sigsegSegment in_segment, size_t in_channel, double const** out_samples, size_t* out_count);

    SIGSEG_EXPORT
    sigsegStatus sigsegReleaseSegment(sigsegSegment in_segment);

#ifdef __cplusplus
}
#endif
