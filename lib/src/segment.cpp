// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

#include "sigseg/sigseg.h"
#include <exception>
#include "internal/Instance.hpp"
#include "sigseg-internal/Exception.hpp"

using namespace sigseg::lib;

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegGetSegment(sigsegInstance in_instance, char const* in_path, int64_t in_index, sigsegSegment* out_segment)
{
    try
    {
        if (auto const instance = to_Instance(in_instance); instance != nullptr)
        {
            if ((in_path == nullptr) || (out_segment == nullptr))
            {
                return SIGSEG_ERR_INVALID_ARG;
            }

            auto data = instance->getFileManager().getSegment(in_path, in_index);
            *out_segment = to_sigsegSegment(new Segment{std::move(data)});
            return SIGSEG_STATUS_OK;
        }
        return SIGSEG_ERR_INVALID_INSTANCE;
    }
    catch (...)
    {
        return statusFromCurrentException();
    }
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegSegmentGetChannelCount(sigsegSegment in_segment, size_t* out_count)
{
    auto const segment = to_Segment(in_segment);
    if ((segment == nullptr) || (out_count == nullptr))
    {
        return SIGSEG_ERR_INVALID_ARG;
    }

    *out_count = segment->data->size();
    return SIGSEG_STATUS_OK;
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegSegmentGetChannel(sigsegSegment in_segment, size_t in_channel, double const** out_samples, size_t* out_count)
{
    auto const segment = to_Segment(in_segment);
    if ((segment == nullptr) || (out_samples == nullptr) || (out_count == nullptr))
    {
        return SIGSEG_ERR_INVALID_ARG;
    }
    if (in_channel >= segment->data->size())
    {
        return SIGSEG_ERR_OUT_OF_RANGE;
    }

    auto const& samples = (*segment->data)[in_channel];
    *out_samples = samples.data();
    *out_count = samples.size();
    return SIGSEG_STATUS_OK;
}

extern "C"
SIGSEG_EXPORT
sigsegStatus sigsegReleaseSegment(sigsegSegment in_segment)
{
    auto const segment = to_Segment(in_segment);
    if (segment == nullptr)
    {
        return SIGSEG_ERR_INVALID_ARG;
    }

    delete segment;
    return SIGSEG_STATUS_OK;
}
