// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace xrext
{

// Error carrying the XrResult of the failed runtime call
class XrError : public std::runtime_error
{
public:
    XrError(const std::string& call, XrResult result)
        : std::runtime_error(call + " failed: " + std::to_string(result)), result_(result)
    {
    }

    XrResult result() const noexcept
    {
        return result_;
    }

private:
    XrResult result_;
};

// Anything but XR_SUCCESS is a failure at this layer, qualified success codes included
inline void check_xr_result(XrResult result, const char* call)
{
    if (result != XR_SUCCESS)
    {
        throw XrError(call, result);
    }
}

/**
 * @brief Two-call idiom used by every xrEnumerate* style entry point.
 *
 * @p enumerate is invoked as enumerate(capacity_input, &count_output, buffer). The first call
 * queries the size with a null buffer; when the size is zero no fill call is issued. Every
 * element is initialized from @p prototype before the fill call so structure types are set.
 *
 * @return XR_SUCCESS, or the first non-success status (out is left empty in that case).
 */
template <typename T, typename EnumerateFn>
XrResult enumerate_two_call(EnumerateFn&& enumerate, std::vector<T>& out, const T& prototype = T{})
{
    out.clear();

    uint32_t count = 0;
    XrResult result = enumerate(0u, &count, static_cast<T*>(nullptr));
    if (result != XR_SUCCESS)
    {
        return result;
    }
    if (count == 0)
    {
        return XR_SUCCESS;
    }

    out.assign(count, prototype);
    result = enumerate(count, &count, out.data());
    if (result != XR_SUCCESS)
    {
        out.clear();
        return result;
    }

    out.resize(std::min<size_t>(count, out.size()), prototype);
    return XR_SUCCESS;
}

} // namespace xrext
