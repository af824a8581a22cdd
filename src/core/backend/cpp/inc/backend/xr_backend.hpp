// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <optional>
#include <string>

namespace xrext
{

enum class BackendXRType
{
    None,
    Simulator,
    OpenXR,
    WebXR
};

// Read access to the XR session the process runs on.
// Extension subsystems depend on this surface only, never on a loader or a session object.
class IXrBackend
{
public:
    virtual ~IXrBackend() = default;

    virtual BackendXRType xr_type() const = 0;

    // True once the session exists and the runtime enabled the extension
    virtual bool ext_enabled(const std::string& name) const = 0;

    // Must be called before the session is created, ignored afterwards
    virtual void request_ext(const std::string& name) = 0;

    // Valid only after session creation
    virtual XrInstance instance() const = 0;
    virtual XrSession session() const = 0;
    virtual XrSystemId system_id() const = 0;

    // Raw lookup, nullptr when the runtime does not provide the symbol
    virtual PFN_xrVoidFunction get_proc_addr(const char* name) const = 0;

    // Typed lookup. T must be a function pointer type matching the symbol's signature.
    template <typename T>
    std::optional<T> get_function(const char* name) const
    {
        PFN_xrVoidFunction function = get_proc_addr(name);
        if (!function)
        {
            return std::nullopt;
        }
        return reinterpret_cast<T>(function);
    }
};

} // namespace xrext
