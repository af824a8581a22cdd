// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/backend/openxr_backend.hpp"

#include <logging/log.hpp>
#include <oxr_utils/oxr_funcs.hpp>

#include <algorithm>

namespace xrext
{

BackendXRType OpenXRBackend::xr_type() const
{
    return attached_ ? BackendXRType::OpenXR : BackendXRType::None;
}

bool OpenXRBackend::ext_enabled(const std::string& name) const
{
    return attached_ && enabled_.count(name) > 0;
}

void OpenXRBackend::request_ext(const std::string& name)
{
    if (attached_)
    {
        logging::warn("[OpenXRBackend] request_ext(" + name + ") after session creation is ignored");
        return;
    }

    if (std::find(requested_.begin(), requested_.end(), name) == requested_.end())
    {
        requested_.push_back(name);
    }
}

XrInstance OpenXRBackend::instance() const
{
    return handles_.instance;
}

XrSession OpenXRBackend::session() const
{
    return handles_.session;
}

XrSystemId OpenXRBackend::system_id() const
{
    return handles_.system_id;
}

PFN_xrVoidFunction OpenXRBackend::get_proc_addr(const char* name) const
{
    if (!attached_)
    {
        return nullptr;
    }

    PFN_xrVoidFunction function = nullptr;
    XrResult result = loadExtensionFunction(handles_.instance, handles_.xrGetInstanceProcAddr, name, &function);
    if (XR_FAILED(result))
    {
        logging::diag(std::string("[OpenXRBackend] xrGetInstanceProcAddr(") + name + ") failed: " +
                      std::to_string(result));
    }
    return function;
}

void OpenXRBackend::attach(const OpenXRSessionHandles& handles, const std::vector<std::string>& enabled)
{
    handles_ = handles;
    enabled_ = std::set<std::string>(enabled.begin(), enabled.end());
    attached_ = true;
}

void OpenXRBackend::detach()
{
    handles_ = OpenXRSessionHandles();
    enabled_.clear();
    attached_ = false;
}

} // namespace xrext
