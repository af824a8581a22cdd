// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "xr_backend.hpp"

#include <oxr_utils/oxr_session_handles.hpp>

#include <set>
#include <string>
#include <vector>

namespace xrext
{

// IXrBackend over a set of session handles.
// Collects extension requests until a session is attached, then answers from the handles.
class OpenXRBackend : public IXrBackend
{
public:
    OpenXRBackend() = default;

    BackendXRType xr_type() const override;
    bool ext_enabled(const std::string& name) const override;
    void request_ext(const std::string& name) override;

    XrInstance instance() const override;
    XrSession session() const override;
    XrSystemId system_id() const override;

    PFN_xrVoidFunction get_proc_addr(const char* name) const override;

    // Extensions requested so far, in request order
    const std::vector<std::string>& requested_extensions() const
    {
        return requested_;
    }

    bool is_attached() const
    {
        return attached_;
    }

    // Bind to a live session. enabled lists the extensions the instance was created with.
    void attach(const OpenXRSessionHandles& handles, const std::vector<std::string>& enabled);

    // Forget the session, all handles read as null afterwards
    void detach();

private:
    std::vector<std::string> requested_;
    std::set<std::string> enabled_;
    OpenXRSessionHandles handles_;
    bool attached_ = false;
};

} // namespace xrext
