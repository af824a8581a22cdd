// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <backend/openxr_backend.hpp>
#include <openxr/openxr.h>
#include <oxr_utils/oxr_session_handles.hpp>

#include <memory>
#include <string>
#include <vector>

namespace xrext
{

// OpenXR session management - creates and manages a headless OpenXR session.
// The instance enables every extension requested on the backend that the runtime offers,
// and the backend stays attached for the lifetime of the session.
class OpenXRSession
{
public:
    ~OpenXRSession();

    // Static factory method - throws std::runtime_error on failure
    static std::shared_ptr<OpenXRSession> Create(const std::string& app_name, OpenXRBackend& backend);

    // Get session handles for use with the extension subsystems
    OpenXRSessionHandles get_handles() const;

    // Extensions the instance was created with
    const std::vector<std::string>& enabled_extensions() const
    {
        return enabled_extensions_;
    }

    // Available instance extensions reported by the loader
    static std::vector<std::string> enumerate_instance_extensions();

private:
    // Private constructor - use Create() instead
    explicit OpenXRSession(OpenXRBackend& backend);

    // Initialization methods
    void create_instance(const std::string& app_name, const std::vector<std::string>& requested);
    void create_system();
    void create_session();
    void create_reference_space();
    void begin();

    OpenXRBackend& backend_;
    std::vector<std::string> enabled_extensions_;
    bool headless_ = false;

    XrInstance instance_;
    XrSystemId system_id_;
    XrSession session_;
    XrSpace space_;
};

} // namespace xrext
