// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/oxr/oxr_session.hpp"

#include <logging/log.hpp>
#include <oxr_utils/oxr_enumerate.hpp>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace xrext
{

namespace
{

constexpr const char* HEADLESS_EXTENSION_NAME = "XR_MND_headless";

} // anonymous namespace

OpenXRSession::OpenXRSession(OpenXRBackend& backend)
    : backend_(backend),
      instance_(XR_NULL_HANDLE),
      system_id_(XR_NULL_SYSTEM_ID),
      session_(XR_NULL_HANDLE),
      space_(XR_NULL_HANDLE)
{
}

OpenXRSession::~OpenXRSession()
{
    // Subsystems read handles through the backend, make sure none outlive the session
    backend_.detach();

    // RAII cleanup
    if (space_ != XR_NULL_HANDLE)
    {
        xrDestroySpace(space_);
        space_ = XR_NULL_HANDLE;
    }

    if (session_ != XR_NULL_HANDLE)
    {
        xrDestroySession(session_);
        session_ = XR_NULL_HANDLE;
    }

    if (instance_ != XR_NULL_HANDLE)
    {
        xrDestroyInstance(instance_);
        instance_ = XR_NULL_HANDLE;
    }
}

std::shared_ptr<OpenXRSession> OpenXRSession::Create(const std::string& app_name, OpenXRBackend& backend)
{
    if (backend.is_attached())
    {
        throw std::runtime_error("OpenXRSession: backend is already attached to a session");
    }

    auto session = std::shared_ptr<OpenXRSession>(new OpenXRSession(backend));

    // These methods throw on failure, no need to check return values
    session->create_instance(app_name, backend.requested_extensions());
    session->create_system();
    session->create_session();
    session->create_reference_space();
    session->begin();

    backend.attach(session->get_handles(), session->enabled_extensions_);

    return session;
}

OpenXRSessionHandles OpenXRSession::get_handles() const
{
    // Pass the global xrGetInstanceProcAddr - oxr_session links against OpenXR loader
    return OpenXRSessionHandles(instance_, system_id_, session_, space_, ::xrGetInstanceProcAddr);
}

std::vector<std::string> OpenXRSession::enumerate_instance_extensions()
{
    std::vector<XrExtensionProperties> properties;
    XrResult result = enumerate_two_call(
        [](uint32_t capacity, uint32_t* count, XrExtensionProperties* out)
        { return xrEnumerateInstanceExtensionProperties(nullptr, capacity, count, out); },
        properties, XrExtensionProperties{ XR_TYPE_EXTENSION_PROPERTIES });
    if (result != XR_SUCCESS)
    {
        throw std::runtime_error("Failed to enumerate instance extensions: " + std::to_string(result));
    }

    std::vector<std::string> names;
    names.reserve(properties.size());
    for (const auto& property : properties)
    {
        names.emplace_back(property.extensionName);
    }
    return names;
}

void OpenXRSession::create_instance(const std::string& app_name, const std::vector<std::string>& requested)
{
    const std::vector<std::string> available = enumerate_instance_extensions();
    auto is_available = [&available](const std::string& name)
    { return std::find(available.begin(), available.end(), name) != available.end(); };

    // Enable what was requested and what the runtime offers, warn about the rest
    enabled_extensions_.clear();
    for (const auto& name : requested)
    {
        if (is_available(name))
        {
            enabled_extensions_.push_back(name);
        }
        else
        {
            logging::warn("[OpenXRSession] Requested extension " + name + " is not offered by the runtime");
        }
    }

    // Run headless when the runtime allows it, no graphics binding is provided
    if (is_available(HEADLESS_EXTENSION_NAME) &&
        std::find(enabled_extensions_.begin(), enabled_extensions_.end(), HEADLESS_EXTENSION_NAME) ==
            enabled_extensions_.end())
    {
        enabled_extensions_.push_back(HEADLESS_EXTENSION_NAME);
    }
    headless_ = std::find(enabled_extensions_.begin(), enabled_extensions_.end(), HEADLESS_EXTENSION_NAME) !=
                enabled_extensions_.end();

    XrInstanceCreateInfo create_info{ XR_TYPE_INSTANCE_CREATE_INFO };
    create_info.applicationInfo.apiVersion = XR_CURRENT_API_VERSION;
    strncpy(create_info.applicationInfo.applicationName, app_name.c_str(), XR_MAX_APPLICATION_NAME_SIZE - 1);
    strncpy(create_info.applicationInfo.engineName, "xrext", XR_MAX_ENGINE_NAME_SIZE - 1);

    // Convert vector<string> to array of const char* for OpenXR API
    std::vector<const char*> extension_ptrs;
    for (const auto& ext : enabled_extensions_)
    {
        extension_ptrs.push_back(ext.c_str());
    }

    create_info.enabledExtensionCount = static_cast<uint32_t>(extension_ptrs.size());
    create_info.enabledExtensionNames = extension_ptrs.empty() ? nullptr : extension_ptrs.data();

    XrResult result = xrCreateInstance(&create_info, &instance_);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create OpenXR instance: " + std::to_string(result));
    }

    logging::info("Created OpenXR instance with " + std::to_string(enabled_extensions_.size()) + " extension(s)");
    for (const auto& ext : enabled_extensions_)
    {
        logging::diag("  enabled: " + ext);
    }
}

void OpenXRSession::create_system()
{
    XrSystemGetInfo system_info{ XR_TYPE_SYSTEM_GET_INFO };
    system_info.formFactor = XR_FORM_FACTOR_HEAD_MOUNTED_DISPLAY;

    XrResult result = xrGetSystem(instance_, &system_info, &system_id_);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to get OpenXR system: " + std::to_string(result));
    }

    logging::info("Created OpenXR system");
}

void OpenXRSession::create_session()
{
    XrSessionCreateInfo create_info{ XR_TYPE_SESSION_CREATE_INFO };
    create_info.systemId = system_id_;

    XrResult result = xrCreateSession(instance_, &create_info, &session_);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create OpenXR session: " + std::to_string(result));
    }

    logging::info(headless_ ? "Created OpenXR session (headless mode)" : "Created OpenXR session");
}

void OpenXRSession::create_reference_space()
{
    XrReferenceSpaceCreateInfo create_info{ XR_TYPE_REFERENCE_SPACE_CREATE_INFO };
    create_info.referenceSpaceType = XR_REFERENCE_SPACE_TYPE_STAGE;
    create_info.poseInReferenceSpace.orientation.w = 1.0f;

    XrResult result = xrCreateReferenceSpace(session_, &create_info, &space_);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create reference space: " + std::to_string(result));
    }

    logging::diag("Created reference space");
}

void OpenXRSession::begin()
{
    // Enumerate view configurations to find a valid one
    std::vector<XrViewConfigurationType> view_configs;
    XrResult result = enumerate_two_call(
        [this](uint32_t capacity, uint32_t* count, XrViewConfigurationType* out)
        { return xrEnumerateViewConfigurations(instance_, system_id_, capacity, count, out); },
        view_configs, XR_VIEW_CONFIGURATION_TYPE_PRIMARY_STEREO);
    if (result != XR_SUCCESS || view_configs.empty())
    {
        throw std::runtime_error("Failed to enumerate view configurations: " + std::to_string(result));
    }

    // Find the primary stereo view configuration (preferred), or use the first available
    XrViewConfigurationType selected_view_config = view_configs[0];
    for (const auto& config : view_configs)
    {
        if (config == XR_VIEW_CONFIGURATION_TYPE_PRIMARY_STEREO)
        {
            selected_view_config = config;
            break;
        }
    }

    XrSessionBeginInfo begin_info{ XR_TYPE_SESSION_BEGIN_INFO };
    begin_info.primaryViewConfigurationType = selected_view_config;

    result = xrBeginSession(session_, &begin_info);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to begin OpenXR session: " + std::to_string(result));
    }
}

} // namespace xrext
