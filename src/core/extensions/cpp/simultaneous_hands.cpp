// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/extensions/simultaneous_hands.hpp"

#include <backend/extension_gate.hpp>
#include <logging/log.hpp>
#include <oxr_utils/oxr_ext_types.hpp>

namespace xrext::simultaneous_hands
{

bool is_available(const IXrBackend& backend)
{
    return xrext::probe(backend, EXTENSION_NAME);
}

bool is_supported(const IXrBackend& backend, bool with_log)
{
    if (!is_available(backend))
    {
        logging::warn("[SimultaneousHands] XR_META_simultaneous_hands_and_controllers extension is not available");
        return false;
    }

    auto get_properties = resolve<PFN_xrGetSystemProperties>(backend, "xrGetSystemProperties");
    if (!get_properties)
    {
        logging::warn("[SimultaneousHands] xrGetSystemProperties could not be resolved");
        return false;
    }

    SystemSimultaneousHandsAndControllersPropertiesMETA simultaneous_props{
        TYPE_SYSTEM_SIMULTANEOUS_HANDS_AND_CONTROLLERS_PROPERTIES_META, nullptr, XR_FALSE
    };
    XrSystemProperties system_properties{ XR_TYPE_SYSTEM_PROPERTIES };
    system_properties.next = &simultaneous_props;

    XrResult result = (*get_properties)(backend.instance(), backend.system_id(), &system_properties);
    if (result != XR_SUCCESS)
    {
        logging::err("[SimultaneousHands] xrGetSystemProperties failed: " + std::to_string(result));
        return false;
    }

    const bool supported = simultaneous_props.supportsSimultaneousHandsAndControllers != XR_FALSE;
    if (with_log)
    {
        logging::info(supported ? "[SimultaneousHands] Simultaneous hands and controllers tracking is available"
                                : "[SimultaneousHands] Simultaneous hands and controllers tracking is not available");
    }
    return supported;
}

bool resume(const IXrBackend& backend, bool with_log)
{
    if (!is_supported(backend, with_log))
    {
        return false;
    }

    auto resume_fn = resolve<PFN_ResumeSimultaneousHandsAndControllersTrackingMETA>(
        backend, "xrResumeSimultaneousHandsAndControllersTrackingMETA");
    if (!resume_fn)
    {
        logging::warn("[SimultaneousHands] xrResumeSimultaneousHandsAndControllersTrackingMETA could not be resolved");
        return false;
    }

    const SimultaneousHandsAndControllersTrackingResumeInfoMETA resume_info{
        TYPE_SIMULTANEOUS_HANDS_AND_CONTROLLERS_TRACKING_RESUME_INFO_META, nullptr
    };
    XrResult result = (*resume_fn)(backend.session(), &resume_info);
    if (result != XR_SUCCESS)
    {
        if (with_log)
        {
            logging::err("[SimultaneousHands] xrResumeSimultaneousHandsAndControllersTrackingMETA failed: " +
                         std::to_string(result));
        }
        return false;
    }

    if (with_log)
    {
        logging::info("[SimultaneousHands] Simultaneous hands and controllers tracking resumed");
    }
    return true;
}

bool pause(const IXrBackend& backend, bool with_log)
{
    if (!is_supported(backend, with_log))
    {
        return false;
    }

    auto pause_fn = resolve<PFN_PauseSimultaneousHandsAndControllersTrackingMETA>(
        backend, "xrPauseSimultaneousHandsAndControllersTrackingMETA");
    if (!pause_fn)
    {
        logging::warn("[SimultaneousHands] xrPauseSimultaneousHandsAndControllersTrackingMETA could not be resolved");
        return false;
    }

    const SimultaneousHandsAndControllersTrackingPauseInfoMETA pause_info{
        TYPE_SIMULTANEOUS_HANDS_AND_CONTROLLERS_TRACKING_PAUSE_INFO_META, nullptr
    };
    XrResult result = (*pause_fn)(backend.session(), &pause_info);
    if (result != XR_SUCCESS)
    {
        if (with_log)
        {
            logging::err("[SimultaneousHands] xrPauseSimultaneousHandsAndControllersTrackingMETA failed: " +
                         std::to_string(result));
        }
        return false;
    }

    if (with_log)
    {
        logging::info("[SimultaneousHands] Simultaneous hands and controllers tracking paused");
    }
    return true;
}

} // namespace xrext::simultaneous_hands
