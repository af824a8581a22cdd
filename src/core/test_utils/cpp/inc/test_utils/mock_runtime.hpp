// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>
#include <oxr_utils/oxr_ext_types.hpp>

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

// In-process fake of the OpenXR entry points used by the extension layer.
// Functions are served by name through mock_proc_addr; state is global and reset per test.

namespace xrext::test
{

inline const XrInstance MOCK_INSTANCE = reinterpret_cast<XrInstance>(0x1);
inline const XrSession MOCK_SESSION = reinterpret_cast<XrSession>(0x2);
inline const XrSpace MOCK_SPACE = reinterpret_cast<XrSpace>(0x3);
constexpr XrSystemId MOCK_SYSTEM_ID = 1;

struct MockRenderModel
{
    std::string path;
    // Properties report XR_RENDER_MODEL_UNAVAILABLE_FB when false
    bool connected = true;
    uint32_t vendor_id = 0x2833;
    std::string model_name;
    uint32_t model_version = 1;
    XrRenderModelFlagsFB flags = 0;
    XrRenderModelKeyFB key = XR_NULL_RENDER_MODEL_KEY_FB;
    std::vector<uint8_t> data;
};

struct MockRuntimeState
{
    std::map<std::string, int> calls;

    // XR_FB_display_refresh_rate
    std::vector<float> supported_rates{ 72.0f, 90.0f, 120.0f };
    float current_rate = 72.0f;
    XrResult enumerate_rates_result = XR_SUCCESS;
    XrResult get_rate_result = XR_SUCCESS;
    std::vector<float> requested_rates;

    // Paths, XrPath is index + 1
    std::vector<std::string> paths;

    // XR_FB_render_model
    std::vector<MockRenderModel> render_models;
    XrResult enumerate_paths_result = XR_SUCCESS;
    XrResult load_result = XR_SUCCESS;
    bool capability_request_chained = false;
    XrRenderModelFlagsFB capability_request_flags = 0;
    std::vector<XrRenderModelKeyFB> loaded_keys;

    // xrGetSystemProperties
    XrResult system_properties_result = XR_SUCCESS;
    bool simultaneous_supported = true;
    bool depth_tracking_supported = true;

    // XR_META_simultaneous_hands_and_controllers
    XrResult resume_result = XR_SUCCESS;
    XrResult pause_result = XR_SUCCESS;
    XrStructureType last_resume_type = XR_TYPE_UNKNOWN;
    XrStructureType last_pause_type = XR_TYPE_UNKNOWN;
    bool tracking_resumed = false;

    // XR_ANDROID_depth_texture
    std::vector<DepthResolutionANDROID> depth_resolutions{ DEPTH_RESOLUTION_QUARTER_ANDROID,
                                                           DEPTH_RESOLUTION_HALF_ANDROID,
                                                           DEPTH_RESOLUTION_FULL_ANDROID };
    uint32_t depth_image_count = 3;
    std::set<void*> live_depth_textures;
    std::set<XrSwapchain> live_depth_swapchains;
    DepthSwapchainCreateInfoANDROID last_swapchain_info{};
    DepthTextureCreateInfoANDROID last_texture_info{};
    uint32_t next_depth_handle = 0;
    uint32_t next_image_index = 0;
    XrResult destroy_texture_result = XR_SUCCESS;
    std::vector<float> depth_pixels = std::vector<float>(16, 1.5f);
    std::vector<uint8_t> confidence_pixels = std::vector<uint8_t>(16, 200);

    // Actions, keyed by (action name, subaction path)
    std::map<uint64_t, std::string> actions;
    std::map<std::pair<std::string, std::string>, bool> boolean_states;
    std::map<std::pair<std::string, std::string>, float> float_states;
    std::map<std::pair<std::string, std::string>, XrVector2f> vector2_states;
    std::vector<std::string> suggested_bindings;
    std::string suggested_profile;
    XrResult sync_result = XR_SUCCESS;
    bool action_sets_attached = false;

    // Loader-level entry points, see mock_loader.cpp
    std::vector<std::string> instance_extensions{ "XR_MND_headless", "XR_FB_display_refresh_rate",
                                                  "XR_FB_render_model" };
    std::vector<std::string> created_with_extensions;
    bool instance_alive = false;
    bool session_alive = false;
    bool session_begun = false;
};

MockRuntimeState& mock_state();

// Back to defaults, call counts cleared
void reset_mock_runtime();

int call_count(const std::string& symbol);
int total_calls();

// nullptr for symbols the mock does not implement
PFN_xrVoidFunction mock_proc_addr(const char* name);

XrPath mock_path(const std::string& path);

// Adds a model bound to path with a non-null key and small glTF payload
MockRenderModel& add_mock_render_model(const std::string& path, const std::string& model_name);

} // namespace xrext::test
