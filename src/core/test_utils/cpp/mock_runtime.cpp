// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/test_utils/mock_runtime.hpp"

#include <algorithm>
#include <cstring>

namespace xrext::test
{

namespace
{

MockRuntimeState g_state;

void count_call(const char* symbol)
{
    ++g_state.calls[symbol];
}

const std::string* path_string(XrPath path)
{
    if (path == XR_NULL_PATH || path > g_state.paths.size())
    {
        return nullptr;
    }
    return &g_state.paths[path - 1];
}

std::pair<std::string, std::string> action_key(const XrActionStateGetInfo* info)
{
    auto it = g_state.actions.find(reinterpret_cast<uint64_t>(info->action));
    const std::string name = it != g_state.actions.end() ? it->second : std::string();
    const std::string* hand = path_string(info->subactionPath);
    return { name, hand ? *hand : std::string() };
}

// Walks a next chain looking for a structure type
template <typename T>
T* find_in_chain(void* next, XrStructureType type)
{
    auto* header = static_cast<XrBaseOutStructure*>(next);
    while (header)
    {
        if (header->type == type)
        {
            return reinterpret_cast<T*>(header);
        }
        header = header->next;
    }
    return nullptr;
}

// --- Core ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrStringToPath(XrInstance instance, const char* pathString, XrPath* path)
{
    count_call("xrStringToPath");
    *path = mock_path(pathString);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL
mock_xrPathToString(XrInstance instance, XrPath path, uint32_t bufferCapacityInput, uint32_t* bufferCountOutput, char* buffer)
{
    count_call("xrPathToString");
    const std::string* text = path_string(path);
    if (!text)
    {
        return XR_ERROR_PATH_INVALID;
    }

    *bufferCountOutput = static_cast<uint32_t>(text->size() + 1);
    if (bufferCapacityInput == 0)
    {
        return XR_SUCCESS;
    }
    if (bufferCapacityInput < *bufferCountOutput)
    {
        return XR_ERROR_SIZE_INSUFFICIENT;
    }
    std::memcpy(buffer, text->c_str(), text->size() + 1);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetSystemProperties(XrInstance instance,
                                                          XrSystemId systemId,
                                                          XrSystemProperties* properties)
{
    count_call("xrGetSystemProperties");
    if (g_state.system_properties_result != XR_SUCCESS)
    {
        return g_state.system_properties_result;
    }

    properties->systemId = systemId;
    properties->vendorId = 0x2833;
    std::strncpy(properties->systemName, "Mock XR System", XR_MAX_SYSTEM_NAME_SIZE - 1);
    properties->graphicsProperties.maxSwapchainImageWidth = 4096;
    properties->graphicsProperties.maxSwapchainImageHeight = 4096;
    properties->graphicsProperties.maxLayerCount = 16;
    properties->trackingProperties.orientationTracking = XR_TRUE;
    properties->trackingProperties.positionTracking = XR_TRUE;

    if (auto* simultaneous = find_in_chain<SystemSimultaneousHandsAndControllersPropertiesMETA>(
            properties->next, TYPE_SYSTEM_SIMULTANEOUS_HANDS_AND_CONTROLLERS_PROPERTIES_META))
    {
        simultaneous->supportsSimultaneousHandsAndControllers = g_state.simultaneous_supported ? XR_TRUE : XR_FALSE;
    }
    if (auto* depth = find_in_chain<SystemDepthTrackingPropertiesANDROID>(
            properties->next, TYPE_SYSTEM_DEPTH_TRACKING_PROPERTIES_ANDROID))
    {
        depth->supportsDepthTracking = g_state.depth_tracking_supported ? XR_TRUE : XR_FALSE;
    }
    return XR_SUCCESS;
}

// --- Actions ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreateActionSet(XrInstance instance,
                                                      const XrActionSetCreateInfo* createInfo,
                                                      XrActionSet* actionSet)
{
    count_call("xrCreateActionSet");
    *actionSet = reinterpret_cast<XrActionSet>(0x10);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrDestroyActionSet(XrActionSet actionSet)
{
    count_call("xrDestroyActionSet");
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreateAction(XrActionSet actionSet,
                                                   const XrActionCreateInfo* createInfo,
                                                   XrAction* action)
{
    count_call("xrCreateAction");
    const uint64_t handle = 0x100 + g_state.actions.size();
    g_state.actions[handle] = createInfo->actionName;
    *action = reinterpret_cast<XrAction>(handle);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrSuggestInteractionProfileBindings(
    XrInstance instance, const XrInteractionProfileSuggestedBinding* suggestedBindings)
{
    count_call("xrSuggestInteractionProfileBindings");
    const std::string* profile = path_string(suggestedBindings->interactionProfile);
    g_state.suggested_profile = profile ? *profile : std::string();
    for (uint32_t i = 0; i < suggestedBindings->countSuggestedBindings; ++i)
    {
        const std::string* binding = path_string(suggestedBindings->suggestedBindings[i].binding);
        if (binding)
        {
            g_state.suggested_bindings.push_back(*binding);
        }
    }
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrAttachSessionActionSets(XrSession session,
                                                              const XrSessionActionSetsAttachInfo* attachInfo)
{
    count_call("xrAttachSessionActionSets");
    g_state.action_sets_attached = true;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrSyncActions(XrSession session, const XrActionsSyncInfo* syncInfo)
{
    count_call("xrSyncActions");
    return g_state.sync_result;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetActionStateBoolean(XrSession session,
                                                            const XrActionStateGetInfo* getInfo,
                                                            XrActionStateBoolean* state)
{
    count_call("xrGetActionStateBoolean");
    auto it = g_state.boolean_states.find(action_key(getInfo));
    state->isActive = it != g_state.boolean_states.end() ? XR_TRUE : XR_FALSE;
    state->currentState = (it != g_state.boolean_states.end() && it->second) ? XR_TRUE : XR_FALSE;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetActionStateFloat(XrSession session,
                                                          const XrActionStateGetInfo* getInfo,
                                                          XrActionStateFloat* state)
{
    count_call("xrGetActionStateFloat");
    auto it = g_state.float_states.find(action_key(getInfo));
    state->isActive = it != g_state.float_states.end() ? XR_TRUE : XR_FALSE;
    state->currentState = it != g_state.float_states.end() ? it->second : 0.0f;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetActionStateVector2f(XrSession session,
                                                             const XrActionStateGetInfo* getInfo,
                                                             XrActionStateVector2f* state)
{
    count_call("xrGetActionStateVector2f");
    auto it = g_state.vector2_states.find(action_key(getInfo));
    state->isActive = it != g_state.vector2_states.end() ? XR_TRUE : XR_FALSE;
    state->currentState = it != g_state.vector2_states.end() ? it->second : XrVector2f{ 0.0f, 0.0f };
    return XR_SUCCESS;
}

// --- XR_FB_display_refresh_rate ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrEnumerateDisplayRefreshRatesFB(XrSession session,
                                                                     uint32_t capacity,
                                                                     uint32_t* count,
                                                                     float* rates)
{
    count_call("xrEnumerateDisplayRefreshRatesFB");
    if (g_state.enumerate_rates_result != XR_SUCCESS)
    {
        return g_state.enumerate_rates_result;
    }
    *count = static_cast<uint32_t>(g_state.supported_rates.size());
    if (capacity == 0)
    {
        return XR_SUCCESS;
    }
    if (capacity < *count)
    {
        return XR_ERROR_SIZE_INSUFFICIENT;
    }
    std::copy(g_state.supported_rates.begin(), g_state.supported_rates.end(), rates);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetDisplayRefreshRateFB(XrSession session, float* rate)
{
    count_call("xrGetDisplayRefreshRateFB");
    if (g_state.get_rate_result != XR_SUCCESS)
    {
        return g_state.get_rate_result;
    }
    *rate = g_state.current_rate;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrRequestDisplayRefreshRateFB(XrSession session, float rate)
{
    count_call("xrRequestDisplayRefreshRateFB");
    g_state.requested_rates.push_back(rate);
    const auto& supported = g_state.supported_rates;
    if (std::find(supported.begin(), supported.end(), rate) == supported.end())
    {
        return XR_ERROR_DISPLAY_REFRESH_RATE_UNSUPPORTED_FB;
    }
    g_state.current_rate = rate;
    return XR_SUCCESS;
}

// --- XR_FB_render_model ---

const MockRenderModel* find_model_by_path(XrPath path)
{
    const std::string* text = path_string(path);
    if (!text)
    {
        return nullptr;
    }
    for (const auto& model : g_state.render_models)
    {
        if (model.path == *text)
        {
            return &model;
        }
    }
    return nullptr;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrEnumerateRenderModelPathsFB(XrSession session,
                                                                  uint32_t capacity,
                                                                  uint32_t* count,
                                                                  XrRenderModelPathInfoFB* paths)
{
    count_call("xrEnumerateRenderModelPathsFB");
    if (g_state.enumerate_paths_result != XR_SUCCESS)
    {
        return g_state.enumerate_paths_result;
    }
    *count = static_cast<uint32_t>(g_state.render_models.size());
    if (capacity == 0)
    {
        return XR_SUCCESS;
    }
    if (capacity < *count)
    {
        return XR_ERROR_SIZE_INSUFFICIENT;
    }
    for (uint32_t i = 0; i < *count; ++i)
    {
        if (paths[i].type != XR_TYPE_RENDER_MODEL_PATH_INFO_FB)
        {
            return XR_ERROR_VALIDATION_FAILURE;
        }
        paths[i].path = mock_path(g_state.render_models[i].path);
    }
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetRenderModelPropertiesFB(XrSession session,
                                                                 XrPath path,
                                                                 XrRenderModelPropertiesFB* properties)
{
    count_call("xrGetRenderModelPropertiesFB");
    if (auto* request = find_in_chain<XrRenderModelCapabilitiesRequestFB>(
            properties->next, XR_TYPE_RENDER_MODEL_CAPABILITIES_REQUEST_FB))
    {
        g_state.capability_request_chained = true;
        g_state.capability_request_flags = request->flags;
    }

    const MockRenderModel* model = find_model_by_path(path);
    if (!model)
    {
        return XR_ERROR_PATH_UNSUPPORTED;
    }
    if (!model->connected)
    {
        properties->modelKey = XR_NULL_RENDER_MODEL_KEY_FB;
        return XR_RENDER_MODEL_UNAVAILABLE_FB;
    }

    properties->vendorId = model->vendor_id;
    std::memset(properties->modelName, 0, XR_MAX_RENDER_MODEL_NAME_SIZE_FB);
    std::strncpy(properties->modelName, model->model_name.c_str(), XR_MAX_RENDER_MODEL_NAME_SIZE_FB - 1);
    properties->modelKey = model->key;
    properties->modelVersion = model->model_version;
    properties->flags = model->flags;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrLoadRenderModelFB(XrSession session,
                                                        const XrRenderModelLoadInfoFB* info,
                                                        XrRenderModelBufferFB* buffer)
{
    count_call("xrLoadRenderModelFB");
    if (g_state.load_result != XR_SUCCESS)
    {
        return g_state.load_result;
    }

    const MockRenderModel* found = nullptr;
    for (const auto& model : g_state.render_models)
    {
        if (model.key == info->modelKey && model.key != XR_NULL_RENDER_MODEL_KEY_FB)
        {
            found = &model;
        }
    }
    if (!found)
    {
        return XR_ERROR_RENDER_MODEL_KEY_INVALID_FB;
    }

    buffer->bufferCountOutput = static_cast<uint32_t>(found->data.size());
    if (buffer->bufferCapacityInput == 0)
    {
        return XR_SUCCESS;
    }
    if (buffer->bufferCapacityInput < buffer->bufferCountOutput)
    {
        return XR_ERROR_SIZE_INSUFFICIENT;
    }
    std::copy(found->data.begin(), found->data.end(), buffer->buffer);
    g_state.loaded_keys.push_back(info->modelKey);
    return XR_SUCCESS;
}

// --- XR_META_simultaneous_hands_and_controllers ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrResumeSimultaneousHandsAndControllersTrackingMETA(
    XrSession session, const SimultaneousHandsAndControllersTrackingResumeInfoMETA* info)
{
    count_call("xrResumeSimultaneousHandsAndControllersTrackingMETA");
    g_state.last_resume_type = info->type;
    if (g_state.resume_result == XR_SUCCESS)
    {
        g_state.tracking_resumed = true;
    }
    return g_state.resume_result;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrPauseSimultaneousHandsAndControllersTrackingMETA(
    XrSession session, const SimultaneousHandsAndControllersTrackingPauseInfoMETA* info)
{
    count_call("xrPauseSimultaneousHandsAndControllersTrackingMETA");
    g_state.last_pause_type = info->type;
    if (g_state.pause_result == XR_SUCCESS)
    {
        g_state.tracking_resumed = false;
    }
    return g_state.pause_result;
}

// --- XR_ANDROID_depth_texture ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrEnumerateDepthResolutionsANDROID(XrSession session,
                                                                       uint32_t capacity,
                                                                       uint32_t* count,
                                                                       DepthResolutionANDROID* resolutions)
{
    count_call("xrEnumerateDepthResolutionsANDROID");
    *count = static_cast<uint32_t>(g_state.depth_resolutions.size());
    if (capacity == 0)
    {
        return XR_SUCCESS;
    }
    if (capacity < *count)
    {
        return XR_ERROR_SIZE_INSUFFICIENT;
    }
    std::copy(g_state.depth_resolutions.begin(), g_state.depth_resolutions.end(), resolutions);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreateDepthTextureANDROID(XrSession session,
                                                                const DepthTextureCreateInfoANDROID* createInfo,
                                                                DepthTextureANDROID* texture)
{
    count_call("xrCreateDepthTextureANDROID");
    if (createInfo->type != TYPE_DEPTH_TEXTURE_CREATE_INFO_ANDROID ||
        createInfo->resolution.type != TYPE_DEPTH_RESOLUTION_INFO_ANDROID)
    {
        return XR_ERROR_VALIDATION_FAILURE;
    }
    g_state.last_texture_info = *createInfo;
    texture->texture = reinterpret_cast<void*>(static_cast<uintptr_t>(0x1000 + ++g_state.next_depth_handle));
    g_state.live_depth_textures.insert(texture->texture);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrDestroyDepthTextureANDROID(XrSession session, const DepthTextureANDROID* texture)
{
    count_call("xrDestroyDepthTextureANDROID");
    if (g_state.live_depth_textures.erase(texture->texture) == 0)
    {
        return XR_ERROR_HANDLE_INVALID;
    }
    return g_state.destroy_texture_result;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrAcquireDepthTextureANDROID(XrSession session,
                                                                 const DepthTextureANDROID* texture,
                                                                 DepthSurfaceInfoANDROID* surfaceInfo)
{
    count_call("xrAcquireDepthTextureANDROID");
    if (g_state.live_depth_textures.count(texture->texture) == 0)
    {
        return XR_ERROR_HANDLE_INVALID;
    }
    surfaceInfo->depthSurface = reinterpret_cast<void*>(0xD00D);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrReleaseDepthTextureANDROID(XrSession session, const DepthTextureANDROID* texture)
{
    count_call("xrReleaseDepthTextureANDROID");
    return g_state.live_depth_textures.count(texture->texture) > 0 ? XR_SUCCESS : XR_ERROR_HANDLE_INVALID;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreateDepthSwapchainANDROID(XrSession session,
                                                                  const DepthSwapchainCreateInfoANDROID* createInfo,
                                                                  XrSwapchain* swapchain)
{
    count_call("xrCreateDepthSwapchainANDROID");
    if (createInfo->type != TYPE_DEPTH_SWAPCHAIN_CREATE_INFO_ANDROID)
    {
        return XR_ERROR_VALIDATION_FAILURE;
    }
    g_state.last_swapchain_info = *createInfo;
    *swapchain = reinterpret_cast<XrSwapchain>(static_cast<uintptr_t>(0x2000 + ++g_state.next_depth_handle));
    g_state.live_depth_swapchains.insert(*swapchain);
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrDestroyDepthSwapchainANDROID(XrSession session, XrSwapchain swapchain)
{
    count_call("xrDestroyDepthSwapchainANDROID");
    return g_state.live_depth_swapchains.erase(swapchain) > 0 ? XR_SUCCESS : XR_ERROR_HANDLE_INVALID;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrEnumerateDepthSwapchainImagesANDROID(XrSwapchain swapchain,
                                                                           uint32_t capacity,
                                                                           uint32_t* count,
                                                                           DepthSwapchainImageANDROID* images)
{
    count_call("xrEnumerateDepthSwapchainImagesANDROID");
    if (g_state.live_depth_swapchains.count(swapchain) == 0)
    {
        return XR_ERROR_HANDLE_INVALID;
    }
    *count = g_state.depth_image_count;
    if (capacity == 0)
    {
        return XR_SUCCESS;
    }
    if (capacity < *count)
    {
        return XR_ERROR_SIZE_INSUFFICIENT;
    }

    const DepthSwapchainCreateFlagsANDROID flags = g_state.last_swapchain_info.createFlags;
    for (uint32_t i = 0; i < *count; ++i)
    {
        if (images[i].type != TYPE_DEPTH_SWAPCHAIN_IMAGE_ANDROID)
        {
            return XR_ERROR_VALIDATION_FAILURE;
        }
        images[i].rawDepthImage =
            (flags & DEPTH_SWAPCHAIN_CREATE_RAW_DEPTH_IMAGE_BIT_ANDROID) ? g_state.depth_pixels.data() : nullptr;
        images[i].rawDepthConfidenceImage = (flags & DEPTH_SWAPCHAIN_CREATE_RAW_CONFIDENCE_IMAGE_BIT_ANDROID) ?
                                                g_state.confidence_pixels.data() :
                                                nullptr;
        images[i].smoothDepthImage =
            (flags & DEPTH_SWAPCHAIN_CREATE_SMOOTH_DEPTH_IMAGE_BIT_ANDROID) ? g_state.depth_pixels.data() : nullptr;
        images[i].smoothDepthConfidenceImage = (flags & DEPTH_SWAPCHAIN_CREATE_SMOOTH_CONFIDENCE_IMAGE_BIT_ANDROID) ?
                                                   g_state.confidence_pixels.data() :
                                                   nullptr;
    }
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrAcquireDepthSwapchainImagesANDROID(XrSession session,
                                                                         XrSwapchain swapchain,
                                                                         uint32_t* index)
{
    count_call("xrAcquireDepthSwapchainImagesANDROID");
    if (g_state.live_depth_swapchains.count(swapchain) == 0)
    {
        return XR_ERROR_HANDLE_INVALID;
    }
    *index = g_state.next_image_index++ % std::max<uint32_t>(g_state.depth_image_count, 1);
    return XR_SUCCESS;
}

template <typename F>
PFN_xrVoidFunction as_void(F function)
{
    return reinterpret_cast<PFN_xrVoidFunction>(function);
}

} // anonymous namespace

MockRuntimeState& mock_state()
{
    return g_state;
}

void reset_mock_runtime()
{
    g_state = MockRuntimeState{};
}

int call_count(const std::string& symbol)
{
    auto it = g_state.calls.find(symbol);
    return it != g_state.calls.end() ? it->second : 0;
}

int total_calls()
{
    int total = 0;
    for (const auto& entry : g_state.calls)
    {
        total += entry.second;
    }
    return total;
}

XrPath mock_path(const std::string& path)
{
    auto it = std::find(g_state.paths.begin(), g_state.paths.end(), path);
    if (it != g_state.paths.end())
    {
        return static_cast<XrPath>(it - g_state.paths.begin()) + 1;
    }
    g_state.paths.push_back(path);
    return static_cast<XrPath>(g_state.paths.size());
}

MockRenderModel& add_mock_render_model(const std::string& path, const std::string& model_name)
{
    MockRenderModel model;
    model.path = path;
    model.model_name = model_name;
    model.key = static_cast<XrRenderModelKeyFB>(100 + g_state.render_models.size());
    model.data = { 'g', 'l', 'T', 'F', 2, 0, 0, 0 };
    g_state.render_models.push_back(model);
    return g_state.render_models.back();
}

PFN_xrVoidFunction mock_proc_addr(const char* name)
{
    static const std::map<std::string, PFN_xrVoidFunction> table = {
        { "xrStringToPath", as_void(&mock_xrStringToPath) },
        { "xrPathToString", as_void(&mock_xrPathToString) },
        { "xrGetSystemProperties", as_void(&mock_xrGetSystemProperties) },
        { "xrCreateActionSet", as_void(&mock_xrCreateActionSet) },
        { "xrDestroyActionSet", as_void(&mock_xrDestroyActionSet) },
        { "xrCreateAction", as_void(&mock_xrCreateAction) },
        { "xrSuggestInteractionProfileBindings", as_void(&mock_xrSuggestInteractionProfileBindings) },
        { "xrAttachSessionActionSets", as_void(&mock_xrAttachSessionActionSets) },
        { "xrSyncActions", as_void(&mock_xrSyncActions) },
        { "xrGetActionStateBoolean", as_void(&mock_xrGetActionStateBoolean) },
        { "xrGetActionStateFloat", as_void(&mock_xrGetActionStateFloat) },
        { "xrGetActionStateVector2f", as_void(&mock_xrGetActionStateVector2f) },
        { "xrEnumerateDisplayRefreshRatesFB", as_void(&mock_xrEnumerateDisplayRefreshRatesFB) },
        { "xrGetDisplayRefreshRateFB", as_void(&mock_xrGetDisplayRefreshRateFB) },
        { "xrRequestDisplayRefreshRateFB", as_void(&mock_xrRequestDisplayRefreshRateFB) },
        { "xrEnumerateRenderModelPathsFB", as_void(&mock_xrEnumerateRenderModelPathsFB) },
        { "xrGetRenderModelPropertiesFB", as_void(&mock_xrGetRenderModelPropertiesFB) },
        { "xrLoadRenderModelFB", as_void(&mock_xrLoadRenderModelFB) },
        { "xrResumeSimultaneousHandsAndControllersTrackingMETA",
          as_void(&mock_xrResumeSimultaneousHandsAndControllersTrackingMETA) },
        { "xrPauseSimultaneousHandsAndControllersTrackingMETA",
          as_void(&mock_xrPauseSimultaneousHandsAndControllersTrackingMETA) },
        { "xrEnumerateDepthResolutionsANDROID", as_void(&mock_xrEnumerateDepthResolutionsANDROID) },
        { "xrCreateDepthTextureANDROID", as_void(&mock_xrCreateDepthTextureANDROID) },
        { "xrDestroyDepthTextureANDROID", as_void(&mock_xrDestroyDepthTextureANDROID) },
        { "xrAcquireDepthTextureANDROID", as_void(&mock_xrAcquireDepthTextureANDROID) },
        { "xrReleaseDepthTextureANDROID", as_void(&mock_xrReleaseDepthTextureANDROID) },
        { "xrCreateDepthSwapchainANDROID", as_void(&mock_xrCreateDepthSwapchainANDROID) },
        { "xrDestroyDepthSwapchainANDROID", as_void(&mock_xrDestroyDepthSwapchainANDROID) },
        { "xrEnumerateDepthSwapchainImagesANDROID", as_void(&mock_xrEnumerateDepthSwapchainImagesANDROID) },
        { "xrAcquireDepthSwapchainImagesANDROID", as_void(&mock_xrAcquireDepthSwapchainImagesANDROID) },
    };

    auto it = table.find(name);
    return it != table.end() ? it->second : nullptr;
}

} // namespace xrext::test
