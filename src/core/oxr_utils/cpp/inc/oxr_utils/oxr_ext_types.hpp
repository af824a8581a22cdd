// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "oxr_funcs.hpp"

#include <cstdint>

// Structure layouts and entry point signatures for extensions that older openxr.h
// releases do not ship. They live in the xrext namespace so they never clash with
// the registry definitions when a newer header does carry them.

namespace xrext
{

// ============================================================================
// XR_META_simultaneous_hands_and_controllers
// ============================================================================

constexpr const char* XR_META_SIMULTANEOUS_HANDS_AND_CONTROLLERS_NAME = "XR_META_simultaneous_hands_and_controllers";

constexpr XrStructureType TYPE_SYSTEM_SIMULTANEOUS_HANDS_AND_CONTROLLERS_PROPERTIES_META =
    static_cast<XrStructureType>(1000532001);
constexpr XrStructureType TYPE_SIMULTANEOUS_HANDS_AND_CONTROLLERS_TRACKING_RESUME_INFO_META =
    static_cast<XrStructureType>(1000532002);
constexpr XrStructureType TYPE_SIMULTANEOUS_HANDS_AND_CONTROLLERS_TRACKING_PAUSE_INFO_META =
    static_cast<XrStructureType>(1000532003);

static_assert(TYPE_SYSTEM_SIMULTANEOUS_HANDS_AND_CONTROLLERS_PROPERTIES_META == 1000532001);
static_assert(TYPE_SIMULTANEOUS_HANDS_AND_CONTROLLERS_TRACKING_RESUME_INFO_META == 1000532002);
static_assert(TYPE_SIMULTANEOUS_HANDS_AND_CONTROLLERS_TRACKING_PAUSE_INFO_META == 1000532003);

struct SystemSimultaneousHandsAndControllersPropertiesMETA
{
    XrStructureType type;
    void* next;
    XrBool32 supportsSimultaneousHandsAndControllers;
};

struct SimultaneousHandsAndControllersTrackingResumeInfoMETA
{
    XrStructureType type;
    const void* next;
};

struct SimultaneousHandsAndControllersTrackingPauseInfoMETA
{
    XrStructureType type;
    const void* next;
};

using PFN_ResumeSimultaneousHandsAndControllersTrackingMETA =
    XrResult(XRAPI_PTR*)(XrSession session, const SimultaneousHandsAndControllersTrackingResumeInfoMETA* resumeInfo);
using PFN_PauseSimultaneousHandsAndControllersTrackingMETA =
    XrResult(XRAPI_PTR*)(XrSession session, const SimultaneousHandsAndControllersTrackingPauseInfoMETA* pauseInfo);

// ============================================================================
// XR_ANDROID_depth_texture
// ============================================================================

constexpr const char* XR_ANDROID_DEPTH_TEXTURE_NAME = "XR_ANDROID_depth_texture";

constexpr XrStructureType TYPE_DEPTH_RESOLUTION_INFO_ANDROID = static_cast<XrStructureType>(1000343000);
constexpr XrStructureType TYPE_DEPTH_SURFACE_INFO_ANDROID = static_cast<XrStructureType>(1000343001);
constexpr XrStructureType TYPE_DEPTH_TEXTURE_CREATE_INFO_ANDROID = static_cast<XrStructureType>(1000343002);
constexpr XrStructureType TYPE_DEPTH_TEXTURE_ANDROID = static_cast<XrStructureType>(1000343003);
constexpr XrStructureType TYPE_DEPTH_SWAPCHAIN_CREATE_INFO_ANDROID = static_cast<XrStructureType>(1000343004);
constexpr XrStructureType TYPE_DEPTH_SWAPCHAIN_IMAGE_ANDROID = static_cast<XrStructureType>(1000343005);
constexpr XrStructureType TYPE_SYSTEM_DEPTH_TRACKING_PROPERTIES_ANDROID = static_cast<XrStructureType>(1000343006);

static_assert(TYPE_DEPTH_RESOLUTION_INFO_ANDROID == 1000343000);
static_assert(TYPE_DEPTH_SURFACE_INFO_ANDROID == 1000343001);
static_assert(TYPE_DEPTH_TEXTURE_CREATE_INFO_ANDROID == 1000343002);
static_assert(TYPE_DEPTH_TEXTURE_ANDROID == 1000343003);
static_assert(TYPE_DEPTH_SWAPCHAIN_CREATE_INFO_ANDROID == 1000343004);
static_assert(TYPE_DEPTH_SWAPCHAIN_IMAGE_ANDROID == 1000343005);
static_assert(TYPE_SYSTEM_DEPTH_TRACKING_PROPERTIES_ANDROID == 1000343006);

using DepthResolutionANDROID = uint32_t;
constexpr DepthResolutionANDROID DEPTH_RESOLUTION_QUARTER_ANDROID = 1;
constexpr DepthResolutionANDROID DEPTH_RESOLUTION_HALF_ANDROID = 2;
constexpr DepthResolutionANDROID DEPTH_RESOLUTION_FULL_ANDROID = 3;

using DepthSwapchainCreateFlagsANDROID = uint64_t;
constexpr DepthSwapchainCreateFlagsANDROID DEPTH_SWAPCHAIN_CREATE_SMOOTH_DEPTH_IMAGE_BIT_ANDROID = 0x00000001;
constexpr DepthSwapchainCreateFlagsANDROID DEPTH_SWAPCHAIN_CREATE_SMOOTH_CONFIDENCE_IMAGE_BIT_ANDROID = 0x00000002;
constexpr DepthSwapchainCreateFlagsANDROID DEPTH_SWAPCHAIN_CREATE_RAW_DEPTH_IMAGE_BIT_ANDROID = 0x00000004;
constexpr DepthSwapchainCreateFlagsANDROID DEPTH_SWAPCHAIN_CREATE_RAW_CONFIDENCE_IMAGE_BIT_ANDROID = 0x00000008;

using SurfaceOriginANDROID = uint32_t;
constexpr SurfaceOriginANDROID SURFACE_ORIGIN_TOP_LEFT_ANDROID = 0;
constexpr SurfaceOriginANDROID SURFACE_ORIGIN_BOTTOM_LEFT_ANDROID = 1;

struct DepthResolutionInfoANDROID
{
    XrStructureType type;
    const void* next;
    uint32_t width;
    uint32_t height;
};

struct DepthSurfaceInfoANDROID
{
    XrStructureType type;
    const void* next;
    void* depthSurface;
};

struct DepthTextureCreateInfoANDROID
{
    XrStructureType type;
    const void* next;
    DepthResolutionInfoANDROID resolution;
    SurfaceOriginANDROID surfaceOrigin;
};

struct DepthTextureANDROID
{
    XrStructureType type;
    const void* next;
    void* texture;
};

struct DepthSwapchainCreateInfoANDROID
{
    XrStructureType type;
    const void* next;
    DepthResolutionANDROID resolution;
    DepthSwapchainCreateFlagsANDROID createFlags;
};

struct DepthSwapchainImageANDROID
{
    XrStructureType type;
    void* next;
    const float* rawDepthImage;
    const uint8_t* rawDepthConfidenceImage;
    const float* smoothDepthImage;
    const uint8_t* smoothDepthConfidenceImage;
};

struct SystemDepthTrackingPropertiesANDROID
{
    XrStructureType type;
    void* next;
    XrBool32 supportsDepthTracking;
};

using PFN_EnumerateDepthResolutionsANDROID = XrResult(XRAPI_PTR*)(XrSession session,
                                                                  uint32_t resolutionCapacityInput,
                                                                  uint32_t* resolutionCountOutput,
                                                                  DepthResolutionANDROID* resolutions);
using PFN_CreateDepthTextureANDROID = XrResult(XRAPI_PTR*)(XrSession session,
                                                           const DepthTextureCreateInfoANDROID* createInfo,
                                                           DepthTextureANDROID* texture);
using PFN_DestroyDepthTextureANDROID = XrResult(XRAPI_PTR*)(XrSession session, const DepthTextureANDROID* texture);
using PFN_AcquireDepthTextureANDROID = XrResult(XRAPI_PTR*)(XrSession session,
                                                            const DepthTextureANDROID* texture,
                                                            DepthSurfaceInfoANDROID* surfaceInfo);
using PFN_ReleaseDepthTextureANDROID = XrResult(XRAPI_PTR*)(XrSession session, const DepthTextureANDROID* texture);
using PFN_CreateDepthSwapchainANDROID = XrResult(XRAPI_PTR*)(XrSession session,
                                                             const DepthSwapchainCreateInfoANDROID* createInfo,
                                                             XrSwapchain* swapchain);
using PFN_DestroyDepthSwapchainANDROID = XrResult(XRAPI_PTR*)(XrSession session, XrSwapchain swapchain);
using PFN_EnumerateDepthSwapchainImagesANDROID = XrResult(XRAPI_PTR*)(XrSwapchain swapchain,
                                                                      uint32_t imageCapacityInput,
                                                                      uint32_t* imageCountOutput,
                                                                      DepthSwapchainImageANDROID* images);
using PFN_AcquireDepthSwapchainImageANDROID = XrResult(XRAPI_PTR*)(XrSession session,
                                                                   XrSwapchain swapchain,
                                                                   uint32_t* index);

} // namespace xrext
