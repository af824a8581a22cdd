// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/extensions/depth_texture.hpp"

#include <backend/extension_gate.hpp>
#include <logging/log.hpp>

namespace xrext
{

namespace
{

const char* bool_text(XrBool32 value)
{
    return value != XR_FALSE ? "true" : "false";
}

} // anonymous namespace

bool is_android_depth_texture_extension_available(const IXrBackend& backend)
{
    return probe(backend, XR_ANDROID_DEPTH_TEXTURE_NAME);
}

std::pair<uint32_t, uint32_t> resolution_dimensions(DepthResolutionANDROID resolution)
{
    switch (resolution)
    {
    case DEPTH_RESOLUTION_QUARTER_ANDROID:
        return { 640, 480 };
    case DEPTH_RESOLUTION_HALF_ANDROID:
        return { 1280, 960 };
    case DEPTH_RESOLUTION_FULL_ANDROID:
        return { 2560, 1920 };
    default:
        return { 0, 0 };
    }
}

DepthTextureCreateInfoANDROID make_depth_texture_create_info(uint32_t width,
                                                             uint32_t height,
                                                             SurfaceOriginANDROID surface_origin)
{
    DepthTextureCreateInfoANDROID info{};
    info.type = TYPE_DEPTH_TEXTURE_CREATE_INFO_ANDROID;
    info.next = nullptr;
    info.resolution = DepthResolutionInfoANDROID{ TYPE_DEPTH_RESOLUTION_INFO_ANDROID, nullptr, width, height };
    info.surfaceOrigin = surface_origin;
    return info;
}

DepthSwapchainCreateInfoANDROID make_depth_swapchain_create_info(DepthResolutionANDROID resolution,
                                                                 DepthSwapchainCreateFlagsANDROID create_flags)
{
    DepthSwapchainCreateInfoANDROID info{};
    info.type = TYPE_DEPTH_SWAPCHAIN_CREATE_INFO_ANDROID;
    info.next = nullptr;
    info.resolution = resolution;
    info.createFlags = create_flags;
    return info;
}

// ============================================================================
// XrAndroidDepthTexture
// ============================================================================

std::unique_ptr<XrAndroidDepthTexture> XrAndroidDepthTexture::create(const IXrBackend& backend)
{
    if (!is_android_depth_texture_extension_available(backend))
    {
        logging::warn("[XrAndroidDepthTexture] XR_ANDROID_depth_texture extension not available");
        return nullptr;
    }

    Functions funcs;
    bool loaded = true;
    loaded &= resolve_into(backend, "xrEnumerateDepthResolutionsANDROID", funcs.enumerate_resolutions);
    loaded &= resolve_into(backend, "xrCreateDepthTextureANDROID", funcs.create_texture);
    loaded &= resolve_into(backend, "xrDestroyDepthTextureANDROID", funcs.destroy_texture);
    loaded &= resolve_into(backend, "xrAcquireDepthTextureANDROID", funcs.acquire_texture);
    loaded &= resolve_into(backend, "xrReleaseDepthTextureANDROID", funcs.release_texture);
    loaded &= resolve_into(backend, "xrCreateDepthSwapchainANDROID", funcs.create_swapchain);
    loaded &= resolve_into(backend, "xrDestroyDepthSwapchainANDROID", funcs.destroy_swapchain);
    loaded &= resolve_into(backend, "xrEnumerateDepthSwapchainImagesANDROID", funcs.enumerate_images);
    loaded &= resolve_into(backend, "xrAcquireDepthSwapchainImagesANDROID", funcs.acquire_image);

    if (!loaded)
    {
        logging::warn("[XrAndroidDepthTexture] Failed to load all XR_ANDROID_depth_texture functions");
        return nullptr;
    }

    // Only check_system_support needs it
    if (!resolve_into(backend, "xrGetSystemProperties", funcs.get_system_properties))
    {
        logging::diag("[XrAndroidDepthTexture] xrGetSystemProperties not resolved, system support cannot be checked");
    }

    logging::info("[XrAndroidDepthTexture] XR_ANDROID_depth_texture extension initialized");
    return std::unique_ptr<XrAndroidDepthTexture>(new XrAndroidDepthTexture(backend, funcs));
}

XrAndroidDepthTexture::XrAndroidDepthTexture(const IXrBackend& backend, const Functions& funcs)
    : backend_(backend), funcs_(funcs)
{
}

bool XrAndroidDepthTexture::check_system_support(bool with_log) const
{
    if (!funcs_.get_system_properties)
    {
        throw XrError("xrGetSystemProperties", XR_ERROR_FUNCTION_UNSUPPORTED);
    }

    SystemDepthTrackingPropertiesANDROID depth_props{ TYPE_SYSTEM_DEPTH_TRACKING_PROPERTIES_ANDROID, nullptr, XR_FALSE };
    XrSystemProperties system_properties{ XR_TYPE_SYSTEM_PROPERTIES };
    system_properties.next = &depth_props;

    check_xr_result(funcs_.get_system_properties(backend_.instance(), backend_.system_id(), &system_properties),
                    "xrGetSystemProperties");

    if (with_log)
    {
        logging::diag("=== XR_ANDROID_depth_texture System Properties ===");
        logging::diag("System ID: " + std::to_string(system_properties.systemId));
        logging::diag("Vendor ID: " + std::to_string(system_properties.vendorId));
        logging::diag(std::string("System name: ") + system_properties.systemName);
        logging::diag("Graphics properties:");
        logging::diag("  Max swapchain image height: " +
                      std::to_string(system_properties.graphicsProperties.maxSwapchainImageHeight));
        logging::diag("  Max swapchain image width: " +
                      std::to_string(system_properties.graphicsProperties.maxSwapchainImageWidth));
        logging::diag("  Max layer count: " + std::to_string(system_properties.graphicsProperties.maxLayerCount));
        logging::diag("Tracking properties:");
        logging::diag(std::string("  Orientation tracking: ") +
                      bool_text(system_properties.trackingProperties.orientationTracking));
        logging::diag(std::string("  Position tracking: ") +
                      bool_text(system_properties.trackingProperties.positionTracking));
        logging::diag(std::string("  Supports depth tracking: ") + bool_text(depth_props.supportsDepthTracking));
    }

    return depth_props.supportsDepthTracking != XR_FALSE;
}

std::vector<DepthResolutionANDROID> XrAndroidDepthTexture::enumerate_depth_resolutions(XrSession session) const
{
    std::vector<DepthResolutionANDROID> resolutions;
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, DepthResolutionANDROID* out)
        { return funcs_.enumerate_resolutions(session, capacity, count, out); },
        resolutions);
    check_xr_result(result, "xrEnumerateDepthResolutionsANDROID");
    return resolutions;
}

void XrAndroidDepthTexture::require_live_texture(const DepthTextureANDROID& texture, const char* call) const
{
    if (live_textures_.count(texture.texture) == 0)
    {
        throw XrError(call, XR_ERROR_HANDLE_INVALID);
    }
}

void XrAndroidDepthTexture::require_live_swapchain(XrSwapchain swapchain, const char* call) const
{
    if (live_swapchains_.count(swapchain) == 0)
    {
        throw XrError(call, XR_ERROR_HANDLE_INVALID);
    }
}

DepthTextureANDROID XrAndroidDepthTexture::create_depth_texture(XrSession session,
                                                                const DepthTextureCreateInfoANDROID& info)
{
    DepthTextureANDROID texture{ TYPE_DEPTH_TEXTURE_ANDROID, nullptr, nullptr };
    check_xr_result(funcs_.create_texture(session, &info, &texture), "xrCreateDepthTextureANDROID");
    live_textures_.insert(texture.texture);
    return texture;
}

void XrAndroidDepthTexture::destroy_depth_texture(XrSession session, const DepthTextureANDROID& texture)
{
    require_live_texture(texture, "xrDestroyDepthTextureANDROID");
    if (is_acquired(texture))
    {
        throw XrError("xrDestroyDepthTextureANDROID", XR_ERROR_CALL_ORDER_INVALID);
    }

    // The handle is gone whatever the runtime answers
    live_textures_.erase(texture.texture);
    check_xr_result(funcs_.destroy_texture(session, &texture), "xrDestroyDepthTextureANDROID");
}

DepthSurfaceInfoANDROID XrAndroidDepthTexture::acquire_depth_texture(XrSession session,
                                                                     const DepthTextureANDROID& texture)
{
    require_live_texture(texture, "xrAcquireDepthTextureANDROID");
    if (is_acquired(texture))
    {
        throw XrError("xrAcquireDepthTextureANDROID", XR_ERROR_CALL_ORDER_INVALID);
    }

    DepthSurfaceInfoANDROID surface{ TYPE_DEPTH_SURFACE_INFO_ANDROID, nullptr, nullptr };
    check_xr_result(funcs_.acquire_texture(session, &texture, &surface), "xrAcquireDepthTextureANDROID");
    acquired_textures_.insert(texture.texture);
    return surface;
}

void XrAndroidDepthTexture::release_depth_texture(XrSession session, const DepthTextureANDROID& texture)
{
    require_live_texture(texture, "xrReleaseDepthTextureANDROID");
    if (!is_acquired(texture))
    {
        throw XrError("xrReleaseDepthTextureANDROID", XR_ERROR_CALL_ORDER_INVALID);
    }

    check_xr_result(funcs_.release_texture(session, &texture), "xrReleaseDepthTextureANDROID");
    acquired_textures_.erase(texture.texture);
}

XrSwapchain XrAndroidDepthTexture::create_depth_swapchain(XrSession session, const DepthSwapchainCreateInfoANDROID& info)
{
    XrSwapchain swapchain = XR_NULL_HANDLE;
    check_xr_result(funcs_.create_swapchain(session, &info, &swapchain), "xrCreateDepthSwapchainANDROID");
    live_swapchains_.insert(swapchain);
    return swapchain;
}

void XrAndroidDepthTexture::destroy_depth_swapchain(XrSession session, XrSwapchain swapchain)
{
    require_live_swapchain(swapchain, "xrDestroyDepthSwapchainANDROID");
    live_swapchains_.erase(swapchain);
    check_xr_result(funcs_.destroy_swapchain(session, swapchain), "xrDestroyDepthSwapchainANDROID");
}

std::vector<DepthSwapchainImageANDROID> XrAndroidDepthTexture::enumerate_depth_swapchain_images(
    XrSwapchain swapchain) const
{
    require_live_swapchain(swapchain, "xrEnumerateDepthSwapchainImagesANDROID");

    std::vector<DepthSwapchainImageANDROID> images;
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, DepthSwapchainImageANDROID* out)
        { return funcs_.enumerate_images(swapchain, capacity, count, out); },
        images, DepthSwapchainImageANDROID{ TYPE_DEPTH_SWAPCHAIN_IMAGE_ANDROID, nullptr, nullptr, nullptr, nullptr, nullptr });
    check_xr_result(result, "xrEnumerateDepthSwapchainImagesANDROID");
    return images;
}

uint32_t XrAndroidDepthTexture::acquire_depth_swapchain_image(XrSession session, XrSwapchain swapchain)
{
    require_live_swapchain(swapchain, "xrAcquireDepthSwapchainImagesANDROID");

    uint32_t index = 0;
    check_xr_result(funcs_.acquire_image(session, swapchain, &index), "xrAcquireDepthSwapchainImagesANDROID");
    return index;
}

// ============================================================================
// RAII owners
// ============================================================================

DepthTextureHandle::DepthTextureHandle(XrAndroidDepthTexture& depth,
                                       XrSession session,
                                       const DepthTextureCreateInfoANDROID& info)
    : depth_(depth), session_(session), texture_(depth.create_depth_texture(session, info)), alive_(true)
{
}

DepthTextureHandle::~DepthTextureHandle()
{
    if (!alive_)
    {
        return;
    }

    try
    {
        destroy();
    }
    catch (const XrError& e)
    {
        logging::err(std::string("[DepthTextureHandle] ") + e.what());
    }
}

void DepthTextureHandle::destroy()
{
    if (!alive_)
    {
        throw XrError("xrDestroyDepthTextureANDROID", XR_ERROR_HANDLE_INVALID);
    }

    // Still-acquired textures are released first so the destroy is legal
    if (depth_.is_acquired(texture_))
    {
        depth_.release_depth_texture(session_, texture_);
    }
    alive_ = false;
    depth_.destroy_depth_texture(session_, texture_);
}

ScopedDepthTextureAcquire::ScopedDepthTextureAcquire(XrAndroidDepthTexture& depth,
                                                     XrSession session,
                                                     const DepthTextureANDROID& texture)
    : depth_(depth), session_(session), texture_(texture), surface_(depth.acquire_depth_texture(session, texture))
{
}

ScopedDepthTextureAcquire::~ScopedDepthTextureAcquire()
{
    if (!depth_.is_acquired(texture_))
    {
        return;
    }

    try
    {
        depth_.release_depth_texture(session_, texture_);
    }
    catch (const XrError& e)
    {
        logging::err(std::string("[ScopedDepthTextureAcquire] ") + e.what());
    }
}

DepthSwapchainHandle::DepthSwapchainHandle(XrAndroidDepthTexture& depth,
                                           XrSession session,
                                           const DepthSwapchainCreateInfoANDROID& info)
    : depth_(depth), session_(session)
{
    XrSwapchain swapchain = depth.create_depth_swapchain(session, info);
    swapchain_ = XrSwapchainPtr(swapchain,
                                [&depth, session](XrSwapchain handle)
                                {
                                    try
                                    {
                                        depth.destroy_depth_swapchain(session, handle);
                                    }
                                    catch (const XrError& e)
                                    {
                                        logging::err(std::string("[DepthSwapchainHandle] ") + e.what());
                                    }
                                });

    // The image list is fixed for the lifetime of the swapchain
    images_ = depth.enumerate_depth_swapchain_images(swapchain);
}

DepthSwapchainHandle::~DepthSwapchainHandle() = default;

uint32_t DepthSwapchainHandle::acquire_image()
{
    if (!swapchain_)
    {
        throw XrError("xrAcquireDepthSwapchainImagesANDROID", XR_ERROR_HANDLE_INVALID);
    }
    const uint32_t index = depth_.acquire_depth_swapchain_image(session_, swapchain_.get());
    if (index >= images_.size())
    {
        logging::err("[DepthSwapchainHandle] Runtime returned image index " + std::to_string(index) + " for " +
                     std::to_string(images_.size()) + " images");
        throw XrError("xrAcquireDepthSwapchainImagesANDROID", XR_ERROR_RUNTIME_FAILURE);
    }
    return index;
}

void DepthSwapchainHandle::destroy()
{
    if (!swapchain_)
    {
        throw XrError("xrDestroyDepthSwapchainANDROID", XR_ERROR_HANDLE_INVALID);
    }
    images_.clear();
    depth_.destroy_depth_swapchain(session_, swapchain_.release());
}

} // namespace xrext
