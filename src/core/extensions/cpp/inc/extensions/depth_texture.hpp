// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <backend/xr_backend.hpp>
#include <oxr_utils/oxr_ext_types.hpp>

#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace xrext
{

bool is_android_depth_texture_extension_available(const IXrBackend& backend);

// Pixel size of a resolution tag, {0, 0} for unknown tags
std::pair<uint32_t, uint32_t> resolution_dimensions(DepthResolutionANDROID resolution);

DepthTextureCreateInfoANDROID make_depth_texture_create_info(uint32_t width,
                                                             uint32_t height,
                                                             SurfaceOriginANDROID surface_origin);

DepthSwapchainCreateInfoANDROID make_depth_swapchain_create_info(DepthResolutionANDROID resolution,
                                                                 DepthSwapchainCreateFlagsANDROID create_flags);

/**
 * @brief XR_ANDROID_depth_texture entry points.
 *
 * Every runtime failure is thrown as XrError. Textures are tracked from create to destroy:
 * a second acquire without a release, a release without an acquire, destroying while
 * acquired, and any use after destroy throw XrError without reaching the runtime.
 */
class XrAndroidDepthTexture
{
public:
    // Returns nullptr and logs a warning when the extension or one of its nine symbols is missing
    static std::unique_ptr<XrAndroidDepthTexture> create(const IXrBackend& backend);

    XrAndroidDepthTexture(const XrAndroidDepthTexture&) = delete;
    XrAndroidDepthTexture& operator=(const XrAndroidDepthTexture&) = delete;

    // Queries the depth-tracking system property; logs the system properties when with_log.
    // Throws XrError(XR_ERROR_FUNCTION_UNSUPPORTED) when xrGetSystemProperties did not resolve.
    bool check_system_support(bool with_log) const;

    std::vector<DepthResolutionANDROID> enumerate_depth_resolutions(XrSession session) const;

    DepthTextureANDROID create_depth_texture(XrSession session, const DepthTextureCreateInfoANDROID& info);
    void destroy_depth_texture(XrSession session, const DepthTextureANDROID& texture);
    DepthSurfaceInfoANDROID acquire_depth_texture(XrSession session, const DepthTextureANDROID& texture);
    void release_depth_texture(XrSession session, const DepthTextureANDROID& texture);

    XrSwapchain create_depth_swapchain(XrSession session, const DepthSwapchainCreateInfoANDROID& info);
    void destroy_depth_swapchain(XrSession session, XrSwapchain swapchain);
    std::vector<DepthSwapchainImageANDROID> enumerate_depth_swapchain_images(XrSwapchain swapchain) const;
    uint32_t acquire_depth_swapchain_image(XrSession session, XrSwapchain swapchain);

    bool is_acquired(const DepthTextureANDROID& texture) const
    {
        return acquired_textures_.count(texture.texture) > 0;
    }

private:
    struct Functions
    {
        PFN_xrGetSystemProperties get_system_properties = nullptr;
        PFN_EnumerateDepthResolutionsANDROID enumerate_resolutions = nullptr;
        PFN_CreateDepthTextureANDROID create_texture = nullptr;
        PFN_DestroyDepthTextureANDROID destroy_texture = nullptr;
        PFN_AcquireDepthTextureANDROID acquire_texture = nullptr;
        PFN_ReleaseDepthTextureANDROID release_texture = nullptr;
        PFN_CreateDepthSwapchainANDROID create_swapchain = nullptr;
        PFN_DestroyDepthSwapchainANDROID destroy_swapchain = nullptr;
        PFN_EnumerateDepthSwapchainImagesANDROID enumerate_images = nullptr;
        PFN_AcquireDepthSwapchainImageANDROID acquire_image = nullptr;
    };

    XrAndroidDepthTexture(const IXrBackend& backend, const Functions& funcs);

    void require_live_texture(const DepthTextureANDROID& texture, const char* call) const;
    void require_live_swapchain(XrSwapchain swapchain, const char* call) const;

    const IXrBackend& backend_;
    const Functions funcs_;

    std::set<void*> live_textures_;
    std::set<void*> acquired_textures_;
    std::set<XrSwapchain> live_swapchains_;
};

// Owns a depth texture, destroys it exactly once
class DepthTextureHandle
{
public:
    DepthTextureHandle(XrAndroidDepthTexture& depth, XrSession session, const DepthTextureCreateInfoANDROID& info);
    ~DepthTextureHandle();

    DepthTextureHandle(const DepthTextureHandle&) = delete;
    DepthTextureHandle& operator=(const DepthTextureHandle&) = delete;

    const DepthTextureANDROID& get() const
    {
        return texture_;
    }

    // Explicit destroy, lets the caller see failures. The destructor is a no-op afterwards.
    void destroy();

private:
    XrAndroidDepthTexture& depth_;
    XrSession session_;
    DepthTextureANDROID texture_;
    bool alive_;
};

// Acquire on construction, release on scope exit
class ScopedDepthTextureAcquire
{
public:
    ScopedDepthTextureAcquire(XrAndroidDepthTexture& depth, XrSession session, const DepthTextureANDROID& texture);
    ~ScopedDepthTextureAcquire();

    ScopedDepthTextureAcquire(const ScopedDepthTextureAcquire&) = delete;
    ScopedDepthTextureAcquire& operator=(const ScopedDepthTextureAcquire&) = delete;

    const DepthSurfaceInfoANDROID& surface() const
    {
        return surface_;
    }

private:
    XrAndroidDepthTexture& depth_;
    XrSession session_;
    DepthTextureANDROID texture_;
    DepthSurfaceInfoANDROID surface_;
};

// Owns a depth swapchain and the image list enumerated once after creation
class DepthSwapchainHandle
{
public:
    DepthSwapchainHandle(XrAndroidDepthTexture& depth, XrSession session, const DepthSwapchainCreateInfoANDROID& info);
    ~DepthSwapchainHandle();

    DepthSwapchainHandle(const DepthSwapchainHandle&) = delete;
    DepthSwapchainHandle& operator=(const DepthSwapchainHandle&) = delete;

    XrSwapchain get() const
    {
        return swapchain_.get();
    }

    const std::vector<DepthSwapchainImageANDROID>& images() const
    {
        return images_;
    }

    // Index into images(), an index past the image list throws XrError(XR_ERROR_RUNTIME_FAILURE)
    uint32_t acquire_image();

    void destroy();

private:
    XrAndroidDepthTexture& depth_;
    XrSession session_;
    XrSwapchainPtr swapchain_;
    std::vector<DepthSwapchainImageANDROID> images_;
};

} // namespace xrext
