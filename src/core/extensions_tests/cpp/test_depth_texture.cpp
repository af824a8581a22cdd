// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <extensions/depth_texture.hpp>
#include <test_utils/fakes.hpp>
#include <test_utils/mock_backend.hpp>

#include <functional>

using namespace xrext;

namespace
{

XrResult error_of(const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const XrError& e)
    {
        return e.result();
    }
    return XR_SUCCESS;
}

std::unique_ptr<XrAndroidDepthTexture> make_depth(test::MockBackend& backend)
{
    backend.enable(XR_ANDROID_DEPTH_TEXTURE_NAME);
    return XrAndroidDepthTexture::create(backend);
}

} // namespace

TEST_CASE("Depth texture needs the extension and all nine entry points", "[depth_texture]")
{
    test::reset_mock_runtime();

    test::MockBackend disabled;
    CHECK_FALSE(is_android_depth_texture_extension_available(disabled));
    CHECK(XrAndroidDepthTexture::create(disabled) == nullptr);

    for (const char* symbol : { "xrEnumerateDepthResolutionsANDROID", "xrCreateDepthTextureANDROID",
                                "xrDestroyDepthTextureANDROID", "xrAcquireDepthTextureANDROID",
                                "xrReleaseDepthTextureANDROID", "xrCreateDepthSwapchainANDROID",
                                "xrDestroyDepthSwapchainANDROID", "xrEnumerateDepthSwapchainImagesANDROID",
                                "xrAcquireDepthSwapchainImagesANDROID" })
    {
        test::MockBackend backend;
        backend.hide_symbol(symbol);
        CHECK(make_depth(backend) == nullptr);
    }

    // xrGetSystemProperties is optional
    test::MockBackend no_properties;
    no_properties.hide_symbol("xrGetSystemProperties");
    auto depth = make_depth(no_properties);
    REQUIRE(depth);
    CHECK(error_of([&] { depth->check_system_support(false); }) == XR_ERROR_FUNCTION_UNSUPPORTED);

    CHECK(test::total_calls() == 0);
}

TEST_CASE("System support is read from the chained properties", "[depth_texture]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;
    auto depth = make_depth(backend);
    REQUIRE(depth);

    test::LogCapture capture;
    CHECK(depth->check_system_support(true));
    CHECK(capture.contains("System name: Mock XR System"));
    CHECK(capture.contains("Supports depth tracking: true"));

    test::mock_state().depth_tracking_supported = false;
    CHECK_FALSE(depth->check_system_support(false));

    test::mock_state().system_properties_result = XR_ERROR_SYSTEM_INVALID;
    CHECK(error_of([&] { depth->check_system_support(false); }) == XR_ERROR_SYSTEM_INVALID);
}

TEST_CASE("Resolutions enumerate and map to pixel sizes", "[depth_texture]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;
    auto depth = make_depth(backend);
    REQUIRE(depth);

    auto resolutions = depth->enumerate_depth_resolutions(test::MOCK_SESSION);
    REQUIRE(resolutions.size() == 3);
    CHECK(resolution_dimensions(resolutions[0]) == std::make_pair(640u, 480u));
    CHECK(resolution_dimensions(resolutions[1]) == std::make_pair(1280u, 960u));
    CHECK(resolution_dimensions(resolutions[2]) == std::make_pair(2560u, 1920u));
    CHECK(resolution_dimensions(42) == std::make_pair(0u, 0u));

    test::mock_state().depth_resolutions.clear();
    CHECK(depth->enumerate_depth_resolutions(test::MOCK_SESSION).empty());
    CHECK(test::call_count("xrEnumerateDepthResolutionsANDROID") == 3);
}

TEST_CASE("Acquire and release must alternate", "[depth_texture]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;
    auto depth = make_depth(backend);
    REQUIRE(depth);
    const XrSession session = test::MOCK_SESSION;

    auto info = make_depth_texture_create_info(1280, 960, SURFACE_ORIGIN_BOTTOM_LEFT_ANDROID);
    DepthTextureANDROID texture = depth->create_depth_texture(session, info);
    CHECK(texture.texture != nullptr);
    CHECK(test::mock_state().last_texture_info.resolution.width == 1280);
    CHECK(test::mock_state().last_texture_info.surfaceOrigin == SURFACE_ORIGIN_BOTTOM_LEFT_ANDROID);

    DepthSurfaceInfoANDROID surface = depth->acquire_depth_texture(session, texture);
    CHECK(surface.type == TYPE_DEPTH_SURFACE_INFO_ANDROID);
    CHECK(surface.depthSurface != nullptr);
    CHECK(depth->is_acquired(texture));

    CHECK(error_of([&] { depth->acquire_depth_texture(session, texture); }) == XR_ERROR_CALL_ORDER_INVALID);
    CHECK(error_of([&] { depth->destroy_depth_texture(session, texture); }) == XR_ERROR_CALL_ORDER_INVALID);

    depth->release_depth_texture(session, texture);
    CHECK_FALSE(depth->is_acquired(texture));
    CHECK(error_of([&] { depth->release_depth_texture(session, texture); }) == XR_ERROR_CALL_ORDER_INVALID);

    // A second cycle is fine once released
    depth->acquire_depth_texture(session, texture);
    depth->release_depth_texture(session, texture);

    CHECK(test::call_count("xrAcquireDepthTextureANDROID") == 2);
    CHECK(test::call_count("xrReleaseDepthTextureANDROID") == 2);

    depth->destroy_depth_texture(session, texture);
    CHECK(error_of([&] { depth->destroy_depth_texture(session, texture); }) == XR_ERROR_HANDLE_INVALID);
    CHECK(error_of([&] { depth->acquire_depth_texture(session, texture); }) == XR_ERROR_HANDLE_INVALID);
    CHECK(test::call_count("xrDestroyDepthTextureANDROID") == 1);
}

TEST_CASE("Texture handle destroys exactly once", "[depth_texture]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;
    auto depth = make_depth(backend);
    REQUIRE(depth);
    auto info = make_depth_texture_create_info(640, 480, SURFACE_ORIGIN_TOP_LEFT_ANDROID);

    {
        DepthTextureHandle handle(*depth, test::MOCK_SESSION, info);
        ScopedDepthTextureAcquire acquire(*depth, test::MOCK_SESSION, handle.get());
        CHECK(acquire.surface().depthSurface != nullptr);
        CHECK(depth->is_acquired(handle.get()));
    }
    CHECK(test::call_count("xrReleaseDepthTextureANDROID") == 1);
    CHECK(test::call_count("xrDestroyDepthTextureANDROID") == 1);
    CHECK(test::mock_state().live_depth_textures.empty());

    {
        DepthTextureHandle handle(*depth, test::MOCK_SESSION, info);
        depth->acquire_depth_texture(test::MOCK_SESSION, handle.get());

        // destroy releases the outstanding acquire first
        handle.destroy();
        CHECK(error_of([&] { handle.destroy(); }) == XR_ERROR_HANDLE_INVALID);
    }
    CHECK(test::call_count("xrReleaseDepthTextureANDROID") == 2);
    CHECK(test::call_count("xrDestroyDepthTextureANDROID") == 2);
}

TEST_CASE("Depth swapchain lifecycle", "[depth_texture]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;
    auto depth = make_depth(backend);
    REQUIRE(depth);

    auto info = make_depth_swapchain_create_info(DEPTH_RESOLUTION_HALF_ANDROID,
                                                 DEPTH_SWAPCHAIN_CREATE_SMOOTH_DEPTH_IMAGE_BIT_ANDROID |
                                                     DEPTH_SWAPCHAIN_CREATE_RAW_DEPTH_IMAGE_BIT_ANDROID);
    XrSwapchain swapchain = depth->create_depth_swapchain(test::MOCK_SESSION, info);
    CHECK(test::mock_state().last_swapchain_info.resolution == DEPTH_RESOLUTION_HALF_ANDROID);

    auto images = depth->enumerate_depth_swapchain_images(swapchain);
    REQUIRE_FALSE(images.empty());
    for (const auto& image : images)
    {
        CHECK(image.rawDepthImage != nullptr);
        CHECK(image.smoothDepthImage != nullptr);
        CHECK(image.rawDepthConfidenceImage == nullptr);
        CHECK(image.smoothDepthConfidenceImage == nullptr);
    }

    for (int i = 0; i < 5; ++i)
    {
        uint32_t index = depth->acquire_depth_swapchain_image(test::MOCK_SESSION, swapchain);
        CHECK(index < images.size());
    }

    depth->destroy_depth_swapchain(test::MOCK_SESSION, swapchain);
    CHECK(error_of([&] { depth->destroy_depth_swapchain(test::MOCK_SESSION, swapchain); }) == XR_ERROR_HANDLE_INVALID);
    CHECK(error_of([&] { depth->enumerate_depth_swapchain_images(swapchain); }) == XR_ERROR_HANDLE_INVALID);
    CHECK(test::call_count("xrDestroyDepthSwapchainANDROID") == 1);
}

TEST_CASE("Swapchain handle owns the swapchain and its images", "[depth_texture]")
{
    test::reset_mock_runtime();
    test::mock_state().depth_image_count = 2;
    test::MockBackend backend;
    auto depth = make_depth(backend);
    REQUIRE(depth);

    auto info = make_depth_swapchain_create_info(DEPTH_RESOLUTION_QUARTER_ANDROID,
                                                 DEPTH_SWAPCHAIN_CREATE_RAW_DEPTH_IMAGE_BIT_ANDROID |
                                                     DEPTH_SWAPCHAIN_CREATE_RAW_CONFIDENCE_IMAGE_BIT_ANDROID);
    {
        DepthSwapchainHandle handle(*depth, test::MOCK_SESSION, info);
        REQUIRE(handle.images().size() == 2);
        CHECK(handle.images()[0].rawDepthConfidenceImage != nullptr);
        CHECK(handle.images()[0].smoothDepthImage == nullptr);
        CHECK(handle.acquire_image() == 0);
        CHECK(handle.acquire_image() == 1);
        CHECK(handle.acquire_image() == 0);
    }
    CHECK(test::call_count("xrDestroyDepthSwapchainANDROID") == 1);
    CHECK(test::call_count("xrEnumerateDepthSwapchainImagesANDROID") == 2);

    {
        DepthSwapchainHandle handle(*depth, test::MOCK_SESSION, info);
        handle.destroy();
        CHECK(handle.images().empty());
        CHECK(error_of([&] { handle.acquire_image(); }) == XR_ERROR_HANDLE_INVALID);
    }
    CHECK(test::call_count("xrDestroyDepthSwapchainANDROID") == 2);
    CHECK(test::mock_state().live_depth_swapchains.empty());
}

TEST_CASE("Scoped acquire built from a texture value releases exactly once", "[depth_texture]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;
    auto depth = make_depth(backend);
    REQUIRE(depth);
    auto info = make_depth_texture_create_info(640, 480, SURFACE_ORIGIN_TOP_LEFT_ANDROID);

    void* raw = nullptr;
    {
        ScopedDepthTextureAcquire acquire(*depth, test::MOCK_SESSION, depth->create_depth_texture(test::MOCK_SESSION, info));
        CHECK(acquire.surface().depthSurface != nullptr);
        REQUIRE(test::mock_state().live_depth_textures.size() == 1);
        raw = *test::mock_state().live_depth_textures.begin();
    }
    CHECK(test::call_count("xrAcquireDepthTextureANDROID") == 1);
    CHECK(test::call_count("xrReleaseDepthTextureANDROID") == 1);

    DepthTextureANDROID texture{ TYPE_DEPTH_TEXTURE_ANDROID, nullptr, raw };
    CHECK_FALSE(depth->is_acquired(texture));
    depth->destroy_depth_texture(test::MOCK_SESSION, texture);
    CHECK(test::mock_state().live_depth_textures.empty());
}

TEST_CASE("Swapchain handle rejects an image index past its images", "[depth_texture]")
{
    test::reset_mock_runtime();
    test::mock_state().depth_image_count = 2;
    test::MockBackend backend;
    auto depth = make_depth(backend);
    REQUIRE(depth);

    auto info = make_depth_swapchain_create_info(DEPTH_RESOLUTION_QUARTER_ANDROID,
                                                 DEPTH_SWAPCHAIN_CREATE_RAW_DEPTH_IMAGE_BIT_ANDROID);
    DepthSwapchainHandle handle(*depth, test::MOCK_SESSION, info);
    REQUIRE(handle.images().size() == 2);

    // The runtime now reports an index the enumerated list does not have
    test::mock_state().depth_image_count = 5;
    test::mock_state().next_image_index = 3;

    test::LogCapture capture;
    CHECK(error_of([&] { handle.acquire_image(); }) == XR_ERROR_RUNTIME_FAILURE);
    CHECK(capture.contains("image index 3 for 2 images"));
}
