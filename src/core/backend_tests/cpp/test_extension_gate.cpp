// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <backend/extension_gate.hpp>
#include <backend/openxr_backend.hpp>
#include <catch2/catch_test_macros.hpp>
#include <test_utils/mock_backend.hpp>

using namespace xrext;

namespace
{

XRAPI_ATTR XrResult XRAPI_CALL mock_get_proc_addr(XrInstance instance, const char* name, PFN_xrVoidFunction* function)
{
    *function = test::mock_proc_addr(name);
    return *function ? XR_SUCCESS : XR_ERROR_FUNCTION_UNSUPPORTED;
}

OpenXRSessionHandles mock_handles()
{
    return OpenXRSessionHandles(
        test::MOCK_INSTANCE, test::MOCK_SYSTEM_ID, test::MOCK_SESSION, test::MOCK_SPACE, &mock_get_proc_addr);
}

} // namespace

TEST_CASE("probe requires an OpenXR backend with the extension enabled", "[extension_gate]")
{
    test::MockBackend backend({ "XR_FB_render_model" });
    CHECK(probe(backend, "XR_FB_render_model"));
    CHECK_FALSE(probe(backend, "XR_FB_display_refresh_rate"));

    for (auto type : { BackendXRType::None, BackendXRType::Simulator, BackendXRType::WebXR })
    {
        backend.set_type(type);
        CHECK_FALSE(probe(backend, "XR_FB_render_model"));
    }
}

TEST_CASE("resolve returns typed pointers or nothing", "[extension_gate]")
{
    test::MockBackend backend;

    auto found = resolve<PFN_xrStringToPath>(backend, "xrStringToPath");
    REQUIRE(found.has_value());
    CHECK(*found != nullptr);

    CHECK_FALSE(resolve<PFN_xrStringToPath>(backend, "xrNotARealFunction").has_value());

    backend.hide_symbol("xrStringToPath");
    PFN_xrStringToPath slot = reinterpret_cast<PFN_xrStringToPath>(0x1);
    CHECK_FALSE(resolve_into(backend, "xrStringToPath", slot));
    CHECK(slot == nullptr);
}

TEST_CASE("OpenXRBackend is not OpenXR until attached", "[openxr_backend]")
{
    OpenXRBackend backend;
    backend.request_ext("XR_FB_render_model");
    backend.request_ext("XR_FB_render_model");
    backend.request_ext("XR_FB_display_refresh_rate");

    CHECK(backend.requested_extensions() == std::vector<std::string>{ "XR_FB_render_model", "XR_FB_display_refresh_rate" });
    CHECK(backend.xr_type() == BackendXRType::None);
    CHECK_FALSE(backend.ext_enabled("XR_FB_render_model"));
    CHECK(backend.get_proc_addr("xrStringToPath") == nullptr);
    CHECK_FALSE(probe(backend, "XR_FB_render_model"));
}

TEST_CASE("OpenXRBackend answers from the attached handles", "[openxr_backend]")
{
    OpenXRBackend backend;
    backend.attach(mock_handles(), { "XR_FB_render_model" });

    CHECK(backend.xr_type() == BackendXRType::OpenXR);
    CHECK(backend.session() == test::MOCK_SESSION);
    CHECK(backend.system_id() == test::MOCK_SYSTEM_ID);
    CHECK(probe(backend, "XR_FB_render_model"));
    CHECK(backend.get_proc_addr("xrLoadRenderModelFB") != nullptr);
    CHECK(backend.get_proc_addr("xrNotARealFunction") == nullptr);

    auto resolver = make_resolver(backend);
    CHECK(resolver("xrPathToString") != nullptr);

    backend.detach();
    CHECK(backend.xr_type() == BackendXRType::None);
    CHECK(backend.instance() == XR_NULL_HANDLE);
    CHECK_FALSE(backend.ext_enabled("XR_FB_render_model"));
}
