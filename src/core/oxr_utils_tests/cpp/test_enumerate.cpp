// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <oxr_utils/oxr_enumerate.hpp>

#include <vector>

using namespace xrext;

TEST_CASE("Zero size query issues no fill call", "[enumerate]")
{
    int calls = 0;
    std::vector<float> out{ 1.0f };
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, float* buffer)
        {
            ++calls;
            *count = 0;
            return XR_SUCCESS;
        },
        out);

    CHECK(result == XR_SUCCESS);
    CHECK(out.empty());
    CHECK(calls == 1);
}

TEST_CASE("Elements are initialized from the prototype before the fill call", "[enumerate]")
{
    std::vector<XrStructureType> seen_types;
    std::vector<XrRenderModelPathInfoFB> out;
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, XrRenderModelPathInfoFB* buffer)
        {
            *count = 3;
            for (uint32_t i = 0; i < capacity; ++i)
            {
                seen_types.push_back(buffer[i].type);
                buffer[i].path = i + 10;
            }
            return XR_SUCCESS;
        },
        out, XrRenderModelPathInfoFB{ XR_TYPE_RENDER_MODEL_PATH_INFO_FB });

    REQUIRE(result == XR_SUCCESS);
    REQUIRE(out.size() == 3);
    CHECK(out[2].path == 12);
    REQUIRE(seen_types.size() == 3);
    for (auto type : seen_types)
    {
        CHECK(type == XR_TYPE_RENDER_MODEL_PATH_INFO_FB);
    }
}

TEST_CASE("Fill call may report fewer elements than the size query", "[enumerate]")
{
    std::vector<uint32_t> out;
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, uint32_t* buffer)
        {
            if (capacity == 0)
            {
                *count = 4;
                return XR_SUCCESS;
            }
            buffer[0] = 7;
            buffer[1] = 8;
            *count = 2;
            return XR_SUCCESS;
        },
        out);

    REQUIRE(result == XR_SUCCESS);
    CHECK(out == std::vector<uint32_t>{ 7, 8 });
}

TEST_CASE("Failures are returned and leave the output empty", "[enumerate]")
{
    std::vector<uint32_t> out{ 1, 2 };
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, uint32_t* buffer)
        {
            if (capacity == 0)
            {
                *count = 2;
                return XR_SUCCESS;
            }
            return XR_ERROR_SIZE_INSUFFICIENT;
        },
        out);

    CHECK(result == XR_ERROR_SIZE_INSUFFICIENT);
    CHECK(out.empty());
}

TEST_CASE("XrError carries the result and names the call", "[enumerate]")
{
    try
    {
        check_xr_result(XR_ERROR_HANDLE_INVALID, "xrSomething");
        FAIL("check_xr_result did not throw");
    }
    catch (const XrError& e)
    {
        CHECK(e.result() == XR_ERROR_HANDLE_INVALID);
        CHECK(std::string(e.what()) == "xrSomething failed: " + std::to_string(XR_ERROR_HANDLE_INVALID));
    }

    // Qualified success codes count as failures at this layer
    CHECK_THROWS_AS(check_xr_result(XR_RENDER_MODEL_UNAVAILABLE_FB, "xrGetRenderModelPropertiesFB"), XrError);
    CHECK_NOTHROW(check_xr_result(XR_SUCCESS, "xrSomething"));
}
