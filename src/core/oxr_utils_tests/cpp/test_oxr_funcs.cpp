// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <oxr_utils/oxr_funcs.hpp>
#include <test_utils/mock_runtime.hpp>

#include <stdexcept>
#include <string>

using namespace xrext;

namespace
{

XRAPI_ATTR XrResult XRAPI_CALL mock_get_proc_addr(XrInstance instance, const char* name, PFN_xrVoidFunction* function)
{
    *function = test::mock_proc_addr(name);
    return *function ? XR_SUCCESS : XR_ERROR_FUNCTION_UNSUPPORTED;
}

} // namespace

TEST_CASE("loadExtensionFunction nulls the output on failure", "[oxr_funcs]")
{
    PFN_xrVoidFunction function = reinterpret_cast<PFN_xrVoidFunction>(0x1234);
    CHECK(loadExtensionFunction(test::MOCK_INSTANCE, &mock_get_proc_addr, "xrNotARealFunction", &function) ==
          XR_ERROR_FUNCTION_UNSUPPORTED);
    CHECK(function == nullptr);

    CHECK(loadExtensionFunction(test::MOCK_INSTANCE, nullptr, "xrStringToPath", &function) ==
          XR_ERROR_FUNCTION_UNSUPPORTED);

    CHECK(loadExtensionFunction(test::MOCK_INSTANCE, &mock_get_proc_addr, "xrStringToPath", &function) == XR_SUCCESS);
    CHECK(function != nullptr);
}

TEST_CASE("Core functions load through a resolver", "[oxr_funcs]")
{
    test::reset_mock_runtime();

    auto funcs = OpenXRCoreFunctions::load(test::MOCK_INSTANCE, &mock_get_proc_addr);
    CHECK(funcs.xrStringToPath != nullptr);
    CHECK(funcs.has_action_functions());

    // Missing action functions are tolerated, missing core ones are not
    auto partial = OpenXRCoreFunctions::load(
        [](const char* name) -> PFN_xrVoidFunction
        { return std::string(name) == "xrSyncActions" ? nullptr : test::mock_proc_addr(name); });
    CHECK_FALSE(partial.has_action_functions());

    CHECK_THROWS_AS(OpenXRCoreFunctions::load([](const char*) -> PFN_xrVoidFunction { return nullptr; }),
                    std::runtime_error);
}

TEST_CASE("Action set handle is destroyed exactly once", "[oxr_funcs]")
{
    test::reset_mock_runtime();
    auto funcs = OpenXRCoreFunctions::load(test::MOCK_INSTANCE, &mock_get_proc_addr);

    {
        XrActionSetCreateInfo info{ XR_TYPE_ACTION_SET_CREATE_INFO };
        XrActionSetPtr action_set = createActionSet(funcs, test::MOCK_INSTANCE, info);
        REQUIRE(action_set);

        XrActionSetPtr moved = std::move(action_set);
        CHECK_FALSE(action_set);
        CHECK(moved);
    }

    CHECK(test::call_count("xrCreateActionSet") == 1);
    CHECK(test::call_count("xrDestroyActionSet") == 1);
}
