// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <input/openxr_input_system.hpp>
#include <test_utils/fakes.hpp>
#include <test_utils/mock_backend.hpp>

#include <algorithm>
#include <stdexcept>

using namespace xrext;

TEST_CASE("Input system binds the Oculus Touch profile", "[input]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;

    // Calls xrCreateActionSet, xrCreateAction, xrSuggestInteractionProfileBindings, xrAttachSessionActionSets
    OpenXRInputSystem input(backend);

    const auto& state = test::mock_state();
    CHECK(state.suggested_profile == "/interaction_profiles/oculus/touch_controller");
    CHECK(state.action_sets_attached);
    CHECK(test::call_count("xrCreateAction") == 7);
    CHECK(std::count(state.suggested_bindings.begin(), state.suggested_bindings.end(),
                     "/user/hand/left/input/menu/click") == 1);
}

TEST_CASE("Input system reports action state per hand", "[input]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;
    OpenXRInputSystem input(backend);

    auto& state = test::mock_state();
    state.float_states[{ "trigger_value", "/user/hand/right" }] = 0.5f;
    state.vector2_states[{ "thumbstick", "/user/hand/left" }] = XrVector2f{ 0.0f, 1.0f };
    state.boolean_states[{ "primary_click", "/user/hand/right" }] = true;
    state.boolean_states[{ "menu_click", "/user/hand/left" }] = true;

    REQUIRE(input.update());

    ControllerSnapshot right = input.controller(Handed::Right);
    CHECK(right.trigger == Catch::Approx(0.5f));
    CHECK(right.x1_pressed);
    CHECK_FALSE(right.x2_pressed);
    CHECK(right.tracked);

    ControllerSnapshot left = input.controller(Handed::Left);
    CHECK(left.stick_y == Catch::Approx(1.0f));
    CHECK(left.trigger == 0.0f);
    CHECK(left.tracked);

    CHECK(input.controller_menu_button());
}

TEST_CASE("Input system keeps snapshots when sync fails", "[input]")
{
    test::reset_mock_runtime();
    test::MockBackend backend;
    OpenXRInputSystem input(backend);

    test::mock_state().float_states[{ "squeeze_value", "/user/hand/left" }] = 0.8f;
    REQUIRE(input.update());

    test::mock_state().sync_result = XR_ERROR_SESSION_NOT_FOCUSED;
    test::mock_state().float_states.clear();
    CHECK_FALSE(input.update());
    CHECK(input.controller(Handed::Left).grip == Catch::Approx(0.8f));
}

TEST_CASE("Input system requires an OpenXR backend", "[input]")
{
    test::reset_mock_runtime();
    test::MockBackend backend({}, BackendXRType::Simulator);
    CHECK_THROWS_AS(OpenXRInputSystem{ backend }, std::runtime_error);

    test::MockBackend no_actions;
    no_actions.hide_symbol("xrSyncActions");
    CHECK_THROWS_AS(OpenXRInputSystem{ no_actions }, std::runtime_error);
}

TEST_CASE("Controller model slot holds a weak reference", "[input]")
{
    test::FakeInputSystem input;
    auto model = std::make_shared<test::FakeModel>(1);

    input.set_controller_model(Handed::Right, model);
    CHECK(input.controller_model(Handed::Right) == model);
    CHECK(input.controller_model(Handed::Left) == nullptr);

    model.reset();
    CHECK(input.controller_model(Handed::Right) == nullptr);

    auto other = std::make_shared<test::FakeModel>(0);
    input.set_controller_model(Handed::Left, other);
    input.set_controller_model(Handed::Left, nullptr);
    CHECK(input.controller_model(Handed::Left) == nullptr);
}
