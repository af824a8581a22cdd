// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <extensions/render_model.hpp>
#include <test_utils/fakes.hpp>
#include <test_utils/mock_backend.hpp>

#include <functional>
#include <stdexcept>

using namespace xrext;

namespace
{

constexpr const char* LEFT_PATH = "/model_fb/controller/left";
constexpr const char* RIGHT_PATH = "/model_fb/controller/right";

// Both controllers connected, plus a disconnected keyboard
void setup_runtime()
{
    test::reset_mock_runtime();
    test::add_mock_render_model(LEFT_PATH, "Quest Touch Left");
    test::add_mock_render_model(RIGHT_PATH, "Quest Touch Right").flags = 0x3;
    test::add_mock_render_model("/model_fb/keyboard/local", "Keyboard").connected = false;
}

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

} // namespace

TEST_CASE("Render model is unavailable without the extension", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend;

    CHECK_FALSE(is_render_model_extension_available(backend));
    CHECK(XrFbRenderModel::create(backend) == nullptr);

    test::MockBackend missing_symbol({ XR_FB_RENDER_MODEL_NAME });
    missing_symbol.hide_symbol("xrLoadRenderModelFB");
    CHECK(XrFbRenderModel::create(missing_symbol) == nullptr);

    CHECK(test::total_calls() == 0);
}

TEST_CASE("Paths round-trip through the runtime", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);

    auto paths = render_model->enumerate_render_model_paths();
    REQUIRE(paths.size() == 3);
    CHECK(paths[0] == LEFT_PATH);

    for (const auto& path : paths)
    {
        CHECK(render_model->path_to_string(render_model->string_to_path(path)) == path);
    }
}

TEST_CASE("Properties request the glTF subset capability", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);

    RenderModelProperties properties = render_model->get_render_model_properties(RIGHT_PATH);
    CHECK(properties.model_name == "Quest Touch Right");
    CHECK(properties.vendor_id == 0x2833);
    CHECK(properties.flags == 0x3);
    CHECK(test::mock_state().capability_request_chained);
    CHECK(test::mock_state().capability_request_flags == XR_RENDER_MODEL_SUPPORTS_GLTF_2_0_SUBSET_2_BIT_FB);

    // Disconnected devices surface the qualified success code as an error
    CHECK(error_of([&] { render_model->get_render_model_properties("/model_fb/keyboard/local"); }) ==
          XR_RENDER_MODEL_UNAVAILABLE_FB);
}

TEST_CASE("Model bytes are loaded with the two-call idiom", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);

    auto data = render_model->load_render_model(LEFT_PATH);
    CHECK(data == test::mock_state().render_models[0].data);
    CHECK(test::call_count("xrLoadRenderModelFB") == 2);

    // Unavailable properties still attempt the load, with a null key
    CHECK(error_of([&] { render_model->load_render_model("/model_fb/keyboard/local"); }) ==
          XR_ERROR_RENDER_MODEL_KEY_INVALID_FB);

    test::mock_state().load_result = XR_ERROR_RUNTIME_FAILURE;
    CHECK(error_of([&] { render_model->load_render_model(LEFT_PATH); }) == XR_ERROR_RUNTIME_FAILURE);
}

TEST_CASE("Malformed path strings are validation failures", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);

    const std::string interior_nul("/model_fb/contr\0ller", 20);
    CHECK(error_of([&] { render_model->string_to_path(interior_nul); }) == XR_ERROR_VALIDATION_FAILURE);
    CHECK(test::call_count("xrStringToPath") == 0);

    XrPath bad_utf8 = test::mock_path("/model_fb/\xC3\x28");
    CHECK(error_of([&] { render_model->path_to_string(bad_utf8); }) == XR_ERROR_VALIDATION_FAILURE);

    XrPath truncated = test::mock_path("/model_fb/\xE2\x82");
    CHECK(error_of([&] { render_model->path_to_string(truncated); }) == XR_ERROR_VALIDATION_FAILURE);

    XrPath accented = test::mock_path("/model_fb/caf\xC3\xA9");
    CHECK(render_model->path_to_string(accented) == "/model_fb/caf\xC3\xA9");

    CHECK(error_of([&] { render_model->path_to_string(9999); }) == XR_ERROR_PATH_INVALID);
}

TEST_CASE("Exploration logs every path", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);

    test::LogCapture capture;
    render_model->explore_render_models();

    CHECK(capture.contains(std::string("Available render model: ") + LEFT_PATH));
    CHECK(capture.contains("--Model: Quest Touch Right"));
    CHECK(capture.contains("Model flags: 0x3"));
    CHECK(capture.contains("No connected device for model: /model_fb/keyboard/local"));

    test::mock_state().enumerate_paths_result = XR_ERROR_SESSION_LOST;
    render_model->explore_render_models();
    CHECK(capture.contains("Failed to explore render models"));
}

TEST_CASE("Controller models are loaded once per hand", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);
    test::FakeModelLoader loader;

    auto first = render_model->get_controller_model(Handed::Left, LEFT_PATH, loader);
    auto second = render_model->get_controller_model(Handed::Left, LEFT_PATH, loader);

    CHECK(first == second);
    REQUIRE(loader.filenames.size() == 1);
    CHECK(loader.filenames[0] == std::string(LEFT_PATH) + ".gltf");
    CHECK(loader.byte_counts[0] == 8);

    auto model = std::dynamic_pointer_cast<test::FakeModel>(first);
    REQUIRE(model->root_transform.has_value());
    CHECK(model->root_transform->orientation.w == 1.0f);
    CHECK(model->root_transform->position.x == 0.0f);

    CHECK(render_model->cached_model(Handed::Right) == nullptr);
}

TEST_CASE("A loader returning nothing is an error", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);

    test::FakeModelLoader loader;
    loader.return_null = true;
    CHECK_THROWS_AS(render_model->get_controller_model(Handed::Right, RIGHT_PATH, loader), std::runtime_error);
    CHECK(render_model->cached_model(Handed::Right) == nullptr);
}

TEST_CASE("Setup binds both hands and plays the first animation", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);
    test::FakeModelLoader loader;
    test::FakeInputSystem input;

    render_model->setup_controller_models(LEFT_PATH, RIGHT_PATH, true, input, loader);

    // Right is loaded first
    REQUIRE(loader.filenames.size() == 2);
    CHECK(loader.filenames[0] == std::string(RIGHT_PATH) + ".gltf");

    for (Handed hand : { Handed::Left, Handed::Right })
    {
        auto model = std::dynamic_pointer_cast<test::FakeModel>(input.controller_model(hand));
        REQUIRE(model);
        CHECK(model == render_model->cached_model(hand));
        REQUIRE(model->played.size() == 1);
        CHECK(model->played[0].first == 0);
        CHECK(model->played[0].second == AnimMode::Loop);
    }

    render_model->disable_controller_models(input);
    CHECK(input.controller_model(Handed::Left) == nullptr);
    CHECK(input.controller_model(Handed::Right) == nullptr);
    CHECK(render_model->cached_model(Handed::Left) == nullptr);
}

TEST_CASE("Unexpected animation counts are warned about", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);
    test::FakeInputSystem input;

    SECTION("no animation")
    {
        test::FakeModelLoader loader;
        loader.anim_count = 0;
        test::LogCapture capture;
        render_model->setup_controller_models(LEFT_PATH, RIGHT_PATH, true, input, loader);

        CHECK(capture.contains("controller model has no animation"));
        auto model = std::dynamic_pointer_cast<test::FakeModel>(render_model->cached_model(Handed::Left));
        CHECK(model->played.empty());
    }

    SECTION("several animations")
    {
        test::FakeModelLoader loader;
        loader.anim_count = 3;
        test::LogCapture capture;
        render_model->setup_controller_models(LEFT_PATH, RIGHT_PATH, true, input, loader);

        CHECK(capture.contains("only the first one is played"));
        auto model = std::dynamic_pointer_cast<test::FakeModel>(render_model->cached_model(Handed::Right));
        CHECK(model->played.size() == 1);
    }

    SECTION("animation disabled")
    {
        test::FakeModelLoader loader;
        render_model->setup_controller_models(LEFT_PATH, RIGHT_PATH, false, input, loader);
        auto model = std::dynamic_pointer_cast<test::FakeModel>(render_model->cached_model(Handed::Right));
        CHECK(model->played.empty());
    }
}

TEST_CASE("Setup is not transactional", "[render_model]")
{
    setup_runtime();
    test::MockBackend backend({ XR_FB_RENDER_MODEL_NAME });
    auto render_model = XrFbRenderModel::create(backend);
    REQUIRE(render_model);
    test::FakeModelLoader loader;
    test::FakeInputSystem input;

    CHECK_THROWS_AS(render_model->setup_controller_models("/model_fb/missing", RIGHT_PATH, true, input, loader),
                    XrError);

    // Right finished before left failed
    CHECK(render_model->cached_model(Handed::Right) != nullptr);
    CHECK(input.controller_model(Handed::Right) != nullptr);
    CHECK(render_model->cached_model(Handed::Left) == nullptr);
}
