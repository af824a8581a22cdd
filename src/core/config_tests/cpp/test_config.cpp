// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <config/xrext_config.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace xrext;
namespace fs = std::filesystem;

TEST_CASE("Absent keys keep their defaults", "[config]")
{
    XrExtConfig config = XrExtConfig::load_from_string("");

    CHECK(config.app_name == "xrext_demo");
    CHECK(config.log_level == logging::Level::Info);
    CHECK(config.extensions.empty());
    CHECK_FALSE(config.refresh_rate.preferred.has_value());
    CHECK(config.refresh_rate.candidates.empty());
    CHECK(config.render_model.stepper.left_controller_model_path == "/model_fb/controller/left");
    CHECK(config.render_model.stepper.right_controller_model_path == "/model_fb/controller/right");
    CHECK(config.render_model.stepper.with_animation);
    CHECK(config.render_model.draw_on_start);
    CHECK_FALSE(config.simultaneous_hands_and_controllers);
}

TEST_CASE("Every section is parsed", "[config]")
{
    XrExtConfig config = XrExtConfig::load_from_string(R"(
app_name: controller_viewer
log_level: diagnostic
extensions:
  - XR_FB_display_refresh_rate
  - XR_FB_render_model
refresh_rate:
  preferred: 90
  candidates: [60, 72, 90.5]
render_model:
  left_controller_model_path: /model_fb/controller/left_v2
  with_animation: false
  draw_on_start: false
simultaneous_hands_and_controllers: true
)");

    CHECK(config.app_name == "controller_viewer");
    CHECK(config.log_level == logging::Level::Diagnostic);
    CHECK(config.extensions == std::vector<std::string>{ "XR_FB_display_refresh_rate", "XR_FB_render_model" });
    CHECK(config.refresh_rate.preferred == 90.0f);
    CHECK(config.refresh_rate.candidates == std::vector<float>{ 60.0f, 72.0f, 90.5f });
    CHECK(config.render_model.stepper.left_controller_model_path == "/model_fb/controller/left_v2");
    CHECK(config.render_model.stepper.right_controller_model_path == "/model_fb/controller/right");
    CHECK_FALSE(config.render_model.stepper.with_animation);
    CHECK_FALSE(config.render_model.draw_on_start);
    CHECK(config.simultaneous_hands_and_controllers);
}

TEST_CASE("Bad values are reported as YAML parsing errors", "[config]")
{
    auto message_of = [](const std::string& yaml)
    {
        try
        {
            XrExtConfig::load_from_string(yaml);
        }
        catch (const std::runtime_error& e)
        {
            return std::string(e.what());
        }
        return std::string();
    };

    CHECK(message_of("log_level: chatty").rfind("YAML parsing error: unknown log_level", 0) == 0);
    CHECK(message_of("refresh_rate:\n  preferred: fast").rfind("YAML parsing error:", 0) == 0);
    CHECK(message_of("simultaneous_hands_and_controllers: maybe").rfind("YAML parsing error:", 0) == 0);
    CHECK(message_of("app_name: [unterminated").rfind("YAML parsing error:", 0) == 0);
    CHECK(message_of("- just\n- a list").rfind("YAML parsing error:", 0) == 0);
}

TEST_CASE("Config loads from a file", "[config]")
{
    const fs::path path = fs::temp_directory_path() / "xrext_config_test.yaml";
    {
        std::ofstream out(path);
        out << "app_name: from_file\nrender_model:\n  with_animation: false\n";
    }

    XrExtConfig config = XrExtConfig::load(path.string());
    CHECK(config.app_name == "from_file");
    CHECK_FALSE(config.render_model.stepper.with_animation);

    fs::remove(path);
    CHECK_THROWS_AS(XrExtConfig::load(path.string()), std::runtime_error);
}
