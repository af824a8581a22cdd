// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <logging/log.hpp>
#include <stepper/render_model_stepper.hpp>

#include <optional>
#include <string>
#include <vector>

namespace xrext
{

struct RefreshRateConfig
{
    // Requested after the session starts when set
    std::optional<float> preferred;
    // Empty means the usual-FPS suspects
    std::vector<float> candidates;
};

struct RenderModelConfig
{
    RenderModelStepperConfig stepper;
    bool draw_on_start = true;
};

/**
 * @brief Application configuration read from YAML.
 *
 * Absent keys keep their defaults. Parse and type errors are thrown as
 * std::runtime_error("YAML parsing error: ...").
 */
struct XrExtConfig
{
    std::string app_name = "xrext_demo";
    logging::Level log_level = logging::Level::Info;
    std::vector<std::string> extensions;
    RefreshRateConfig refresh_rate;
    RenderModelConfig render_model;
    bool simultaneous_hands_and_controllers = false;

    static XrExtConfig load(const std::string& path);
    static XrExtConfig load_from_string(const std::string& yaml);
};

} // namespace xrext
