// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/config/xrext_config.hpp"

#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace xrext
{

namespace
{

XrExtConfig parse_config(const YAML::Node& root)
{
    XrExtConfig config;
    if (!root || root.IsNull())
    {
        return config;
    }
    if (!root.IsMap())
    {
        throw std::runtime_error("YAML parsing error: top-level node must be a map");
    }

    try
    {
        if (root["app_name"])
            config.app_name = root["app_name"].as<std::string>();

        if (root["log_level"])
        {
            const std::string name = root["log_level"].as<std::string>();
            auto level = logging::parse_level(name);
            if (!level)
            {
                throw std::runtime_error("YAML parsing error: unknown log_level '" + name + "'");
            }
            config.log_level = *level;
        }

        if (root["extensions"] && root["extensions"].IsSequence())
        {
            for (const auto& ext : root["extensions"])
            {
                config.extensions.push_back(ext.as<std::string>());
            }
        }

        if (const YAML::Node refresh = root["refresh_rate"])
        {
            if (refresh["preferred"])
                config.refresh_rate.preferred = refresh["preferred"].as<float>();
            if (refresh["candidates"] && refresh["candidates"].IsSequence())
            {
                for (const auto& rate : refresh["candidates"])
                {
                    config.refresh_rate.candidates.push_back(rate.as<float>());
                }
            }
        }

        if (const YAML::Node render_model = root["render_model"])
        {
            RenderModelStepperConfig& stepper = config.render_model.stepper;
            if (render_model["left_controller_model_path"])
                stepper.left_controller_model_path = render_model["left_controller_model_path"].as<std::string>();
            if (render_model["right_controller_model_path"])
                stepper.right_controller_model_path = render_model["right_controller_model_path"].as<std::string>();
            if (render_model["with_animation"])
                stepper.with_animation = render_model["with_animation"].as<bool>();
            if (render_model["draw_on_start"])
                config.render_model.draw_on_start = render_model["draw_on_start"].as<bool>();
        }

        if (root["simultaneous_hands_and_controllers"])
            config.simultaneous_hands_and_controllers = root["simultaneous_hands_and_controllers"].as<bool>();
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }

    return config;
}

} // anonymous namespace

XrExtConfig XrExtConfig::load(const std::string& path)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
    return parse_config(root);
}

XrExtConfig XrExtConfig::load_from_string(const std::string& yaml)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml);
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
    return parse_config(root);
}

} // namespace xrext
