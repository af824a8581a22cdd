// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/stepper/render_model_stepper.hpp"

#include <logging/log.hpp>

#include <exception>
#include <initializer_list>
#include <utility>

namespace xrext
{

RenderModelStepper::RenderModelStepper(RenderModelStepperConfig config) : config_(std::move(config))
{
}

bool RenderModelStepper::start(const StepperId& id, XrContext& context)
{
    id_ = id;
    if (!context.backend || !context.input || !context.model_loader)
    {
        logging::err("[RenderModelStepper] " + id + ": context is missing a backend, input system or model loader");
        return false;
    }
    context_ = &context;

    render_model_ = XrFbRenderModel::create(*context.backend);
    if (!render_model_)
    {
        logging::warn("[RenderModelStepper] " + id + ": XR_FB_render_model unavailable, stepper not started");
        return false;
    }

    render_model_->explore_render_models();
    return true;
}

void RenderModelStepper::enable_drawing()
{
    if (drawing_)
    {
        return;
    }
    drawing_ = true;
    animator_.reset();

    try
    {
        render_model_->setup_controller_models(config_.left_controller_model_path,
                                               config_.right_controller_model_path,
                                               config_.with_animation,
                                               *context_->input,
                                               *context_->model_loader);
    }
    catch (const std::exception& e)
    {
        logging::err("[RenderModelStepper] Failed to set up controller models: " + std::string(e.what()));
    }
}

void RenderModelStepper::disable_drawing()
{
    if (!drawing_)
    {
        return;
    }
    drawing_ = false;
    render_model_->disable_controller_models(*context_->input);
}

void RenderModelStepper::check_event(const StepperId& from, const std::string& key, const std::string& value)
{
    if (key != DRAW_CONTROLLER_EVENT || !render_model_)
    {
        return;
    }

    logging::diag("[RenderModelStepper] " + key + "=" + value + " from " + from);
    if (value == "true")
    {
        enable_drawing();
    }
    else
    {
        disable_drawing();
    }
}

void RenderModelStepper::draw(const FrameToken& /*token*/)
{
    if (!drawing_)
    {
        return;
    }

    const IInputSystem& input = *context_->input;
    const bool menu = input.controller_menu_button();

    for (Handed hand : { Handed::Right, Handed::Left })
    {
        const float time = animator_.animation_time(hand, input.controller(hand), menu);
        last_time_[static_cast<size_t>(hand)] = time;

        if (!config_.with_animation)
        {
            continue;
        }
        std::shared_ptr<IModel> model = render_model_->cached_model(hand);
        if (model && model->anim_count() > 0)
        {
            model->set_anim_time(time);
        }
    }

    animator_.advance_frame();
}

bool RenderModelStepper::close(bool triggering)
{
    if (triggering)
    {
        if (render_model_)
        {
            render_model_->disable_controller_models(*context_->input);
            render_model_.reset();
        }
        drawing_ = false;
        shutdown_completed_ = true;
    }
    return shutdown_completed_;
}

} // namespace xrext
