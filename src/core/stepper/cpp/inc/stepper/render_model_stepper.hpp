// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "controller_animator.hpp"
#include "stepper.hpp"

#include <extensions/render_model.hpp>

#include <array>
#include <memory>
#include <string>

namespace xrext
{

constexpr const char* DRAW_CONTROLLER_EVENT = "draw_controller";

struct RenderModelStepperConfig
{
    std::string left_controller_model_path = "/model_fb/controller/left";
    std::string right_controller_model_path = "/model_fb/controller/right";
    bool with_animation = true;
};

/**
 * @brief Shows the runtime's controller models and animates them from controller input.
 *
 * Drawing is toggled by the draw_controller event ("true" enables, anything else disables).
 */
class RenderModelStepper : public IStepper
{
public:
    explicit RenderModelStepper(RenderModelStepperConfig config = {});

    bool start(const StepperId& id, XrContext& context) override;
    void check_event(const StepperId& from, const std::string& key, const std::string& value) override;
    void draw(const FrameToken& token) override;
    bool close(bool triggering) override;

    bool is_drawing() const
    {
        return drawing_;
    }

    // Last time emitted for the hand, shift included. Idle until the first draw.
    float last_animation_time(Handed hand) const
    {
        return last_time_[static_cast<size_t>(hand)];
    }

    uint64_t frame_counter() const
    {
        return animator_.frame_counter();
    }

    const XrFbRenderModel* render_model() const
    {
        return render_model_.get();
    }

    const RenderModelStepperConfig& config() const
    {
        return config_;
    }

private:
    void enable_drawing();
    void disable_drawing();

    RenderModelStepperConfig config_;
    StepperId id_;
    XrContext* context_ = nullptr;
    std::unique_ptr<XrFbRenderModel> render_model_;
    ControllerAnimator animator_;
    std::array<float, 2> last_time_{ anim_time::IDLE + anim_time::LEFT_HAND_SHIFT, anim_time::IDLE };
    bool drawing_ = false;
    bool shutdown_completed_ = false;
};

} // namespace xrext
