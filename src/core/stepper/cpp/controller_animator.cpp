// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/stepper/controller_animator.hpp"

#include <cmath>

namespace xrext
{

float stick_animation_time(float x, float y)
{
    if (std::sqrt(x * x + y * y) <= STICK_DEADZONE)
    {
        return 0.0f;
    }

    bool horizontal = std::fabs(x) > STICK_AXIS_THRESHOLD;
    bool vertical = std::fabs(y) > STICK_AXIS_THRESHOLD;

    // Between the dead zone and the axis threshold the dominant axis wins
    if (!horizontal && !vertical)
    {
        horizontal = std::fabs(x) > std::fabs(y);
        vertical = !horizontal;
    }

    if (horizontal && vertical)
    {
        if (y > 0.0f)
        {
            return x > 0.0f ? anim_time::STICK_UP_RIGHT : anim_time::STICK_UP_LEFT;
        }
        return x > 0.0f ? anim_time::STICK_DOWN_RIGHT : anim_time::STICK_DOWN_LEFT;
    }
    if (horizontal)
    {
        return x > 0.0f ? anim_time::STICK_RIGHT : anim_time::STICK_LEFT;
    }
    return y > 0.0f ? anim_time::STICK_UP : anim_time::STICK_DOWN;
}

std::vector<float> active_animation_times(const ControllerSnapshot& snapshot, bool menu_pressed)
{
    std::vector<float> times;

    const float stick = stick_animation_time(snapshot.stick_x, snapshot.stick_y);
    if (stick > 0.0f)
    {
        times.push_back(stick);
    }
    if (snapshot.trigger > ANALOG_THRESHOLD)
    {
        times.push_back(anim_time::TRIGGER_BASE + anim_time::ANALOG_SPAN * snapshot.trigger);
    }
    if (snapshot.grip > ANALOG_THRESHOLD)
    {
        times.push_back(anim_time::GRIP_BASE + anim_time::ANALOG_SPAN * snapshot.grip);
    }
    if (snapshot.x1_pressed && snapshot.x2_pressed)
    {
        times.push_back(anim_time::BUTTON_X1_X2);
    }
    else if (snapshot.x1_pressed)
    {
        times.push_back(anim_time::BUTTON_X1);
    }
    else if (snapshot.x2_pressed)
    {
        times.push_back(anim_time::BUTTON_X2);
    }
    if (menu_pressed)
    {
        times.push_back(anim_time::MENU);
    }
    return times;
}

float ControllerAnimator::animation_time(Handed hand, const ControllerSnapshot& snapshot, bool menu_pressed) const
{
    const std::vector<float> times = active_animation_times(snapshot, menu_pressed);

    float time = anim_time::IDLE;
    if (!times.empty())
    {
        time = times[frame_counter_ % times.size()];
    }
    if (hand == Handed::Left)
    {
        time += anim_time::LEFT_HAND_SHIFT;
    }
    return time;
}

} // namespace xrext
