// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <input/input_system.hpp>

#include <cstdint>
#include <vector>

namespace xrext
{

// Key times into the controller model's single animation clip
namespace anim_time
{
constexpr float STICK_UP = 1.18f;
constexpr float STICK_DOWN = 1.26f;
constexpr float STICK_LEFT = 1.32f;
constexpr float STICK_RIGHT = 1.38f;
constexpr float STICK_DOWN_LEFT = 1.46f;
constexpr float STICK_UP_LEFT = 1.52f;
constexpr float STICK_UP_RIGHT = 1.58f;
constexpr float STICK_DOWN_RIGHT = 1.64f;

constexpr float TRIGGER_BASE = 0.60f;
constexpr float GRIP_BASE = 0.82f;
constexpr float ANALOG_SPAN = 0.06f;

constexpr float BUTTON_X1 = 0.18f;
constexpr float BUTTON_X2 = 0.32f;
constexpr float BUTTON_X1_X2 = 0.46f;
constexpr float MENU = 0.98f;

constexpr float IDLE = 4.40f;
constexpr float LEFT_HAND_SHIFT = 0.04f;
} // namespace anim_time

constexpr float STICK_DEADZONE = 0.25f;
constexpr float STICK_AXIS_THRESHOLD = 0.3f;
constexpr float ANALOG_THRESHOLD = 0.1f;

// Stick key time, 0 when the stick is inside the dead zone
float stick_animation_time(float x, float y);

// Every active input in fixed order: stick, trigger, grip, face buttons, menu. Empty when idle.
std::vector<float> active_animation_times(const ControllerSnapshot& snapshot, bool menu_pressed);

/**
 * @brief Maps controller input to a key time, cycling through simultaneous inputs.
 *
 * The frame counter is shared by both hands and advanced once per frame.
 */
class ControllerAnimator
{
public:
    // Right-hand time; the left hand is shifted by anim_time::LEFT_HAND_SHIFT
    float animation_time(Handed hand, const ControllerSnapshot& snapshot, bool menu_pressed) const;

    void advance_frame()
    {
        ++frame_counter_;
    }

    uint64_t frame_counter() const
    {
        return frame_counter_;
    }

    void reset()
    {
        frame_counter_ = 0;
    }

private:
    uint64_t frame_counter_ = 0;
};

} // namespace xrext
