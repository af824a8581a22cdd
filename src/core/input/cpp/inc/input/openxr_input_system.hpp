// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "input_system.hpp"

#include <backend/xr_backend.hpp>
#include <oxr_utils/oxr_funcs.hpp>

namespace xrext
{

// Reads both controllers through the OpenXR action system (Oculus Touch profile).
// Call update() once per frame before the steppers run.
class OpenXRInputSystem : public IInputSystem
{
public:
    // Throws std::runtime_error when the action system cannot be set up
    explicit OpenXRInputSystem(const IXrBackend& backend);

    ControllerSnapshot controller(Handed hand) const override;
    bool controller_menu_button() const override;

    // Returns false when xrSyncActions fails, snapshots keep their last values
    bool update();

private:
    const OpenXRCoreFunctions core_funcs_;
    XrSession session_;

    XrPath left_hand_path_;
    XrPath right_hand_path_;

    XrActionSetPtr action_set_;
    XrAction primary_click_action_;
    XrAction secondary_click_action_;
    XrAction thumbstick_action_;
    XrAction thumbstick_click_action_;
    XrAction squeeze_value_action_;
    XrAction trigger_value_action_;
    XrAction menu_click_action_;

    ControllerSnapshot left_;
    ControllerSnapshot right_;
    bool menu_pressed_ = false;
};

} // namespace xrext
