// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "model.hpp"

#include <array>
#include <memory>

namespace xrext
{

enum class Handed
{
    Left = 0,
    Right = 1
};

inline const char* handed_name(Handed hand)
{
    return hand == Handed::Left ? "left" : "right";
}

// Controller state for one frame
struct ControllerSnapshot
{
    float stick_x = 0.0f;
    float stick_y = 0.0f;
    float trigger = 0.0f;
    float grip = 0.0f;
    bool x1_pressed = false;
    bool x2_pressed = false;
    bool stick_clicked = false;
    bool tracked = false;
};

// Controller input plus the per-hand controller visual slot.
// The slot holds a weak reference, the owner of the model decides its lifetime.
class IInputSystem
{
public:
    virtual ~IInputSystem() = default;

    virtual ControllerSnapshot controller(Handed hand) const = 0;
    virtual bool controller_menu_button() const = 0;

    // nullptr clears the slot
    void set_controller_model(Handed hand, const std::shared_ptr<IModel>& model)
    {
        models_[static_cast<size_t>(hand)] = model;
    }

    std::shared_ptr<IModel> controller_model(Handed hand) const
    {
        return models_[static_cast<size_t>(hand)].lock();
    }

private:
    std::array<std::weak_ptr<IModel>, 2> models_;
};

} // namespace xrext
