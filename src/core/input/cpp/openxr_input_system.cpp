// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/input/openxr_input_system.hpp"

#include <backend/extension_gate.hpp>
#include <logging/log.hpp>

#include <cstring>
#include <stdexcept>
#include <vector>

namespace xrext
{

namespace
{

// Helper functions for getting OpenXR action states

XrPath xr_path_from_string(const OpenXRCoreFunctions& funcs, XrInstance instance, const char* s)
{
    XrPath path = XR_NULL_PATH;
    XrResult res = funcs.xrStringToPath(instance, s, &path);
    if (XR_FAILED(res))
    {
        throw std::runtime_error(std::string("xrStringToPath failed for '") + s + "': " + std::to_string(res));
    }
    return path;
}

OpenXRCoreFunctions load_action_functions(const IXrBackend& backend)
{
    if (backend.xr_type() != BackendXRType::OpenXR)
    {
        throw std::runtime_error("OpenXRInputSystem requires an OpenXR backend");
    }

    OpenXRCoreFunctions funcs = OpenXRCoreFunctions::load(make_resolver(backend));
    if (!funcs.has_action_functions())
    {
        throw std::runtime_error("Failed to load OpenXR action functions");
    }
    return funcs;
}

bool get_boolean_action_state(XrSession session, const OpenXRCoreFunctions& core_funcs, XrAction action, XrPath subaction_path)
{
    XrActionStateGetInfo get_info{ XR_TYPE_ACTION_STATE_GET_INFO };
    get_info.action = action;
    get_info.subactionPath = subaction_path;

    XrActionStateBoolean state{ XR_TYPE_ACTION_STATE_BOOLEAN };
    XrResult result = core_funcs.xrGetActionStateBoolean(session, &get_info, &state);
    if (XR_SUCCEEDED(result) && state.isActive)
    {
        return state.currentState;
    }
    return false;
}

// Returns false when the action is inactive, value is zeroed then
bool get_float_action_state(
    XrSession session, const OpenXRCoreFunctions& core_funcs, XrAction action, XrPath subaction_path, float& out_value)
{
    XrActionStateGetInfo get_info{ XR_TYPE_ACTION_STATE_GET_INFO };
    get_info.action = action;
    get_info.subactionPath = subaction_path;

    XrActionStateFloat state{ XR_TYPE_ACTION_STATE_FLOAT };
    XrResult result = core_funcs.xrGetActionStateFloat(session, &get_info, &state);
    if (XR_SUCCEEDED(result) && state.isActive)
    {
        out_value = state.currentState;
        return true;
    }
    out_value = 0.0f;
    return false;
}

bool get_vector2_action_state(XrSession session,
                              const OpenXRCoreFunctions& core_funcs,
                              XrAction action,
                              XrPath subaction_path,
                              float& out_x,
                              float& out_y)
{
    XrActionStateGetInfo get_info{ XR_TYPE_ACTION_STATE_GET_INFO };
    get_info.action = action;
    get_info.subactionPath = subaction_path;

    XrActionStateVector2f state{ XR_TYPE_ACTION_STATE_VECTOR2F };
    XrResult result = core_funcs.xrGetActionStateVector2f(session, &get_info, &state);
    if (XR_SUCCEEDED(result) && state.isActive)
    {
        out_x = state.currentState.x;
        out_y = state.currentState.y;
        return true;
    }
    out_x = out_y = 0.0f;
    return false;
}

XrAction create_action(const OpenXRCoreFunctions& funcs,
                       XrActionSet action_set,
                       XrPath left_hand_path,
                       XrPath right_hand_path,
                       const char* name,
                       const char* localized_name,
                       XrActionType type)
{
    XrAction out_action = XR_NULL_HANDLE;

    XrPath hand_paths[2] = { left_hand_path, right_hand_path };

    XrActionCreateInfo action_info{ XR_TYPE_ACTION_CREATE_INFO };
    action_info.actionType = type;
    strncpy(action_info.actionName, name, XR_MAX_ACTION_NAME_SIZE - 1);
    strncpy(action_info.localizedActionName, localized_name, XR_MAX_LOCALIZED_ACTION_NAME_SIZE - 1);
    action_info.countSubactionPaths = 2; // BOTH hands
    action_info.subactionPaths = hand_paths;

    XrResult res = funcs.xrCreateAction(action_set, &action_info, &out_action);
    if (XR_FAILED(res))
    {
        throw std::runtime_error(std::string("Failed to create action ") + name + ": " + std::to_string(res));
    }

    return out_action;
}

} // anonymous namespace

// Constructor - throws std::runtime_error on failure
OpenXRInputSystem::OpenXRInputSystem(const IXrBackend& backend)
    : core_funcs_(load_action_functions(backend)),
      session_(backend.session()),

      left_hand_path_(xr_path_from_string(core_funcs_, backend.instance(), "/user/hand/left")),
      right_hand_path_(xr_path_from_string(core_funcs_, backend.instance(), "/user/hand/right")),

      action_set_(createActionSet(core_funcs_,
                                  backend.instance(),
                                  { .type = XR_TYPE_ACTION_SET_CREATE_INFO,
                                    .actionSetName = "controller_input",
                                    .localizedActionSetName = "Controller Input" })),
      primary_click_action_(create_action(core_funcs_,
                                          action_set_.get(),
                                          left_hand_path_,
                                          right_hand_path_,
                                          "primary_click",
                                          "Primary Click",
                                          XR_ACTION_TYPE_BOOLEAN_INPUT)),
      secondary_click_action_(create_action(core_funcs_,
                                            action_set_.get(),
                                            left_hand_path_,
                                            right_hand_path_,
                                            "secondary_click",
                                            "Secondary Click",
                                            XR_ACTION_TYPE_BOOLEAN_INPUT)),
      thumbstick_action_(create_action(core_funcs_,
                                       action_set_.get(),
                                       left_hand_path_,
                                       right_hand_path_,
                                       "thumbstick",
                                       "Thumbstick",
                                       XR_ACTION_TYPE_VECTOR2F_INPUT)),
      thumbstick_click_action_(create_action(core_funcs_,
                                             action_set_.get(),
                                             left_hand_path_,
                                             right_hand_path_,
                                             "thumbstick_click",
                                             "Thumbstick Click",
                                             XR_ACTION_TYPE_BOOLEAN_INPUT)),
      squeeze_value_action_(create_action(core_funcs_,
                                          action_set_.get(),
                                          left_hand_path_,
                                          right_hand_path_,
                                          "squeeze_value",
                                          "Squeeze Value",
                                          XR_ACTION_TYPE_FLOAT_INPUT)),
      trigger_value_action_(create_action(core_funcs_,
                                          action_set_.get(),
                                          left_hand_path_,
                                          right_hand_path_,
                                          "trigger_value",
                                          "Trigger Value",
                                          XR_ACTION_TYPE_FLOAT_INPUT)),
      menu_click_action_(create_action(core_funcs_,
                                       action_set_.get(),
                                       left_hand_path_,
                                       right_hand_path_,
                                       "menu_click",
                                       "Menu Click",
                                       XR_ACTION_TYPE_BOOLEAN_INPUT))
{
    const XrInstance instance = backend.instance();

    std::vector<XrActionSuggestedBinding> bindings;
    auto add_binding = [&](XrAction action, const char* path)
    {
        XrPath binding_path;
        if (XR_SUCCEEDED(core_funcs_.xrStringToPath(instance, path, &binding_path)))
        {
            bindings.push_back({ action, binding_path });
        }
    };

    // Common bindings for both hands
    add_binding(thumbstick_action_, "/user/hand/left/input/thumbstick");
    add_binding(thumbstick_action_, "/user/hand/right/input/thumbstick");
    add_binding(thumbstick_click_action_, "/user/hand/left/input/thumbstick/click");
    add_binding(thumbstick_click_action_, "/user/hand/right/input/thumbstick/click");
    add_binding(squeeze_value_action_, "/user/hand/left/input/squeeze/value");
    add_binding(squeeze_value_action_, "/user/hand/right/input/squeeze/value");
    add_binding(trigger_value_action_, "/user/hand/left/input/trigger/value");
    add_binding(trigger_value_action_, "/user/hand/right/input/trigger/value");

    // Hand-specific button bindings
    add_binding(primary_click_action_, "/user/hand/left/input/x/click"); // Left: X
    add_binding(secondary_click_action_, "/user/hand/left/input/y/click"); // Left: Y
    add_binding(primary_click_action_, "/user/hand/right/input/a/click"); // Right: A
    add_binding(secondary_click_action_, "/user/hand/right/input/b/click"); // Right: B
    add_binding(menu_click_action_, "/user/hand/left/input/menu/click"); // Left only

    // Suggest bindings for Oculus Touch controller profile
    XrInteractionProfileSuggestedBinding suggested_bindings{ XR_TYPE_INTERACTION_PROFILE_SUGGESTED_BINDING };
    suggested_bindings.interactionProfile =
        xr_path_from_string(core_funcs_, instance, "/interaction_profiles/oculus/touch_controller");
    suggested_bindings.countSuggestedBindings = static_cast<uint32_t>(bindings.size());
    suggested_bindings.suggestedBindings = bindings.data();

    XrResult result = core_funcs_.xrSuggestInteractionProfileBindings(instance, &suggested_bindings);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to suggest interaction profile bindings: " + std::to_string(result));
    }

    // Attach action set to session
    XrActionSet action_set_handle = action_set_.get();
    XrSessionActionSetsAttachInfo attach_info{ XR_TYPE_SESSION_ACTION_SETS_ATTACH_INFO };
    attach_info.countActionSets = 1;
    attach_info.actionSets = &action_set_handle;

    result = core_funcs_.xrAttachSessionActionSets(session_, &attach_info);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to attach action sets: " + std::to_string(result));
    }

    logging::info("OpenXRInputSystem initialized (left + right, Oculus Touch profile)");
}

ControllerSnapshot OpenXRInputSystem::controller(Handed hand) const
{
    return hand == Handed::Left ? left_ : right_;
}

bool OpenXRInputSystem::controller_menu_button() const
{
    return menu_pressed_;
}

bool OpenXRInputSystem::update()
{
    // Sync actions
    XrActionsSyncInfo sync_info{ XR_TYPE_ACTIONS_SYNC_INFO };
    XrActiveActionSet active_action_set{ action_set_.get(), XR_NULL_PATH };
    sync_info.countActiveActionSets = 1;
    sync_info.activeActionSets = &active_action_set;

    XrResult result = core_funcs_.xrSyncActions(session_, &sync_info);
    if (XR_FAILED(result))
    {
        logging::err("[OpenXRInputSystem] xrSyncActions failed: " + std::to_string(result));
        return false;
    }

    auto update_controller = [&](XrPath hand_path, ControllerSnapshot& snapshot)
    {
        snapshot.x1_pressed = get_boolean_action_state(session_, core_funcs_, primary_click_action_, hand_path);
        snapshot.x2_pressed = get_boolean_action_state(session_, core_funcs_, secondary_click_action_, hand_path);
        snapshot.stick_clicked = get_boolean_action_state(session_, core_funcs_, thumbstick_click_action_, hand_path);

        bool stick_active = get_vector2_action_state(
            session_, core_funcs_, thumbstick_action_, hand_path, snapshot.stick_x, snapshot.stick_y);
        bool trigger_active =
            get_float_action_state(session_, core_funcs_, trigger_value_action_, hand_path, snapshot.trigger);
        bool grip_active = get_float_action_state(session_, core_funcs_, squeeze_value_action_, hand_path, snapshot.grip);

        snapshot.tracked = stick_active || trigger_active || grip_active;
    };

    update_controller(left_hand_path_, left_);
    update_controller(right_hand_path_, right_);
    menu_pressed_ = get_boolean_action_state(session_, core_funcs_, menu_click_action_, left_hand_path_);

    return true;
}

} // namespace xrext
