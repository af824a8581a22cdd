// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "xr_context.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace xrext
{

using StepperId = std::string;

struct StepperEvent
{
    StepperId from;
    std::string key;
    std::string value;
};

// What a stepper sees of the current frame
struct FrameToken
{
    std::vector<StepperEvent> event_report;
    uint64_t frame_index = 0;
};

/**
 * @brief Object hosted by the main loop.
 *
 * Lifecycle: start, then start_completed until it returns true, then check_event and draw
 * once per frame, then close(true) once followed by close(false) until it returns true.
 * All calls happen on the thread that drives the host.
 */
class IStepper
{
public:
    virtual ~IStepper() = default;

    // Returning false aborts this stepper only, the host drops it
    virtual bool start(const StepperId& id, XrContext& context) = 0;

    // Multi-frame initialization hook
    virtual bool start_completed()
    {
        return true;
    }

    // Disabled steppers receive neither events nor draw calls
    virtual bool enabled() const
    {
        return true;
    }

    virtual void check_event(const StepperId& from, const std::string& key, const std::string& value) = 0;

    virtual void draw(const FrameToken& token) = 0;

    // triggering is true on the first call only. Returns true once shutdown has completed.
    virtual bool close(bool triggering) = 0;
};

} // namespace xrext
