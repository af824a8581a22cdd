// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <backend/xr_backend.hpp>

namespace xrext::simultaneous_hands
{

constexpr const char* EXTENSION_NAME = "XR_META_simultaneous_hands_and_controllers";

bool is_available(const IXrBackend& backend);

// Asks the system whether hands and controllers can be tracked at the same time
bool is_supported(const IXrBackend& backend, bool with_log);

// Both return false when unsupported or when the runtime call fails.
// Repeated calls are left to the runtime.
bool resume(const IXrBackend& backend, bool with_log);
bool pause(const IXrBackend& backend, bool with_log);

} // namespace xrext::simultaneous_hands
