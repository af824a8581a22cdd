// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <backend/xr_backend.hpp>

#include <optional>
#include <vector>

namespace xrext::display_refresh_rate
{

constexpr const char* EXTENSION_NAME = "XR_FB_display_refresh_rate";

// Default candidate list for probe()
const std::vector<float>& usual_fps_suspects();

bool is_available(const IXrBackend& backend);

// Rates exactly as the runtime reports them, empty when unavailable or on failure
std::vector<float> enumerate(const IXrBackend& backend, bool with_log);

std::optional<float> get_current(const IXrBackend& backend);

// Request a new rate, the current rate is unchanged on failure
bool set(const IXrBackend& backend, float rate, bool with_log);

// Returns the candidates the runtime accepted. The rate active on entry is restored before
// returning, on every exit path.
std::vector<float> probe(const IXrBackend& backend, const std::vector<float>& candidates, bool with_log);

} // namespace xrext::display_refresh_rate
