// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <backend/xr_backend.hpp>
#include <input/input_system.hpp>
#include <input/model.hpp>

namespace xrext
{

// Collaborators handed to every stepper. Non-owning, they must outlive the host.
struct XrContext
{
    IXrBackend* backend = nullptr;
    IInputSystem* input = nullptr;
    IModelLoader* model_loader = nullptr;
};

} // namespace xrext
