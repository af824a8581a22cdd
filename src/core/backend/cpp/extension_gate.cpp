// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/backend/extension_gate.hpp"

namespace xrext
{

bool probe(const IXrBackend& backend, const char* extension_name)
{
    return backend.xr_type() == BackendXRType::OpenXR && backend.ext_enabled(extension_name);
}

ProcResolver make_resolver(const IXrBackend& backend)
{
    return [&backend](const char* name) { return backend.get_proc_addr(name); };
}

} // namespace xrext
