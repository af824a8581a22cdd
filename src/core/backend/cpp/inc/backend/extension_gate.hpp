// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "xr_backend.hpp"

#include <oxr_utils/oxr_funcs.hpp>

#include <optional>

namespace xrext
{

// True iff the backend is OpenXR and the runtime reports the extension enabled
bool probe(const IXrBackend& backend, const char* extension_name);

// Resolves a symbol typed as T. Callers must not keep the pointer past the session.
template <typename T>
std::optional<T> resolve(const IXrBackend& backend, const char* symbol)
{
    return backend.get_function<T>(symbol);
}

// Resolve into an existing slot, returns false when the symbol is missing
template <typename T>
bool resolve_into(const IXrBackend& backend, const char* symbol, T& out)
{
    auto function = resolve<T>(backend, symbol);
    out = function.value_or(nullptr);
    return out != nullptr;
}

// Adapts the backend to the resolver used by OpenXRCoreFunctions::load
ProcResolver make_resolver(const IXrBackend& backend);

} // namespace xrext
