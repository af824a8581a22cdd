// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Define XR_NO_PROTOTYPES to prevent OpenXR headers from declaring function prototypes
// This forces us to use xrGetInstanceProcAddr for all OpenXR functions
#define XR_NO_PROTOTYPES

#include <openxr/openxr.h>

#include "oxr_enumerate.hpp"

#include <cassert>
#include <functional>
#include <stdexcept>
#include <string>

// When XR_NO_PROTOTYPES is defined, even xrGetInstanceProcAddr is not declared
// We need to manually declare it here so we can bootstrap the dynamic loading
// This will use whatever OpenXR loader is already loaded in the process
extern "C"
{
    XRAPI_ATTR XrResult XRAPI_CALL xrGetInstanceProcAddr(XrInstance instance,
                                                         const char* name,
                                                         PFN_xrVoidFunction* function);
}

namespace xrext
{

// Resolve one function by name. Leaves *function null when the runtime does not provide it.
inline XrResult loadExtensionFunction(XrInstance instance,
                                      PFN_xrGetInstanceProcAddr getProcAddr,
                                      const char* name,
                                      PFN_xrVoidFunction* function)
{
    assert(function);
    *function = nullptr;
    if (!getProcAddr)
    {
        return XR_ERROR_FUNCTION_UNSUPPORTED;
    }

    XrResult result = getProcAddr(instance, name, function);
    if (XR_FAILED(result))
    {
        *function = nullptr;
    }
    return result;
}

// Resolves a function by name, returns nullptr when it is not provided
using ProcResolver = std::function<PFN_xrVoidFunction(const char*)>;

// Helper structure to hold dynamically loaded core OpenXR function pointers
// These are the core functions used by the extension subsystems and the input system (not extensions)
struct OpenXRCoreFunctions
{
    PFN_xrGetSystemProperties xrGetSystemProperties;
    PFN_xrStringToPath xrStringToPath;
    PFN_xrPathToString xrPathToString;

    // Action system functions (for controller input)
    PFN_xrCreateActionSet xrCreateActionSet;
    PFN_xrDestroyActionSet xrDestroyActionSet;
    PFN_xrCreateAction xrCreateAction;
    PFN_xrSuggestInteractionProfileBindings xrSuggestInteractionProfileBindings;
    PFN_xrAttachSessionActionSets xrAttachSessionActionSets;
    PFN_xrSyncActions xrSyncActions;
    PFN_xrGetActionStateBoolean xrGetActionStateBoolean;
    PFN_xrGetActionStateFloat xrGetActionStateFloat;
    PFN_xrGetActionStateVector2f xrGetActionStateVector2f;

    bool has_action_functions() const
    {
        return xrCreateActionSet && xrDestroyActionSet && xrCreateAction && xrSuggestInteractionProfileBindings &&
               xrAttachSessionActionSets && xrSyncActions && xrGetActionStateBoolean && xrGetActionStateFloat &&
               xrGetActionStateVector2f;
    }

    // Load all core functions through the resolver - throws if a required one is missing
    static OpenXRCoreFunctions load(const ProcResolver& resolve)
    {
        assert(resolve);

        OpenXRCoreFunctions results{};
        results.xrGetSystemProperties = reinterpret_cast<PFN_xrGetSystemProperties>(resolve("xrGetSystemProperties"));
        results.xrStringToPath = reinterpret_cast<PFN_xrStringToPath>(resolve("xrStringToPath"));
        results.xrPathToString = reinterpret_cast<PFN_xrPathToString>(resolve("xrPathToString"));

        if (!results.xrGetSystemProperties || !results.xrStringToPath || !results.xrPathToString)
        {
            throw std::runtime_error("Failed to load core OpenXR functions");
        }

        // Action system functions are optional, only the input system needs them
        results.xrCreateActionSet = reinterpret_cast<PFN_xrCreateActionSet>(resolve("xrCreateActionSet"));
        results.xrDestroyActionSet = reinterpret_cast<PFN_xrDestroyActionSet>(resolve("xrDestroyActionSet"));
        results.xrCreateAction = reinterpret_cast<PFN_xrCreateAction>(resolve("xrCreateAction"));
        results.xrSuggestInteractionProfileBindings =
            reinterpret_cast<PFN_xrSuggestInteractionProfileBindings>(resolve("xrSuggestInteractionProfileBindings"));
        results.xrAttachSessionActionSets =
            reinterpret_cast<PFN_xrAttachSessionActionSets>(resolve("xrAttachSessionActionSets"));
        results.xrSyncActions = reinterpret_cast<PFN_xrSyncActions>(resolve("xrSyncActions"));
        results.xrGetActionStateBoolean = reinterpret_cast<PFN_xrGetActionStateBoolean>(resolve("xrGetActionStateBoolean"));
        results.xrGetActionStateFloat = reinterpret_cast<PFN_xrGetActionStateFloat>(resolve("xrGetActionStateFloat"));
        results.xrGetActionStateVector2f =
            reinterpret_cast<PFN_xrGetActionStateVector2f>(resolve("xrGetActionStateVector2f"));

        return results;
    }

    static OpenXRCoreFunctions load(XrInstance instance, PFN_xrGetInstanceProcAddr getProcAddr)
    {
        return load(
            [instance, getProcAddr](const char* name)
            {
                PFN_xrVoidFunction function = nullptr;
                loadExtensionFunction(instance, getProcAddr, name, &function);
                return function;
            });
    }
};

// Helper to wrap OpenXR handles in unique_ptr-like semantics
template <typename HandleType>
class OpenXRHandle
{
public:
    // Default constructor creates an empty/moved-from state
    OpenXRHandle() : handle_(XR_NULL_HANDLE), deleter_(nullptr)
    {
    }

    OpenXRHandle(HandleType handle, std::function<void(HandleType)> deleter)
        : handle_(handle), deleter_(std::move(deleter))
    {
    }

    ~OpenXRHandle()
    {
        reset();
    }

    // Move semantics only
    OpenXRHandle(OpenXRHandle&& other) noexcept : handle_(other.handle_), deleter_(std::move(other.deleter_))
    {
        other.handle_ = XR_NULL_HANDLE;
    }

    OpenXRHandle& operator=(OpenXRHandle&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            handle_ = other.handle_;
            deleter_ = std::move(other.deleter_);
            other.handle_ = XR_NULL_HANDLE;
        }
        return *this;
    }

    OpenXRHandle(const OpenXRHandle&) = delete;
    OpenXRHandle& operator=(const OpenXRHandle&) = delete;

    HandleType get() const
    {
        return handle_;
    }
    HandleType operator*() const
    {
        return handle_;
    }
    explicit operator bool() const
    {
        return handle_ != XR_NULL_HANDLE;
    }

    // Give up ownership without destroying
    HandleType release()
    {
        HandleType handle = handle_;
        handle_ = XR_NULL_HANDLE;
        return handle;
    }

    void reset()
    {
        if (handle_ != XR_NULL_HANDLE)
        {
            assert(deleter_);
            deleter_(handle_);
            handle_ = XR_NULL_HANDLE;
        }
    }

private:
    HandleType handle_;
    std::function<void(HandleType)> deleter_;
};

using XrActionSetPtr = OpenXRHandle<XrActionSet>;
using XrSwapchainPtr = OpenXRHandle<XrSwapchain>;

// Create an action set with automatic cleanup - throws on failure
inline XrActionSetPtr createActionSet(const OpenXRCoreFunctions& funcs,
                                      XrInstance instance,
                                      const XrActionSetCreateInfo& createInfo)
{
    XrActionSet actionSet = XR_NULL_HANDLE;
    XrResult result = funcs.xrCreateActionSet(instance, &createInfo, &actionSet);

    if (XR_FAILED(result))
    {
        throw XrError("xrCreateActionSet", result);
    }

    auto deleter = [destroyFunc = funcs.xrDestroyActionSet](XrActionSet handle)
    {
        assert(destroyFunc);
        destroyFunc(handle);
    };

    return XrActionSetPtr(actionSet, deleter);
}

} // namespace xrext
