// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Loader entry points backed by the mock runtime, so OpenXRSession runs without a real runtime

#include <openxr/openxr.h>
#include <test_utils/mock_runtime.hpp>

#include <algorithm>
#include <cstring>
#include <string>

using xrext::test::mock_state;

extern "C"
{

    XRAPI_ATTR XrResult XRAPI_CALL xrEnumerateInstanceExtensionProperties(const char* layerName,
                                                                          uint32_t propertyCapacityInput,
                                                                          uint32_t* propertyCountOutput,
                                                                          XrExtensionProperties* properties)
    {
        const auto& extensions = mock_state().instance_extensions;
        *propertyCountOutput = static_cast<uint32_t>(extensions.size());
        if (propertyCapacityInput == 0)
        {
            return XR_SUCCESS;
        }
        if (propertyCapacityInput < *propertyCountOutput)
        {
            return XR_ERROR_SIZE_INSUFFICIENT;
        }
        for (size_t i = 0; i < extensions.size(); ++i)
        {
            std::strncpy(properties[i].extensionName, extensions[i].c_str(), XR_MAX_EXTENSION_NAME_SIZE - 1);
            properties[i].extensionVersion = 1;
        }
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateInstance(const XrInstanceCreateInfo* createInfo, XrInstance* instance)
    {
        auto& state = mock_state();
        state.created_with_extensions.clear();
        for (uint32_t i = 0; i < createInfo->enabledExtensionCount; ++i)
        {
            state.created_with_extensions.emplace_back(createInfo->enabledExtensionNames[i]);
        }
        state.instance_alive = true;
        *instance = xrext::test::MOCK_INSTANCE;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroyInstance(XrInstance instance)
    {
        mock_state().instance_alive = false;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrGetSystem(XrInstance instance, const XrSystemGetInfo* getInfo, XrSystemId* systemId)
    {
        *systemId = xrext::test::MOCK_SYSTEM_ID;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateSession(XrInstance instance,
                                                   const XrSessionCreateInfo* createInfo,
                                                   XrSession* session)
    {
        mock_state().session_alive = true;
        *session = xrext::test::MOCK_SESSION;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroySession(XrSession session)
    {
        mock_state().session_alive = false;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateReferenceSpace(XrSession session,
                                                          const XrReferenceSpaceCreateInfo* createInfo,
                                                          XrSpace* space)
    {
        *space = xrext::test::MOCK_SPACE;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroySpace(XrSpace space)
    {
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrEnumerateViewConfigurations(XrInstance instance,
                                                                 XrSystemId systemId,
                                                                 uint32_t viewConfigurationTypeCapacityInput,
                                                                 uint32_t* viewConfigurationTypeCountOutput,
                                                                 XrViewConfigurationType* viewConfigurationTypes)
    {
        *viewConfigurationTypeCountOutput = 1;
        if (viewConfigurationTypeCapacityInput == 0)
        {
            return XR_SUCCESS;
        }
        viewConfigurationTypes[0] = XR_VIEW_CONFIGURATION_TYPE_PRIMARY_STEREO;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrBeginSession(XrSession session, const XrSessionBeginInfo* beginInfo)
    {
        mock_state().session_begun = true;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrGetInstanceProcAddr(XrInstance instance,
                                                         const char* name,
                                                         PFN_xrVoidFunction* function)
    {
        *function = xrext::test::mock_proc_addr(name);
        return *function ? XR_SUCCESS : XR_ERROR_FUNCTION_UNSUPPORTED;
    }

} // extern "C"
