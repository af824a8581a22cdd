// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <backend/xr_backend.hpp>
#include <input/input_system.hpp>
#include <input/model.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace xrext
{

constexpr const char* XR_FB_RENDER_MODEL_NAME = "XR_FB_render_model";

struct RenderModelProperties
{
    uint32_t vendor_id = 0;
    std::string model_name;
    uint32_t model_version = 0;
    uint64_t flags = 0;
};

bool is_render_model_extension_available(const IXrBackend& backend);

/**
 * @brief XR_FB_render_model access plus the per-hand controller model cache.
 *
 * Runtime failures are thrown as XrError carrying the XrResult. The instance and session are
 * read from the backend on every call, so an object must not outlive the session it was
 * created on.
 */
class XrFbRenderModel
{
public:
    // Returns nullptr and logs a warning when the extension or one of its symbols is missing
    static std::unique_ptr<XrFbRenderModel> create(const IXrBackend& backend);

    XrFbRenderModel(const XrFbRenderModel&) = delete;
    XrFbRenderModel& operator=(const XrFbRenderModel&) = delete;

    std::vector<std::string> enumerate_render_model_paths() const;

    // The model key is not exposed, it is only meaningful to load_render_model
    RenderModelProperties get_render_model_properties(const std::string& model_path) const;

    // glTF bytes of the model currently bound to the path
    std::vector<uint8_t> load_render_model(const std::string& model_path) const;

    XrPath string_to_path(const std::string& path) const;
    std::string path_to_string(XrPath path) const;

    // Logs every available path with its properties at diagnostic level
    void explore_render_models() const;

    // Loads and caches the model on first use, later calls return the cached one
    std::shared_ptr<IModel> get_controller_model(Handed hand, const std::string& model_path, IModelLoader& loader);

    // Right first, then left. Not transactional: models loaded before a failure stay cached.
    void setup_controller_models(const std::string& left_path,
                                 const std::string& right_path,
                                 bool with_animation,
                                 IInputSystem& input,
                                 IModelLoader& loader);

    // Clears both controller visuals in the input system, then drops the cache
    void disable_controller_models(IInputSystem& input);

    std::shared_ptr<IModel> cached_model(Handed hand) const
    {
        return cache_[static_cast<size_t>(hand)];
    }

private:
    struct Functions
    {
        PFN_xrEnumerateRenderModelPathsFB enumerate_paths = nullptr;
        PFN_xrGetRenderModelPropertiesFB get_properties = nullptr;
        PFN_xrLoadRenderModelFB load = nullptr;
        PFN_xrStringToPath string_to_path = nullptr;
        PFN_xrPathToString path_to_string = nullptr;
    };

    XrFbRenderModel(const IXrBackend& backend, const Functions& funcs);

    // Runs the properties query with the glTF capability request chained
    XrResult query_properties(XrPath path, XrRenderModelPropertiesFB& properties) const;

    const IXrBackend& backend_;
    const Functions funcs_;
    std::array<std::shared_ptr<IModel>, 2> cache_;
};

} // namespace xrext
