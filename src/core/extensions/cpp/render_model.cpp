// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/extensions/render_model.hpp"

#include <backend/extension_gate.hpp>
#include <logging/log.hpp>

#include <cstring>
#include <sstream>
#include <stdexcept>

namespace xrext
{

namespace
{

bool is_valid_utf8(const std::string& s)
{
    size_t i = 0;
    while (i < s.size())
    {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        uint32_t code_point = 0;
        if (c < 0x80)
        {
            ++i;
            continue;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            code_point = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            code_point = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            code_point = c & 0x07;
        }
        else
        {
            return false;
        }

        if (i + extra >= s.size())
        {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k)
        {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80)
            {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and out of range values
        static constexpr uint32_t min_value[] = { 0, 0x80, 0x800, 0x10000 };
        if (code_point < min_value[extra] || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF))
        {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string model_name_from(const char* name, size_t capacity)
{
    size_t length = 0;
    while (length < capacity && name[length] != '\0')
    {
        ++length;
    }
    return std::string(name, length);
}

} // anonymous namespace

bool is_render_model_extension_available(const IXrBackend& backend)
{
    return probe(backend, XR_FB_RENDER_MODEL_NAME);
}

std::unique_ptr<XrFbRenderModel> XrFbRenderModel::create(const IXrBackend& backend)
{
    if (!is_render_model_extension_available(backend))
    {
        logging::warn("[XrFbRenderModel] XR_FB_render_model extension not available");
        return nullptr;
    }

    Functions funcs;
    bool loaded = true;
    loaded &= resolve_into(backend, "xrEnumerateRenderModelPathsFB", funcs.enumerate_paths);
    loaded &= resolve_into(backend, "xrGetRenderModelPropertiesFB", funcs.get_properties);
    loaded &= resolve_into(backend, "xrLoadRenderModelFB", funcs.load);
    loaded &= resolve_into(backend, "xrStringToPath", funcs.string_to_path);
    loaded &= resolve_into(backend, "xrPathToString", funcs.path_to_string);

    if (!loaded)
    {
        logging::warn("[XrFbRenderModel] Failed to load all XR_FB_render_model functions");
        return nullptr;
    }

    return std::unique_ptr<XrFbRenderModel>(new XrFbRenderModel(backend, funcs));
}

XrFbRenderModel::XrFbRenderModel(const IXrBackend& backend, const Functions& funcs) : backend_(backend), funcs_(funcs)
{
}

XrPath XrFbRenderModel::string_to_path(const std::string& path) const
{
    if (path.find('\0') != std::string::npos)
    {
        throw XrError("xrStringToPath", XR_ERROR_VALIDATION_FAILURE);
    }

    XrPath result_path = XR_NULL_PATH;
    check_xr_result(funcs_.string_to_path(backend_.instance(), path.c_str(), &result_path), "xrStringToPath");
    return result_path;
}

std::string XrFbRenderModel::path_to_string(XrPath path) const
{
    const XrInstance instance = backend_.instance();
    std::vector<char> buffer;
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, char* out)
        { return funcs_.path_to_string(instance, path, capacity, count, out); },
        buffer, '\0');
    check_xr_result(result, "xrPathToString");

    // The count includes the terminator
    if (!buffer.empty() && buffer.back() == '\0')
    {
        buffer.pop_back();
    }

    std::string text(buffer.begin(), buffer.end());
    if (!is_valid_utf8(text))
    {
        throw XrError("xrPathToString", XR_ERROR_VALIDATION_FAILURE);
    }
    return text;
}

std::vector<std::string> XrFbRenderModel::enumerate_render_model_paths() const
{
    const XrSession session = backend_.session();
    std::vector<XrRenderModelPathInfoFB> path_infos;
    XrResult result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, XrRenderModelPathInfoFB* out)
        { return funcs_.enumerate_paths(session, capacity, count, out); },
        path_infos, XrRenderModelPathInfoFB{ XR_TYPE_RENDER_MODEL_PATH_INFO_FB });
    check_xr_result(result, "xrEnumerateRenderModelPathsFB");

    std::vector<std::string> paths;
    paths.reserve(path_infos.size());
    for (const auto& info : path_infos)
    {
        paths.push_back(path_to_string(info.path));
    }
    return paths;
}

XrResult XrFbRenderModel::query_properties(XrPath path, XrRenderModelPropertiesFB& properties) const
{
    XrRenderModelCapabilitiesRequestFB capabilities{ XR_TYPE_RENDER_MODEL_CAPABILITIES_REQUEST_FB };
    capabilities.flags = XR_RENDER_MODEL_SUPPORTS_GLTF_2_0_SUBSET_2_BIT_FB;

    properties = XrRenderModelPropertiesFB{ XR_TYPE_RENDER_MODEL_PROPERTIES_FB };
    properties.next = &capabilities;

    XrResult result = funcs_.get_properties(backend_.session(), path, &properties);
    properties.next = nullptr;
    return result;
}

RenderModelProperties XrFbRenderModel::get_render_model_properties(const std::string& model_path) const
{
    XrRenderModelPropertiesFB properties;
    check_xr_result(query_properties(string_to_path(model_path), properties), "xrGetRenderModelPropertiesFB");

    RenderModelProperties out;
    out.vendor_id = properties.vendorId;
    out.model_name = model_name_from(properties.modelName, XR_MAX_RENDER_MODEL_NAME_SIZE_FB);
    out.model_version = properties.modelVersion;
    out.flags = properties.flags;
    return out;
}

std::vector<uint8_t> XrFbRenderModel::load_render_model(const std::string& model_path) const
{
    const XrSession session = backend_.session();

    // The key is attempted even when the runtime says the model is not ready yet
    XrRenderModelPropertiesFB properties;
    XrResult result = query_properties(string_to_path(model_path), properties);
    if (result != XR_SUCCESS && result != XR_RENDER_MODEL_UNAVAILABLE_FB && result != XR_SESSION_LOSS_PENDING)
    {
        throw XrError("xrGetRenderModelPropertiesFB", result);
    }

    XrRenderModelLoadInfoFB load_info{ XR_TYPE_RENDER_MODEL_LOAD_INFO_FB };
    load_info.modelKey = properties.modelKey;

    std::vector<uint8_t> data;
    result = enumerate_two_call(
        [&](uint32_t capacity, uint32_t* count, uint8_t* out)
        {
            XrRenderModelBufferFB buffer{ XR_TYPE_RENDER_MODEL_BUFFER_FB };
            buffer.bufferCapacityInput = capacity;
            buffer.buffer = out;
            XrResult load_result = funcs_.load(session, &load_info, &buffer);
            *count = buffer.bufferCountOutput;
            return load_result;
        },
        data);
    check_xr_result(result, "xrLoadRenderModelFB");
    return data;
}

void XrFbRenderModel::explore_render_models() const
{
    std::vector<std::string> paths;
    try
    {
        paths = enumerate_render_model_paths();
    }
    catch (const XrError& e)
    {
        logging::warn(std::string("[XrFbRenderModel] Failed to explore render models: ") + e.what());
        return;
    }

    for (const auto& path : paths)
    {
        logging::diag("Available render model: " + path);
        try
        {
            RenderModelProperties properties = get_render_model_properties(path);
            std::ostringstream flags;
            flags << std::hex << properties.flags;
            logging::diag("--Model: " + properties.model_name);
            logging::diag("    Vendor ID: " + std::to_string(properties.vendor_id));
            logging::diag("    Model version: " + std::to_string(properties.model_version));
            logging::diag("    Model flags: 0x" + flags.str());
        }
        catch (const XrError&)
        {
            logging::diag("No connected device for model: " + path);
        }
    }
}

std::shared_ptr<IModel> XrFbRenderModel::get_controller_model(Handed hand,
                                                              const std::string& model_path,
                                                              IModelLoader& loader)
{
    auto& slot = cache_[static_cast<size_t>(hand)];
    if (!slot)
    {
        std::vector<uint8_t> data = load_render_model(model_path);
        std::shared_ptr<IModel> model = loader.from_memory(model_path + ".gltf", data);
        if (!model)
        {
            throw std::runtime_error("Model loader returned no model for " + model_path);
        }

        // Identity local transform on the root node
        model->set_root_transform(identity_pose());
        slot = std::move(model);
    }
    return slot;
}

void XrFbRenderModel::setup_controller_models(const std::string& left_path,
                                              const std::string& right_path,
                                              bool with_animation,
                                              IInputSystem& input,
                                              IModelLoader& loader)
{
    auto setup_hand = [&](Handed hand, const std::string& path)
    {
        std::shared_ptr<IModel> model = get_controller_model(hand, path, loader);
        input.set_controller_model(hand, model);

        if (with_animation)
        {
            const size_t count = model->anim_count();
            if (count == 0)
            {
                logging::warn(std::string("[XrFbRenderModel] ") + handed_name(hand) +
                              " controller model has no animation");
            }
            else
            {
                if (count > 1)
                {
                    logging::warn(std::string("[XrFbRenderModel] ") + handed_name(hand) + " controller model has " +
                                  std::to_string(count) + " animations, only the first one is played");
                }
                model->play_anim(0, AnimMode::Loop);
            }
        }

        logging::info(std::string("[XrFbRenderModel] ") + handed_name(hand) +
                      " controller model loaded and configured from path: " + path);
    };

    setup_hand(Handed::Right, right_path);
    setup_hand(Handed::Left, left_path);
}

void XrFbRenderModel::disable_controller_models(IInputSystem& input)
{
    input.set_controller_model(Handed::Right, nullptr);
    input.set_controller_model(Handed::Left, nullptr);
    cache_[0].reset();
    cache_[1].reset();
    logging::info("[XrFbRenderModel] Controller models disabled");
}

} // namespace xrext
