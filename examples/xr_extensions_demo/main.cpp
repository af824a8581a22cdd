// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <backend/openxr_backend.hpp>
#include <config/xrext_config.hpp>
#include <extensions/depth_texture.hpp>
#include <extensions/display_refresh_rate.hpp>
#include <extensions/render_model.hpp>
#include <extensions/simultaneous_hands.hpp>
#include <input/openxr_input_system.hpp>
#include <logging/log.hpp>
#include <oxr/oxr_session.hpp>
#include <oxr_utils/oxr_enumerate.hpp>
#include <stepper/render_model_stepper.hpp>
#include <stepper/steppers.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace xrext;

namespace
{

// No renderer is attached here: models only record what the stepper asks of them
class HeadlessModel : public IModel
{
public:
    size_t anim_count() const override
    {
        return 0;
    }

    void play_anim(size_t, AnimMode) override
    {
    }

    void set_anim_time(float) override
    {
    }

    void set_root_transform(const XrPosef&) override
    {
    }
};

class HeadlessModelLoader : public IModelLoader
{
public:
    std::shared_ptr<IModel> from_memory(const std::string& filename, const std::vector<uint8_t>& bytes) override
    {
        std::cout << "  Loaded " << filename << " (" << bytes.size() << " bytes)" << std::endl;
        return std::make_shared<HeadlessModel>();
    }
};

void run_refresh_rate(const IXrBackend& backend, const RefreshRateConfig& config)
{
    if (!display_refresh_rate::is_available(backend))
    {
        std::cout << "  Display refresh rate: unavailable" << std::endl;
        return;
    }

    const auto& candidates =
        config.candidates.empty() ? display_refresh_rate::usual_fps_suspects() : config.candidates;
    auto accepted = display_refresh_rate::probe(backend, candidates, true);
    std::cout << "  Accepted rates:";
    for (float rate : accepted)
    {
        std::cout << " " << rate;
    }
    std::cout << std::endl;

    if (config.preferred && display_refresh_rate::set(backend, *config.preferred, true))
    {
        std::cout << "  Refresh rate set to " << *config.preferred << std::endl;
    }
}

void run_depth_check(const IXrBackend& backend)
{
    auto depth = XrAndroidDepthTexture::create(backend);
    if (!depth)
    {
        std::cout << "  Depth texture: unavailable" << std::endl;
        return;
    }

    try
    {
        if (!depth->check_system_support(true))
        {
            std::cout << "  Depth texture: not supported by this system" << std::endl;
            return;
        }

        auto resolutions = depth->enumerate_depth_resolutions(backend.session());
        if (resolutions.empty())
        {
            std::cout << "  Depth texture: no resolutions reported" << std::endl;
            return;
        }

        auto [width, height] = resolution_dimensions(resolutions.front());
        DepthTextureHandle texture(
            *depth, backend.session(), make_depth_texture_create_info(width, height, SURFACE_ORIGIN_TOP_LEFT_ANDROID));
        {
            ScopedDepthTextureAcquire acquire(*depth, backend.session(), texture.get());
            std::cout << "  Depth texture " << width << "x" << height << " acquired" << std::endl;
        }
        texture.destroy();
    }
    catch (const XrError& e)
    {
        std::cerr << "  Depth texture check failed: " << e.what() << std::endl;
    }
}

} // namespace

int main(int argc, char** argv)
{
    std::cout << "XR Extensions Demo" << std::endl;
    std::cout << "==================" << std::endl;

    XrExtConfig config;
    int frame_count = 300;
    try
    {
        if (argc > 1)
        {
            config = XrExtConfig::load(argv[1]);
        }
        if (argc > 2)
        {
            frame_count = std::stoi(argv[2]);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Usage: " << argv[0] << " [config.yaml] [frames]" << std::endl;
        std::cerr << e.what() << std::endl;
        return 1;
    }

    logging::set_level(config.log_level);
    logging::apply_level_from_env();

    try
    {
        // Step 1: request extensions, then create the session
        std::cout << "[Step 1] Creating OpenXR session..." << std::endl;
        OpenXRBackend backend;
        backend.request_ext(display_refresh_rate::EXTENSION_NAME);
        backend.request_ext(XR_FB_RENDER_MODEL_NAME);
        backend.request_ext(XR_ANDROID_DEPTH_TEXTURE_NAME);
        if (config.simultaneous_hands_and_controllers)
        {
            backend.request_ext(simultaneous_hands::EXTENSION_NAME);
        }
        for (const auto& ext : config.extensions)
        {
            backend.request_ext(ext);
        }

        auto session = OpenXRSession::Create(config.app_name, backend);
        std::cout << "  Enabled extensions:" << std::endl;
        for (const auto& ext : session->enabled_extensions())
        {
            std::cout << "    - " << ext << std::endl;
        }

        // Step 2: extension subsystems
        std::cout << "[Step 2] Probing extensions..." << std::endl;
        run_refresh_rate(backend, config.refresh_rate);

        if (config.simultaneous_hands_and_controllers)
        {
            bool resumed = simultaneous_hands::resume(backend, true);
            std::cout << "  Simultaneous hands and controllers: " << (resumed ? "resumed" : "unavailable")
                      << std::endl;
        }

        run_depth_check(backend);

        // Step 3: controllers
        std::cout << "[Step 3] Starting controller models..." << std::endl;
        OpenXRInputSystem input(backend);
        HeadlessModelLoader loader;
        XrContext context{ &backend, &input, &loader };

        Steppers steppers(context);
        steppers.add("render_model", std::make_unique<RenderModelStepper>(config.render_model.stepper));
        if (config.render_model.draw_on_start)
        {
            steppers.send_event("main", DRAW_CONTROLLER_EVENT, "true");
        }

        // Step 4: frame loop
        std::cout << "[Step 4] Running " << frame_count << " frames..." << std::endl;
        for (int i = 0; i < frame_count; ++i)
        {
            if (!input.update())
            {
                std::cerr << "  Input update failed on frame " << i << std::endl;
            }
            if (i == frame_count - 1)
            {
                steppers.quit("main", "frame limit reached");
            }
            if (!steppers.step())
            {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(16));
        }

        std::cout << "  Quit: " << steppers.quit_reason() << std::endl;
        steppers.shutdown();

        if (config.simultaneous_hands_and_controllers)
        {
            simultaneous_hands::pause(backend, true);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Demo failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Done" << std::endl;
    return 0;
}
