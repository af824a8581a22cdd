// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <input/input_system.hpp>
#include <input/model.hpp>
#include <logging/log.hpp>

#include <array>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace xrext::test
{

class FakeModel : public IModel
{
public:
    explicit FakeModel(size_t anim_count) : anim_count_(anim_count)
    {
    }

    size_t anim_count() const override
    {
        return anim_count_;
    }

    void play_anim(size_t index, AnimMode mode) override
    {
        played.emplace_back(index, mode);
    }

    void set_anim_time(float time) override
    {
        anim_times.push_back(time);
    }

    void set_root_transform(const XrPosef& pose) override
    {
        root_transform = pose;
    }

    std::vector<std::pair<size_t, AnimMode>> played;
    std::vector<float> anim_times;
    std::optional<XrPosef> root_transform;

private:
    size_t anim_count_;
};

class FakeModelLoader : public IModelLoader
{
public:
    std::shared_ptr<IModel> from_memory(const std::string& filename, const std::vector<uint8_t>& bytes) override
    {
        filenames.push_back(filename);
        byte_counts.push_back(bytes.size());
        if (fail)
        {
            throw std::runtime_error("FakeModelLoader: cannot parse " + filename);
        }
        if (return_null)
        {
            return nullptr;
        }
        return std::make_shared<FakeModel>(anim_count);
    }

    size_t anim_count = 1;
    bool fail = false;
    bool return_null = false;
    std::vector<std::string> filenames;
    std::vector<size_t> byte_counts;
};

class FakeInputSystem : public IInputSystem
{
public:
    ControllerSnapshot controller(Handed hand) const override
    {
        return snapshots[static_cast<size_t>(hand)];
    }

    bool controller_menu_button() const override
    {
        return menu_pressed;
    }

    ControllerSnapshot& snapshot(Handed hand)
    {
        return snapshots[static_cast<size_t>(hand)];
    }

    std::array<ControllerSnapshot, 2> snapshots{};
    bool menu_pressed = false;
};

// Captures log lines for the lifetime of the object
class LogCapture
{
public:
    explicit LogCapture(logging::Level level = logging::Level::Diagnostic) : previous_level_(logging::get_level())
    {
        logging::set_level(level);
        logging::set_sink([this](logging::Level severity, const std::string& msg) { lines.emplace_back(severity, msg); });
    }

    ~LogCapture()
    {
        logging::set_sink(nullptr);
        logging::set_level(previous_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(const std::string& text) const
    {
        for (const auto& line : lines)
        {
            if (line.second.find(text) != std::string::npos)
            {
                return true;
            }
        }
        return false;
    }

    size_t count(logging::Level severity) const
    {
        size_t n = 0;
        for (const auto& line : lines)
        {
            if (line.first == severity)
            {
                ++n;
            }
        }
        return n;
    }

    std::vector<std::pair<logging::Level, std::string>> lines;

private:
    logging::Level previous_level_;
};

} // namespace xrext::test
