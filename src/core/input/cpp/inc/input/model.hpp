// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace xrext
{

enum class AnimMode
{
    Once,
    Loop,
    Manual
};

// A loaded model asset as seen by this layer: a root transform and an animation track list
class IModel
{
public:
    virtual ~IModel() = default;

    virtual size_t anim_count() const = 0;
    virtual void play_anim(size_t index, AnimMode mode) = 0;

    // Seek the playing animation, in seconds
    virtual void set_anim_time(float time) = 0;

    virtual void set_root_transform(const XrPosef& pose) = 0;
};

// Builds models from in-memory glTF bytes
class IModelLoader
{
public:
    virtual ~IModelLoader() = default;

    // Throws std::runtime_error when the bytes cannot be turned into a model
    virtual std::shared_ptr<IModel> from_memory(const std::string& filename, const std::vector<uint8_t>& bytes) = 0;
};

inline XrPosef identity_pose()
{
    XrPosef pose{};
    pose.orientation.w = 1.0f;
    return pose;
}

} // namespace xrext
