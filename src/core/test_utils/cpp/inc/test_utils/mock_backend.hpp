// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "mock_runtime.hpp"

#include <backend/xr_backend.hpp>

#include <set>
#include <string>
#include <vector>

namespace xrext::test
{

// Backend answering from the mock runtime. Extensions are enabled explicitly per test.
class MockBackend : public IXrBackend
{
public:
    explicit MockBackend(std::set<std::string> enabled = {}, BackendXRType type = BackendXRType::OpenXR)
        : type_(type), enabled_(std::move(enabled))
    {
    }

    BackendXRType xr_type() const override
    {
        return type_;
    }

    bool ext_enabled(const std::string& name) const override
    {
        return enabled_.count(name) > 0;
    }

    void request_ext(const std::string& name) override
    {
        requested_.push_back(name);
    }

    XrInstance instance() const override
    {
        return MOCK_INSTANCE;
    }

    XrSession session() const override
    {
        return MOCK_SESSION;
    }

    XrSystemId system_id() const override
    {
        return MOCK_SYSTEM_ID;
    }

    PFN_xrVoidFunction get_proc_addr(const char* name) const override
    {
        if (hidden_symbols_.count(name) > 0)
        {
            return nullptr;
        }
        return mock_proc_addr(name);
    }

    void enable(const std::string& name)
    {
        enabled_.insert(name);
    }

    void set_type(BackendXRType type)
    {
        type_ = type;
    }

    // The symbol resolves to nullptr from now on
    void hide_symbol(const std::string& name)
    {
        hidden_symbols_.insert(name);
    }

    const std::vector<std::string>& requested() const
    {
        return requested_;
    }

private:
    BackendXRType type_;
    std::set<std::string> enabled_;
    std::set<std::string> hidden_symbols_;
    std::vector<std::string> requested_;
};

} // namespace xrext::test
