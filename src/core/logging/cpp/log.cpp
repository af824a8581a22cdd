// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/logging/log.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace xrext::logging
{

namespace
{

struct LoggerState
{
    std::mutex mutex;
    Level min_severity = Level::Info;
    Sink sink;
};

LoggerState& state()
{
    static LoggerState logger;
    return logger;
}

void default_sink(Level severity, const std::string& msg)
{
    std::ostream& out = (severity >= Level::Warning) ? std::cerr : std::cout;
    out << "[" << level_name(severity) << "] " << msg << std::endl;
}

} // anonymous namespace

void set_level(Level min_severity)
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().min_severity = min_severity;
}

Level get_level()
{
    std::lock_guard<std::mutex> lock(state().mutex);
    return state().min_severity;
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().sink = std::move(sink);
}

void write(Level severity, const std::string& msg)
{
    // The sink runs unlocked so it may log or reconfigure the logger itself
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(state().mutex);
        if (severity < state().min_severity)
        {
            return;
        }
        sink = state().sink;
    }

    if (sink)
    {
        sink(severity, msg);
    }
    else
    {
        default_sink(severity, msg);
    }
}

std::optional<Level> parse_level(std::string_view name)
{
    if (name == "diagnostic" || name == "diag")
        return Level::Diagnostic;
    if (name == "info")
        return Level::Info;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "error" || name == "err")
        return Level::Error;
    return std::nullopt;
}

std::string_view level_name(Level level)
{
    switch (level)
    {
    case Level::Diagnostic:
        return "diag";
    case Level::Info:
        return "info";
    case Level::Warning:
        return "warn";
    case Level::Error:
        return "error";
    }
    return "unknown";
}

bool apply_level_from_env()
{
    const char* env_level = std::getenv("XREXT_LOG_LEVEL");
    if (env_level == nullptr || std::string(env_level).empty())
    {
        return false;
    }

    auto level = parse_level(env_level);
    if (!level)
    {
        write(Level::Warning, std::string("[Log] Ignoring unknown XREXT_LOG_LEVEL '") + env_level + "'");
        return false;
    }

    set_level(*level);
    return true;
}

} // namespace xrext::logging
