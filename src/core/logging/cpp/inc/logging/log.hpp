// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace xrext::logging
{

enum class Level
{
    Diagnostic,
    Info,
    Warning,
    Error
};

// Receives every message that passes the level filter
using Sink = std::function<void(Level, const std::string&)>;

// Messages below min_severity are dropped
void set_level(Level min_severity);
Level get_level();

// Replace the output sink. An empty sink restores the default std::cout / std::cerr sink.
void set_sink(Sink sink);

void write(Level severity, const std::string& msg);

// Parses "diagnostic", "info", "warning" or "error" (case sensitive, "diag"/"warn"/"err" accepted)
std::optional<Level> parse_level(std::string_view name);
std::string_view level_name(Level level);

// Applies XREXT_LOG_LEVEL when set, returns true if the variable held a valid level
bool apply_level_from_env();

inline void diag(const std::string& msg)
{
    write(Level::Diagnostic, msg);
}

inline void info(const std::string& msg)
{
    write(Level::Info, msg);
}

inline void warn(const std::string& msg)
{
    write(Level::Warning, msg);
}

inline void err(const std::string& msg)
{
    write(Level::Error, msg);
}

} // namespace xrext::logging
