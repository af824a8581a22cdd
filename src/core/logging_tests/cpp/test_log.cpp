// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <logging/log.hpp>
#include <test_utils/fakes.hpp>

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using namespace xrext;

TEST_CASE("Messages below the minimum level are dropped", "[logging]")
{
    test::LogCapture capture(logging::Level::Warning);

    logging::diag("hidden diag");
    logging::info("hidden info");
    logging::warn("shown warning");
    logging::err("shown error");

    REQUIRE(capture.lines.size() == 2);
    CHECK(capture.lines[0].first == logging::Level::Warning);
    CHECK(capture.lines[0].second == "shown warning");
    CHECK(capture.lines[1].first == logging::Level::Error);
}

TEST_CASE("Level names parse in long and short form", "[logging]")
{
    CHECK(logging::parse_level("diagnostic") == logging::Level::Diagnostic);
    CHECK(logging::parse_level("diag") == logging::Level::Diagnostic);
    CHECK(logging::parse_level("info") == logging::Level::Info);
    CHECK(logging::parse_level("warning") == logging::Level::Warning);
    CHECK(logging::parse_level("warn") == logging::Level::Warning);
    CHECK(logging::parse_level("error") == logging::Level::Error);
    CHECK_FALSE(logging::parse_level("INFO").has_value());
    CHECK_FALSE(logging::parse_level("").has_value());

    CHECK(logging::level_name(logging::Level::Warning) == "warn");
}

TEST_CASE("Log level is read from XREXT_LOG_LEVEL", "[logging]")
{
    const logging::Level previous = logging::get_level();

    setenv("XREXT_LOG_LEVEL", "error", 1);
    CHECK(logging::apply_level_from_env());
    CHECK(logging::get_level() == logging::Level::Error);

    {
        test::LogCapture capture(logging::Level::Diagnostic);
        setenv("XREXT_LOG_LEVEL", "loud", 1);
        CHECK_FALSE(logging::apply_level_from_env());
        CHECK(capture.contains("Ignoring unknown XREXT_LOG_LEVEL"));
    }

    unsetenv("XREXT_LOG_LEVEL");
    CHECK_FALSE(logging::apply_level_from_env());

    logging::set_level(previous);
}

TEST_CASE("A sink may log and reconfigure the logger", "[logging]")
{
    const logging::Level previous = logging::get_level();
    std::vector<std::pair<logging::Level, std::string>> lines;

    logging::set_level(logging::Level::Diagnostic);
    logging::set_sink(
        [&lines](logging::Level severity, const std::string& msg)
        {
            lines.emplace_back(severity, msg);
            if (msg == "first")
            {
                logging::info("nested");
                logging::set_level(logging::Level::Error);
            }
        });

    logging::info("first");
    logging::info("dropped after the sink raised the level");
    logging::err("last");
    logging::set_sink(nullptr);

    REQUIRE(lines.size() == 3);
    CHECK(lines[0].second == "first");
    CHECK(lines[1].second == "nested");
    CHECK(lines[2].second == "last");
    CHECK(logging::get_level() == logging::Level::Error);

    logging::set_level(previous);
}
