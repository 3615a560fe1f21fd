// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Vantage Contributors
 */

#include "logging_init.h"
#include "runtime_config.h"

#include <catch2/catch_test_macros.hpp>

using namespace vantage;

TEST_CASE("RuntimeConfig - Command-line overrides", "[runtime]") {
    SceneConfig config;
    config.grid_density = 0.5;

    SECTION("No overrides leave the config alone") {
        RuntimeConfig runtime;
        runtime.apply_to(config);
        REQUIRE(config.layout_kind == LayoutKind::THREE_PANEL);
        REQUIRE(config.grid_density == 0.5);
        REQUIRE(config.projection_mode == ProjectionMode::PERSPECTIVE);
        REQUIRE_FALSE(config.parallel);
        REQUIRE_FALSE(runtime.should_export());
    }

    SECTION("Every override is applied") {
        RuntimeConfig runtime;
        runtime.layout = LayoutKind::FIVE_PANEL;
        runtime.grid_density = 2.0;
        runtime.force_orthographic = true;
        runtime.parallel = true;
        runtime.output_path = "scene.json";
        runtime.apply_to(config);

        REQUIRE(config.layout_kind == LayoutKind::FIVE_PANEL);
        REQUIRE(config.grid_density == 2.0);
        REQUIRE(config.projection_mode == ProjectionMode::ORTHOGRAPHIC);
        REQUIRE(config.parallel);
        REQUIRE(runtime.should_export());
    }
}

TEST_CASE("RuntimeConfig - Logging setup", "[runtime][logging]") {
    RuntimeConfig runtime;

    SECTION("Verbosity levels") {
        REQUIRE(runtime.log_config().level == spdlog::level::warn);
        runtime.verbosity = 1;
        REQUIRE(runtime.log_config().level == spdlog::level::info);
        runtime.verbosity = 2;
        REQUIRE(runtime.log_config().level == spdlog::level::debug);
        runtime.verbosity = 3;
        REQUIRE(runtime.log_config().level == spdlog::level::trace);
    }

    SECTION("Destination and file") {
        runtime.log_target = logging::LogTarget::File;
        runtime.log_file = "/tmp/vantage.log";
        logging::LogConfig log = runtime.log_config();
        REQUIRE(log.target == logging::LogTarget::File);
        REQUIRE(log.file_path == "/tmp/vantage.log");
    }

    SECTION("Target names") {
        REQUIRE(logging::parse_log_target("syslog") == logging::LogTarget::Syslog);
        REQUIRE(logging::parse_log_target("file") == logging::LogTarget::File);
        REQUIRE(logging::parse_log_target("console") == logging::LogTarget::Console);
        REQUIRE(logging::parse_log_target("bogus") == logging::LogTarget::Auto);
        REQUIRE(std::string(logging::log_target_name(logging::LogTarget::Syslog)) == "syslog");
    }
}

TEST_CASE("Logging - Unwritable log file falls back to console", "[runtime][logging]") {
    logging::LogConfig log;
    log.level = spdlog::level::warn;
    log.target = logging::LogTarget::File;
    log.file_path = "/proc/vantage/unwritable.log";

    SECTION("Console enabled keeps only the console sink") {
        REQUIRE_NOTHROW(logging::init(log));
        REQUIRE(spdlog::default_logger()->sinks().size() == 1);
    }

    SECTION("Console disabled still gets a console sink") {
        log.enable_console = false;
        REQUIRE_NOTHROW(logging::init(log));
        REQUIRE(spdlog::default_logger()->sinks().size() == 1);
    }
}
