// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Vantage Contributors
 *
 * This file is part of Vantage, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#include "logging_init.h"

#include <memory>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#include <syslog.h>
#endif

namespace vantage {
namespace logging {

namespace {

constexpr size_t LOG_FILE_MAX_SIZE = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_MAX_FILES = 3;

// Returns nullptr and sets fallback_reason when the file cannot be opened
spdlog::sink_ptr make_file_sink(const std::string& path, std::string& fallback_reason) {
    const std::string file = path.empty() ? DEFAULT_LOG_FILE : path;
    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, LOG_FILE_MAX_SIZE,
                                                                      LOG_FILE_MAX_FILES);
    } catch (const spdlog::spdlog_ex& e) {
        fallback_reason = std::string("cannot open log file, using console: ") + e.what();
        return nullptr;
    }
}

} // anonymous namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console || config.target == LogTarget::Console) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console);
    }

    std::string fallback_reason;
    spdlog::sink_ptr target_sink;
    switch (config.target) {
    case LogTarget::Auto:
        if (!config.file_path.empty()) {
            target_sink = make_file_sink(config.file_path, fallback_reason);
        }
        break;
    case LogTarget::File:
        target_sink = make_file_sink(config.file_path, fallback_reason);
        break;
    case LogTarget::Syslog:
#ifdef __linux__
        target_sink = std::make_shared<spdlog::sinks::syslog_sink_mt>("vantage-grid", LOG_PID,
                                                                      LOG_USER, true);
#else
        fallback_reason = "syslog not available on this platform, using file";
        target_sink = make_file_sink(config.file_path, fallback_reason);
#endif
        break;
    case LogTarget::Console:
        break;
    }

    if (target_sink) {
        sinks.push_back(target_sink);
    } else if (sinks.empty()) {
        // Never leave the process without a log destination
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console);
    }

    auto logger = std::make_shared<spdlog::logger>("vantage", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    if (!fallback_reason.empty()) {
        spdlog::warn("[Logging] {}", fallback_reason);
    }
    spdlog::debug("[Logging] Initialized: target={}, level={}", log_target_name(config.target),
                  spdlog::level::to_string_view(config.level));
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog") {
        return LogTarget::Syslog;
    }
    if (str == "file") {
        return LogTarget::File;
    }
    if (str == "console") {
        return LogTarget::Console;
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum level_from_verbosity(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

} // namespace logging
} // namespace vantage
