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

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace vantage {
namespace logging {

/**
 * @brief Log destination targets
 *
 * Console output is always available. Auto writes to the log file when a
 * file path is configured, otherwise console only.
 */
enum class LogTarget {
    Auto,    ///< File if file_path is set, else console only (default)
    Syslog,  ///< Traditional syslog (Linux only)
    File,    ///< Rotating file log
    Console  ///< Console only (disable file/system logging)
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;         ///< Always show console output
    LogTarget target = LogTarget::Auto; ///< Additional log destination
    std::string file_path;              ///< Log file path (empty = default for File)
};

/// Log file used by LogTarget::File when no path is configured
constexpr const char* DEFAULT_LOG_FILE = "vantage-grid.log";

/**
 * @brief Initialize logging subsystem
 *
 * Call once at startup before any log calls. Creates a multi-sink logger
 * that writes to the console (if enabled) and the selected target, and
 * installs it as the spdlog default logger. A log file that cannot be
 * opened is reported as a warning and logging continues on the console.
 *
 * @param config Logging configuration
 */
void init(const LogConfig& config);

/**
 * @brief Parse log target from string
 *
 * @param str One of: "auto", "syslog", "file", "console"
 * @return Corresponding LogTarget enum value (Auto if unrecognized)
 */
LogTarget parse_log_target(const std::string& str);

/**
 * @brief Get string name for log target
 *
 * @param target LogTarget enum value
 * @return Human-readable name (e.g., "syslog", "file")
 */
const char* log_target_name(LogTarget target);

/**
 * @brief Map a -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum level_from_verbosity(int verbosity);

} // namespace logging
} // namespace vantage
