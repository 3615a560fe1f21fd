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

#ifndef VANTAGE_RUNTIME_CONFIG_H
#define VANTAGE_RUNTIME_CONFIG_H

#include "logging_init.h"
#include "panel_layout.h"
#include "scene_assembler.h"

#include <optional>
#include <string>

namespace vantage {

/**
 * @brief Command-line settings for vantage-grid
 *
 * Values here override the matching keys of the loaded configuration file.
 */
struct RuntimeConfig {
    std::string config_path; ///< Scene configuration file (-c/--config, required)
    std::string output_path; ///< JSON export path (-o/--output, empty = no export)

    std::optional<LayoutKind> layout;   ///< Layout override (--layout)
    std::optional<double> grid_density; ///< Global density override (--density)
    bool force_orthographic = false;    ///< Orthographic projection (--ortho)
    bool parallel = false;              ///< One worker thread per panel (-j/--parallel)

    int verbosity = 0; ///< -v count (0 warn, 1 info, 2 debug, 3 trace)
    logging::LogTarget log_target = logging::LogTarget::Auto; ///< --log-dest
    std::string log_file;                                     ///< --log-file

    /**
     * @brief Check if a JSON export was requested
     * @return true if an output path is set
     */
    bool should_export() const {
        return !output_path.empty();
    }

    /**
     * @brief Apply command-line overrides on top of a loaded config
     * @param config Scene configuration to modify in place
     */
    void apply_to(SceneConfig& config) const;

    /**
     * @brief Logging setup implied by -v, --log-dest and --log-file
     */
    logging::LogConfig log_config() const;
};

} // namespace vantage

#endif // VANTAGE_RUNTIME_CONFIG_H
