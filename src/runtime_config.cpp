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

#include "runtime_config.h"

namespace vantage {

void RuntimeConfig::apply_to(SceneConfig& config) const {
    if (layout) {
        config.layout_kind = *layout;
        // Overrides naming panels the new layout lacks are left in place so
        // build_panels() can reject them
    }
    if (grid_density) {
        config.grid_density = *grid_density;
    }
    if (force_orthographic) {
        config.projection_mode = ProjectionMode::ORTHOGRAPHIC;
    }
    if (parallel) {
        config.parallel = true;
    }
}

logging::LogConfig RuntimeConfig::log_config() const {
    logging::LogConfig log;
    log.level = logging::level_from_verbosity(verbosity);
    log.target = log_target;
    log.file_path = log_file;
    return log;
}

} // namespace vantage
