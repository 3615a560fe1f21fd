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

#include "scene_assembler.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * @file scene_config.h
 * @brief JSON scene configuration loader
 *
 * Document layout:
 *
 *   layout.type               "3panel" | "4panel" | "5panel"
 *   layout.panel_size         {width, height, units} or "small" | "standard" | "large"
 *   layout.room_size          {width, height, depth, units} or preset name (optional)
 *   layout.density_overrides  {panel label: density} (optional)
 *   camera                    position, target, up, fov, near, far, projection
 *   grid                      density, min_line_length
 *   output.size               {width, height}
 *
 * Missing keys take the defaults below. Keys the engine has no use for
 * (style, output format) are ignored.
 */

namespace vantage {

/// Defaults applied by the loader for absent keys
constexpr double DEFAULT_NEAR_PLANE = 0.1;
constexpr double DEFAULT_FAR_PLANE = 100.0;
constexpr double DEFAULT_FOV_DEGREES = 50.0;
constexpr double DEFAULT_GRID_DENSITY = 0.5;
constexpr double DEFAULT_MIN_LINE_LENGTH = 5.0;
constexpr int DEFAULT_CANVAS_WIDTH = 1920;
constexpr int DEFAULT_CANVAS_HEIGHT = 1080;

/**
 * @brief Build a SceneConfig from a parsed document
 * @throws GridError(INVALID_CONFIG) for wrong types or unknown enum strings,
 *         with parameter() set to the dotted key path
 */
SceneConfig scene_config_from_json(const nlohmann::json& doc);

/**
 * @brief Read and parse a configuration file
 * @throws GridError(INVALID_CONFIG) if the file is unreadable or not valid JSON
 */
SceneConfig load_scene_config(const std::string& path);

/**
 * @brief Serialize a config back to the document format
 *
 * Always writes explicit panel/room sizes, never preset names.
 */
nlohmann::json scene_config_to_json(const SceneConfig& config);

std::optional<ProjectionMode> parse_projection_mode(const std::string& str);

} // namespace vantage
