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

#include "grid_generator.h"
#include "line_clipping.h"
#include "panel_layout.h"
#include "perspective_camera.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @file scene_assembler.h
 * @brief Whole-scene grid generation from a configuration record
 *
 * generate_scene() wires the layout builder, the camera and the grid
 * generator together: build panels, build the camera, validate every
 * effective density, then sample and project each panel. Panels are
 * independent, so they can be processed on one worker thread each; the
 * result is identical either way.
 */

namespace vantage {

/**
 * @brief Everything needed to produce one scene
 *
 * Plain value record. Defaults match a 6" x 6" corner room seen from
 * (0, 4, 8) on a 1920x1080 canvas.
 */
struct SceneConfig {
    std::string preset_name;

    // Layout
    LayoutKind layout_kind = LayoutKind::THREE_PANEL;
    double panel_width = 6.0;
    double panel_height = 6.0;
    std::optional<RoomScale> room_scale;

    // Camera
    Vec3 camera_position{0.0, 4.0, 8.0};
    Vec3 camera_target{0.0, 0.0, 0.0};
    Vec3 camera_up{0.0, 1.0, 0.0};
    double fov_degrees = 50.0;
    ProjectionMode projection_mode = ProjectionMode::PERSPECTIVE;
    double near_plane = 0.1;
    double far_plane = 100.0;

    // Grid
    double grid_density = 0.5;
    std::map<std::string, double> panel_density_overrides; ///< Panel label -> density
    double min_line_length = 0.0;                          ///< Pixels

    // Output
    int canvas_width = 1920;
    int canvas_height = 1080;

    bool parallel = false; ///< One worker thread per panel
};

/**
 * @brief Projected grids for a whole layout
 */
struct SceneGrid {
    std::vector<PanelGrid> panels; ///< Layout order
    Rect2D canvas;                 ///< Canvas rectangle used for clipping
    Rect2D content_bounds;         ///< Bounding box of all emitted lines (empty scene: zero box)

    /// Look up a panel by label, nullptr if absent
    const PanelGrid* find(const std::string& label) const;

    size_t total_lines() const;
};

/**
 * @brief Line counts for a scene
 */
struct GridStats {
    size_t total_lines = 0;
    size_t horizontal_lines = 0;
    size_t vertical_lines = 0;
    size_t boundary_lines = 0;
    std::map<std::string, size_t> lines_per_panel;
};

/**
 * @brief Build the camera described by a config
 * @throws GridError(INVALID_CAMERA_CONFIG) on invalid camera parameters
 */
Camera build_camera(const SceneConfig& config);

/**
 * @brief Build the panels described by a config, with density overrides applied
 * @throws GridError(INVALID_LAYOUT_DIMENSIONS) on non-positive dimensions
 * @throws GridError(INVALID_CONFIG) if an override names a panel not in the layout
 */
std::vector<Panel> build_panels(const SceneConfig& config);

/**
 * @brief Effective grid density of a panel (override or global default)
 */
double effective_density(const Panel& panel, double global_density);

/**
 * @brief Run the full pipeline for a config
 *
 * Shared panel edges are emitted once, by the first panel in layout order.
 *
 * @throws GridError on any invalid input; nothing is emitted in that case
 */
SceneGrid generate_scene(const SceneConfig& config);

GridStats compute_grid_stats(const SceneGrid& scene);

} // namespace vantage
