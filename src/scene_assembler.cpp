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

#include "scene_assembler.h"

#include "grid_error.h"

#include <exception>
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>
#include <utility>

namespace vantage {

const PanelGrid* SceneGrid::find(const std::string& label) const {
    for (const auto& panel : panels) {
        if (panel.label == label) {
            return &panel;
        }
    }
    return nullptr;
}

size_t SceneGrid::total_lines() const {
    size_t total = 0;
    for (const auto& panel : panels) {
        total += panel.lines.size();
    }
    return total;
}

Camera build_camera(const SceneConfig& config) {
    return Camera::build(config.camera_position, config.camera_target, config.camera_up,
                         config.fov_degrees, config.near_plane, config.far_plane,
                         config.projection_mode);
}

std::vector<Panel> build_panels(const SceneConfig& config) {
    std::vector<Panel> panels =
        build_layout(config.layout_kind, config.panel_width, config.panel_height, config.room_scale);

    for (const auto& [label, density] : config.panel_density_overrides) {
        bool found = false;
        for (auto& panel : panels) {
            if (panel.label == label) {
                panel.density_override = density;
                found = true;
                break;
            }
        }
        if (!found) {
            throw GridError(GridErrorType::INVALID_CONFIG,
                            "Density override for unknown panel '" + label + "' in " +
                                layout_display_name(config.layout_kind),
                            "density_overrides." + label);
        }
    }
    return panels;
}

double effective_density(const Panel& panel, double global_density) {
    return panel.density_override.value_or(global_density);
}

namespace {

PanelGrid process_panel(const Panel& panel, const std::array<bool, 4>& shared_edges,
                        double density, const Projector& projector, const GridOptions& options) {
    std::vector<GridLine3D> lines = sample_panel(panel, density);

    // Edges already emitted by an earlier panel are skipped here
    std::vector<GridLine3D> owned;
    owned.reserve(lines.size());
    for (auto& line : lines) {
        if (line.boundary && line.edge_index >= 0 && shared_edges[line.edge_index]) {
            continue;
        }
        owned.push_back(std::move(line));
    }

    return project_panel(panel, owned, projector, options);
}

Rect2D content_bounds_of(const std::vector<PanelGrid>& panels) {
    Rect2D bounds{Vec2(0.0), Vec2(0.0)};
    bool first = true;
    for (const auto& panel : panels) {
        for (const auto& line : panel.lines) {
            if (first) {
                bounds = Rect2D{line.start, line.start};
                first = false;
            }
            bounds.expand(line.start);
            bounds.expand(line.end);
        }
    }
    return bounds;
}

} // anonymous namespace

SceneGrid generate_scene(const SceneConfig& config) {
    std::vector<Panel> panels = build_panels(config);
    Camera camera = build_camera(config);
    Projector projector(camera, config.canvas_width, config.canvas_height);

    // Validate all densities before any work so a bad one never yields partial output
    std::vector<double> densities;
    densities.reserve(panels.size());
    for (const auto& panel : panels) {
        double density = effective_density(panel, config.grid_density);
        try {
            grid_spacing(density);
        } catch (const GridError& e) {
            throw GridError(e.type(), std::string(e.what()) + " (panel '" + panel.label + "')",
                            panel.density_override ? "density_overrides." + panel.label
                                                   : std::string("grid_density"));
        }
        densities.push_back(density);
    }

    std::vector<std::array<bool, 4>> shared = find_shared_edges(panels);
    GridOptions options;
    options.min_line_length = config.min_line_length;

    spdlog::debug("[Scene] Generating {} ({} panels), {} camera at ({:.2f}, {:.2f}, {:.2f}), "
                  "canvas {}x{}{}",
                  layout_kind_name(config.layout_kind), panels.size(),
                  projection_mode_name(camera.projection_mode()), camera.position().x,
                  camera.position().y, camera.position().z, config.canvas_width,
                  config.canvas_height, config.parallel ? ", parallel" : "");

    SceneGrid scene;
    scene.canvas = projector.canvas_rect();
    scene.panels.resize(panels.size());

    if (config.parallel && panels.size() > 1) {
        // Each worker writes only its own slot; errors are rethrown after join
        std::vector<std::exception_ptr> errors(panels.size());
        std::vector<std::thread> workers;
        workers.reserve(panels.size());

        try {
            for (size_t i = 0; i < panels.size(); ++i) {
                workers.emplace_back([&, i]() {
                    try {
                        scene.panels[i] =
                            process_panel(panels[i], shared[i], densities[i], projector, options);
                    } catch (...) {
                        errors[i] = std::current_exception();
                    }
                });
            }
        } catch (const std::system_error& e) {
            // Started workers reference locals; join them before unwinding
            spdlog::debug("[Scene] Worker start failed after {} threads: {}", workers.size(),
                          e.what());
            for (auto& worker : workers) {
                worker.join();
            }
            throw;
        }
        for (auto& worker : workers) {
            worker.join();
        }
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    } else {
        for (size_t i = 0; i < panels.size(); ++i) {
            scene.panels[i] = process_panel(panels[i], shared[i], densities[i], projector, options);
        }
    }

    scene.content_bounds = content_bounds_of(scene.panels);

    spdlog::debug("[Scene] Generated {} lines", scene.total_lines());
    return scene;
}

GridStats compute_grid_stats(const SceneGrid& scene) {
    GridStats stats;
    for (const auto& panel : scene.panels) {
        stats.lines_per_panel[panel.label] = panel.lines.size();
        for (const auto& line : panel.lines) {
            stats.total_lines++;
            if (line.boundary) {
                stats.boundary_lines++;
            }
            if (line.axis == GridAxis::HORIZONTAL) {
                stats.horizontal_lines++;
            } else {
                stats.vertical_lines++;
            }
        }
    }
    return stats;
}

} // namespace vantage
