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

#include "json_scene_exporter.h"

#include "grid_error.h"
#include "scene_config.h"

#include <fstream>
#include <spdlog/spdlog.h>
#include <utility>

using json = nlohmann::json;

namespace vantage {

namespace {

json point_json(const Vec2& p) {
    return json::array({p.x, p.y});
}

const char* panel_kind_json_name(PanelKind kind) {
    switch (kind) {
    case PanelKind::FLOOR:
        return "floor";
    case PanelKind::WALL:
        return "wall";
    case PanelKind::CEILING:
        return "ceiling";
    }
    return "unknown";
}

} // anonymous namespace

JsonSceneExporter::JsonSceneExporter(SceneConfig config, int indent)
    : config_(std::move(config)), indent_(indent) {}

json JsonSceneExporter::to_json(const SceneGrid& scene) const {
    json doc;
    doc["canvas"] = {{"width", scene.canvas.width()}, {"height", scene.canvas.height()}};
    doc["content_bounds"] = {{"min", point_json(scene.content_bounds.min)},
                             {"max", point_json(scene.content_bounds.max)}};

    GridStats stats = compute_grid_stats(scene);
    doc["stats"] = {{"total", stats.total_lines},
                    {"horizontal", stats.horizontal_lines},
                    {"vertical", stats.vertical_lines},
                    {"boundary", stats.boundary_lines}};

    json panels = json::array();
    for (const auto& panel : scene.panels) {
        json polygon = json::array();
        for (const auto& p : panel.boundary_polygon) {
            polygon.push_back(point_json(p));
        }

        json lines = json::array();
        for (const auto& line : panel.lines) {
            lines.push_back({{"start", point_json(line.start)},
                             {"end", point_json(line.end)},
                             {"axis", grid_axis_name(line.axis)},
                             {"boundary", line.boundary}});
        }

        panels.push_back({{"label", panel.label},
                          {"kind", panel_kind_json_name(panel.kind)},
                          {"boundary_polygon", std::move(polygon)},
                          {"lines", std::move(lines)}});
    }
    doc["panels"] = std::move(panels);

    if (config_) {
        doc["config"] = scene_config_to_json(*config_);
    }
    return doc;
}

void JsonSceneExporter::render(const SceneGrid& scene, const std::string& output_path) const {
    std::ofstream out(output_path);
    if (!out.is_open()) {
        throw GridError(GridErrorType::RENDER_FAILED, "Cannot open output file: " + output_path,
                        "output");
    }

    out << to_json(scene).dump(indent_) << '\n';
    if (!out) {
        throw GridError(GridErrorType::RENDER_FAILED, "Failed writing output file: " + output_path,
                        "output");
    }

    spdlog::debug("[JsonExport] Wrote {} panels to {}", scene.panels.size(), output_path);
}

} // namespace vantage
