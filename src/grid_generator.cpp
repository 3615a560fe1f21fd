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

#include "grid_generator.h"

#include "grid_error.h"

#include <cmath>
#include <spdlog/spdlog.h>
#include <string>

namespace vantage {

// ============================================================================
// Constants
// ============================================================================

namespace {

// Fraction of a grid cell treated as "on the far edge" when counting lines
constexpr double CELL_TOLERANCE = 1e-9;

// Slack (view-space units) when testing against the near plane, so points
// interpolated onto the plane itself stay visible
constexpr double NEAR_PLANE_TOLERANCE = 1e-12;

// Segments shorter than this (pixels) are points, never emitted
constexpr double MIN_SEGMENT_LENGTH = 1e-9;

size_t interior_count(double edge_length, double spacing) {
    double cells = edge_length / spacing;
    if (!std::isfinite(cells)) {
        throw GridError(GridErrorType::INVALID_DENSITY,
                        "Grid density exceeds the line limit: spacing underflows panel size",
                        "density");
    }

    double count = std::ceil(cells - CELL_TOLERANCE) - 1.0;
    if (count <= 0.0) {
        return 0;
    }
    if (count > static_cast<double>(MAX_INTERIOR_LINES_PER_AXIS)) {
        throw GridError(GridErrorType::INVALID_DENSITY,
                        "Grid density exceeds the line limit of " +
                            std::to_string(MAX_INTERIOR_LINES_PER_AXIS) +
                            " lines per direction (density is positive but too fine)",
                        "density");
    }
    return static_cast<size_t>(count);
}

Vec3 lerp_point(const Vec3& a, const Vec3& b, double t) {
    return a + (b - a) * t;
}

} // anonymous namespace

// ============================================================================
// Sampling
// ============================================================================

double grid_spacing(double density) {
    if (!std::isfinite(density) || density <= 0.0) {
        throw GridError(GridErrorType::INVALID_DENSITY,
                        "Grid density must be positive, got " + std::to_string(density),
                        "density");
    }
    return BASE_GRID_SPACING / density;
}

size_t expected_interior_count(double edge_length, double density) {
    return interior_count(edge_length, grid_spacing(density));
}

std::vector<GridLine3D> sample_panel(const Panel& panel, double density) {
    double spacing = grid_spacing(density);
    const auto& c = panel.corners;

    double u_length = glm::length(panel.u_edge());
    double v_length = glm::length(panel.v_edge());

    // HORIZONTAL lines are stacked along v, VERTICAL lines along u
    size_t horizontal_count = interior_count(v_length, spacing);
    size_t vertical_count = interior_count(u_length, spacing);

    std::vector<GridLine3D> lines;
    lines.reserve(4 + horizontal_count + vertical_count);

    // Boundary edges: even edges run along u, odd edges along v
    for (int e = 0; e < 4; ++e) {
        GridLine3D line;
        line.start = c[e];
        line.end = c[(e + 1) % 4];
        line.axis = (e % 2 == 0) ? GridAxis::HORIZONTAL : GridAxis::VERTICAL;
        line.boundary = true;
        line.edge_index = e;
        lines.push_back(line);
    }

    // Interior lines connect matching points on opposite edges so they stay
    // on the surface for any convex quad, not just rectangles
    for (size_t k = 1; k <= horizontal_count; ++k) {
        double t = static_cast<double>(k) * spacing / v_length;
        GridLine3D line;
        line.start = lerp_point(c[0], c[3], t);
        line.end = lerp_point(c[1], c[2], t);
        line.axis = GridAxis::HORIZONTAL;
        lines.push_back(line);
    }

    for (size_t k = 1; k <= vertical_count; ++k) {
        double t = static_cast<double>(k) * spacing / u_length;
        GridLine3D line;
        line.start = lerp_point(c[0], c[1], t);
        line.end = lerp_point(c[3], c[2], t);
        line.axis = GridAxis::VERTICAL;
        lines.push_back(line);
    }

    spdlog::trace("[GridGenerator] Sampled '{}': spacing={:.4f}, {} horizontal + {} vertical "
                  "interior lines",
                  panel.label, spacing, horizontal_count, vertical_count);
    return lines;
}

// ============================================================================
// Projector
// ============================================================================

Projector::Projector(const Camera& camera, int canvas_width, int canvas_height)
    : near_plane_(camera.near_plane()), canvas_width_(canvas_width),
      canvas_height_(canvas_height) {
    if (canvas_width <= 0) {
        throw GridError(GridErrorType::INVALID_CONFIG,
                        "Canvas width must be positive, got " + std::to_string(canvas_width),
                        "canvas_width");
    }
    if (canvas_height <= 0) {
        throw GridError(GridErrorType::INVALID_CONFIG,
                        "Canvas height must be positive, got " + std::to_string(canvas_height),
                        "canvas_height");
    }

    view_ = camera.view_matrix();
    projection_ =
        camera.projection_matrix(static_cast<double>(canvas_width) / canvas_height);
}

Rect2D Projector::canvas_rect() const {
    return Rect2D{Vec2(0.0, 0.0),
                  Vec2(static_cast<double>(canvas_width_), static_cast<double>(canvas_height_))};
}

Vec3 Projector::to_view(const Vec3& world) const {
    return Vec3(view_ * Vec4(world, 1.0));
}

bool Projector::is_in_front(const Vec3& view_point) const {
    return view_point.z <= -near_plane_ + NEAR_PLANE_TOLERANCE;
}

Vec2 Projector::view_to_canvas(const Vec3& view_point) const {
    // Transform to clip space, then perspective divide (w >= near for points in front)
    Vec4 clip = projection_ * Vec4(view_point, 1.0);
    double ndc_x = clip.x / clip.w;
    double ndc_y = clip.y / clip.w;

    // Convert to canvas coordinates
    double canvas_x = (ndc_x + 1.0) * 0.5 * canvas_width_;
    double canvas_y = (1.0 - ndc_y) * 0.5 * canvas_height_; // Flip Y
    return Vec2(canvas_x, canvas_y);
}

std::optional<Vec2> Projector::project_point(const Vec3& world) const {
    Vec3 view_point = to_view(world);
    if (!is_in_front(view_point)) {
        return std::nullopt;
    }
    return view_to_canvas(view_point);
}

bool Projector::clip_to_near_plane(Vec3& a, Vec3& b) const {
    bool a_visible = is_in_front(a);
    bool b_visible = is_in_front(b);

    if (!a_visible && !b_visible) {
        return false;
    }
    if (a_visible && b_visible) {
        return true;
    }

    double t = (-near_plane_ - a.z) / (b.z - a.z);
    Vec3 hit = a + (b - a) * t;
    hit.z = -near_plane_;
    if (a_visible) {
        b = hit;
    } else {
        a = hit;
    }
    return true;
}

std::optional<std::pair<Vec2, Vec2>> Projector::project_segment(const Vec3& start,
                                                                const Vec3& end) const {
    Vec3 a = to_view(start);
    Vec3 b = to_view(end);
    if (!clip_to_near_plane(a, b)) {
        return std::nullopt;
    }
    return std::make_pair(view_to_canvas(a), view_to_canvas(b));
}

std::vector<Vec2> Projector::project_outline(const std::array<Vec3, 4>& corners) const {
    // Sutherland-Hodgman against the near plane, in view space
    std::vector<Vec3> clipped;
    clipped.reserve(5);

    Vec3 prev = to_view(corners[3]);
    bool prev_visible = is_in_front(prev);
    for (const auto& corner : corners) {
        Vec3 curr = to_view(corner);
        bool curr_visible = is_in_front(curr);

        if (curr_visible != prev_visible) {
            double t = (-near_plane_ - prev.z) / (curr.z - prev.z);
            Vec3 hit = prev + (curr - prev) * t;
            hit.z = -near_plane_;
            clipped.push_back(hit);
        }
        if (curr_visible) {
            clipped.push_back(curr);
        }
        prev = curr;
        prev_visible = curr_visible;
    }

    std::vector<Vec2> outline;
    if (clipped.size() < 3) {
        return outline;
    }
    outline.reserve(clipped.size());
    for (const auto& p : clipped) {
        outline.push_back(view_to_canvas(p));
    }
    return outline;
}

// ============================================================================
// Projection & clipping
// ============================================================================

PanelGrid project_panel(const Panel& panel, const std::vector<GridLine3D>& lines,
                        const Projector& projector, const GridOptions& options) {
    PanelGrid grid;
    grid.label = panel.label;
    grid.kind = panel.kind;

    std::vector<Vec2> outline = projector.project_outline(panel.corners);
    if (outline.empty()) {
        spdlog::trace("[GridGenerator] Panel '{}' is entirely behind the camera", panel.label);
        return grid;
    }

    Rect2D canvas = projector.canvas_rect();
    grid.boundary_polygon = clip_polygon_to_rect(outline, canvas);

    size_t dropped = 0;
    for (const auto& line : lines) {
        auto segment = projector.project_segment(line.start, line.end);
        if (!segment) {
            dropped++;
            continue;
        }

        Vec2 start = segment->first;
        Vec2 end = segment->second;

        // Keep the line inside its own panel, then inside the canvas
        if (!clip_segment_to_convex_polygon(start, end, outline) ||
            !clip_segment_to_rect(start, end, canvas)) {
            dropped++;
            continue;
        }

        double length = glm::length(end - start);
        if (length <= MIN_SEGMENT_LENGTH || length < options.min_line_length) {
            dropped++;
            continue;
        }

        GridLine2D projected;
        projected.start = start;
        projected.end = end;
        projected.panel_label = panel.label;
        projected.axis = line.axis;
        projected.boundary = line.boundary;
        grid.lines.push_back(std::move(projected));
    }

    spdlog::trace("[GridGenerator] Panel '{}': kept {} lines, dropped {}", panel.label,
                  grid.lines.size(), dropped);
    return grid;
}

PanelGrid project_panel(const Panel& panel, const std::vector<GridLine3D>& lines,
                        const Camera& camera, int canvas_width, int canvas_height,
                        const GridOptions& options) {
    Projector projector(camera, canvas_width, canvas_height);
    return project_panel(panel, lines, projector, options);
}

const char* grid_axis_name(GridAxis axis) {
    switch (axis) {
    case GridAxis::HORIZONTAL:
        return "horizontal";
    case GridAxis::VERTICAL:
        return "vertical";
    }
    return "unknown";
}

} // namespace vantage
