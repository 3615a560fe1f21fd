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

#include "panel_layout.h"

#include "grid_error.h"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <sstream>

namespace vantage {

// ============================================================================
// Constants
// ============================================================================

namespace {

// Conversion factors to inches
constexpr double INCHES_PER_INCH = 1.0;
constexpr double INCHES_PER_FOOT = 12.0;
constexpr double INCHES_PER_METER = 39.37;
constexpr double INCHES_PER_CENTIMETER = 0.3937;
constexpr double INCHES_PER_MILLIMETER = 0.0394;

double to_inches(LengthUnit unit) {
    switch (unit) {
    case LengthUnit::INCHES:
        return INCHES_PER_INCH;
    case LengthUnit::FEET:
        return INCHES_PER_FOOT;
    case LengthUnit::METERS:
        return INCHES_PER_METER;
    case LengthUnit::CENTIMETERS:
        return INCHES_PER_CENTIMETER;
    case LengthUnit::MILLIMETERS:
        return INCHES_PER_MILLIMETER;
    }
    return INCHES_PER_INCH;
}

void check_dimension(double value, const char* parameter) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw GridError(GridErrorType::INVALID_LAYOUT_DIMENSIONS,
                        std::string("Layout dimension '") + parameter +
                            "' must be positive, got " + std::to_string(value),
                        parameter);
    }
}

Panel make_panel(const char* label, PanelKind kind, const Vec3& c0, const Vec3& c1,
                 const Vec3& c2, const Vec3& c3, const Vec3& normal) {
    Panel panel;
    panel.label = label;
    panel.kind = kind;
    panel.corners = {c0, c1, c2, c3};
    panel.normal = normal;
    return panel;
}

} // anonymous namespace

// ============================================================================
// Panel
// ============================================================================

AABB Panel::bounds() const {
    AABB box{corners[0], corners[0]};
    for (const auto& corner : corners) {
        box.expand(corner);
    }
    return box;
}

// ============================================================================
// Layout builders
// ============================================================================

std::vector<Panel> build_three_panel(double width, double height, double depth) {
    check_dimension(width, "width");
    check_dimension(height, "height");
    check_dimension(depth, "depth");

    std::vector<Panel> panels;
    panels.reserve(5);

    // Floor: extends from the corner toward the viewer, normal up
    panels.push_back(make_panel("Floor", PanelKind::FLOOR, Vec3(0.0, 0.0, 0.0),
                                Vec3(width, 0.0, 0.0), Vec3(width, 0.0, depth),
                                Vec3(0.0, 0.0, depth), Vec3(0.0, 1.0, 0.0)));

    // Left wall: X = 0 plane, runs along Z, normal toward the room (+X)
    panels.push_back(make_panel("Wall-Left", PanelKind::WALL, Vec3(0.0, 0.0, 0.0),
                                Vec3(0.0, 0.0, depth), Vec3(0.0, height, depth),
                                Vec3(0.0, height, 0.0), Vec3(1.0, 0.0, 0.0)));

    // Right wall: Z = 0 plane, runs along X, normal toward the room (+Z).
    // Starts at its outer edge so the winding matches the other panels.
    panels.push_back(make_panel("Wall-Right", PanelKind::WALL, Vec3(width, 0.0, 0.0),
                                Vec3(0.0, 0.0, 0.0), Vec3(0.0, height, 0.0),
                                Vec3(width, height, 0.0), Vec3(0.0, 0.0, 1.0)));

    return panels;
}

std::vector<Panel> build_four_panel(double width, double height, double depth) {
    std::vector<Panel> panels = build_three_panel(width, height, depth);

    // Ceiling: Y = height plane, shares the top edges of both walls, normal down
    panels.push_back(make_panel("Ceiling", PanelKind::CEILING, Vec3(0.0, height, depth),
                                Vec3(width, height, depth), Vec3(width, height, 0.0),
                                Vec3(0.0, height, 0.0), Vec3(0.0, -1.0, 0.0)));
    return panels;
}

std::vector<Panel> build_five_panel(double width, double height, double depth) {
    std::vector<Panel> panels = build_four_panel(width, height, depth);

    // Back wall: Z = depth plane, closes the far edges of floor, ceiling and left wall
    panels.push_back(make_panel("Wall-Back", PanelKind::WALL, Vec3(0.0, 0.0, depth),
                                Vec3(width, 0.0, depth), Vec3(width, height, depth),
                                Vec3(0.0, height, depth), Vec3(0.0, 0.0, -1.0)));
    return panels;
}

std::vector<Panel> build_layout(LayoutKind kind, double panel_width, double panel_height,
                                const std::optional<RoomScale>& room_scale) {
    check_dimension(panel_width, "panel_width");
    check_dimension(panel_height, "panel_height");

    double width = panel_width;
    double height = panel_height;
    double depth = panel_width;

    if (room_scale) {
        check_dimension(room_scale->width, "room_width");
        check_dimension(room_scale->height, "room_height");
        check_dimension(room_scale->depth, "room_depth");

        double scale = unit_scale_factor(room_scale->room_units, room_scale->panel_units);
        width = room_scale->width * scale;
        height = room_scale->height * scale;
        depth = room_scale->depth * scale;
    }

    spdlog::debug("[Layout] Building {} ({:.2f} x {:.2f} x {:.2f})", layout_kind_name(kind), width,
                  height, depth);

    switch (kind) {
    case LayoutKind::THREE_PANEL:
        return build_three_panel(width, height, depth);
    case LayoutKind::FOUR_PANEL:
        return build_four_panel(width, height, depth);
    case LayoutKind::FIVE_PANEL:
        return build_five_panel(width, height, depth);
    }
    return build_three_panel(width, height, depth);
}

// ============================================================================
// Derived geometry
// ============================================================================

LayoutBounds layout_bounds(const std::vector<Panel>& panels) {
    LayoutBounds result;
    if (panels.empty()) {
        return result;
    }

    result.box = AABB{panels[0].corners[0], panels[0].corners[0]};
    Vec3 sum(0.0);
    size_t count = 0;
    for (const auto& panel : panels) {
        for (const auto& corner : panel.corners) {
            result.box.expand(corner);
            sum += corner;
            count++;
        }
    }
    result.centroid = sum / static_cast<double>(count);
    return result;
}

std::vector<std::array<bool, 4>> find_shared_edges(const std::vector<Panel>& panels) {
    std::vector<std::array<bool, 4>> shared(panels.size(), {false, false, false, false});

    for (size_t i = 0; i < panels.size(); ++i) {
        for (int e = 0; e < 4; ++e) {
            const Vec3& a = panels[i].corners[e];
            const Vec3& b = panels[i].corners[(e + 1) % 4];

            for (size_t j = 0; j < i && !shared[i][e]; ++j) {
                for (int f = 0; f < 4; ++f) {
                    const Vec3& c = panels[j].corners[f];
                    const Vec3& d = panels[j].corners[(f + 1) % 4];
                    if ((approx_equal(a, c) && approx_equal(b, d)) ||
                        (approx_equal(a, d) && approx_equal(b, c))) {
                        shared[i][e] = true;
                        break;
                    }
                }
            }
        }
    }
    return shared;
}

std::string validate_panel(const Panel& panel, double tolerance) {
    const auto& c = panel.corners;
    double scale = std::max(1.0, glm::length(panel.bounds().size()));
    double tol = tolerance * scale * scale;

    if (std::abs(glm::length(panel.normal) - 1.0) > 1e-6) {
        return "normal is not unit length";
    }

    Vec3 plane_normal = glm::cross(c[1] - c[0], c[3] - c[0]);
    auto unit_normal = try_normalize(plane_normal);
    if (!unit_normal) {
        return "corners are collinear";
    }

    // Normal from the opposite corner's edge pair must agree
    auto opposite_normal = try_normalize(glm::cross(c[3] - c[2], c[1] - c[2]));
    if (!opposite_normal || glm::length(*unit_normal - *opposite_normal) > 1e-6) {
        return "corners are not coplanar";
    }
    if (std::abs(glm::dot(c[2] - c[0], *unit_normal)) > tolerance * scale) {
        return "corners are not coplanar";
    }

    // Convex and simple: every turn goes the same way around the plane normal
    for (int i = 0; i < 4; ++i) {
        Vec3 edge_in = c[(i + 1) % 4] - c[i];
        Vec3 edge_out = c[(i + 2) % 4] - c[(i + 1) % 4];
        if (glm::dot(glm::cross(edge_in, edge_out), *unit_normal) <= tol) {
            return "outline is not convex";
        }
    }

    // Clockwise viewed from the side the normal points to
    if (glm::dot(*unit_normal, panel.normal) >= 0.0) {
        return "corners are not wound clockwise as seen from inside the room";
    }
    if (!are_parallel(*unit_normal, panel.normal, 1e-6)) {
        return "normal is not perpendicular to the panel plane";
    }

    return {};
}

// ============================================================================
// Names, units and presets
// ============================================================================

double unit_scale_factor(LengthUnit from, LengthUnit to) {
    return to_inches(from) / to_inches(to);
}

const char* layout_kind_name(LayoutKind kind) {
    switch (kind) {
    case LayoutKind::THREE_PANEL:
        return "3panel";
    case LayoutKind::FOUR_PANEL:
        return "4panel";
    case LayoutKind::FIVE_PANEL:
        return "5panel";
    }
    return "unknown";
}

const char* layout_display_name(LayoutKind kind) {
    switch (kind) {
    case LayoutKind::THREE_PANEL:
        return "3-Panel Corner Room";
    case LayoutKind::FOUR_PANEL:
        return "4-Panel Room with Ceiling";
    case LayoutKind::FIVE_PANEL:
        return "5-Panel Enclosed Room";
    }
    return "Unknown Layout";
}

size_t layout_panel_count(LayoutKind kind) {
    switch (kind) {
    case LayoutKind::THREE_PANEL:
        return 3;
    case LayoutKind::FOUR_PANEL:
        return 4;
    case LayoutKind::FIVE_PANEL:
        return 5;
    }
    return 0;
}

std::optional<LayoutKind> parse_layout_kind(const std::string& str) {
    if (str == "3panel") {
        return LayoutKind::THREE_PANEL;
    }
    if (str == "4panel") {
        return LayoutKind::FOUR_PANEL;
    }
    if (str == "5panel") {
        return LayoutKind::FIVE_PANEL;
    }
    return std::nullopt;
}

std::optional<LengthUnit> parse_length_unit(const std::string& str) {
    if (str == "inches" || str == "in") {
        return LengthUnit::INCHES;
    }
    if (str == "feet" || str == "ft") {
        return LengthUnit::FEET;
    }
    if (str == "meters" || str == "m") {
        return LengthUnit::METERS;
    }
    if (str == "cm") {
        return LengthUnit::CENTIMETERS;
    }
    if (str == "mm") {
        return LengthUnit::MILLIMETERS;
    }
    return std::nullopt;
}

const char* length_unit_name(LengthUnit unit) {
    switch (unit) {
    case LengthUnit::INCHES:
        return "inches";
    case LengthUnit::FEET:
        return "feet";
    case LengthUnit::METERS:
        return "meters";
    case LengthUnit::CENTIMETERS:
        return "cm";
    case LengthUnit::MILLIMETERS:
        return "mm";
    }
    return "unknown";
}

std::string layout_description(LayoutKind kind, const std::vector<Panel>& panels,
                               double panel_width, double panel_height) {
    std::ostringstream out;
    out << layout_display_name(kind) << ": ";
    for (size_t i = 0; i < panels.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << panels[i].label;
    }
    out << " (" << panel_width << "\" x " << panel_height << "\")";
    return out.str();
}

std::optional<std::array<double, 2>> panel_size_preset(const std::string& name) {
    if (name == "small") {
        return std::array<double, 2>{4.0, 4.0};
    }
    if (name == "standard") {
        return std::array<double, 2>{6.0, 6.0};
    }
    if (name == "large") {
        return std::array<double, 2>{8.0, 8.0};
    }
    return std::nullopt;
}

std::optional<RoomScale> room_size_preset(const std::string& name) {
    RoomScale room;
    room.room_units = LengthUnit::FEET;
    room.panel_units = LengthUnit::INCHES;

    if (name == "small") {
        room.width = 8.0;
        room.height = 6.0;
        room.depth = 8.0;
    } else if (name == "standard") {
        room.width = 12.0;
        room.height = 8.0;
        room.depth = 12.0;
    } else if (name == "large") {
        room.width = 16.0;
        room.height = 10.0;
        room.depth = 16.0;
    } else {
        return std::nullopt;
    }
    return room;
}

} // namespace vantage
