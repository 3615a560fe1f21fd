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

#include "perspective_transform.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

/**
 * @file panel_layout.h
 * @brief Room layouts built from planar quadrilateral panels
 *
 * Coordinate system (origin at the corner where the walls meet the floor):
 * - X axis: along the right wall
 * - Y axis: vertical (floor to ceiling)
 * - Z axis: along the left wall
 *
 * Larger layouts are composed from smaller ones: the four-panel builder
 * calls the three-panel builder and appends the ceiling, the five-panel
 * builder calls the four-panel builder and appends the back wall.
 *
 * Every panel is wound clockwise when viewed from inside the room, i.e.
 * cross(c1 - c0, c3 - c0) points opposite the inward normal.
 */

namespace vantage {

enum class LayoutKind {
    THREE_PANEL, ///< Floor + left wall + right wall
    FOUR_PANEL,  ///< THREE_PANEL + ceiling
    FIVE_PANEL   ///< FOUR_PANEL + back wall
};

enum class PanelKind { FLOOR, WALL, CEILING };

enum class LengthUnit { INCHES, FEET, METERS, CENTIMETERS, MILLIMETERS };

/**
 * @brief Planar quadrilateral surface of the room
 */
struct Panel {
    std::string label;                      ///< "Floor", "Wall-Left", ...
    std::array<Vec3, 4> corners;            ///< Consistently wound corners
    Vec3 normal{0.0, 1.0, 0.0};             ///< Unit normal pointing into the room
    PanelKind kind = PanelKind::FLOOR;      ///< Surface category
    std::optional<double> density_override; ///< Per-panel grid density (empty = global)

    /// First local edge direction (corner[1] - corner[0])
    Vec3 u_edge() const {
        return corners[1] - corners[0];
    }

    /// Second local edge direction (corner[3] - corner[0])
    Vec3 v_edge() const {
        return corners[3] - corners[0];
    }

    Vec3 center() const {
        return (corners[0] + corners[1] + corners[2] + corners[3]) * 0.25;
    }

    AABB bounds() const;
};

/**
 * @brief Room dimensions in room units
 *
 * When supplied to build_layout(), the room is built at this size
 * (converted into panel units) instead of at panel size.
 */
struct RoomScale {
    double width = 0.0;
    double height = 0.0;
    double depth = 0.0;
    LengthUnit room_units = LengthUnit::FEET;
    LengthUnit panel_units = LengthUnit::INCHES;
};

/**
 * @brief Bounding box and centroid of a whole layout
 */
struct LayoutBounds {
    AABB box;
    Vec3 centroid{0.0, 0.0, 0.0}; ///< Mean of all panel corners
};

/**
 * @brief Build the panel set of a layout
 *
 * Without a room scale the room is panel_width wide, panel_width deep and
 * panel_height tall.
 *
 * @throws GridError(INVALID_LAYOUT_DIMENSIONS) if width, height or depth <= 0
 */
std::vector<Panel> build_layout(LayoutKind kind, double panel_width, double panel_height,
                                const std::optional<RoomScale>& room_scale = std::nullopt);

/// Floor, Wall-Left, Wall-Right for a room of the given size
std::vector<Panel> build_three_panel(double width, double height, double depth);

/// build_three_panel() plus Ceiling at y = height
std::vector<Panel> build_four_panel(double width, double height, double depth);

/// build_four_panel() plus Wall-Back at z = depth
std::vector<Panel> build_five_panel(double width, double height, double depth);

LayoutBounds layout_bounds(const std::vector<Panel>& panels);

/**
 * @brief Find panel edges already owned by an earlier panel
 *
 * Edge i of a panel runs from corner[i] to corner[(i + 1) % 4]. An edge is
 * marked shared when a panel earlier in the list has an edge with the same
 * endpoints (either direction).
 *
 * @return One mask per panel, true = emitted by an earlier panel
 */
std::vector<std::array<bool, 4>> find_shared_edges(const std::vector<Panel>& panels);

/**
 * @brief Check panel invariants
 *
 * Coplanar corners, convex and non-self-intersecting outline, unit normal
 * and clockwise winding as seen from the normal side.
 *
 * @return Empty string if valid, otherwise a description of the violation
 */
std::string validate_panel(const Panel& panel, double tolerance = 1e-9);

/**
 * @brief Conversion factor between length units (via inches)
 */
double unit_scale_factor(LengthUnit from, LengthUnit to);

const char* layout_kind_name(LayoutKind kind);

/**
 * @brief Human readable layout name, e.g. "3-Panel Corner Room"
 */
const char* layout_display_name(LayoutKind kind);

size_t layout_panel_count(LayoutKind kind);

/**
 * @brief Parse "3panel" / "4panel" / "5panel"
 * @return Kind, or std::nullopt if unrecognized
 */
std::optional<LayoutKind> parse_layout_kind(const std::string& str);

std::optional<LengthUnit> parse_length_unit(const std::string& str);

const char* length_unit_name(LengthUnit unit);

/**
 * @brief Describe a layout, e.g. "3-Panel Corner Room: Floor, Wall-Left, Wall-Right (6" x 6")"
 */
std::string layout_description(LayoutKind kind, const std::vector<Panel>& panels,
                               double panel_width, double panel_height);

/**
 * @brief Panel size preset ("small" 4x4, "standard" 6x6, "large" 8x8 inches)
 * @return {width, height}, or std::nullopt for an unknown preset
 */
std::optional<std::array<double, 2>> panel_size_preset(const std::string& name);

/**
 * @brief Room size preset ("small", "standard", "large"), in feet
 */
std::optional<RoomScale> room_size_preset(const std::string& name);

} // namespace vantage
