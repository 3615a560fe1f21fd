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

#include <vector>

/**
 * @file line_clipping.h
 * @brief 2D segment and polygon clipping in canvas space
 *
 * - Cohen-Sutherland: segment against an axis-aligned rectangle
 * - Cyrus-Beck: segment against a convex polygon of either winding
 * - Sutherland-Hodgman: convex polygon against an axis-aligned rectangle
 */

namespace vantage {

/// Distance tolerance (pixels) for inside tests on polygon edges
constexpr double CLIP_TOLERANCE = 1e-6;

/**
 * @brief Axis-aligned rectangle in canvas space
 */
struct Rect2D {
    Vec2 min{0.0, 0.0};
    Vec2 max{0.0, 0.0};

    double width() const {
        return max.x - min.x;
    }
    double height() const {
        return max.y - min.y;
    }

    bool contains(const Vec2& p, double tolerance = 0.0) const {
        return p.x >= min.x - tolerance && p.x <= max.x + tolerance &&
               p.y >= min.y - tolerance && p.y <= max.y + tolerance;
    }

    void expand(const Vec2& p) {
        min = glm::min(min, p);
        max = glm::max(max, p);
    }
};

/**
 * @brief Clip a segment to a rectangle (Cohen-Sutherland)
 *
 * Endpoints are updated in place.
 *
 * @return false if the segment lies completely outside
 */
bool clip_segment_to_rect(Vec2& p0, Vec2& p1, const Rect2D& rect);

/**
 * @brief Clip a segment to a convex polygon (Cyrus-Beck)
 *
 * Works for clockwise and counter-clockwise polygons. A polygon with
 * (near) zero area, e.g. a panel seen edge-on, clips against its bounding
 * box instead.
 *
 * @return false if the segment lies completely outside
 */
bool clip_segment_to_convex_polygon(Vec2& p0, Vec2& p1, const std::vector<Vec2>& polygon);

/**
 * @brief Clip a convex polygon to a rectangle (Sutherland-Hodgman)
 *
 * @return Clipped outline, empty if nothing remains
 */
std::vector<Vec2> clip_polygon_to_rect(const std::vector<Vec2>& polygon, const Rect2D& rect);

/**
 * @brief Shoelace signed area (positive = counter-clockwise in a Y-up frame)
 */
double polygon_signed_area(const std::vector<Vec2>& polygon);

/**
 * @brief Inside test for a convex polygon of either winding
 *
 * Points on the outline (within tolerance) count as inside.
 */
bool point_in_convex_polygon(const Vec2& p, const std::vector<Vec2>& polygon,
                             double tolerance = CLIP_TOLERANCE);

} // namespace vantage
