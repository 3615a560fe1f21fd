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

#include "line_clipping.h"

#include <algorithm>
#include <cmath>

namespace vantage {

namespace {

// Cohen-Sutherland line clipping outcode bits
constexpr int CS_INSIDE = 0; // 0000
constexpr int CS_LEFT = 1;   // 0001
constexpr int CS_RIGHT = 2;  // 0010
constexpr int CS_BOTTOM = 4; // 0100
constexpr int CS_TOP = 8;    // 1000

// Polygons whose area is below this fraction of their squared extent are edge-on
constexpr double DEGENERATE_AREA_FACTOR = 1e-9;

int compute_outcode(const Vec2& p, const Rect2D& rect) {
    int code = CS_INSIDE;
    if (p.x < rect.min.x)
        code |= CS_LEFT;
    else if (p.x > rect.max.x)
        code |= CS_RIGHT;
    if (p.y < rect.min.y)
        code |= CS_TOP; // Note: y increases downward in canvas coords
    else if (p.y > rect.max.y)
        code |= CS_BOTTOM;
    return code;
}

Rect2D polygon_bounds(const std::vector<Vec2>& polygon) {
    Rect2D box{polygon.front(), polygon.front()};
    for (const auto& p : polygon) {
        box.expand(p);
    }
    return box;
}

bool is_degenerate(const std::vector<Vec2>& polygon, double area) {
    if (polygon.size() < 3) {
        return true;
    }
    Rect2D box = polygon_bounds(polygon);
    double extent = std::max(1.0, glm::length(box.max - box.min));
    return std::abs(area) <= DEGENERATE_AREA_FACTOR * extent * extent;
}

double distance_to_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
    Vec2 ab = b - a;
    double len_sq = glm::dot(ab, ab);
    if (len_sq <= 0.0) {
        return glm::length(p - a);
    }
    double t = std::clamp(glm::dot(p - a, ab) / len_sq, 0.0, 1.0);
    return glm::length(p - (a + ab * t));
}

// Sutherland-Hodgman pass against one rectangle side
template <typename InsideFn, typename IntersectFn>
std::vector<Vec2> clip_against_side(const std::vector<Vec2>& input, InsideFn inside,
                                    IntersectFn intersect) {
    std::vector<Vec2> output;
    if (input.empty()) {
        return output;
    }
    output.reserve(input.size() + 2);

    Vec2 prev = input.back();
    bool prev_inside = inside(prev);
    for (const auto& curr : input) {
        bool curr_inside = inside(curr);
        if (curr_inside) {
            if (!prev_inside) {
                output.push_back(intersect(prev, curr));
            }
            output.push_back(curr);
        } else if (prev_inside) {
            output.push_back(intersect(prev, curr));
        }
        prev = curr;
        prev_inside = curr_inside;
    }
    return output;
}

} // anonymous namespace

bool clip_segment_to_rect(Vec2& p0, Vec2& p1, const Rect2D& rect) {
    int outcode0 = compute_outcode(p0, rect);
    int outcode1 = compute_outcode(p1, rect);

    while (true) {
        if (!(outcode0 | outcode1)) {
            // Both endpoints inside - accept
            return true;
        }
        if (outcode0 & outcode1) {
            // Both endpoints share an outside zone - reject
            return false;
        }

        // Line crosses boundary - clip
        Vec2 clipped;
        int outcode_out = outcode0 ? outcode0 : outcode1;

        // Find intersection with clipping boundary
        if (outcode_out & CS_BOTTOM) {
            clipped.x = p0.x + (p1.x - p0.x) * (rect.max.y - p0.y) / (p1.y - p0.y);
            clipped.y = rect.max.y;
        } else if (outcode_out & CS_TOP) {
            clipped.x = p0.x + (p1.x - p0.x) * (rect.min.y - p0.y) / (p1.y - p0.y);
            clipped.y = rect.min.y;
        } else if (outcode_out & CS_RIGHT) {
            clipped.y = p0.y + (p1.y - p0.y) * (rect.max.x - p0.x) / (p1.x - p0.x);
            clipped.x = rect.max.x;
        } else {
            clipped.y = p0.y + (p1.y - p0.y) * (rect.min.x - p0.x) / (p1.x - p0.x);
            clipped.x = rect.min.x;
        }

        if (outcode_out == outcode0) {
            p0 = clipped;
            outcode0 = compute_outcode(p0, rect);
        } else {
            p1 = clipped;
            outcode1 = compute_outcode(p1, rect);
        }
    }
}

bool clip_segment_to_convex_polygon(Vec2& p0, Vec2& p1, const std::vector<Vec2>& polygon) {
    if (polygon.empty()) {
        return false;
    }

    double area = polygon_signed_area(polygon);
    if (is_degenerate(polygon, area)) {
        Rect2D box = polygon_bounds(polygon);
        box.min -= Vec2(CLIP_TOLERANCE);
        box.max += Vec2(CLIP_TOLERANCE);
        return clip_segment_to_rect(p0, p1, box);
    }

    double orientation = area > 0.0 ? 1.0 : -1.0;
    Vec2 direction = p1 - p0;
    double t_enter = 0.0;
    double t_exit = 1.0;

    for (size_t i = 0; i < polygon.size(); ++i) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[(i + 1) % polygon.size()];
        Vec2 edge = b - a;
        double edge_len = glm::length(edge);
        if (edge_len <= EPSILON) {
            continue;
        }

        // Unit inward normal (left of the edge for counter-clockwise outlines)
        Vec2 normal = Vec2(-edge.y, edge.x) * (orientation / edge_len);
        double distance = glm::dot(normal, p0 - a);
        double rate = glm::dot(normal, direction);

        if (std::abs(rate) <= EPSILON) {
            // Parallel to this edge: all in or all out
            if (distance < -CLIP_TOLERANCE) {
                return false;
            }
            continue;
        }

        double t = -distance / rate;
        if (rate > 0.0) {
            t_enter = std::max(t_enter, t);
        } else {
            t_exit = std::min(t_exit, t);
        }
        if (t_enter > t_exit) {
            return false;
        }
    }

    Vec2 start = p0 + direction * t_enter;
    Vec2 end = p0 + direction * t_exit;
    p0 = start;
    p1 = end;
    return true;
}

std::vector<Vec2> clip_polygon_to_rect(const std::vector<Vec2>& polygon, const Rect2D& rect) {
    std::vector<Vec2> result = polygon;

    result = clip_against_side(
        result, [&](const Vec2& p) { return p.x >= rect.min.x; },
        [&](const Vec2& a, const Vec2& b) {
            double t = (rect.min.x - a.x) / (b.x - a.x);
            return Vec2(rect.min.x, a.y + (b.y - a.y) * t);
        });
    result = clip_against_side(
        result, [&](const Vec2& p) { return p.x <= rect.max.x; },
        [&](const Vec2& a, const Vec2& b) {
            double t = (rect.max.x - a.x) / (b.x - a.x);
            return Vec2(rect.max.x, a.y + (b.y - a.y) * t);
        });
    result = clip_against_side(
        result, [&](const Vec2& p) { return p.y >= rect.min.y; },
        [&](const Vec2& a, const Vec2& b) {
            double t = (rect.min.y - a.y) / (b.y - a.y);
            return Vec2(a.x + (b.x - a.x) * t, rect.min.y);
        });
    result = clip_against_side(
        result, [&](const Vec2& p) { return p.y <= rect.max.y; },
        [&](const Vec2& a, const Vec2& b) {
            double t = (rect.max.y - a.y) / (b.y - a.y);
            return Vec2(a.x + (b.x - a.x) * t, rect.max.y);
        });

    // Every vertex is now inside up to rounding in the interpolated coordinate
    for (auto& p : result) {
        p.x = std::clamp(p.x, rect.min.x, rect.max.x);
        p.y = std::clamp(p.y, rect.min.y, rect.max.y);
    }
    return result;
}

double polygon_signed_area(const std::vector<Vec2>& polygon) {
    double twice_area = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[(i + 1) % polygon.size()];
        twice_area += a.x * b.y - b.x * a.y;
    }
    return twice_area * 0.5;
}

bool point_in_convex_polygon(const Vec2& p, const std::vector<Vec2>& polygon, double tolerance) {
    if (polygon.empty()) {
        return false;
    }

    double area = polygon_signed_area(polygon);
    if (is_degenerate(polygon, area)) {
        // Edge-on outline: inside means on the outline
        for (size_t i = 0; i < polygon.size(); ++i) {
            if (distance_to_segment(p, polygon[i], polygon[(i + 1) % polygon.size()]) <=
                tolerance) {
                return true;
            }
        }
        return false;
    }

    double orientation = area > 0.0 ? 1.0 : -1.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[(i + 1) % polygon.size()];
        Vec2 edge = b - a;
        double edge_len = glm::length(edge);
        if (edge_len <= EPSILON) {
            continue;
        }
        Vec2 normal = Vec2(-edge.y, edge.x) * (orientation / edge_len);
        if (glm::dot(normal, p - a) < -tolerance) {
            return false;
        }
    }
    return true;
}

} // namespace vantage
