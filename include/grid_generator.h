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

#include "line_clipping.h"
#include "panel_layout.h"
#include "perspective_camera.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file grid_generator.h
 * @brief Perspective grid sampling, projection and clipping per panel
 *
 * Pipeline for one panel:
 *
 *   sample_panel()      3D boundary + interior lines on the panel surface
 *   Projector           view transform, near-plane clip, projection, divide,
 *                       NDC to canvas (Y down)
 *   project_panel()     clip to the panel's projected outline, clip to the
 *                       canvas, drop degenerate/short lines
 *
 * Grid density is an inverse spacing multiplier: spacing is
 * BASE_GRID_SPACING / density, so a higher density gives more lines.
 */

namespace vantage {

/// Grid spacing at density 1.0, in world units
constexpr double BASE_GRID_SPACING = 1.0;

/// Upper bound on interior lines per direction, guards against absurd densities
constexpr size_t MAX_INTERIOR_LINES_PER_AXIS = 100000;

/**
 * @brief Orientation of a line on the panel's local grid
 *
 * HORIZONTAL lines run parallel to corner[1] - corner[0],
 * VERTICAL lines run parallel to corner[3] - corner[0].
 */
enum class GridAxis { HORIZONTAL, VERTICAL };

/**
 * @brief Grid line on a panel surface in world space
 */
struct GridLine3D {
    Vec3 start{0.0, 0.0, 0.0};
    Vec3 end{0.0, 0.0, 0.0};
    GridAxis axis = GridAxis::HORIZONTAL;
    bool boundary = false; ///< true for panel edges, false for interior lines
    int edge_index = -1;   ///< Panel edge traced by a boundary line (0-3), -1 for interior
};

/**
 * @brief Projected, clipped grid line in canvas space
 */
struct GridLine2D {
    Vec2 start{0.0, 0.0};
    Vec2 end{0.0, 0.0};
    std::string panel_label;
    GridAxis axis = GridAxis::HORIZONTAL;
    bool boundary = false;

    double length() const {
        return glm::length(end - start);
    }
};

/**
 * @brief Tunables for projection output
 */
struct GridOptions {
    double min_line_length = 0.0; ///< Lines shorter than this (pixels) are dropped
};

/**
 * @brief All projected output of one panel
 */
struct PanelGrid {
    std::string label;
    PanelKind kind = PanelKind::FLOOR;
    std::vector<GridLine2D> lines;      ///< Boundary lines first, then interior lines
    std::vector<Vec2> boundary_polygon; ///< Projected outline clipped to the canvas
};

/**
 * @brief Grid spacing for a density
 * @throws GridError(INVALID_DENSITY) if density <= 0 or not finite
 */
double grid_spacing(double density);

/**
 * @brief Closed-form number of interior lines across an edge of given length
 *
 * Lines sit at k * spacing for k = 1, 2, ... strictly inside the edge; a
 * line falling exactly on the far edge is the boundary line, not interior.
 *
 * @throws GridError(INVALID_DENSITY) if density <= 0 or not finite
 */
size_t expected_interior_count(double edge_length, double density);

/**
 * @brief Sample a regular 3D grid on a panel
 *
 * Emits the four boundary edges (boundary=true, edge_index 0-3) followed by
 * the interior HORIZONTAL lines and then the interior VERTICAL lines.
 *
 * @param panel Panel to sample
 * @param density Positive density multiplier
 * @throws GridError(INVALID_DENSITY) if density <= 0, not finite, or so
 *         large that a direction would exceed MAX_INTERIOR_LINES_PER_AXIS
 */
std::vector<GridLine3D> sample_panel(const Panel& panel, double density);

/**
 * @brief World-to-canvas projection for one camera and canvas size
 *
 * Holds the view and projection matrices so they are built once per scene.
 * Geometry behind the near plane is clipped in view space before the
 * perspective divide.
 */
class Projector {
  public:
    /**
     * @throws GridError(INVALID_CONFIG) for non-positive canvas dimensions
     * @throws GridError(DEGENERATE_BASIS) if the camera basis is degenerate
     */
    Projector(const Camera& camera, int canvas_width, int canvas_height);

    int canvas_width() const {
        return canvas_width_;
    }
    int canvas_height() const {
        return canvas_height_;
    }

    /// Canvas rectangle [0, width] x [0, height]
    Rect2D canvas_rect() const;

    const Mat4& view_matrix() const {
        return view_;
    }
    const Mat4& projection_matrix() const {
        return projection_;
    }

    /**
     * @brief Transform a world point into view space
     */
    Vec3 to_view(const Vec3& world) const;

    /**
     * @brief Check whether a view-space point is on the visible side of the near plane
     */
    bool is_in_front(const Vec3& view_point) const;

    /**
     * @brief Clip a view-space segment to the visible side of the near plane
     *
     * A hidden endpoint is replaced by the intersection with z = -near.
     *
     * @return false if the whole segment is behind the near plane
     */
    bool clip_to_near_plane(Vec3& a, Vec3& b) const;

    /**
     * @brief Map a view-space point (in front of the near plane) to the canvas
     */
    Vec2 view_to_canvas(const Vec3& view_point) const;

    /**
     * @brief Project a world point to canvas coordinates
     * @return Canvas point, or std::nullopt if the point is behind the near plane
     */
    std::optional<Vec2> project_point(const Vec3& world) const;

    /**
     * @brief Project a world segment, clipping it at the near plane
     * @return Canvas endpoints, or std::nullopt if entirely behind the near plane
     */
    std::optional<std::pair<Vec2, Vec2>> project_segment(const Vec3& start,
                                                         const Vec3& end) const;

    /**
     * @brief Project a panel outline, clipping it at the near plane
     * @return Canvas outline (3 to 5 vertices), or empty if fully behind
     */
    std::vector<Vec2> project_outline(const std::array<Vec3, 4>& corners) const;

  private:
    Mat4 view_;
    Mat4 projection_;
    double near_plane_;
    int canvas_width_;
    int canvas_height_;
};

/**
 * @brief Project and clip a panel's sampled lines
 *
 * @param panel Owning panel (its outline is the clip region)
 * @param lines Lines from sample_panel()
 * @param projector Camera/canvas projection
 * @param options Output filtering
 */
PanelGrid project_panel(const Panel& panel, const std::vector<GridLine3D>& lines,
                        const Projector& projector, const GridOptions& options = {});

/**
 * @brief Convenience overload building the Projector from a camera
 */
PanelGrid project_panel(const Panel& panel, const std::vector<GridLine3D>& lines,
                        const Camera& camera, int canvas_width, int canvas_height,
                        const GridOptions& options = {});

const char* grid_axis_name(GridAxis axis);

} // namespace vantage
