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

/**
 * @file perspective_camera.h
 * @brief Pinhole camera producing view and projection matrices
 *
 * A Camera is an immutable value. Operations that move it (orbit,
 * distance changes, mode switches) return a new Camera; nothing is
 * mutated after build().
 *
 * Conventions:
 * - Right-handed world, +Y up
 * - View space looks down -Z
 * - fov_degrees is the HORIZONTAL field of view, so that
 *   focal_length = canvas_half_width / tan(fov / 2)
 * - Orthographic view volume half-width = distance_to_target * tan(fov / 2),
 *   which makes both modes agree on scale in the plane through the target
 */

namespace vantage {

enum class ProjectionMode {
    PERSPECTIVE, ///< Frustum projection (vanishing points)
    ORTHOGRAPHIC ///< Parallel projection (no foreshortening)
};

/// Elevation limit for orbiting, keeps forward away from the world up pole
constexpr double MAX_ORBIT_ELEVATION_DEG = 89.0;

class Camera {
  public:
    /**
     * @brief Validate parameters and construct a camera
     *
     * @param position Eye position
     * @param target Look-at point
     * @param up Up hint (typically WORLD_UP)
     * @param fov_degrees Horizontal field of view, open range (0, 180)
     * @param near_plane Near clip distance, > 0
     * @param far_plane Far clip distance, > near_plane
     * @param mode Projection mode
     * @return Camera
     * @throws GridError(INVALID_CAMERA_CONFIG) on any violated constraint
     */
    static Camera build(const Vec3& position, const Vec3& target, const Vec3& up,
                        double fov_degrees, double near_plane, double far_plane,
                        ProjectionMode mode);

    const Vec3& position() const {
        return position_;
    }
    const Vec3& target() const {
        return target_;
    }
    const Vec3& up() const {
        return up_;
    }
    double fov_degrees() const {
        return fov_degrees_;
    }
    double near_plane() const {
        return near_plane_;
    }
    double far_plane() const {
        return far_plane_;
    }
    ProjectionMode projection_mode() const {
        return mode_;
    }

    /**
     * @brief World-to-camera look-at transform
     *
     * @throws GridError(DEGENERATE_BASIS) if the view direction is parallel
     *         to the up hint; supply a different up vector in that case
     */
    Mat4 view_matrix() const;

    /**
     * @brief Camera-to-clip transform for the current mode
     *
     * @param aspect_ratio Canvas width / height, > 0
     * @throws GridError(INVALID_CAMERA_CONFIG) for a non-positive aspect ratio
     */
    Mat4 projection_matrix(double aspect_ratio) const;

    /**
     * @brief Combined projection * view transform
     */
    Mat4 view_projection_matrix(double aspect_ratio) const;

    double distance_to_target() const;

    /**
     * @brief Pixel focal length for a canvas
     * @param canvas_half_width Half the canvas width in pixels
     * @return canvas_half_width / tan(fov / 2)
     */
    double focal_length(double canvas_half_width) const;

    /// Azimuth of the eye around the target, degrees in [0, 360), 0 = +X
    double azimuth_degrees() const;

    /// Elevation of the eye above the target's XZ plane, degrees in [-90, 90]
    double elevation_degrees() const;

    /**
     * @brief Rotate the eye about the target at constant distance
     *
     * Elevation is clamped to +/-MAX_ORBIT_ELEVATION_DEG so the next
     * view_matrix() build cannot hit the pole.
     *
     * @param azimuth_delta Degrees around the world Y axis
     * @param elevation_delta Degrees toward +Y
     * @return New camera, all other parameters unchanged
     */
    Camera orbit(double azimuth_delta, double elevation_delta) const;

    /**
     * @brief Place the eye at absolute spherical coordinates around the target
     *
     * @param azimuth Degrees, 0 = +X axis, 90 = +Z axis
     * @param elevation Degrees, 0 = XZ plane, 90 = +Y axis (clamped)
     * @param distance Distance from target, > 0
     * @throws GridError(INVALID_CAMERA_CONFIG) if distance <= 0
     */
    Camera orbit_to(double azimuth, double elevation, double distance) const;

    /**
     * @brief Move the eye along its current direction to a new distance
     * @throws GridError(INVALID_CAMERA_CONFIG) if distance <= 0
     */
    Camera with_distance(double distance) const;

    Camera with_projection_mode(ProjectionMode mode) const;

  private:
    Camera() = default;

    Vec3 position_{0.0, 0.0, 1.0};
    Vec3 target_{0.0, 0.0, 0.0};
    Vec3 up_{0.0, 1.0, 0.0};
    double fov_degrees_ = 50.0;
    double near_plane_ = 0.1;
    double far_plane_ = 100.0;
    ProjectionMode mode_ = ProjectionMode::PERSPECTIVE;
};

/**
 * @brief Standard viewpoint for forced perspective grids
 *
 * Slightly elevated eye at (0, 4, distance) looking at the origin.
 */
Camera create_standard_camera(double distance = 8.0, double fov_degrees = 50.0);

/**
 * @brief Orthographic variant of the standard viewpoint, far = 2 * distance
 */
Camera create_orthographic_camera(double distance = 8.0, double fov_degrees = 50.0);

/**
 * @brief Position a camera so a bounding box fills the view
 *
 * The eye stands on the open side of the room (positive X/Z, raised) and
 * looks at the box center, far enough back that the bounding sphere fits
 * inside the field of view.
 *
 * @param bounds Scene bounds (must not be empty)
 * @param fov_degrees Horizontal FOV for the returned camera
 * @param mode Projection mode for the returned camera
 * @throws GridError(INVALID_CAMERA_CONFIG) for empty bounds or invalid FOV
 */
Camera fit_camera_to_bounds(const AABB& bounds, double fov_degrees, ProjectionMode mode);

const char* projection_mode_name(ProjectionMode mode);

} // namespace vantage
