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

#include "perspective_camera.h"

#include "grid_error.h"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <string>

#include <glm/gtc/matrix_transform.hpp>

namespace vantage {

namespace {

bool is_finite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

[[noreturn]] void fail_camera(const std::string& message, const char* parameter) {
    throw GridError(GridErrorType::INVALID_CAMERA_CONFIG, message, parameter);
}

double half_fov_tangent(double fov_degrees) {
    return std::tan(degrees_to_radians(fov_degrees) / 2.0);
}

} // namespace

Camera Camera::build(const Vec3& position, const Vec3& target, const Vec3& up,
                     double fov_degrees, double near_plane, double far_plane,
                     ProjectionMode mode) {
    if (!is_finite(position)) {
        fail_camera("Camera position must be finite", "camera_position");
    }
    if (!is_finite(target)) {
        fail_camera("Camera target must be finite", "camera_target");
    }
    if (approx_equal(position, target)) {
        fail_camera("Camera position and target cannot be the same point", "camera_position");
    }
    if (!try_normalize(up)) {
        fail_camera("Camera up vector must be non-zero", "camera_up");
    }
    if (!std::isfinite(fov_degrees) || fov_degrees <= 0.0 || fov_degrees >= 180.0) {
        fail_camera("Field of view must be in (0, 180) degrees, got " + std::to_string(fov_degrees),
                    "fov_degrees");
    }
    if (!std::isfinite(near_plane) || near_plane <= 0.0) {
        fail_camera("Near plane must be positive, got " + std::to_string(near_plane), "near");
    }
    if (!std::isfinite(far_plane) || far_plane <= near_plane) {
        fail_camera("Far plane must be greater than near plane (" + std::to_string(near_plane) +
                        "), got " + std::to_string(far_plane),
                    "far");
    }

    Camera camera;
    camera.position_ = position;
    camera.target_ = target;
    camera.up_ = up;
    camera.fov_degrees_ = fov_degrees;
    camera.near_plane_ = near_plane;
    camera.far_plane_ = far_plane;
    camera.mode_ = mode;
    return camera;
}

Mat4 Camera::view_matrix() const {
    Vec3 forward = glm::normalize(target_ - position_);
    if (are_parallel(forward, up_)) {
        throw GridError(GridErrorType::DEGENERATE_BASIS,
                        "Camera view direction is parallel to the up vector; "
                        "choose a different up hint",
                        "camera_up");
    }

    // right = normalize(forward x up), camera_up = right x forward
    return glm::lookAt(position_, target_, up_);
}

Mat4 Camera::projection_matrix(double aspect_ratio) const {
    if (!std::isfinite(aspect_ratio) || aspect_ratio <= 0.0) {
        fail_camera("Aspect ratio must be positive, got " + std::to_string(aspect_ratio),
                    "aspect_ratio");
    }

    double tan_half = half_fov_tangent(fov_degrees_);

    if (mode_ == ProjectionMode::ORTHOGRAPHIC) {
        // Same extent as the perspective frustum in the plane through the target
        double half_width = distance_to_target() * tan_half;
        double half_height = half_width / aspect_ratio;
        return glm::ortho(-half_width, half_width, -half_height, half_height, near_plane_,
                          far_plane_);
    }

    // glm takes the vertical FOV; derive it from the horizontal one
    double fovy = 2.0 * std::atan(tan_half / aspect_ratio);
    return glm::perspective(fovy, aspect_ratio, near_plane_, far_plane_);
}

Mat4 Camera::view_projection_matrix(double aspect_ratio) const {
    return projection_matrix(aspect_ratio) * view_matrix();
}

double Camera::distance_to_target() const {
    return glm::length(target_ - position_);
}

double Camera::focal_length(double canvas_half_width) const {
    return canvas_half_width / half_fov_tangent(fov_degrees_);
}

double Camera::azimuth_degrees() const {
    Vec3 offset = position_ - target_;
    double azimuth = radians_to_degrees(std::atan2(offset.z, offset.x));
    if (azimuth < 0.0) {
        azimuth += 360.0;
    }
    return azimuth;
}

double Camera::elevation_degrees() const {
    Vec3 offset = position_ - target_;
    double ratio = std::clamp(offset.y / glm::length(offset), -1.0, 1.0);
    return radians_to_degrees(std::asin(ratio));
}

Camera Camera::orbit(double azimuth_delta, double elevation_delta) const {
    double azimuth = azimuth_degrees() + azimuth_delta;
    double elevation = elevation_degrees() + elevation_delta;

    // Wrap azimuth to [0, 360)
    azimuth = std::fmod(azimuth, 360.0);
    if (azimuth < 0.0) {
        azimuth += 360.0;
    }

    return orbit_to(azimuth, elevation, distance_to_target());
}

Camera Camera::orbit_to(double azimuth, double elevation, double distance) const {
    if (!std::isfinite(distance) || distance <= 0.0) {
        fail_camera("Orbit distance must be positive, got " + std::to_string(distance),
                    "distance");
    }
    if (!std::isfinite(azimuth) || !std::isfinite(elevation)) {
        fail_camera("Orbit angles must be finite", "azimuth");
    }

    // Clamp elevation to avoid gimbal lock at poles
    elevation = std::clamp(elevation, -MAX_ORBIT_ELEVATION_DEG, MAX_ORBIT_ELEVATION_DEG);

    double azimuth_rad = degrees_to_radians(azimuth);
    double elevation_rad = degrees_to_radians(elevation);

    Vec3 offset(distance * std::cos(elevation_rad) * std::cos(azimuth_rad),
                distance * std::sin(elevation_rad),
                distance * std::cos(elevation_rad) * std::sin(azimuth_rad));

    Camera moved = *this;
    moved.position_ = target_ + offset;

    spdlog::trace("[Camera] Orbit: azimuth={:.1f}°, elevation={:.1f}°, distance={:.2f}", azimuth,
                  elevation, distance);
    return moved;
}

Camera Camera::with_distance(double distance) const {
    if (!std::isfinite(distance) || distance <= 0.0) {
        fail_camera("Distance must be positive, got " + std::to_string(distance), "distance");
    }

    Vec3 direction = glm::normalize(position_ - target_);
    Camera moved = *this;
    moved.position_ = target_ + direction * distance;
    return moved;
}

Camera Camera::with_projection_mode(ProjectionMode mode) const {
    Camera switched = *this;
    switched.mode_ = mode;
    return switched;
}

Camera create_standard_camera(double distance, double fov_degrees) {
    return Camera::build(Vec3(0.0, 4.0, distance), Vec3(0.0), WORLD_UP, fov_degrees, 0.1, 100.0,
                         ProjectionMode::PERSPECTIVE);
}

Camera create_orthographic_camera(double distance, double fov_degrees) {
    return Camera::build(Vec3(0.0, 4.0, distance), Vec3(0.0), WORLD_UP, fov_degrees, 0.1,
                         distance * 2.0, ProjectionMode::ORTHOGRAPHIC);
}

Camera fit_camera_to_bounds(const AABB& bounds, double fov_degrees, ProjectionMode mode) {
    if (bounds.is_empty()) {
        fail_camera("Cannot fit camera to empty bounding box", "bounds");
    }
    if (!std::isfinite(fov_degrees) || fov_degrees <= 0.0 || fov_degrees >= 180.0) {
        fail_camera("Field of view must be in (0, 180) degrees, got " + std::to_string(fov_degrees),
                    "fov_degrees");
    }

    Vec3 center = bounds.center();
    double radius = glm::length(bounds.size()) * 0.5;

    // Fit the bounding sphere inside the horizontal half-angle, 10% margin
    double half_fov = degrees_to_radians(fov_degrees) / 2.0;
    double distance = radius / std::sin(half_fov) * 1.1;

    Vec3 direction = glm::normalize(Vec3(1.0, 0.6, 1.0));
    Vec3 position = center + direction * distance;

    double near_plane = distance * 0.01;
    double far_plane = distance + radius * 2.0;

    spdlog::debug("[Camera] Fit to bounds: center=({:.2f},{:.2f},{:.2f}), radius={:.2f}, "
                  "distance={:.2f}",
                  center.x, center.y, center.z, radius, distance);

    return Camera::build(position, center, WORLD_UP, fov_degrees, near_plane, far_plane, mode);
}

const char* projection_mode_name(ProjectionMode mode) {
    switch (mode) {
    case ProjectionMode::PERSPECTIVE:
        return "perspective";
    case ProjectionMode::ORTHOGRAPHIC:
        return "orthographic";
    }
    return "unknown";
}

} // namespace vantage
