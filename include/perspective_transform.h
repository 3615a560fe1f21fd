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

#ifndef VANTAGE_PERSPECTIVE_TRANSFORM_H
#define VANTAGE_PERSPECTIVE_TRANSFORM_H

/**
 * @file perspective_transform.h
 * @brief Double-precision vector/matrix kernel for the projection pipeline
 *
 * Thin layer over glm's double types. Everything that can degenerate
 * (normalizing a zero vector, inverting a singular matrix, dividing by a
 * vanishing w) is routed through here so the degeneracy tolerance is
 * applied in one place:
 *
 * WORLD SPACE → VIEW SPACE → CLIP SPACE → NDC → CANVAS SPACE
 */

#include <glm/glm.hpp>

#include <optional>

namespace vantage {

using Vec2 = glm::dvec2;
using Vec3 = glm::dvec3;
using Vec4 = glm::dvec4;
using Mat4 = glm::dmat4;

/// Values within this distance of zero are treated as zero in degeneracy checks
constexpr double EPSILON = 1e-9;

/// World up direction (+Y)
const Vec3 WORLD_UP{0.0, 1.0, 0.0};

/**
 * @brief Axis-aligned bounding box for spatial queries
 */
struct AABB {
    Vec3 min{0.0, 0.0, 0.0};
    Vec3 max{0.0, 0.0, 0.0};

    /**
     * @brief Get center point of bounding box
     * @return Center coordinate
     */
    Vec3 center() const {
        return (min + max) * 0.5;
    }

    /**
     * @brief Get size (dimensions) of bounding box
     * @return Size vector (width, height, depth)
     */
    Vec3 size() const {
        return max - min;
    }

    /**
     * @brief Expand bounding box to include a point
     * @param point Point to include
     */
    void expand(const Vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    /**
     * @brief Check if bounding box is empty (not initialized)
     * @return true if empty (min == max)
     */
    bool is_empty() const {
        return min == max;
    }
};

/**
 * @brief Check whether a scalar is zero within tolerance
 */
inline bool is_near_zero(double value, double tolerance = EPSILON) {
    return value >= -tolerance && value <= tolerance;
}

double degrees_to_radians(double degrees);
double radians_to_degrees(double radians);

/**
 * @brief Normalize a vector, rejecting zero-length input
 *
 * @param v Vector to normalize
 * @return Unit vector, or std::nullopt if |v| <= EPSILON
 */
std::optional<Vec3> try_normalize(const Vec3& v);

/**
 * @brief Normalize a vector, mapping zero-length input to the zero vector
 */
Vec3 safe_normalize(const Vec3& v);

/**
 * @brief Check whether two directions are parallel (or anti-parallel)
 *
 * @return true if |normalize(a) x normalize(b)| <= tolerance, or either is zero
 */
bool are_parallel(const Vec3& a, const Vec3& b, double tolerance = EPSILON);

/**
 * @brief Check whether two points coincide within tolerance
 */
bool approx_equal(const Vec3& a, const Vec3& b, double tolerance = EPSILON);

/**
 * @brief Invert a 4x4 matrix
 *
 * @param m Matrix to invert
 * @return Inverse of m
 * @throws GridError(SINGULAR_MATRIX) if |det(m)| <= EPSILON
 */
Mat4 inverse(const Mat4& m);

/**
 * @brief Transform a point with homogeneous divide
 *
 * @param m Affine or projective transform
 * @param p Point (w = 1)
 * @return (x/w, y/w, z/w), or std::nullopt if w is within EPSILON of zero
 */
std::optional<Vec3> transform_point(const Mat4& m, const Vec3& p);

/**
 * @brief Transform a direction (w = 0, translation ignored)
 */
Vec3 transform_direction(const Mat4& m, const Vec3& d);

/**
 * @brief Check a matrix against identity
 *
 * @return true if every element is within tolerance of the identity's
 */
bool is_identity(const Mat4& m, double tolerance = 1e-9);

} // namespace vantage

#endif // VANTAGE_PERSPECTIVE_TRANSFORM_H
