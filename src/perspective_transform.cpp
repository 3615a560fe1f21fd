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

#include "perspective_transform.h"

#include "grid_error.h"

#include <cmath>
#include <glm/gtc/constants.hpp>

namespace vantage {

double degrees_to_radians(double degrees) {
    return degrees * glm::pi<double>() / 180.0;
}

double radians_to_degrees(double radians) {
    return radians * 180.0 / glm::pi<double>();
}

std::optional<Vec3> try_normalize(const Vec3& v) {
    double len = glm::length(v);
    if (!std::isfinite(len) || len <= EPSILON) {
        return std::nullopt;
    }
    return v / len;
}

Vec3 safe_normalize(const Vec3& v) {
    auto n = try_normalize(v);
    return n ? *n : Vec3(0.0);
}

bool are_parallel(const Vec3& a, const Vec3& b, double tolerance) {
    auto na = try_normalize(a);
    auto nb = try_normalize(b);
    if (!na || !nb) {
        return true;
    }
    return glm::length(glm::cross(*na, *nb)) <= tolerance;
}

bool approx_equal(const Vec3& a, const Vec3& b, double tolerance) {
    return glm::length(a - b) <= tolerance;
}

Mat4 inverse(const Mat4& m) {
    double det = glm::determinant(m);
    if (!std::isfinite(det) || std::abs(det) <= EPSILON) {
        throw GridError(GridErrorType::SINGULAR_MATRIX,
                        "Matrix is singular (determinant " + std::to_string(det) + ")", "matrix");
    }
    return glm::inverse(m);
}

std::optional<Vec3> transform_point(const Mat4& m, const Vec3& p) {
    Vec4 h = m * Vec4(p, 1.0);
    if (is_near_zero(h.w)) {
        return std::nullopt;
    }
    return Vec3(h.x / h.w, h.y / h.w, h.z / h.w);
}

Vec3 transform_direction(const Mat4& m, const Vec3& d) {
    return Vec3(m * Vec4(d, 0.0));
}

bool is_identity(const Mat4& m, double tolerance) {
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            double expected = (col == row) ? 1.0 : 0.0;
            if (std::abs(m[col][row] - expected) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

} // namespace vantage
