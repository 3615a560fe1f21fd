// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Vantage Contributors
 */

#include "grid_error.h"
#include "perspective_transform.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

using namespace vantage;
using Catch::Approx;

TEST_CASE("Transform - Angle conversion", "[transform]") {
    REQUIRE(degrees_to_radians(180.0) == Approx(M_PI));
    REQUIRE(degrees_to_radians(90.0) == Approx(M_PI / 2.0));
    REQUIRE(radians_to_degrees(M_PI) == Approx(180.0));
    REQUIRE(radians_to_degrees(degrees_to_radians(37.5)) == Approx(37.5));
}

TEST_CASE("Transform - Normalization", "[transform]") {
    SECTION("Non-zero vector normalizes to unit length") {
        auto n = try_normalize(Vec3(3.0, 0.0, 4.0));
        REQUIRE(n.has_value());
        REQUIRE(glm::length(*n) == Approx(1.0));
        REQUIRE(n->x == Approx(0.6));
        REQUIRE(n->z == Approx(0.8));
    }

    SECTION("Zero vector has no direction") {
        REQUIRE_FALSE(try_normalize(Vec3(0.0)).has_value());
        REQUIRE_FALSE(try_normalize(Vec3(1e-12, 0.0, 0.0)).has_value());
    }

    SECTION("safe_normalize falls back to zero") {
        Vec3 n = safe_normalize(Vec3(0.0));
        REQUIRE(n == Vec3(0.0));
    }
}

TEST_CASE("Transform - Parallel and equality checks", "[transform]") {
    REQUIRE(are_parallel(Vec3(0.0, 1.0, 0.0), Vec3(0.0, 5.0, 0.0)));
    REQUIRE(are_parallel(Vec3(0.0, 1.0, 0.0), Vec3(0.0, -2.0, 0.0)));
    REQUIRE_FALSE(are_parallel(Vec3(0.0, 1.0, 0.0), Vec3(1.0, 1.0, 0.0)));

    REQUIRE(approx_equal(Vec3(1.0, 2.0, 3.0), Vec3(1.0, 2.0, 3.0 + 1e-12)));
    REQUIRE_FALSE(approx_equal(Vec3(1.0, 2.0, 3.0), Vec3(1.0, 2.0, 3.1)));
}

TEST_CASE("Transform - Matrix inverse", "[transform]") {
    SECTION("Inverse of a view matrix gives identity") {
        Mat4 view = glm::lookAt(Vec3(3.0, 4.0, 8.0), Vec3(0.5, 0.0, -1.0), Vec3(0.0, 1.0, 0.0));
        Mat4 product = view * vantage::inverse(view);
        REQUIRE(is_identity(product, 1e-9));
    }

    SECTION("Singular matrix is rejected") {
        Mat4 flat(1.0);
        flat[1][1] = 0.0; // Collapse Y
        try {
            vantage::inverse(flat);
            FAIL("Expected SINGULAR_MATRIX");
        } catch (const GridError& e) {
            REQUIRE(e.type() == GridErrorType::SINGULAR_MATRIX);
        }
    }
}

TEST_CASE("Transform - Point and direction transforms", "[transform]") {
    Mat4 translate = glm::translate(Mat4(1.0), Vec3(1.0, 2.0, 3.0));

    SECTION("Points are translated") {
        auto p = transform_point(translate, Vec3(1.0, 1.0, 1.0));
        REQUIRE(p.has_value());
        REQUIRE(approx_equal(*p, Vec3(2.0, 3.0, 4.0)));
    }

    SECTION("Directions ignore translation") {
        Vec3 d = transform_direction(translate, Vec3(0.0, 0.0, 1.0));
        REQUIRE(approx_equal(d, Vec3(0.0, 0.0, 1.0)));
    }

    SECTION("Point at infinity has no Euclidean image") {
        Mat4 degenerate(1.0);
        degenerate[3][3] = 0.0; // w' = 0 at the origin
        REQUIRE_FALSE(transform_point(degenerate, Vec3(0.0, 0.0, 0.0)).has_value());
    }
}

TEST_CASE("Transform - AABB", "[transform]") {
    AABB box{Vec3(0.0), Vec3(0.0)};
    REQUIRE(box.is_empty());

    box.expand(Vec3(2.0, 4.0, 6.0));
    box.expand(Vec3(-2.0, 0.0, 0.0));
    REQUIRE_FALSE(box.is_empty());
    REQUIRE(approx_equal(box.center(), Vec3(0.0, 2.0, 3.0)));
    REQUIRE(approx_equal(box.size(), Vec3(4.0, 4.0, 6.0)));
}

TEST_CASE("GridError - Kind and parameter", "[errors]") {
    GridError error(GridErrorType::INVALID_DENSITY, "Grid density must be positive", "density");
    REQUIRE(error.type() == GridErrorType::INVALID_DENSITY);
    REQUIRE(error.parameter() == "density");
    REQUIRE(std::string(error.what()) == "Grid density must be positive");

    REQUIRE(std::string(grid_error_type_name(GridErrorType::INVALID_CAMERA_CONFIG)) ==
            "InvalidCameraConfig");
    REQUIRE(std::string(grid_error_type_name(GridErrorType::DEGENERATE_BASIS)) ==
            "DegenerateBasis");
    REQUIRE(std::string(grid_error_type_name(GridErrorType::RENDER_FAILED)) == "RenderFailed");
}
