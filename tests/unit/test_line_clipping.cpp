// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Vantage Contributors
 */

#include "line_clipping.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace vantage;
using Catch::Approx;

TEST_CASE("Clipping - Segment to rectangle", "[clipping]") {
    Rect2D rect{Vec2(0.0, 0.0), Vec2(100.0, 50.0)};

    SECTION("Inside segment is untouched") {
        Vec2 a(10.0, 10.0), b(90.0, 40.0);
        REQUIRE(clip_segment_to_rect(a, b, rect));
        REQUIRE(a == Vec2(10.0, 10.0));
        REQUIRE(b == Vec2(90.0, 40.0));
    }

    SECTION("Outside segment is rejected") {
        Vec2 a(-10.0, -10.0), b(-5.0, 60.0);
        REQUIRE_FALSE(clip_segment_to_rect(a, b, rect));

        Vec2 c(110.0, 10.0), d(150.0, 40.0);
        REQUIRE_FALSE(clip_segment_to_rect(c, d, rect));
    }

    SECTION("Crossing segment is trimmed to the border") {
        Vec2 a(-50.0, 25.0), b(150.0, 25.0);
        REQUIRE(clip_segment_to_rect(a, b, rect));
        REQUIRE(a.x == Approx(0.0));
        REQUIRE(b.x == Approx(100.0));
        REQUIRE(a.y == Approx(25.0));
    }

    SECTION("Diagonal through a corner region") {
        Vec2 a(-10.0, -10.0), b(60.0, 60.0);
        REQUIRE(clip_segment_to_rect(a, b, rect));
        REQUIRE(rect.contains(a, 1e-9));
        REQUIRE(rect.contains(b, 1e-9));
        REQUIRE(a.x == Approx(0.0));
        REQUIRE(b.y == Approx(50.0));
    }

    SECTION("Segment missing the rectangle past a corner") {
        Vec2 a(90.0, -20.0), b(120.0, 10.0);
        REQUIRE_FALSE(clip_segment_to_rect(a, b, rect));
    }
}

TEST_CASE("Clipping - Segment to convex polygon", "[clipping]") {
    // Diamond, counter-clockwise in a Y-up frame
    std::vector<Vec2> diamond = {Vec2(0.0, -10.0), Vec2(10.0, 0.0), Vec2(0.0, 10.0),
                                 Vec2(-10.0, 0.0)};

    SECTION("Horizontal line through the middle") {
        Vec2 a(-20.0, 0.0), b(20.0, 0.0);
        REQUIRE(clip_segment_to_convex_polygon(a, b, diamond));
        REQUIRE(a.x == Approx(-10.0));
        REQUIRE(b.x == Approx(10.0));
    }

    SECTION("Winding does not matter") {
        std::vector<Vec2> reversed(diamond.rbegin(), diamond.rend());
        Vec2 a(-20.0, 5.0), b(20.0, 5.0);
        REQUIRE(clip_segment_to_convex_polygon(a, b, reversed));
        REQUIRE(a.x == Approx(-5.0));
        REQUIRE(b.x == Approx(5.0));
    }

    SECTION("Line outside the polygon is rejected") {
        Vec2 a(8.0, 8.0), b(20.0, 8.0);
        REQUIRE_FALSE(clip_segment_to_convex_polygon(a, b, diamond));
    }

    SECTION("Clipped endpoints lie inside") {
        Vec2 a(-30.0, -7.0), b(25.0, 9.0);
        REQUIRE(clip_segment_to_convex_polygon(a, b, diamond));
        REQUIRE(point_in_convex_polygon(a, diamond, 1e-9));
        REQUIRE(point_in_convex_polygon(b, diamond, 1e-9));
    }

    SECTION("Edge-on polygon clips to its extent") {
        std::vector<Vec2> sliver = {Vec2(5.0, 0.0), Vec2(5.0, 10.0), Vec2(5.0, 20.0),
                                    Vec2(5.0, 5.0)};
        Vec2 a(5.0, -10.0), b(5.0, 30.0);
        REQUIRE(clip_segment_to_convex_polygon(a, b, sliver));
        REQUIRE(a.y == Approx(0.0).margin(1e-5));
        REQUIRE(b.y == Approx(20.0).margin(1e-5));

        Vec2 c(6.0, 0.0), d(6.0, 10.0);
        REQUIRE_FALSE(clip_segment_to_convex_polygon(c, d, sliver));
    }
}

TEST_CASE("Clipping - Polygon to rectangle", "[clipping]") {
    Rect2D rect{Vec2(0.0, 0.0), Vec2(10.0, 10.0)};

    SECTION("Contained polygon is unchanged") {
        std::vector<Vec2> square = {Vec2(2.0, 2.0), Vec2(8.0, 2.0), Vec2(8.0, 8.0), Vec2(2.0, 8.0)};
        auto clipped = clip_polygon_to_rect(square, rect);
        REQUIRE(clipped.size() == 4);
        REQUIRE(polygon_signed_area(clipped) == Approx(36.0));
    }

    SECTION("Overhanging polygon is cut at the border") {
        std::vector<Vec2> square = {Vec2(5.0, 5.0), Vec2(15.0, 5.0), Vec2(15.0, 15.0),
                                    Vec2(5.0, 15.0)};
        auto clipped = clip_polygon_to_rect(square, rect);
        REQUIRE(polygon_signed_area(clipped) == Approx(25.0));
        for (const auto& p : clipped) {
            REQUIRE(rect.contains(p, 1e-9));
        }
    }

    SECTION("Disjoint polygon vanishes") {
        std::vector<Vec2> square = {Vec2(20.0, 20.0), Vec2(30.0, 20.0), Vec2(30.0, 30.0)};
        REQUIRE(clip_polygon_to_rect(square, rect).empty());
    }
}

TEST_CASE("Clipping - Signed area orientation", "[clipping]") {
    std::vector<Vec2> ccw = {Vec2(0.0, 0.0), Vec2(1.0, 0.0), Vec2(1.0, 1.0), Vec2(0.0, 1.0)};
    std::vector<Vec2> cw(ccw.rbegin(), ccw.rend());
    REQUIRE(polygon_signed_area(ccw) == Approx(1.0));
    REQUIRE(polygon_signed_area(cw) == Approx(-1.0));
}
