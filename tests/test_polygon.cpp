#include <gtest/gtest.h>
#include <geometry/polygon.hpp>
#include <cmath>
#include <stdexcept>

using namespace animatic;

namespace {

Polygon2 unit_square() {
    return {{-0.5, -0.5}, {0.5, -0.5}, {0.5, 0.5}, {-0.5, 0.5}};
}

}  // namespace

TEST(PolygonTest, RayFromOutside) {
    EXPECT_NEAR(ray_polygon_distance(unit_square(), {2.0, 0.0}, {-1.0, 0.0}), 1.5, 1e-12);
}

TEST(PolygonTest, DirectionNeedNotBeNormalized) {
    EXPECT_NEAR(ray_polygon_distance(unit_square(), {0.0, 3.0}, {0.0, -7.0}), 2.5, 1e-12);
}

TEST(PolygonTest, RayFromInsideIsNegative) {
    EXPECT_NEAR(ray_polygon_distance(unit_square(), {0.0, 0.0}, {-1.0, 0.0}), -0.5, 1e-12);
}

TEST(PolygonTest, RayMissing) {
    double d = ray_polygon_distance(unit_square(), {2.0, 3.0}, {1.0, 0.0});
    EXPECT_TRUE(std::isinf(d));
    EXPECT_GT(d, 0.0);

    // Only behind the point
    d = ray_polygon_distance(unit_square(), {2.0, 0.0}, {1.0, 0.0});
    EXPECT_TRUE(std::isinf(d));
    EXPECT_LT(d, 0.0);
}

TEST(PolygonTest, RejectsBadInput) {
    EXPECT_THROW(ray_polygon_distance(unit_square(), {2.0, 0.0}, {0.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(ray_polygon_distance({{0.0, 0.0}}, {2.0, 0.0}, {1.0, 0.0}), std::invalid_argument);
}

TEST(PolygonTest, Convexity) {
    EXPECT_TRUE(is_convex(unit_square()));

    Polygon2 dart{{0.0, 0.0}, {2.0, 1.0}, {0.0, 2.0}, {0.5, 1.0}};
    EXPECT_FALSE(is_convex(dart));

    // Collinear vertex does not break convexity
    Polygon2 with_midpoint{{0.0, 0.0}, {1.0, 0.0}, {2.0, 0.0}, {2.0, 2.0}, {0.0, 2.0}};
    EXPECT_TRUE(is_convex(with_midpoint));

    EXPECT_THROW(is_convex({{0.0, 0.0}, {1.0, 0.0}}), std::invalid_argument);
}

TEST(PolygonTest, SignedArea) {
    EXPECT_NEAR(signed_area(unit_square()), 1.0, 1e-12);
    Polygon2 square = unit_square();
    Polygon2 reversed(square.rbegin(), square.rend());
    EXPECT_NEAR(signed_area(reversed), -1.0, 1e-12);
}
