// =============================================================================
// Polygon / Cell Intersection Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geoscan/geometry.hpp"

using namespace geoscan;

namespace {

const BoundingBox UNIT{0.0, 1.0, 0.0, 1.0};

} // anonymous namespace

TEST(GeometryTest, SegmentThroughInteriorIntersects) {
    EXPECT_TRUE(segment_intersects_box(LatLng(-1.0, 0.5), LatLng(2.0, 0.5), UNIT));
    EXPECT_TRUE(segment_intersects_box(LatLng(-1.0, -1.0), LatLng(2.0, 2.0), UNIT));
    EXPECT_FALSE(segment_intersects_box(LatLng(-1.0, 2.0), LatLng(2.0, 2.0), UNIT));
}

TEST(GeometryTest, SegmentOnBorderDoesNotIntersect) {
    // Runs along the bottom edge
    EXPECT_FALSE(segment_intersects_box(LatLng(0.0, -1.0), LatLng(0.0, 2.0), UNIT));
    // Touches a corner only
    EXPECT_FALSE(segment_intersects_box(LatLng(-1.0, 0.0), LatLng(1.0, 2.0), UNIT));
}

TEST(GeometryTest, PolygonSharingAnEdgeDoesNotIntersect) {
    std::vector<LatLng> below = {{-1.0, 0.0}, {-1.0, 1.0}, {0.0, 1.0}, {0.0, 0.0}};
    EXPECT_FALSE(polygon_intersects_box(below, UNIT));

    std::vector<LatLng> overlapping = {{-1.0, 0.0}, {-1.0, 1.0}, {0.5, 1.0}, {0.5, 0.0}};
    EXPECT_TRUE(polygon_intersects_box(overlapping, UNIT));
}

TEST(GeometryTest, PolygonCoveringTheBox) {
    std::vector<LatLng> around = {{-5.0, -5.0}, {-5.0, 5.0}, {5.0, 5.0}, {5.0, -5.0}};
    EXPECT_TRUE(polygon_intersects_box(around, UNIT));

    std::vector<LatLng> elsewhere = {{3.0, 3.0}, {3.0, 4.0}, {4.0, 4.0}, {4.0, 3.0}};
    EXPECT_FALSE(polygon_intersects_box(elsewhere, UNIT));
}
