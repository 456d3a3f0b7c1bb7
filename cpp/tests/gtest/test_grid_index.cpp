// =============================================================================
// Grid Index Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geoscan/error.hpp"
#include "geoscan/spatial_index.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>

using namespace geoscan;

class GridIndexTest : public ::testing::Test {
protected:
    GridIndex index;

    // Small square around (lat, lng) with the given half-width in degrees
    static std::vector<LatLng> square(double lat, double lng, double half) {
        return {
            {lat - half, lng - half},
            {lat - half, lng + half},
            {lat + half, lng + half},
            {lat + half, lng - half},
        };
    }
};

TEST_F(GridIndexTest, CellIdsAreFixedWidthUpperHex) {
    for (int res = 0; res <= GridIndex::MAX_RESOLUTION; res += 4) {
        std::string id = index.cell_id(48.8566, 2.3522, res);
        EXPECT_EQ(id.size(), 16u);
        EXPECT_TRUE(std::all_of(id.begin(), id.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'A' && c <= 'F');
        })) << id;
    }
}

TEST_F(GridIndexTest, SameCellForNearbyPoints) {
    // 1e-6 degrees apart, far from any cell edge at resolution 10
    GridIndex::Cell cell = index.locate(10.0, 10.0, 10);
    LatLng center = GridIndex::cell_center(cell);
    EXPECT_EQ(index.cell_id(center.lat, center.lng, 10),
              index.cell_id(center.lat + 1e-6, center.lng - 1e-6, 10));
}

TEST_F(GridIndexTest, ParseIsCaseInsensitiveAndRoundTrips) {
    std::string id = index.cell_id(-33.8688, 151.2093, 16);
    std::string lower = id;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    GridIndex::Cell a = GridIndex::parse_cell(id);
    GridIndex::Cell b = GridIndex::parse_cell(lower);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.resolution, 16);
    EXPECT_EQ(GridIndex::format_cell(a), id);

    LatLng center = GridIndex::cell_center(a);
    EXPECT_EQ(index.cell_id(center.lat, center.lng, 16), id);
}

TEST_F(GridIndexTest, ParseRejectsMalformedIds) {
    EXPECT_THROW(GridIndex::parse_cell(""), InvalidArgumentError);
    EXPECT_THROW(GridIndex::parse_cell("XYZ"), InvalidArgumentError);
    EXPECT_THROW(GridIndex::parse_cell("00000000000000000"), InvalidArgumentError);
    // Resolution 25 does not exist
    EXPECT_THROW(GridIndex::parse_cell("1900000000000000"), InvalidArgumentError);
    // Resolution 0 has a 2 bit curve
    EXPECT_THROW(GridIndex::parse_cell("0000000000000004"), InvalidArgumentError);
}

// Resolution 0 is one row of two columns: half of the 2x2 curve is off-grid
TEST_F(GridIndexTest, CoarsestResolutionHasTwoCells) {
    int valid = 0;
    for (const char* id : {"0000000000000000", "0000000000000001",
                           "0000000000000002", "0000000000000003"}) {
        try {
            GridIndex::parse_cell(id);
            ++valid;
        } catch (const InvalidArgumentError&) {
        }
    }
    EXPECT_EQ(valid, 2);
    EXPECT_NE(index.cell_id(0.0, -90.0, 0), index.cell_id(0.0, 90.0, 0));
}

TEST_F(GridIndexTest, BoundaryCoordinatesStayOnGrid) {
    EXPECT_NO_THROW(index.cell_id(90.0, 180.0, 12));
    EXPECT_NO_THROW(index.cell_id(-90.0, -180.0, 12));
    GridIndex::Cell north = index.locate(90.0, 0.0, 12);
    EXPECT_EQ(north.row, GridIndex::rows(12) - 1);
}

TEST_F(GridIndexTest, RejectsInvalidInput) {
    EXPECT_THROW(index.cell_id(91.0, 0.0, 5), InvalidArgumentError);
    EXPECT_THROW(index.cell_id(0.0, 181.0, 5), InvalidArgumentError);
    EXPECT_THROW(index.cell_id(std::nan(""), 0.0, 5), InvalidArgumentError);
    EXPECT_THROW(index.cell_id(0.0, 0.0, -1), InvalidArgumentError);
    EXPECT_THROW(index.cell_id(0.0, 0.0, GridIndex::MAX_RESOLUTION + 1), InvalidArgumentError);
}

TEST_F(GridIndexTest, DiagonalHalvesWithEachResolution) {
    for (int res = 1; res <= GridIndex::MAX_RESOLUTION; ++res) {
        EXPECT_NEAR(index.cell_diagonal_m(res) * 2.0, index.cell_diagonal_m(res - 1), 1e-6);
    }
    EXPECT_NEAR(index.cell_diagonal_m(24), 1.687, 0.01);
}

TEST_F(GridIndexTest, DiskWrapsLongitudeAndClampsLatitude) {
    const int res = 6;
    GridIndex::Cell interior = index.locate(0.0, 0.0, res);
    EXPECT_EQ(index.disk(interior, 1).size(), 9u);
    EXPECT_EQ(index.disk(interior, 2).size(), 25u);

    GridIndex::Cell pole = index.locate(90.0, 0.0, res);
    EXPECT_EQ(index.disk(pole, 1).size(), 6u);

    GridIndex::Cell east = index.locate(0.0, 179.99, res);
    auto ring = index.disk(east, 1);
    EXPECT_TRUE(std::any_of(ring.begin(), ring.end(),
                            [](const GridIndex::Cell& c) { return c.col == 0; }));
}

TEST_F(GridIndexTest, PolyFillCoversInteriorAndVertices) {
    const int res = 12;
    auto polygon = square(45.0, 7.0, 0.2);
    auto cells = index.poly_fill(polygon, res, 0);

    ASSERT_FALSE(cells.empty());
    EXPECT_TRUE(std::is_sorted(cells.begin(), cells.end()));
    EXPECT_EQ(std::adjacent_find(cells.begin(), cells.end()), cells.end());

    std::set<std::string> cell_set(cells.begin(), cells.end());
    EXPECT_TRUE(cell_set.count(index.cell_id(45.0, 7.0, res)));
    for (const auto& p : polygon) {
        EXPECT_TRUE(cell_set.count(index.cell_id(p.lat, p.lng, res)));
    }
    EXPECT_FALSE(cell_set.count(index.cell_id(46.0, 7.0, res)));
}

// A polygon smaller than a cell still yields the cell it sits in
TEST_F(GridIndexTest, PolyFillTinyPolygon) {
    const int res = 4;
    auto cells = index.poly_fill(square(10.0, 10.0, 0.001), res, 0);
    ASSERT_EQ(cells.size(), 1u);
    EXPECT_EQ(cells[0], index.cell_id(10.0, 10.0, res));
}

// An edge lying on a grid line claims only the cells on its own side
TEST_F(GridIndexTest, PolyFillEdgeOnGridLine) {
    const int res = 16;
    std::vector<LatLng> below_equator = {{-0.05, 0.0}, {-0.05, 0.05}, {0.0, 0.05}, {0.0, 0.0}};
    auto cells = index.poly_fill(below_equator, res, 0);

    std::set<std::string> cell_set(cells.begin(), cells.end());
    EXPECT_TRUE(cell_set.count(index.cell_id(-0.001, 0.025, res)));
    EXPECT_FALSE(cell_set.count(index.cell_id(0.001, 0.025, res)));
    for (const auto& id : cells) {
        EXPECT_LT(index.cell_center(index.parse_cell(id)).lat, 0.0) << id;
    }
}

TEST_F(GridIndexTest, LayersProduceSuperset) {
    const int res = 14;
    auto polygon = square(-23.5, -46.6, 0.01);
    auto base = index.poly_fill(polygon, res, 0);
    auto dilated = index.poly_fill(polygon, res, 1);
    auto wider = index.poly_fill(polygon, res, 2);

    EXPECT_GT(dilated.size(), base.size());
    EXPECT_GT(wider.size(), dilated.size());
    EXPECT_TRUE(std::includes(dilated.begin(), dilated.end(), base.begin(), base.end()));
    EXPECT_TRUE(std::includes(wider.begin(), wider.end(), dilated.begin(), dilated.end()));
}

TEST_F(GridIndexTest, PolyFillRejectsHugePolygons) {
    GridIndex small(100);
    EXPECT_THROW(small.poly_fill(square(0.0, 0.0, 10.0), 12, 0), InvalidArgumentError);
    EXPECT_THROW(index.poly_fill(square(0.0, 0.0, 0.1), 12, -1), InvalidArgumentError);
    EXPECT_THROW(index.poly_fill({}, 12, 0), InvalidArgumentError);
}

TEST_F(GridIndexTest, PolyFillRejectsHugeLayerCounts) {
    auto polygon = square(0.0, 0.0, 0.001);
    EXPECT_THROW(index.poly_fill(polygon, 12, 1 << 30), InvalidArgumentError);
    EXPECT_THROW(index.poly_fill(polygon, 12, std::numeric_limits<int>::max()), InvalidArgumentError);
}
