// =============================================================================
// Precision Selection Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geoscan/error.hpp"
#include "geoscan/precision.hpp"

#include <cmath>
#include <limits>

using namespace geoscan;

class PrecisionTest : public ::testing::Test {
protected:
    GridIndex index;
};

TEST_F(PrecisionTest, DefaultEpsilonFitsInsideCell) {
    int res = select_precision(50.0, index);
    EXPECT_LE(index.cell_diagonal_m(res), 50.0);
    // Coarsest such resolution: one step coarser is already too wide
    EXPECT_GT(index.cell_diagonal_m(res - 1), 50.0);
}

TEST_F(PrecisionTest, MonotoneInEpsilon) {
    int previous = select_precision(2.0, index);
    for (double eps : {5.0, 50.0, 500.0, 5000.0, 50000.0, 5e6}) {
        int res = select_precision(eps, index);
        EXPECT_LE(res, previous) << "epsilon " << eps;
        previous = res;
    }
}

TEST_F(PrecisionTest, ExtremeValues) {
    EXPECT_EQ(select_precision(2.0, index), GridIndex::MAX_RESOLUTION);
    EXPECT_EQ(select_precision(1e9, index), GridIndex::MIN_RESOLUTION);
}

TEST_F(PrecisionTest, ExactDiagonalIsAccepted) {
    const double d = index.cell_diagonal_m(10);
    EXPECT_EQ(select_precision(d, index), 10);
}

TEST_F(PrecisionTest, RejectsUnusableEpsilon) {
    EXPECT_THROW(select_precision(0.0, index), NoPrecisionError);
    EXPECT_THROW(select_precision(-1.0, index), NoPrecisionError);
    EXPECT_THROW(select_precision(std::nan(""), index), NoPrecisionError);
    EXPECT_THROW(select_precision(std::numeric_limits<double>::infinity(), index), NoPrecisionError);
    // Finer than the finest cell
    EXPECT_THROW(select_precision(1.0, index), NoPrecisionError);
}

TEST_F(PrecisionTest, NoPrecisionIsAConfigurationError) {
    try {
        select_precision(1.0, index);
        FAIL() << "Expected NoPrecisionError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_PRECISION);
        EXPECT_FALSE(e.suggestion().empty());
    }
}
