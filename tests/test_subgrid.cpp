#include "fluxcal/Subgrid.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace fluxcal;

TEST(Subgrid, DefaultLayoutHasThreeHundredPoints)
{
    ApertureSubgrid grid;
    EXPECT_EQ(grid.size(), 300u);
    EXPECT_DOUBLE_EQ(grid.fibre_radius(), kFibreRadius);
}

TEST(Subgrid, PointsLieInsideTheFibre)
{
    ApertureSubgrid grid;
    for (Eigen::Index k = 0; k < grid.x().size(); ++k) {
        const double r = std::hypot(grid.x()[k], grid.y()[k]);
        EXPECT_LT(r, kFibreRadius);
        EXPECT_GT(r, 0.0);
    }
}

TEST(Subgrid, CentroidIsTheFibreCentre)
{
    ApertureSubgrid grid;
    EXPECT_NEAR(grid.x().mean(), 0.0, 1e-12);
    EXPECT_NEAR(grid.y().mean(), 0.0, 1e-12);
}

TEST(Subgrid, InnerRingIsRotatedForTheNextRing)
{
    ApertureSubgrid grid(1.0, 2, 6);
    // ring 0: 3 points at r = 0.25, ring 1: 9 points at r = 0.75
    ASSERT_EQ(grid.size(), 12u);
    EXPECT_NEAR(grid.x()[0], 0.25, 1e-15);
    EXPECT_NEAR(grid.y()[0], 0.0, 1e-15);

    const double rot = 0.5 * (2.0 * std::acos(-1.0) / 3.0);
    EXPECT_NEAR(grid.x()[3], 0.75 * std::cos(rot), 1e-15);
    EXPECT_NEAR(grid.y()[3], 0.75 * std::sin(rot), 1e-15);
}

TEST(Subgrid, RotationAccumulatesHalfSpacings)
{
    ApertureSubgrid grid(1.0, 3, 6);
    // rings of 3, 9 and 15 points; ring 2 starts at pi/3 + pi/9
    ASSERT_EQ(grid.size(), 27u);
    const double pi  = std::acos(-1.0);
    const double rot = pi / 3.0 + pi / 9.0;
    const double r   = 2.5 / 3.0;
    EXPECT_NEAR(grid.x()[12], r * std::cos(rot), 1e-14);
    EXPECT_NEAR(grid.y()[12], r * std::sin(rot), 1e-14);
}

TEST(Subgrid, IsDeterministic)
{
    ApertureSubgrid a, b;
    EXPECT_EQ(a.x(), b.x());
    EXPECT_EQ(a.y(), b.y());
    EXPECT_EQ(&default_subgrid(), &default_subgrid());
    EXPECT_EQ(default_subgrid().x(), a.x());
}

TEST(Subgrid, RejectsBadLayout)
{
    EXPECT_THROW(ApertureSubgrid(0.0), std::invalid_argument);
    EXPECT_THROW(ApertureSubgrid(0.8, 0, 6), std::invalid_argument);
}
