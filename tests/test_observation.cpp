#include "fluxcal/Observation.hpp"
#include "SyntheticIfu.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace fluxcal;
using namespace fluxcal::test;

namespace {

IfuObservation ramp_ifu(int n_fibre, int n_pixel, double wl0)
{
    IfuObservation ifu;
    ifu.path = "ramp.fits";
    ifu.data.resize(n_fibre, n_pixel);
    for (int f = 0; f < n_fibre; ++f)
        for (int k = 0; k < n_pixel; ++k)
            ifu.data(f, k) = k + 1000.0 * f;
    ifu.variance = Matrix::Ones(n_fibre, n_pixel);
    ifu.wavelength = linear_grid(wl0, 1.0, n_pixel);
    ifu.xfibre = Vector::LinSpaced(n_fibre, -1.0, 1.0);
    ifu.yfibre = Vector::Zero(n_fibre);
    return ifu;
}

} // unnamed namespace

TEST(Chunking, DefaultChunksOfAHundredPixels)
{
    const IfuObservation ifu = ramp_ifu(3, 248, 4000.0);
    const ChunkedData c = chunk_data(ifu);
    ASSERT_EQ(c.wavelength.size(), 2);
    ASSERT_EQ(c.data.rows(), 3);
    // pixels 24..123 and 124..223
    EXPECT_DOUBLE_EQ(c.data(0, 0), 73.5);
    EXPECT_DOUBLE_EQ(c.data(0, 1), 173.5);
    EXPECT_DOUBLE_EQ(c.data(2, 1), 2173.5);
    EXPECT_DOUBLE_EQ(c.wavelength[0], 4073.5);
    EXPECT_DOUBLE_EQ(c.variance(1, 0), 0.01);
    EXPECT_EQ(c.xfibre, ifu.xfibre);
}

TEST(Chunking, ExplicitChunkCountAndDrop)
{
    const IfuObservation ifu = ramp_ifu(2, 100, 5000.0);
    const ChunkedData c = chunk_data(ifu, 10, 4);          // 80 usable, 20 per chunk
    ASSERT_EQ(c.wavelength.size(), 4);
    EXPECT_DOUBLE_EQ(c.data(0, 0), 19.5);
    EXPECT_DOUBLE_EQ(c.data(0, 3), 79.5);
    EXPECT_DOUBLE_EQ(c.wavelength[3], 5079.5);
    EXPECT_DOUBLE_EQ(c.variance(0, 0), 20.0 / 400.0);
}

TEST(Chunking, NonFiniteValuesAreIgnored)
{
    IfuObservation ifu = ramp_ifu(1, 100, 5000.0);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ifu.data(0, 10) = nan;                                   // chunk 0 covers 10..29
    ifu.variance(0, 11) = nan;
    for (int k = 30; k < 50; ++k) ifu.data(0, k) = nan;      // chunk 1 entirely bad

    const ChunkedData c = chunk_data(ifu, 10, 4);
    double expected = 0.0;
    for (int k = 11; k < 30; ++k) expected += k;
    EXPECT_DOUBLE_EQ(c.data(0, 0), expected / 19.0);
    EXPECT_DOUBLE_EQ(c.variance(0, 0), 19.0 / (19.0 * 19.0));
    EXPECT_TRUE(std::isnan(c.data(0, 1)));
}

TEST(Chunking, FilesAreConcatenatedAlongWavelength)
{
    std::vector<IfuObservation> ifus = {ramp_ifu(2, 248, 4000.0), ramp_ifu(2, 248, 6000.0)};
    ifus[1].xfibre *= 2.0;
    const ChunkedData c = read_chunked_data(ifus);
    ASSERT_EQ(c.wavelength.size(), 4);
    EXPECT_DOUBLE_EQ(c.wavelength[1], 4173.5);
    EXPECT_DOUBLE_EQ(c.wavelength[2], 6073.5);
    EXPECT_DOUBLE_EQ(c.data(1, 3), 1173.5);
    EXPECT_EQ(c.xfibre, ifus[1].xfibre);                     // positions of the last file
}

TEST(Chunking, RejectsInconsistentInput)
{
    IfuObservation ifu = ramp_ifu(2, 100, 5000.0);
    ifu.wavelength.resize(99);
    EXPECT_THROW(chunk_data(ifu), std::invalid_argument);

    EXPECT_THROW(chunk_data(ramp_ifu(2, 40, 5000.0)), std::invalid_argument);
    EXPECT_THROW(read_chunked_data({}), std::invalid_argument);

    std::vector<IfuObservation> mixed = {ramp_ifu(2, 248, 4000.0), ramp_ifu(3, 248, 6000.0)};
    EXPECT_THROW(read_chunked_data(mixed), std::invalid_argument);
}
