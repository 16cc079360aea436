#include "fluxcal/Interpolation.hpp"
#include "fluxcal/Rebin.hpp"
#include "fluxcal/TransferFunction.hpp"
#include "SyntheticIfu.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace fluxcal;
using namespace fluxcal::test;

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

TEST(Interpolation, LinearWithClampedEnds)
{
    Vector x(3), y(3), q(5);
    x << 1.0, 2.0, 4.0;
    y << 10.0, 20.0, 0.0;
    q << 0.0, 1.5, 3.0, 4.0, 9.0;
    const Vector out = interp_linear(x, y, q);
    EXPECT_DOUBLE_EQ(out[0], 10.0);
    EXPECT_DOUBLE_EQ(out[1], 15.0);
    EXPECT_DOUBLE_EQ(out[2], 10.0);
    EXPECT_DOUBLE_EQ(out[3], 0.0);
    EXPECT_DOUBLE_EQ(out[4], 0.0);
    EXPECT_THROW(interp_linear(Vector(), Vector(), q), std::invalid_argument);
}

TEST(Interpolation, GaussianFilterKeepsConstantsAndArea)
{
    const Vector flat = Vector::Constant(40, 2.5);
    const Vector f = gaussian_filter1d(flat, 3.0);
    for (Eigen::Index i = 0; i < f.size(); ++i)
        EXPECT_NEAR(f[i], 2.5, 1e-12);

    Vector spike = Vector::Zero(101);
    spike[50] = 1.0;
    const Vector g = gaussian_filter1d(spike, 4.0);
    EXPECT_NEAR(g.sum(), 1.0, 1e-12);
    EXPECT_NEAR(g[46], g[54], 1e-15);
    EXPECT_GT(g[50], g[51]);
    EXPECT_EQ(g[50 - 17], 0.0);           // beyond the 4 sigma kernel radius

    EXPECT_THROW(gaussian_filter1d(flat, 0.0), std::invalid_argument);
}

TEST(TransferFunction, UnsmoothedRatioOfScaledSpectrumIsTheScale)
{
    const Vector obs_wl = linear_grid(3700.0, 1.0, 2000);
    Vector obs(obs_wl.size());
    for (Eigen::Index i = 0; i < obs.size(); ++i)
        obs[i] = 500.0 + 0.1 * i;

    // standard on a coarser grid inside the observed range, k times the
    // observed flux rebinned onto it
    const Vector std_wl = linear_grid(3800.0, 20.0, 80);
    const Vector std_flux = 3.0e-3 * rebin_flux(std_wl, obs_wl, obs);

    const Vector tf = take_ratio(std_flux, std_wl, obs, obs_wl, false);
    ASSERT_EQ(tf.size(), obs_wl.size());
    for (Eigen::Index i = 0; i < tf.size(); ++i)
        EXPECT_NEAR(tf[i], 3.0e-3, 1e-15);
}

TEST(TransferFunction, SmoothedConstantRatioStaysConstant)
{
    const Vector obs_wl = linear_grid(3700.0, 1.0, 2000);
    const Vector obs = Vector::Constant(obs_wl.size(), 800.0);
    const Vector std_wl = linear_grid(3800.0, 20.0, 80);
    const Vector std_flux = Vector::Constant(std_wl.size(), 1.6);

    const Vector tf = take_ratio(std_flux, std_wl, obs, obs_wl, true, kDefaultSmoothWidth);
    for (Eigen::Index i = 0; i < tf.size(); ++i)
        EXPECT_NEAR(tf[i], 2.0e-3, 1e-12);
}

TEST(TransferFunction, SmoothingKeepsALinearTrendAwayFromTheEnds)
{
    Vector inverse(60);
    for (Eigen::Index i = 0; i < inverse.size(); ++i) inverse[i] = 1.0 + 0.01 * i;
    const Vector ratio = inverse.cwiseInverse();
    const Vector smoothed = smooth_ratio(ratio, 5.0);
    ASSERT_EQ(smoothed.size(), ratio.size());
    // kernel radius is 20 samples
    for (Eigen::Index i = 20; i < 40; ++i)
        EXPECT_NEAR(smoothed[i], ratio[i], 1e-12);
    EXPECT_TRUE(smoothed.allFinite());
}

TEST(TransferFunction, SmoothingFillsInteriorGapsAndKeepsEdgeGaps)
{
    Vector ratio = Vector::Constant(80, 4.0);
    ratio[0] = kNaN;
    ratio[1] = std::numeric_limits<double>::infinity();    // inverse 0 is finite
    ratio[40] = kNaN;
    ratio[79] = kNaN;

    const Vector s = smooth_ratio(ratio, 3.0);
    EXPECT_TRUE(std::isnan(s[0]));
    EXPECT_TRUE(std::isnan(s[79]));
    EXPECT_TRUE(std::isfinite(s[40]));
    EXPECT_NEAR(s[40], 4.0, 1e-12);
    EXPECT_NEAR(s[60], 4.0, 1e-12);
}

TEST(TransferFunction, SmoothingNeedsEnoughSamples)
{
    EXPECT_THROW(smooth_ratio(Vector::Constant(20, 1.0), 10.0), std::invalid_argument);
    EXPECT_THROW(smooth_ratio(Vector::Constant(50, kNaN), 10.0), std::invalid_argument);
    EXPECT_NO_THROW(smooth_ratio(Vector::Constant(32, 1.0), 10.0));
}
