#include "fluxcal/FitsIO.hpp"
#include "SyntheticFrame.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace fluxcal;
using namespace fluxcal::test;

namespace {

class FitsIOTest : public ::testing::Test {
protected:
    FitsIOTest() : dir_("fits")
    {
        SyntheticProbe star;
        star.probenum = 3;
        star.name     = "STD";
        star.ra       = 150.0;
        star.dec      = -30.0;
        star.fibres   = hex_bundle(1);
        star.flux.resize(star.fibres.x.size(), kPixels);
        for (Eigen::Index i = 0; i < star.flux.rows(); ++i)
            for (long k = 0; k < kPixels; ++k)
                star.flux(i, k) = 100.0 * i + k;

        SyntheticProbe sky;
        sky.probenum = 13;
        sky.name     = "SKY13";
        sky.ra       = 150.1;
        sky.dec      = -30.1;
        sky.fibres.x = Vector::Zero(1);
        sky.fibres.y = Vector::Zero(1);
        sky.flux     = Matrix::Zero(1, kPixels);

        SyntheticProbe galaxy = star;
        galaxy.probenum = 1;
        galaxy.name     = "G12345";
        galaxy.ra       = 151.0;
        galaxy.dec      = -29.5;

        write_synthetic_frame(path(), {galaxy, sky, star}, 4000.0, 2.0, kPixels);
    }

    std::string path() const { return dir_.file("frame.fits"); }

    static constexpr long kPixels = 50;
    ScratchDir dir_;
};

} // unnamed namespace

TEST_F(FitsIOTest, LoadsOneProbe)
{
    const IfuObservation ifu = load_ifu(path(), 3);
    ASSERT_EQ(ifu.data.rows(), 7);
    ASSERT_EQ(ifu.data.cols(), kPixels);
    EXPECT_EQ(ifu.probenum, 3);
    EXPECT_EQ(ifu.data(2, 5), 205.0);
    EXPECT_EQ(ifu.variance(6, 49), 1.0);
    EXPECT_DOUBLE_EQ(ifu.wavelength[0], 4000.0);
    EXPECT_DOUBLE_EQ(ifu.wavelength[10], 4020.0);

    const FibreBundle b = hex_bundle(1);
    for (Eigen::Index i = 0; i < b.x.size(); ++i) {
        EXPECT_NEAR(ifu.xfibre[i], b.x[i], 1e-6);
        EXPECT_NEAR(ifu.yfibre[i], b.y[i], 1e-6);
    }
}

TEST_F(FitsIOTest, UnknownProbeIsAnError)
{
    EXPECT_THROW(load_ifu(path(), 42), std::runtime_error);
    EXPECT_THROW(load_ifu(dir_.file("missing.fits"), 3), std::runtime_error);
}

TEST_F(FitsIOTest, ProbePositionsSkipSky)
{
    const auto probes = probe_positions(path());
    ASSERT_EQ(probes.size(), 2u);
    EXPECT_EQ(probes[0].probenum, 1);
    EXPECT_EQ(probes[1].probenum, 3);
    EXPECT_NEAR(probes[1].ra, 150.0, 1e-9);
    EXPECT_NEAR(probes[1].dec, -30.0, 1e-9);
}

TEST_F(FitsIOTest, CalibrationHduAppendAndOverwrite)
{
    StarMatch m;
    m.path = "/standards/fltt7987.dat";
    m.name = "LTT7987";
    m.separation = 1.25;
    m.probenum = 3;

    EXPECT_THROW(save_transfer_function(path(), Vector::Ones(kPixels)), std::runtime_error);

    save_extracted_flux(path(), make_record(Vector::Constant(kPixels, 5.0),
                                            Vector::Constant(kPixels, 0.5), m));
    FluxCalibrationRecord r = load_calibration_record(path());
    EXPECT_EQ(r.rows.rows(), 2);
    EXPECT_EQ(r.rows(0, 3), 5.0);
    EXPECT_EQ(r.probenum, 3);
    EXPECT_EQ(r.star_name, "LTT7987");
    EXPECT_EQ(r.star_file, "/standards/fltt7987.dat");
    EXPECT_DOUBLE_EQ(r.separation, 1.25);

    save_transfer_function(path(), Vector::Constant(kPixels, 2.0));
    r = load_calibration_record(path());
    ASSERT_EQ(r.rows.rows(), 3);
    EXPECT_EQ(r.rows(2, 0), 2.0);

    save_transfer_function(path(), Vector::Constant(kPixels, 3.0));
    r = load_calibration_record(path());
    ASSERT_EQ(r.rows.rows(), 3);
    EXPECT_EQ(r.rows(2, 49), 3.0);
    EXPECT_EQ(r.rows(1, 0), 0.5);

    // a fresh extraction replaces the product and its transfer function
    save_extracted_flux(path(), make_record(Vector::Constant(kPixels, 6.0),
                                            Vector::Zero(kPixels), m));
    r = load_calibration_record(path());
    EXPECT_EQ(r.rows.rows(), 2);
    EXPECT_EQ(r.rows(0, 0), 6.0);

    // the science data are untouched
    EXPECT_EQ(load_ifu(path(), 3).data(2, 5), 205.0);
}
