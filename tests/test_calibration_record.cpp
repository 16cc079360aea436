#include "fluxcal/CalibrationRecord.hpp"
#include <gtest/gtest.h>

using namespace fluxcal;

namespace {

StarMatch star()
{
    StarMatch m;
    m.path = "/data/standards/ESO/fltt7987.dat";
    m.name = "LTT7987";
    m.separation = 2.5;
    m.probenum = 4;
    return m;
}

} // unnamed namespace

TEST(CalibrationRecord, ExtractedRowsAndHeader)
{
    Vector flux(3), bg(3);
    flux << 1.0, 2.0, 3.0;
    bg << 0.1, 0.2, 0.3;
    const FluxCalibrationRecord r = make_record(flux, bg, star());
    ASSERT_EQ(r.rows.rows(), 2);
    EXPECT_EQ(r.n_pixel(), 3);
    EXPECT_EQ(r.rows(0, 2), 3.0);
    EXPECT_EQ(r.rows(1, 0), 0.1);
    EXPECT_EQ(r.probenum, 4);
    EXPECT_EQ(r.star_name, "LTT7987");
    EXPECT_EQ(r.star_file, "/data/standards/ESO/fltt7987.dat");
    EXPECT_EQ(r.separation, 2.5);
    EXPECT_FALSE(r.has_transfer_function());

    EXPECT_THROW(make_record(flux, Vector::Zero(2), star()), std::invalid_argument);
}

TEST(CalibrationRecord, TransferFunctionIsAppendedThenOverwritten)
{
    FluxCalibrationRecord r = make_record(Vector::Ones(4), Vector::Zero(4), star());

    store_transfer_function(r, Vector::Constant(4, 7.0));
    ASSERT_EQ(r.rows.rows(), 3);
    EXPECT_TRUE(r.has_transfer_function());
    EXPECT_EQ(r.rows(0, 0), 1.0);
    EXPECT_EQ(r.rows(2, 3), 7.0);

    store_transfer_function(r, Vector::Constant(4, 9.0));
    ASSERT_EQ(r.rows.rows(), 3);
    EXPECT_EQ(r.rows(2, 0), 9.0);
    EXPECT_EQ(r.rows(1, 0), 0.0);
}

TEST(CalibrationRecord, NewExtractionDropsTheOldTransferFunction)
{
    FluxCalibrationRecord r = make_record(Vector::Ones(4), Vector::Zero(4), star());
    store_transfer_function(r, Vector::Constant(4, 7.0));

    StarMatch other = star();
    other.name = "EG274";
    store_extracted(r, make_record(Vector::Constant(5, 2.0), Vector::Zero(5), other));
    EXPECT_EQ(r.rows.rows(), 2);
    EXPECT_EQ(r.n_pixel(), 5);
    EXPECT_EQ(r.star_name, "EG274");
}

TEST(CalibrationRecord, TransferFunctionNeedsMatchingExtraction)
{
    FluxCalibrationRecord empty;
    EXPECT_THROW(store_transfer_function(empty, Vector::Ones(3)), std::runtime_error);

    FluxCalibrationRecord r = make_record(Vector::Ones(4), Vector::Zero(4), star());
    EXPECT_THROW(store_transfer_function(r, Vector::Ones(3)), std::invalid_argument);
}
