#include "fluxcal/CalibrationRecord.hpp"
#include <stdexcept>

namespace fluxcal {

FluxCalibrationRecord make_record(const Vector& flux, const Vector& background,
                                  const StarMatch& star)
{
    if (flux.size() != background.size())
        throw std::invalid_argument("make_record: flux and background differ in length");

    FluxCalibrationRecord r;
    r.rows.resize(2, flux.size());
    r.rows.row(0) = flux.transpose();
    r.rows.row(1) = background.transpose();
    r.probenum    = star.probenum;
    r.star_name   = star.name;
    r.star_file   = star.path;
    r.separation  = star.separation;
    return r;
}

void store_extracted(FluxCalibrationRecord& target, const FluxCalibrationRecord& fresh)
{
    if (fresh.rows.rows() != 2)
        throw std::invalid_argument("store_extracted: expected flux and background rows only");
    target = fresh;
}

void store_transfer_function(FluxCalibrationRecord& record, const Vector& transfer_function)
{
    const Eigen::Index n_rows = record.rows.rows();
    if (n_rows != 2 && n_rows != 3)
        throw std::runtime_error("store_transfer_function: no extracted flux stored yet");
    if (transfer_function.size() != record.n_pixel())
        throw std::invalid_argument("store_transfer_function: length "
                                    + std::to_string(transfer_function.size())
                                    + " does not match " + std::to_string(record.n_pixel())
                                    + " pixels");

    if (n_rows == 2)
        record.rows.conservativeResize(3, Eigen::NoChange);
    record.rows.row(2) = transfer_function.transpose();
}

} // namespace fluxcal
