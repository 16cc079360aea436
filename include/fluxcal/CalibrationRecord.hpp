#pragma once
#include "StandardCatalogue.hpp"
#include "Types.hpp"
#include <string>

namespace fluxcal {

inline constexpr const char* kFluxCalibrationHdu = "FLUX_CALIBRATION";

/*
 * Contents of the per-file FLUX_CALIBRATION product.
 *   row 0  extracted flux
 *   row 1  extracted background
 *   row 2  transfer function (optional)
 */
struct FluxCalibrationRecord {
    Matrix      rows;              // 2 or 3 × n_pixel
    int         probenum   = -1;   // PROBENUM
    std::string star_name;         // STDNAME
    std::string star_file;         // STDFILE
    double      separation = 0.0;  // STDOFF, arcsec

    bool        has_transfer_function() const { return rows.rows() == 3; }
    Eigen::Index n_pixel() const { return rows.cols(); }
};

FluxCalibrationRecord make_record(const Vector& flux, const Vector& background,
                                  const StarMatch& star);

// Replace whatever was stored before, including a prior transfer function.
void store_extracted(FluxCalibrationRecord& target, const FluxCalibrationRecord& fresh);

// Append row 2 to a two-row record, overwrite it in a three-row record.
void store_transfer_function(FluxCalibrationRecord& record, const Vector& transfer_function);

} // namespace fluxcal
