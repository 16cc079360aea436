#pragma once
#include "CalibrationRecord.hpp"
#include "Observation.hpp"
#include "StandardCatalogue.hpp"
#include <string>
#include <vector>

namespace fluxcal {

/*
 * Reduced multi-fibre frame layout:
 *   primary HDU   flux, NAXIS1 = pixel, NAXIS2 = fibre, CRVAL1/CDELT1/CRPIX1
 *   VARIANCE      same shape as the primary image
 *   FIBRES_IFU    table with PROBENUM, PROBENAME, FIB_MRA, FIB_MDEC per fibre
 */
IfuObservation load_ifu(const std::string& path, int probenum);

// Non-sky probes sorted by probe number, with their mean fibre position.
std::vector<ProbePosition> probe_positions(const std::string& path);

// Delete any FLUX_CALIBRATION HDU in `path` and append a new one.
void save_extracted_flux(const std::string& path, const FluxCalibrationRecord& record);

FluxCalibrationRecord load_calibration_record(const std::string& path);

// Append or overwrite row 2 of the stored FLUX_CALIBRATION HDU.
void save_transfer_function(const std::string& path, const Vector& transfer_function);

} // namespace fluxcal
