#pragma once
#include "JsonUtils.hpp"
#include "PsfParameters.hpp"
#include "SimpleLM.hpp"
#include "StandardCatalogue.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fluxcal {

struct FileResult {
    std::string path;
    int         n_pixel         = 0;
    int         n_finite_flux   = 0;    // slices with an extracted flux
    double      median_transfer = 0.0;  // over finite transfer function values
};

struct CalibrationSummary {
    StarMatch               star;
    ModelVariant            model = ModelVariant::Circular;
    PsfParameters           psf;
    LMSolverSummary         fit;
    std::vector<FileResult> files;
};

/*
 * Match the standard in the first frame, fit one PSF to the chunked data of
 * all frames, then extract flux and derive a transfer function per frame.
 * Both products are written to each frame's FLUX_CALIBRATION HDU.
 */
CalibrationSummary derive_transfer_function(const std::vector<std::string>& paths,
                                            const Settings&                 settings);

nlohmann::json to_json(const CalibrationSummary& summary);

} // namespace fluxcal
