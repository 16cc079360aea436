#include "fluxcal/Workflow.hpp"
#include "fluxcal/CalibrationRecord.hpp"
#include "fluxcal/FitsIO.hpp"
#include "fluxcal/FluxExtractor.hpp"
#include "fluxcal/Moffat.hpp"
#include "fluxcal/Observation.hpp"
#include "fluxcal/PsfFitter.hpp"
#include "fluxcal/Subgrid.hpp"
#include "fluxcal/TransferFunction.hpp"
#include <boost/math/statistics/univariate_statistics.hpp>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace fluxcal {

namespace {

double finite_median(const Vector& v)
{
    std::vector<double> good;
    for (Eigen::Index i = 0; i < v.size(); ++i)
        if (std::isfinite(v[i])) good.push_back(v[i]);
    if (good.empty()) return std::numeric_limits<double>::quiet_NaN();
    return boost::math::statistics::median(good);
}

} // unnamed namespace

CalibrationSummary derive_transfer_function(const std::vector<std::string>& paths,
                                            const Settings&                 settings)
{
    if (paths.empty())
        throw std::invalid_argument("derive_transfer_function: no input files");

    CalibrationSummary summary;
    summary.model = settings.model;

    /* ---------- which star, in which bundle --------------------------- */
    summary.star = match_standard_star(probe_positions(paths.front()),
                                       settings.max_separation_arcsec,
                                       settings.catalogues);
    const StandardSpectrum standard = read_standard_spectrum(summary.star.path);

    /* ---------- one PSF fit for the whole group ----------------------- */
    std::vector<IfuObservation> ifus;
    for (const auto& p : paths)
        ifus.push_back(load_ifu(p, summary.star.probenum));

    const ChunkedData chunked = read_chunked_data(ifus, settings.n_drop, settings.n_chunk);
    std::cout << "[Calib] fitting " << to_string(settings.model) << " PSF to "
              << chunked.data.rows() << " fibres x " << chunked.wavelength.size()
              << " chunks\n";

    const MoffatModel model(default_subgrid());
    PsfFitOptions opt;
    opt.max_iterations = settings.max_iterations;
    opt.verbose        = settings.verbose;
    summary.psf = fit_model_flux(chunked.data, chunked.variance,
                                 chunked.xfibre, chunked.yfibre,
                                 chunked.wavelength, settings.model,
                                 model, opt, &summary.fit);

    /* ---------- per file: extract, ratio, store ----------------------- */
    for (const auto& ifu : ifus) {
        const ExtractedFlux ex = extract_total_flux(ifu.data, ifu.variance,
                                                    ifu.xfibre, ifu.yfibre,
                                                    ifu.wavelength, summary.psf, model);
        save_extracted_flux(ifu.path, make_record(ex.flux, ex.background, summary.star));

        const Vector tf = take_ratio(standard.flux, standard.wavelength,
                                     ex.flux, ifu.wavelength,
                                     settings.smooth, settings.smooth_width);
        save_transfer_function(ifu.path, tf);

        FileResult r;
        r.path            = ifu.path;
        r.n_pixel         = static_cast<int>(ifu.wavelength.size());
        r.n_finite_flux   = static_cast<int>(ex.flux.array().isFinite().count());
        r.median_transfer = finite_median(tf);
        summary.files.push_back(r);

        std::cout << "[Calib] " << ifu.path << ": " << r.n_finite_flux << '/'
                  << r.n_pixel << " slices extracted, median transfer "
                  << r.median_transfer << '\n';
    }
    return summary;
}

nlohmann::json to_json(const CalibrationSummary& summary)
{
    nlohmann::json j;
    j["star"] = {
        {"name",       summary.star.name},
        {"path",       summary.star.path},
        {"probenum",   summary.star.probenum},
        {"separation", summary.star.separation}
    };

    const Vector v     = to_vector(summary.psf);
    const auto   n_sc  = scalar_parameter_count(summary.model);
    const double* tail = v.data() + (v.size() - n_sc);
    j["psf"] = {
        {"model",      to_string(summary.model)},
        {"parameters", std::vector<double>(tail, tail + n_sc)}
    };
    j["fit"] = {
        {"iterations",   summary.fit.iterations},
        {"initialChi2",  summary.fit.initial_chi2},
        {"finalChi2",    summary.fit.final_chi2},
        {"converged",    summary.fit.converged}
    };

    nlohmann::json files = nlohmann::json::array();
    for (const auto& f : summary.files) {
        files.push_back({
            {"path",           f.path},
            {"nPixel",         f.n_pixel},
            {"nFiniteFlux",    f.n_finite_flux},
            {"medianTransfer", f.median_transfer}
        });
    }
    j["files"] = files;
    return j;
}

} // namespace fluxcal
