#include "fluxcal/FluxExtractor.hpp"
#include "fluxcal/SimpleLM.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace fluxcal {

SliceFlux extract_slice(const Vector&          data,
                        const Vector&          variance,
                        const Vector&          xfibre,
                        const Vector&          yfibre,
                        const SliceParameters& shape,
                        const MoffatModel&     model)
{
    if (data.size() != xfibre.size() || data.size() != yfibre.size()
        || variance.size() != data.size())
        throw std::invalid_argument("extract_slice: fibre arrays differ in length");

    const double nan = std::numeric_limits<double>::quiet_NaN();

    std::vector<Eigen::Index> good;
    for (Eigen::Index f = 0; f < data.size(); ++f)
        if (std::isfinite(data[f])) good.push_back(f);

    if (static_cast<int>(good.size()) <= kMinFiniteFibres)
        return {nan, nan};

    const Eigen::Index n = static_cast<Eigen::Index>(good.size());
    Vector d(n), x(n), y(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        d[i] = data[good[i]];
        x[i] = xfibre[good[i]];
        y[i] = yfibre[good[i]];
    }
    const Vector profile = model.fibre_profile(shape, x, y);

    /* linear in (flux, background): Jacobian is constant */
    auto residual = [&](const Eigen::VectorXd& p,
                        Eigen::VectorXd*       r,
                        Eigen::MatrixXd*       J) {
        if (r) *r = (p[0] * profile).array() + p[1] - d.array();
        if (J) {
            J->resize(n, 2);
            J->col(0) = profile;
            J->col(1).setOnes();
        }
    };

    Eigen::VectorXd p(2);
    p << d.sum(), 0.0;

    LMSolverOptions opt;
    opt.max_iterations = 50;
    opt.tag            = "[Extract]";
    levenberg_marquardt(residual, p, {}, {}, opt);

    return {p[0], p[1]};
}

ExtractedFlux extract_total_flux(const Matrix&        data,
                                 const Matrix&        variance,
                                 const Vector&        xfibre,
                                 const Vector&        yfibre,
                                 const Vector&        wavelength,
                                 const PsfParameters& psf,
                                 const MoffatModel&   model)
{
    if (data.cols() != wavelength.size() || variance.cols() != wavelength.size())
        throw std::invalid_argument("extract_total_flux: pixel count mismatch");

    const auto slices = expand_to_slices(psf, wavelength);
    const Eigen::Index n_pixel = wavelength.size();

    ExtractedFlux out;
    out.flux.resize(n_pixel);
    out.background.resize(n_pixel);

    int n_skipped = 0;
    for (Eigen::Index i = 0; i < n_pixel; ++i) {
        const SliceFlux sf = extract_slice(data.col(i), variance.col(i),
                                           xfibre, yfibre,
                                           slices[static_cast<std::size_t>(i)], model);
        out.flux[i]       = sf.flux;
        out.background[i] = sf.background;
        if (!std::isfinite(sf.flux)) ++n_skipped;
    }

    std::cout << "[Extract] " << n_pixel << " slices, " << n_skipped
              << " with too few finite fibres\n";
    return out;
}

} // namespace fluxcal
