#include "fluxcal/TransferFunction.hpp"
#include "fluxcal/Interpolation.hpp"
#include "fluxcal/Rebin.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

namespace fluxcal {

Vector take_ratio(const Vector& standard_flux,
                  const Vector& standard_wavelength,
                  const Vector& observed_flux,
                  const Vector& observed_wavelength,
                  bool          smooth,
                  double        width)
{
    if (standard_flux.size() != standard_wavelength.size())
        throw std::invalid_argument("take_ratio: standard flux and wavelength differ in length");

    const Vector rebinned = rebin_flux(standard_wavelength,
                                       observed_wavelength, observed_flux);
    Vector ratio = standard_flux.array() / rebinned.array();
    if (smooth)
        ratio = smooth_ratio(ratio, width);

    return interp_linear(standard_wavelength, ratio, observed_wavelength);
}

Vector smooth_ratio(const Vector& ratio, double width)
{
    /* transmission-like quantity behaves better at the edges */
    Vector inverse = ratio.cwiseInverse();

    Eigen::Index first = -1, last = -1;
    for (Eigen::Index i = 0; i < inverse.size(); ++i)
        if (std::isfinite(inverse[i])) {
            if (first < 0) first = i;
            last = i;
        }
    if (first < 0)
        throw std::invalid_argument("smooth_ratio: no finite values to smooth");

    Vector cut = inverse.segment(first, last - first + 1);
    const Eigen::Index n = cut.size();

    /* ---- interpolate over interior gaps ---- */
    std::vector<double> good_x, good_y, bad_x;
    for (Eigen::Index i = 0; i < n; ++i) {
        if (std::isfinite(cut[i])) {
            good_x.push_back(static_cast<double>(i));
            good_y.push_back(cut[i]);
        } else {
            bad_x.push_back(static_cast<double>(i));
        }
    }
    if (!bad_x.empty()) {
        const Vector filled = interp_linear(
            Eigen::Map<Vector>(good_x.data(), good_x.size()),
            Eigen::Map<Vector>(good_y.data(), good_y.size()),
            Eigen::Map<Vector>(bad_x.data(),  bad_x.size()));
        for (std::size_t k = 0; k < bad_x.size(); ++k)
            cut[static_cast<Eigen::Index>(bad_x[k])] = filled[static_cast<Eigen::Index>(k)];
    }

    /* ---- point-reflected extension at both ends ---- */
    const Eigen::Index extra = static_cast<Eigen::Index>(std::round(3.0 * width));
    if (n < extra + 2)
        throw std::invalid_argument("smooth_ratio: "
                                    + std::to_string(n)
                                    + " samples are too few for width "
                                    + std::to_string(width));

    Vector extended(n + 2 * extra);
    for (Eigen::Index k = 0; k < extra; ++k) {
        extended[k]             = 2.0 * cut[0]     - cut[extra + 1 - k];
        extended[extra + n + k] = 2.0 * cut[n - 1] - cut[n - 1 - k];
    }
    extended.segment(extra, n) = cut;

    const Vector smoothed = gaussian_filter1d(extended, width);
    inverse.segment(first, n) = smoothed.segment(extra, n);

    return inverse.cwiseInverse();
}

} // namespace fluxcal
