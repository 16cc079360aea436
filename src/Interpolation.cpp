#include "fluxcal/Interpolation.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace fluxcal {

Vector interp_linear(const Vector& x_in,
                     const Vector& y_in,
                     const Vector& x_out)
{
    const Eigen::Index n_in = x_in.size();
    if (n_in == 0 || y_in.size() != n_in)
        throw std::invalid_argument("interp_linear: invalid input table.");

    Vector out(x_out.size());
    for (Eigen::Index k = 0; k < x_out.size(); ++k) {
        const double x = x_out[k];

        if (x <= x_in[0])        { out[k] = y_in[0];        continue; }
        if (x >= x_in[n_in - 1]) { out[k] = y_in[n_in - 1]; continue; }

        const auto* first = x_in.data();
        const auto* it    = std::upper_bound(first, first + n_in, x);
        const Eigen::Index hi = static_cast<Eigen::Index>(it - first);
        const Eigen::Index lo = hi - 1;

        const double dx = x_in[hi] - x_in[lo];
        const double t  = (dx == 0.0) ? 0.0 : (x - x_in[lo]) / dx;
        out[k] = (1.0 - t) * y_in[lo] + t * y_in[hi];
    }
    return out;
}

Vector gaussian_filter1d(const Vector& y, double sigma)
{
    if (!(sigma > 0.0))
        throw std::invalid_argument("gaussian_filter1d: sigma must be positive");

    const int radius = static_cast<int>(4.0 * sigma + 0.5);

    std::vector<double> kernel(2 * radius + 1);
    double ksum = 0.0;
    for (int i = -radius; i <= radius; ++i) {
        const double w = std::exp(-0.5 * i * i / (sigma * sigma));
        kernel[i + radius] = w;
        ksum += w;
    }
    for (auto& w : kernel) w /= ksum;

    const Eigen::Index n = y.size();
    Vector out(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        double sum = 0.0;
        for (int k = -radius; k <= radius; ++k) {
            const Eigen::Index j = std::clamp<Eigen::Index>(i + k, 0, n - 1);
            sum += kernel[k + radius] * y[j];
        }
        out[i] = sum;
    }
    return out;
}

} // namespace fluxcal
