#include "fluxcal/Subgrid.hpp"
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace fluxcal {

ApertureSubgrid::ApertureSubgrid(double fibre_radius, int n_rings, int n_inner)
    : fibre_radius_(fibre_radius)
{
    if (n_rings < 1 || n_inner < 1)
        throw std::invalid_argument("ApertureSubgrid: need at least one ring and one point");
    if (!(fibre_radius > 0.0))
        throw std::invalid_argument("ApertureSubgrid: fibre radius must be positive");

    const double two_pi = boost::math::constants::two_pi<double>();

    std::vector<double> xs, ys;
    double rot_angle = 0.0;
    for (int i_ring = 0; i_ring < n_rings; ++i_ring) {
        const double radius_ring = i_ring + 0.5;
        const int    n_points    = static_cast<int>(std::round(n_inner * radius_ring));
        const double spacing     = two_pi / n_points;
        const double radius      = radius_ring * fibre_radius / n_rings;

        for (int k = 0; k < n_points; ++k) {
            const double theta = k * spacing + rot_angle;
            xs.push_back(radius * std::cos(theta));
            ys.push_back(radius * std::sin(theta));
        }
        rot_angle += 0.5 * spacing;
    }

    x_ = Eigen::Map<Vector>(xs.data(), xs.size());
    y_ = Eigen::Map<Vector>(ys.data(), ys.size());
}

const ApertureSubgrid& default_subgrid()
{
    static const ApertureSubgrid grid;
    return grid;
}

} // namespace fluxcal
