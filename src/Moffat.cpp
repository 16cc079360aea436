#include "fluxcal/Moffat.hpp"
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <stdexcept>

namespace fluxcal {

namespace {
constexpr double kPi = boost::math::constants::pi<double>();
}

MoffatModel::MoffatModel(const ApertureSubgrid& subgrid)
    : subgrid_(subgrid)
    , fibre_area_(kPi * subgrid.fibre_radius() * subgrid.fibre_radius())
{}

double MoffatModel::point(const SliceParameters& p, double x, double y) const
{
    const double xterm     = (x - p.xcen) / p.alphax;
    const double yterm     = (y - p.ycen) / p.alphay;
    const double one_m_rho = 1.0 - p.rho * p.rho;

    const double norm = (p.beta - 1.0)
                      / (kPi * p.alphax * p.alphay * std::sqrt(one_m_rho));
    const double q    = (xterm * xterm + yterm * yterm
                         - 2.0 * p.rho * xterm * yterm) / one_m_rho;

    return norm * std::pow(1.0 + q, -p.beta) * fibre_area_;
}

Vector MoffatModel::fibre_profile(const SliceParameters& p,
                                  const Vector&          xfibre,
                                  const Vector&          yfibre) const
{
    if (xfibre.size() != yfibre.size())
        throw std::invalid_argument("fibre_profile: x/y fibre arrays differ in length");

    const Vector& xs = subgrid_.x();
    const Vector& ys = subgrid_.y();
    const Eigen::Index n_sub = xs.size();

    Vector out(xfibre.size());
    for (Eigen::Index f = 0; f < xfibre.size(); ++f) {
        double sum = 0.0;
        for (Eigen::Index k = 0; k < n_sub; ++k)
            sum += point(p, xfibre[f] + xs[k], yfibre[f] + ys[k]);
        out[f] = sum / static_cast<double>(n_sub);
    }
    return out;
}

Matrix MoffatModel::fibre_profiles(const std::vector<SliceParameters>& slices,
                                   const Vector&                       xfibre,
                                   const Vector&                       yfibre) const
{
    Matrix out(xfibre.size(), static_cast<Eigen::Index>(slices.size()));
    for (std::size_t s = 0; s < slices.size(); ++s)
        out.col(static_cast<Eigen::Index>(s)) = fibre_profile(slices[s], xfibre, yfibre);
    return out;
}

Matrix MoffatModel::model_flux(const std::vector<SliceParameters>& slices,
                               const Vector&                       xfibre,
                               const Vector&                       yfibre) const
{
    Matrix flux = fibre_profiles(slices, xfibre, yfibre);
    for (std::size_t s = 0; s < slices.size(); ++s) {
        const auto col = static_cast<Eigen::Index>(s);
        flux.col(col) = (slices[s].flux * flux.col(col)).array() + slices[s].background;
    }
    return flux;
}

} // namespace fluxcal
