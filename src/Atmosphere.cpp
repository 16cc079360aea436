#include "fluxcal/Atmosphere.hpp"
#include <cmath>

namespace fluxcal {

namespace {
constexpr double kArcsecPerRadian = 206265.0;
}

double refractive_index(double wavelength, const AtmosphericConditions& atm)
{
    const double wl   = wavelength * 1e-4;          // Å -> micron
    const double inv2 = 1.0 / (wl * wl);
    const double t    = atm.temperature;
    const double p    = atm.pressure;

    const double sea_level_dry = 64.328 + 29498.1 / (146.0 - inv2)
                                        + 255.4   / (41.0  - inv2);
    const double altitude_correction =
        (p * (1.0 + (1.049 - 0.0157 * t) * 1e-6 * p))
        / (720.883 * (1.0 + 0.003661 * t));
    const double vapour_correction =
        ((0.0624 - 0.000680 * inv2) / (1.0 + 0.003661 * t)) * atm.vapour_pressure;

    return 1e-6 * (sea_level_dry * altitude_correction - vapour_correction) + 1.0;
}

double dar(double wavelength, double zenith_distance,
           const AtmosphericConditions& atm)
{
    const double n_observed  = refractive_index(wavelength, atm);
    const double n_reference = refractive_index(kReferenceWavelength, atm);
    return kArcsecPerRadian * (n_observed - n_reference) * std::tan(zenith_distance);
}

Vector dar(const Vector& wavelength, double zenith_distance,
           const AtmosphericConditions& atm)
{
    Vector out(wavelength.size());
    for (Eigen::Index i = 0; i < wavelength.size(); ++i)
        out[i] = dar(wavelength[i], zenith_distance, atm);
    return out;
}

} // namespace fluxcal
