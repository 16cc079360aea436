#pragma once
#include "Types.hpp"

namespace fluxcal {

// Wavelength (Å) at which the reference PSF centre and width are defined.
constexpr double kReferenceWavelength = 5000.0;

// Observing conditions entering the refraction formula.
struct AtmosphericConditions {
    double temperature     = 7.0;     // °C
    double pressure        = 600.0;   // mmHg
    double vapour_pressure = 8.0;     // mmHg
};

/**
 * Refractive index of air at `wavelength` (Å), Filippenko (1982):
 * sea-level dry term scaled for pressure and temperature, minus the water
 * vapour correction.
 */
double refractive_index(double wavelength,
                        const AtmosphericConditions& atm = {});

/**
 * Differential atmospheric refraction (arcsec) at `wavelength` relative to
 * kReferenceWavelength, for a zenith distance in radians.  Identically zero
 * at the reference wavelength.
 */
double dar(double wavelength,
           double zenith_distance,
           const AtmosphericConditions& atm = {});

Vector dar(const Vector& wavelength,
           double zenith_distance,
           const AtmosphericConditions& atm = {});

} // namespace fluxcal
