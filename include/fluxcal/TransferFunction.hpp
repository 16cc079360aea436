#pragma once
#include "Types.hpp"

namespace fluxcal {

constexpr double kDefaultSmoothWidth = 10.0;

/**
 * Transfer function standard / observed on the observed wavelength grid.
 *
 * The observed flux is rebinned onto the (coarser) standard grid, the ratio is
 * taken there, optionally smoothed, and linearly interpolated back onto
 * `observed_wavelength`.
 */
Vector take_ratio(const Vector& standard_flux,
                  const Vector& standard_wavelength,
                  const Vector& observed_flux,
                  const Vector& observed_wavelength,
                  bool          smooth = true,
                  double        width  = kDefaultSmoothWidth);

/**
 * Gaussian smoothing of a ratio, carried out on its reciprocal.
 *
 * Non-finite values at the ends are left untouched, interior ones are
 * interpolated over.  Both ends are extended by round(3 width) samples
 * reflected through the end point before filtering.
 */
Vector smooth_ratio(const Vector& ratio, double width = kDefaultSmoothWidth);

} // namespace fluxcal
