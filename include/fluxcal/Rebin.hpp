#pragma once
#include "Types.hpp"

namespace fluxcal {

/*
 * Flux conserving resampling of a flux density onto `target_wavelength`.
 *
 * Bin edges of both grids are the midpoints between neighbouring samples,
 * with the outermost edges on the first and last sample.  Non-finite source
 * samples carry no weight.  A target bin without any finite overlap is
 * returned as NaN.  When a target bin's upper edge lies beyond the source
 * grid only the source bin straddling its lower edge is counted.
 */
Vector rebin_flux(const Vector& target_wavelength,
                  const Vector& source_wavelength,
                  const Vector& source_flux);

/* midpoint edges, first/last edge on the first/last sample (n + 1 values) */
Vector bin_edges(const Vector& centres);

} // namespace fluxcal
