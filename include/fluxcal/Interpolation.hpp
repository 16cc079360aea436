#pragma once
#include "Types.hpp"

namespace fluxcal {

/**
 * Linear interpolation y(x_out) on an ascending table; values outside the
 * table are clamped to the first / last ordinate.
 */
Vector interp_linear(const Vector& x_in,
                     const Vector& y_in,
                     const Vector& x_out);

/**
 * 1-D Gaussian filter of standard deviation `sigma` samples, kernel truncated
 * at 4 sigma, edges extended with the nearest value.
 */
Vector gaussian_filter1d(const Vector& y, double sigma);

} // namespace fluxcal
