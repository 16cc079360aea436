#pragma once
#include "Types.hpp"
#include <cstddef>

namespace fluxcal {

// Core radius of one fibre on the sky, arcsec.
constexpr double kFibreRadius = 0.798;

/*
 * Fixed set of sample offsets covering one circular fibre aperture.
 *
 * The points sit on `n_rings` concentric rings at radii (i + 0.5)/n_rings of
 * the fibre radius; ring i carries round(n_inner * (i + 0.5)) points and is
 * rotated by half of its own point spacing with respect to the ring inside it.
 * The legacy layout also added half of the accumulated rotation; this one does not.
 * Averaging a profile over these offsets approximates its convolution with
 * the fibre face.
 */
class ApertureSubgrid {
public:
    explicit ApertureSubgrid(double fibre_radius = kFibreRadius,
                             int    n_rings      = 10,
                             int    n_inner      = 6);

    const Vector& x() const { return x_; }
    const Vector& y() const { return y_; }
    std::size_t   size() const { return static_cast<std::size_t>(x_.size()); }
    double        fibre_radius() const { return fibre_radius_; }

private:
    double fibre_radius_;
    Vector x_;
    Vector y_;
};

// Process-wide subgrid with the default layout, built on first use.
const ApertureSubgrid& default_subgrid();

} // namespace fluxcal
