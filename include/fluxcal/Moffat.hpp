#pragma once
#include "Types.hpp"
#include "Subgrid.hpp"
#include <vector>

namespace fluxcal {

/*  PSF parameters resolved at a single wavelength slice.
 *  Positions and widths in arcsec; flux in counts summed over the whole PSF,
 *  background in counts per fibre.                                        */
struct SliceParameters {
    double xcen       = 0.0;
    double ycen       = 0.0;
    double alphax     = 1.0;
    double alphay     = 1.0;
    double beta       = 4.0;
    double rho        = 0.0;
    double flux       = 0.0;
    double background = 0.0;
};

/*
 * Elliptical Moffat profile integrated over fibre apertures.
 *
 * The profile is normalised to unit integral over the plane and then scaled
 * by the area of one fibre face, so that `flux * fibre_profile` is the number
 * of counts a fibre would see for a PSF with total counts `flux`.
 */
class MoffatModel {
public:
    explicit MoffatModel(const ApertureSubgrid& subgrid);
    MoffatModel(ApertureSubgrid&&) = delete;     // keeps a reference

    /* profile at the exact offsets (x, y), no aperture integration */
    double point(const SliceParameters& p, double x, double y) const;

    /* profile averaged over the subgrid around every fibre centre */
    Vector fibre_profile(const SliceParameters& p,
                         const Vector&          xfibre,
                         const Vector&          yfibre) const;

    /* n_fibre × n_slice matrix of fibre_profile() columns */
    Matrix fibre_profiles(const std::vector<SliceParameters>& slices,
                          const Vector&                       xfibre,
                          const Vector&                       yfibre) const;

    /* flux * profile + background for every fibre and slice */
    Matrix model_flux(const std::vector<SliceParameters>& slices,
                      const Vector&                       xfibre,
                      const Vector&                       yfibre) const;

    const ApertureSubgrid& subgrid() const { return subgrid_; }

private:
    const ApertureSubgrid& subgrid_;
    double                 fibre_area_;
};

} // namespace fluxcal
