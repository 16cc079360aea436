#pragma once
#include "Types.hpp"
#include "Moffat.hpp"
#include "PsfParameters.hpp"

namespace fluxcal {

// A slice needs strictly more finite fibres than this to be fitted.
constexpr int kMinFiniteFibres = 30;

struct SliceFlux {
    double flux;
    double background;
};

struct ExtractedFlux {
    Vector flux;          // total PSF counts per wavelength, NaN if unconstrained
    Vector background;    // per-fibre background per wavelength
};

/*
 * Fit flux and background of one wavelength slice with the PSF shape held
 * fixed.  Non-finite fibres are dropped; with kMinFiniteFibres or fewer
 * remaining the result is (NaN, NaN).  The residual is unweighted, the
 * variance is accepted for interface symmetry only.
 */
SliceFlux extract_slice(const Vector&          data,
                        const Vector&          variance,
                        const Vector&          xfibre,
                        const Vector&          yfibre,
                        const SliceParameters& shape,
                        const MoffatModel&     model);

/* extract_slice() for every column of an n_fibre × n_pixel frame */
ExtractedFlux extract_total_flux(const Matrix&        data,
                                 const Matrix&        variance,
                                 const Vector&        xfibre,
                                 const Vector&        yfibre,
                                 const Vector&        wavelength,
                                 const PsfParameters& psf,
                                 const MoffatModel&   model);

} // namespace fluxcal
