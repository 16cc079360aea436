#pragma once
/*
 * Reference-wavelength PSF parameters for the three supported models and the
 * mapping between them, the flat vector the solver works on, and the
 * per-slice parameters the Moffat model evaluates.
 *
 *  Vector layouts (n = number of wavelength slices):
 *
 *    full          flux[n] background[n] xcen_ref ycen_ref zenith_direction
 *                  zenith_distance alphax_ref alphay_ref beta rho
 *    circular      flux[n] background[n] xcen_ref ycen_ref zenith_direction
 *                  zenith_distance alpha_ref beta
 *    circular_atm  flux[n] background[n] temperature pressure vapour_pressure
 *                  xcen_ref ycen_ref zenith_direction zenith_distance
 *                  alpha_ref beta
 *
 *  Angles in radians, positions and widths in arcsec.
 */

#include "Types.hpp"
#include "Moffat.hpp"
#include <string>
#include <variant>
#include <vector>

namespace fluxcal {

enum class ModelVariant {
    Full        = 0,
    Circular    = 1,
    CircularAtm = 2
};

/* accepts short names and the legacy ref_centre_alpha_angle* names */
ModelVariant parse_model_variant(const std::string& name);
std::string  to_string(ModelVariant variant);

/* number of scalar (non per-slice) entries in the variant's vector */
int scalar_parameter_count(ModelVariant variant);

struct FullShape {
    double xcen_ref         = 0.0;
    double ycen_ref         = 0.0;
    double zenith_direction = 0.0;
    double zenith_distance  = 0.0;
    double alphax_ref       = 1.0;
    double alphay_ref       = 1.0;
    double beta             = 4.0;
    double rho              = 0.0;
};

struct CircularShape {
    double xcen_ref         = 0.0;
    double ycen_ref         = 0.0;
    double zenith_direction = 0.0;
    double zenith_distance  = 0.0;
    double alpha_ref        = 1.0;
    double beta             = 4.0;
};

struct CircularAtmShape {
    double temperature      = 7.0;
    double pressure         = 600.0;
    double vapour_pressure  = 8.0;
    double xcen_ref         = 0.0;
    double ycen_ref         = 0.0;
    double zenith_direction = 0.0;
    double zenith_distance  = 0.0;
    double alpha_ref        = 1.0;
    double beta             = 4.0;
};

/* alternative index == static_cast<int>(ModelVariant) */
using PsfShape = std::variant<FullShape, CircularShape, CircularAtmShape>;

struct PsfParameters {
    PsfShape shape;
    Vector   flux;          // one entry per slice, or empty for shape-only use
    Vector   background;    // idem

    ModelVariant variant() const;
};

/* alpha_ref · (λ / λ_ref)^-0.2 */
double alpha_at(double wavelength, double alpha_ref);

Vector to_vector(const PsfParameters& params);

PsfParameters from_vector(const Vector& vec, ModelVariant variant);
PsfParameters from_vector(const Vector& vec, const std::string& variant_name);

/*
 * Resolve the reference parameters at every wavelength: DAR shifted centres,
 * chromatically scaled widths, rho forced to zero for circular models.
 * Flux and background are copied when they have one entry per wavelength and
 * left at zero otherwise.
 */
std::vector<SliceParameters> expand_to_slices(const PsfParameters& params,
                                              const Vector&        wavelength);

} // namespace fluxcal
