#include "fluxcal/PsfParameters.hpp"
#include "fluxcal/Atmosphere.hpp"
#include "fluxcal/Errors.hpp"
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace fluxcal {

namespace {

constexpr double kAlphaIndex = -0.2;

/* shared tail of the slice expansion: centre shift along the zenith
 * direction and chromatic widths; flux and background are set by the caller */
void fill_geometry(std::vector<SliceParameters>& slices,
                   const Vector&                 wavelength,
                   double xcen_ref, double ycen_ref,
                   double zenith_direction, double zenith_distance,
                   double alphax_ref, double alphay_ref,
                   double beta, double rho,
                   const AtmosphericConditions& atm)
{
    const double cos_dir = std::cos(zenith_direction);
    const double sin_dir = std::sin(zenith_direction);

    for (Eigen::Index i = 0; i < wavelength.size(); ++i) {
        auto&        s      = slices[static_cast<std::size_t>(i)];
        const double offset = dar(wavelength[i], zenith_distance, atm);
        s.xcen   = xcen_ref + cos_dir * offset;
        s.ycen   = ycen_ref + sin_dir * offset;
        s.alphax = alpha_at(wavelength[i], alphax_ref);
        s.alphay = alpha_at(wavelength[i], alphay_ref);
        s.beta   = beta;
        s.rho    = rho;
    }
}

} // unnamed namespace

/* ------------------------------------------------------------------ */
ModelVariant parse_model_variant(const std::string& name)
{
    static const std::unordered_map<std::string, ModelVariant> kNames = {
        {"full",                            ModelVariant::Full},
        {"circular",                        ModelVariant::Circular},
        {"circular_atm",                    ModelVariant::CircularAtm},
        {"ref_centre_alpha_angle",          ModelVariant::Full},
        {"ref_centre_alpha_angle_circ",     ModelVariant::Circular},
        {"ref_centre_alpha_angle_circ_atm", ModelVariant::CircularAtm}
    };
    auto it = kNames.find(name);
    if (it == kNames.end()) throw UnknownModelVariant(name);
    return it->second;
}

std::string to_string(ModelVariant variant)
{
    switch (variant) {
        case ModelVariant::Full:        return "full";
        case ModelVariant::Circular:    return "circular";
        case ModelVariant::CircularAtm: return "circular_atm";
    }
    throw UnknownModelVariant(std::to_string(static_cast<int>(variant)));
}

int scalar_parameter_count(ModelVariant variant)
{
    switch (variant) {
        case ModelVariant::Full:        return 8;
        case ModelVariant::Circular:    return 6;
        case ModelVariant::CircularAtm: return 9;
    }
    throw UnknownModelVariant(std::to_string(static_cast<int>(variant)));
}

ModelVariant PsfParameters::variant() const
{
    if (shape.valueless_by_exception())
        throw UnknownModelVariant("<valueless>");
    return static_cast<ModelVariant>(shape.index());
}

double alpha_at(double wavelength, double alpha_ref)
{
    return alpha_ref * std::pow(wavelength / kReferenceWavelength, kAlphaIndex);
}

/* ------------------------------------------------------------------ */
/*  record  ->  flat vector                                           */
/* ------------------------------------------------------------------ */
Vector to_vector(const PsfParameters& params)
{
    const ModelVariant variant = params.variant();
    const Eigen::Index n_flux  = params.flux.size();
    const Eigen::Index n_bg    = params.background.size();
    const int          k       = scalar_parameter_count(variant);
    if (n_flux != n_bg)
        throw std::invalid_argument("to_vector: flux and background differ in length");

    Vector v(n_flux + n_bg + k);
    v.head(n_flux)          = params.flux;
    v.segment(n_flux, n_bg) = params.background;
    double* tail = v.data() + n_flux + n_bg;

    switch (variant) {
        case ModelVariant::Full: {
            const auto& s = std::get<FullShape>(params.shape);
            tail[0] = s.xcen_ref;
            tail[1] = s.ycen_ref;
            tail[2] = s.zenith_direction;
            tail[3] = s.zenith_distance;
            tail[4] = s.alphax_ref;
            tail[5] = s.alphay_ref;
            tail[6] = s.beta;
            tail[7] = s.rho;
            break;
        }
        case ModelVariant::Circular: {
            const auto& s = std::get<CircularShape>(params.shape);
            tail[0] = s.xcen_ref;
            tail[1] = s.ycen_ref;
            tail[2] = s.zenith_direction;
            tail[3] = s.zenith_distance;
            tail[4] = s.alpha_ref;
            tail[5] = s.beta;
            break;
        }
        case ModelVariant::CircularAtm: {
            const auto& s = std::get<CircularAtmShape>(params.shape);
            tail[0] = s.temperature;
            tail[1] = s.pressure;
            tail[2] = s.vapour_pressure;
            tail[3] = s.xcen_ref;
            tail[4] = s.ycen_ref;
            tail[5] = s.zenith_direction;
            tail[6] = s.zenith_distance;
            tail[7] = s.alpha_ref;
            tail[8] = s.beta;
            break;
        }
        default:
            throw UnknownModelVariant(std::to_string(static_cast<int>(variant)));
    }
    return v;
}

/* ------------------------------------------------------------------ */
/*  flat vector  ->  record                                           */
/* ------------------------------------------------------------------ */
PsfParameters from_vector(const Vector& vec, ModelVariant variant)
{
    const int k = scalar_parameter_count(variant);     // throws if unknown
    const Eigen::Index n_per_slice = vec.size() - k;
    if (n_per_slice < 0 || n_per_slice % 2 != 0)
        throw std::invalid_argument("from_vector: vector of length "
                                    + std::to_string(vec.size())
                                    + " does not fit model " + to_string(variant));

    const Eigen::Index n_slice = n_per_slice / 2;
    PsfParameters out;
    out.flux       = vec.head(n_slice);
    out.background = vec.segment(n_slice, n_slice);
    const double* tail = vec.data() + 2 * n_slice;

    switch (variant) {
        case ModelVariant::Full: {
            FullShape s;
            s.xcen_ref         = tail[0];
            s.ycen_ref         = tail[1];
            s.zenith_direction = tail[2];
            s.zenith_distance  = tail[3];
            s.alphax_ref       = tail[4];
            s.alphay_ref       = tail[5];
            s.beta             = tail[6];
            s.rho              = tail[7];
            out.shape = s;
            break;
        }
        case ModelVariant::Circular: {
            CircularShape s;
            s.xcen_ref         = tail[0];
            s.ycen_ref         = tail[1];
            s.zenith_direction = tail[2];
            s.zenith_distance  = tail[3];
            s.alpha_ref        = tail[4];
            s.beta             = tail[5];
            out.shape = s;
            break;
        }
        case ModelVariant::CircularAtm: {
            CircularAtmShape s;
            s.temperature      = tail[0];
            s.pressure         = tail[1];
            s.vapour_pressure  = tail[2];
            s.xcen_ref         = tail[3];
            s.ycen_ref         = tail[4];
            s.zenith_direction = tail[5];
            s.zenith_distance  = tail[6];
            s.alpha_ref        = tail[7];
            s.beta             = tail[8];
            out.shape = s;
            break;
        }
        default:
            throw UnknownModelVariant(std::to_string(static_cast<int>(variant)));
    }
    return out;
}

PsfParameters from_vector(const Vector& vec, const std::string& variant_name)
{
    return from_vector(vec, parse_model_variant(variant_name));
}

/* ------------------------------------------------------------------ */
/*  reference parameters  ->  per-slice parameters                    */
/* ------------------------------------------------------------------ */
std::vector<SliceParameters> expand_to_slices(const PsfParameters& params,
                                              const Vector&        wavelength)
{
    const Eigen::Index n = wavelength.size();
    std::vector<SliceParameters> slices(static_cast<std::size_t>(n));
    for (auto& s : slices) { s.flux = 0.0; s.background = 0.0; }

    switch (params.variant()) {
        case ModelVariant::Full: {
            const auto& s = std::get<FullShape>(params.shape);
            fill_geometry(slices, wavelength, s.xcen_ref, s.ycen_ref,
                          s.zenith_direction, s.zenith_distance,
                          s.alphax_ref, s.alphay_ref, s.beta, s.rho, {});
            break;
        }
        case ModelVariant::Circular: {
            const auto& s = std::get<CircularShape>(params.shape);
            fill_geometry(slices, wavelength, s.xcen_ref, s.ycen_ref,
                          s.zenith_direction, s.zenith_distance,
                          s.alpha_ref, s.alpha_ref, s.beta, 0.0, {});
            break;
        }
        case ModelVariant::CircularAtm: {
            const auto& s = std::get<CircularAtmShape>(params.shape);
            const AtmosphericConditions atm{s.temperature, s.pressure,
                                            s.vapour_pressure};
            fill_geometry(slices, wavelength, s.xcen_ref, s.ycen_ref,
                          s.zenith_direction, s.zenith_distance,
                          s.alpha_ref, s.alpha_ref, s.beta, 0.0, atm);
            break;
        }
        default:
            throw UnknownModelVariant(std::to_string(static_cast<int>(params.variant())));
    }

    if (params.flux.size() == n)
        for (Eigen::Index i = 0; i < n; ++i)
            slices[static_cast<std::size_t>(i)].flux = params.flux[i];
    if (params.background.size() == n)
        for (Eigen::Index i = 0; i < n; ++i)
            slices[static_cast<std::size_t>(i)].background = params.background[i];

    return slices;
}

} // namespace fluxcal
