#include "fluxcal/PsfFitter.hpp"
#include "fluxcal/Errors.hpp"
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace fluxcal {

namespace {

constexpr double kPi = boost::math::constants::pi<double>();

bool usable(double value, double variance)
{
    return std::isfinite(value) && std::isfinite(variance) && variance > 0.0;
}

} // unnamed namespace

/* ------------------------------------------------------------------ */
PsfCost::PsfCost(const Matrix&      datatube,
                 const Matrix&      vartube,
                 const Vector&      xfibre,
                 const Vector&      yfibre,
                 const Vector&      wavelength,
                 ModelVariant       variant,
                 const MoffatModel& model)
    : data_(datatube)
    , xfibre_(xfibre)
    , yfibre_(yfibre)
    , wavelength_(wavelength)
    , variant_(variant)
    , model_(model)
    , n_slice_(static_cast<int>(wavelength.size()))
    , n_params_(2 * static_cast<int>(wavelength.size())
                + scalar_parameter_count(variant))
{
    if (datatube.rows() != xfibre.size() || xfibre.size() != yfibre.size())
        throw std::invalid_argument("PsfCost: fibre count mismatch");
    if (datatube.cols() != wavelength.size())
        throw std::invalid_argument("PsfCost: slice count mismatch");
    if (vartube.rows() != datatube.rows() || vartube.cols() != datatube.cols())
        throw std::invalid_argument("PsfCost: data and variance differ in shape");

    for (Eigen::Index f = 0; f < datatube.rows(); ++f)
        for (Eigen::Index s = 0; s < datatube.cols(); ++s)
            if (usable(datatube(f, s), vartube(f, s)))
                points_.push_back({f, s, std::sqrt(vartube(f, s))});

    if (points_.empty())
        throw std::runtime_error("PsfCost: no finite data points to fit");
}

/* --------------------------------------------------------------------- */
/*  (1)  residuals only                                                  */
/* --------------------------------------------------------------------- */
void PsfCost::compute_residuals(const Eigen::VectorXd& p,
                                Eigen::VectorXd&       r,
                                Matrix*                profiles) const
{
    const PsfParameters params = from_vector(p, variant_);
    const auto          slices = expand_to_slices(params, wavelength_);
    const Matrix        prof   = model_.fibre_profiles(slices, xfibre_, yfibre_);

    r.resize(numResiduals());
    for (std::size_t i = 0; i < points_.size(); ++i) {
        const Point& pt = points_[i];
        const auto&  sl = slices[static_cast<std::size_t>(pt.slice)];
        const double model = sl.flux * prof(pt.fibre, pt.slice) + sl.background;
        r[static_cast<Eigen::Index>(i)] = (model - data_(pt.fibre, pt.slice)) / pt.sigma;
    }
    if (profiles) *profiles = prof;
}

/* --------------------------------------------------------------------- */
/*  (2)  residuals + Jacobian                                            */
/* --------------------------------------------------------------------- */
void PsfCost::operator()(const Eigen::VectorXd& parameters,
                         Eigen::VectorXd*       residuals,
                         Eigen::MatrixXd*       jacobians) const
{
    Eigen::VectorXd r0;
    Matrix          prof;
    compute_residuals(parameters, r0, &prof);
    if (residuals) *residuals = r0;

    if (!jacobians) return;
    jacobians->setZero(numResiduals(), n_params_);

    /* ========== (A) analytic flux / background columns ============= */
    for (std::size_t i = 0; i < points_.size(); ++i) {
        const Point&       pt  = points_[i];
        const Eigen::Index row = static_cast<Eigen::Index>(i);
        jacobians->coeffRef(row, pt.slice)            = prof(pt.fibre, pt.slice) / pt.sigma;
        jacobians->coeffRef(row, n_slice_ + pt.slice) = 1.0 / pt.sigma;
    }

    /* ========== (B) FD for the shared shape parameters ============= */
    const double eps_base = 1e-6;
    for (int j = 2 * n_slice_; j < n_params_; ++j) {
        const double h = eps_base * (std::abs(parameters[j]) + 1.0);
        Eigen::VectorXd p_eps = parameters;
        p_eps[j] += h;

        Eigen::VectorXd r_eps;
        compute_residuals(p_eps, r_eps);
        jacobians->col(j) = (r_eps - r0) / h;
    }
}

/* ------------------------------------------------------------------ */
PsfParameters first_guess(const Matrix& datatube,
                          const Matrix& vartube,
                          const Vector& xfibre,
                          const Vector& yfibre,
                          const Vector& wavelength,
                          ModelVariant  variant)
{
    const Eigen::Index n_fibre = datatube.rows();
    const Eigen::Index n_slice = datatube.cols();
    if (wavelength.size() != n_slice)
        throw std::invalid_argument("first_guess: slice count mismatch");

    /* per-fibre inverse-variance weighted signal --------------------- */
    Vector weighted = Vector::Zero(n_fibre);
    for (Eigen::Index f = 0; f < n_fibre; ++f)
        for (Eigen::Index s = 0; s < n_slice; ++s)
            if (usable(datatube(f, s), vartube(f, s)))
                weighted[f] += datatube(f, s) / vartube(f, s);
    const double total = weighted.sum();
    if (total != 0.0) weighted /= total;

    const double xcen = xfibre.dot(weighted);
    const double ycen = yfibre.dot(weighted);

    PsfParameters guess;
    guess.flux = Vector::Zero(n_slice);
    for (Eigen::Index s = 0; s < n_slice; ++s)
        for (Eigen::Index f = 0; f < n_fibre; ++f)
            if (std::isfinite(datatube(f, s))) guess.flux[s] += datatube(f, s);
    guess.background = Vector::Zero(n_slice);

    switch (variant) {
        case ModelVariant::Full: {
            FullShape s;
            s.xcen_ref = xcen;  s.ycen_ref = ycen;
            s.zenith_direction = kPi / 4.0;
            s.zenith_distance  = kPi / 8.0;
            s.alphax_ref = 1.0; s.alphay_ref = 1.0;
            s.beta = 4.0;       s.rho = 0.0;
            guess.shape = s;
            break;
        }
        case ModelVariant::Circular: {
            CircularShape s;
            s.xcen_ref = xcen;  s.ycen_ref = ycen;
            s.zenith_direction = kPi / 4.0;
            s.zenith_distance  = kPi / 8.0;
            s.alpha_ref = 1.0;  s.beta = 4.0;
            guess.shape = s;
            break;
        }
        case ModelVariant::CircularAtm: {
            CircularAtmShape s;               // 7 °C, 600 mmHg, 8 mmHg
            s.xcen_ref = xcen;  s.ycen_ref = ycen;
            s.zenith_direction = kPi / 4.0;
            s.zenith_distance  = kPi / 8.0;
            s.alpha_ref = 1.0;  s.beta = 4.0;
            guess.shape = s;
            break;
        }
        default:
            throw UnknownModelVariant(std::to_string(static_cast<int>(variant)));
    }
    return guess;
}

/* ------------------------------------------------------------------ */
std::pair<std::vector<double>, std::vector<double>>
parameter_bounds(ModelVariant variant, int n_slice)
{
    const double inf = std::numeric_limits<double>::infinity();
    const int    k   = scalar_parameter_count(variant);
    const int    n0  = 2 * n_slice;

    std::vector<double> lo(n0 + k, -inf);
    std::vector<double> hi(n0 + k,  inf);

    auto zenith_distance = [&](int i) { lo[n0 + i] = 0.0;   hi[n0 + i] = 0.5 * kPi - 1e-3; };
    auto width           = [&](int i) { lo[n0 + i] = 1e-3; };
    auto beta            = [&](int i) { lo[n0 + i] = 1.0 + 1e-3; };

    switch (variant) {
        case ModelVariant::Full:
            zenith_distance(3); width(4); width(5); beta(6);
            lo[n0 + 7] = -0.999; hi[n0 + 7] = 0.999;
            break;
        case ModelVariant::Circular:
            zenith_distance(3); width(4); beta(5);
            break;
        case ModelVariant::CircularAtm:
            lo[n0 + 1] = 0.0;  lo[n0 + 2] = 0.0;     // pressures
            zenith_distance(6); width(7); beta(8);
            break;
        default:
            throw UnknownModelVariant(std::to_string(static_cast<int>(variant)));
    }
    return {lo, hi};
}

/* ------------------------------------------------------------------ */
PsfParameters fit_model_flux(const Matrix&        datatube,
                             const Matrix&        vartube,
                             const Vector&        xfibre,
                             const Vector&        yfibre,
                             const Vector&        wavelength,
                             ModelVariant         variant,
                             const MoffatModel&   model,
                             const PsfFitOptions& options,
                             LMSolverSummary*     summary)
{
    const PsfParameters guess = first_guess(datatube, vartube, xfibre, yfibre,
                                            wavelength, variant);
    PsfCost cost(datatube, vartube, xfibre, yfibre, wavelength, variant, model);

    Eigen::VectorXd x = to_vector(guess);
    const auto [lo, hi] = parameter_bounds(variant, static_cast<int>(wavelength.size()));

    std::cout << "[Fit] Fitting " << to_string(variant) << " model to "
              << datatube.rows() << " fibres x " << datatube.cols()
              << " slices (" << cost.numResiduals() << " residuals, "
              << cost.numParameters() << " parameters)\n";

    LMSolverOptions lm_opt;
    lm_opt.max_iterations = options.max_iterations;
    lm_opt.verbose        = options.verbose;
    lm_opt.tag            = "[Fit]";

    auto cost_functor = [&cost](const Eigen::VectorXd& p,
                                Eigen::VectorXd* r,
                                Eigen::MatrixXd* J) {
        cost(p, r, J);
    };
    const LMSolverSummary summ = levenberg_marquardt(cost_functor, x, lo, hi, lm_opt);

    std::cout << "[Fit] " << (summ.converged ? "Converged" : "Warning: not converged")
              << " after " << summ.iterations << " iterations, χ² "
              << summ.initial_chi2 << " -> " << summ.final_chi2 << '\n';

    if (summary) *summary = summ;
    return from_vector(x, variant);
}

} // namespace fluxcal
