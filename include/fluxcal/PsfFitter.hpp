#pragma once
#include "Types.hpp"
#include "Moffat.hpp"
#include "PsfParameters.hpp"
#include "SimpleLM.hpp"
#include <utility>
#include <vector>

namespace fluxcal {

/* ------------------------------------------------------------------------- */
/*  Residual functor for the joint fit over all fibres and all slices        */
/* ------------------------------------------------------------------------- */
class PsfCost {
public:
    PsfCost(const Matrix&      datatube,       // n_fibre × n_slice
            const Matrix&      vartube,
            const Vector&      xfibre,
            const Vector&      yfibre,
            const Vector&      wavelength,     // n_slice
            ModelVariant       variant,
            const MoffatModel& model);
    PsfCost(const Matrix&, const Matrix&, const Vector&, const Vector&,
            const Vector&, ModelVariant, MoffatModel&&) = delete;

    /* number of residuals produced */
    int numResiduals() const { return static_cast<int>(points_.size()); }
    int numParameters() const { return n_params_; }

    /* residuals and (optionally) full Jacobian */
    void operator()(const Eigen::VectorXd& parameters,
                    Eigen::VectorXd*       residuals,
                    Eigen::MatrixXd*       jacobians) const;

private:
    struct Point { Eigen::Index fibre, slice; double sigma; };

    void compute_residuals(const Eigen::VectorXd& parameters,
                           Eigen::VectorXd&       residuals,
                           Matrix*                profiles = nullptr) const;

    Matrix             data_;
    Vector             xfibre_;
    Vector             yfibre_;
    Vector             wavelength_;
    ModelVariant       variant_;
    const MoffatModel& model_;
    int                n_slice_;
    int                n_params_;
    std::vector<Point> points_;    // finite data with positive variance
};

struct PsfFitOptions {
    int  max_iterations = 200;
    bool verbose        = false;
};

/* Starting point: variance weighted centroid, fixed shape defaults,
 * fibre-summed flux per slice, zero background.                        */
PsfParameters first_guess(const Matrix& datatube,
                          const Matrix& vartube,
                          const Vector& xfibre,
                          const Vector& yfibre,
                          const Vector& wavelength,
                          ModelVariant  variant);

/* lower / upper box for the variant's vector layout with n_slice slices */
std::pair<std::vector<double>, std::vector<double>>
parameter_bounds(ModelVariant variant, int n_slice);

/* Single joint least-squares fit of the PSF to every fibre and slice. */
PsfParameters fit_model_flux(const Matrix&        datatube,
                             const Matrix&        vartube,
                             const Vector&        xfibre,
                             const Vector&        yfibre,
                             const Vector&        wavelength,
                             ModelVariant         variant,
                             const MoffatModel&   model,
                             const PsfFitOptions& options = {},
                             LMSolverSummary*     summary = nullptr);

} // namespace fluxcal
