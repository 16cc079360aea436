#pragma once
#include <Eigen/Core>
#include <Eigen/Dense>
#include <vector>
#include <iostream>
#include <iomanip>
#include <limits>
#include <cmath>

namespace fluxcal {

/* ---------------------------  user visible bits  --------------------------- */

struct LMSolverOptions {
    int    max_iterations        = 200;      // hard upper limit
    bool   verbose               = false;    // one line per iteration
    const char* tag              = "[LM]";   // log prefix
};

struct LMSolverSummary {
    int    iterations         = 0;
    double initial_chi2       = 0.0;
    double final_chi2         = 0.0;
    bool   converged          = false;
};

/* JᵀJ, lower triangle rank update mirrored to upper */
inline
void normal_matrix(const Eigen::MatrixXd& J, Eigen::MatrixXd& JTJ)
{
    JTJ.setZero();
    JTJ.selfadjointView<Eigen::Lower>().rankUpdate(J.adjoint(), 1.0);
    JTJ.template triangularView<Eigen::StrictlyUpper>() = JTJ.transpose();
}

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*
 *  Functor signature:
 *      void f(const Eigen::VectorXd& x, Eigen::VectorXd* r, Eigen::MatrixXd* J)
 *  J may be requested as nullptr.  Steps are projected onto [lower, upper]
 *  (either may be empty = unbounded).
 */
template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                    func,
                    Eigen::VectorXd&             x,
                    const std::vector<double>&   lower,
                    const std::vector<double>&   upper,
                    const LMSolverOptions&       opt = {})
{
    LMSolverSummary summ;
    const int n = static_cast<int>(x.size());
    if (n == 0) {
        summ.converged = true;
        return summ;
    }

    /* ---- keep the start point inside the box ---------------------- */
    for (int j = 0; j < n; ++j) {
        if (!lower.empty()) x[j] = std::max(x[j], lower[j]);
        if (!upper.empty()) x[j] = std::min(x[j], upper[j]);
    }

    /* --------------------------------------------------------------- */
    /*  first model evaluation                                         */
    /* --------------------------------------------------------------- */
    Eigen::VectorXd r;
    Eigen::MatrixXd J;
    func(x, &r, &J);

    const std::size_t m = static_cast<std::size_t>(r.size());
    double chi2 = r.squaredNorm();
    summ.initial_chi2 = chi2;

    /* --------------------------------------------------------------- */
    /*  tolerances and initial λ, scaled to the starting point         */
    /* --------------------------------------------------------------- */
    const double eps = std::numeric_limits<double>::epsilon();

    const double gmax0    = (J.transpose() * r).cwiseAbs().maxCoeff();
    const double grad_tol = (gmax0 > 0.0) ? 1e-10 * gmax0 : 1e-12;
    const double step_tol = 1e-10 * std::max(1.0, x.lpNorm<Eigen::Infinity>());
    const double chi2_tol = 1e-12 * std::max(1.0, chi2);

    double lambda = 1e-3 * (J.transpose() * J).diagonal().maxCoeff();
    if (lambda == 0.0) lambda = 1e-3;

    Eigen::MatrixXd JTJ(n, n);
    Eigen::VectorXd diag_JTJ(n), g(n), dx(n);

    if (opt.verbose)
        std::cout << opt.tag << "  " << m << " residuals, " << n
                  << " free parameters, χ²=" << chi2 << std::endl;

    /* --------------------------------------------------------------- */
    /*  main iteration loop                                            */
    /* --------------------------------------------------------------- */
    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;

        normal_matrix(J, JTJ);

        /* ---------------------- g = Jᵀ r --------------------------- */
        g.noalias() = J.transpose() * r;
        if (g.cwiseAbs().maxCoeff() < grad_tol) {
            summ.converged = true;
            break;
        }

        /* ------- (JTJ + λ D) Δx = −g   (D = diag(JTJ)) -------------- */
        diag_JTJ = JTJ.diagonal();
        JTJ.diagonal().array() += lambda * (diag_JTJ.array() + 1e-20);
        dx = -JTJ.ldlt().solve(g);

        if (!dx.allFinite()) {
            std::cout << opt.tag << "  Warning: numerical failure! Inf/NaN in solver. Aborting iteration...\n";
            break;
        }

        if (dx.cwiseAbs().maxCoeff() < step_tol) {
            summ.converged = true;
            break;
        }

        /* --------------------- candidate point ---------------------- */
        Eigen::VectorXd x_try = x + dx;
        for (int j = 0; j < n; ++j) {
            if (!lower.empty()) x_try[j] = std::max(x_try[j], lower[j]);
            if (!upper.empty()) x_try[j] = std::min(x_try[j], upper[j]);
        }

        /* ----------- the step actually taken after clipping --------- */
        dx = x_try - x;

        Eigen::VectorXd r_try;
        Eigen::MatrixXd J_try;
        func(x_try, &r_try, &J_try);
        const double chi2_try = r_try.allFinite()
                              ? r_try.squaredNorm()
                              : std::numeric_limits<double>::infinity();

        /* ------------------- Powell's ρ test ------------------------ */
        const Eigen::VectorXd tmp =
            lambda * (diag_JTJ.array() * dx.array()).matrix() - g;
        double pred_red = 0.5 * dx.dot(tmp);
        if (pred_red <= 0.0) pred_red = eps;

        const double rho    = (chi2 - chi2_try) / pred_red;
        const bool   accept = rho > 0.0 && chi2_try < chi2;

        if (accept) {
            x.swap(x_try);
            r.swap(r_try);
            J.swap(J_try);
            const double old_chi2 = chi2;
            chi2 = chi2_try;

            /* adaptive λ (MINPACK style) ---------------------------- */
            const double fac = std::max(1.0/3.0,
                                        1.0 - std::pow(2.0*rho - 1.0, 3.0));
            lambda = std::max(lambda * fac, 1e-18);

            if (opt.verbose)
                std::cout << opt.tag << "  iter " << it
                          << "  ρ="  << std::fixed << std::setprecision(2) << rho
                          << "  χ²=" << std::scientific << std::setprecision(4) << chi2
                          << "  λ="  << std::scientific << std::setprecision(2) << lambda
                          << std::defaultfloat << "  (accepted)\n";

            if (old_chi2 - chi2 < chi2_tol) {
                summ.converged = true;
                break;
            }
        } else {
            lambda *= 2.0;
            if (opt.verbose)
                std::cout << opt.tag << "  iter " << it
                          << "  ρ="  << std::fixed << std::setprecision(2) << rho
                          << "  χ²=" << std::scientific << std::setprecision(4) << chi2_try
                          << "  λ="  << std::scientific << std::setprecision(2) << lambda
                          << std::defaultfloat << "  (rejected)\n";
            if (lambda > 1e30) break;             // no downhill step left
        }
    }

    summ.final_chi2 = chi2;
    return summ;
}

} // namespace fluxcal
