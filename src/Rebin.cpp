#include "fluxcal/Rebin.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace fluxcal {

/* -------------------------------------------------------------- *
 *  position of xi in fractional bin-index space of `edges`,      *
 *  NaN outside [edges[0], edges[n]]                               *
 * -------------------------------------------------------------- */
static double edge_index(const Vector& edges, double xi)
{
    const Eigen::Index n = edges.size();
    if (!(xi >= edges[0] && xi <= edges[n - 1]))
        return std::numeric_limits<double>::quiet_NaN();
    if (xi == edges[n - 1]) return static_cast<double>(n - 1);

    const auto it = std::upper_bound(edges.data(), edges.data() + n, xi);
    const Eigen::Index hi = static_cast<Eigen::Index>(it - edges.data());
    const Eigen::Index lo = hi - 1;
    const double w = (xi - edges[lo]) / (edges[hi] - edges[lo]);
    return static_cast<double>(lo) + w;
}

Vector bin_edges(const Vector& centres)
{
    const Eigen::Index N = centres.size();
    if (N < 2)
        throw std::invalid_argument("bin_edges: need at least two samples");

    Vector edges(N + 1);
    edges[0] = centres[0];
    for (Eigen::Index i = 1; i < N; ++i)
        edges[i] = 0.5 * (centres[i - 1] + centres[i]);
    edges[N] = centres[N - 1];
    return edges;
}

/* ==============================================================
 *  public interface
 * =============================================================*/
Vector rebin_flux(const Vector& target_wavelength,
                  const Vector& source_wavelength,
                  const Vector& source_flux)
{
    if (source_wavelength.size() != source_flux.size())
        throw std::invalid_argument("rebin_flux: source wavelength and flux differ in length");

    const Vector src_edges = bin_edges(source_wavelength);
    const Vector tgt_edges = bin_edges(target_wavelength);
    const Eigen::Index n_src = source_flux.size();
    const Eigen::Index n_tgt = target_wavelength.size();

    /* ---- per-bin totals and weights of the source ---- */
    Vector src_total(n_src), src_weight(n_src);
    for (Eigen::Index j = 0; j < n_src; ++j) {
        const double width = src_edges[j + 1] - src_edges[j];
        const bool   ok    = std::isfinite(source_flux[j]);
        src_total[j]  = ok ? source_flux[j] * width : 0.0;
        src_weight[j] = ok ? width : 0.0;
    }

    /* ---- target edges in source bin-index space ---- */
    Vector index(n_tgt + 1);
    for (Eigen::Index i = 0; i <= n_tgt; ++i)
        index[i] = edge_index(src_edges, tgt_edges[i]);

    Vector total  = Vector::Zero(n_tgt);
    Vector weight = Vector::Zero(n_tgt);

    auto add = [&](Eigen::Index i, Eigen::Index j, double frac) {
        if (j < 0 || j >= n_src || frac == 0.0) return;
        total[i]  += frac * src_total[j];
        weight[i] += frac * src_weight[j];
    };

    for (Eigen::Index i = 0; i < n_tgt; ++i) {
        const double lo = index[i];
        const double hi = index[i + 1];
        if (!std::isfinite(lo)) continue;

        const Eigen::Index lo_bin  = static_cast<Eigen::Index>(std::floor(lo));
        const double       lo_frac = lo - std::floor(lo);

        if (!std::isfinite(hi)) {
            /* upper edge beyond the source grid: only the straddling
               lower bin is counted, the rest of the range is dropped */
            add(i, lo_bin, 1.0 - lo_frac);
            continue;
        }

        const Eigen::Index hi_bin  = static_cast<Eigen::Index>(std::floor(hi));
        const double       hi_frac = hi - std::floor(hi);

        if (hi_bin == lo_bin) {
            add(i, lo_bin, hi - lo);
            continue;
        }
        add(i, lo_bin, 1.0 - lo_frac);
        for (Eigen::Index j = lo_bin + 1; j < hi_bin; ++j)
            add(i, j, 1.0);
        add(i, hi_bin, hi_frac);
    }

    /* ---- back from total flux per bin to flux density ---- */
    /* bins without finite overlap keep zero accumulators and come out NaN */
    Vector out(n_tgt);
    for (Eigen::Index i = 0; i < n_tgt; ++i)
        out[i] = (weight[i] > 0.0) ? total[i] / weight[i]
                                   : std::numeric_limits<double>::quiet_NaN();
    return out;
}

} // namespace fluxcal
