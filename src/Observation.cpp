#include "fluxcal/Observation.hpp"
#include <boost/math/statistics/univariate_statistics.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace fluxcal {

ChunkedData chunk_data(const IfuObservation& ifu, int n_drop, int n_chunk)
{
    const Eigen::Index n_fibre = ifu.data.rows();
    const Eigen::Index n_pixel = ifu.data.cols();

    if (ifu.variance.rows() != n_fibre || ifu.variance.cols() != n_pixel
        || ifu.wavelength.size() != n_pixel)
        throw std::invalid_argument("chunk_data: inconsistent array shapes in " + ifu.path);
    if (n_drop < 0 || n_pixel - 2 * n_drop <= 0)
        throw std::invalid_argument("chunk_data: nothing left after dropping pixels");

    const double usable = static_cast<double>(n_pixel - 2 * n_drop);
    if (n_chunk <= 0)
        n_chunk = static_cast<int>(std::round(usable / 100.0));
    if (n_chunk <= 0)
        throw std::invalid_argument("chunk_data: spectrum too short to chunk");

    const Eigen::Index chunk_size = static_cast<Eigen::Index>(std::round(usable / n_chunk));
    if (chunk_size <= 0 || n_drop + n_chunk * chunk_size > n_pixel)
        throw std::invalid_argument("chunk_data: chunks overrun the spectrum");

    const double nan = std::numeric_limits<double>::quiet_NaN();

    ChunkedData out;
    out.data.resize(n_fibre, n_chunk);
    out.variance.resize(n_fibre, n_chunk);
    out.wavelength.resize(n_chunk);
    out.xfibre = ifu.xfibre;
    out.yfibre = ifu.yfibre;

    for (int c = 0; c < n_chunk; ++c) {
        const Eigen::Index start = n_drop + c * chunk_size;

        for (Eigen::Index f = 0; f < n_fibre; ++f) {
            double sum = 0.0, var_sum = 0.0;
            int    n_good = 0, n_var = 0;
            for (Eigen::Index k = start; k < start + chunk_size; ++k) {
                const double d = ifu.data(f, k);
                const double v = ifu.variance(f, k);
                if (std::isfinite(d)) { sum += d; ++n_good; }
                if (std::isfinite(v)) { var_sum += v; ++n_var; }
            }
            out.data(f, c)     = n_good ? sum / n_good : nan;
            out.variance(f, c) = n_var ? var_sum / (static_cast<double>(n_var) * n_var) : nan;
        }

        std::vector<double> wl(ifu.wavelength.data() + start,
                               ifu.wavelength.data() + start + chunk_size);
        out.wavelength[c] = boost::math::statistics::median(wl);
    }
    return out;
}

ChunkedData read_chunked_data(const std::vector<IfuObservation>& ifus,
                              int n_drop, int n_chunk)
{
    if (ifus.empty())
        throw std::invalid_argument("read_chunked_data: no observations given");

    std::vector<ChunkedData> parts;
    Eigen::Index n_total = 0;
    for (const auto& ifu : ifus) {
        parts.push_back(chunk_data(ifu, n_drop, n_chunk));
        n_total += parts.back().wavelength.size();
    }

    const Eigen::Index n_fibre = parts.front().data.rows();
    ChunkedData out;
    out.data.resize(n_fibre, n_total);
    out.variance.resize(n_fibre, n_total);
    out.wavelength.resize(n_total);

    Eigen::Index col = 0;
    for (const auto& p : parts) {
        if (p.data.rows() != n_fibre)
            throw std::invalid_argument("read_chunked_data: fibre count differs between files");
        const Eigen::Index n = p.wavelength.size();
        out.data.middleCols(col, n)     = p.data;
        out.variance.middleCols(col, n) = p.variance;
        out.wavelength.segment(col, n)  = p.wavelength;
        col += n;
    }
    out.xfibre = parts.back().xfibre;
    out.yfibre = parts.back().yfibre;
    return out;
}

} // namespace fluxcal
