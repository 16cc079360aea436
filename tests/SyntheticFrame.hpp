#pragma once
#include "SyntheticIfu.hpp"
#include <CCfits/CCfits>
#include <cmath>
#include <string>
#include <valarray>
#include <vector>

namespace fluxcal::test {

/* one probe of a synthetic frame: fibre offsets in arcsec around (ra, dec) */
struct SyntheticProbe {
    int         probenum = 1;
    std::string name;
    double      ra  = 0.0;
    double      dec = 0.0;
    FibreBundle fibres;
    Matrix      flux;              // n_fibre × n_pixel
};

/*
 * Write a reduced-frame lookalike: primary flux image with a linear
 * wavelength solution, unit VARIANCE extension and a FIBRES_IFU table.
 */
inline void write_synthetic_frame(const std::string&                 path,
                                  const std::vector<SyntheticProbe>& probes,
                                  double crval1, double cdelt1, long n_pixel)
{
    long n_fibre = 0;
    for (const auto& p : probes) n_fibre += static_cast<long>(p.fibres.x.size());

    long naxes[2] = {n_pixel, n_fibre};
    CCfits::FITS f("!" + path, DOUBLE_IMG, 2, naxes);

    std::valarray<double> flux(static_cast<std::size_t>(n_pixel * n_fibre));
    std::vector<int>         probenum;
    std::vector<std::string> probename;
    std::vector<double>      ra, dec;

    long row = 0;
    for (const auto& p : probes) {
        const double cos_dec = std::cos(p.dec * std::acos(-1.0) / 180.0);
        for (Eigen::Index i = 0; i < p.fibres.x.size(); ++i, ++row) {
            for (long k = 0; k < n_pixel; ++k)
                flux[static_cast<std::size_t>(row * n_pixel + k)] = p.flux(i, k);
            probenum.push_back(p.probenum);
            probename.push_back(p.name);
            ra.push_back(p.ra - p.fibres.x[i] / (3600.0 * cos_dec));
            dec.push_back(p.dec + p.fibres.y[i] / 3600.0);
        }
    }

    f.pHDU().write(1, static_cast<long>(flux.size()), flux);
    f.pHDU().addKey("CRVAL1", crval1, "wavelength of reference pixel");
    f.pHDU().addKey("CDELT1", cdelt1, "wavelength step");
    f.pHDU().addKey("CRPIX1", 1.0,    "reference pixel");

    std::vector<long> ext_axes{n_pixel, n_fibre};
    CCfits::ExtHDU* var = f.addImage("VARIANCE", DOUBLE_IMG, ext_axes);
    std::valarray<double> ones(1.0, flux.size());
    var->write(1, static_cast<long>(ones.size()), ones);

    std::vector<std::string> names{"PROBENUM", "PROBENAME", "FIB_MRA", "FIB_MDEC"};
    std::vector<std::string> forms{"J", "16A", "D", "D"};
    std::vector<std::string> units{"", "", "deg", "deg"};
    CCfits::Table* tbl = f.addTable("FIBRES_IFU", static_cast<int>(n_fibre), names, forms, units);
    tbl->column("PROBENUM").write(probenum, 1);
    tbl->column("PROBENAME").write(probename, 1);
    tbl->column("FIB_MRA").write(ra, 1);
    tbl->column("FIB_MDEC").write(dec, 1);
}

} // namespace fluxcal::test
