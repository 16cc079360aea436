#include "fluxcal/FitsIO.hpp"
#include <CCfits/CCfits>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>
#include <valarray>

namespace fluxcal {

namespace {

struct FibreTable {
    std::vector<int>         probenum;
    std::vector<std::string> probename;
    std::vector<double>      ra;
    std::vector<double>      dec;
};

FibreTable read_fibre_table(CCfits::FITS& f)
{
    CCfits::ExtHDU& tbl = f.extension("FIBRES_IFU");
    const long n = tbl.rows();
    FibreTable t;
    tbl.column("PROBENUM").read(t.probenum, 1, n);
    tbl.column("PROBENAME").read(t.probename, 1, n);
    tbl.column("FIB_MRA").read(t.ra, 1, n);
    tbl.column("FIB_MDEC").read(t.dec, 1, n);
    return t;
}

Matrix rows_of(const std::valarray<double>& image, long n_pixel,
               const std::vector<long>& fibres)
{
    Matrix m(static_cast<Eigen::Index>(fibres.size()), n_pixel);
    for (std::size_t r = 0; r < fibres.size(); ++r)
        for (long k = 0; k < n_pixel; ++k)
            m(static_cast<Eigen::Index>(r), k) = image[fibres[r] * n_pixel + k];
    return m;
}

void write_record(CCfits::FITS& f, const FluxCalibrationRecord& record)
{
    try {
        f.deleteExtension(kFluxCalibrationHdu);
    } catch (const CCfits::FITS::NoSuchHDU&) {
        // first calibration of this file
    }

    const long n_pixel = static_cast<long>(record.n_pixel());
    const long n_rows  = static_cast<long>(record.rows.rows());
    std::vector<long> naxes{n_pixel, n_rows};
    CCfits::ExtHDU* hdu = f.addImage(kFluxCalibrationHdu, DOUBLE_IMG, naxes);

    std::valarray<double> buf(static_cast<std::size_t>(n_pixel * n_rows));
    for (long r = 0; r < n_rows; ++r)
        for (long k = 0; k < n_pixel; ++k)
            buf[static_cast<std::size_t>(r * n_pixel + k)] = record.rows(r, k);
    hdu->write(1, static_cast<long>(buf.size()), buf);

    hdu->addKey("PROBENUM", record.probenum,   "Number of the probe containing the star");
    hdu->addKey("STDNAME",  record.star_name,  "Name of standard star");
    hdu->addKey("STDFILE",  record.star_file,  "Filename of standard spectrum");
    hdu->addKey("STDOFF",   record.separation, "Offset (arcsec) to standard star coordinates");
}

FluxCalibrationRecord read_record(CCfits::FITS& f, const std::string& path)
{
    CCfits::ExtHDU* hdu = nullptr;
    try {
        hdu = &f.extension(kFluxCalibrationHdu);
    } catch (const CCfits::FITS::NoSuchHDU&) {
        throw std::runtime_error("no " + std::string(kFluxCalibrationHdu)
                                 + " HDU in " + path);
    }

    std::valarray<double> buf;
    hdu->read(buf);
    const long n_pixel = hdu->axis(0);
    const long n_rows  = hdu->axis(1);

    FluxCalibrationRecord r;
    r.rows.resize(n_rows, n_pixel);
    for (long i = 0; i < n_rows; ++i)
        for (long k = 0; k < n_pixel; ++k)
            r.rows(i, k) = buf[static_cast<std::size_t>(i * n_pixel + k)];

    hdu->readKey("PROBENUM", r.probenum);
    hdu->readKey("STDNAME",  r.star_name);
    hdu->readKey("STDFILE",  r.star_file);
    hdu->readKey("STDOFF",   r.separation);
    return r;
}

[[noreturn]] void rethrow_fits(const std::string& what, const CCfits::FitsException& e)
{
    throw std::runtime_error(what + ": " + e.message());
}

} // unnamed namespace

/* ------------------------------------------------------------------ */
IfuObservation load_ifu(const std::string& path, int probenum)
{
    try {
        CCfits::FITS f(path, CCfits::Read, true);

        CCfits::PHDU& prim = f.pHDU();
        std::valarray<double> flux;
        prim.read(flux);
        const long n_pixel = prim.axis(0);

        double crval = 0, cdelt = 0, crpix = 0;
        prim.readKey("CRVAL1", crval);
        prim.readKey("CDELT1", cdelt);
        prim.readKey("CRPIX1", crpix);

        std::valarray<double> var;
        f.extension("VARIANCE").read(var);
        if (var.size() != flux.size())
            throw std::runtime_error("load_ifu: VARIANCE shape differs from flux in " + path);

        const FibreTable t = read_fibre_table(f);
        std::vector<long> fibres;
        for (std::size_t i = 0; i < t.probenum.size(); ++i)
            if (t.probenum[i] == probenum) fibres.push_back(static_cast<long>(i));
        if (fibres.empty())
            throw std::runtime_error("load_ifu: probe " + std::to_string(probenum)
                                     + " not present in " + path);

        IfuObservation ifu;
        ifu.path     = path;
        ifu.probenum = probenum;
        ifu.data     = rows_of(flux, n_pixel, fibres);
        ifu.variance = rows_of(var,  n_pixel, fibres);

        ifu.wavelength.resize(n_pixel);
        for (long k = 0; k < n_pixel; ++k)
            ifu.wavelength[k] = crval + cdelt * (static_cast<double>(k + 1) - crpix);

        double ra_mean = 0, dec_mean = 0;
        for (long i : fibres) { ra_mean += t.ra[i]; dec_mean += t.dec[i]; }
        ra_mean  /= static_cast<double>(fibres.size());
        dec_mean /= static_cast<double>(fibres.size());

        const double cos_dec = std::cos(dec_mean * boost::math::constants::degree<double>());
        ifu.xfibre.resize(static_cast<Eigen::Index>(fibres.size()));
        ifu.yfibre.resize(static_cast<Eigen::Index>(fibres.size()));
        for (std::size_t r = 0; r < fibres.size(); ++r) {
            const long i = fibres[r];
            ifu.xfibre[r] = -(t.ra[i] - ra_mean) * cos_dec * 3600.0;
            ifu.yfibre[r] =  (t.dec[i] - dec_mean) * 3600.0;
        }

        std::cout << "[FITS] " << path << ": probe " << probenum << ", "
                  << fibres.size() << " fibres x " << n_pixel << " pixels\n";
        return ifu;
    } catch (const CCfits::FitsException& e) {
        rethrow_fits("load_ifu(" + path + ")", e);
    }
}

std::vector<ProbePosition> probe_positions(const std::string& path)
{
    try {
        CCfits::FITS f(path, CCfits::Read);
        const FibreTable t = read_fibre_table(f);

        struct Acc { std::string name; double ra = 0, dec = 0; int n = 0; };
        std::map<int, Acc> acc;
        for (std::size_t i = 0; i < t.probenum.size(); ++i) {
            if (t.probename[i].find("SKY") != std::string::npos) continue;
            Acc& a = acc[t.probenum[i]];
            a.name = t.probename[i];
            a.ra  += t.ra[i];
            a.dec += t.dec[i];
            ++a.n;
        }

        std::vector<ProbePosition> out;
        for (const auto& [num, a] : acc)
            out.push_back({num, a.name, a.ra / a.n, a.dec / a.n});
        return out;
    } catch (const CCfits::FitsException& e) {
        rethrow_fits("probe_positions(" + path + ")", e);
    }
}

void save_extracted_flux(const std::string& path, const FluxCalibrationRecord& record)
{
    FluxCalibrationRecord stored;
    store_extracted(stored, record);
    try {
        CCfits::FITS f(path, CCfits::Write);
        write_record(f, stored);
    } catch (const CCfits::FitsException& e) {
        rethrow_fits("save_extracted_flux(" + path + ")", e);
    }
    std::cout << "[FITS] wrote " << kFluxCalibrationHdu << " to " << path << '\n';
}

FluxCalibrationRecord load_calibration_record(const std::string& path)
{
    try {
        CCfits::FITS f(path, CCfits::Read);
        return read_record(f, path);
    } catch (const CCfits::FitsException& e) {
        rethrow_fits("load_calibration_record(" + path + ")", e);
    }
}

void save_transfer_function(const std::string& path, const Vector& transfer_function)
{
    try {
        CCfits::FITS f(path, CCfits::Write);
        FluxCalibrationRecord record = read_record(f, path);
        store_transfer_function(record, transfer_function);
        write_record(f, record);
    } catch (const CCfits::FitsException& e) {
        rethrow_fits("save_transfer_function(" + path + ")", e);
    }
}

} // namespace fluxcal
