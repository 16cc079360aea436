#include "fluxcal/StandardCatalogue.hpp"
#include "fluxcal/Errors.hpp"
#include <boost/math/constants/constants.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace fluxcal {

namespace {

constexpr double kArcsecPerDegree = 3600.0;

double to_radians(double deg)
{
    return deg * boost::math::constants::degree<double>();
}

bool parse_double(const std::string& token, double& value)
{
    try {
        std::size_t used = 0;
        value = std::stod(token, &used);
        return used == token.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

double sexagesimal(const std::string& a, const std::string& b, const std::string& c,
                   const std::string& line)
{
    double x = 0, y = 0, z = 0;
    if (!parse_double(a, x) || !parse_double(b, y) || !parse_double(c, z))
        throw std::runtime_error("read_catalogue: bad coordinate in line '" + line + "'");
    const double sign = (!a.empty() && a.front() == '-') ? -1.0 : 1.0;
    return sign * (std::abs(x) + y / 60.0 + z / 3600.0);
}

} // unnamed namespace

double angular_separation_arcsec(double ra1, double dec1, double ra2, double dec2)
{
    const double d1 = to_radians(dec1), d2 = to_radians(dec2);
    const double sdd = std::sin(0.5 * (d2 - d1));
    const double sda = std::sin(0.5 * to_radians(ra2 - ra1));
    const double h   = sdd * sdd + std::cos(d1) * std::cos(d2) * sda * sda;
    const double sep = 2.0 * std::asin(std::sqrt(std::min(1.0, h)));
    return sep / boost::math::constants::degree<double>() * kArcsecPerDegree;
}

std::vector<CatalogueEntry> read_catalogue(const std::string& index_path)
{
    std::ifstream in(index_path);
    if (!in)
        throw std::runtime_error("read_catalogue: cannot open " + index_path);

    std::vector<CatalogueEntry> out;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ss(line);
        std::vector<std::string> tok;
        for (std::string t; ss >> t;) tok.push_back(t);
        if (tok.empty() || tok.front().front() == '#') continue;
        if (tok.size() < 8)
            throw std::runtime_error("read_catalogue: short line in " + index_path
                                     + ": '" + line + "'");

        CatalogueEntry e;
        e.file = tok[0];
        e.name = tok[1];
        e.ra   = 15.0 * sexagesimal(tok[2], tok[3], tok[4], line);
        e.dec  = sexagesimal(tok[5], tok[6], tok[7], line);
        out.push_back(std::move(e));
    }
    return out;
}

std::optional<StarMatch>
match_star_coordinates(double ra, double dec, double max_sep_arcsec,
                       const std::vector<std::string>& catalogues)
{
    for (const auto& index_path : catalogues) {
        for (const auto& star : read_catalogue(index_path)) {
            const double sep = angular_separation_arcsec(ra, dec, star.ra, star.dec);
            if (sep < max_sep_arcsec) {
                StarMatch m;
                m.path       = (fs::path(index_path).parent_path() / star.file).string();
                m.name       = star.name;
                m.separation = sep;
                return m;
            }
        }
    }
    return std::nullopt;
}

StarMatch match_standard_star(const std::vector<ProbePosition>& probes,
                              double max_sep_arcsec,
                              const std::vector<std::string>& catalogues)
{
    for (const auto& probe : probes) {
        auto m = match_star_coordinates(probe.ra, probe.dec, max_sep_arcsec, catalogues);
        if (m) {
            m->probenum = probe.probenum;
            std::cout << "[Calib] probe " << probe.probenum << " matches "
                      << m->name << " (" << m->separation << " arcsec)\n";
            return *m;
        }
    }
    throw NoStandardStarFound("no probe lies within "
                              + std::to_string(max_sep_arcsec)
                              + " arcsec of a catalogue star");
}

StandardSpectrum read_standard_spectrum(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("read_standard_spectrum: cannot open " + path);

    std::vector<double> wl, fl;
    bool in_header = true;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ss(line);
        std::string first, second;
        ss >> first;
        double w = 0, f = 0;
        if (in_header) {
            if (!parse_double(first, w)) continue;
            in_header = false;
        }
        if (first.empty()) continue;
        ss >> second;
        if (!parse_double(first, w) || !parse_double(second, f))
            throw std::runtime_error("read_standard_spectrum: bad line in "
                                     + path + ": '" + line + "'");
        wl.push_back(w);
        fl.push_back(f);
    }
    if (wl.empty())
        throw std::runtime_error("read_standard_spectrum: no data in " + path);

    StandardSpectrum s;
    s.wavelength = Eigen::Map<Vector>(wl.data(), static_cast<Eigen::Index>(wl.size()));
    s.flux       = Eigen::Map<Vector>(fl.data(), static_cast<Eigen::Index>(fl.size()));
    return s;
}

} // namespace fluxcal
