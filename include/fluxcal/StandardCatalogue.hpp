#pragma once
#include "Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fluxcal {

struct CatalogueEntry {
    std::string file;          // spectrum file name, relative to the index
    std::string name;
    double      ra  = 0.0;     // degrees
    double      dec = 0.0;
};

struct StarMatch {
    std::string path;          // full path of the standard spectrum
    std::string name;
    double      separation = 0.0;   // arcsec
    int         probenum   = -1;
};

// Mean position of one non-sky probe.
struct ProbePosition {
    int         probenum = 0;
    std::string probename;
    double      ra  = 0.0;
    double      dec = 0.0;
};

struct StandardSpectrum {
    Vector wavelength;
    Vector flux;
};

/* great-circle distance, degrees in, arcsec out */
double angular_separation_arcsec(double ra1, double dec1, double ra2, double dec2);

// columns: file name RAh RAm RAs Decd Decm Decs
std::vector<CatalogueEntry> read_catalogue(const std::string& index_path);

std::optional<StarMatch>
match_star_coordinates(double ra, double dec, double max_sep_arcsec,
                       const std::vector<std::string>& catalogues);

/*
 * First probe (in the given order) whose mean position falls within
 * `max_sep_arcsec` of a catalogue star.  Throws NoStandardStarFound.
 */
StarMatch match_standard_star(const std::vector<ProbePosition>& probes,
                              double max_sep_arcsec,
                              const std::vector<std::string>& catalogues);

/* two-column text spectrum, leading non-numeric lines skipped */
StandardSpectrum read_standard_spectrum(const std::string& path);

} // namespace fluxcal
