#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace fluxcal {

// One fibre bundle of one reduced frame.
struct IfuObservation {
    std::string path;
    int         probenum = 0;
    Matrix      data;          // n_fibre × n_pixel
    Matrix      variance;      // n_fibre × n_pixel
    Vector      wavelength;    // n_pixel, Å
    Vector      xfibre;        // arcsec offsets from the bundle centre
    Vector      yfibre;
};

// Wavelength-averaged version of one or more observations of a bundle.
struct ChunkedData {
    Matrix data;               // n_fibre × n_chunk
    Matrix variance;
    Vector wavelength;         // n_chunk, median of each chunk
    Vector xfibre;
    Vector yfibre;
};

constexpr int kDefaultDropPixels = 24;

/*
 * Average `n_chunk` blocks of pixels, skipping `n_drop` pixels at both ends.
 * n_chunk <= 0 selects round((n_pixel - 2 n_drop) / 100).  Flux is the NaN
 * ignoring mean, variance sum(var) / n_finite², wavelength the block median.
 */
ChunkedData chunk_data(const IfuObservation& ifu,
                       int n_drop  = kDefaultDropPixels,
                       int n_chunk = 0);

/* chunk every file and concatenate along the wavelength axis */
ChunkedData read_chunked_data(const std::vector<IfuObservation>& ifus,
                              int n_drop  = kDefaultDropPixels,
                              int n_chunk = 0);

} // namespace fluxcal
