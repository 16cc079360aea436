#pragma once
#include <stdexcept>
#include <string>

namespace fluxcal {

// Raised wherever a PSF model variant is dispatched on and the value is not
// one of the three known parameterisations.
class UnknownModelVariant : public std::runtime_error {
public:
    explicit UnknownModelVariant(const std::string& name)
        : std::runtime_error("Unrecognised model name: " + name) {}
};

// No fibre bundle of a frame lies within the matching radius of any
// catalogue standard.
class NoStandardStarFound : public std::runtime_error {
public:
    explicit NoStandardStarFound(const std::string& where)
        : std::runtime_error("No standard star found in the data: " + where) {}
};

} // namespace fluxcal
