#pragma once
#include "PsfParameters.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fluxcal {

nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

// Working directory, executable directory, then the build tree's parent.
std::vector<std::string> default_config_paths();

// First global_settings.json on the list that parses; an empty object if none does.
nlohmann::json load_global_config(const std::vector<std::string>& search_paths
                                      = default_config_paths());

struct Settings {
    std::vector<std::string> catalogues = {
        "./standards/ESO/ESOstandards.dat",
        "./standards/Bessell/Bessellstandards.dat"
    };
    double       max_separation_arcsec = 30.0;
    ModelVariant model          = ModelVariant::Circular;
    int          n_drop         = 24;
    int          n_chunk        = 0;     // 0: choose from the spectrum length
    bool         smooth         = true;
    double       smooth_width   = 10.0;
    int          max_iterations = 200;
    bool         verbose        = false;
};

// Missing keys keep their defaults.
Settings settings_from_json(const nlohmann::json& j);

} // namespace fluxcal
