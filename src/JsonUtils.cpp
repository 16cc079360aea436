#include "fluxcal/JsonUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace fluxcal {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("load_json: cannot open " + path);
    nlohmann::json j;
    f >> j;
    return j;
}

std::vector<std::string> default_config_paths()
{
    std::vector<std::string> paths = {"global_settings.json"};

    std::error_code ec;
    const auto exe_path = std::filesystem::canonical("/proc/self/exe", ec);
    if (!ec)
        paths.push_back((exe_path.parent_path() / "global_settings.json").string());

    paths.push_back("../global_settings.json");
    return paths;
}

nlohmann::json load_global_config(const std::vector<std::string>& search_paths)
{
    for (const auto& path : search_paths) {
        if (!std::filesystem::exists(path)) continue;
        std::ifstream file(path);
        if (!file.is_open()) continue;
        try {
            nlohmann::json config;
            file >> config;
            std::cout << "Loaded config from: " << path << std::endl;
            return config;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "Error parsing JSON from " << path << ": " << e.what() << std::endl;
        }
    }
    std::cout << "No global_settings.json found, using built-in defaults\n";
    return nlohmann::json::object();
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

Settings settings_from_json(const nlohmann::json& j)
{
    Settings s;
    if (!j.is_object()) return s;

    if (j.contains("catalogues"))
        s.catalogues = j["catalogues"].get<std::vector<std::string>>();
    s.max_separation_arcsec = j.value("maxSeparationArcsec", s.max_separation_arcsec);
    if (j.contains("model"))
        s.model = parse_model_variant(j["model"].get<std::string>());
    s.n_drop         = j.value("nDrop",         s.n_drop);
    s.n_chunk        = j.value("nChunk",        s.n_chunk);
    s.smooth         = j.value("smooth",        s.smooth);
    s.smooth_width   = j.value("smoothWidth",   s.smooth_width);
    s.max_iterations = j.value("maxIterations", s.max_iterations);
    s.verbose        = j.value("verbose",       s.verbose);
    return s;
}

} // namespace fluxcal
