#include "fluxcal/JsonUtils.hpp"
#include "fluxcal/PsfParameters.hpp"
#include "fluxcal/Workflow.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <fstream>
#include <iostream>

using namespace fluxcal;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("fluxcal", "Transfer function from IFU standard star frames");
        opts.add_options()
            ("config",  "Settings JSON (default: search for global_settings.json)", cxxopts::value<std::string>())
            ("model",   "PSF model (full, circular, circular_atm)", cxxopts::value<std::string>())
            ("summary", "Write a JSON summary to this path", cxxopts::value<std::string>())
            ("verbose", "Print every solver iteration")
            ("files",   "Reduced FITS frames of one standard star", cxxopts::value<std::vector<std::string>>())
            ("h,help",  "Show help");
        opts.parse_positional({"files"});
        opts.positional_help("<fits files...>");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("files")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        nlohmann::json cfg;
        if (cli.count("config")) {
            cfg = load_json(cli["config"].as<std::string>());
            std::cout << "Loaded config from: " << cli["config"].as<std::string>() << '\n';
        } else {
            cfg = load_global_config();
        }
        expand_env(cfg);
        Settings settings = settings_from_json(cfg);
        if (cli.count("model"))
            settings.model = parse_model_variant(cli["model"].as<std::string>());
        if (cli.count("verbose"))
            settings.verbose = true;

        const auto files = cli["files"].as<std::vector<std::string>>();
        CalibrationSummary summary = derive_transfer_function(files, settings);

        if (cli.count("summary")) {
            const std::string out_path = cli["summary"].as<std::string>();
            std::ofstream out(out_path);
            if (!out)
                throw std::runtime_error("cannot write summary to " + out_path);
            out << to_json(summary).dump(2) << '\n';
            std::cout << "Summary written to " << out_path << '\n';
        }

        std::cout << "\nFlux calibration completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time).count();

    int minutes = static_cast<int>(duration / 60);
    int seconds = static_cast<int>(duration % 60);

    std::cout << "\nTook: ";
    if (minutes > 0) std::cout << minutes << "m ";
    std::cout << seconds << "s\n";

    return 0;
}
