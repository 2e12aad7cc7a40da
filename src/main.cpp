#include "fitmodels/Catalog.hpp"
#include "fitmodels/DataLoader.hpp"
#include "fitmodels/ModelConfig.hpp"
#include "fitmodels/Parameters.hpp"
#include <cxxopts.hpp>
#include <iomanip>
#include <iostream>

using namespace fitmodels;

static std::vector<ModelConfig> configs_from_cli(const cxxopts::ParseResult& cli)
{
    if (cli.count("config")) {
        auto cfgs = model_configs_from_json(load_json(cli["config"].as<std::string>()));
        if (cli.count("verbose"))
            std::cout << "[config] " << cfgs.size() << " model(s) from "
                      << cli["config"].as<std::string>() << '\n';
        return cfgs;
    }

    ModelConfig c;
    c.shape    = cli["model"].as<std::string>();
    c.prefix   = cli["prefix"].as<std::string>();
    c.negative = cli.count("negative") > 0;
    c.missing  = parse_missing_policy(cli["missing"].as<std::string>());
    if (cli.count("suffix")) c.suffix = cli["suffix"].as<std::string>();
    if (cli.count("degree")) c.degree = cli["degree"].as<double>();
    return {c};
}

int main(int argc, char** argv)
{
    try {
        cxxopts::Options opts("fitmodels_guess",
                              "Starting values for named curve-fitting models");
        opts.add_options()
            ("data",     "Two-column ASCII data file (x y)", cxxopts::value<std::string>())
            ("model",    "Model shape name", cxxopts::value<std::string>())
            ("config",   "JSON model configuration", cxxopts::value<std::string>())
            ("prefix",   "Parameter name prefix", cxxopts::value<std::string>()->default_value(""))
            ("suffix",   "Parameter name suffix", cxxopts::value<std::string>())
            ("degree",   "Polynomial degree", cxxopts::value<double>())
            ("missing",  "Missing data policy: none, drop, raise",
                         cxxopts::value<std::string>()->default_value("none"))
            ("negative", "Guess a dip instead of a peak")
            ("list",     "List the known model shapes")
            ("v,verbose","Print guess diagnostics")
            ("h,help",   "Show help");

        auto cli = opts.parse(argc, argv);

        if (cli.count("list")) {
            for (const auto& n : catalog_names()) std::cout << n << '\n';
            return 0;
        }
        if (cli.count("help") || !cli.count("data") ||
            (!cli.count("model") && !cli.count("config")))
        {
            std::cout << opts.help() << '\n';
            return 0;
        }

        const XYData data = load_xy_ascii(cli["data"].as<std::string>());
        if (cli.count("verbose"))
            std::cout << "[config] " << data.x.size() << " points loaded\n";

        const auto cfgs = configs_from_cli(cli);

        Parameters params;
        CompositeModel model = make_composite(cfgs, params);

        GuessOptions gopt;
        gopt.verbose = cli.count("verbose") > 0;
        for (std::size_t i = 0; i < cfgs.size(); ++i) {
            gopt.negative = cfgs[i].negative;
            model.components()[i]->guess_starting_values(data.y, data.x, gopt);
        }

        std::cout << std::left << std::setw(20) << "parameter"
                  << std::right << std::setw(16) << "value" << '\n';
        for (const auto& n : params.names()) {
            std::cout << std::left << std::setw(20) << n
                      << std::right << std::setw(16) << std::setprecision(8)
                      << params.value(n);
            if (params.is_derived(n)) std::cout << "  (derived)";
            std::cout << '\n';
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
