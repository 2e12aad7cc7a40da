#include "fitmodels/ModelConfig.hpp"
#include "fitmodels/Errors.hpp"
#include <fstream>
#include <stdexcept>

namespace fitmodels {

ModelConfig model_config_from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw std::invalid_argument("model config must be a JSON object");
    if (!j.contains("shape"))
        throw std::invalid_argument("model config: missing \"shape\"");

    ModelConfig c;
    c.shape  = j["shape"].get<std::string>();
    c.prefix = j.value("prefix", std::string{});

    if (j.contains("suffix") && !j["suffix"].is_null())
        c.suffix = j["suffix"].get<std::string>();

    if (j.contains("independent_vars"))
        c.independent_vars = j["independent_vars"].get<std::vector<std::string>>();

    /* null is the "no checking" policy */
    if (j.contains("missing") && !j["missing"].is_null())
        c.missing = parse_missing_policy(j["missing"].get<std::string>());

    if (j.contains("degree")) {
        if (!j["degree"].is_number())
            throw InvalidDegreeError("degree must be a number");
        c.degree = j["degree"].get<double>();
    }

    c.negative = j.value("negative", false);
    return c;
}

std::vector<ModelConfig> model_configs_from_json(const nlohmann::json& j)
{
    std::vector<ModelConfig> out;
    if (j.is_object() && j.contains("models")) {
        if (!j["models"].is_array())
            throw std::invalid_argument("\"models\" must be an array");
        for (const auto& m : j["models"]) out.push_back(model_config_from_json(m));
    } else {
        out.push_back(model_config_from_json(j));
    }
    return out;
}

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot open: " + path);

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Error parsing JSON from " + path + ": " + e.what());
    }
    return j;
}

} // namespace fitmodels
