#pragma once
#include "Missing.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fitmodels {

/*
 * One model instance as described in a JSON configuration:
 *
 *   { "shape": "gaussian", "prefix": "p1_", "suffix": null,
 *     "independent_vars": ["x"], "missing": "drop", "negative": false }
 *
 * "degree" is only read for the polynomial shape.
 */
struct ModelConfig {
    std::string                shape;
    std::string                prefix;
    std::optional<std::string> suffix;
    std::vector<std::string>   independent_vars{"x"};
    MissingPolicy              missing  = MissingPolicy::None;
    std::optional<double>      degree;
    bool                       negative = false;
};

ModelConfig model_config_from_json(const nlohmann::json& j);

/* a single object, or { "models": [ … ] } */
std::vector<ModelConfig> model_configs_from_json(const nlohmann::json& j);

nlohmann::json load_json(const std::string& path);

} // namespace fitmodels
