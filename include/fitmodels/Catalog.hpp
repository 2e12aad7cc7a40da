#pragma once
#include "Model.hpp"
#include "ModelConfig.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fitmodels {

/* every name accepted by make_model, aliases included */
std::vector<std::string> catalog_names();
bool is_known_shape(const std::string& name);

ModelOptions model_options(const ModelConfig& cfg);

std::unique_ptr<Model> make_model(const ModelConfig& cfg, Parameters& params);

CompositeModel make_composite(const std::vector<ModelConfig>& cfgs,
                              Parameters&                     params);

} // namespace fitmodels
