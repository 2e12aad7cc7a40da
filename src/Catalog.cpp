#include "fitmodels/Catalog.hpp"
#include "fitmodels/Errors.hpp"
#include "fitmodels/Models.hpp"
#include <functional>
#include <map>
#include <stdexcept>
#include <utility>

namespace fitmodels {

namespace {

using Factory = std::function<std::unique_ptr<Model>(const ModelConfig&,
                                                     Parameters&,
                                                     const ModelOptions&)>;

template<typename M>
Factory simple()
{
    return [](const ModelConfig&, Parameters& p, const ModelOptions& o) {
        return std::make_unique<M>(p, o);
    };
}

const std::map<std::string, Factory>& registry()
{
    static const std::map<std::string, Factory> reg = {
        {"constant",    simple<ConstantModel>()},
        {"linear",      simple<LinearModel>()},
        {"quadratic",   simple<QuadraticModel>()},
        {"parabolic",   simple<ParabolicModel>()},
        {"gaussian",    simple<GaussianModel>()},
        {"lorentzian",  simple<LorentzianModel>()},
        {"voigt",       simple<VoigtModel>()},
        {"powerlaw",    simple<PowerLawModel>()},
        {"exponential", simple<ExponentialModel>()},
        {"polynomial",
         [](const ModelConfig& c, Parameters& p, const ModelOptions& o)
             -> std::unique_ptr<Model> {
             if (!c.degree)
                 throw InvalidDegreeError("polynomial model requires a degree");
             return std::make_unique<PolynomialModel>(*c.degree, p, o);
         }},
    };
    return reg;
}

} // unnamed namespace

std::vector<std::string> catalog_names()
{
    std::vector<std::string> out;
    for (const auto& kv : registry()) out.push_back(kv.first);
    return out;
}

bool is_known_shape(const std::string& name)
{
    return registry().count(name) != 0;
}

ModelOptions model_options(const ModelConfig& cfg)
{
    ModelOptions o;
    o.prefix           = cfg.prefix;
    o.suffix           = cfg.suffix;
    o.independent_vars = cfg.independent_vars;
    o.missing          = cfg.missing;
    return o;
}

std::unique_ptr<Model> make_model(const ModelConfig& cfg, Parameters& params)
{
    auto it = registry().find(cfg.shape);
    if (it == registry().end())
        throw std::invalid_argument("unknown model shape '" + cfg.shape + "'");
    return it->second(cfg, params, model_options(cfg));
}

CompositeModel make_composite(const std::vector<ModelConfig>& cfgs,
                              Parameters&                     params)
{
    std::vector<ModelPtr> parts;
    parts.reserve(cfgs.size());
    for (const auto& c : cfgs) parts.emplace_back(make_model(c, params));
    return CompositeModel(std::move(parts));
}

} // namespace fitmodels
