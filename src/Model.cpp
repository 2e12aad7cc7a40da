#include "fitmodels/Model.hpp"
#include "fitmodels/ConstraintBinder.hpp"
#include "fitmodels/Errors.hpp"
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace fitmodels {

static void validate_1d(const std::vector<std::string>& independent_vars)
{
    if (independent_vars.size() != 1)
        throw DimensionalityError(
            "This model requires exactly one independent variable (got " +
            std::to_string(independent_vars.size()) + ").");
}

Model::Model(Shape shape, Parameters& params, const ModelOptions& opts)
    : shape_(std::move(shape))
    , params_(&params)
    , naming_(opts.prefix, opts.suffix)
    , independent_vars_(opts.independent_vars)
    , missing_(opts.missing)
{
    validate_1d(independent_vars_);

    if (!shape_.defaults.empty() &&
        shape_.defaults.size() != shape_.param_names.size())
        throw std::logic_error("shape '" + shape_.name +
                               "': defaults do not match parameter names");

    /* check every name before the store is touched */
    for (const auto& n : param_names())
        if (params_->is_derived(n))
            throw std::invalid_argument("'" + n + "' is already a derived parameter");

    if (shape_.derived) {
        const std::string d = naming_.compose(shape_.derived->name);
        if (params_->contains(d) && !params_->is_derived(d))
            throw std::invalid_argument("'" + d + "' is already a primary parameter");
        if (params_->is_derived(d) &&
            !(params_->expression(d) == derived_expr(naming_, *shape_.derived)))
            throw std::invalid_argument("'" + d +
                                        "' already bound to another expression");
    }

    for (std::size_t i = 0; i < shape_.param_names.size(); ++i) {
        const double v0 = shape_.defaults.empty() ? 0.0 : shape_.defaults[i];
        params_->add(param_name(shape_.param_names[i]), v0);
    }

    if (shape_.derived)
        bind_derived(*params_, naming_, *shape_.derived);
}

std::string Model::param_name(const std::string& base) const
{
    return naming_.compose(base);
}

std::vector<std::string> Model::param_names() const
{
    return naming_.compose(shape_.param_names);
}

std::optional<std::string> Model::derived_name() const
{
    if (!shape_.derived) return std::nullopt;
    return naming_.compose(shape_.derived->name);
}

Vector Model::eval(const Vector& x) const
{
    std::vector<double> p;
    p.reserve(shape_.param_names.size());
    for (const auto& base : shape_.param_names)
        p.push_back(params_->value(param_name(base)));
    return shape_.formula(x, p);
}

void Model::guess_starting_values(Vector                data,
                                  std::optional<Vector> x,
                                  const GuessOptions&   opt)
{
    if (x && x->size() != data.size())
        throw std::invalid_argument(
            "guess_starting_values(): " + independent_var() + " has " +
            std::to_string(x->size()) + " values, data has " +
            std::to_string(data.size()));

    apply_missing_policy(missing_, data, x);
    if (data.size() == 0)
        throw std::invalid_argument("guess_starting_values(): no data");

    const GuessResult g = guess(data, x, opt);

    for (const auto& base : shape_.param_names)
        if (!g.count(base))
            throw std::logic_error("shape '" + shape_.name +
                                   "': guess left '" + base + "' unset");

    for (const auto& [base, v] : g)
        params_->set(param_name(base), v);

    if (opt.verbose) {
        std::cout << "[guess] " << shape_.name;
        for (const auto& base : shape_.param_names)
            std::cout << "  " << param_name(base) << '=' << g.at(base);
        if (auto d = derived_name())
            std::cout << "  " << *d << '=' << params_->value(*d) << " (derived)";
        std::cout << '\n';
    }

    has_initial_guess_ = true;
}

/* ------------------------------------------------------------------ */

CompositeModel::CompositeModel(std::vector<ModelPtr> components)
    : components_(std::move(components))
{
    if (components_.empty())
        throw std::invalid_argument("CompositeModel: no components");

    std::set<std::string> seen;
    for (const auto& m : components_) {
        if (!m) throw std::invalid_argument("CompositeModel: null component");
        if (&m->params() != &components_.front()->params())
            throw std::invalid_argument(
                "CompositeModel: components use different parameter stores");

        std::vector<std::string> names = m->param_names();
        if (auto d = m->derived_name()) names.push_back(*d);
        for (const auto& n : names)
            if (!seen.insert(n).second)
                throw ParameterCollisionError(
                    "CompositeModel: parameter '" + n +
                    "' is exposed by more than one component; use distinct "
                    "prefix/suffix");
    }
}

Vector CompositeModel::eval(const Vector& x) const
{
    Vector out = Vector::Zero(x.size());
    for (const auto& m : components_) out += m->eval(x);
    return out;
}

std::vector<std::string> CompositeModel::param_names() const
{
    std::vector<std::string> out;
    for (const auto& m : components_) {
        auto n = m->param_names();
        out.insert(out.end(), n.begin(), n.end());
    }
    return out;
}

} // namespace fitmodels
