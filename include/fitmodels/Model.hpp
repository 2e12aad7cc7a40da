#pragma once
#include "Missing.hpp"
#include "Naming.hpp"
#include "Parameters.hpp"
#include "Shape.hpp"
#include "Types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fitmodels {

struct ModelOptions {
    std::string                prefix;
    std::optional<std::string> suffix;
    std::vector<std::string>   independent_vars{"x"};
    MissingPolicy              missing = MissingPolicy::None;
};

struct GuessOptions {
    bool negative = false;      // peak shapes: fit a dip instead of a peak
    bool verbose  = false;      // print the guessed values
};

/* base name -> starting value */
using GuessResult = std::map<std::string, double>;

/*
 * A Shape bound to a naming configuration and to an externally owned
 * parameter store.  Construction registers the primary parameters (with
 * the shape defaults) and the derived parameter, if the shape has one.
 */
class Model {
public:
    Model(Shape shape, Parameters& params, const ModelOptions& opts = {});
    virtual ~Model() = default;

    Model(const Model&)            = delete;
    Model& operator=(const Model&) = delete;

    const Shape&            shape()  const { return shape_; }
    const std::string&      name()   const { return shape_.name; }
    const NamingConvention& naming() const { return naming_; }
    const std::string&      prefix() const { return naming_.prefix(); }
    const std::string&      independent_var() const { return independent_vars_.front(); }
    MissingPolicy           missing() const { return missing_; }

    std::string                param_name(const std::string& base) const;
    std::vector<std::string>   param_names() const;
    std::optional<std::string> derived_name() const;

    Parameters& params() const { return *params_; }

    /* evaluate with the values currently held by the store */
    Vector eval(const Vector& x) const;

    /*
     * Apply the missing-data policy, run the shape guess procedure and write
     * every primary parameter into the store.  May be called repeatedly.
     */
    void guess_starting_values(Vector                data,
                               std::optional<Vector> x   = std::nullopt,
                               const GuessOptions&   opt = {});

    bool has_initial_guess() const { return has_initial_guess_; }

protected:
    virtual GuessResult guess(const Vector&                data,
                              const std::optional<Vector>& x,
                              const GuessOptions&          opt) const = 0;

private:
    Shape                    shape_;
    Parameters*              params_;
    NamingConvention         naming_;
    std::vector<std::string> independent_vars_;
    MissingPolicy            missing_;
    bool                     has_initial_guess_ = false;
};

using ModelPtr = std::shared_ptr<Model>;

/*
 * Sum of several models sharing one parameter store.  Parameter names of
 * the components must be disjoint.
 */
class CompositeModel {
public:
    explicit CompositeModel(std::vector<ModelPtr> components);

    Vector eval(const Vector& x) const;
    std::vector<std::string> param_names() const;

    const std::vector<ModelPtr>& components() const { return components_; }
    Parameters& params() const { return components_.front()->params(); }

private:
    std::vector<ModelPtr> components_;
};

} // namespace fitmodels
