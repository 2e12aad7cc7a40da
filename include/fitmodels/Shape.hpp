#pragma once
#include "Parameters.hpp"
#include "Types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fitmodels {

/* values are passed in the order of Shape::param_names */
using Formula = std::function<Vector(const Vector& x, const std::vector<double>& p)>;

/* derived parameter, e.g.  fwhm = 2.354820 * sigma  */
struct DerivedSpec {
    std::string              name;
    DerivedExpr::Op          op = DerivedExpr::Op::Scale;
    std::vector<std::string> operand_bases;
    double                   factor = 1.0;
};

/* immutable description of one model family */
struct Shape {
    std::string                name;
    Formula                    formula;
    std::vector<std::string>   param_names;
    std::vector<double>        defaults;     // same size as param_names
    std::optional<DerivedSpec> derived;
};

} // namespace fitmodels
