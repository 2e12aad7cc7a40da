#include "fitmodels/ConstraintBinder.hpp"

namespace fitmodels {

DerivedExpr derived_expr(const NamingConvention& naming, const DerivedSpec& spec)
{
    DerivedExpr expr;
    expr.op       = spec.op;
    expr.operands = naming.compose(spec.operand_bases);
    expr.constant = spec.factor;
    return expr;
}

std::string bind_derived(Parameters&             params,
                         const NamingConvention& naming,
                         const DerivedSpec&      spec)
{
    std::string name = naming.compose(spec.name);
    params.add_derived(name, derived_expr(naming, spec));
    return name;
}

} // namespace fitmodels
