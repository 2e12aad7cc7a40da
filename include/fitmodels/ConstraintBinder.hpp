#pragma once
#include "Naming.hpp"
#include "Parameters.hpp"
#include "Shape.hpp"
#include <string>

namespace fitmodels {

/* the expression `spec` describes, with operand names composed */
DerivedExpr derived_expr(const NamingConvention& naming, const DerivedSpec& spec);

/*
 * Register `spec` in `params` with every name composed through `naming`.
 * Returns the composed name of the derived parameter.  The operands must
 * already be registered.
 */
std::string bind_derived(Parameters&             params,
                         const NamingConvention& naming,
                         const DerivedSpec&      spec);

} // namespace fitmodels
