#include "fitmodels/Parameters.hpp"
#include <stdexcept>

namespace fitmodels {

bool Parameters::add(const std::string& name, double value)
{
    if (derived_.count(name))
        throw std::invalid_argument("Parameters::add(): '" + name +
                                    "' is a derived parameter");
    return p_.emplace(name, Parameter{value}).second;
}

bool Parameters::add_derived(const std::string& name, const DerivedExpr& expr)
{
    if (p_.count(name))
        throw std::invalid_argument("Parameters::add_derived(): '" + name +
                                    "' is already a primary parameter");
    if (expr.operands.empty())
        throw std::invalid_argument("Parameters::add_derived(): '" + name +
                                    "' has no operands");
    if (expr.op == DerivedExpr::Op::Scale && expr.operands.size() != 1)
        throw std::invalid_argument("Parameters::add_derived(): Scale of '" +
                                    name + "' takes exactly one operand");

    /* operands must exist already, so no cycle can ever be formed */
    for (const auto& o : expr.operands)
        if (!contains(o))
            throw std::invalid_argument("Parameters::add_derived(): operand '" +
                                        o + "' of '" + name + "' is not registered");

    auto it = derived_.find(name);
    if (it != derived_.end()) {
        if (!(it->second == expr))
            throw std::invalid_argument("Parameters::add_derived(): '" + name +
                                        "' already bound to another expression");
        return false;
    }
    derived_.emplace(name, expr);
    return true;
}

Parameter& Parameters::primary(const std::string& name)
{
    if (derived_.count(name))
        throw std::invalid_argument("'" + name + "' is derived and can not be assigned");
    auto it = p_.find(name);
    if (it == p_.end()) throw std::out_of_range(name);
    return it->second;
}

void Parameters::set(const std::string& name, double val)
{
    primary(name).value = val;
}

void Parameters::set(const std::string& name, double val, bool frozen)
{
    Parameter& p = primary(name);
    p.value  = val;
    p.frozen = frozen;
}

void Parameters::set_bounds(const std::string& name, double lower, double upper)
{
    if (lower > upper)
        throw std::invalid_argument("set_bounds(): lower > upper for '" + name + "'");
    Parameter& p = primary(name);
    p.lower = lower;
    p.upper = upper;
}

double Parameters::value(const std::string& name) const
{
    auto it = p_.find(name);
    if (it != p_.end()) return it->second.value;

    const DerivedExpr& e = expression(name);
    switch (e.op) {
    case DerivedExpr::Op::Scale:
        return e.constant * value(e.operands.front());
    case DerivedExpr::Op::Sum: {
        double s = e.constant;
        for (const auto& o : e.operands) s += value(o);
        return s;
    }
    }
    throw std::logic_error("Parameters::value(): unhandled operator");
}

const Parameter& Parameters::at(const std::string& name) const
{
    auto it = p_.find(name);
    if (it == p_.end()) throw std::out_of_range(name);
    return it->second;
}

const DerivedExpr& Parameters::expression(const std::string& name) const
{
    auto it = derived_.find(name);
    if (it == derived_.end()) throw std::out_of_range(name);
    return it->second;
}

bool Parameters::contains(const std::string& name) const
{
    return p_.count(name) || derived_.count(name);
}

bool Parameters::is_derived(const std::string& name) const
{
    return derived_.count(name) != 0;
}

std::vector<std::string> Parameters::names() const
{
    std::vector<std::string> out;
    out.reserve(size());
    for (const auto& kv : p_)       out.push_back(kv.first);
    for (const auto& kv : derived_) out.push_back(kv.first);
    return out;
}

} // namespace fitmodels
