#pragma once
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace fitmodels {

struct Parameter {
    double value  = 0.0;
    bool   frozen = false;
    double lower  = -std::numeric_limits<double>::infinity();
    double upper  =  std::numeric_limits<double>::infinity();
};

/*
 * Structured constraint expression  (operator, operands, constant).
 *
 *     Scale :  constant * operands[0]
 *     Sum   :  constant + operands[0] + operands[1] + ...
 *
 * Operands are exact (composed) parameter names.
 */
struct DerivedExpr {
    enum class Op { Scale, Sum };

    Op                       op       = Op::Scale;
    std::vector<std::string> operands;
    double                   constant = 0.0;

    bool operator==(const DerivedExpr& o) const
    {
        return op == o.op && operands == o.operands && constant == o.constant;
    }
};

/*
 * Name-keyed parameter store shared by any number of models.
 * Derived parameters are evaluated on every read and can not be assigned.
 */
class Parameters {
public:
    /* returns false (and keeps the stored value) if `name` already exists */
    bool add(const std::string& name, double value = 0.0);
    bool add_derived(const std::string& name, const DerivedExpr& expr);

    void set(const std::string& name, double val);
    void set(const std::string& name, double val, bool frozen);
    void set_bounds(const std::string& name, double lower, double upper);

    double value(const std::string& name) const;
    const Parameter& at(const std::string& name) const;
    const DerivedExpr& expression(const std::string& name) const;

    bool contains(const std::string& name) const;
    bool is_derived(const std::string& name) const;

    /* primaries first, then derived, each alphabetical */
    std::vector<std::string> names() const;
    std::size_t size() const { return p_.size() + derived_.size(); }

private:
    Parameter& primary(const std::string& name);

    std::map<std::string, Parameter>   p_;
    std::map<std::string, DerivedExpr> derived_;
};

} // namespace fitmodels
