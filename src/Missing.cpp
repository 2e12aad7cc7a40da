#include "fitmodels/Missing.hpp"
#include "fitmodels/Errors.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fitmodels {

MissingPolicy parse_missing_policy(const std::string& s)
{
    if (s.empty() || s == "none") return MissingPolicy::None;
    if (s == "drop")              return MissingPolicy::Drop;
    if (s == "raise")             return MissingPolicy::Raise;
    throw std::invalid_argument("unknown missing-data policy '" + s +
                                "' (expected none, drop or raise)");
}

std::string to_string(MissingPolicy m)
{
    switch (m) {
    case MissingPolicy::None:  return "none";
    case MissingPolicy::Drop:  return "drop";
    case MissingPolicy::Raise: return "raise";
    }
    return "none";
}

void apply_missing_policy(MissingPolicy          policy,
                          Vector&                data,
                          std::optional<Vector>& x)
{
    if (policy == MissingPolicy::None) return;

    const bool has_x = x && x->size() == data.size();
    auto is_missing = [&](Eigen::Index i) {
        return std::isnan(data[i]) || (has_x && std::isnan((*x)[i]));
    };

    if (policy == MissingPolicy::Raise) {
        for (Eigen::Index i = 0; i < data.size(); ++i)
            if (is_missing(i))
                throw MissingDataError("missing value (NaN) at index " +
                                       std::to_string(i));
        return;
    }

    std::vector<Eigen::Index> keep;
    keep.reserve(data.size());
    for (Eigen::Index i = 0; i < data.size(); ++i)
        if (!is_missing(i)) keep.push_back(i);

    if (static_cast<Eigen::Index>(keep.size()) == data.size()) return;

    Vector d(keep.size());
    Vector xv(has_x ? keep.size() : 0);
    for (std::size_t k = 0; k < keep.size(); ++k) {
        d[k] = data[keep[k]];
        if (has_x) xv[k] = (*x)[keep[k]];
    }
    data = std::move(d);
    if (has_x) x = std::move(xv);
}

} // namespace fitmodels
