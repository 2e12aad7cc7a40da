#include "fitmodels/Naming.hpp"
#include <utility>

namespace fitmodels {

NamingConvention::NamingConvention(std::string prefix,
                                   std::optional<std::string> suffix)
    : prefix_(std::move(prefix)), suffix_(std::move(suffix))
{}

std::string NamingConvention::compose(const std::string& base) const
{
    return suffix_ ? prefix_ + base + *suffix_ : prefix_ + base;
}

std::vector<std::string>
NamingConvention::compose(const std::vector<std::string>& bases) const
{
    std::vector<std::string> out;
    out.reserve(bases.size());
    for (const auto& b : bases) out.push_back(compose(b));
    return out;
}

} // namespace fitmodels
