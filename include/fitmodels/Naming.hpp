#pragma once
#include <optional>
#include <string>
#include <vector>

namespace fitmodels {

/*
 * Exposed parameter name:
 *
 *     prefix + base            (no suffix)
 *     prefix + base + suffix
 */
class NamingConvention {
public:
    explicit NamingConvention(std::string                prefix = {},
                              std::optional<std::string> suffix = std::nullopt);

    std::string compose(const std::string& base) const;
    std::vector<std::string> compose(const std::vector<std::string>& bases) const;

    const std::string&                prefix() const { return prefix_; }
    const std::optional<std::string>& suffix() const { return suffix_; }

private:
    std::string                prefix_;
    std::optional<std::string> suffix_;
};

} // namespace fitmodels
