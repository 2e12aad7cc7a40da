#pragma once
#include "Types.hpp"
#include <optional>
#include <string>

namespace fitmodels {

/*  None  : no checking
 *  Drop  : remove observations where data or x is NaN
 *  Raise : throw MissingDataError on the first NaN                          */
enum class MissingPolicy { None, Drop, Raise };

MissingPolicy parse_missing_policy(const std::string& s);
std::string   to_string(MissingPolicy m);

void apply_missing_policy(MissingPolicy          policy,
                          Vector&                data,
                          std::optional<Vector>& x);

} // namespace fitmodels
