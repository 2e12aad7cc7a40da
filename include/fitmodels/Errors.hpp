#pragma once
#include <stdexcept>
#include <string>

namespace fitmodels {

/* independent_vars does not hold exactly one name */
class DimensionalityError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/* polynomial degree is not an integer in [0, kMaxPolyDegree] */
class InvalidDegreeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/* two components of a composite expose the same parameter name */
class ParameterCollisionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* missing == raise and a NaN was found */
class MissingDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace fitmodels
