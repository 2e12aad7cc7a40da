#pragma once
#include "Types.hpp"
#include <string>

namespace fitmodels {

struct XYData {
    Vector x;
    Vector y;
};

/* two whitespace separated columns, '#' comments */
XYData load_xy_ascii(const std::string& path);

} // namespace fitmodels
