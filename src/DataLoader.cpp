#include "fitmodels/DataLoader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fitmodels {

XYData load_xy_ascii(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot open: " + path);

    std::vector<Real> xs, ys;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        std::istringstream iss(line);
        Real a, b;
        std::string rest;
        const bool ok = static_cast<bool>(iss >> a >> b);
        if (ok) std::getline(iss, rest);
        const auto tail = rest.find_first_not_of(" \t\r");
        if (!ok || (tail != std::string::npos && rest[tail] != '#'))
            throw std::runtime_error(path + ":" + std::to_string(lineno) +
                                     ": expected two numeric columns");
        xs.push_back(a);
        ys.push_back(b);
    }

    XYData d;
    d.x = Eigen::Map<Vector>(xs.data(), xs.size());
    d.y = Eigen::Map<Vector>(ys.data(), ys.size());
    return d;
}

} // namespace fitmodels
