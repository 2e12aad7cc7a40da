#include "fitmodels/PeakEstimation.hpp"
#include <stdexcept>

namespace fitmodels {

Eigen::Index index_of(const Vector& arr, double val)
{
    if (arr.size() == 0)
        throw std::invalid_argument("index_of(): empty array");

    if (val < arr.minCoeff()) return 0;

    Eigen::Index idx = 0;
    (arr.array() - val).abs().minCoeff(&idx);       // first of equal minima
    return idx;
}

PeakGuess estimate_peak(const Vector&                y,
                        const std::optional<Vector>& x,
                        bool                         negative)
{
    if (!x) return {1.0, 0.0, 1.0};

    if (y.size() == 0)
        throw std::invalid_argument("estimate_peak(): no data");
    if (x->size() != y.size())
        throw std::invalid_argument("estimate_peak(): x and y differ in length");

    const double maxy = y.maxCoeff(), miny = y.minCoeff();
    const double maxx = x->maxCoeff(), minx = x->minCoeff();

    const Eigen::Index iext = index_of(y, negative ? miny : maxy);

    PeakGuess g;
    g.center    = (*x)[iext];
    g.amplitude = (negative ? -1.5 : 1.5) * (maxy - miny);
    g.sigma     = (maxx - minx) / 6.0;

    /* first / last sample beyond half max, in the given sample order */
    const double halfmax = 0.5 * (maxy + miny);
    Eigen::Index first = -1, last = -1, count = 0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        const bool beyond = negative ? y[i] < halfmax : y[i] > halfmax;
        if (!beyond) continue;
        if (first < 0) first = i;
        last = i;
        ++count;
    }
    if (count > 2)
        g.sigma = ((*x)[last] - (*x)[first]) / 2.0;

    return g;
}

} // namespace fitmodels
