#pragma once
#include "Types.hpp"
#include <Eigen/Core>
#include <optional>

namespace fitmodels {

/*
 * Index of the element of `arr` closest to `val`.  A target below every
 * element maps to 0, whatever the distances are.
 */
Eigen::Index index_of(const Vector& arr, double val);

struct PeakGuess {
    double amplitude;
    double center;
    double sigma;
};

/*
 * Starting (amplitude, center, sigma) for a symmetric peak.
 *
 *   amplitude  ±1.5 (max y − min y)
 *   center     x at the max (min, if negative) of y
 *   sigma      (max x − min x) / 6, or half the x-span between the first
 *              and last sample beyond the half-max level if more than two
 *              samples qualify
 *
 * Without x the neutral guess (1, 0, 1) is returned.
 */
PeakGuess estimate_peak(const Vector&                y,
                        const std::optional<Vector>& x,
                        bool                         negative);

} // namespace fitmodels
