#pragma once
#include "Types.hpp"
#include <optional>

namespace fitmodels {

/*
 * Least-squares polynomial fit  y ≈ p[0] x^deg + … + p[deg]
 * (highest order first).
 *
 * Returns std::nullopt instead of throwing when the fit can not be trusted:
 * sizes differ, fewer points than coefficients, non-finite input, rank
 * deficient design matrix or non-finite result.
 */
std::optional<Vector> polyfit(const Vector& x, const Vector& y, int degree);

} // namespace fitmodels
