#pragma once
#include "Types.hpp"
#include <complex>
#include <optional>
#include <vector>

namespace fitmodels {

Vector constant   (const Vector& x, double c);
Vector linear     (const Vector& x, double slope, double intercept);
Vector parabolic  (const Vector& x, double a, double b, double c);

/* sum_i coeffs[i] * x^i  (ascending order) */
Vector polynomial (const Vector& x, const std::vector<double>& coeffs);

Vector gaussian   (const Vector& x, double amplitude, double center, double sigma);
Vector lorentzian (const Vector& x, double amplitude, double center, double sigma);

/* gamma defaults to sigma */
Vector voigt      (const Vector& x, double amplitude, double center, double sigma,
                   std::optional<double> gamma = std::nullopt);

Vector exponential(const Vector& x, double amplitude, double decay);
Vector powerlaw   (const Vector& x, double amplitude, double exponent);

/* Faddeeva function w(z) = exp(-z^2) erfc(-iz), Im z >= 0 */
std::complex<double> faddeeva(std::complex<double> z);

} // namespace fitmodels
