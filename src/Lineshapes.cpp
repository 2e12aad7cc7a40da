#include "fitmodels/Lineshapes.hpp"
#include <boost/math/constants/constants.hpp>
#include <boost/math/tools/rational.hpp>
#include <cmath>

namespace fitmodels {

namespace bmc = boost::math::constants;

Vector constant(const Vector& x, double c)
{
    return Vector::Constant(x.size(), c);
}

Vector linear(const Vector& x, double slope, double intercept)
{
    return (slope * x.array() + intercept).matrix();
}

Vector parabolic(const Vector& x, double a, double b, double c)
{
    return (a * x.array().square() + b * x.array() + c).matrix();
}

Vector polynomial(const Vector& x, const std::vector<double>& coeffs)
{
    Vector out = Vector::Zero(x.size());
    if (coeffs.empty()) return out;
    for (Eigen::Index i = 0; i < x.size(); ++i)
        out[i] = boost::math::tools::evaluate_polynomial(coeffs.data(), x[i],
                                                         coeffs.size());
    return out;
}

Vector gaussian(const Vector& x, double amplitude, double center, double sigma)
{
    const double norm = amplitude / (bmc::root_two_pi<double>() * sigma);
    return (norm * (-(x.array() - center).square() / (2.0 * sigma * sigma)).exp())
        .matrix();
}

Vector lorentzian(const Vector& x, double amplitude, double center, double sigma)
{
    const double norm = amplitude / (bmc::pi<double>() * sigma);
    return (norm * (1.0 + ((x.array() - center) / sigma).square()).inverse()).matrix();
}

Vector voigt(const Vector& x, double amplitude, double center, double sigma,
             std::optional<double> gamma)
{
    const double g     = gamma.value_or(sigma);
    const double denom = sigma * bmc::root_two<double>();
    const double norm  = amplitude / (sigma * bmc::root_two_pi<double>());

    Vector out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        const std::complex<double> z((x[i] - center) / denom, g / denom);
        out[i] = norm * faddeeva(z).real();
    }
    return out;
}

Vector exponential(const Vector& x, double amplitude, double decay)
{
    return (amplitude * (-x.array() / decay).exp()).matrix();
}

Vector powerlaw(const Vector& x, double amplitude, double exponent)
{
    return (amplitude * x.array().pow(exponent)).matrix();
}

/*
 * Humlicek (1982) region-wise rational approximation, |error| < 1e-4.
 * Uses t = y - i x  for  z = x + i y.
 */
std::complex<double> faddeeva(std::complex<double> z)
{
    using C = std::complex<double>;
    const double x  = z.real();
    const double y  = z.imag();
    const double ax = std::abs(x);
    const C      t(y, -x);
    const double s  = ax + y;

    if (s >= 15.0)
        return t * 0.5641896 / (0.5 + t * t);

    if (s >= 5.5) {
        const C u = t * t;
        return t * (1.410474 + u * 0.5641896) / (0.75 + u * (3.0 + u));
    }

    if (y >= 0.195 * ax - 0.176)
        return (16.4955 + t * (20.20933 + t * (11.96482 + t * (3.778987 + t * 0.5642236)))) /
               (16.4955 + t * (38.82363 + t * (39.27121 + t * (21.69274 + t * (6.699398 + t)))));

    const C u = t * t;
    return std::exp(u) -
           t * (36183.31 - u * (3321.9905 - u * (1540.787 - u * (219.0313 - u *
               (35.76683 - u * (1.320522 - u * 0.56419)))))) /
               (32066.6 - u * (24322.84 - u * (9022.228 - u * (2186.181 - u *
               (364.2191 - u * (61.57037 - u * (1.841439 - u)))))));
}

} // namespace fitmodels
