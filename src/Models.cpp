#include "fitmodels/Models.hpp"
#include "fitmodels/Errors.hpp"
#include "fitmodels/Lineshapes.hpp"
#include "fitmodels/PeakEstimation.hpp"
#include "fitmodels/Regression.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace fitmodels {

namespace {

constexpr double kPowerLawLogOffset = 1e-14;
constexpr double kExpLogOffset      = 1e-15;
constexpr double kFallbackOffset    = 1e-9;
constexpr double kMinSlope          = 1e-12;     // |slope| below: decay undefined

void log_fallback(const GuessOptions& opt, const std::string& shape,
                  const char* why)
{
    if (opt.verbose)
        std::cout << "[guess] " << shape << ": " << why
                  << ", using fallback values\n";
}

Shape peak_shape(const char* name, double fwhm_factor, Formula f)
{
    Shape s;
    s.name        = name;
    s.formula     = std::move(f);
    s.param_names = {"amplitude", "center", "sigma"};
    s.defaults    = {1.0, 0.0, 1.0};
    s.derived     = DerivedSpec{"fwhm", DerivedExpr::Op::Scale, {"sigma"}, fwhm_factor};
    return s;
}

} // unnamed namespace

int validate_degree(double deg)
{
    if (!std::isfinite(deg) || std::floor(deg) != deg ||
        deg < 0.0 || deg > kMaxPolyDegree)
    {
        std::ostringstream msg;
        msg << "degree must be an integer in [0, " << kMaxPolyDegree
            << "] (got " << deg << ")";
        throw InvalidDegreeError(msg.str());
    }
    return static_cast<int>(deg);
}

/* ------------------------------------------------------------------ */
/*  shapes                                                             */
/* ------------------------------------------------------------------ */
Shape constant_shape()
{
    return {"constant",
            [](const Vector& x, const std::vector<double>& p) {
                return constant(x, p[0]);
            },
            {"c"}, {0.0}, std::nullopt};
}

Shape linear_shape()
{
    return {"linear",
            [](const Vector& x, const std::vector<double>& p) {
                return linear(x, p[0], p[1]);
            },
            {"slope", "intercept"}, {0.0, 0.0}, std::nullopt};
}

Shape quadratic_shape()
{
    return {"quadratic",
            [](const Vector& x, const std::vector<double>& p) {
                return parabolic(x, p[0], p[1], p[2]);
            },
            {"a", "b", "c"}, {0.0, 0.0, 0.0}, std::nullopt};
}

Shape polynomial_shape(int degree)
{
    validate_degree(degree);

    Shape s;
    s.name    = "polynomial";
    s.formula = [](const Vector& x, const std::vector<double>& p) {
        return polynomial(x, p);
    };
    for (int i = 0; i <= degree; ++i)
        s.param_names.push_back("c" + std::to_string(i));
    s.defaults.assign(s.param_names.size(), 0.0);
    return s;
}

Shape gaussian_shape()
{
    return peak_shape("gaussian", GaussianModel::fwhm_factor,
                      [](const Vector& x, const std::vector<double>& p) {
                          return gaussian(x, p[0], p[1], p[2]);
                      });
}

Shape lorentzian_shape()
{
    return peak_shape("lorentzian", LorentzianModel::fwhm_factor,
                      [](const Vector& x, const std::vector<double>& p) {
                          return lorentzian(x, p[0], p[1], p[2]);
                      });
}

Shape voigt_shape()
{
    return peak_shape("voigt", VoigtModel::fwhm_factor,
                      [](const Vector& x, const std::vector<double>& p) {
                          return voigt(x, p[0], p[1], p[2]);
                      });
}

Shape powerlaw_shape()
{
    return {"powerlaw",
            [](const Vector& x, const std::vector<double>& p) {
                return powerlaw(x, p[0], p[1]);
            },
            {"amplitude", "exponent"}, {1.0, 1.0}, std::nullopt};
}

Shape exponential_shape()
{
    return {"exponential",
            [](const Vector& x, const std::vector<double>& p) {
                return exponential(x, p[0], p[1]);
            },
            {"amplitude", "decay"}, {1.0, 1.0}, std::nullopt};
}

/* ------------------------------------------------------------------ */
/*  guess procedures                                                   */
/* ------------------------------------------------------------------ */
ConstantModel::ConstantModel(Parameters& params, const ModelOptions& opts)
    : Model(constant_shape(), params, opts)
{}

GuessResult ConstantModel::guess(const Vector& data, const std::optional<Vector>&,
                                 const GuessOptions&) const
{
    return {{"c", data.mean()}};
}

LinearModel::LinearModel(Parameters& params, const ModelOptions& opts)
    : Model(linear_shape(), params, opts)
{}

GuessResult LinearModel::guess(const Vector& data, const std::optional<Vector>& x,
                               const GuessOptions& opt) const
{
    double slope = 0.0, intercept = 0.0;
    if (x) {
        if (auto p = polyfit(*x, data, 1)) {
            slope     = (*p)[0];
            intercept = (*p)[1];
        } else {
            log_fallback(opt, name(), "singular linear regression");
        }
    }
    return {{"slope", slope}, {"intercept", intercept}};
}

QuadraticModel::QuadraticModel(Parameters& params, const ModelOptions& opts)
    : Model(quadratic_shape(), params, opts)
{}

GuessResult QuadraticModel::guess(const Vector& data, const std::optional<Vector>& x,
                                  const GuessOptions& opt) const
{
    double a = 0.0, b = 0.0, c = 0.0;
    if (x) {
        if (auto p = polyfit(*x, data, 2)) {
            a = (*p)[0];
            b = (*p)[1];
            c = (*p)[2];
        } else {
            log_fallback(opt, name(), "singular quadratic regression");
        }
    }
    return {{"a", a}, {"b", b}, {"c", c}};
}

PolynomialModel::PolynomialModel(int degree, Parameters& params,
                                 const ModelOptions& opts)
    : Model(polynomial_shape(degree), params, opts)
    , degree_(degree)
{}

PolynomialModel::PolynomialModel(double degree, Parameters& params,
                                 const ModelOptions& opts)
    : PolynomialModel(validate_degree(degree), params, opts)
{}

GuessResult PolynomialModel::guess(const Vector& data, const std::optional<Vector>& x,
                                   const GuessOptions& opt) const
{
    std::vector<double> coefs(degree_ + 1, 0.0);
    if (x) {
        if (auto p = polyfit(*x, data, degree_)) {
            /* polyfit is highest order first, c0..c_deg ascending */
            for (int i = 0; i <= degree_; ++i)
                coefs[i] = (*p)[degree_ - i];
        } else {
            log_fallback(opt, name(), "singular polynomial regression");
        }
    }

    GuessResult g;
    for (int i = 0; i <= degree_; ++i)
        g["c" + std::to_string(i)] = coefs[i];
    return g;
}

PeakModel::PeakModel(Shape shape, Parameters& params, const ModelOptions& opts)
    : Model(std::move(shape), params, opts)
{}

GuessResult PeakModel::guess(const Vector& data, const std::optional<Vector>& x,
                             const GuessOptions& opt) const
{
    const PeakGuess pk = estimate_peak(data, x, opt.negative);
    /* fwhm follows sigma through the store */
    return {{"amplitude", pk.amplitude}, {"center", pk.center}, {"sigma", pk.sigma}};
}

GaussianModel::GaussianModel(Parameters& params, const ModelOptions& opts)
    : PeakModel(gaussian_shape(), params, opts)
{}

LorentzianModel::LorentzianModel(Parameters& params, const ModelOptions& opts)
    : PeakModel(lorentzian_shape(), params, opts)
{}

VoigtModel::VoigtModel(Parameters& params, const ModelOptions& opts)
    : PeakModel(voigt_shape(), params, opts)
{}

PowerLawModel::PowerLawModel(Parameters& params, const ModelOptions& opts)
    : Model(powerlaw_shape(), params, opts)
{}

GuessResult PowerLawModel::guess(const Vector& data, const std::optional<Vector>& x,
                                 const GuessOptions& opt) const
{
    double expon = 1.0;
    double lamp  = std::log(std::abs(data.maxCoeff()) + kFallbackOffset);

    if (!x) {
        log_fallback(opt, name(), "no independent variable");
    } else if (((x->array() + kPowerLawLogOffset) <= 0.0).any() ||
               ((data.array() + kPowerLawLogOffset) <= 0.0).any()) {
        log_fallback(opt, name(), "non-positive values in log-log regression");
    } else {
        const Vector lx = (x->array() + kPowerLawLogOffset).log().matrix();
        const Vector ly = (data.array() + kPowerLawLogOffset).log().matrix();
        if (auto p = polyfit(lx, ly, 1)) {
            expon = (*p)[0];
            lamp  = (*p)[1];
        } else {
            log_fallback(opt, name(), "singular log-log regression");
        }
    }
    return {{"amplitude", std::exp(lamp)}, {"exponent", expon}};
}

ExponentialModel::ExponentialModel(Parameters& params, const ModelOptions& opts)
    : Model(exponential_shape(), params, opts)
{}

GuessResult ExponentialModel::guess(const Vector& data, const std::optional<Vector>& x,
                                    const GuessOptions& opt) const
{
    double slope     = 1.0;
    double intercept = std::log(std::abs(data.maxCoeff()) + kFallbackOffset);

    if (!x) {
        log_fallback(opt, name(), "no independent variable");
    } else {
        const Vector ly = (data.array().abs() + kExpLogOffset).log().matrix();
        auto p = polyfit(*x, ly, 1);
        if (p && std::abs((*p)[0]) > kMinSlope) {
            slope     = (*p)[0];
            intercept = (*p)[1];
        } else {
            log_fallback(opt, name(), "flat or singular log-linear regression");
        }
    }
    return {{"amplitude", std::exp(intercept)}, {"decay", -1.0 / slope}};
}

} // namespace fitmodels
