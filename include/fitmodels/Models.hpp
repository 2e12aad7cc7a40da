#pragma once
#include "Model.hpp"

namespace fitmodels {

constexpr int kMaxPolyDegree = 7;

/* throws InvalidDegreeError unless deg is an integer in [0, kMaxPolyDegree] */
int validate_degree(double deg);

Shape constant_shape();
Shape linear_shape();
Shape quadratic_shape();
Shape polynomial_shape(int degree);
Shape gaussian_shape();
Shape lorentzian_shape();
Shape voigt_shape();
Shape powerlaw_shape();
Shape exponential_shape();

/* x -> c */
class ConstantModel : public Model {
public:
    explicit ConstantModel(Parameters& params, const ModelOptions& opts = {});

protected:
    GuessResult guess(const Vector& data, const std::optional<Vector>& x,
                      const GuessOptions& opt) const override;
};

/* x -> slope * x + intercept */
class LinearModel : public Model {
public:
    explicit LinearModel(Parameters& params, const ModelOptions& opts = {});

protected:
    GuessResult guess(const Vector& data, const std::optional<Vector>& x,
                      const GuessOptions& opt) const override;
};

/* x -> a * x^2 + b * x + c */
class QuadraticModel : public Model {
public:
    explicit QuadraticModel(Parameters& params, const ModelOptions& opts = {});

protected:
    GuessResult guess(const Vector& data, const std::optional<Vector>& x,
                      const GuessOptions& opt) const override;
};

using ParabolicModel = QuadraticModel;

/* x -> c0 + c1 * x + … + c_deg * x^deg */
class PolynomialModel : public Model {
public:
    PolynomialModel(int degree, Parameters& params, const ModelOptions& opts = {});
    PolynomialModel(double degree, Parameters& params, const ModelOptions& opts = {});

    int degree() const { return degree_; }

protected:
    GuessResult guess(const Vector& data, const std::optional<Vector>& x,
                      const GuessOptions& opt) const override;

private:
    int degree_;
};

/*
 * Symmetric peak (amplitude, center, sigma) with a derived
 * fwhm = fwhm_factor * sigma.
 */
class PeakModel : public Model {
public:
    PeakModel(Shape shape, Parameters& params, const ModelOptions& opts);

protected:
    GuessResult guess(const Vector& data, const std::optional<Vector>& x,
                      const GuessOptions& opt) const override;
};

class GaussianModel : public PeakModel {
public:
    static constexpr double fwhm_factor = 2.354820;
    explicit GaussianModel(Parameters& params, const ModelOptions& opts = {});
};

class LorentzianModel : public PeakModel {
public:
    static constexpr double fwhm_factor = 2.0;
    explicit LorentzianModel(Parameters& params, const ModelOptions& opts = {});
};

class VoigtModel : public PeakModel {
public:
    static constexpr double fwhm_factor = 3.60131;
    explicit VoigtModel(Parameters& params, const ModelOptions& opts = {});
};

/* x -> amplitude * x^exponent */
class PowerLawModel : public Model {
public:
    explicit PowerLawModel(Parameters& params, const ModelOptions& opts = {});

protected:
    GuessResult guess(const Vector& data, const std::optional<Vector>& x,
                      const GuessOptions& opt) const override;
};

/* x -> amplitude * exp(-x / decay) */
class ExponentialModel : public Model {
public:
    explicit ExponentialModel(Parameters& params, const ModelOptions& opts = {});

protected:
    GuessResult guess(const Vector& data, const std::optional<Vector>& x,
                      const GuessOptions& opt) const override;
};

} // namespace fitmodels
