#include "fitmodels/Errors.hpp"
#include "fitmodels/Lineshapes.hpp"
#include "fitmodels/Models.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <initializer_list>
#include <cmath>
#include <limits>
#include <set>

using namespace fitmodels;
using fitmodels::test::apply;
using fitmodels::test::linspace;
using fitmodels::test::vec;

class ModelsTest : public ::testing::Test {
  protected:
    Parameters params;
    Vector     x = linspace(-5.0, 5.0, 101);
};

/* ---------------------------------------------------------------- */
/*  baselines                                                        */
/* ---------------------------------------------------------------- */
TEST_F(ModelsTest, ConstantIsMean) {
    ConstantModel m(params);
    m.guess_starting_values(vec({ 1.0, 2.0, 6.0 }));
    EXPECT_DOUBLE_EQ(params.value("c"), 3.0);
    EXPECT_TRUE(m.has_initial_guess());
}

TEST_F(ModelsTest, LinearRecoversSlopeAndIntercept) {
    LinearModel m(params);
    m.guess_starting_values(apply(x, [](double v) { return 3.0 * v + 5.0; }), x);
    EXPECT_NEAR(params.value("slope"), 3.0, 1e-9);
    EXPECT_NEAR(params.value("intercept"), 5.0, 1e-9);
}

TEST_F(ModelsTest, LinearWithoutXDefaultsToZero) {
    LinearModel m(params);
    m.guess_starting_values(vec({ 4.0, 5.0 }));
    EXPECT_EQ(params.value("slope"), 0.0);
    EXPECT_EQ(params.value("intercept"), 0.0);
    EXPECT_TRUE(m.has_initial_guess());
}

TEST_F(ModelsTest, LinearSingularRegressionFallsBack) {
    LinearModel m(params);
    m.guess_starting_values(vec({ 1.0, 2.0, 3.0 }), vec({ 1.0, 1.0, 1.0 }));
    EXPECT_EQ(params.value("slope"), 0.0);
    EXPECT_EQ(params.value("intercept"), 0.0);
}

TEST_F(ModelsTest, QuadraticRecoversCoefficients) {
    QuadraticModel m(params, { .prefix = "q_" });
    m.guess_starting_values(apply(x, [](double v) { return 2.0 * v * v - 3.0 * v + 1.0; }), x);
    EXPECT_NEAR(params.value("q_a"), 2.0, 1e-9);
    EXPECT_NEAR(params.value("q_b"), -3.0, 1e-9);
    EXPECT_NEAR(params.value("q_c"), 1.0, 1e-9);
}

TEST_F(ModelsTest, ParabolicIsQuadratic) {
    ParabolicModel m(params);
    EXPECT_EQ(m.name(), "quadratic");
    EXPECT_EQ(m.param_names(), (std::vector<std::string>{ "a", "b", "c" }));
}

/* ---------------------------------------------------------------- */
/*  peaks                                                            */
/* ---------------------------------------------------------------- */
TEST_F(ModelsTest, GaussianGuessAndDerivedFwhm) {
    GaussianModel m(params, { .prefix = "g_" });
    ASSERT_EQ(m.derived_name(), "g_fwhm");
    EXPECT_TRUE(params.is_derived("g_fwhm"));

    const Vector y = gaussian(x, 10.0, 0.8, 0.7);
    m.guess_starting_values(y, x);

    EXPECT_NEAR(params.value("g_center"), 0.8, 0.05);
    EXPECT_GT(params.value("g_amplitude"), 0.0);
    EXPECT_GT(params.value("g_sigma"), 0.0);
    EXPECT_DOUBLE_EQ(params.value("g_fwhm"), 2.354820 * params.value("g_sigma"));

    params.set("g_sigma", 3.0);
    EXPECT_DOUBLE_EQ(params.value("g_fwhm"), 2.354820 * 3.0);
    EXPECT_THROW(params.set("g_fwhm", 1.0), std::invalid_argument);
}

TEST_F(ModelsTest, FwhmFactorsPerShape) {
    GaussianModel   g(params, { .prefix = "g_" });
    LorentzianModel l(params, { .prefix = "l_" });
    VoigtModel      v(params, { .prefix = "v_" });

    const Vector y = lorentzian(x, 2.0, -1.0, 0.5);
    for (Model* m : std::initializer_list<Model*>{ &g, &l, &v })
        m->guess_starting_values(y, x);

    EXPECT_DOUBLE_EQ(params.value("g_fwhm"), 2.354820 * params.value("g_sigma"));
    EXPECT_DOUBLE_EQ(params.value("l_fwhm"), 2.0 * params.value("l_sigma"));
    EXPECT_DOUBLE_EQ(params.value("v_fwhm"), 3.60131 * params.value("v_sigma"));

    for (const char* p : { "g_", "l_", "v_" })
        EXPECT_NEAR(params.value(std::string(p) + "center"), -1.0, 1e-12);
}

TEST_F(ModelsTest, NegativePeakFlag) {
    LorentzianModel m(params);
    const Vector y = (Vector::Constant(x.size(), 5.0) - lorentzian(x, 3.0, 2.0, 0.4));
    GuessOptions opt;
    opt.negative = true;
    m.guess_starting_values(y, x, opt);
    EXPECT_LT(params.value("amplitude"), 0.0);
    EXPECT_NEAR(params.value("center"), 2.0, 0.1);
}

TEST_F(ModelsTest, PeakWithoutXUsesNeutralGuess) {
    VoigtModel m(params);
    m.guess_starting_values(vec({ 0.0, 3.0, 0.0 }));
    EXPECT_EQ(params.value("amplitude"), 1.0);
    EXPECT_EQ(params.value("center"), 0.0);
    EXPECT_EQ(params.value("sigma"), 1.0);
    EXPECT_DOUBLE_EQ(params.value("fwhm"), 3.60131);
}

/* ---------------------------------------------------------------- */
/*  power law / exponential                                          */
/* ---------------------------------------------------------------- */
TEST_F(ModelsTest, PowerLawRecoversExponentAndAmplitude) {
    PowerLawModel m(params, { .prefix = "pl_" });
    const Vector xp = linspace(0.5, 5.0, 40);
    m.guess_starting_values(apply(xp, [](double v) { return 2.0 * v * v * v; }), xp);
    EXPECT_NEAR(params.value("pl_exponent"), 3.0, 1e-6);
    EXPECT_NEAR(params.value("pl_amplitude"), 2.0, 1e-6);
}

TEST_F(ModelsTest, PowerLawFallsBackOnNonPositiveData) {
    PowerLawModel m(params);
    m.guess_starting_values(vec({ -1.0, -2.0, -3.0 }), vec({ 1.0, 2.0, 3.0 }));
    EXPECT_EQ(params.value("exponent"), 1.0);
    EXPECT_NEAR(params.value("amplitude"), 1.0 + 1e-9, 1e-12);
    EXPECT_TRUE(m.has_initial_guess());
}

TEST_F(ModelsTest, PowerLawFallsBackWithoutX) {
    PowerLawModel m(params);
    m.guess_starting_values(vec({ 1.0, 4.0, 2.0 }));
    EXPECT_EQ(params.value("exponent"), 1.0);
    EXPECT_NEAR(params.value("amplitude"), 4.0, 1e-8);
}

TEST_F(ModelsTest, ExponentialRecoversDecay) {
    ExponentialModel m(params);
    const Vector xe = linspace(0.0, 10.0, 50);
    m.guess_starting_values(apply(xe, [](double v) { return 4.0 * std::exp(-v / 2.5); }), xe);
    EXPECT_NEAR(params.value("decay"), 2.5, 1e-8);
    EXPECT_NEAR(params.value("amplitude"), 4.0, 1e-8);
}

TEST_F(ModelsTest, ExponentialFlatDataFallsBack) {
    ExponentialModel m(params);
    m.guess_starting_values(Vector::Constant(10, 3.0), linspace(0.0, 9.0, 10));
    EXPECT_EQ(params.value("decay"), -1.0);
    EXPECT_NEAR(params.value("amplitude"), 3.0, 1e-8);
}

/* ---------------------------------------------------------------- */
/*  model contract                                                   */
/* ---------------------------------------------------------------- */
TEST_F(ModelsTest, ExactlyOneIndependentVariable) {
    ModelOptions two;
    two.independent_vars = { "x", "y" };
    EXPECT_THROW(GaussianModel(params, two), DimensionalityError);

    ModelOptions none;
    none.independent_vars = {};
    EXPECT_THROW(LinearModel(params, none), DimensionalityError);
    EXPECT_EQ(params.size(), 0u);

    ModelOptions renamed;
    renamed.independent_vars = { "t" };
    ExponentialModel m(params, renamed);
    EXPECT_EQ(m.independent_var(), "t");
}

TEST_F(ModelsTest, DistinctPrefixesGiveDisjointNames) {
    GaussianModel a(params, { .prefix = "a_" });
    GaussianModel b(params, { .prefix = "b_" });

    std::vector<std::string> na = a.param_names(), nb = b.param_names();
    na.push_back(*a.derived_name());
    nb.push_back(*b.derived_name());

    std::set<std::string> sa(na.begin(), na.end());
    for (const auto& n : nb) EXPECT_EQ(sa.count(n), 0u) << n;
    EXPECT_EQ(params.size(), 8u);
}

TEST_F(ModelsTest, SuffixIsAppended) {
    GaussianModel m(params, { .prefix = "p", .suffix = "_1" });
    EXPECT_EQ(m.param_names(),
              (std::vector<std::string>{ "pamplitude_1", "pcenter_1", "psigma_1" }));
    EXPECT_EQ(m.derived_name(), "pfwhm_1");
}

TEST_F(ModelsTest, DefaultsAreRegisteredAtConstruction) {
    GaussianModel m(params);
    EXPECT_FALSE(m.has_initial_guess());
    EXPECT_EQ(params.value("amplitude"), 1.0);
    EXPECT_EQ(params.value("sigma"), 1.0);
    EXPECT_DOUBLE_EQ(params.value("fwhm"), 2.354820);

    LinearModel l(params, { .prefix = "l_" });
    EXPECT_EQ(params.value("l_slope"), 0.0);
    EXPECT_EQ(params.value("l_intercept"), 0.0);
}

TEST_F(ModelsTest, SecondGuessOverwrites) {
    ConstantModel m(params);
    m.guess_starting_values(vec({ 1.0, 1.0 }));
    m.guess_starting_values(vec({ 5.0, 7.0 }));
    EXPECT_DOUBLE_EQ(params.value("c"), 6.0);
    EXPECT_TRUE(m.has_initial_guess());
}

TEST_F(ModelsTest, LengthMismatchThrows) {
    LinearModel m(params);
    EXPECT_THROW(m.guess_starting_values(vec({ 1.0, 2.0 }), vec({ 1.0 })),
                 std::invalid_argument);
    EXPECT_FALSE(m.has_initial_guess());
}

TEST_F(ModelsTest, MissingDropAndRaise) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const Vector xs = vec({ 0.0, 1.0, 2.0, 3.0 });
    const Vector ys = vec({ 5.0, nan, 11.0, 14.0 });

    LinearModel drop(params, { .prefix = "d_", .missing = MissingPolicy::Drop });
    drop.guess_starting_values(ys, xs);
    EXPECT_NEAR(params.value("d_slope"), 3.0, 1e-9);
    EXPECT_NEAR(params.value("d_intercept"), 5.0, 1e-9);

    LinearModel raise(params, { .prefix = "r_", .missing = MissingPolicy::Raise });
    EXPECT_THROW(raise.guess_starting_values(ys, xs), MissingDataError);
    EXPECT_FALSE(raise.has_initial_guess());
}

TEST_F(ModelsTest, EvalReadsTheStore) {
    GaussianModel m(params);
    params.set("amplitude", 2.0);
    params.set("center", 1.0);
    params.set("sigma", 0.5);
    const Vector xs = vec({ 0.0, 1.0, 2.5 });
    EXPECT_TRUE(m.eval(xs).isApprox(gaussian(xs, 2.0, 1.0, 0.5)));
}

TEST_F(ModelsTest, CompositeSumsComponents) {
    auto g = std::make_shared<GaussianModel>(params, ModelOptions{ .prefix = "g_" });
    auto c = std::make_shared<ConstantModel>(params, ModelOptions{ .prefix = "bg_" });
    params.set("bg_c", 0.25);

    CompositeModel sum({ g, c });
    const Vector xs = vec({ -1.0, 0.0, 1.0 });
    EXPECT_TRUE(sum.eval(xs).isApprox(g->eval(xs) + Vector::Constant(3, 0.25)));
    EXPECT_EQ(sum.param_names().size(), 4u);
}

TEST_F(ModelsTest, CompositeRejectsCollisions) {
    auto a = std::make_shared<GaussianModel>(params);
    auto b = std::make_shared<GaussianModel>(params);
    EXPECT_THROW(CompositeModel({ a, b }), ParameterCollisionError);

    // same names, different fwhm expression: rejected by the store itself
    EXPECT_THROW(LorentzianModel l(params), std::invalid_argument);

    Parameters other;
    auto c = std::make_shared<ConstantModel>(other);
    EXPECT_THROW(CompositeModel({ a, c }), std::invalid_argument);
}

TEST_F(ModelsTest, FailedConstructionLeavesStoreUntouched) {
    ConstantModel c(params, { .prefix = "fwhm" });
    const auto before = params.size();

    // derived name "fwhmc" is taken by the constant's primary
    EXPECT_THROW(GaussianModel g(params, { .prefix = "", .suffix = "c" }),
                 std::invalid_argument);
    EXPECT_EQ(params.size(), before);
    EXPECT_FALSE(params.contains("amplitudec"));
    EXPECT_FALSE(params.contains("centerc"));
    EXPECT_FALSE(params.contains("sigmac"));

    GaussianModel g(params, { .prefix = "p_" });
    const auto with_gaussian = params.size();
    EXPECT_THROW(LorentzianModel l(params, { .prefix = "p_" }), std::invalid_argument);
    EXPECT_EQ(params.size(), with_gaussian);
    EXPECT_DOUBLE_EQ(params.value("p_fwhm"), 2.354820);

    // a primary that shadows an existing derived name
    GaussianModel q(params, { .prefix = "q_", .suffix = "c" });
    const auto with_q = params.size();
    EXPECT_TRUE(params.is_derived("q_fwhmc"));
    EXPECT_THROW(ConstantModel k(params, { .prefix = "q_fwhm" }), std::invalid_argument);
    EXPECT_EQ(params.size(), with_q);
}

TEST_F(ModelsTest, VerboseGuessPrintsValues) {
    ConstantModel m(params, { .prefix = "k_" });
    GuessOptions opt;
    opt.verbose = true;
    ::testing::internal::CaptureStdout();
    m.guess_starting_values(vec({ 2.0, 4.0 }), std::nullopt, opt);
    const std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("[guess] constant"), std::string::npos);
    EXPECT_NE(out.find("k_c=3"), std::string::npos);
}
