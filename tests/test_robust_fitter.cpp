/// @file test_robust_fitter.cpp
/// @brief Unit tests for the single minimizers and the two-phase robust fit.
///
/// Requires Ceres and ROOT Minuit2.

#include <map>
#include <memory>

#include "CeresUtils.hh"
#include "FitErrors.hh"
#include "Minimizers.hh"
#include "RobustFitter.hh"
#include "TestHarness.hh"

using namespace bkgfit;

static const std::string kMain2 = "pow(1 - @0/1000, @1) * pow(@0/1000, -(@2))";

static Histogram main2Histogram() {
    return shapeHistogram(kMain2, {3.0, 2.0}, uniformEdges(200.0, 800.0, 40), 1e5);
}

// ===========================================================================
// Single minimizers
// ===========================================================================

void test_numeric_gradient_of_quadratic() {
    const Objective f = [](const std::vector<double>& x) {
        return (x[0] - 2.0) * (x[0] - 2.0) + 3.0 * (x[1] + 1.0) * (x[1] + 1.0);
    };
    int evaluations = 0;
    std::unique_ptr<NumericGradientFunction> function(MakeNumericGradientFunction(f, 2, &evaluations));
    TEST_ASSERT(function->NumParameters() == 2);

    const double x[2] = {0.0, 0.0};
    double cost = 0.0;
    double gradient[2] = {0.0, 0.0};
    TEST_ASSERT(function->Evaluate(x, &cost, gradient));
    TEST_ASSERT(approxEqual(cost, 7.0, 1e-12));
    TEST_ASSERT(approxEqual(gradient[0], -4.0, 1e-5));
    TEST_ASSERT(approxEqual(gradient[1], 6.0, 1e-5));
    // Cost plus two evaluations per parameter at least
    TEST_ASSERT(evaluations >= 5);
}

void test_numeric_gradient_rejects_nan() {
    const Objective f = [](const std::vector<double>&) { return std::nan(""); };
    std::unique_ptr<NumericGradientFunction> function(MakeNumericGradientFunction(f, 1, nullptr));
    const double x[1] = {1.0};
    double cost = 0.0;
    TEST_ASSERT(!function->Evaluate(x, &cost, nullptr));
}

void test_bfgs_quadratic() {
    const Objective f = [](const std::vector<double>& x) {
        return (x[0] - 2.0) * (x[0] - 2.0) + 3.0 * (x[1] + 1.0) * (x[1] + 1.0);
    };
    const FitResult r = MinimizeBfgs(f, {0.0, 0.0}, 1e-8, 200);
    TEST_ASSERT(r.success);
    TEST_ASSERT(r.method == "BFGS");
    TEST_ASSERT(approxEqual(r.x[0], 2.0, 1e-3));
    TEST_ASSERT(approxEqual(r.x[1], -1.0, 1e-3));
    TEST_ASSERT(r.nfev > 0);
}

void test_simplex_quadratic() {
    const Objective f = [](const std::vector<double>& x) {
        return (x[0] - 2.0) * (x[0] - 2.0) + 3.0 * (x[1] + 1.0) * (x[1] + 1.0);
    };
    const FitResult r = MinimizeSimplex(f, {1.0, 1.0}, 1e-6, 10000);
    TEST_ASSERT(r.method == "Nelder-Mead");
    TEST_ASSERT(approxEqual(r.x[0], 2.0, 1e-2));
    TEST_ASSERT(approxEqual(r.x[1], -1.0, 1e-2));
    TEST_ASSERT(r.xInit == std::vector<double>({1.0, 1.0}));
}

void test_simplex_reports_raw_nan() {
    const Objective f = [](const std::vector<double>&) { return std::nan(""); };
    const FitResult r = MinimizeSimplex(f, {1.0}, 1e-6, 200);
    TEST_ASSERT(std::isnan(r.fun));
    TEST_ASSERT(!r.success);
}

void test_single_fit_uses_cache() {
    const std::string dir = scratchDirectory("single_fit");
    const FitCache cache(dir);
    const Histogram h = main2Histogram();
    const SingleFitOptions options{Method::kBfgs, 1e-3, 2000};

    const FitResult first = SingleFit(kMain2, h, std::nullopt, options, &cache);
    TEST_ASSERT(first.xInit == std::vector<double>({1.0, 1.0}));
    TEST_ASSERT(first.expression == kMain2);
    TEST_ASSERT(cache.Contains(first.hash));

    const FitResult second = SingleFit(kMain2, h, std::nullopt, options, &cache);
    TEST_ASSERT(second.hash == first.hash);
    TEST_ASSERT(second.x == first.x);
    TEST_ASSERT(second.nfev == first.nfev);
    std::filesystem::remove_all(dir);
}

void test_single_fit_wrong_init_size_throws() {
    TEST_THROWS(SingleFit(kMain2, main2Histogram(), std::vector<double>{1.0}, SingleFitOptions{}),
                std::invalid_argument);
}

// ===========================================================================
// Robust fit
// ===========================================================================

void test_brute_force_starts_order() {
    const auto starts = RobustFitter::BruteForceStarts(2);
    TEST_ASSERT(starts.size() == 4);
    TEST_ASSERT(starts[0] == std::vector<double>({-1.0, -1.0}));
    TEST_ASSERT(starts[1] == std::vector<double>({-1.0, 1.0}));
    TEST_ASSERT(starts[2] == std::vector<double>({1.0, -1.0}));
    TEST_ASSERT(starts[3] == std::vector<double>({1.0, 1.0}));
    TEST_ASSERT(RobustFitter::BruteForceStarts(4).size() == 16);
    TEST_ASSERT(RobustFitter::BruteForceStarts(0).size() == 1);
}

void test_robust_fit_recovers_truth() {
    const RobustFitter fitter;
    const FitResult r = fitter.Fit(kMain2, main2Histogram());
    TEST_ASSERT(r.success);
    TEST_ASSERT(!r.bruteForce);
    TEST_ASSERT(r.method == "Nelder-Mead");
    TEST_ASSERT(approxEqual(r.x[0], 3.0, 1e-2));
    TEST_ASSERT(approxEqual(r.x[1], 2.0, 1e-2));
}

void test_robust_fit_brute_force_on_request() {
    const RobustFitter fitter;
    const FitResult r = fitter.Fit(kMain2, main2Histogram(), true);
    TEST_ASSERT(r.bruteForce);
    TEST_ASSERT(r.bruteStarts.size() == 4);
    TEST_ASSERT(std::isfinite(r.fun));
    TEST_ASSERT(approxEqual(r.x[0], 3.0, 0.2));
    TEST_ASSERT(approxEqual(r.x[1], 2.0, 0.2));
}

void test_brute_force_runs_every_start_with_both_methods() {
    const std::string dir = scratchDirectory("brute_runs");
    const FitCache cache(dir);
    const RobustFitter fitter(&cache);
    const FitResult r = fitter.BruteForce(kMain2, main2Histogram());
    TEST_ASSERT(r.bruteForce);

    // One cache entry per single fit
    std::map<std::string, int> runsPerMethod;
    std::map<std::vector<double>, int> runsPerStart;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() != ".json") continue;
        const auto run = cache.Get(entry.path().stem().string());
        TEST_ASSERT(run.has_value());
        ++runsPerMethod[run->method];
        ++runsPerStart[run->xInit];
    }
    TEST_ASSERT(runsPerMethod.size() == 2);
    TEST_ASSERT(runsPerMethod["BFGS"] == 4);
    TEST_ASSERT(runsPerMethod["Nelder-Mead"] == 4);
    TEST_ASSERT(runsPerStart.size() == 4);
    for (const auto& start : RobustFitter::BruteForceStarts(2)) {
        TEST_ASSERT(runsPerStart[start] == 2);
    }
    std::filesystem::remove_all(dir);
}

void test_robust_fit_no_convergence() {
    // Objective is NaN everywhere
    const RobustFitter fitter;
    const Histogram h({0.0, 1.0, 2.0}, {1.0, 3.0}, {1.0, 1.0});
    TEST_THROWS(fitter.Fit("sqrt(-1 - @1*@1)*@0", h), NoConvergenceError);
}

void test_robust_fit_cached_under_robust_tag() {
    const std::string dir = scratchDirectory("robust_cache");
    const FitCache cache(dir);
    FileLock lock(dir + "/.lock");
    const RobustFitter fitter(&cache, &lock);
    const Histogram h = main2Histogram();

    const FitResult first = fitter.Fit(kMain2, h);
    const std::string robustHash = MakeFitHash(kMain2, h, std::nullopt, std::nullopt, "robust");
    TEST_ASSERT(cache.Contains(robustHash));

    const FitResult second = fitter.Fit(kMain2, h);
    TEST_ASSERT(second.x == first.x);
    TEST_ASSERT(second.fun == first.fun);
    std::filesystem::remove_all(dir);
}

int main() {
    std::cout << "=== Robust Fitter Unit Tests ===\n\n";

    std::cout << "[Single minimizers]\n";
    RUN_TEST(test_numeric_gradient_of_quadratic);
    RUN_TEST(test_numeric_gradient_rejects_nan);
    RUN_TEST(test_bfgs_quadratic);
    RUN_TEST(test_simplex_quadratic);
    RUN_TEST(test_simplex_reports_raw_nan);
    RUN_TEST(test_single_fit_uses_cache);
    RUN_TEST(test_single_fit_wrong_init_size_throws);

    std::cout << "\n[Robust fit]\n";
    RUN_TEST(test_brute_force_starts_order);
    RUN_TEST(test_robust_fit_recovers_truth);
    RUN_TEST(test_robust_fit_brute_force_on_request);
    RUN_TEST(test_brute_force_runs_every_start_with_both_methods);
    RUN_TEST(test_robust_fit_no_convergence);
    RUN_TEST(test_robust_fit_cached_under_robust_tag);

    return reportResults();
}
