/// @file Minimizers.cc

#include "Minimizers.hh"
#include "CeresUtils.hh"
#include "LoggingInit.hh"
#include "RuntimeConfig.hh"

#include <algorithm>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "Math/Factory.h"
#include "Math/Functor.h"
#include "Math/Minimizer.h"
#include "ceres/ceres.h"
#include "glog/logging.h"

namespace bkgfit {

const char* MethodName(Method method) {
    switch (method) {
        case Method::kBfgs:
            return "BFGS";
        case Method::kNelderMead:
            return "Nelder-Mead";
    }
    return "unknown";
}

SingleFitOptions SingleFitOptions::Bfgs() {
    const RuntimeConfig& config = RuntimeConfig::Instance();
    return {Method::kBfgs, config.bfgsTolerance, config.bfgsMaxIterations};
}

SingleFitOptions SingleFitOptions::NelderMead() {
    const RuntimeConfig& config = RuntimeConfig::Instance();
    return {Method::kNelderMead, config.simplexTolerance, config.simplexMaxFunctionCalls};
}

FitResult MinimizeBfgs(const Objective& objective, const std::vector<double>& x0, double tolerance,
                       int maxIterations) {
    LoggingInitializer::InitializeOnce();

    FitResult result;
    result.method = MethodName(Method::kBfgs);
    result.xInit = x0;
    result.x = x0;

    if (x0.empty()) {
        result.fun = objective(x0);
        result.nfev = 1;
        result.success = std::isfinite(result.fun);
        result.message = "no free parameters";
        return result;
    }

    int evaluations = 0;
    // GradientProblem takes ownership of the function
    ceres::GradientProblem problem(
        MakeNumericGradientFunction(objective, static_cast<int>(x0.size()), &evaluations));
    ceres::GradientProblemSolver::Summary summary;
    ceres::Solve(MakeGradientSolverOptions(tolerance, maxIterations), problem, result.x.data(),
                 &summary);

    result.fun = objective(result.x);
    result.nfev = evaluations + 1;
    result.success = summary.termination_type == ceres::CONVERGENCE;
    result.message = summary.message;
    VLOG(1) << "BFGS: " << summary.BriefReport();
    return result;
}

FitResult MinimizeSimplex(const Objective& objective, const std::vector<double>& x0,
                          double tolerance, int maxFunctionCalls) {
    FitResult result;
    result.method = MethodName(Method::kNelderMead);
    result.xInit = x0;
    result.x = x0;

    if (x0.empty()) {
        result.fun = objective(x0);
        result.nfev = 1;
        result.success = std::isfinite(result.fun);
        result.message = "no free parameters";
        return result;
    }

    std::unique_ptr<ROOT::Math::Minimizer> min{
        ROOT::Math::Factory::CreateMinimizer("Minuit2", "Simplex")};
    if (!min) {
        throw std::runtime_error("MinimizeSimplex: cannot create Minuit2 Simplex minimizer");
    }
    min->SetMaxFunctionCalls(static_cast<unsigned int>(maxFunctionCalls));
    min->SetMaxIterations(static_cast<unsigned int>(maxFunctionCalls));
    min->SetTolerance(tolerance);
    min->SetPrintLevel(0);

    const std::size_t n = x0.size();
    int evaluations = 0;
    auto fcn = [&objective, &evaluations, n](const double* p) {
        ++evaluations;
        const double value = objective(std::vector<double>(p, p + n));
        return std::isfinite(value) ? value : Constants::NON_FINITE_PENALTY;
    };
    ROOT::Math::Functor functor(fcn, static_cast<unsigned int>(n));
    min->SetFunction(functor);

    for (std::size_t i = 0; i < n; ++i) {
        const double step = x0[i] != 0.0 ? 0.05 * std::abs(x0[i]) : 0.00025;
        min->SetVariable(static_cast<unsigned int>(i), "p" + std::to_string(i + 1), x0[i], step);
    }

    const bool ok = min->Minimize();
    const double* xs = min->X();
    result.x.assign(xs, xs + n);
    result.fun = objective(result.x);
    result.nfev = evaluations + 1;
    // A minimum found on the penalty plateau is not a fit
    result.success = ok && std::isfinite(result.fun);
    std::ostringstream msg;
    msg << "Minuit2 Simplex status " << min->Status() << (ok ? " (converged)" : " (not converged)");
    result.message = msg.str();
    return result;
}

FitResult Minimize(const Objective& objective, const std::vector<double>& x0,
                   const SingleFitOptions& options) {
    switch (options.method) {
        case Method::kBfgs:
            return MinimizeBfgs(objective, x0, options.tolerance, options.maxEvaluations);
        case Method::kNelderMead:
            return MinimizeSimplex(objective, x0, options.tolerance, options.maxEvaluations);
    }
    throw std::invalid_argument("Minimize: unknown method");
}

FitResult SingleFit(const std::string& expression, const Histogram& histogram,
                    const std::optional<std::vector<double>>& initVals,
                    const SingleFitOptions& options, const FitCache* cache) {
    const std::string hash = MakeFitHash(expression, histogram, initVals,
                                         OptimizerSettings{options.tolerance, MethodName(options.method)});
    if (cache) {
        if (auto cached = cache->Get(hash)) {
            LOG(INFO) << "Returning cached fit " << hash;
            return *cached;
        }
    }

    const int nPars = Expression::Parse(expression).NFitParameters();
    const std::vector<double> x0 =
        initVals ? *initVals : std::vector<double>(static_cast<std::size_t>(std::max(nPars, 0)), 1.0);
    if (static_cast<int>(x0.size()) != std::max(nPars, 0)) {
        throw std::invalid_argument("SingleFit: expected " + std::to_string(nPars) +
                                    " init values; got " + std::to_string(x0.size()));
    }
    LOG(INFO) << "Fitting " << expression << " with " << x0.size() << " parameters ("
              << MethodName(options.method) << ")";

    FitResult result = Minimize(BuildChi2(expression, histogram), x0, options);
    result.expression = expression;
    result.hash = hash;

    if (cache) {
        cache->Write(hash, result);
    }
    return result;
}

}  // namespace bkgfit
