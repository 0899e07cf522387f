/// @file Minimizers.hh
/// @brief Single unconstrained minimizations of a shape objective.
///
/// BFGS runs on the Ceres line-search solver with a numeric gradient;
/// Nelder-Mead runs on the Minuit2 Simplex minimizer. SingleFit adds the
/// cache lookup and bookkeeping around one minimization of the chi2 of an
/// expression against a histogram.

#ifndef BKGFIT_MINIMIZERS_HH
#define BKGFIT_MINIMIZERS_HH

#include "Constants.hh"
#include "FitCache.hh"
#include "FitResult.hh"
#include "Objective.hh"

#include <optional>
#include <string>
#include <vector>

namespace bkgfit {

enum class Method { kBfgs, kNelderMead };

/// "BFGS" or "Nelder-Mead"; also used in the fit hash.
const char* MethodName(Method method);

struct SingleFitOptions {
    Method method{Method::kBfgs};
    double tolerance{Constants::BFGS_TOLERANCE};
    int maxEvaluations{Constants::BFGS_MAX_ITERATIONS};  ///< iterations for BFGS, calls for Nelder-Mead

    /// Settings for each method taken from RuntimeConfig.
    static SingleFitOptions Bfgs();
    static SingleFitOptions NelderMead();
};

/// fun is the objective at x; success means the solver reported convergence.
FitResult MinimizeBfgs(const Objective& objective, const std::vector<double>& x0, double tolerance,
                       int maxIterations);

/// Non-finite objective values are replaced by a large penalty inside the
/// simplex; fun is recomputed from the raw objective at x.
FitResult MinimizeSimplex(const Objective& objective, const std::vector<double>& x0,
                          double tolerance, int maxFunctionCalls);

FitResult Minimize(const Objective& objective, const std::vector<double>& x0,
                   const SingleFitOptions& options);

/// Minimizes the chi2 of expression against histogram from initVals (all
/// ones when absent). Looks the fit up in cache first and writes it back.
FitResult SingleFit(const std::string& expression, const Histogram& histogram,
                    const std::optional<std::vector<double>>& initVals,
                    const SingleFitOptions& options, const FitCache* cache = nullptr);

}  // namespace bkgfit

#endif  // BKGFIT_MINIMIZERS_HH
