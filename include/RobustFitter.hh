/// @file RobustFitter.hh
/// @brief Two-phase shape fit with a brute-force fallback.
///
/// A loose BFGS pass from all-ones start values is followed by a tight
/// Nelder-Mead pass from its result. If the second pass does not converge
/// (or brute force is requested) every start in {-1, +1}^N is tried with both
/// methods and the best finite result wins.

#ifndef BKGFIT_ROBUST_FITTER_HH
#define BKGFIT_ROBUST_FITTER_HH

#include "FitCache.hh"
#include "FitResult.hh"
#include "Histogram.hh"
#include "Minimizers.hh"

#include <string>
#include <vector>

namespace bkgfit {

class RobustFitter {
public:
    /// Options default to RuntimeConfig. cache and lock are optional and not owned.
    explicit RobustFitter(const FitCache* cache = nullptr, CacheLock* lock = nullptr);
    RobustFitter(const FitCache* cache, CacheLock* lock, SingleFitOptions bfgs,
                 SingleFitOptions nelderMead);

    /// @throws NoConvergenceError if brute force finds no finite result
    FitResult Fit(const std::string& expression, const Histogram& histogram, bool brute = false) const;

    /// Scan of every start in {-1, +1}^N with both methods.
    /// @throws NoConvergenceError if no run ends with a finite objective
    FitResult BruteForce(const std::string& expression, const Histogram& histogram) const;

    /// The 2^N start vectors in lexicographic order, -1 before +1.
    static std::vector<std::vector<double>> BruteForceStarts(int nPars);

private:
    FitResult FitUnlocked(const std::string& expression, const Histogram& histogram, bool brute) const;

    const FitCache* fCache;
    CacheLock* fLock;
    SingleFitOptions fBfgs;
    SingleFitOptions fNelderMead;
};

}  // namespace bkgfit

#endif  // BKGFIT_ROBUST_FITTER_HH
