/// @file RobustFitter.cc

#include "RobustFitter.hh"
#include "Constants.hh"
#include "Expression.hh"
#include "FitErrors.hh"

#include <cmath>
#include <mutex>

#include "glog/logging.h"

namespace bkgfit {

RobustFitter::RobustFitter(const FitCache* cache, CacheLock* lock)
    : RobustFitter(cache, lock, SingleFitOptions::Bfgs(), SingleFitOptions::NelderMead()) {}

RobustFitter::RobustFitter(const FitCache* cache, CacheLock* lock, SingleFitOptions bfgs,
                           SingleFitOptions nelderMead)
    : fCache(cache), fLock(lock), fBfgs(bfgs), fNelderMead(nelderMead) {}

std::vector<std::vector<double>> RobustFitter::BruteForceStarts(int nPars) {
    std::vector<std::vector<double>> starts;
    if (nPars < 0) {
        return starts;
    }
    const std::size_t n = static_cast<std::size_t>(nPars);
    const std::size_t count = std::size_t{1} << n;
    starts.reserve(count);
    // Bit (n-1-i) of the counter picks the value of parameter i
    for (std::size_t k = 0; k < count; ++k) {
        std::vector<double> start(n);
        for (std::size_t i = 0; i < n; ++i) {
            const bool high = (k >> (n - 1 - i)) & 1u;
            start[i] = high ? Constants::BRUTE_START_HIGH : Constants::BRUTE_START_LOW;
        }
        starts.push_back(std::move(start));
    }
    return starts;
}

FitResult RobustFitter::Fit(const std::string& expression, const Histogram& histogram,
                            bool brute) const {
    std::unique_lock<CacheLock> guard;
    if (fLock) {
        guard = std::unique_lock<CacheLock>(*fLock);
    }
    return FitUnlocked(expression, histogram, brute);
}

FitResult RobustFitter::FitUnlocked(const std::string& expression, const Histogram& histogram,
                                    bool brute) const {
    LOG(INFO) << "Robust fit of expression " << expression << " to " << histogram;
    const std::string robustHash =
        MakeFitHash(expression, histogram, std::nullopt, std::nullopt, Constants::ROBUST_TAG);

    if (fCache) {
        if (auto cached = fCache->Get(robustHash)) {
            LOG(INFO) << "Returning cached fit:\n" << *cached;
            return *cached;
        }
    }

    // Loose BFGS, then strict Nelder-Mead from where it ended
    const FitResult first = SingleFit(expression, histogram, std::nullopt, fBfgs, fCache);
    FitResult result = SingleFit(expression, histogram, first.x, fNelderMead, fCache);

    if (result.success && !brute) {
        if (fCache) {
            fCache->Write(robustHash, result);
        }
        LOG(INFO) << "Converged with simple fitting strategy, result:\n" << result;
        return result;
    }

    result = BruteForce(expression, histogram);
    if (fCache) {
        fCache->Write(robustHash, result);
    }
    return result;
}

FitResult RobustFitter::BruteForce(const std::string& expression, const Histogram& histogram) const {
    const int nPars = Expression::Parse(expression).NFitParameters();
    const std::vector<std::vector<double>> starts = BruteForceStarts(nPars);
    LOG(INFO) << "Fit did not converge with single try; brute forcing it with " << starts.size()
              << " different variations of initial values with both BFGS and Nelder-Mead.";

    std::vector<FitResult> finite;
    for (const SingleFitOptions& options : {fBfgs, fNelderMead}) {
        for (const auto& start : starts) {
            FitResult run = SingleFit(expression, histogram, start, options, fCache);
            if (!std::isfinite(run.fun)) {
                VLOG(1) << "Discarding " << MethodName(options.method) << " start " << run.hash
                        << ": objective " << run.fun;
                continue;
            }
            finite.push_back(std::move(run));
        }
    }

    if (finite.empty()) {
        throw NoConvergenceError("Not a single fit of the brute force converged for " + expression);
    }

    std::size_t best = 0;
    for (std::size_t i = 1; i < finite.size(); ++i) {
        if (finite[i].fun < finite[best].fun) {
            best = i;
        }
    }
    FitResult result = std::move(finite[best]);
    result.bruteForce = true;
    result.bruteStarts = starts;
    LOG(INFO) << "Best fit from brute force:\n" << result;
    return result;
}

}  // namespace bkgfit
