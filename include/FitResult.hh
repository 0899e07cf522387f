/// @file FitResult.hh
/// @brief Outcome of a shape minimization, as stored in the fit cache.

#ifndef BKGFIT_FIT_RESULT_HH
#define BKGFIT_FIT_RESULT_HH

#include <iosfwd>
#include <limits>
#include <string>
#include <vector>

namespace bkgfit {

struct FitResult {
    std::vector<double> x;      ///< fit parameters @1..@N at the minimum
    double fun{std::numeric_limits<double>::quiet_NaN()};
    bool success{false};
    std::string hash;
    std::vector<double> xInit;
    std::string expression;
    std::string method;         ///< "BFGS" or "Nelder-Mead"
    int nfev{0};
    std::string message;

    bool bruteForce{false};                      ///< produced by the brute-force scan
    std::vector<std::vector<double>> bruteStarts;  ///< start points tried by the scan
};

std::ostream& operator<<(std::ostream& os, const FitResult& result);

}  // namespace bkgfit

#endif  // BKGFIT_FIT_RESULT_HH
