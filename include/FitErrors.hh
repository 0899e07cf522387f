/// @file FitErrors.hh
/// @brief Exceptions raised by the fitting and model-selection core.

#ifndef BKGFIT_FIT_ERRORS_HH
#define BKGFIT_FIT_ERRORS_HH

#include <stdexcept>
#include <string>

namespace bkgfit {

/// Base class of every error the fitting core raises on purpose.
class FitError : public std::runtime_error {
public:
    explicit FitError(const std::string& what) : std::runtime_error(what) {}
};

/// Expression references a parameter index that was not supplied.
class UnboundParameterError : public FitError {
public:
    UnboundParameterError(int index, std::size_t available)
        : FitError("expression references @" + std::to_string(index) + " but only " +
                   std::to_string(available) + " parameter(s) were supplied"),
          fIndex(index) {}

    int Index() const { return fIndex; }

private:
    int fIndex;
};

/// Parameter count outside the family's [nMin, nMax].
class InvalidParameterCountError : public FitError {
public:
    InvalidParameterCountError(const std::string& family, int n, int nMin, int nMax)
        : FitError("unavailable npars=" + std::to_string(n) + " for " + family + " (allowed: " +
                   std::to_string(nMin) + " to " + std::to_string(nMax) + ")") {}
};

/// Every brute-force start ended with a non-finite objective.
class NoConvergenceError : public FitError {
public:
    explicit NoConvergenceError(const std::string& what) : FitError(what) {}
};

/// Pairwise F-test comparison called with i >= j.
class OrderingViolationError : public FitError {
public:
    OrderingViolationError(std::size_t i, std::size_t j)
        : FitError("F-test comparison requires i < j (got i=" + std::to_string(i) +
                   ", j=" + std::to_string(j) + ")") {}
};

/// Malformed expression template.
class ExpressionSyntaxError : public FitError {
public:
    ExpressionSyntaxError(const std::string& message, const std::string& expression, std::size_t pos)
        : FitError(message + " at position " + std::to_string(pos) + " in '" + expression + "'") {}
};

/// Family name not present in the catalog.
class UnknownFamilyError : public FitError {
public:
    explicit UnknownFamilyError(const std::string& family)
        : FitError("unknown model family '" + family + "'") {}
};

}  // namespace bkgfit

#endif  // BKGFIT_FIT_ERRORS_HH
