/// @file PrecisionRefiner.hh
/// @brief Binned maximum-likelihood refit of a model instance with Minuit2.
///
/// The shape fit gives seed values; the refiner first adapts each parameter
/// range to its seed (widening ranges the seed falls outside of, shrinking
/// ranges that are needlessly wide) and then runs Migrad on the multinomial
/// NLL of the bin-integrated, normalized shape.

#ifndef BKGFIT_PRECISION_REFINER_HH
#define BKGFIT_PRECISION_REFINER_HH

#include "Histogram.hh"
#include "ModelFamily.hh"

#include <iosfwd>
#include <string>
#include <vector>

namespace bkgfit {

struct RefitResult {
    bool converged{false};
    int status{-1};                  ///< Minuit status code
    int covarianceStatus{-1};
    double minNll{0.0};
    double edm{0.0};
    std::vector<std::string> names;
    std::vector<double> values;
    std::vector<double> errors;
    std::vector<std::vector<double>> covariance;  ///< empty if unavailable
    std::vector<ParameterRange> ranges;           ///< ranges used in the fit
    bool sumW2Corrected{false};                   ///< errors corrected for bin weights
};

std::ostream& operator<<(std::ostream& os, const RefitResult& result);

/// Widens and shrinks each parameter range around its seed, then sets the
/// parameter value to the seed.
/// @throws std::invalid_argument if seed has the wrong size
void AdjustParameterBounds(ModelInstance& instance, const std::vector<double>& seed);

/// @throws std::invalid_argument if ranges has the wrong size
void AdjustParameterRanges(ModelInstance& instance, const std::vector<ParameterRange>& ranges);

/// -sum(n_i * log(f_i)) over bins with n_i > 0, with f_i the normalized
/// bin integrals of the shape for the given parameters.
double MultinomialNll(const ModelInstance& instance, const Histogram& data,
                      const std::vector<double>& parameters);

/// MultinomialNll with every non-empty bin weighted by weights[i] instead
/// of its content.
double WeightedMultinomialNll(const ModelInstance& instance, const Histogram& data,
                              const std::vector<double>& weights, const std::vector<double>& parameters);

/// Per-bin sum of squared weights: the squared error, or the content where
/// the error is not positive.
std::vector<double> SumOfSquaredWeights(const Histogram& data);

/// True if some non-empty bin has a squared error different from its content.
bool IsWeighted(const Histogram& data);

struct RefitOptions {
    int strategy;
    double tolerance;
    int maxFunctionCalls;
    int printLevel;

    static RefitOptions FromConfig();
};

class PrecisionRefiner {
public:
    PrecisionRefiner();
    explicit PrecisionRefiner(RefitOptions options) : fOptions(options) {}

    /// Fits the instance to its bound histogram.
    RefitResult Refit(ModelInstance& instance, const std::vector<double>& seed) const;

    /// Fits the instance to data. Parameter values of the instance are updated
    /// to the fitted values. For weighted data the errors and covariance are
    /// corrected with the Hessian of the sum-of-weights-squared likelihood.
    /// @throws std::exception from the numeric fit, after logging it
    RefitResult Refit(ModelInstance& instance, const std::vector<double>& seed,
                      const Histogram& data) const;

    const RefitOptions& Options() const { return fOptions; }

private:
    RefitOptions fOptions;
};

}  // namespace bkgfit

#endif  // BKGFIT_PRECISION_REFINER_HH
