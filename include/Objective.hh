/// @file Objective.hh
/// @brief Scalar objectives over a histogram for the shape optimizers.
///
/// The model is evaluated at the bin centres with @0 bound to the mass and
/// rescaled so its total matches the histogram total before it is compared
/// to the data.

#ifndef BKGFIT_OBJECTIVE_HH
#define BKGFIT_OBJECTIVE_HH

#include "Expression.hh"
#include "Histogram.hh"

#include <functional>
#include <string>
#include <vector>

namespace bkgfit {

using Objective = std::function<double(const std::vector<double>&)>;

/// Factor that brings sum(model) to sum(data); 1 when the model sums to zero.
double ShapeScaleFactor(const std::vector<double>& model, const std::vector<double>& data);

/// Model at the bin centres for the fit parameters, scaled to the data total.
std::vector<double> ScaledShape(const Expression& expression, const Histogram& histogram,
                                const std::vector<double>& fitParameters);

/// sum((data - model)^2 / model)
Objective BuildChi2(const std::string& expression, const Histogram& histogram);

/// sqrt(sum((data - model)^2))
Objective BuildRss(const std::string& expression, const Histogram& histogram);

}  // namespace bkgfit

#endif  // BKGFIT_OBJECTIVE_HH
