#include "CeresUtils.hh"

#include <cmath>
#include <utility>
#include <vector>

namespace bkgfit {

ceres::GradientProblemSolver::Options MakeGradientSolverOptions(double tolerance, int max_iterations) {
    ceres::GradientProblemSolver::Options options;

    options.line_search_direction_type = ceres::BFGS;
    options.line_search_type = ceres::WOLFE;
    options.minimizer_progress_to_stdout = false;
    options.logging_type = ceres::SILENT;

    options.function_tolerance = tolerance;
    options.gradient_tolerance = tolerance;
    options.parameter_tolerance = 1e-3 * tolerance;
    options.max_num_iterations = max_iterations;

    return options;
}

ObjectiveCostFunctor::ObjectiveCostFunctor(Objective objective, int num_parameters, int* evaluations)
    : objective_(std::move(objective)), num_parameters_(num_parameters), evaluations_(evaluations) {}

bool ObjectiveCostFunctor::operator()(const double* parameters, double* cost) const {
    if (evaluations_) ++(*evaluations_);
    const double value = objective_(std::vector<double>(parameters, parameters + num_parameters_));
    if (!std::isfinite(value)) {
        return false;
    }
    *cost = value;
    return true;
}

NumericGradientFunction* MakeNumericGradientFunction(Objective objective, int num_parameters,
                                                     int* evaluations) {
    return new NumericGradientFunction(
        new ObjectiveCostFunctor(std::move(objective), num_parameters, evaluations), num_parameters);
}

} // namespace bkgfit
