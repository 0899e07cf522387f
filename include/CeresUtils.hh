#ifndef BKGFIT_CERES_UTILS_HH
#define BKGFIT_CERES_UTILS_HH

#include "ceres/ceres.h"
#include "ceres/numeric_diff_first_order_function.h"
#include "Objective.hh"

namespace bkgfit {

// Line-search BFGS options for the loose first pass of the robust fit
ceres::GradientProblemSolver::Options MakeGradientSolverOptions(double tolerance, int max_iterations);

// Cost functor over a scalar objective. Every call is counted into
// *evaluations; a non-finite cost is reported to Ceres as a failed evaluation.
struct ObjectiveCostFunctor {
    ObjectiveCostFunctor(Objective objective, int num_parameters, int* evaluations);

    bool operator()(const double* parameters, double* cost) const;

    Objective objective_;
    int num_parameters_;
    int* evaluations_;
};

using NumericGradientFunction =
    ceres::NumericDiffFirstOrderFunction<ObjectiveCostFunctor, ceres::CENTRAL>;

// First-order function for ceres::GradientProblem, which takes ownership.
// The gradient is taken by Ceres central differences.
NumericGradientFunction* MakeNumericGradientFunction(Objective objective, int num_parameters,
                                                     int* evaluations);

} // namespace bkgfit

#endif // BKGFIT_CERES_UTILS_HH
