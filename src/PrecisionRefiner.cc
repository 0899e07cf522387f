/// @file PrecisionRefiner.cc

#include "PrecisionRefiner.hh"
#include "Constants.hh"
#include "RuntimeConfig.hh"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <Fit/FitResult.h>
#include <Fit/Fitter.h>
#include <Math/Functor.h>
#include <Math/MinimizerOptions.h>

#include "glog/logging.h"

namespace bkgfit {

namespace {

std::string FormatRange(double lo, double hi) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << "(" << lo << ", " << hi << ")";
    return os.str();
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const RefitResult& result) {
    os << "  status: " << result.status << (result.converged ? " (converged)" : " (failed)")
       << "\n  covariance status: " << result.covarianceStatus << "\n  min NLL: " << result.minNll
       << "\n  EDM: " << result.edm;
    if (result.sumW2Corrected) os << "\n  errors corrected for weights";
    for (std::size_t i = 0; i < result.values.size(); ++i) {
        os << "\n    " << (i < result.names.size() ? result.names[i] : "p" + std::to_string(i + 1))
           << " = " << result.values[i] << " +/- " << result.errors[i];
    }
    return os;
}

void AdjustParameterBounds(ModelInstance& instance, const std::vector<double>& seed) {
    std::vector<Parameter>& parameters = instance.Parameters();
    if (seed.size() != parameters.size()) {
        throw std::invalid_argument("AdjustParameterBounds: expected " +
                                    std::to_string(parameters.size()) + " values; got " +
                                    std::to_string(seed.size()));
    }
    const ModelFamily& family = instance.Family();
    const int n = instance.NPars();

    for (std::size_t ip = 0; ip < parameters.size(); ++ip) {
        Parameter& par = parameters[ip];
        const double value = seed[ip];
        const double left = par.lo;
        const double right = par.hi;
        const int index = static_cast<int>(ip) + 1;

        // Seed outside the current range: widen the violated side
        if (value < left) {
            double newLeft = value - Constants::RANGE_WIDENING_FACTOR * std::abs(value);
            const OptionalRange maxRange = family.MaxRange(n, index);
            if (maxRange.lo) newLeft = std::max(newLeft, *maxRange.lo);
            LOG(INFO) << "Increasing range for " << par.name << " on the left: "
                      << FormatRange(left, right) << " -> " << FormatRange(newLeft, right);
            par.lo = newLeft;
        } else if (value > right) {
            double newRight = value + Constants::RANGE_WIDENING_FACTOR * std::abs(value);
            const OptionalRange maxRange = family.MaxRange(n, index);
            if (maxRange.hi) newRight = std::min(newRight, *maxRange.hi);
            LOG(INFO) << "Increasing range for " << par.name << " on the right: "
                      << FormatRange(left, right) << " -> " << FormatRange(left, newRight);
            par.hi = newRight;
        }

        // Range needlessly wide compared to the seed: shrink it around zero
        if (std::abs(value) / (std::min(std::abs(left), std::abs(right)) + Constants::SMALL_SEED_EPSILON) <
            Constants::SMALL_SEED_RATIO) {
            double newLeft = -Constants::RANGE_WIDENING_FACTOR * std::abs(value);
            double newRight = Constants::RANGE_WIDENING_FACTOR * std::abs(value);
            const OptionalRange minRange = family.MinRange(n, index);
            if (minRange.lo) newLeft = std::min(newLeft, *minRange.lo);
            if (minRange.hi) newRight = std::max(newRight, *minRange.hi);
            LOG(INFO) << "Decreasing range for " << par.name << " on both sides: "
                      << FormatRange(left, right) << " -> " << FormatRange(newLeft, newRight);
            par.SetRange(newLeft, newRight);
        }

        par.value = value;
        LOG(INFO) << "Setting " << par.name << " (" << par.title << ") value to " << value
                  << ", range is " << par.lo << " to " << par.hi;
    }
}

void AdjustParameterRanges(ModelInstance& instance, const std::vector<ParameterRange>& ranges) {
    std::vector<Parameter>& parameters = instance.Parameters();
    if (ranges.size() != parameters.size()) {
        throw std::invalid_argument("AdjustParameterRanges: expected " +
                                    std::to_string(parameters.size()) + " ranges; got " +
                                    std::to_string(ranges.size()));
    }
    for (std::size_t ip = 0; ip < parameters.size(); ++ip) {
        parameters[ip].SetRange(ranges[ip].lo, ranges[ip].hi);
        LOG(INFO) << "Setting " << parameters[ip].name << " (" << parameters[ip].title << ") range to "
                  << ranges[ip].lo << " to " << ranges[ip].hi;
    }
}

double MultinomialNll(const ModelInstance& instance, const Histogram& data,
                      const std::vector<double>& parameters) {
    return WeightedMultinomialNll(instance, data, data.Vals(), parameters);
}

double WeightedMultinomialNll(const ModelInstance& instance, const Histogram& data,
                              const std::vector<double>& weights, const std::vector<double>& parameters) {
    const std::vector<double> fractions = instance.BinFractions(data.Binning(), parameters);
    const std::vector<double>& counts = data.Vals();
    double nll = 0.0;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (counts[i] <= 0.0) {
            continue;
        }
        if (!(fractions[i] > 0.0)) {
            return Constants::NON_FINITE_PENALTY;
        }
        nll -= weights[i] * std::log(fractions[i]);
    }
    return std::isfinite(nll) ? nll : Constants::NON_FINITE_PENALTY;
}

std::vector<double> SumOfSquaredWeights(const Histogram& data) {
    const std::vector<double>& vals = data.Vals();
    const std::vector<double>& errs = data.Errs();
    std::vector<double> w2(vals.size());
    for (std::size_t i = 0; i < vals.size(); ++i) {
        w2[i] = errs[i] > 0.0 ? errs[i] * errs[i] : vals[i];
    }
    return w2;
}

bool IsWeighted(const Histogram& data) {
    const std::vector<double>& vals = data.Vals();
    const std::vector<double> w2 = SumOfSquaredWeights(data);
    for (std::size_t i = 0; i < vals.size(); ++i) {
        if (vals[i] > 0.0 && std::abs(w2[i] - vals[i]) > Constants::UNWEIGHTED_TOLERANCE * vals[i]) {
            return true;
        }
    }
    return false;
}

RefitOptions RefitOptions::FromConfig() {
    const RuntimeConfig& config = RuntimeConfig::Instance();
    return {config.refitStrategy, config.refitTolerance, config.refitMaxFunctionCalls,
            config.refitPrintLevel};
}

PrecisionRefiner::PrecisionRefiner() : fOptions(RefitOptions::FromConfig()) {}

RefitResult PrecisionRefiner::Refit(ModelInstance& instance, const std::vector<double>& seed) const {
    return Refit(instance, seed, instance.BoundHistogram());
}

RefitResult PrecisionRefiner::Refit(ModelInstance& instance, const std::vector<double>& seed,
                                    const Histogram& data) const {
    LOG(INFO) << "Fitting " << instance.Id() << " to " << data << " with Minuit2";
    AdjustParameterBounds(instance, seed);

    const std::vector<Parameter>& parameters = instance.Parameters();
    const unsigned int npar = static_cast<unsigned int>(parameters.size());
    const std::vector<double> start = instance.ParameterValues();

    auto fcn = [&instance, &data, npar](const double* p) {
        return MultinomialNll(instance, data, std::vector<double>(p, p + npar));
    };
    ROOT::Math::Functor functor(fcn, npar);

    ROOT::Fit::Fitter fitter;
    fitter.SetFCN(functor, start.data(), static_cast<unsigned int>(data.NBins()));
    fitter.Config().SetMinimizer("Minuit2", "Migrad");
    fitter.Config().MinimizerOptions().SetStrategy(fOptions.strategy);
    fitter.Config().MinimizerOptions().SetTolerance(fOptions.tolerance);
    fitter.Config().MinimizerOptions().SetMaxFunctionCalls(static_cast<unsigned int>(fOptions.maxFunctionCalls));
    fitter.Config().MinimizerOptions().SetPrintLevel(fOptions.printLevel);
    fitter.Config().MinimizerOptions().SetErrorDef(0.5);

    RefitResult result;
    for (unsigned int i = 0; i < npar; ++i) {
        const Parameter& par = parameters[i];
        auto& settings = fitter.Config().ParSettings(i);
        settings.SetName(par.name);
        settings.SetValue(par.value);
        settings.SetStepSize(std::max(0.01 * std::abs(par.value), 0.01 * (par.hi - par.lo) / 10.0));
        settings.SetLimits(par.lo, par.hi);
        result.names.push_back(par.name);
        result.ranges.push_back({par.lo, par.hi});
    }

    bool ok = false;
    try {
        ok = fitter.FitFCN();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Problem fitting pdf " << instance.Id() << ": " << e.what();
        throw;
    }

    // Errors of a weighted fit follow C * H(sum w^2) * C
    if (ok && IsWeighted(data)) {
        const std::vector<double> w2 = SumOfSquaredWeights(data);
        auto fcnW2 = [&instance, &data, w2, npar](const double* p) {
            return WeightedMultinomialNll(instance, data, w2, std::vector<double>(p, p + npar));
        };
        ROOT::Math::Functor functorW2(fcnW2, npar);
        result.sumW2Corrected = fitter.ApplyWeightCorrection(functorW2);
        if (!result.sumW2Corrected) {
            LOG(WARNING) << "Sum-of-weights-squared error correction failed for " << instance.Id()
                         << "; reporting uncorrected errors";
        }
    }

    const ROOT::Fit::FitResult& fit = fitter.Result();
    result.converged = ok && fit.IsValid();
    result.status = fit.Status();
    result.covarianceStatus = fit.CovMatrixStatus();
    result.minNll = fit.MinFcnValue();
    result.edm = fit.Edm();
    if (fit.NPar() == npar) {
        for (unsigned int i = 0; i < npar; ++i) {
            result.values.push_back(fit.Parameter(i));
            result.errors.push_back(fit.ParError(i));
        }
        if (fit.CovMatrixStatus() > 0) {
            result.covariance.assign(npar, std::vector<double>(npar, 0.0));
            for (unsigned int i = 0; i < npar; ++i) {
                for (unsigned int j = 0; j < npar; ++j) {
                    result.covariance[i][j] = fit.CovMatrix(i, j);
                }
            }
        }
        instance.SetParameterValues(result.values);
    } else {
        result.values = start;
        result.errors.assign(npar, 0.0);
    }

    if (result.converged) {
        LOG(INFO) << "Refit of " << instance.Id() << ":\n" << result;
    } else {
        LOG(WARNING) << "Refit of " << instance.Id() << " did not converge:\n" << result;
    }
    return result;
}

}  // namespace bkgfit
