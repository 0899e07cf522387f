#ifndef BKGFIT_CONSTANTS_HH
#define BKGFIT_CONSTANTS_HH

namespace bkgfit::Constants {

    // ========================
    // MODEL CATALOG
    // ========================

    // Mass scale substituted for {0} in the expression templates (GeV)
    constexpr double MASS_SCALE = 1000.0;

    // Range used for a parameter the family does not declare
    constexpr double DEFAULT_PAR_MIN = -100.0;
    constexpr double DEFAULT_PAR_MAX = 100.0;

    // Starting value of every freshly built parameter
    constexpr double DEFAULT_PAR_VALUE = 1.0;

    // ========================
    // ROBUST OPTIMIZER
    // ========================

    // Phase A: loose gradient-based search (BFGS)
    constexpr double BFGS_TOLERANCE = 1e-3;
    constexpr int BFGS_MAX_ITERATIONS = 2000;

    // Phase B: tight derivative-free refinement (Nelder-Mead)
    constexpr double SIMPLEX_TOLERANCE = 1e-6;
    constexpr int SIMPLEX_MAX_FUNCTION_CALLS = 10000;

    // Brute force start values per parameter
    constexpr double BRUTE_START_LOW = -1.0;
    constexpr double BRUTE_START_HIGH = 1.0;

    // Value handed to Minuit in place of a non-finite objective
    constexpr double NON_FINITE_PENALTY = 1e10;

    // Cache tag of the overall robust fit
    constexpr const char* ROBUST_TAG = "robust";

    // ========================
    // PRECISION REFINER
    // ========================

    // Out-of-range seeds widen the violated side to seed +/- 10*|seed|
    constexpr double RANGE_WIDENING_FACTOR = 10.0;

    // |seed| / min(|lo|, |hi|) below this shrinks the range to +/- 10*|seed|
    constexpr double SMALL_SEED_RATIO = 0.1;
    constexpr double SMALL_SEED_EPSILON = 1e-10;

    // Minuit2 settings for the likelihood refit
    constexpr int REFIT_STRATEGY = 2;
    constexpr double REFIT_TOLERANCE = 1e-2;
    constexpr int REFIT_MAX_FUNCTION_CALLS = 100000;
    constexpr int REFIT_PRINT_LEVEL = 0;

    // Relative mismatch of err^2 and content above which a bin counts as weighted
    constexpr double UNWEIGHTED_TOLERANCE = 1e-6;

    // Sub-intervals per bin for the Simpson bin integral
    constexpr int BIN_INTEGRATION_STEPS = 4;

    // ========================
    // MODEL SELECTION
    // ========================

    // Null hypothesis (extra parameters not justified) kept above this
    constexpr double FTEST_SIGNIFICANCE = 0.07;

    // 1 sigma coverage used for Poisson error bars
    constexpr double ONE_SIGMA_COVERAGE = 0.6827;

    // ========================
    // FIT CACHE
    // ========================

    constexpr const char* DEFAULT_CACHE_DIR = "fit_cache";
    constexpr const char* CACHE_LOCK_FILE = ".lock";

    // ========================
    // LOGGING
    // ========================

    // glog severity below which messages are dropped (0 = INFO)
    constexpr int LOG_MIN_LEVEL = 0;
    // glog VLOG verbosity; 1 shows per-start brute force detail
    constexpr int LOG_VERBOSITY = 0;

} // namespace bkgfit::Constants

#endif // BKGFIT_CONSTANTS_HH
