/// @file RuntimeConfig.hh
/// @brief Runtime configuration for the fitting and selection core.
///
/// This class wraps compile-time defaults from Constants.hh but allows
/// runtime overrides from BKGFIT_* environment variables or from a
/// key/value map. If nothing is overridden, the core runs identically to
/// the compile-time configuration.

#ifndef BKGFIT_RUNTIME_CONFIG_HH
#define BKGFIT_RUNTIME_CONFIG_HH

#include "Constants.hh"

#include <map>
#include <string>
#include <vector>

namespace bkgfit {

/// Runtime configuration, initialized from Constants.hh.
///
/// Keys accepted by ApplyOverrides (environment variable in brackets):
///   cache_dir                  [BKGFIT_CACHE_DIR]
///   use_cache                  [BKGFIT_USE_CACHE]
///   bfgs_tolerance             [BKGFIT_BFGS_TOLERANCE]
///   bfgs_max_iterations        [BKGFIT_BFGS_MAX_ITERATIONS]
///   simplex_tolerance          [BKGFIT_SIMPLEX_TOLERANCE]
///   simplex_max_function_calls [BKGFIT_SIMPLEX_MAX_FUNCTION_CALLS]
///   refit_strategy             [BKGFIT_REFIT_STRATEGY]
///   refit_tolerance            [BKGFIT_REFIT_TOLERANCE]
///   refit_max_function_calls   [BKGFIT_REFIT_MAX_FUNCTION_CALLS]
///   refit_print_level          [BKGFIT_REFIT_PRINT_LEVEL]
///   ftest_significance         [BKGFIT_FTEST_SIGNIFICANCE]
///   mass_scale                 [BKGFIT_MASS_SCALE]
///   log_min_level              [BKGFIT_LOG_MIN_LEVEL]
///   log_verbosity              [BKGFIT_LOG_VERBOSITY]
class RuntimeConfig {
public:
    static RuntimeConfig& Instance();

    // Delete copy/move
    RuntimeConfig(const RuntimeConfig&) = delete;
    RuntimeConfig& operator=(const RuntimeConfig&) = delete;
    RuntimeConfig(RuntimeConfig&&) = delete;
    RuntimeConfig& operator=(RuntimeConfig&&) = delete;

    /// Reads every BKGFIT_* variable that is set.
    /// @throws std::invalid_argument on a malformed value
    void ApplyEnvironment();

    /// @throws std::invalid_argument on an unknown key or a malformed value
    void ApplyOverrides(const std::map<std::string, std::string>& overrides);

    /// Restores the compile-time defaults.
    void Reset();

    static std::vector<std::string> Keys();

    // ---- Cache ----
    std::string cacheDirectory{Constants::DEFAULT_CACHE_DIR};
    bool useCache{true};

    // ---- Robust optimizer ----
    double bfgsTolerance{Constants::BFGS_TOLERANCE};
    int bfgsMaxIterations{Constants::BFGS_MAX_ITERATIONS};
    double simplexTolerance{Constants::SIMPLEX_TOLERANCE};
    int simplexMaxFunctionCalls{Constants::SIMPLEX_MAX_FUNCTION_CALLS};

    // ---- Precision refiner ----
    int refitStrategy{Constants::REFIT_STRATEGY};
    double refitTolerance{Constants::REFIT_TOLERANCE};
    int refitMaxFunctionCalls{Constants::REFIT_MAX_FUNCTION_CALLS};
    int refitPrintLevel{Constants::REFIT_PRINT_LEVEL};

    // ---- Model selection ----
    double ftestSignificance{Constants::FTEST_SIGNIFICANCE};
    double massScale{Constants::MASS_SCALE};

    // ---- Logging ----
    int logMinLevel{Constants::LOG_MIN_LEVEL};
    int logVerbosity{Constants::LOG_VERBOSITY};

private:
    RuntimeConfig() = default;
    void Set(const std::string& key, const std::string& value);
};

} // namespace bkgfit

#endif // BKGFIT_RUNTIME_CONFIG_HH
