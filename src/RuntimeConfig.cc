/// @file RuntimeConfig.cc
/// @brief Implementation of the RuntimeConfig singleton and its override keys.

#include "RuntimeConfig.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include "glog/logging.h"

namespace bkgfit {

namespace {

double ParseDouble(const std::string& key, const std::string& value) {
    std::size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw std::invalid_argument("RuntimeConfig: malformed value '" + value + "' for " + key);
    }
    return out;
}

int ParseInt(const std::string& key, const std::string& value) {
    std::size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw std::invalid_argument("RuntimeConfig: malformed value '" + value + "' for " + key);
    }
    return out;
}

bool ParseBool(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw std::invalid_argument("RuntimeConfig: malformed value '" + value + "' for " + key);
}

std::string EnvironmentName(const std::string& key) {
    std::string name = "BKGFIT_" + key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return name;
}

} // namespace

RuntimeConfig& RuntimeConfig::Instance() {
    static RuntimeConfig instance;
    return instance;
}

std::vector<std::string> RuntimeConfig::Keys() {
    return {"cache_dir",       "use_cache",          "bfgs_tolerance",
            "bfgs_max_iterations", "simplex_tolerance", "simplex_max_function_calls",
            "refit_strategy",  "refit_tolerance",    "refit_max_function_calls",
            "refit_print_level", "ftest_significance", "mass_scale",
            "log_min_level",   "log_verbosity"};
}

void RuntimeConfig::Set(const std::string& key, const std::string& value) {
    if (key == "cache_dir") {
        if (value.empty()) {
            throw std::invalid_argument("RuntimeConfig: cache_dir must not be empty");
        }
        cacheDirectory = value;
    } else if (key == "use_cache") {
        useCache = ParseBool(key, value);
    } else if (key == "bfgs_tolerance") {
        bfgsTolerance = ParseDouble(key, value);
    } else if (key == "bfgs_max_iterations") {
        bfgsMaxIterations = ParseInt(key, value);
    } else if (key == "simplex_tolerance") {
        simplexTolerance = ParseDouble(key, value);
    } else if (key == "simplex_max_function_calls") {
        simplexMaxFunctionCalls = ParseInt(key, value);
    } else if (key == "refit_strategy") {
        refitStrategy = ParseInt(key, value);
    } else if (key == "refit_tolerance") {
        refitTolerance = ParseDouble(key, value);
    } else if (key == "refit_max_function_calls") {
        refitMaxFunctionCalls = ParseInt(key, value);
    } else if (key == "refit_print_level") {
        refitPrintLevel = ParseInt(key, value);
    } else if (key == "ftest_significance") {
        ftestSignificance = ParseDouble(key, value);
    } else if (key == "mass_scale") {
        massScale = ParseDouble(key, value);
    } else if (key == "log_min_level") {
        logMinLevel = ParseInt(key, value);
    } else if (key == "log_verbosity") {
        logVerbosity = ParseInt(key, value);
    } else {
        throw std::invalid_argument("RuntimeConfig: unknown key '" + key + "'");
    }
}

void RuntimeConfig::ApplyOverrides(const std::map<std::string, std::string>& overrides) {
    for (const auto& [key, value] : overrides) {
        Set(key, value);
        VLOG(1) << "RuntimeConfig: " << key << " = " << value;
    }
}

void RuntimeConfig::ApplyEnvironment() {
    for (const auto& key : Keys()) {
        const char* value = std::getenv(EnvironmentName(key).c_str());
        if (value != nullptr) {
            Set(key, value);
        }
    }
}

void RuntimeConfig::Reset() {
    cacheDirectory = Constants::DEFAULT_CACHE_DIR;
    useCache = true;
    bfgsTolerance = Constants::BFGS_TOLERANCE;
    bfgsMaxIterations = Constants::BFGS_MAX_ITERATIONS;
    simplexTolerance = Constants::SIMPLEX_TOLERANCE;
    simplexMaxFunctionCalls = Constants::SIMPLEX_MAX_FUNCTION_CALLS;
    refitStrategy = Constants::REFIT_STRATEGY;
    refitTolerance = Constants::REFIT_TOLERANCE;
    refitMaxFunctionCalls = Constants::REFIT_MAX_FUNCTION_CALLS;
    refitPrintLevel = Constants::REFIT_PRINT_LEVEL;
    ftestSignificance = Constants::FTEST_SIGNIFICANCE;
    massScale = Constants::MASS_SCALE;
    logMinLevel = Constants::LOG_MIN_LEVEL;
    logVerbosity = Constants::LOG_VERBOSITY;
}

} // namespace bkgfit
