/// @file test_runtime_config.cpp
/// @brief Unit tests for runtime overrides of the compile-time defaults.

#include <cstdlib>

#include "FitCache.hh"
#include "LoggingInit.hh"
#include "Minimizers.hh"
#include "RuntimeConfig.hh"
#include "TestHarness.hh"

using namespace bkgfit;

void test_defaults_match_constants() {
    RuntimeConfig& config = RuntimeConfig::Instance();
    config.Reset();
    TEST_ASSERT(config.cacheDirectory == Constants::DEFAULT_CACHE_DIR);
    TEST_ASSERT(config.useCache);
    TEST_ASSERT(config.bfgsTolerance == Constants::BFGS_TOLERANCE);
    TEST_ASSERT(config.simplexTolerance == Constants::SIMPLEX_TOLERANCE);
    TEST_ASSERT(config.refitStrategy == Constants::REFIT_STRATEGY);
    TEST_ASSERT(config.ftestSignificance == Constants::FTEST_SIGNIFICANCE);
    TEST_ASSERT(RuntimeConfig::Keys().size() == 14);
}

void test_apply_overrides() {
    RuntimeConfig& config = RuntimeConfig::Instance();
    config.Reset();
    config.ApplyOverrides({{"simplex_tolerance", "1e-8"},
                           {"use_cache", "off"},
                           {"refit_strategy", "1"},
                           {"cache_dir", "/tmp/elsewhere"}});
    TEST_ASSERT(config.simplexTolerance == 1e-8);
    TEST_ASSERT(!config.useCache);
    TEST_ASSERT(config.refitStrategy == 1);
    TEST_ASSERT(config.cacheDirectory == "/tmp/elsewhere");

    // Options read the live configuration
    TEST_ASSERT(SingleFitOptions::NelderMead().tolerance == 1e-8);
    config.Reset();
    TEST_ASSERT(SingleFitOptions::NelderMead().tolerance == Constants::SIMPLEX_TOLERANCE);
}

void test_rejects_bad_input() {
    RuntimeConfig& config = RuntimeConfig::Instance();
    config.Reset();
    TEST_THROWS(config.ApplyOverrides({{"no_such_key", "1"}}), std::invalid_argument);
    TEST_THROWS(config.ApplyOverrides({{"bfgs_tolerance", "tight"}}), std::invalid_argument);
    TEST_THROWS(config.ApplyOverrides({{"refit_strategy", "2.5"}}), std::invalid_argument);
    TEST_THROWS(config.ApplyOverrides({{"use_cache", "maybe"}}), std::invalid_argument);
    TEST_THROWS(config.ApplyOverrides({{"cache_dir", ""}}), std::invalid_argument);
    TEST_ASSERT(config.bfgsTolerance == Constants::BFGS_TOLERANCE);
}

void test_apply_environment() {
    RuntimeConfig& config = RuntimeConfig::Instance();
    config.Reset();
    ::setenv("BKGFIT_FTEST_SIGNIFICANCE", "0.05", 1);
    ::setenv("BKGFIT_MASS_SCALE", "13000", 1);
    config.ApplyEnvironment();
    TEST_ASSERT(config.ftestSignificance == 0.05);
    TEST_ASSERT(config.massScale == 13000.0);

    ::setenv("BKGFIT_BFGS_MAX_ITERATIONS", "lots", 1);
    TEST_THROWS(config.ApplyEnvironment(), std::invalid_argument);
    ::unsetenv("BKGFIT_FTEST_SIGNIFICANCE");
    ::unsetenv("BKGFIT_MASS_SCALE");
    ::unsetenv("BKGFIT_BFGS_MAX_ITERATIONS");
    config.Reset();
}

void test_configured_cache() {
    RuntimeConfig& config = RuntimeConfig::Instance();
    const std::string dir = scratchDirectory("configured") + "/cache";
    config.ApplyOverrides({{"cache_dir", dir}});
    const auto cache = OpenConfiguredCache();
    TEST_ASSERT(cache != nullptr);
    TEST_ASSERT(cache->Directory() == dir);
    TEST_ASSERT(std::filesystem::is_directory(dir));

    config.ApplyOverrides({{"use_cache", "no"}});
    TEST_ASSERT(OpenConfiguredCache() == nullptr);
    config.Reset();
    std::filesystem::remove_all(std::filesystem::path(dir).parent_path());
}

void test_logging_initializes_once() {
    LoggingInitializer::InitializeOnce();
    LoggingInitializer::InitializeOnce();
}

int main() {
    std::cout << "=== Runtime Config Unit Tests ===\n\n";

    RUN_TEST(test_defaults_match_constants);
    RUN_TEST(test_apply_overrides);
    RUN_TEST(test_rejects_bad_input);
    RUN_TEST(test_apply_environment);
    RUN_TEST(test_configured_cache);
    RUN_TEST(test_logging_initializes_once);

    return reportResults();
}
