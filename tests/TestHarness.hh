/// @file TestHarness.hh
/// @brief Minimal assertion harness shared by the unit test executables.

#ifndef BKGFIT_TEST_HARNESS_HH
#define BKGFIT_TEST_HARNESS_HH

#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "Expression.hh"
#include "Histogram.hh"

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int g_testCount = 0;
static int g_passCount = 0;

[[maybe_unused]] static bool approxEqual(double a, double b, double tol = 1e-3) {
    return std::abs(a - b) < tol;
}

#define RUN_TEST(func)                                                                                                 \
    do {                                                                                                               \
        ++g_testCount;                                                                                                 \
        try {                                                                                                          \
            func();                                                                                                    \
            ++g_passCount;                                                                                             \
            std::cout << "  PASS  " << #func << "\n";                                                                  \
        } catch (const std::exception& e) {                                                                            \
            std::cerr << "  FAIL  " << #func << " : " << e.what() << "\n";                                             \
        } catch (...) {                                                                                                \
            std::cerr << "  FAIL  " << #func << " : unknown exception\n";                                              \
        }                                                                                                              \
    } while (false)

#define TEST_ASSERT(cond)                                                                                              \
    do {                                                                                                               \
        if (!(cond)) {                                                                                                 \
            throw std::runtime_error(std::string("Assertion failed: ") + #cond + " (" + __FILE__ + ":" +               \
                                     std::to_string(__LINE__) + ")");                                                  \
        }                                                                                                              \
    } while (false)

#define TEST_THROWS(expr, ExceptionType)                                                                               \
    do {                                                                                                               \
        bool thrown_ = false;                                                                                          \
        try {                                                                                                          \
            (void)(expr);                                                                                              \
        } catch (const ExceptionType&) {                                                                               \
            thrown_ = true;                                                                                            \
        }                                                                                                              \
        if (!thrown_) {                                                                                                \
            throw std::runtime_error(std::string("Expected ") + #ExceptionType + " from " + #expr + " (" +            \
                                     __FILE__ + ":" + std::to_string(__LINE__) + ")");                                 \
        }                                                                                                              \
    } while (false)

static int reportResults() {
    std::cout << "\n=== Results: " << g_passCount << " / " << g_testCount << " passed ===\n";

    if (g_passCount == g_testCount) {
        std::cout << "All tests passed.\n";
        return 0;
    } else {
        std::cerr << (g_testCount - g_passCount) << " test(s) FAILED.\n";
        return 1;
    }
}

// Evenly spaced edges on [lo, hi]
[[maybe_unused]] static std::vector<double> uniformEdges(double lo, double hi, int nBins) {
    std::vector<double> edges(nBins + 1);
    for (int i = 0; i <= nBins; ++i) {
        edges[i] = lo + (hi - lo) * i / nBins;
    }
    return edges;
}

// Histogram whose contents are the expression at the bin centres, scaled to total
[[maybe_unused]] static bkgfit::Histogram shapeHistogram(const std::string& expression,
                                                          const std::vector<double>& fitParameters,
                                                          const std::vector<double>& edges, double total) {
    std::vector<double> centers(edges.size() - 1);
    for (std::size_t i = 0; i + 1 < edges.size(); ++i) {
        centers[i] = 0.5 * (edges[i] + edges[i + 1]);
    }
    std::vector<double> vals = bkgfit::Expression::Parse(expression).EvaluateOver(centers, fitParameters);
    double sum = 0.0;
    for (double v : vals) sum += v;
    std::vector<double> errs(vals.size());
    for (std::size_t i = 0; i < vals.size(); ++i) {
        vals[i] *= total / sum;
        errs[i] = std::sqrt(vals[i]);
    }
    return bkgfit::Histogram(edges, vals, errs);
}

// Fresh empty directory under the system temp path
[[maybe_unused]] static std::string scratchDirectory(const std::string& name) {
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("bkgfit_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

#endif  // BKGFIT_TEST_HARNESS_HH
