/// @file Histogram.hh
/// @brief Binned mass spectrum consumed by the fits.
///
/// A Histogram holds n+1 strictly increasing bin edges, n bin contents and
/// n bin errors plus free-form string metadata. It is validated once on
/// construction and never mutated afterwards; range cuts return copies.

#ifndef BKGFIT_HISTOGRAM_HH
#define BKGFIT_HISTOGRAM_HH

#include <iosfwd>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace bkgfit {

class Histogram {
public:
    using Metadata = std::map<std::string, std::string>;

    /// @throws std::invalid_argument on inconsistent sizes or non-increasing edges
    Histogram(std::vector<double> binning, std::vector<double> vals, std::vector<double> errs,
              Metadata metadata = {});

    const std::vector<double>& Binning() const { return fBinning; }
    const std::vector<double>& Vals() const { return fVals; }
    const std::vector<double>& Errs() const { return fErrs; }
    const Metadata& GetMetadata() const { return fMetadata; }

    std::size_t NBins() const { return fVals.size(); }
    double Min() const { return fBinning.front(); }
    double Max() const { return fBinning.back(); }
    double Integral() const;
    std::vector<double> BinCenters() const;

    /// Drops every bin with left edge < xmin or right edge > xmax.
    /// @throws std::invalid_argument if xmin > xmax
    Histogram Cut(double xmin = -std::numeric_limits<double>::infinity(),
                  double xmax = std::numeric_limits<double>::infinity()) const;

    /// Copy with the first iBinMin bins removed.
    Histogram CutLeft(std::size_t iBinMin) const;

    /// Copy whose errors are the upper 1 sigma Poisson errors of the contents.
    Histogram WithPoissonErrors() const;

    bool operator==(const Histogram& other) const;
    bool operator!=(const Histogram& other) const { return !(*this == other); }

private:
    // Filled in place by the range cuts
    Histogram() = default;

    std::vector<double> fBinning;
    std::vector<double> fVals;
    std::vector<double> fErrs;
    Metadata fMetadata;
};

std::ostream& operator<<(std::ostream& os, const Histogram& h);

/// Upper 1 sigma Poisson error on an observed count N.
double PoissonErrorUp(double n);

/// Histograms keyed by their slash-joined path inside a JSON tree.
using HistogramMap = std::map<std::string, Histogram>;

/// Reads a JSON document and converts every object carrying a "binning" key
/// into a Histogram. Nested objects are traversed recursively.
/// @throws std::runtime_error if the file cannot be parsed
HistogramMap LoadHistogramTree(const std::string& path);

/// Applies Histogram::Cut to every entry.
HistogramMap CutHistograms(const HistogramMap& histograms, double xmin, double xmax);

}  // namespace bkgfit

#endif  // BKGFIT_HISTOGRAM_HH
