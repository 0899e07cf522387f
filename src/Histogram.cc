/// @file Histogram.cc
/// @brief Histogram validation, range cuts and JSON tree loading.

#include "Histogram.hh"
#include "Constants.hh"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "Math/QuantFuncMathCore.h"
#include "glog/logging.h"

namespace bkgfit {

namespace {

std::vector<double> ReadArray(const boost::property_tree::ptree& node, const std::string& key) {
    std::vector<double> out;
    const auto child = node.get_child_optional(key);
    if (!child) {
        return out;
    }
    for (const auto& item : *child) {
        out.push_back(item.second.get_value<double>());
    }
    return out;
}

void CollectHistograms(const boost::property_tree::ptree& node, const std::string& path,
                       HistogramMap& out) {
    if (node.get_child_optional("binning")) {
        Histogram::Metadata metadata;
        if (const auto meta = node.get_child_optional("metadata")) {
            for (const auto& item : *meta) {
                metadata[item.first] = item.second.data();
            }
        }
        out.emplace(path, Histogram(ReadArray(node, "binning"), ReadArray(node, "vals"),
                                    ReadArray(node, "errs"), std::move(metadata)));
        return;
    }
    for (const auto& item : node) {
        if (item.first.empty()) {
            continue;  // array element, not a named subtree
        }
        CollectHistograms(item.second, path.empty() ? item.first : path + "/" + item.first, out);
    }
}

}  // namespace

Histogram::Histogram(std::vector<double> binning, std::vector<double> vals,
                     std::vector<double> errs, Metadata metadata)
    : fBinning(std::move(binning)),
      fVals(std::move(vals)),
      fErrs(std::move(errs)),
      fMetadata(std::move(metadata)) {
    if (fBinning.size() < 2) {
        throw std::invalid_argument("Histogram: need at least two bin edges");
    }
    if (fVals.size() != fBinning.size() - 1 || fErrs.size() != fVals.size()) {
        std::ostringstream msg;
        msg << "Histogram: inconsistent sizes (edges=" << fBinning.size() << ", vals=" << fVals.size()
            << ", errs=" << fErrs.size() << ")";
        throw std::invalid_argument(msg.str());
    }
    for (std::size_t i = 1; i < fBinning.size(); ++i) {
        if (!(fBinning[i] > fBinning[i - 1])) {
            throw std::invalid_argument("Histogram: bin edges must be strictly increasing");
        }
    }
}

double Histogram::Integral() const {
    return std::accumulate(fVals.begin(), fVals.end(), 0.0);
}

std::vector<double> Histogram::BinCenters() const {
    std::vector<double> centers(NBins());
    for (std::size_t i = 0; i < NBins(); ++i) {
        centers[i] = 0.5 * (fBinning[i] + fBinning[i + 1]);
    }
    return centers;
}

Histogram Histogram::Cut(double xmin, double xmax) const {
    if (xmin > xmax) {
        std::ostringstream msg;
        msg << "xmin (" << xmin << ") greater than xmax (" << xmax << ")";
        throw std::invalid_argument(msg.str());
    }

    std::size_t imin = 0;
    if (xmin > fBinning.front()) {
        imin = std::lower_bound(fBinning.begin(), fBinning.end(), xmin) - fBinning.begin();
    }
    std::size_t imax = NBins() + 1;
    if (xmax < fBinning.back()) {
        imax = std::upper_bound(fBinning.begin(), fBinning.end(), xmax) - fBinning.begin();
    }
    if (imax < imin + 2) {
        throw std::invalid_argument("Histogram::Cut: range keeps no complete bin");
    }

    Histogram h;
    h.fBinning.assign(fBinning.begin() + imin, fBinning.begin() + imax);
    h.fVals.assign(fVals.begin() + imin, fVals.begin() + (imax - 1));
    h.fErrs.assign(fErrs.begin() + imin, fErrs.begin() + (imax - 1));
    h.fMetadata = fMetadata;
    return h;
}

Histogram Histogram::CutLeft(std::size_t iBinMin) const {
    if (iBinMin == 0) {
        return *this;
    }
    if (iBinMin >= NBins()) {
        throw std::invalid_argument("Histogram::CutLeft: would remove every bin");
    }
    Histogram h;
    h.fBinning.assign(fBinning.begin() + iBinMin, fBinning.end());
    h.fVals.assign(fVals.begin() + iBinMin, fVals.end());
    h.fErrs.assign(fErrs.begin() + iBinMin, fErrs.end());
    h.fMetadata = fMetadata;
    return h;
}

Histogram Histogram::WithPoissonErrors() const {
    Histogram h = *this;
    for (std::size_t i = 0; i < NBins(); ++i) {
        h.fErrs[i] = PoissonErrorUp(fVals[i]);
    }
    return h;
}

bool Histogram::operator==(const Histogram& other) const {
    return fVals == other.fVals && fErrs == other.fErrs && fBinning == other.fBinning;
}

std::ostream& operator<<(std::ostream& os, const Histogram& h) {
    const std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(3) << "<H n=" << h.NBins() << " int=" << h.Integral()
       << std::setprecision(1) << " binning=" << h.Min() << "-" << h.Max() << ">";
    os.unsetf(std::ios_base::floatfield);
    os.precision(precision);
    return os;
}

double PoissonErrorUp(double n) {
    const double alpha = 1.0 - Constants::ONE_SIGMA_COVERAGE;
    const double upper = ROOT::Math::gamma_quantile_c(alpha / 2.0, n + 1.0, 1.0);
    return upper - n;
}

HistogramMap LoadHistogramTree(const std::string& path) {
    boost::property_tree::ptree tree;
    try {
        boost::property_tree::read_json(path, tree);
    } catch (const boost::property_tree::json_parser_error& e) {
        throw std::runtime_error("LoadHistogramTree: cannot parse " + path + ": " + e.what());
    }
    HistogramMap out;
    CollectHistograms(tree, "", out);
    LOG(INFO) << "Loaded " << out.size() << " histogram(s) from " << path;
    return out;
}

HistogramMap CutHistograms(const HistogramMap& histograms, double xmin, double xmax) {
    HistogramMap out;
    for (const auto& [key, hist] : histograms) {
        out.emplace(key, hist.Cut(xmin, xmax));
    }
    return out;
}

}  // namespace bkgfit
