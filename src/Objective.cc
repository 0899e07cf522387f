/// @file Objective.cc

#include "Objective.hh"

#include <cmath>
#include <numeric>

namespace bkgfit {

double ShapeScaleFactor(const std::vector<double>& model, const std::vector<double>& data) {
    const double modelSum = std::accumulate(model.begin(), model.end(), 0.0);
    if (modelSum == 0.0) {
        return 1.0;
    }
    return std::accumulate(data.begin(), data.end(), 0.0) / modelSum;
}

std::vector<double> ScaledShape(const Expression& expression, const Histogram& histogram,
                                const std::vector<double>& fitParameters) {
    std::vector<double> y = expression.EvaluateOver(histogram.BinCenters(), fitParameters);
    const double scale = ShapeScaleFactor(y, histogram.Vals());
    for (double& v : y) {
        v *= scale;
    }
    return y;
}

Objective BuildChi2(const std::string& expression, const Histogram& histogram) {
    // Parsed once; the closure owns copies of everything it reads
    const Expression parsed = Expression::Parse(expression);
    const Histogram data = histogram;
    return [parsed, data](const std::vector<double>& parameters) {
        const std::vector<double> y = ScaledShape(parsed, data, parameters);
        const std::vector<double>& vals = data.Vals();
        double chi2 = 0.0;
        for (std::size_t i = 0; i < y.size(); ++i) {
            const double d = vals[i] - y[i];
            chi2 += d * d / y[i];
        }
        return chi2;
    };
}

Objective BuildRss(const std::string& expression, const Histogram& histogram) {
    const Expression parsed = Expression::Parse(expression);
    const Histogram data = histogram;
    return [parsed, data](const std::vector<double>& parameters) {
        const std::vector<double> y = ScaledShape(parsed, data, parameters);
        const std::vector<double>& vals = data.Vals();
        double sum = 0.0;
        for (std::size_t i = 0; i < y.size(); ++i) {
            const double d = vals[i] - y[i];
            sum += d * d;
        }
        return std::sqrt(sum);
    };
}

}  // namespace bkgfit
