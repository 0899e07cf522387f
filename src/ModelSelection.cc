/// @file ModelSelection.cc

#include "ModelSelection.hh"
#include "LoggingInit.hh"
#include "RuntimeConfig.hh"

#include <stdexcept>

#include "glog/logging.h"

namespace bkgfit {

SelectionOptions SelectionOptions::FromConfig() {
    const RuntimeConfig& config = RuntimeConfig::Instance();
    SelectionOptions options;
    options.threshold = config.ftestSignificance;
    options.massScale = config.massScale;
    return options;
}

ModelFit FitModel(ModelInstance& instance, const RobustFitter& fitter, const PrecisionRefiner& refiner,
                  bool brute) {
    ModelFit out;
    out.shape = fitter.Fit(instance.ExpressionString(), instance.BoundHistogram(), brute);
    out.refit = refiner.Refit(instance, out.shape.x);
    return out;
}

SelectionResult SelectBackgroundModel(ModelArena& arena, const std::string& family,
                                      std::shared_ptr<const Histogram> histogram, const Histogram& data,
                                      const SelectionOptions& options) {
    LoggingInitializer::InitializeOnce();

    SelectionResult result;
    result.family = family;

    ModelFactory factory(arena, options.massScale);
    result.candidates = factory.MakeAll(family, histogram, options.prefix + "_" + family);

    const RobustFitter fitter(options.cache, options.lock);
    const PrecisionRefiner refiner;
    std::vector<const ModelInstance*> models;
    for (ModelInstance* candidate : result.candidates) {
        result.fits.push_back(FitModel(*candidate, fitter, refiner, options.brute));
        models.push_back(candidate);
    }

    const FisherTest test = FisherTest::FromModels(models, data, options.gofType, options.threshold);
    result.gofs = test.Gofs();
    result.testWinner = test.Run();
    result.winner = result.testWinner;

    const auto forced = options.winners.find(family);
    if (forced != options.winners.end()) {
        if (forced->second >= result.candidates.size()) {
            throw std::invalid_argument("SelectBackgroundModel: winner override " +
                                        std::to_string(forced->second) + " for " + family + " out of range");
        }
        result.winner = forced->second;
    }
    LOG(INFO) << "Chose n_pars=" << result.Winner().NPars() << " for " << family;
    return result;
}

std::vector<SelectionResult> SelectAllBackgroundModels(ModelArena& arena,
                                                       std::shared_ptr<const Histogram> histogram,
                                                       const Histogram& data,
                                                       const SelectionOptions& options) {
    std::vector<SelectionResult> results;
    for (const std::string& family : KnownFamilies()) {
        results.push_back(SelectBackgroundModel(arena, family, histogram, data, options));
    }
    return results;
}

}  // namespace bkgfit
