/// @file ModelSelection.hh
/// @brief End-to-end background model choice for one or all families.
///
/// Every allowed parameter count of a family is shape-fitted to the
/// background histogram, refined by the likelihood fit, scored against the
/// data and passed through the F-test.

#ifndef BKGFIT_MODEL_SELECTION_HH
#define BKGFIT_MODEL_SELECTION_HH

#include "FisherTest.hh"
#include "FitCache.hh"
#include "FitResult.hh"
#include "ModelFamily.hh"
#include "PrecisionRefiner.hh"
#include "RobustFitter.hh"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bkgfit {

struct SelectionOptions {
    GofType gofType{GofType::kRss};
    bool brute{false};
    double threshold{Constants::FTEST_SIGNIFICANCE};
    double massScale{Constants::MASS_SCALE};
    std::map<std::string, std::size_t> winners;  ///< family -> forced winner index
    std::string prefix{"bkg"};                   ///< instance ids are "<prefix>_<family>_npars<N>"
    const FitCache* cache{nullptr};              ///< not owned
    CacheLock* lock{nullptr};                    ///< not owned

    /// Threshold and mass scale from RuntimeConfig.
    static SelectionOptions FromConfig();
};

/// Shape fit of the instance's expression to its histogram, then the
/// likelihood refit seeded with the shape fit result.
struct ModelFit {
    FitResult shape;
    RefitResult refit;
};

ModelFit FitModel(ModelInstance& instance, const RobustFitter& fitter, const PrecisionRefiner& refiner,
                  bool brute = false);

struct SelectionResult {
    std::string family;
    std::vector<ModelInstance*> candidates;  ///< increasing parameter count; owned by the arena
    std::vector<ModelFit> fits;
    std::vector<GoodnessOfFit> gofs;
    std::size_t testWinner{0};  ///< F-test choice
    std::size_t winner{0};      ///< after the override, if any

    ModelInstance& Winner() const { return *candidates.at(winner); }
};

/// Instances are added to the arena, so a second selection of the same family
/// into one arena needs a different options.prefix.
/// @throws UnknownFamilyError, NoConvergenceError, std::invalid_argument for
///         an override index outside the candidate list or an id already in
///         the arena
SelectionResult SelectBackgroundModel(ModelArena& arena, const std::string& family,
                                      std::shared_ptr<const Histogram> histogram, const Histogram& data,
                                      const SelectionOptions& options);

/// SelectBackgroundModel for every family in KnownFamilies().
std::vector<SelectionResult> SelectAllBackgroundModels(ModelArena& arena,
                                                       std::shared_ptr<const Histogram> histogram,
                                                       const Histogram& data,
                                                       const SelectionOptions& options);

}  // namespace bkgfit

#endif  // BKGFIT_MODEL_SELECTION_HH
