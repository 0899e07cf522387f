/// @file ModelFamily.hh
/// @brief Catalog of parametric background shapes and their concrete instances.
///
/// A ModelFamily is a named functional form available for a contiguous
/// range of parameter counts. A ModelInstance is one parameter count of one
/// family bound to a histogram; instances are owned by a ModelArena keyed by
/// a stable id and are handed out by reference.

#ifndef BKGFIT_MODEL_FAMILY_HH
#define BKGFIT_MODEL_FAMILY_HH

#include "Constants.hh"
#include "Expression.hh"
#include "Histogram.hh"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bkgfit {

/// Closed interval of allowed parameter values.
struct ParameterRange {
    double lo{Constants::DEFAULT_PAR_MIN};
    double hi{Constants::DEFAULT_PAR_MAX};
};

/// Range with optionally undeclared edges (hard minimum / maximum ranges).
struct OptionalRange {
    std::optional<double> lo;
    std::optional<double> hi;
};

/// Template for one parameter count of a family. Parameter keys are 1-based.
struct FamilyEntry {
    std::string expression;                 ///< uses {0} for the mass scale
    std::map<int, ParameterRange> pars;     ///< default ranges
    std::map<int, OptionalRange> mins;      ///< ranges never shrunk below
    std::map<int, OptionalRange> maxs;      ///< ranges never widened beyond
};

/// Fit parameter of a model instance.
struct Parameter {
    std::string name;
    std::string title;
    double value{Constants::DEFAULT_PAR_VALUE};
    double lo{Constants::DEFAULT_PAR_MIN};
    double hi{Constants::DEFAULT_PAR_MAX};

    void SetRange(double newLo, double newHi) {
        lo = newLo;
        hi = newHi;
    }
};

class ModelFamily {
public:
    /// @throws std::invalid_argument if entries is empty or the counts are not contiguous
    ModelFamily(std::string name, std::map<int, FamilyEntry> entries);

    const std::string& Name() const { return fName; }
    int NMin() const { return fNMin; }
    int NMax() const { return fNMax; }

    /// @throws InvalidParameterCountError if n is outside [NMin, NMax]
    void CheckN(int n) const;

    /// Template for n parameters with {0} replaced by the mass scale.
    std::string ExpressionFor(int n, double massScale = Constants::MASS_SCALE) const;

    /// Fresh parameters "<prefix>_p1".."<prefix>_pN", value 1, default ranges.
    std::vector<Parameter> MakeParameters(int n, const std::string& prefix) const;

    /// Declared hard minimum range of parameter i (1-based); empty if none.
    OptionalRange MinRange(int n, int i) const;

    /// Declared hard maximum range of parameter i (1-based); empty if none.
    OptionalRange MaxRange(int n, int i) const;

private:
    const FamilyEntry& Entry(int n) const;

    std::string fName;
    std::map<int, FamilyEntry> fEntries;
    int fNMin{0};
    int fNMax{0};
};

using ModelFamilyPtr = std::shared_ptr<const ModelFamily>;

/// The built-in families: main, alt, ua2, ua2mod, modexp, polpow.
const std::map<std::string, ModelFamilyPtr>& FamilyCatalog();

/// @throws UnknownFamilyError
ModelFamilyPtr GetFamily(const std::string& name);

/// Families that are fitted and F-tested by default.
std::vector<std::string> KnownFamilies();

class ModelInstance {
public:
    ModelInstance(std::string id, ModelFamilyPtr family, int nPars,
                  std::shared_ptr<const Histogram> histogram,
                  double massScale = Constants::MASS_SCALE);

    const std::string& Id() const { return fId; }
    const ModelFamily& Family() const { return *fFamily; }
    const std::string& FamilyName() const { return fFamily->Name(); }
    int NPars() const { return fNPars; }

    const std::string& ExpressionString() const { return fExpression.Source(); }
    const Expression& GetExpression() const { return fExpression; }

    std::vector<Parameter>& Parameters() { return fParameters; }
    const std::vector<Parameter>& Parameters() const { return fParameters; }
    std::vector<double> ParameterValues() const;
    void SetParameterValues(const std::vector<double>& values);

    const Histogram& BoundHistogram() const { return *fHistogram; }
    const std::shared_ptr<const Histogram>& BoundHistogramPtr() const { return fHistogram; }

    /// Shape values at xs with the current parameters, normalized to unit sum.
    std::vector<double> Evaluate(const std::vector<double>& xs) const;

    /// Integral of the shape over each bin of binning for the given parameters.
    std::vector<double> BinIntegrals(const std::vector<double>& binning,
                                     const std::vector<double>& parameters) const;

    /// BinIntegrals normalized to unit sum (all zero if the integral vanishes).
    std::vector<double> BinFractions(const std::vector<double>& binning,
                                     const std::vector<double>& parameters) const;

private:
    std::string fId;
    ModelFamilyPtr fFamily;
    int fNPars;
    Expression fExpression;
    std::vector<Parameter> fParameters;
    std::shared_ptr<const Histogram> fHistogram;
};

std::ostream& operator<<(std::ostream& os, const ModelInstance& model);

/// Owns every ModelInstance of a run, keyed by its id.
class ModelArena {
public:
    ModelArena() = default;
    ModelArena(const ModelArena&) = delete;
    ModelArena& operator=(const ModelArena&) = delete;

    /// @throws std::invalid_argument if the id is already taken
    ModelInstance& Emplace(std::unique_ptr<ModelInstance> instance);

    /// @throws std::out_of_range for an unknown id
    ModelInstance& Get(const std::string& id);
    const ModelInstance& Get(const std::string& id) const;

    bool Contains(const std::string& id) const { return fInstances.count(id) > 0; }
    std::size_t Size() const { return fInstances.size(); }

    /// Hands ownership of an instance back to the caller.
    std::unique_ptr<ModelInstance> Release(const std::string& id);

private:
    std::map<std::string, std::unique_ptr<ModelInstance>> fInstances;
};

/// Builds instances into an arena.
class ModelFactory {
public:
    explicit ModelFactory(ModelArena& arena, double massScale = Constants::MASS_SCALE)
        : fArena(arena), fMassScale(massScale) {}

    /// One instance with id "<name>_npars<N>".
    /// @throws InvalidParameterCountError, UnknownFamilyError
    ModelInstance& Make(const std::string& family, int nPars,
                        std::shared_ptr<const Histogram> histogram, const std::string& name);
    ModelInstance& Make(ModelFamilyPtr family, int nPars,
                        std::shared_ptr<const Histogram> histogram, const std::string& name);

    /// One instance per allowed parameter count, in increasing order, or only
    /// nPars when given.
    std::vector<ModelInstance*> MakeAll(const std::string& family,
                                        std::shared_ptr<const Histogram> histogram,
                                        const std::string& name,
                                        std::optional<int> nPars = std::nullopt);
    std::vector<ModelInstance*> MakeAll(ModelFamilyPtr family,
                                        std::shared_ptr<const Histogram> histogram,
                                        const std::string& name,
                                        std::optional<int> nPars = std::nullopt);

private:
    ModelArena& fArena;
    double fMassScale;
};

}  // namespace bkgfit

#endif  // BKGFIT_MODEL_FAMILY_HH
