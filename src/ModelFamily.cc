/// @file ModelFamily.cc
/// @brief Family catalog, model instances, arena and factory.

#include "ModelFamily.hh"
#include "FitErrors.hh"

#include <cmath>
#include <iomanip>
#include <numeric>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include "glog/logging.h"

namespace bkgfit {

namespace {

std::string FormatScale(double massScale) {
    std::ostringstream os;
    os << std::setprecision(17) << massScale;
    return os.str();
}

std::string SubstituteScale(const std::string& expression, const std::string& scale) {
    static const std::string kPlaceholder = "{0}";
    std::string out;
    out.reserve(expression.size() + 16);
    std::size_t pos = 0;
    while (true) {
        const std::size_t hit = expression.find(kPlaceholder, pos);
        if (hit == std::string::npos) {
            out.append(expression, pos, std::string::npos);
            return out;
        }
        out.append(expression, pos, hit - pos);
        out.append(scale);
        pos = hit + kPlaceholder.size();
    }
}

std::map<std::string, ModelFamilyPtr> BuildCatalog() {
    std::map<std::string, ModelFamilyPtr> catalog;
    auto add = [&catalog](const std::string& name, std::map<int, FamilyEntry> entries) {
        catalog.emplace(name, std::make_shared<const ModelFamily>(name, std::move(entries)));
    };

    // Model NM has N parameters on (1-x) and M on x; exponents are (p_i + p_{i+1} * log(x))
    add("main", {
        {2, {"pow(1 - @0/{0}, @1) * pow(@0/{0}, -(@2))",
             {{1, {-30., 30.}}, {2, {-10., 10.}}}, {}, {}}},
        {3, {"pow(1 - @0/{0}, @1) * pow(@0/{0}, -(@2+@3*log(@0/{0})))",
             {{1, {-45., 45.}}, {2, {-10., 10.}}, {3, {-15., 15.}}}, {}, {}}},
        {4, {"pow(1 - @0/{0}, @1) * pow(@0/{0}, -(@2+@3*log(@0/{0})+@4*pow(log(@0/{0}),2)))",
             {{1, {-95., 95.}}, {2, {-25., 20.}}, {3, {-2., 2.}}, {4, {-2., 2.}}}, {}, {}}},
        {5, {"pow(1 - @0/{0}, @1+@2*log(@0/{0})+@3*pow(log(@0/{0}),2)) * pow(@0/{0}, -(@4+@5*log(@0/{0})))",
             {{1, {-15., 15.}}, {2, {-95., 95.}}, {3, {-25., 25.}}, {4, {-5., 5.}}, {5, {-1.5, 1.5}}}, {}, {}}},
    });

    add("alt", {
        {2, {"exp(@1*(@0/{0})) * pow(@0/{0},@2)",
             {{1, {-50., 50.}}, {2, {-10., 10.}}}, {}, {}}},
        {3, {"exp(@1*(@0/{0})) * pow(@0/{0},@2*(1+@3*log(@0/{0})))", {}, {}, {}}},
        {4, {"exp(@1*(@0/{0})) * pow(@0/{0},@2*(1+@3*log(@0/{0})*(1+@4*log(@0/{0}))))",
             {{1, {-150., 150.}}, {2, {-100., 100.}}, {3, {-10., 10.}}, {4, {-10., 10.}}}, {}, {}}},
    });

    add("ua2", {
        {2, {"pow(@0/{0}, @1) * exp(@0/{0}*(@2))", {}, {}, {}}},
        {3, {"pow(@0/{0}, @1) * exp(@0/{0}*(@2+ @3*@0/{0}))", {}, {}, {}}},
        {4, {"pow(@0/{0}, @1) * exp(@0/{0}*(@2+ @3*@0/{0} + @4*pow(@0/{0},2)))", {}, {}, {}}},
        {5, {"pow(@0/{0}, @1) * exp(@0/{0}*(@2+ @3*@0/{0} + @4*pow(@0/{0},2) + @5*pow(@0/{0},3)))",
             {}, {}, {}}},
    });

    add("ua2mod", {
        {1, {"exp(@1*@0/{0})", {}, {}, {}}},
        {2, {"exp(@1*@0/{0} + @2*pow(@0/{0},2))", {}, {}, {}}},
        {3, {"exp(@1*@0/{0} + @2*pow(@0/{0},2) + @3*pow(@0/{0},3))", {}, {}, {}}},
        {4, {"exp(@1*@0/{0} + @2*pow(@0/{0},2) + @3*pow(@0/{0},3) + @4*pow(@0/{0},4))", {}, {}, {}}},
        {5, {"exp(@1*@0/{0} + @2*pow(@0/{0},2) + @3*pow(@0/{0},3) + @4*pow(@0/{0},4) + @5*pow(@0/{0},5))",
             {}, {}, {}}},
    });

    add("modexp", {
        {2, {"exp(@1*pow(@0/{0}, @2))",
             {{1, {-20., 0.}}, {2, {0., 10.}}}, {}, {}}},
        {3, {"exp(@1*pow(@0/{0}, @2)+@1*pow(1-@0/{0}, @3))",
             {{1, {-20., 0.}}, {2, {0., 10.}}, {3, {-10., 0.}}}, {}, {}}},
        {4, {"exp(@1*pow(@0/{0}, @2)+@4*pow(1-@0/{0}, @3))",
             {{1, {-20., 0.}}, {2, {0., 10.}}, {3, {-10., 0.}}, {4, {-20., 0.}}}, {}, {}}},
    });

    add("polpow", {
        {2, {"pow(1 + @1*@0/{0},-@2)",
             {{1, {0., 50.}}, {2, {-50., 0.}}}, {}, {}}},
        {3, {"pow(1 + @1*@0/{0} + @2*pow(@0/{0},2),-@3)",
             {{1, {0., 50.}}, {2, {0., 50.}}, {3, {-50., 0.}}}, {}, {}}},
        {4, {"pow(1 + @1*@0/{0} + @2*pow(@0/{0},2) + @3*pow(@0/{0},3),-@4)",
             {{1, {0., 50.}}, {2, {0., 50.}}, {3, {0., 50.}}, {4, {-50., 0.}}}, {}, {}}},
        {5, {"pow(1 + @1*@0/{0} + @2*pow(@0/{0},2) + @3*pow(@0/{0},3) + @4*pow(@0/{0},4),-@5)",
             {{1, {0., 50.}}, {2, {0., 50.}}, {3, {0., 50.}}, {4, {0., 50.}}, {5, {-50., 0.}}}, {}, {}}},
    });

    return catalog;
}

}  // namespace

// ---------------------------------------------------------------------------
// ModelFamily
// ---------------------------------------------------------------------------

ModelFamily::ModelFamily(std::string name, std::map<int, FamilyEntry> entries)
    : fName(std::move(name)), fEntries(std::move(entries)) {
    if (fEntries.empty()) {
        throw std::invalid_argument("ModelFamily " + fName + ": no parameter counts declared");
    }
    fNMin = fEntries.begin()->first;
    fNMax = fEntries.rbegin()->first;
    if (fNMin < 1 || static_cast<int>(fEntries.size()) != fNMax - fNMin + 1) {
        throw std::invalid_argument("ModelFamily " + fName + ": parameter counts must be contiguous and >= 1");
    }
}

void ModelFamily::CheckN(int n) const {
    if (n < fNMin || n > fNMax) {
        throw InvalidParameterCountError(fName, n, fNMin, fNMax);
    }
}

const FamilyEntry& ModelFamily::Entry(int n) const {
    CheckN(n);
    return fEntries.at(n);
}

std::string ModelFamily::ExpressionFor(int n, double massScale) const {
    return SubstituteScale(Entry(n).expression, FormatScale(massScale));
}

std::vector<Parameter> ModelFamily::MakeParameters(int n, const std::string& prefix) const {
    const FamilyEntry& entry = Entry(n);
    std::vector<Parameter> parameters;
    parameters.reserve(static_cast<std::size_t>(n));
    for (int i = 1; i <= n; ++i) {
        Parameter par;
        par.name = prefix + "_p" + std::to_string(i);
        par.title = "p" + std::to_string(i);
        par.value = Constants::DEFAULT_PAR_VALUE;
        const auto it = entry.pars.find(i);
        const ParameterRange range = it != entry.pars.end() ? it->second : ParameterRange{};
        par.SetRange(range.lo, range.hi);
        parameters.push_back(par);
    }
    return parameters;
}

OptionalRange ModelFamily::MinRange(int n, int i) const {
    const FamilyEntry& entry = Entry(n);
    const auto it = entry.mins.find(i);
    return it != entry.mins.end() ? it->second : OptionalRange{};
}

OptionalRange ModelFamily::MaxRange(int n, int i) const {
    const FamilyEntry& entry = Entry(n);
    const auto it = entry.maxs.find(i);
    return it != entry.maxs.end() ? it->second : OptionalRange{};
}

const std::map<std::string, ModelFamilyPtr>& FamilyCatalog() {
    static const std::map<std::string, ModelFamilyPtr> catalog = BuildCatalog();
    return catalog;
}

ModelFamilyPtr GetFamily(const std::string& name) {
    const auto& catalog = FamilyCatalog();
    const auto it = catalog.find(name);
    if (it == catalog.end()) {
        throw UnknownFamilyError(name);
    }
    return it->second;
}

std::vector<std::string> KnownFamilies() {
    return {"main", "alt", "ua2"};
}

// ---------------------------------------------------------------------------
// ModelInstance
// ---------------------------------------------------------------------------

ModelInstance::ModelInstance(std::string id, ModelFamilyPtr family, int nPars,
                             std::shared_ptr<const Histogram> histogram, double massScale)
    : fId(std::move(id)), fFamily(std::move(family)), fNPars(nPars), fHistogram(std::move(histogram)) {
    if (!fFamily) {
        throw std::invalid_argument("ModelInstance " + fId + ": null family");
    }
    if (!fHistogram) {
        throw std::invalid_argument("ModelInstance " + fId + ": null histogram");
    }
    fFamily->CheckN(nPars);
    fExpression = Expression::Parse(fFamily->ExpressionFor(nPars, massScale));
    fParameters = fFamily->MakeParameters(nPars, fId);
}

std::vector<double> ModelInstance::ParameterValues() const {
    std::vector<double> values;
    values.reserve(fParameters.size());
    for (const auto& par : fParameters) {
        values.push_back(par.value);
    }
    return values;
}

void ModelInstance::SetParameterValues(const std::vector<double>& values) {
    if (values.size() != fParameters.size()) {
        throw std::invalid_argument("ModelInstance " + fId + ": expected " +
                                    std::to_string(fParameters.size()) + " values; got " +
                                    std::to_string(values.size()));
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        fParameters[i].value = values[i];
    }
}

std::vector<double> ModelInstance::Evaluate(const std::vector<double>& xs) const {
    std::vector<double> ys = fExpression.EvaluateOver(xs, ParameterValues());
    const double sum = std::accumulate(ys.begin(), ys.end(), 0.0);
    const double norm = sum != 0.0 ? sum : 1.0;
    for (double& y : ys) {
        y /= norm;
    }
    return ys;
}

std::vector<double> ModelInstance::BinIntegrals(const std::vector<double>& binning,
                                                const std::vector<double>& parameters) const {
    // Composite Simpson rule on each bin
    const int steps = Constants::BIN_INTEGRATION_STEPS;
    std::vector<double> p(parameters.size() + 1);
    std::copy(parameters.begin(), parameters.end(), p.begin() + 1);

    std::vector<double> integrals(binning.size() > 0 ? binning.size() - 1 : 0);
    for (std::size_t ib = 0; ib < integrals.size(); ++ib) {
        const double a = binning[ib];
        const double h = (binning[ib + 1] - a) / steps;
        double sum = 0.0;
        for (int k = 0; k <= steps; ++k) {
            p[0] = a + k * h;
            const double weight = (k == 0 || k == steps) ? 1.0 : (k % 2 == 1 ? 4.0 : 2.0);
            sum += weight * fExpression.Evaluate(p);
        }
        integrals[ib] = sum * h / 3.0;
    }
    return integrals;
}

std::vector<double> ModelInstance::BinFractions(const std::vector<double>& binning,
                                                const std::vector<double>& parameters) const {
    std::vector<double> fractions = BinIntegrals(binning, parameters);
    const double total = std::accumulate(fractions.begin(), fractions.end(), 0.0);
    for (double& f : fractions) {
        f = total != 0.0 ? f / total : 0.0;
    }
    return fractions;
}

std::ostream& operator<<(std::ostream& os, const ModelInstance& model) {
    os << "<ModelInstance \"" << model.Id() << "\""
       << "\n  family     = " << model.FamilyName()
       << "\n  n_pars     = " << model.NPars()
       << "\n  expression = \"" << model.ExpressionString() << "\""
       << "\n  parameters =";
    for (const auto& par : model.Parameters()) {
        os << "\n    \"" << par.name << "\" = " << par.value << " [" << par.lo << ", " << par.hi << "]";
    }
    return os << "\n  >";
}

// ---------------------------------------------------------------------------
// ModelArena
// ---------------------------------------------------------------------------

ModelInstance& ModelArena::Emplace(std::unique_ptr<ModelInstance> instance) {
    if (!instance) {
        throw std::invalid_argument("ModelArena::Emplace: null instance");
    }
    const std::string id = instance->Id();
    const auto [it, inserted] = fInstances.emplace(id, std::move(instance));
    if (!inserted) {
        throw std::invalid_argument("ModelArena::Emplace: id '" + id + "' already in use");
    }
    return *it->second;
}

ModelInstance& ModelArena::Get(const std::string& id) {
    const auto it = fInstances.find(id);
    if (it == fInstances.end()) {
        throw std::out_of_range("ModelArena: no instance with id '" + id + "'");
    }
    return *it->second;
}

const ModelInstance& ModelArena::Get(const std::string& id) const {
    const auto it = fInstances.find(id);
    if (it == fInstances.end()) {
        throw std::out_of_range("ModelArena: no instance with id '" + id + "'");
    }
    return *it->second;
}

std::unique_ptr<ModelInstance> ModelArena::Release(const std::string& id) {
    const auto it = fInstances.find(id);
    if (it == fInstances.end()) {
        throw std::out_of_range("ModelArena: no instance with id '" + id + "'");
    }
    std::unique_ptr<ModelInstance> out = std::move(it->second);
    fInstances.erase(it);
    return out;
}

// ---------------------------------------------------------------------------
// ModelFactory
// ---------------------------------------------------------------------------

ModelInstance& ModelFactory::Make(const std::string& family, int nPars,
                                  std::shared_ptr<const Histogram> histogram,
                                  const std::string& name) {
    return Make(GetFamily(family), nPars, std::move(histogram), name);
}

ModelInstance& ModelFactory::Make(ModelFamilyPtr family, int nPars,
                                  std::shared_ptr<const Histogram> histogram,
                                  const std::string& name) {
    const std::string id = name + "_npars" + std::to_string(nPars);
    auto instance = std::make_unique<ModelInstance>(id, std::move(family), nPars, std::move(histogram),
                                                    fMassScale);
    VLOG(1) << "Created " << *instance;
    return fArena.Emplace(std::move(instance));
}

std::vector<ModelInstance*> ModelFactory::MakeAll(const std::string& family,
                                                  std::shared_ptr<const Histogram> histogram,
                                                  const std::string& name, std::optional<int> nPars) {
    return MakeAll(GetFamily(family), std::move(histogram), name, nPars);
}

std::vector<ModelInstance*> ModelFactory::MakeAll(ModelFamilyPtr family,
                                                  std::shared_ptr<const Histogram> histogram,
                                                  const std::string& name, std::optional<int> nPars) {
    std::vector<ModelInstance*> out;
    const int first = nPars ? *nPars : family->NMin();
    const int last = nPars ? *nPars : family->NMax();
    for (int n = first; n <= last; ++n) {
        out.push_back(&Make(family, n, histogram, name));
    }
    return out;
}

}  // namespace bkgfit
