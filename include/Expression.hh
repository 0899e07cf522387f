/// @file Expression.hh
/// @brief Typed algebraic expression tree for the background shape templates.
///
/// Templates are written in the RooFit formula dialect restricted to the
/// keywords pow, log, sqrt and exp, the operators + - * / and positional
/// parameters @0, @1, ... where @0 is always the mass. They are parsed once
/// into an immutable tree and evaluated by a tree walker.

#ifndef BKGFIT_EXPRESSION_HH
#define BKGFIT_EXPRESSION_HH

#include <memory>
#include <string>
#include <vector>

namespace bkgfit {

class Expression {
public:
    enum class Op {
        kConstant,
        kParameter,
        kNegate,
        kAdd,
        kSubtract,
        kMultiply,
        kDivide,
        kPow,
        kLog,
        kSqrt,
        kExp
    };

    /// One node of the tree. Leaves are constants or parameter references.
    struct Node {
        Op op{Op::kConstant};
        double value{0.0};   ///< literal for kConstant
        int index{-1};       ///< parameter position for kParameter
        std::vector<std::shared_ptr<const Node>> args;
    };
    using NodePtr = std::shared_ptr<const Node>;

    Expression() = default;

    /// @throws ExpressionSyntaxError on malformed input or unsupported keywords
    static Expression Parse(const std::string& source);

    /// Evaluates with parameters[0] = mass and parameters[i] = @i.
    /// @throws UnboundParameterError if a referenced @i is not supplied
    double Evaluate(const std::vector<double>& parameters) const;

    /// Evaluates at every mass in xs with the fit parameters @1..@N.
    std::vector<double> EvaluateOver(const std::vector<double>& xs,
                                     const std::vector<double>& fitParameters) const;

    /// Highest @i referenced; -1 for an expression without parameters.
    int MaxParameterIndex() const;

    /// Number of fit parameters, i.e. MaxParameterIndex() excluding @0.
    int NFitParameters() const { return MaxParameterIndex(); }

    const std::string& Source() const { return fSource; }
    const NodePtr& Root() const { return fRoot; }
    bool Empty() const { return !fRoot; }

private:
    Expression(std::string source, NodePtr root) : fSource(std::move(source)), fRoot(std::move(root)) {}

    std::string fSource;
    NodePtr fRoot;
};

/// Wraps an expression as "@{N+1}*(expr)" to add a free normalization.
std::string AddNormalization(const std::string& expression);

}  // namespace bkgfit

#endif  // BKGFIT_EXPRESSION_HH
