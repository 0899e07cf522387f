/// @file Expression.cc
/// @brief Recursive-descent parser and tree-walking evaluator.

#include "Expression.hh"
#include "FitErrors.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace bkgfit {

namespace {

using Op = Expression::Op;
using Node = Expression::Node;
using NodePtr = Expression::NodePtr;

NodePtr MakeNode(Op op, std::vector<NodePtr> args) {
    auto node = std::make_shared<Node>();
    node->op = op;
    node->args = std::move(args);
    return node;
}

// Grammar:
//   sum     := product (('+' | '-') product)*
//   product := unary (('*' | '/') unary)*
//   unary   := ('-' | '+') unary | primary
//   primary := number | '@' digits | name '(' sum (',' sum)* ')' | '(' sum ')'
class Parser {
public:
    explicit Parser(const std::string& text) : fText(text) {}

    NodePtr ParseAll() {
        NodePtr root = ParseSum();
        SkipSpace();
        if (fPos != fText.size()) {
            Fail("unexpected character '" + std::string(1, fText[fPos]) + "'");
        }
        return root;
    }

private:
    [[noreturn]] void Fail(const std::string& message) const {
        throw ExpressionSyntaxError(message, fText, fPos);
    }

    void SkipSpace() {
        while (fPos < fText.size() && std::isspace(static_cast<unsigned char>(fText[fPos]))) {
            ++fPos;
        }
    }

    bool Accept(char c) {
        SkipSpace();
        if (fPos < fText.size() && fText[fPos] == c) {
            ++fPos;
            return true;
        }
        return false;
    }

    void Expect(char c) {
        if (!Accept(c)) {
            Fail(std::string("expected '") + c + "'");
        }
    }

    NodePtr ParseSum() {
        NodePtr lhs = ParseProduct();
        while (true) {
            if (Accept('+')) {
                lhs = MakeNode(Op::kAdd, {lhs, ParseProduct()});
            } else if (Accept('-')) {
                lhs = MakeNode(Op::kSubtract, {lhs, ParseProduct()});
            } else {
                return lhs;
            }
        }
    }

    NodePtr ParseProduct() {
        NodePtr lhs = ParseUnary();
        while (true) {
            if (Accept('*')) {
                lhs = MakeNode(Op::kMultiply, {lhs, ParseUnary()});
            } else if (Accept('/')) {
                lhs = MakeNode(Op::kDivide, {lhs, ParseUnary()});
            } else {
                return lhs;
            }
        }
    }

    NodePtr ParseUnary() {
        if (Accept('-')) {
            return MakeNode(Op::kNegate, {ParseUnary()});
        }
        if (Accept('+')) {
            return ParseUnary();
        }
        return ParsePrimary();
    }

    NodePtr ParsePrimary() {
        SkipSpace();
        if (fPos >= fText.size()) {
            Fail("unexpected end of expression");
        }
        const char c = fText[fPos];

        if (c == '(') {
            ++fPos;
            NodePtr inner = ParseSum();
            Expect(')');
            return inner;
        }

        if (c == '@') {
            ++fPos;
            const std::size_t start = fPos;
            while (fPos < fText.size() && std::isdigit(static_cast<unsigned char>(fText[fPos]))) {
                ++fPos;
            }
            if (fPos == start) {
                Fail("expected parameter index after '@'");
            }
            auto node = std::make_shared<Node>();
            node->op = Op::kParameter;
            try {
                node->index = std::stoi(fText.substr(start, fPos - start));
            } catch (const std::out_of_range&) {
                Fail("parameter index out of range");
            }
            return node;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            const char* begin = fText.c_str() + fPos;
            char* end = nullptr;
            const double value = std::strtod(begin, &end);
            if (end == begin) {
                Fail("malformed number");
            }
            fPos += static_cast<std::size_t>(end - begin);
            auto node = std::make_shared<Node>();
            node->op = Op::kConstant;
            node->value = value;
            return node;
        }

        if (std::isalpha(static_cast<unsigned char>(c))) {
            const std::size_t start = fPos;
            while (fPos < fText.size() && std::isalnum(static_cast<unsigned char>(fText[fPos]))) {
                ++fPos;
            }
            const std::string name = fText.substr(start, fPos - start);
            Op op;
            std::size_t arity = 1;
            if (name == "pow") {
                op = Op::kPow;
                arity = 2;
            } else if (name == "log") {
                op = Op::kLog;
            } else if (name == "sqrt") {
                op = Op::kSqrt;
            } else if (name == "exp") {
                op = Op::kExp;
            } else {
                fPos = start;
                Fail("unsupported keyword '" + name + "'");
            }
            Expect('(');
            std::vector<NodePtr> args{ParseSum()};
            while (Accept(',')) {
                args.push_back(ParseSum());
            }
            Expect(')');
            if (args.size() != arity) {
                Fail(name + " takes " + std::to_string(arity) + " argument(s)");
            }
            return MakeNode(op, std::move(args));
        }

        Fail("unexpected character '" + std::string(1, c) + "'");
    }

    const std::string& fText;
    std::size_t fPos{0};
};

double EvalNode(const Node& node, const std::vector<double>& p) {
    switch (node.op) {
        case Op::kConstant:
            return node.value;
        case Op::kParameter:
            if (node.index < 0 || static_cast<std::size_t>(node.index) >= p.size()) {
                throw UnboundParameterError(node.index, p.size());
            }
            return p[static_cast<std::size_t>(node.index)];
        case Op::kNegate:
            return -EvalNode(*node.args[0], p);
        case Op::kAdd:
            return EvalNode(*node.args[0], p) + EvalNode(*node.args[1], p);
        case Op::kSubtract:
            return EvalNode(*node.args[0], p) - EvalNode(*node.args[1], p);
        case Op::kMultiply:
            return EvalNode(*node.args[0], p) * EvalNode(*node.args[1], p);
        case Op::kDivide:
            return EvalNode(*node.args[0], p) / EvalNode(*node.args[1], p);
        case Op::kPow:
            return std::pow(EvalNode(*node.args[0], p), EvalNode(*node.args[1], p));
        case Op::kLog:
            return std::log(EvalNode(*node.args[0], p));
        case Op::kSqrt:
            return std::sqrt(EvalNode(*node.args[0], p));
        case Op::kExp:
            return std::exp(EvalNode(*node.args[0], p));
    }
    return std::nan("");
}

int MaxIndex(const Node& node) {
    int result = node.op == Op::kParameter ? node.index : -1;
    for (const auto& arg : node.args) {
        result = std::max(result, MaxIndex(*arg));
    }
    return result;
}

}  // namespace

Expression Expression::Parse(const std::string& source) {
    Parser parser(source);
    return Expression(source, parser.ParseAll());
}

double Expression::Evaluate(const std::vector<double>& parameters) const {
    if (!fRoot) {
        throw std::logic_error("Expression::Evaluate on an empty expression");
    }
    return EvalNode(*fRoot, parameters);
}

std::vector<double> Expression::EvaluateOver(const std::vector<double>& xs,
                                             const std::vector<double>& fitParameters) const {
    std::vector<double> p(fitParameters.size() + 1);
    std::copy(fitParameters.begin(), fitParameters.end(), p.begin() + 1);
    std::vector<double> ys(xs.size());
    for (std::size_t i = 0; i < xs.size(); ++i) {
        p[0] = xs[i];
        ys[i] = Evaluate(p);
    }
    return ys;
}

int Expression::MaxParameterIndex() const {
    return fRoot ? MaxIndex(*fRoot) : -1;
}

std::string AddNormalization(const std::string& expression) {
    const int nPars = Expression::Parse(expression).MaxParameterIndex() + 1;
    return "@" + std::to_string(nPars) + "*(" + expression + ")";
}

}  // namespace bkgfit
