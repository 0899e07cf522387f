/// @file test_expression.cpp
/// @brief Unit tests for the template expression parser and evaluator.

#include "Expression.hh"
#include "FitErrors.hh"
#include "TestHarness.hh"

using bkgfit::Expression;

static double eval(const std::string& source, const std::vector<double>& p) {
    return Expression::Parse(source).Evaluate(p);
}

// ===========================================================================
// Arithmetic
// ===========================================================================

void test_literals_and_precedence() {
    TEST_ASSERT(approxEqual(eval("1 + 2*3", {}), 7.0, 1e-12));
    TEST_ASSERT(approxEqual(eval("(1 + 2)*3", {}), 9.0, 1e-12));
    TEST_ASSERT(approxEqual(eval("8/4/2", {}), 1.0, 1e-12));
    TEST_ASSERT(approxEqual(eval("10 - 4 - 3", {}), 3.0, 1e-12));
    TEST_ASSERT(approxEqual(eval("2.5e1 + .5", {}), 25.5, 1e-12));
}

void test_unary_minus() {
    TEST_ASSERT(approxEqual(eval("-3 + 1", {}), -2.0, 1e-12));
    TEST_ASSERT(approxEqual(eval("-(@1)", {0.0, 4.0}), -4.0, 1e-12));
    TEST_ASSERT(approxEqual(eval("2*-@1", {0.0, 4.0}), -8.0, 1e-12));
}

void test_functions() {
    TEST_ASSERT(approxEqual(eval("pow(2, 10)", {}), 1024.0, 1e-9));
    TEST_ASSERT(approxEqual(eval("log(exp(3))", {}), 3.0, 1e-12));
    TEST_ASSERT(approxEqual(eval("sqrt(16)", {}), 4.0, 1e-12));
}

void test_parameters() {
    const Expression e = Expression::Parse("pow(1 - @0/1000, @1) * pow(@0/1000, -(@2))");
    TEST_ASSERT(e.MaxParameterIndex() == 2);
    TEST_ASSERT(e.NFitParameters() == 2);
    const double x = 500.0;
    const double expected = std::pow(0.5, 3.0) * std::pow(0.5, -2.0);
    TEST_ASSERT(approxEqual(e.Evaluate({x, 3.0, 2.0}), expected, 1e-12));
}

void test_evaluate_over() {
    const Expression e = Expression::Parse("@1*@0 + @2");
    const std::vector<double> ys = e.EvaluateOver({1.0, 2.0, 3.0}, {2.0, 1.0});
    TEST_ASSERT(ys.size() == 3);
    TEST_ASSERT(approxEqual(ys[0], 3.0, 1e-12));
    TEST_ASSERT(approxEqual(ys[2], 7.0, 1e-12));
}

void test_nan_propagates() {
    TEST_ASSERT(std::isnan(eval("sqrt(-1)", {})));
    TEST_ASSERT(std::isnan(eval("log(@1)", {0.0, -2.0})));
}

// ===========================================================================
// Errors
// ===========================================================================

void test_unbound_parameter_throws() {
    TEST_THROWS(eval("@0 + @3", {1.0, 2.0}), bkgfit::UnboundParameterError);
    try {
        eval("@0 + @3", {1.0, 2.0});
    } catch (const bkgfit::UnboundParameterError& e) {
        TEST_ASSERT(e.Index() == 3);
    }
}

void test_syntax_errors() {
    TEST_THROWS(Expression::Parse("1 +"), bkgfit::ExpressionSyntaxError);
    TEST_THROWS(Expression::Parse("(1 + 2"), bkgfit::ExpressionSyntaxError);
    TEST_THROWS(Expression::Parse("@"), bkgfit::ExpressionSyntaxError);
    TEST_THROWS(Expression::Parse("1 2"), bkgfit::ExpressionSyntaxError);
    TEST_THROWS(Expression::Parse("pow(2)"), bkgfit::ExpressionSyntaxError);
    TEST_THROWS(Expression::Parse("@99999999999 * @0"), bkgfit::ExpressionSyntaxError);
}

void test_unsupported_keyword_throws() {
    TEST_THROWS(Expression::Parse("sin(@0)"), bkgfit::ExpressionSyntaxError);
    TEST_THROWS(Expression::Parse("__import__(@0)"), bkgfit::ExpressionSyntaxError);
}

void test_add_normalization() {
    const std::string wrapped = bkgfit::AddNormalization("@1*@0 + @2");
    TEST_ASSERT(wrapped == "@3*(@1*@0 + @2)");
    TEST_ASSERT(approxEqual(eval(wrapped, {1.0, 2.0, 3.0, 10.0}), 50.0, 1e-12));
}

int main() {
    std::cout << "=== Expression Unit Tests ===\n\n";

    std::cout << "[Arithmetic]\n";
    RUN_TEST(test_literals_and_precedence);
    RUN_TEST(test_unary_minus);
    RUN_TEST(test_functions);
    RUN_TEST(test_parameters);
    RUN_TEST(test_evaluate_over);
    RUN_TEST(test_nan_propagates);

    std::cout << "\n[Errors]\n";
    RUN_TEST(test_unbound_parameter_throws);
    RUN_TEST(test_syntax_errors);
    RUN_TEST(test_unsupported_keyword_throws);
    RUN_TEST(test_add_normalization);

    return reportResults();
}
