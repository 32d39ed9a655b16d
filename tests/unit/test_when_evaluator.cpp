#include <vector>
#include <gtest/gtest.h>
#include "when/when_evaluator.hpp"

namespace {

using stepgate::core::errors::get_error;
using stepgate::core::errors::get_value;
using stepgate::core::errors::is_error;
using stepgate::protocol::CelGuard;
using stepgate::protocol::GuardExpression;
using stepgate::protocol::GuardOperator;
using stepgate::protocol::OperatorGuard;
using stepgate::when::allow_exec;
using stepgate::when::evaluate_guard;

TEST(WhenEvaluatorTest, EmptyGuardListAllows) {
    auto allowed = allow_exec({});
    ASSERT_FALSE(is_error(allowed));
    EXPECT_TRUE(get_value(allowed));
}

TEST(WhenEvaluatorTest, InAndNotInOperators) {
    auto in = evaluate_guard(OperatorGuard{"main", GuardOperator::In, {"main", "release"}});
    ASSERT_FALSE(is_error(in));
    EXPECT_TRUE(get_value(in));

    auto not_in = evaluate_guard(OperatorGuard{"main", GuardOperator::NotIn, {"main"}});
    ASSERT_FALSE(is_error(not_in));
    EXPECT_FALSE(get_value(not_in));

    auto empty_values = evaluate_guard(OperatorGuard{"x", GuardOperator::In, {}});
    ASSERT_FALSE(is_error(empty_values));
    EXPECT_FALSE(get_value(empty_values));
}

TEST(WhenEvaluatorTest, AllGuardsMustHold) {
    const std::vector<GuardExpression> guards = {
        OperatorGuard{"yes", GuardOperator::In, {"yes"}},
        CelGuard{"'a' == 'b'"},
    };
    auto allowed = allow_exec(guards);
    ASSERT_FALSE(is_error(allowed));
    EXPECT_FALSE(get_value(allowed));
}

TEST(WhenEvaluatorTest, NonBooleanCelIsAnError) {
    auto result = evaluate_guard(CelGuard{"1 + 2"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "cel_non_boolean_result");
}

TEST(WhenEvaluatorTest, CompileErrorPropagates) {
    const std::vector<GuardExpression> guards = {CelGuard{"unknown_var"}};
    auto allowed = allow_exec(guards);
    ASSERT_TRUE(is_error(allowed));
    EXPECT_EQ(get_error(allowed).code, "cel_compile_failed");
}

}  // namespace
