// Constraint matcher tests

#include "dialects/arith.hpp"
#include "dialects/builtin.hpp"
#include "dialects/cf.hpp"
#include "match/query.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace irkit;
using namespace irkit::match;
using ir::i64;
using ir::int_attr;
namespace arith = irkit::dialects::arith;

class MatchTest : public ::testing::Test {
protected:
    ir::KindRegistry registry_;
    Box<ir::Operation> module_ = ir::create_module();

    void SetUp() override {
        ASSERT_TRUE(is_ok(dialects::register_builtin_dialect(registry_)));
        ASSERT_TRUE(is_ok(dialects::register_arith_dialect(registry_)));
        ASSERT_TRUE(is_ok(dialects::register_cf_dialect(registry_)));
    }

    auto body() -> ir::Block& {
        return module_->region().block();
    }

    /// addi whose lhs is produced by an arith.constant; binds the constant's value.
    auto constant_lhs_query() -> Query {
        auto query = Query::root("arith.addi");
        auto lhs = query.add_variable<OpResultVariable>("lhs");
        auto lhs_op = query.add_variable<OperationVariable>("lhs_op");
        auto value = query.add_variable<AttributeVariable>("value");
        query.add_constraint<OperationOperandConstraint>(query.root_variable(), registry_, "lhs", lhs);
        query.add_constraint<OpResultOpConstraint>(lhs, lhs_op);
        query.add_constraint<TypeConstraint>(lhs_op, "arith.constant");
        query.add_constraint<OperationAttributeConstraint>(lhs_op, "value", value);
        return query;
    }
};

TEST_F(MatchTest, BindsEveryVariable) {
    auto& c = body().push_back(arith::constant(7));
    auto& sum = body().push_back(arith::addi(c.result(), c.result()));

    auto query = constant_lhs_query();
    ASSERT_TRUE(is_ok(query.validate()));

    auto m = query.match(sum);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->bindings.size(), query.num_variables());
    EXPECT_EQ(m->operation("root"), &sum);
    EXPECT_EQ(m->operation("lhs_op"), &c);
    EXPECT_EQ(m->value("lhs"), &c.result());
    ASSERT_NE(m->attribute("value"), nullptr);
    EXPECT_EQ(*m->attribute("value"), int_attr(7));

    // Wrong-kind lookups through the accessors
    EXPECT_EQ(m->operation("lhs"), nullptr);
    EXPECT_EQ(m->value("missing"), nullptr);
}

TEST_F(MatchTest, WrongRootKindNeverMatches) {
    auto& c = body().push_back(arith::constant(7));
    auto& diff = body().push_back(arith::subi(c.result(), c.result()));

    auto query = constant_lhs_query();
    EXPECT_FALSE(query.match(diff).has_value());
    EXPECT_FALSE(query.match(c).has_value());
}

TEST_F(MatchTest, FailingConstraintRejects) {
    ir::Block& second = module_->region().add_block({i64()});
    auto& sum = second.push_back(arith::addi(second.arg(0), second.arg(0)));

    // lhs is a block argument, so OpResultVariable refuses it
    EXPECT_FALSE(constant_lhs_query().match(sum).has_value());

    auto& c = body().push_back(arith::constant(1));
    auto& neg = body().push_back(arith::subi(c.result(), c.result()));
    auto& other = body().push_back(arith::addi(neg.result(), c.result()));
    // lhs is defined by subi, not a constant
    EXPECT_FALSE(constant_lhs_query().match(other).has_value());
}

TEST_F(MatchTest, MatchingIsIdempotent) {
    auto& c = body().push_back(arith::constant(3));
    auto& sum = body().push_back(arith::addi(c.result(), c.result()));

    auto query = constant_lhs_query();
    auto first = query.match(sum);
    auto second = query.match(sum);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->bindings, second->bindings);
}

TEST_F(MatchTest, RepeatedBindingMustAgree) {
    auto& a = body().push_back(arith::constant(1));
    auto& b = body().push_back(arith::constant(2));
    auto& same = body().push_back(arith::addi(a.result(), a.result()));
    auto& mixed = body().push_back(arith::addi(a.result(), b.result()));

    // Both operands bound to one name
    auto query = Query::root("arith.addi");
    auto operand = query.add_variable<ValueVariable>("operand");
    query.add_constraint<OperationOperandConstraint>(query.root_variable(), 0, operand);
    query.add_constraint<OperationOperandConstraint>(query.root_variable(), 1, operand);

    EXPECT_TRUE(query.match(same).has_value());
    EXPECT_FALSE(query.match(mixed).has_value());
}

TEST_F(MatchTest, EqualityConstraint) {
    auto& a = body().push_back(arith::constant(1));
    auto& b = body().push_back(arith::constant(1));
    auto& same = body().push_back(arith::addi(a.result(), a.result()));
    auto& equal_values = body().push_back(arith::addi(a.result(), b.result()));

    auto query = Query::root("arith.addi");
    auto lhs = query.add_variable<ValueVariable>("lhs");
    auto rhs = query.add_variable<ValueVariable>("rhs");
    query.add_constraint<OperationOperandConstraint>(query.root_variable(), 0, lhs);
    query.add_constraint<OperationOperandConstraint>(query.root_variable(), 1, rhs);
    query.add_constraint<EqConstraint>(lhs, rhs);

    EXPECT_TRUE(query.match(same).has_value());
    // Distinct values, even with equal constants, are not equal bindings
    EXPECT_FALSE(query.match(equal_values).has_value());
}

TEST_F(MatchTest, AttributeValueAndResultType) {
    auto& c = body().push_back(arith::constant(4, 32));

    auto query = Query::root("arith.constant");
    auto value = query.add_variable<AttributeVariable>("value");
    auto result = query.add_variable<ValueVariable>("result");
    auto type = query.add_variable<AttributeVariable>("type");
    query.add_constraint<OperationAttributeConstraint>(query.root_variable(), "value", value);
    query.add_constraint<AttributeValueConstraint>(value, int_attr(4, 32));
    query.add_constraint<OperationResultConstraint>(query.root_variable(), registry_, "result", result);
    query.add_constraint<ValueTypeConstraint>(result, type);

    auto m = query.match(c);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(*m->attribute("type"), ir::i32());
    EXPECT_EQ(m->value("result"), &c.result());

    auto& other = body().push_back(arith::constant(5, 32));
    EXPECT_FALSE(query.match(other).has_value());
}

TEST_F(MatchTest, UnknownFieldFailsToMatch) {
    auto& c = body().push_back(arith::constant(1));
    auto& sum = body().push_back(arith::addi(c.result(), c.result()));

    auto query = Query::root("arith.addi");
    auto v = query.add_variable<ValueVariable>("v");
    query.add_constraint<OperationOperandConstraint>(query.root_variable(), registry_, "condition", v);
    EXPECT_FALSE(query.match(sum).has_value());

    auto by_index = Query::root("arith.addi");
    auto w = by_index.add_variable<ValueVariable>("w");
    by_index.add_constraint<OperationOperandConstraint>(by_index.root_variable(), 2, w);
    EXPECT_FALSE(by_index.match(sum).has_value());
}

TEST_F(MatchTest, ModuleSearchInWalkOrder) {
    auto& c = body().push_back(arith::constant(1));
    auto& first = body().push_back(arith::addi(c.result(), c.result()));
    auto& neg = body().push_back(arith::subi(c.result(), c.result()));
    auto& second = body().push_back(arith::addi(neg.result(), c.result()));

    auto any_add = Query::root("arith.addi");
    auto found = any_add.matches(*module_);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].operation("root"), &first);
    EXPECT_EQ(found[1].operation("root"), &second);

    // Only the first has a constant lhs
    auto constant_found = constant_lhs_query().matches(*module_);
    ASSERT_EQ(constant_found.size(), 1u);
    EXPECT_EQ(constant_found[0].operation("root"), &first);

    // The module itself is a candidate
    EXPECT_EQ(Query::root("builtin.module").matches(*module_).size(), 1u);
}

TEST_F(MatchTest, ValidateReportsUnboundVariables) {
    // Read before any constraint binds it
    auto early = Query::root("arith.addi");
    auto lhs = early.add_variable<OpResultVariable>("lhs");
    auto lhs_op = early.add_variable<OperationVariable>("lhs_op");
    early.add_constraint<OpResultOpConstraint>(lhs, lhs_op);
    early.add_constraint<OperationOperandConstraint>(early.root_variable(), 0, lhs);

    auto checked = early.validate();
    ASSERT_TRUE(is_err(checked));
    EXPECT_EQ(unwrap_err(checked).kind, ir::IrErrorKind::UnboundVariable);
    EXPECT_EQ(unwrap_err(checked).subject, "lhs");

    // Declared but never bound
    auto dangling = Query::root("arith.addi");
    (void)dangling.add_variable<AttributeVariable>("unused");
    auto dangling_checked = dangling.validate();
    ASSERT_TRUE(is_err(dangling_checked));
    EXPECT_EQ(unwrap_err(dangling_checked).subject, "unused");

    // Such a query never matches
    auto& c = body().push_back(arith::constant(1));
    auto& sum = body().push_back(arith::addi(c.result(), c.result()));
    EXPECT_FALSE(early.match(sum).has_value());
    EXPECT_FALSE(dangling.match(sum).has_value());
}

TEST_F(MatchTest, DuplicateVariableThrows) {
    auto query = Query::root("arith.addi");
    (void)query.add_variable<ValueVariable>("x");
    EXPECT_THROW((void)query.add_variable<OperationVariable>("x"), std::invalid_argument);
    EXPECT_THROW((void)query.add_variable<OperationVariable>("root"), std::invalid_argument);
}

TEST(MatchContextTest, BindChecksAgainstExisting) {
    MatchContext ctx;
    EXPECT_TRUE(ctx.bind("a", int_attr(1)));
    EXPECT_TRUE(ctx.bind("a", int_attr(1)));
    EXPECT_FALSE(ctx.bind("a", int_attr(2)));
    EXPECT_EQ(std::get<ir::Attribute>(*ctx.lookup("a")), int_attr(1));
    EXPECT_FALSE(ctx.is_bound("b"));
    EXPECT_STREQ(variable_kind_name(VariableKind::OpResult), "op-result");
}
