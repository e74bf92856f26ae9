// Kind registry tests
//
// Registration, lookup, creation and verification through the sample dialects

#include "dialects/arith.hpp"
#include "dialects/builtin.hpp"
#include "dialects/cf.hpp"
#include "ir/op_registry.hpp"

#include <gtest/gtest.h>

using namespace irkit;
using namespace irkit::ir;
namespace arith = irkit::dialects::arith;
namespace cf = irkit::dialects::cf;

class RegistryTest : public ::testing::Test {
protected:
    KindRegistry registry_;

    void SetUp() override {
        ASSERT_TRUE(is_ok(dialects::register_builtin_dialect(registry_)));
        ASSERT_TRUE(is_ok(dialects::register_arith_dialect(registry_)));
        ASSERT_TRUE(is_ok(dialects::register_cf_dialect(registry_)));
    }
};

TEST_F(RegistryTest, DialectsRegisterTheirKinds) {
    EXPECT_EQ(registry_.size(), 9u);
    EXPECT_NE(registry_.lookup("arith.addi"), nullptr);
    EXPECT_NE(registry_.lookup("cf.cond_br"), nullptr);
    EXPECT_NE(registry_.lookup("builtin.unrealized_conversion_cast"), nullptr);
    EXPECT_EQ(registry_.lookup("arith.divsi"), nullptr);
}

TEST_F(RegistryTest, DuplicateKindFails) {
    auto again = registry_.register_kind({"arith.addi", {}, {}, nullptr});
    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(unwrap_err(again).kind, IrErrorKind::DuplicateKind);
    EXPECT_EQ(unwrap_err(again).subject, "arith.addi");

    // Registering a whole dialect twice fails on its first kind
    EXPECT_TRUE(is_err(dialects::register_arith_dialect(registry_)));
}

TEST_F(RegistryTest, FieldIndices) {
    const OpDefinition* def = registry_.lookup("arith.subi");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->operand_index("lhs"), 0u);
    EXPECT_EQ(def->operand_index("rhs"), 1u);
    EXPECT_EQ(def->result_index("result"), 0u);
    EXPECT_FALSE(def->operand_index("value").has_value());
}

TEST_F(RegistryTest, LookupOrError) {
    auto missing = registry_.lookup_or_error("test.unknown");
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing).kind, IrErrorKind::UnknownKind);

    auto found = registry_.lookup_or_error("arith.constant");
    ASSERT_TRUE(is_ok(found));
    EXPECT_EQ(unwrap(found)->name, "arith.constant");
}

TEST_F(RegistryTest, CreateUnknownKindFails) {
    auto created = registry_.create("test.unknown", OperationState{});
    ASSERT_TRUE(is_err(created));
    EXPECT_EQ(unwrap_err(created).kind, IrErrorKind::UnknownKind);
}

TEST_F(RegistryTest, CreateSetsKind) {
    OperationState state;
    state.result_types = {i64()};
    state.attributes["value"] = int_attr(3);
    auto created = registry_.create("arith.constant", std::move(state));
    ASSERT_TRUE(is_ok(created));
    EXPECT_EQ(unwrap(created)->kind(), "arith.constant");
    EXPECT_EQ(arith::constant_value(*unwrap(created)), 3);
}

TEST(RegistryVerifyOnCreateTest, RejectsInvalidOperation) {
    KindRegistry registry(true);
    ASSERT_TRUE(is_ok(dialects::register_arith_dialect(registry)));

    // Constant whose value type disagrees with its result type
    OperationState state;
    state.result_types = {i32()};
    state.attributes["value"] = int_attr(3, 64);
    auto created = registry.create("arith.constant", std::move(state));
    ASSERT_TRUE(is_err(created));
    EXPECT_EQ(unwrap_err(created).kind, IrErrorKind::VerificationFailed);
}

TEST_F(RegistryTest, VerifyWalksNestedOperations) {
    auto module = create_module();
    Block& body = module->region().block();
    auto& a = body.push_back(arith::constant(1));
    auto& b = body.push_back(arith::constant(2, 32));
    body.push_back(arith::addi(a.result(), a.result()));

    EXPECT_TRUE(is_ok(registry_.verify(*module)));

    // Mixed widths
    auto& bad = body.push_back(arith::addi(a.result(), b.result()));
    auto verified = registry_.verify(*module);
    ASSERT_TRUE(is_err(verified));
    EXPECT_EQ(unwrap_err(verified).kind, IrErrorKind::VerificationFailed);
    EXPECT_EQ(unwrap_err(verified).subject, describe(bad));
}

TEST_F(RegistryTest, VerifyReportsUnknownKind) {
    auto module = create_module();
    module->region().block().push_back(Operation::create(OperationState{"test.mystery"}));

    auto verified = registry_.verify(*module);
    ASSERT_TRUE(is_err(verified));
    EXPECT_EQ(unwrap_err(verified).kind, IrErrorKind::UnknownKind);
    EXPECT_EQ(unwrap_err(verified).subject, "test.mystery@0.0.0");
}

TEST_F(RegistryTest, VerifyChecksArity) {
    auto module = create_module();
    Block& body = module->region().block();
    auto& a = body.push_back(arith::constant(1));

    OperationState state{"arith.addi"};
    state.operands = {&a.result()};
    state.result_types = {i64()};
    body.push_back(Operation::create(std::move(state)));

    auto verified = registry_.verify(*module);
    ASSERT_TRUE(is_err(verified));
    EXPECT_EQ(unwrap_err(verified).kind, IrErrorKind::VerificationFailed);
    EXPECT_NE(unwrap_err(verified).message.find("expected 2 operands"), std::string::npos);
}

TEST_F(RegistryTest, FixedArityKindsRejectExtraOperands) {
    auto module = create_module();
    Block& body = module->region().block();
    auto& a = body.push_back(arith::constant(1));

    // A constant has no operands at all
    OperationState state{"arith.constant"};
    state.operands = {&a.result()};
    state.result_types = {i64()};
    state.attributes["value"] = int_attr(2);
    auto& bad = body.push_back(Operation::create(std::move(state)));

    auto verified = registry_.verify(*module);
    ASSERT_TRUE(is_err(verified));
    EXPECT_EQ(unwrap_err(verified).subject, describe(bad));
    EXPECT_NE(unwrap_err(verified).message.find("expected 0 operands, got 1"), std::string::npos);
}

TEST_F(RegistryTest, VariadicKindTakesAnyOperandCount) {
    EXPECT_TRUE(registry_.lookup("cf.br")->variadic_operands);
    EXPECT_FALSE(registry_.lookup("cf.cond_br")->variadic_operands);

    auto module = create_module();
    Region& region = module->region();
    Block& entry = region.block();
    Block& exit = region.add_block({i64(), i64()});

    auto& a = entry.push_back(arith::constant(1));
    entry.push_back(cf::br(exit, {&a.result(), &a.result()}));
    exit.push_back(cf::br(exit, {&exit.arg(0), &exit.arg(1)}));
    EXPECT_TRUE(is_ok(registry_.verify(*module)));
}

TEST_F(RegistryTest, BranchVerification) {
    auto module = create_module();
    Region& region = module->region();
    Block& entry = region.block();
    Block& exit = region.add_block({i64()});

    auto& flag = entry.push_back(arith::constant(1, 1));
    entry.push_back(cf::cond_br(flag.result(), exit, exit));
    EXPECT_TRUE(is_ok(registry_.verify(*module)));

    // br to a block expecting one argument, forwarding none
    exit.push_back(cf::br(exit));
    auto verified = registry_.verify(*module);
    ASSERT_TRUE(is_err(verified));
    EXPECT_NE(unwrap_err(verified).message.find("forwards 0 values"), std::string::npos);
}

TEST_F(RegistryTest, ComparisonPredicateRange) {
    auto module = create_module();
    Block& body = module->region().block();
    auto& a = body.push_back(arith::constant(1));
    auto& cmp = body.push_back(arith::cmpi(arith::CmpPredicate::Sle, a.result(), a.result()));
    EXPECT_TRUE(is_ok(registry_.verify(*module)));
    EXPECT_STREQ(arith::predicate_name(arith::CmpPredicate::Sle), "sle");

    cmp.set_attribute("predicate", int_attr(12));
    EXPECT_TRUE(is_err(registry_.verify(*module)));
}

TEST_F(RegistryTest, UnrealizedCastCarriesTargetType) {
    auto module = create_module();
    Block& body = module->region().block();
    auto& c = body.push_back(arith::constant(1));
    auto& cast = body.push_back(dialects::builtin::unrealized_cast(c.result(), index_type()));

    EXPECT_EQ(cast.kind(), dialects::builtin::UNREALIZED_CAST);
    EXPECT_EQ(cast.result().type(), index_type());
    EXPECT_EQ(cast.operand(0), &c.result());
    EXPECT_TRUE(is_ok(registry_.verify(*module)));
}

TEST(IrErrorTest, PrintsKindMessageAndSubject) {
    IrError error{IrErrorKind::UnresolvedValue, "operand used before definition", "arith.addi@0.0.1"};
    EXPECT_EQ(to_string(error),
              "unresolved-value: operand used before definition [arith.addi@0.0.1]");
    EXPECT_EQ(to_string(IrError{IrErrorKind::UnknownKind, "no such kind", ""}),
              "unknown-kind: no such kind");

    DiagnosticError diagnostic(error);
    EXPECT_EQ(diagnostic.error().subject, "arith.addi@0.0.1");
    EXPECT_STREQ(diagnostic.what(), to_string(error).c_str());
}
