// Core IR tests
//
// Use-lists, block editing, traversal, printable references and teardown

#include "dialects/arith.hpp"
#include "dialects/cf.hpp"
#include "ir/ir.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace irkit;
using namespace irkit::ir;
namespace arith = irkit::dialects::arith;

class IrTest : public ::testing::Test {
protected:
    Box<Operation> module_ = create_module();

    auto body() -> Block& {
        return module_->region().block();
    }

    auto add(Box<Operation> op) -> Operation& {
        return body().push_back(std::move(op));
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(IrTest, ModuleShape) {
    EXPECT_EQ(module_->kind(), "builtin.module");
    EXPECT_EQ(module_->num_regions(), 1u);
    EXPECT_EQ(module_->region().blocks().size(), 1u);
    EXPECT_TRUE(body().empty());
    EXPECT_EQ(body().parent_op(), module_.get());
    EXPECT_EQ(count_ops(*module_), 0u);
}

TEST_F(IrTest, NameDefaultsToKind) {
    OperationState state{"test.op"};
    auto unnamed = Operation::create(std::move(state));
    EXPECT_EQ(unnamed->name(), "test.op");

    OperationState named{"test.op", "custom"};
    EXPECT_EQ(Operation::create(std::move(named))->name(), "custom");
}

TEST_F(IrTest, NullOperandIsRejected) {
    OperationState state{"test.op"};
    state.operands = {nullptr};
    EXPECT_THROW((void)Operation::create(std::move(state)), std::invalid_argument);
}

TEST_F(IrTest, ResultsAreNumbered) {
    OperationState state{"test.pair"};
    state.result_types = {i32(), i64()};
    auto& op = add(Operation::create(std::move(state)));

    ASSERT_EQ(op.num_results(), 2u);
    EXPECT_EQ(op.result(0).index(), 0u);
    EXPECT_EQ(op.result(1).index(), 1u);
    EXPECT_EQ(&op.result(1).owner(), &op);
    EXPECT_EQ(op.result(1).type(), i64());
    EXPECT_EQ(op.result(0).defining_op(), &op);
    EXPECT_EQ(op.result_types(), (std::vector<Attribute>{i32(), i64()}));
}

TEST_F(IrTest, BlockArguments) {
    Block& block = module_->region().add_block({i32(), i1()});
    ASSERT_EQ(block.num_args(), 2u);
    EXPECT_EQ(&block.arg(1).owner(), &block);
    EXPECT_EQ(block.arg(1).index(), 1u);
    EXPECT_EQ(block.arg(0).defining_op(), nullptr);
    EXPECT_NE(block.arg(0).as_block_argument(), nullptr);
    EXPECT_EQ(block.arg(0).as_op_result(), nullptr);

    auto& extra = block.add_argument(i64());
    EXPECT_EQ(extra.index(), 2u);
    EXPECT_EQ(block.arg_types(), (std::vector<Attribute>{i32(), i1(), i64()}));
}

// ============================================================================
// Use-lists
// ============================================================================

TEST_F(IrTest, UsesTrackOperands) {
    auto& c = add(arith::constant(1));
    auto& sum = add(arith::addi(c.result(), c.result()));

    ASSERT_EQ(c.result().uses().size(), 2u);
    EXPECT_EQ(c.result().uses()[0], (Use{&sum, 0}));
    EXPECT_EQ(c.result().uses()[1], (Use{&sum, 1}));
    EXPECT_TRUE(c.has_uses());
    EXPECT_FALSE(sum.has_uses());
}

TEST_F(IrTest, SetOperandMovesUse) {
    auto& a = add(arith::constant(1));
    auto& b = add(arith::constant(2));
    auto& sum = add(arith::addi(a.result(), a.result()));

    sum.set_operand(1, &b.result());

    EXPECT_EQ(sum.operand(1), &b.result());
    ASSERT_EQ(a.result().uses().size(), 1u);
    EXPECT_EQ(a.result().uses()[0].operand_index, 0u);
    ASSERT_EQ(b.result().uses().size(), 1u);
    EXPECT_EQ(b.result().uses()[0], (Use{&sum, 1}));
}

TEST_F(IrTest, ReplaceAllUsesWith) {
    auto& a = add(arith::constant(1));
    auto& b = add(arith::constant(2));
    auto& x = add(arith::addi(a.result(), a.result()));
    auto& y = add(arith::muli(a.result(), b.result()));

    a.result().replace_all_uses_with(b.result());

    EXPECT_FALSE(a.has_uses());
    EXPECT_EQ(b.result().uses().size(), 4u);
    EXPECT_EQ(x.operand(0), &b.result());
    EXPECT_EQ(x.operand(1), &b.result());
    EXPECT_EQ(y.operand(0), &b.result());
}

TEST_F(IrTest, EraseRequiresNoUses) {
    auto& a = add(arith::constant(1));
    auto& sum = add(arith::addi(a.result(), a.result()));

    EXPECT_THROW(body().erase(a), std::logic_error);

    body().erase(sum);
    EXPECT_FALSE(a.has_uses());
    body().erase(a);
    EXPECT_TRUE(body().empty());
}

TEST_F(IrTest, RemoveReturnsOwnership) {
    auto& a = add(arith::constant(1));
    auto& b = add(arith::constant(2));

    Box<Operation> owned = body().remove(a);
    EXPECT_EQ(owned->parent_block(), nullptr);
    EXPECT_EQ(body().size(), 1u);

    body().insert_after(b, std::move(owned));
    EXPECT_EQ(body().index_of(a), 1u);
    EXPECT_EQ(body().index_of(b), 0u);
}

TEST_F(IrTest, InsertBeforeAndAfter) {
    auto& first = add(arith::constant(1));
    auto& last = add(arith::constant(3));
    auto& middle = body().insert_before(last, arith::constant(2));
    auto& tail = body().insert_after(last, arith::constant(4));

    EXPECT_EQ(body().index_of(first), 0u);
    EXPECT_EQ(body().index_of(middle), 1u);
    EXPECT_EQ(body().index_of(last), 2u);
    EXPECT_EQ(body().index_of(tail), 3u);
    EXPECT_EQ(middle.parent_block(), &body());
    EXPECT_EQ(middle.parent_op(), module_.get());
}

// ============================================================================
// Traversal
// ============================================================================

namespace {

auto make_wrapper(std::vector<Box<Operation>> inner) -> Box<Operation> {
    OperationState state{"test.wrapper"};
    auto region = make_box<Region>();
    Block& block = region->add_block();
    for (auto& op : inner) {
        block.push_back(std::move(op));
    }
    state.regions.push_back(std::move(region));
    return Operation::create(std::move(state));
}

} // namespace

TEST_F(IrTest, WalkIsPreOrder) {
    add(arith::constant(1));
    std::vector<Box<Operation>> inner;
    inner.push_back(arith::constant(2));
    inner.push_back(arith::constant(3));
    add(make_wrapper(std::move(inner)));
    add(arith::constant(4));

    std::vector<std::string> seen;
    module_->walk([&](Operation& op) {
        auto value = arith::constant_value(op);
        seen.push_back(value ? std::to_string(*value) : op.kind());
    });

    EXPECT_EQ(seen, (std::vector<std::string>{"builtin.module", "1", "test.wrapper", "2", "3", "4"}));
    EXPECT_EQ(count_ops(*module_), 5u);
}

TEST_F(IrTest, AbortableWalkStopsImmediately) {
    add(arith::constant(1));
    add(arith::constant(2));
    add(arith::constant(3));

    int visited = 0;
    auto result = module_->walk_abortable([&](Operation& op) {
        ++visited;
        return arith::constant_value(op) == 2 ? WalkResult::Interrupt : WalkResult::Advance;
    });

    EXPECT_EQ(result, WalkResult::Interrupt);
    EXPECT_EQ(visited, 3); // module, 1, 2
}

TEST_F(IrTest, ValueUsedInsideRegion) {
    auto& c = add(arith::constant(1));
    auto& unused = add(arith::constant(2));
    std::vector<Box<Operation>> inner;
    inner.push_back(arith::addi(c.result(), c.result()));
    add(make_wrapper(std::move(inner)));

    const Region& top = module_->region();
    const Region& nested = body().ops().back()->region();
    EXPECT_TRUE(is_value_used_inside(nested, c.result()));
    EXPECT_TRUE(is_value_used_inside(top, c.result()));
    EXPECT_FALSE(is_value_used_inside(nested, unused.result()));
}

// ============================================================================
// Printable references
// ============================================================================

TEST_F(IrTest, DescribeUsesPositionPaths) {
    auto& c = add(arith::constant(1));
    std::vector<Box<Operation>> inner;
    inner.push_back(arith::addi(c.result(), c.result()));
    auto& wrapper = add(make_wrapper(std::move(inner)));
    Operation& nested = *wrapper.region().ops().front();

    EXPECT_EQ(describe(*module_), "builtin.module@root");
    EXPECT_EQ(describe(c), "arith.constant@0.0.0");
    EXPECT_EQ(describe(nested), "arith.addi@0.0.1/0.0.0");
    EXPECT_EQ(describe(c.result()), "arith.constant@0.0.0#0");
    EXPECT_EQ(describe(body()), "0.0");
    EXPECT_EQ(describe(wrapper.region().block()), "0.0.1/0.0");
}

TEST_F(IrTest, DescribeBlockArgument) {
    Block& second = module_->region().add_block({i32()});
    EXPECT_EQ(describe(second.arg(0)), "^0.1:arg0");

    Block detached(std::vector<Attribute>{i1()});
    EXPECT_EQ(describe(detached.arg(0)), "^detached:arg0");
}

TEST_F(IrTest, DescribeUnparentedOperation) {
    auto lone = arith::constant(5);
    EXPECT_EQ(describe(*lone), "arith.constant@root");
}

// ============================================================================
// Successors and teardown
// ============================================================================

TEST_F(IrTest, BranchSuccessors) {
    Block& entry = body();
    Block& exit = module_->region().add_block({i64()});
    auto& c = add(arith::constant(7));
    auto& br = entry.push_back(dialects::cf::br(exit, {&c.result()}));

    ASSERT_EQ(br.successors().size(), 1u);
    EXPECT_EQ(br.successors()[0], &exit);
    EXPECT_EQ(c.result().uses().size(), 1u);
}

TEST_F(IrTest, TeardownWithCrossBlockUses) {
    // Uses flow from the first block into the second; destroying the module
    // must not touch freed values.
    auto module = create_module();
    Region& region = module->region();
    auto& c = region.block().push_back(arith::constant(1));
    Block& second = region.add_block();
    second.push_back(arith::addi(c.result(), c.result()));

    std::vector<Box<Operation>> inner;
    inner.push_back(arith::muli(c.result(), c.result()));
    region.block().push_back(make_wrapper(std::move(inner)));

    EXPECT_EQ(c.result().uses().size(), 4u);
    module.reset();
    SUCCEED();
}

TEST_F(IrTest, DropAllReferencesClearsUses) {
    auto& c = add(arith::constant(1));
    auto& sum = add(arith::addi(c.result(), c.result()));

    sum.drop_all_references();
    EXPECT_FALSE(c.has_uses());
}
