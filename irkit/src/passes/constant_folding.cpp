// Constant Folding Patterns Implementation

#include "passes/constant_folding.hpp"

#include "dialects/arith.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace irkit::passes {

using dialects::arith::CmpPredicate;
using ir::Operation;
using rewrite::PatternRewriter;

namespace {

auto result_width(const Operation& op) -> std::optional<uint32_t> {
    if (op.num_results() != 1)
        return std::nullopt;
    if (const auto* type = op.result().type().get_if<ir::IntegerType>()) {
        return type->width;
    }
    return std::nullopt;
}

// Keeps the low `width` bits of `value` and reads them back as signed
auto sign_extend(int64_t value, uint32_t width) -> int64_t {
    if (width == 0 || width >= 64)
        return value;
    uint64_t bits = static_cast<uint64_t>(value) & ((uint64_t{1} << width) - 1);
    uint64_t sign = uint64_t{1} << (width - 1);
    return static_cast<int64_t>((bits ^ sign) - sign);
}

// Producers of the folded op's operands, each once
auto operand_producers(const Operation& op) -> std::vector<Operation*> {
    std::vector<Operation*> producers;
    for (ir::Value* operand : op.operands()) {
        Operation* producer = operand->defining_op();
        if (producer != nullptr &&
            std::find(producers.begin(), producers.end(), producer) == producers.end()) {
            producers.push_back(producer);
        }
    }
    return producers;
}

void erase_dead_constants(const std::vector<Operation*>& producers, PatternRewriter& rewriter) {
    for (Operation* producer : producers) {
        if (producer->kind() == dialects::arith::CONSTANT && !producer->has_uses()) {
            rewriter.erase_op(*producer);
        }
    }
}

void replace_with_constant(Operation& op, int64_t value, uint32_t width,
                           PatternRewriter& rewriter) {
    auto producers = operand_producers(op);
    IRKIT_LOG_TRACE("fold", ir::describe(op) << " -> " << value);
    rewriter.replace_matched_op(dialects::arith::constant(value, width));
    erase_dead_constants(producers, rewriter);
}

} // namespace

// ============================================================================
// Binary arithmetic
// ============================================================================

auto FoldBinaryPattern::try_fold(const std::string& kind, int64_t lhs, int64_t rhs)
    -> std::optional<int64_t> {
    // Unsigned arithmetic wraps instead of overflowing
    auto l = static_cast<uint64_t>(lhs);
    auto r = static_cast<uint64_t>(rhs);
    if (kind == dialects::arith::ADDI)
        return static_cast<int64_t>(l + r);
    if (kind == dialects::arith::SUBI)
        return static_cast<int64_t>(l - r);
    if (kind == dialects::arith::MULI)
        return static_cast<int64_t>(l * r);
    return std::nullopt;
}

void FoldBinaryPattern::rewrite(Operation& op, PatternRewriter& rewriter) {
    if (op.num_operands() != 2)
        return;
    auto lhs = dialects::arith::constant_value(*op.operand(0));
    auto rhs = dialects::arith::constant_value(*op.operand(1));
    auto width = result_width(op);
    if (!lhs || !rhs || !width)
        return;

    auto folded = try_fold(op.kind(), *lhs, *rhs);
    if (!folded)
        return;
    replace_with_constant(op, sign_extend(*folded, *width), *width, rewriter);
}

// ============================================================================
// Comparisons
// ============================================================================

FoldComparePattern::FoldComparePattern() : OpKindRewritePattern(dialects::arith::CMPI) {}

auto FoldComparePattern::evaluate(const Operation& op, int64_t lhs, int64_t rhs) -> bool {
    const ir::Attribute* attr = op.get_attribute("predicate");
    const auto* predicate = attr != nullptr ? attr->get_if<ir::IntegerAttr>() : nullptr;
    if (predicate == nullptr) {
        throw ir::unhandled_case(op, "comparison without an integer predicate");
    }

    auto ul = static_cast<uint64_t>(lhs);
    auto ur = static_cast<uint64_t>(rhs);

    switch (static_cast<CmpPredicate>(predicate->value)) {
    case CmpPredicate::Eq:
        return lhs == rhs;
    case CmpPredicate::Ne:
        return lhs != rhs;
    case CmpPredicate::Slt:
        return lhs < rhs;
    case CmpPredicate::Sle:
        return lhs <= rhs;
    case CmpPredicate::Sgt:
        return lhs > rhs;
    case CmpPredicate::Sge:
        return lhs >= rhs;
    case CmpPredicate::Ult:
        return ul < ur;
    case CmpPredicate::Ule:
        return ul <= ur;
    case CmpPredicate::Ugt:
        return ul > ur;
    case CmpPredicate::Uge:
        return ul >= ur;
    }
    throw ir::unhandled_case(op, "comparison predicate " + std::to_string(predicate->value));
}

void FoldComparePattern::rewrite(Operation& op, PatternRewriter& rewriter) {
    if (op.num_operands() != 2)
        return;
    auto lhs = dialects::arith::constant_value(*op.operand(0));
    auto rhs = dialects::arith::constant_value(*op.operand(1));
    if (!lhs || !rhs)
        return;

    bool result = evaluate(op, *lhs, *rhs);
    replace_with_constant(op, result ? 1 : 0, 1, rewriter);
}

// ============================================================================
// Pattern set
// ============================================================================

auto constant_folding_patterns() -> Box<rewrite::GreedyRewritePatternApplier> {
    std::vector<Box<rewrite::RewritePattern>> patterns;
    patterns.push_back(make_box<FoldBinaryPattern>(dialects::arith::ADDI));
    patterns.push_back(make_box<FoldBinaryPattern>(dialects::arith::SUBI));
    patterns.push_back(make_box<FoldBinaryPattern>(dialects::arith::MULI));
    patterns.push_back(make_box<FoldComparePattern>());
    return make_box<rewrite::GreedyRewritePatternApplier>(std::move(patterns));
}

auto fold_constants(Operation& module, rewrite::GreedyRewriteConfig config) -> bool {
    rewrite::PatternRewriteWalker walker(constant_folding_patterns(), config);
    bool changed = walker.rewrite_module(module);
    IRKIT_LOG_DEBUG("fold", walker.stats().rewrites_applied << " folds in " << ir::describe(module));
    return changed;
}

} // namespace irkit::passes
