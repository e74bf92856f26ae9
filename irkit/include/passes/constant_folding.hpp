#pragma once

// Constant Folding Patterns
//
// Evaluates arith operations whose operands are all constants.
// For example, `addi(constant 2, constant 3)` becomes `constant 5`.
//
// Folds performed:
// - addi, subi, muli (wrapping 64-bit arithmetic)
// - cmpi for every predicate, producing an i1 constant
//
// A fold also erases the constants it consumed once nothing else uses them.

#include "common.hpp"
#include "rewrite/pattern_rewriter.hpp"
#include "rewrite/rewrite_walker.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace irkit::passes {

// Folds one binary arithmetic kind
class FoldBinaryPattern : public rewrite::OpKindRewritePattern {
public:
    explicit FoldBinaryPattern(std::string kind) : OpKindRewritePattern(std::move(kind)) {}

    // Returns nullopt for a kind it does not evaluate
    [[nodiscard]] static auto try_fold(const std::string& kind, int64_t lhs, int64_t rhs)
        -> std::optional<int64_t>;

protected:
    void rewrite(ir::Operation& op, rewrite::PatternRewriter& rewriter) override;
};

class FoldComparePattern : public rewrite::OpKindRewritePattern {
public:
    FoldComparePattern();

    // Throws DiagnosticError naming `op` for a predicate outside the known set
    [[nodiscard]] static auto evaluate(const ir::Operation& op, int64_t lhs, int64_t rhs) -> bool;

protected:
    void rewrite(ir::Operation& op, rewrite::PatternRewriter& rewriter) override;
};

/// All folding patterns behind one applier.
[[nodiscard]] auto constant_folding_patterns() -> Box<rewrite::GreedyRewritePatternApplier>;

/// Runs the folding patterns over `module` to a fixpoint. Returns true if
/// anything was folded.
auto fold_constants(ir::Operation& module, rewrite::GreedyRewriteConfig config = {}) -> bool;

} // namespace irkit::passes
