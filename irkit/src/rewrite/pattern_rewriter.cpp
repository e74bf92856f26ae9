#include "rewrite/pattern_rewriter.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace irkit::rewrite {

using ir::RewriteError;

// ============================================================================
// Effect Bookkeeping
// ============================================================================

auto PatternRewriter::block_of(const Operation& op) const -> ir::Block& {
    ir::Block* block = op.parent_block();
    if (block == nullptr) {
        throw RewriteError(ir::describe(op) + " is not inside a block");
    }
    return *block;
}

void PatternRewriter::record_inserted(Operation& op) {
    ++num_inserted_;
    op.walk([this](Operation& nested) {
        // A new op may reuse the address of one erased earlier in this rewrite
        erased_.erase(std::remove(erased_.begin(), erased_.end(), &nested), erased_.end());
        affected_.push_back(&nested);
    });
}

void PatternRewriter::record_modified(Operation& op) {
    affected_.push_back(&op);
}

void PatternRewriter::record_users(const Value& value) {
    for (const auto& use : value.uses()) {
        record_modified(*use.user);
    }
}

void PatternRewriter::record_erased(Operation& op) {
    ++num_erased_;
    // Producers of the erased op's operands lose a use and may now be dead
    for (Value* operand : op.operands()) {
        if (Operation* producer = operand->defining_op()) {
            record_modified(*producer);
        }
    }
    op.walk([this](Operation& nested) {
        affected_.erase(std::remove(affected_.begin(), affected_.end(), &nested), affected_.end());
        erased_.push_back(&nested);
    });
    if (&op == current_op_) {
        matched_op_erased_ = true;
    }
}

// ============================================================================
// Insertion
// ============================================================================

auto PatternRewriter::insert_op_before_matched_op(Box<Operation> op) -> Operation& {
    return insert_op_before(*current_op_, std::move(op));
}

void PatternRewriter::insert_op_before_matched_op(std::vector<Box<Operation>> ops) {
    for (auto& op : ops) {
        insert_op_before(*current_op_, std::move(op));
    }
}

auto PatternRewriter::insert_op_after_matched_op(Box<Operation> op) -> Operation& {
    return insert_op_after(*current_op_, std::move(op));
}

auto PatternRewriter::insert_op_before(Operation& anchor, Box<Operation> op) -> Operation& {
    if (&anchor == current_op_ && matched_op_erased_) {
        throw RewriteError("cannot insert relative to the erased matched operation");
    }
    Operation& inserted = block_of(anchor).insert_before(anchor, std::move(op));
    has_done_action_ = true;
    record_inserted(inserted);
    return inserted;
}

auto PatternRewriter::insert_op_after(Operation& anchor, Box<Operation> op) -> Operation& {
    if (&anchor == current_op_ && matched_op_erased_) {
        throw RewriteError("cannot insert relative to the erased matched operation");
    }
    Operation& inserted = block_of(anchor).insert_after(anchor, std::move(op));
    has_done_action_ = true;
    record_inserted(inserted);
    return inserted;
}

// ============================================================================
// Replacement
// ============================================================================

void PatternRewriter::replace_matched_op(std::vector<Box<Operation>> new_ops,
                                         std::optional<std::vector<Value*>> new_results) {
    replace_op(*current_op_, std::move(new_ops), std::move(new_results));
}

void PatternRewriter::replace_matched_op(Box<Operation> new_op) {
    std::vector<Box<Operation>> new_ops;
    new_ops.push_back(std::move(new_op));
    replace_op(*current_op_, std::move(new_ops));
}

void PatternRewriter::replace_op(Operation& op, std::vector<Box<Operation>> new_ops,
                                 std::optional<std::vector<Value*>> new_results) {
    ir::Block& block = block_of(op);

    std::vector<Operation*> inserted;
    inserted.reserve(new_ops.size());
    for (auto& new_op : new_ops) {
        if (!new_op) {
            throw RewriteError("null replacement operation for " + ir::describe(op));
        }
        inserted.push_back(new_op.get());
    }

    std::vector<Value*> results;
    if (new_results) {
        results = std::move(*new_results);
    } else if (!inserted.empty()) {
        for (auto* result : inserted.back()->results()) {
            results.push_back(result);
        }
    }

    if (results.size() != op.num_results()) {
        throw RewriteError("replacement for " + ir::describe(op) + " provides " +
                           std::to_string(results.size()) + " results, expected " +
                           std::to_string(op.num_results()));
    }
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i] == nullptr) {
            throw RewriteError("null replacement value for " + ir::describe(op.result(i)));
        }
    }

    for (auto& new_op : new_ops) {
        Operation& placed = block.insert_before(op, std::move(new_op));
        record_inserted(placed);
    }
    has_done_action_ = true;

    for (size_t i = 0; i < results.size(); ++i) {
        record_users(op.result(i));
        op.result(i).replace_all_uses_with(*results[i]);
    }

    erase_op(op);
}

// ============================================================================
// Erasure
// ============================================================================

void PatternRewriter::erase_matched_op() {
    erase_op(*current_op_);
}

void PatternRewriter::erase_op(Operation& op) {
    ir::Block& block = block_of(op);
    if (op.has_uses()) {
        throw RewriteError("cannot erase " + ir::describe(op) + ": its results are still used");
    }
    record_erased(op);
    has_done_action_ = true;
    block.erase(op);
}

// ============================================================================
// In-place Updates
// ============================================================================

void PatternRewriter::replace_all_uses_with(Value& from, Value& to) {
    if (&from == &to)
        return;
    record_users(from);
    from.replace_all_uses_with(to);
    has_done_action_ = true;
}

void PatternRewriter::modify_operand(Operation& op, size_t index, Value& value) {
    op.set_operand(index, &value);
    record_modified(op);
    has_done_action_ = true;
}

// ============================================================================
// Patterns
// ============================================================================

void QueryRewritePattern::match_and_rewrite(Operation& op, PatternRewriter& rewriter) {
    if (op.kind() != query_.root_kind())
        return;
    if (auto bindings = query_.match(op)) {
        fn_(*bindings, rewriter);
    }
}

auto GreedyRewritePatternApplier::name() const -> std::string {
    std::string out = "greedy(";
    for (size_t i = 0; i < patterns_.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += patterns_[i]->name();
    }
    return out + ")";
}

void GreedyRewritePatternApplier::match_and_rewrite(Operation& op, PatternRewriter& rewriter) {
    for (auto& pattern : patterns_) {
        pattern->match_and_rewrite(op, rewriter);
        if (rewriter.has_done_action()) {
            IRKIT_LOG_TRACE("rewrite", pattern->name() << " won");
            return;
        }
    }
}

} // namespace irkit::rewrite
