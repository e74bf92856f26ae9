#pragma once

// Rewrite Patterns and the Mutation Handle
//
// A RewritePattern looks at one operation and either leaves it alone or
// changes the IR through the PatternRewriter it is handed. The rewriter is
// the only way a pattern mutates the module: every call keeps use-lists
// exact and records which operations were inserted, modified or erased so
// the driver can requeue exactly those.
//
// A pattern declines by returning without calling any rewriter method.

#include "common.hpp"
#include "ir/ir.hpp"
#include "match/query.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace irkit::rewrite {

using ir::Operation;
using ir::Value;

// ============================================================================
// PatternRewriter
// ============================================================================

class PatternRewriter {
public:
    explicit PatternRewriter(Operation& current_op) : current_op_(&current_op) {}

    PatternRewriter(const PatternRewriter&) = delete;
    auto operator=(const PatternRewriter&) -> PatternRewriter& = delete;

    // The operation the pattern was invoked on
    [[nodiscard]] auto current_op() const -> Operation& {
        return *current_op_;
    }

    // True once any mutation went through this rewriter
    [[nodiscard]] auto has_done_action() const -> bool {
        return has_done_action_;
    }

    [[nodiscard]] auto has_erased_matched_op() const -> bool {
        return matched_op_erased_;
    }

    // --- Insertion ---

    auto insert_op_before_matched_op(Box<Operation> op) -> Operation&;
    void insert_op_before_matched_op(std::vector<Box<Operation>> ops);
    auto insert_op_after_matched_op(Box<Operation> op) -> Operation&;

    auto insert_op_before(Operation& anchor, Box<Operation> op) -> Operation&;
    auto insert_op_after(Operation& anchor, Box<Operation> op) -> Operation&;

    // --- Replacement ---

    // Inserts `new_ops` before the matched op, redirects its results to
    // `new_results` (default: the results of the last new op) and erases it.
    void replace_matched_op(std::vector<Box<Operation>> new_ops,
                            std::optional<std::vector<Value*>> new_results = std::nullopt);
    void replace_matched_op(Box<Operation> new_op);

    void replace_op(Operation& op, std::vector<Box<Operation>> new_ops,
                    std::optional<std::vector<Value*>> new_results = std::nullopt);

    // --- Erasure ---

    // Throws RewriteError if a result of the op is still used.
    void erase_matched_op();
    void erase_op(Operation& op);

    // --- In-place updates ---

    void replace_all_uses_with(Value& from, Value& to);
    void modify_operand(Operation& op, size_t index, Value& value);

    // --- Effects, in discovery order ---

    // Inserted and modified operations still alive
    [[nodiscard]] auto affected_ops() const -> const std::vector<Operation*>& {
        return affected_;
    }

    // Addresses of erased operations, nested ones included. Never dereferenced.
    [[nodiscard]] auto erased_ops() const -> const std::vector<const Operation*>& {
        return erased_;
    }

    [[nodiscard]] auto num_inserted() const -> size_t {
        return num_inserted_;
    }

    [[nodiscard]] auto num_erased() const -> size_t {
        return num_erased_;
    }

private:
    auto block_of(const Operation& op) const -> ir::Block&;
    void record_inserted(Operation& op);
    void record_modified(Operation& op);
    void record_users(const Value& value);
    void record_erased(Operation& op);

    Operation* current_op_;
    bool has_done_action_ = false;
    bool matched_op_erased_ = false;
    std::vector<Operation*> affected_;
    std::vector<const Operation*> erased_;
    size_t num_inserted_ = 0;
    size_t num_erased_ = 0;
};

// ============================================================================
// Patterns
// ============================================================================

class RewritePattern {
public:
    virtual ~RewritePattern() = default;

    // Pattern name for logging
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    virtual void match_and_rewrite(Operation& op, PatternRewriter& rewriter) = 0;
};

// Pattern that only fires on operations of one kind
class OpKindRewritePattern : public RewritePattern {
public:
    explicit OpKindRewritePattern(std::string kind) : kind_(std::move(kind)) {}

    [[nodiscard]] auto name() const -> std::string override {
        return kind_ + "-pattern";
    }

    void match_and_rewrite(Operation& op, PatternRewriter& rewriter) final {
        if (op.kind() == kind_) {
            rewrite(op, rewriter);
        }
    }

    [[nodiscard]] auto kind() const -> const std::string& {
        return kind_;
    }

protected:
    virtual void rewrite(Operation& op, PatternRewriter& rewriter) = 0;

private:
    std::string kind_;
};

using RewriteFn = std::function<void(Operation&, PatternRewriter&)>;

class AnonymousRewritePattern : public RewritePattern {
public:
    AnonymousRewritePattern(std::string name, RewriteFn fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    [[nodiscard]] auto name() const -> std::string override {
        return name_;
    }

    void match_and_rewrite(Operation& op, PatternRewriter& rewriter) override {
        fn_(op, rewriter);
    }

private:
    std::string name_;
    RewriteFn fn_;
};

using QueryRewriteFn = std::function<void(const match::Match&, PatternRewriter&)>;

// Declines when the query does not match, otherwise hands the bindings to
// the rewrite action
class QueryRewritePattern : public RewritePattern {
public:
    QueryRewritePattern(std::string name, match::Query query, QueryRewriteFn fn)
        : name_(std::move(name)), query_(std::move(query)), fn_(std::move(fn)) {}

    [[nodiscard]] auto name() const -> std::string override {
        return name_;
    }

    void match_and_rewrite(Operation& op, PatternRewriter& rewriter) override;

private:
    std::string name_;
    match::Query query_;
    QueryRewriteFn fn_;
};

// Tries its patterns in order; the first one that acts wins the operation
class GreedyRewritePatternApplier : public RewritePattern {
public:
    explicit GreedyRewritePatternApplier(std::vector<Box<RewritePattern>> patterns)
        : patterns_(std::move(patterns)) {}

    [[nodiscard]] auto name() const -> std::string override;

    void match_and_rewrite(Operation& op, PatternRewriter& rewriter) override;

    [[nodiscard]] auto size() const -> size_t {
        return patterns_.size();
    }

private:
    std::vector<Box<RewritePattern>> patterns_;
};

} // namespace irkit::rewrite
