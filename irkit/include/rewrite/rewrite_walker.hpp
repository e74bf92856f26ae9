#pragma once

// Fixpoint Rewrite Driver
//
// PatternRewriteWalker applies one pattern (usually a composite applier) to
// every operation nested in a module until no pattern acts. Operations are
// visited from a FIFO worklist seeded in pre-order. After each rewrite the
// operations it erased leave the worklist and, with apply_recursively, the
// operations it inserted or modified are queued again in the order the
// rewrite touched them. An operation never sits in the worklist twice.

#include "common.hpp"
#include "ir/ir.hpp"
#include "ir/op_registry.hpp"
#include "rewrite/pattern_rewriter.hpp"

#include <cstddef>

namespace irkit::rewrite {

struct GreedyRewriteConfig {
    // Requeue operations touched by a rewrite
    bool apply_recursively = true;
    // Verify the module through `registry` once the walk is done
    bool verify_after_rewrite = false;
    // Log each applied pattern at Debug
    bool trace_rewrites = true;
    const ir::KindRegistry* registry = nullptr;
};

struct RewriteStats {
    size_t ops_visited = 0;      // Pattern invocations
    size_t rewrites_applied = 0; // Invocations that acted
    size_t ops_inserted = 0;
    size_t ops_erased = 0;
};

class PatternRewriteWalker {
public:
    explicit PatternRewriteWalker(Box<RewritePattern> pattern, GreedyRewriteConfig config = {});

    /// Rewrites everything nested in `module` to a fixpoint. The module
    /// operation itself is not offered to the pattern. Returns true if any
    /// pattern acted. Exceptions raised by a pattern propagate; the module
    /// then holds whatever the rewrites before it produced.
    ///
    /// Throws DiagnosticError when verify_after_rewrite is set and the
    /// registry rejects the result.
    auto rewrite_module(Operation& module) -> bool;

    /// Counters of the most recent rewrite_module call
    [[nodiscard]] auto stats() const -> const RewriteStats& {
        return stats_;
    }

    [[nodiscard]] auto config() const -> const GreedyRewriteConfig& {
        return config_;
    }

private:
    Box<RewritePattern> pattern_;
    GreedyRewriteConfig config_;
    RewriteStats stats_;
};

} // namespace irkit::rewrite
