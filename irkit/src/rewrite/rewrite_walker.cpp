#include "rewrite/rewrite_walker.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>

namespace irkit::rewrite {

namespace {

class Worklist {
public:
    void push(Operation* op) {
        if (queued_.insert(op).second) {
            items_.push_back(op);
        }
    }

    auto pop() -> Operation* {
        Operation* op = items_.front();
        items_.pop_front();
        queued_.erase(op);
        return op;
    }

    void remove(const Operation* op) {
        if (queued_.erase(op) == 0)
            return;
        items_.erase(std::remove(items_.begin(), items_.end(), op), items_.end());
    }

    [[nodiscard]] auto empty() const -> bool {
        return items_.empty();
    }

private:
    std::deque<Operation*> items_;
    std::unordered_set<const Operation*> queued_;
};

} // namespace

PatternRewriteWalker::PatternRewriteWalker(Box<RewritePattern> pattern, GreedyRewriteConfig config)
    : pattern_(std::move(pattern)), config_(config) {
    if (!pattern_) {
        throw std::invalid_argument("rewrite walker needs a pattern");
    }
}

auto PatternRewriteWalker::rewrite_module(Operation& module) -> bool {
    stats_ = RewriteStats{};

    Worklist worklist;
    module.walk([&](Operation& op) {
        if (&op != &module) {
            worklist.push(&op);
        }
    });

    bool changed = false;
    while (!worklist.empty()) {
        Operation* op = worklist.pop();
        ++stats_.ops_visited;

        // Described up front: the pattern may erase the op
        std::string subject = config_.trace_rewrites ? ir::describe(*op) : std::string{};

        PatternRewriter rewriter(*op);
        pattern_->match_and_rewrite(*op, rewriter);
        if (!rewriter.has_done_action())
            continue;

        changed = true;
        ++stats_.rewrites_applied;
        stats_.ops_inserted += rewriter.num_inserted();
        stats_.ops_erased += rewriter.num_erased();

        if (config_.trace_rewrites) {
            IRKIT_LOG_DEBUG("rewrite", pattern_->name()
                                           << " rewrote " << subject << " (+"
                                           << rewriter.num_inserted() << " -"
                                           << rewriter.num_erased() << ")");
        }

        for (const Operation* erased : rewriter.erased_ops()) {
            worklist.remove(erased);
        }
        if (config_.apply_recursively) {
            for (Operation* affected : rewriter.affected_ops()) {
                if (affected != &module) {
                    worklist.push(affected);
                }
            }
        }
    }

    IRKIT_LOG_INFO("rewrite", pattern_->name()
                                  << ": " << stats_.rewrites_applied << " rewrites over "
                                  << stats_.ops_visited << " visits in " << ir::describe(module));

    if (config_.verify_after_rewrite && config_.registry != nullptr) {
        auto verified = config_.registry->verify(module);
        if (is_err(verified)) {
            throw ir::DiagnosticError(unwrap_err(verified));
        }
    }
    return changed;
}

} // namespace irkit::rewrite
