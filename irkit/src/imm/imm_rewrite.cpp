#include "imm/imm_rewrite.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace irkit::imm {

auto Substitution::lookup(const IValue* value) const -> const IValue* {
    auto it = values.find(value);
    return it != values.end() ? it->second : value;
}

auto Substitution::lookup(const IBlock* block) const -> const IBlock* {
    auto it = blocks.find(block);
    return it != blocks.end() ? it->second : block;
}

namespace {

// ============================================================================
// Operand unpacking
// ============================================================================

struct UnpackedOperands {
    std::vector<const IValue*> values;
    OpChain pending; // Operations to insert ahead of the one being built
};

auto unpack_operands(const std::vector<Operand>& operands, const Substitution* env)
    -> UnpackedOperands {
    UnpackedOperands out;
    std::unordered_set<const IOp*> seen;

    for (const auto& operand : operands) {
        const IValue* value = nullptr;

        if (const auto* direct = std::get_if<const IValue*>(&operand)) {
            value = *direct;
        } else {
            OpChain chain;
            if (const auto* single = std::get_if<const IOp*>(&operand)) {
                chain.push_back(*single);
            } else {
                chain = std::get<OpChain>(operand);
            }

            if (chain.empty() || chain.back() == nullptr) {
                throw std::invalid_argument("operation chain used as operand is empty");
            }
            if (chain.back()->result() == nullptr) {
                throw std::invalid_argument(describe(*chain.back()) +
                                            " is used as an operand but has no result");
            }

            for (const IOp* op : chain) {
                if (seen.insert(op).second) {
                    out.pending.push_back(op);
                }
            }
            value = chain.back()->result();
        }

        if (value == nullptr) {
            throw std::invalid_argument("null operand");
        }
        out.values.push_back(env != nullptr ? env->lookup(value) : value);
    }

    // An operation is always created after the operations it uses, so serial
    // order is a definition order for the combined chain.
    std::stable_sort(out.pending.begin(), out.pending.end(),
                     [](const IOp* a, const IOp* b) { return a->serial() < b->serial(); });
    return out;
}

// ============================================================================
// Localized rebuild
// ============================================================================

class Rebuilder {
public:
    Rebuilder(IrArena& arena, Substitution& env) : arena_(arena), env_(env) {}

    /// Creates the replacement block for `old_block`, records the block and
    /// argument mappings, and returns its builder.
    auto begin_block(const IBlock& old_block) -> BlockBuilder {
        BlockBuilder builder(arena_, old_block.arg_types());
        for (size_t i = 0; i < old_block.args().size(); ++i) {
            // An explicit substitution for the argument takes precedence
            env_.values.try_emplace(old_block.arg(i), builder.arg(i));
        }
        env_.blocks[&old_block] = builder.block();
        return builder;
    }

    void fill(BlockBuilder& builder, const SealedList<const IOp*>& ops) {
        for (const IOp* op : ops) {
            builder.append(substitute_if_required(*op));
        }
    }

    auto substitute_if_required(const IOp& op) -> const IOp* {
        bool changed = false;

        std::vector<const IRegion*> regions;
        regions.reserve(op.regions().size());
        for (const IRegion* region : op.regions()) {
            if (region_references_env(*region)) {
                regions.push_back(rebuild_region(*region));
                changed = true;
            } else {
                regions.push_back(region);
            }
        }

        changed = changed || op_references_env(op, {});

        if (!changed) {
            ++reused_;
            return &op;
        }

        OpOverrides overrides;
        overrides.operands = std::vector<Operand>(op.operands().begin(), op.operands().end());
        overrides.regions = std::move(regions);
        auto chain = from_op(arena_, op, std::move(overrides), &env_);
        ++rebuilt_;
        IRKIT_LOG_TRACE("imm", "rebuilt " << describe(op) << " as " << describe(*chain.back()));
        return chain.back();
    }

    [[nodiscard]] auto reused() const -> size_t {
        return reused_;
    }

    [[nodiscard]] auto rebuilt() const -> size_t {
        return rebuilt_;
    }

private:
    /// True if `op` itself (not its regions) uses a substituted value or
    /// branches to a substituted or pending block.
    auto op_references_env(const IOp& op, const std::unordered_set<const IBlock*>& pending) const
        -> bool {
        for (const IValue* operand : op.operands()) {
            if (env_.contains(operand))
                return true;
        }
        for (const IBlock* successor : op.successors()) {
            if (env_.contains(successor) || pending.count(successor) > 0)
                return true;
        }
        return false;
    }

    auto block_references_env(const IBlock& block,
                              const std::unordered_set<const IBlock*>& pending) const -> bool {
        auto found = block.walk_abortable([&](const IOp& op) {
            return op_references_env(op, pending) ? WalkResult::Interrupt : WalkResult::Advance;
        });
        return found == WalkResult::Interrupt;
    }

    /// True if `op` or anything nested in it uses a substituted or redefined
    /// value, or branches to a substituted or pending block.
    auto op_will_change(const IOp& op, const std::unordered_set<const IValue*>& redefined,
                        const std::unordered_set<const IBlock*>& pending) const -> bool {
        auto found = op.walk_abortable([&](const IOp& nested) {
            if (op_references_env(nested, pending))
                return WalkResult::Interrupt;
            for (const IValue* operand : nested.operands()) {
                if (redefined.count(operand) > 0)
                    return WalkResult::Interrupt;
            }
            return WalkResult::Advance;
        });
        return found == WalkResult::Interrupt;
    }

    auto region_references_env(const IRegion& region) const -> bool {
        for (const IBlock* block : region.blocks()) {
            if (block_references_env(*block, {}))
                return true;
        }
        return false;
    }

    /// Rebuilds the blocks of `region` that reach a substituted value, plus
    /// the blocks that branch to those or use a value one of them redefines.
    /// Other blocks are shared.
    auto rebuild_region(const IRegion& region) -> const IRegion* {
        // Values that get a replacement once the region is rebuilt: results of
        // rebuilt operations and arguments of rebuilt blocks.
        std::unordered_set<const IValue*> redefined;
        std::unordered_set<const IBlock*> pending;
        bool grew = true;
        while (grew) {
            grew = false;
            for (const IBlock* block : region.blocks()) {
                for (const IOp* op : block->ops()) {
                    if (!op_will_change(*op, redefined, pending))
                        continue;
                    for (const IValue* result : op->results()) {
                        grew = redefined.insert(result).second || grew;
                    }
                    if (pending.insert(block).second) {
                        grew = true;
                        for (const IValue* arg : block->args()) {
                            redefined.insert(arg);
                        }
                    }
                }
            }
        }

        // All replacement blocks exist before any operation is rebuilt
        std::vector<std::pair<const IBlock*, BlockBuilder>> builders;
        for (const IBlock* block : region.blocks()) {
            if (pending.count(block) > 0) {
                builders.emplace_back(block, begin_block(*block));
            }
        }

        for (auto& [old_block, builder] : builders) {
            fill(builder, old_block->ops());
            builder.finish();
        }

        std::vector<const IBlock*> blocks;
        blocks.reserve(region.blocks().size());
        for (const IBlock* block : region.blocks()) {
            blocks.push_back(env_.lookup(block));
        }
        return arena_.create_region(std::move(blocks));
    }

    IrArena& arena_;
    Substitution& env_;
    size_t reused_ = 0;
    size_t rebuilt_ = 0;
};

} // namespace

// ============================================================================
// Combinators
// ============================================================================

auto new_op(IrArena& arena, const std::string& kind, OpFields fields) -> OpChain {
    auto unpacked = unpack_operands(fields.operands, nullptr);
    auto data = arena.make_op_data(kind, kind, std::move(fields.attributes));
    const IOp* op = arena.create_op(std::move(data), std::move(unpacked.values),
                                    fields.result_types, std::move(fields.successors),
                                    std::move(fields.regions));
    OpChain chain = std::move(unpacked.pending);
    chain.push_back(op);
    return chain;
}

auto from_op(IrArena& arena, const IOp& old_op, OpOverrides overrides, Substitution* env)
    -> OpChain {
    std::vector<Operand> operands =
        overrides.operands ? std::move(*overrides.operands)
                           : std::vector<Operand>(old_op.operands().begin(), old_op.operands().end());
    auto unpacked = unpack_operands(operands, env);

    std::vector<Attribute> result_types =
        overrides.result_types ? std::move(*overrides.result_types) : old_op.result_types();

    std::vector<const IBlock*> successors =
        overrides.successors ? std::move(*overrides.successors) : old_op.successors().to_vector();
    if (env != nullptr) {
        for (auto& successor : successors) {
            successor = env->lookup(successor);
        }
    }

    std::vector<const IRegion*> regions =
        overrides.regions ? std::move(*overrides.regions) : old_op.regions().to_vector();

    Rc<const OpData> data =
        overrides.attributes
            ? arena.make_op_data(old_op.name(), old_op.kind(), std::move(*overrides.attributes))
            : old_op.data();

    const IOp* op = arena.create_op(std::move(data), std::move(unpacked.values), result_types,
                                    std::move(successors), std::move(regions));

    if (env != nullptr) {
        size_t mapped = std::min(old_op.results().size(), op->results().size());
        for (size_t i = 0; i < mapped; ++i) {
            env->values[old_op.results()[i]] = op->results()[i];
        }
    }

    OpChain chain = std::move(unpacked.pending);
    chain.push_back(op);
    return chain;
}

// ============================================================================
// Block rebuilding
// ============================================================================

auto rebuild_block_with_substitution(IrArena& arena, const IBlock& old_block, Substitution& env)
    -> const IBlock* {
    return rebuild_block_with_substitution(arena, old_block.ops(), old_block, env);
}

auto rebuild_block_with_substitution(IrArena& arena, const SealedList<const IOp*>& ops,
                                     const IBlock& old_block, Substitution& env)
    -> const IBlock* {
    Rebuilder rebuilder(arena, env);
    BlockBuilder builder = rebuilder.begin_block(old_block);
    rebuilder.fill(builder, ops);
    IRKIT_LOG_DEBUG("imm", "rebuilt " << describe(old_block) << ": " << rebuilder.rebuilt()
                                      << " ops rebuilt, " << rebuilder.reused() << " reused");
    return builder.finish();
}

auto rewrite_block(IrArena& arena, const IBlock& block, const BlockRewriteFn& fn)
    -> const IBlock* {
    Substitution env;
    Rebuilder rebuilder(arena, env);
    BlockBuilder builder = rebuilder.begin_block(block);
    size_t rewritten = 0;

    for (const IOp* op : block.ops()) {
        const IOp* current = rebuilder.substitute_if_required(*op);
        auto replacement = fn(*current);
        if (!replacement) {
            builder.append(current);
            continue;
        }

        if (replacement->empty()) {
            if (!current->results().empty()) {
                throw std::invalid_argument("cannot drop " + describe(*op) +
                                            " without replacing its results");
            }
        } else {
            const IOp* last = replacement->back();
            if (last->results().size() != current->results().size()) {
                throw std::invalid_argument("replacement for " + describe(*op) + " produces " +
                                            std::to_string(last->results().size()) +
                                            " results, expected " +
                                            std::to_string(current->results().size()));
            }
            for (size_t i = 0; i < last->results().size(); ++i) {
                env.values[op->results()[i]] = last->results()[i];
                env.values[current->results()[i]] = last->results()[i];
            }
        }

        builder.append(*replacement);
        ++rewritten;
    }

    IRKIT_LOG_DEBUG("imm", "rewrote " << rewritten << " of " << block.ops().size() << " ops in "
                                      << describe(block));
    return builder.finish();
}

} // namespace irkit::imm
