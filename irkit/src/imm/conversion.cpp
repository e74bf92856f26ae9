#include "imm/conversion.hpp"

#include "log/log.hpp"

#include <unordered_set>

namespace irkit::imm {

using ir::IrErrorKind;

namespace {

// ============================================================================
// Mutable -> Immutable
// ============================================================================

class FromMutable {
public:
    FromMutable(IrArena& arena, ImmutableMapping& mapping) : arena_(arena), mapping_(mapping) {}

    auto convert_op(const ir::Operation& op) -> Result<const IOp*, IrError> {
        if (auto it = converted_.find(&op); it != converted_.end()) {
            return it->second;
        }
        if (!in_progress_.insert(&op).second) {
            return IrError{IrErrorKind::UnresolvedValue, "operation depends on its own result",
                           ir::describe(op)};
        }

        std::vector<const IValue*> operands;
        operands.reserve(op.num_operands());
        for (const ir::Value* operand : op.operands()) {
            auto converted = convert_operand(*operand);
            if (is_err(converted)) {
                return unwrap_err(converted);
            }
            operands.push_back(unwrap(converted));
        }

        std::vector<const IBlock*> successors;
        for (const ir::Block* successor : op.successors()) {
            auto it = mapping_.blocks.find(successor);
            if (it == mapping_.blocks.end()) {
                return IrError{IrErrorKind::UnresolvedBlock,
                               "successor of " + ir::describe(op) + " is outside the converted tree",
                               ir::describe(*successor)};
            }
            successors.push_back(it->second);
        }

        std::vector<const IRegion*> regions;
        for (const auto& region : op.regions()) {
            auto converted = convert_region(*region);
            if (is_err(converted)) {
                return unwrap_err(converted);
            }
            regions.push_back(unwrap(converted));
        }

        auto data = arena_.make_op_data(op.name(), op.kind(), op.attributes());
        const IOp* immutable = arena_.create_op(std::move(data), std::move(operands),
                                                op.result_types(), std::move(successors),
                                                std::move(regions));
        for (size_t i = 0; i < op.num_results(); ++i) {
            mapping_.values[&op.result(i)] = immutable->results()[i];
        }

        converted_[&op] = immutable;
        in_progress_.erase(&op);
        return immutable;
    }

    auto convert_region(const ir::Region& region) -> Result<const IRegion*, IrError> {
        // Every block exists before any operation is converted, so branches
        // to later blocks resolve.
        std::vector<BlockBuilder> builders;
        builders.reserve(region.blocks().size());
        for (const auto& block : region.blocks()) {
            auto& builder = builders.emplace_back(arena_, block->arg_types());
            mapping_.blocks[block.get()] = builder.block();
            for (size_t i = 0; i < block->num_args(); ++i) {
                mapping_.values[&block->arg(i)] = builder.arg(i);
            }
        }

        std::vector<const IBlock*> blocks;
        for (size_t b = 0; b < builders.size(); ++b) {
            for (const auto& op : region.block(b).ops()) {
                auto converted = convert_op(*op);
                if (is_err(converted)) {
                    return unwrap_err(converted);
                }
                builders[b].append(unwrap(converted));
            }
            blocks.push_back(builders[b].finish());
        }
        return arena_.create_region(std::move(blocks));
    }

private:
    auto convert_operand(const ir::Value& value) -> Result<const IValue*, IrError> {
        if (auto it = mapping_.values.find(&value); it != mapping_.values.end()) {
            return it->second;
        }

        const ir::OpResult* result = value.as_op_result();
        if (result == nullptr) {
            return IrError{IrErrorKind::UnresolvedValue,
                           "block argument used outside the converted tree", ir::describe(value)};
        }

        // Producer not visited yet: convert it now, the walk reuses it later
        auto producer = convert_op(result->owner());
        if (is_err(producer)) {
            return unwrap_err(producer);
        }
        return unwrap(producer)->results()[result->index()];
    }

    IrArena& arena_;
    ImmutableMapping& mapping_;
    std::unordered_map<const ir::Operation*, const IOp*> converted_;
    std::unordered_set<const ir::Operation*> in_progress_;
};

// ============================================================================
// Immutable -> Mutable
// ============================================================================

class ToMutable {
public:
    explicit ToMutable(MutableMapping& mapping) : mapping_(mapping) {}

    auto convert_op(const IOp& op) -> Result<Box<ir::Operation>, IrError> {
        ir::OperationState state{op.kind(), op.name()};

        for (size_t i = 0; i < op.operands().size(); ++i) {
            const IValue* operand = op.operands()[i];
            auto it = mapping_.values.find(operand);
            if (it == mapping_.values.end()) {
                return IrError{IrErrorKind::UnresolvedValue,
                               "operand " + std::to_string(i) + " of " + describe(op) +
                                   " is used before its definition",
                               describe(*operand)};
            }
            state.operands.push_back(it->second);
        }

        for (const IBlock* successor : op.successors()) {
            auto it = mapping_.blocks.find(successor);
            if (it == mapping_.blocks.end()) {
                return IrError{IrErrorKind::UnresolvedBlock,
                               "successor of " + describe(op) + " is not defined",
                               describe(*successor)};
            }
            state.successors.push_back(it->second);
        }

        state.result_types = op.result_types();
        state.attributes = op.attributes();

        for (const IRegion* region : op.regions()) {
            auto converted = convert_region(*region);
            if (is_err(converted)) {
                return std::move(unwrap_err(converted));
            }
            state.regions.push_back(std::move(unwrap(converted)));
        }

        auto mutable_op = ir::Operation::create(std::move(state));
        for (size_t i = 0; i < op.results().size(); ++i) {
            mapping_.values[op.results()[i]] = &mutable_op->result(i);
        }
        return std::move(mutable_op);
    }

    auto convert_region(const IRegion& region) -> Result<Box<ir::Region>, IrError> {
        auto mutable_region = make_box<ir::Region>();
        for (const IBlock* block : region.blocks()) {
            ir::Block& created = mutable_region->add_block(block->arg_types());
            mapping_.blocks[block] = &created;
            for (size_t i = 0; i < block->args().size(); ++i) {
                mapping_.values[block->arg(i)] = &created.arg(i);
            }
        }

        for (size_t b = 0; b < region.blocks().size(); ++b) {
            for (const IOp* op : region.blocks()[b]->ops()) {
                auto converted = convert_op(*op);
                if (is_err(converted)) {
                    return std::move(unwrap_err(converted));
                }
                mutable_region->block(b).push_back(std::move(unwrap(converted)));
            }
        }
        return std::move(mutable_region);
    }

private:
    MutableMapping& mapping_;
};

} // namespace

auto from_mutable(IrArena& arena, const ir::Operation& op) -> Result<const IOp*, IrError> {
    ImmutableMapping mapping;
    return from_mutable(arena, op, mapping);
}

auto from_mutable(IrArena& arena, const ir::Operation& op, ImmutableMapping& mapping)
    -> Result<const IOp*, IrError> {
    size_t before = arena.num_ops();
    auto result = FromMutable(arena, mapping).convert_op(op);
    if (is_err(result)) {
        IRKIT_LOG_WARN("imm", "from_mutable failed: " << to_string(unwrap_err(result)));
    } else {
        IRKIT_LOG_DEBUG("imm", "mirrored " << ir::describe(op) << " as "
                                           << arena.num_ops() - before << " immutable ops");
    }
    return result;
}

auto to_mutable(const IOp& op) -> Result<Box<ir::Operation>, IrError> {
    MutableMapping mapping;
    return to_mutable(op, mapping);
}

auto to_mutable(const IOp& op, MutableMapping& mapping) -> Result<Box<ir::Operation>, IrError> {
    auto result = ToMutable(mapping).convert_op(op);
    if (is_err(result)) {
        IRKIT_LOG_WARN("imm", "to_mutable failed: " << to_string(unwrap_err(result)));
    }
    return result;
}

auto to_mutable(const IRegion& region, MutableMapping& mapping) -> Result<Box<ir::Region>, IrError> {
    return ToMutable(mapping).convert_region(region);
}

} // namespace irkit::imm
