#include "imm/immutable_ir.hpp"

#include <algorithm>
#include <stdexcept>

namespace irkit::imm {

// ============================================================================
// Values
// ============================================================================

auto IValue::as_result() const -> const IResult* {
    return kind_ == IValueKind::Result ? static_cast<const IResult*>(this) : nullptr;
}

auto IValue::as_block_arg() const -> const IBlockArg* {
    return kind_ == IValueKind::BlockArg ? static_cast<const IBlockArg*>(this) : nullptr;
}

// ============================================================================
// IOp
// ============================================================================

IOp::IOp(IrArena& arena, uint64_t serial, Rc<const OpData> data,
         std::vector<const IValue*> operands, const std::vector<Attribute>& result_types,
         std::vector<const IBlock*> successors, std::vector<const IRegion*> regions)
    : serial_(serial), data_(std::move(data)), operands_(seal_list(std::move(operands))),
      results_(make_results(arena, result_types)), successors_(seal_list(std::move(successors))),
      regions_(seal_list(std::move(regions))) {}

auto IOp::make_results(IrArena& arena, const std::vector<Attribute>& types) const
    -> SealedList<const IResult*> {
    ListBuilder<const IResult*> results;
    for (size_t i = 0; i < types.size(); ++i) {
        results.append(arena.make_result(this, static_cast<unsigned>(i), types[i]));
    }
    return results.seal();
}

auto IOp::get_attribute(const std::string& name) const -> const Attribute* {
    auto it = data_->attributes.find(name);
    return it != data_->attributes.end() ? &it->second : nullptr;
}

auto IOp::result_types() const -> std::vector<Attribute> {
    std::vector<Attribute> types;
    types.reserve(results_.size());
    for (const IResult* result : results_) {
        types.push_back(result->type());
    }
    return types;
}

void IOp::walk(const IOpVisitor& visitor) const {
    visitor(*this);
    for (const IRegion* region : regions_) {
        region->walk(visitor);
    }
}

auto IOp::walk_abortable(const IAbortableOpVisitor& visitor) const -> WalkResult {
    if (visitor(*this) == WalkResult::Interrupt)
        return WalkResult::Interrupt;
    for (const IRegion* region : regions_) {
        if (region->walk_abortable(visitor) == WalkResult::Interrupt)
            return WalkResult::Interrupt;
    }
    return WalkResult::Advance;
}

// ============================================================================
// IBlock
// ============================================================================

IBlock::IBlock(IrArena& arena, uint64_t serial, const std::vector<Attribute>& arg_types)
    : serial_(serial), args_(make_args(arena, arg_types)) {}

auto IBlock::make_args(IrArena& arena, const std::vector<Attribute>& types) const
    -> SealedList<const IBlockArg*> {
    ListBuilder<const IBlockArg*> args;
    for (size_t i = 0; i < types.size(); ++i) {
        args.append(arena.make_block_arg(this, static_cast<unsigned>(i), types[i]));
    }
    return args.seal();
}

auto IBlock::arg_types() const -> std::vector<Attribute> {
    std::vector<Attribute> types;
    types.reserve(args_.size());
    for (const IBlockArg* arg : args_) {
        types.push_back(arg->type());
    }
    return types;
}

auto IBlock::ops() const -> const SealedList<const IOp*>& {
    if (!ops_) {
        throw std::logic_error(describe(*this) + " is still under construction");
    }
    return *ops_;
}

void IBlock::walk(const IOpVisitor& visitor) const {
    for (const IOp* op : ops()) {
        op->walk(visitor);
    }
}

auto IBlock::walk_abortable(const IAbortableOpVisitor& visitor) const -> WalkResult {
    for (const IOp* op : ops()) {
        if (op->walk_abortable(visitor) == WalkResult::Interrupt)
            return WalkResult::Interrupt;
    }
    return WalkResult::Advance;
}

// ============================================================================
// IRegion
// ============================================================================

auto IRegion::ops() const -> const SealedList<const IOp*>& {
    static const SealedList<const IOp*> no_ops;
    const IBlock* first = block();
    return first != nullptr ? first->ops() : no_ops;
}

void IRegion::walk(const IOpVisitor& visitor) const {
    for (const IBlock* block : blocks_) {
        block->walk(visitor);
    }
}

auto IRegion::walk_abortable(const IAbortableOpVisitor& visitor) const -> WalkResult {
    for (const IBlock* block : blocks_) {
        if (block->walk_abortable(visitor) == WalkResult::Interrupt)
            return WalkResult::Interrupt;
    }
    return WalkResult::Advance;
}

auto IRegion::value_used_inside(const IValue* value) const -> bool {
    auto found = walk_abortable([value](const IOp& op) {
        const auto& operands = op.operands();
        if (std::find(operands.begin(), operands.end(), value) != operands.end())
            return WalkResult::Interrupt;
        return WalkResult::Advance;
    });
    return found == WalkResult::Interrupt;
}

// ============================================================================
// IrArena
// ============================================================================

auto IrArena::make_op_data(std::string name, std::string kind, AttrDict attributes)
    -> Rc<const OpData> {
    if (name.empty()) {
        name = kind;
    }
    return make_rc<OpData>(OpData{std::move(name), std::move(kind), std::move(attributes)});
}

auto IrArena::create_op(Rc<const OpData> data, std::vector<const IValue*> operands,
                        const std::vector<Attribute>& result_types,
                        std::vector<const IBlock*> successors,
                        std::vector<const IRegion*> regions) -> const IOp* {
    if (!data) {
        throw std::invalid_argument("operation created without op data");
    }
    for (const IValue* operand : operands) {
        if (operand == nullptr) {
            throw std::invalid_argument("null operand for " + data->kind);
        }
    }
    uint64_t serial = next_serial();
    ops_.push_back(Box<IOp>(new IOp(*this, serial, std::move(data), std::move(operands),
                                    result_types, std::move(successors), std::move(regions))));
    return ops_.back().get();
}

auto IrArena::make_block(const std::vector<Attribute>& arg_types) -> IBlock* {
    uint64_t serial = next_serial();
    blocks_.push_back(Box<IBlock>(new IBlock(*this, serial, arg_types)));
    return blocks_.back().get();
}

auto IrArena::create_block(const std::vector<Attribute>& arg_types, std::vector<const IOp*> ops)
    -> const IBlock* {
    BlockBuilder builder(*this, arg_types);
    builder.append(ops);
    return builder.finish();
}

auto IrArena::create_region(std::vector<const IBlock*> blocks) -> const IRegion* {
    uint64_t serial = next_serial();
    regions_.push_back(Box<IRegion>(new IRegion(serial, std::move(blocks))));
    return regions_.back().get();
}

auto IrArena::make_result(const IOp* op, unsigned index, Attribute type) -> const IResult* {
    results_.push_back(make_box<IResult>(op, index, std::move(type), next_serial()));
    return results_.back().get();
}

auto IrArena::make_block_arg(const IBlock* block, unsigned index, Attribute type)
    -> const IBlockArg* {
    block_args_.push_back(make_box<IBlockArg>(block, index, std::move(type), next_serial()));
    return block_args_.back().get();
}

// ============================================================================
// BlockBuilder
// ============================================================================

BlockBuilder::BlockBuilder(IrArena& arena, const std::vector<Attribute>& arg_types)
    : block_(arena.make_block(arg_types)) {}

void BlockBuilder::append(const IOp* op) {
    ops_.append(op);
}

void BlockBuilder::append(const std::vector<const IOp*>& ops) {
    ops_.extend(ops);
}

auto BlockBuilder::finish() -> const IBlock* {
    block_->ops_.emplace(ops_.seal());
    return block_;
}

// ============================================================================
// Printing
// ============================================================================

auto describe(const IOp& op) -> std::string {
    return op.kind() + "#" + std::to_string(op.serial());
}

auto describe(const IBlock& block) -> std::string {
    return "^block#" + std::to_string(block.serial());
}

auto describe(const IValue& value) -> std::string {
    if (const IResult* result = value.as_result()) {
        return describe(result->op()) + ".r" + std::to_string(result->index());
    }
    const IBlockArg* arg = value.as_block_arg();
    return describe(arg->block()) + ".arg" + std::to_string(arg->index());
}

} // namespace irkit::imm
