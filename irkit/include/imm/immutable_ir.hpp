// Immutable IR - frozen, structurally shared dual of the core IR
//
// Every node lives in an IrArena and is handed out as a const pointer. The
// pointer is the node's identity: two nodes are the same node only if they
// are the same object. Each node also carries a serial number, unique within
// its arena, used for printing.
//
// All sequence fields are SealedLists filled in the node's constructor, so a
// node can be referenced from any number of parents without risk of one of
// them changing it. The one exception to construct-then-seal is IBlock,
// whose arguments must exist before the operations that use them: a
// BlockBuilder creates the block and its arguments, collects operations, and
// seals the operation list in finish().
//
// The identity-independent part of an operation (name, kind, attributes) is
// split out into OpData and shared between an operation and any operation
// derived from it with unchanged attributes.

#pragma once

#include "common.hpp"
#include "imm/sealed_list.hpp"
#include "ir/attribute.hpp"
#include "ir/ir.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace irkit::imm {

using ir::Attribute;
using ir::AttrDict;
using ir::WalkResult;

class IrArena;
class IOp;
class IBlock;
class IRegion;
class IResult;
class IBlockArg;

// ============================================================================
// Values
// ============================================================================

enum class IValueKind { Result, BlockArg };

class IValue {
public:
    IValue(const IValue&) = delete;
    auto operator=(const IValue&) -> IValue& = delete;

    [[nodiscard]] auto value_kind() const -> IValueKind {
        return kind_;
    }

    [[nodiscard]] auto type() const -> const Attribute& {
        return type_;
    }

    [[nodiscard]] auto serial() const -> uint64_t {
        return serial_;
    }

    [[nodiscard]] auto as_result() const -> const IResult*;
    [[nodiscard]] auto as_block_arg() const -> const IBlockArg*;

protected:
    IValue(IValueKind kind, Attribute type, uint64_t serial)
        : kind_(kind), type_(std::move(type)), serial_(serial) {}
    ~IValue() = default;

private:
    const IValueKind kind_;
    const Attribute type_;
    const uint64_t serial_;
};

class IResult : public IValue {
public:
    IResult(const IOp* op, unsigned index, Attribute type, uint64_t serial)
        : IValue(IValueKind::Result, std::move(type), serial), op_(op), index_(index) {}

    [[nodiscard]] auto op() const -> const IOp& {
        return *op_;
    }

    [[nodiscard]] auto index() const -> unsigned {
        return index_;
    }

private:
    const IOp* const op_;
    const unsigned index_;
};

class IBlockArg : public IValue {
public:
    IBlockArg(const IBlock* block, unsigned index, Attribute type, uint64_t serial)
        : IValue(IValueKind::BlockArg, std::move(type), serial), block_(block), index_(index) {}

    [[nodiscard]] auto block() const -> const IBlock& {
        return *block_;
    }

    [[nodiscard]] auto index() const -> unsigned {
        return index_;
    }

private:
    const IBlock* const block_;
    const unsigned index_;
};

// ============================================================================
// Nodes
// ============================================================================

/// Name, kind and attributes of an operation. Shared between versions of an
/// operation whose attributes did not change.
struct OpData {
    std::string name;
    std::string kind;
    AttrDict attributes;
};

using IOpVisitor = std::function<void(const IOp&)>;
using IAbortableOpVisitor = std::function<WalkResult(const IOp&)>;

class IOp {
public:
    IOp(const IOp&) = delete;
    auto operator=(const IOp&) -> IOp& = delete;

    [[nodiscard]] auto data() const -> const Rc<const OpData>& {
        return data_;
    }

    [[nodiscard]] auto name() const -> const std::string& {
        return data_->name;
    }

    [[nodiscard]] auto kind() const -> const std::string& {
        return data_->kind;
    }

    [[nodiscard]] auto attributes() const -> const AttrDict& {
        return data_->attributes;
    }

    [[nodiscard]] auto get_attribute(const std::string& name) const -> const Attribute*;

    [[nodiscard]] auto operands() const -> const SealedList<const IValue*>& {
        return operands_;
    }

    [[nodiscard]] auto results() const -> const SealedList<const IResult*>& {
        return results_;
    }

    [[nodiscard]] auto successors() const -> const SealedList<const IBlock*>& {
        return successors_;
    }

    [[nodiscard]] auto regions() const -> const SealedList<const IRegion*>& {
        return regions_;
    }

    /// First result, or nullptr for an operation without results.
    [[nodiscard]] auto result() const -> const IResult* {
        return results_.empty() ? nullptr : results_.front();
    }

    /// First region, or nullptr.
    [[nodiscard]] auto region() const -> const IRegion* {
        return regions_.empty() ? nullptr : regions_.front();
    }

    [[nodiscard]] auto result_types() const -> std::vector<Attribute>;

    [[nodiscard]] auto serial() const -> uint64_t {
        return serial_;
    }

    void walk(const IOpVisitor& visitor) const;
    auto walk_abortable(const IAbortableOpVisitor& visitor) const -> WalkResult;

private:
    friend class IrArena;

    IOp(IrArena& arena, uint64_t serial, Rc<const OpData> data,
        std::vector<const IValue*> operands, const std::vector<Attribute>& result_types,
        std::vector<const IBlock*> successors, std::vector<const IRegion*> regions);

    auto make_results(IrArena& arena, const std::vector<Attribute>& types) const
        -> SealedList<const IResult*>;

    const uint64_t serial_;
    const Rc<const OpData> data_;
    const SealedList<const IValue*> operands_;
    const SealedList<const IResult*> results_;
    const SealedList<const IBlock*> successors_;
    const SealedList<const IRegion*> regions_;
};

class IBlock {
public:
    IBlock(const IBlock&) = delete;
    auto operator=(const IBlock&) -> IBlock& = delete;

    [[nodiscard]] auto args() const -> const SealedList<const IBlockArg*>& {
        return args_;
    }

    [[nodiscard]] auto arg(size_t index) const -> const IBlockArg* {
        return args_.at(index);
    }

    [[nodiscard]] auto arg_types() const -> std::vector<Attribute>;

    /// Throws std::logic_error while the block's builder has not finished.
    [[nodiscard]] auto ops() const -> const SealedList<const IOp*>&;

    [[nodiscard]] auto is_finished() const -> bool {
        return ops_.has_value();
    }

    [[nodiscard]] auto serial() const -> uint64_t {
        return serial_;
    }

    void walk(const IOpVisitor& visitor) const;
    auto walk_abortable(const IAbortableOpVisitor& visitor) const -> WalkResult;

private:
    friend class IrArena;
    friend class BlockBuilder;

    IBlock(IrArena& arena, uint64_t serial, const std::vector<Attribute>& arg_types);

    auto make_args(IrArena& arena, const std::vector<Attribute>& types) const
        -> SealedList<const IBlockArg*>;

    const uint64_t serial_;
    const SealedList<const IBlockArg*> args_;
    std::optional<SealedList<const IOp*>> ops_; // Set once, by BlockBuilder::finish
};

class IRegion {
public:
    IRegion(const IRegion&) = delete;
    auto operator=(const IRegion&) -> IRegion& = delete;

    [[nodiscard]] auto blocks() const -> const SealedList<const IBlock*>& {
        return blocks_;
    }

    /// First block, or nullptr for an empty region.
    [[nodiscard]] auto block() const -> const IBlock* {
        return blocks_.empty() ? nullptr : blocks_.front();
    }

    /// Operations of the first block, empty for an empty region.
    [[nodiscard]] auto ops() const -> const SealedList<const IOp*>&;

    [[nodiscard]] auto serial() const -> uint64_t {
        return serial_;
    }

    void walk(const IOpVisitor& visitor) const;
    auto walk_abortable(const IAbortableOpVisitor& visitor) const -> WalkResult;

    /// True if any operation nested in this region uses `value`.
    [[nodiscard]] auto value_used_inside(const IValue* value) const -> bool;

private:
    friend class IrArena;

    IRegion(uint64_t serial, std::vector<const IBlock*> blocks)
        : serial_(serial), blocks_(seal_list(std::move(blocks))) {}

    const uint64_t serial_;
    const SealedList<const IBlock*> blocks_;
};

// ============================================================================
// Arena
// ============================================================================

/// Owns every immutable node it creates. Nodes live as long as the arena.
class IrArena {
public:
    IrArena() = default;
    IrArena(const IrArena&) = delete;
    auto operator=(const IrArena&) -> IrArena& = delete;

    [[nodiscard]] auto make_op_data(std::string name, std::string kind, AttrDict attributes)
        -> Rc<const OpData>;

    auto create_op(Rc<const OpData> data, std::vector<const IValue*> operands,
                   const std::vector<Attribute>& result_types,
                   std::vector<const IBlock*> successors = {},
                   std::vector<const IRegion*> regions = {}) -> const IOp*;

    /// Builds a block whose operations do not use its own arguments.
    /// Use BlockBuilder otherwise.
    auto create_block(const std::vector<Attribute>& arg_types, std::vector<const IOp*> ops)
        -> const IBlock*;

    auto create_region(std::vector<const IBlock*> blocks) -> const IRegion*;

    [[nodiscard]] auto num_ops() const -> size_t {
        return ops_.size();
    }

    [[nodiscard]] auto num_blocks() const -> size_t {
        return blocks_.size();
    }

    [[nodiscard]] auto num_regions() const -> size_t {
        return regions_.size();
    }

private:
    friend class IOp;
    friend class IBlock;
    friend class BlockBuilder;

    auto next_serial() -> uint64_t {
        return next_serial_++;
    }

    auto make_result(const IOp* op, unsigned index, Attribute type) -> const IResult*;
    auto make_block_arg(const IBlock* block, unsigned index, Attribute type) -> const IBlockArg*;
    auto make_block(const std::vector<Attribute>& arg_types) -> IBlock*;

    std::vector<Box<IOp>> ops_;
    std::vector<Box<IBlock>> blocks_;
    std::vector<Box<IRegion>> regions_;
    std::vector<Box<IResult>> results_;
    std::vector<Box<IBlockArg>> block_args_;
    uint64_t next_serial_ = 0;
};

/// Two-phase block construction: the block and its arguments exist from the
/// start, operations are appended afterwards, finish() seals them.
class BlockBuilder {
public:
    BlockBuilder(IrArena& arena, const std::vector<Attribute>& arg_types);

    BlockBuilder(const BlockBuilder&) = delete;
    auto operator=(const BlockBuilder&) -> BlockBuilder& = delete;
    BlockBuilder(BlockBuilder&&) = default;

    /// The block under construction. Usable as a successor right away.
    [[nodiscard]] auto block() const -> const IBlock* {
        return block_;
    }

    [[nodiscard]] auto arg(size_t index) const -> const IBlockArg* {
        return block_->arg(index);
    }

    void append(const IOp* op);
    void append(const std::vector<const IOp*>& ops);

    /// Seals the operation list. Appending afterwards, or finishing twice,
    /// throws ImmutabilityViolation.
    auto finish() -> const IBlock*;

private:
    IBlock* block_;
    ListBuilder<const IOp*> ops_;
};

// ============================================================================
// Printing
// ============================================================================

/// `kind#serial`
[[nodiscard]] auto describe(const IOp& op) -> std::string;

/// `^block#serial`
[[nodiscard]] auto describe(const IBlock& block) -> std::string;

/// `kind#serial.rN` for results, `^block#serial.argN` for block arguments.
[[nodiscard]] auto describe(const IValue& value) -> std::string;

} // namespace irkit::imm
