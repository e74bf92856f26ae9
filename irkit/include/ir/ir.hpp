// irkit Core IR - SSA graph of operations, blocks and regions
//
// The mutable representation passes rewrite in place.
//
// Ownership forms a tree: an Operation owns its Regions, a Region owns its
// Blocks, a Block owns its arguments and its Operations. Operands and
// successors are plain references into that tree and never own anything.
//
// Every Value keeps a use-list of (user, operand index) pairs. All operand
// edits go through Operation::set_operand so the use-lists stay exact.

#pragma once

#include "common.hpp"
#include "ir/attribute.hpp"
#include "ir/ir_error.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace irkit::ir {

class Operation;
class Block;
class Region;

// ============================================================================
// Values
// ============================================================================

struct Use {
    Operation* user;
    unsigned operand_index;

    auto operator==(const Use&) const -> bool = default;
};

enum class ValueKind { OpResult, BlockArgument };

class OpResult;
class BlockArgument;

/// A single SSA definition: either an operation result or a block argument.
class Value {
public:
    Value(const Value&) = delete;
    auto operator=(const Value&) -> Value& = delete;

    [[nodiscard]] auto value_kind() const -> ValueKind {
        return kind_;
    }

    [[nodiscard]] auto type() const -> const Attribute& {
        return type_;
    }

    [[nodiscard]] auto uses() const -> const std::vector<Use>& {
        return uses_;
    }

    [[nodiscard]] auto has_uses() const -> bool {
        return !uses_.empty();
    }

    /// Redirects every use of this value to `replacement`.
    void replace_all_uses_with(Value& replacement);

    /// The producing operation, or nullptr for a block argument.
    [[nodiscard]] auto defining_op() const -> Operation*;

    [[nodiscard]] auto as_op_result() -> OpResult*;
    [[nodiscard]] auto as_op_result() const -> const OpResult*;
    [[nodiscard]] auto as_block_argument() -> BlockArgument*;
    [[nodiscard]] auto as_block_argument() const -> const BlockArgument*;

protected:
    Value(ValueKind kind, Attribute type) : kind_(kind), type_(std::move(type)) {}
    ~Value() = default;

private:
    friend class Operation;

    void add_use(Use use);
    void remove_use(Use use);

    ValueKind kind_;
    Attribute type_;
    std::vector<Use> uses_;
};

class OpResult : public Value {
public:
    OpResult(Operation* owner, unsigned index, Attribute type)
        : Value(ValueKind::OpResult, std::move(type)), owner_(owner), index_(index) {}

    [[nodiscard]] auto owner() const -> Operation& {
        return *owner_;
    }

    [[nodiscard]] auto index() const -> unsigned {
        return index_;
    }

private:
    Operation* const owner_;
    const unsigned index_;
};

class BlockArgument : public Value {
public:
    BlockArgument(Block* owner, unsigned index, Attribute type)
        : Value(ValueKind::BlockArgument, std::move(type)), owner_(owner), index_(index) {}

    [[nodiscard]] auto owner() const -> Block& {
        return *owner_;
    }

    [[nodiscard]] auto index() const -> unsigned {
        return index_;
    }

private:
    Block* const owner_;
    const unsigned index_;
};

// ============================================================================
// Traversal
// ============================================================================

enum class WalkResult { Advance, Interrupt };

using OpVisitor = std::function<void(Operation&)>;
using ConstOpVisitor = std::function<void(const Operation&)>;
using AbortableOpVisitor = std::function<WalkResult(Operation&)>;
using ConstAbortableOpVisitor = std::function<WalkResult(const Operation&)>;

// ============================================================================
// Operation
// ============================================================================

/// Everything needed to construct an operation.
struct OperationState {
    std::string kind;
    std::string name; // Defaults to `kind` when empty
    std::vector<Value*> operands;
    std::vector<Attribute> result_types;
    AttrDict attributes;
    std::vector<Block*> successors;
    std::vector<Box<Region>> regions;
};

class Operation {
public:
    /// Builds an operation and registers it as a user of its operands.
    /// Results are numbered from zero in the order of `result_types`.
    static auto create(OperationState state) -> Box<Operation>;

    ~Operation();

    Operation(const Operation&) = delete;
    auto operator=(const Operation&) -> Operation& = delete;

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto kind() const -> const std::string& {
        return kind_;
    }

    // Operands

    [[nodiscard]] auto operands() const -> const std::vector<Value*>& {
        return operands_;
    }

    [[nodiscard]] auto operand(size_t index) const -> Value* {
        return operands_.at(index);
    }

    [[nodiscard]] auto num_operands() const -> size_t {
        return operands_.size();
    }

    void set_operand(size_t index, Value* value);

    // Results

    [[nodiscard]] auto num_results() const -> size_t {
        return results_.size();
    }

    [[nodiscard]] auto result(size_t index = 0) -> OpResult& {
        return *results_.at(index);
    }

    [[nodiscard]] auto result(size_t index = 0) const -> const OpResult& {
        return *results_.at(index);
    }

    [[nodiscard]] auto results() const -> std::vector<OpResult*>;

    [[nodiscard]] auto result_types() const -> std::vector<Attribute>;

    /// True if any result of this operation is still used.
    [[nodiscard]] auto has_uses() const -> bool;

    // Successors

    [[nodiscard]] auto successors() const -> const std::vector<Block*>& {
        return successors_;
    }

    void set_successor(size_t index, Block* block) {
        successors_.at(index) = block;
    }

    // Attributes

    [[nodiscard]] auto attributes() const -> const AttrDict& {
        return attributes_;
    }

    [[nodiscard]] auto get_attribute(const std::string& name) const -> const Attribute*;

    void set_attribute(const std::string& name, Attribute value) {
        attributes_[name] = std::move(value);
    }

    // Regions

    [[nodiscard]] auto regions() const -> const std::vector<Box<Region>>& {
        return regions_;
    }

    [[nodiscard]] auto num_regions() const -> size_t {
        return regions_.size();
    }

    [[nodiscard]] auto region(size_t index = 0) const -> Region& {
        return *regions_.at(index);
    }

    // Parents

    [[nodiscard]] auto parent_block() const -> Block* {
        return parent_;
    }

    [[nodiscard]] auto parent_op() const -> Operation*;

    // Traversal

    /// Visits this operation, then every nested operation, depth-first.
    void walk(const OpVisitor& visitor);
    void walk(const ConstOpVisitor& visitor) const;

    /// Like walk, but stops as soon as the visitor returns Interrupt.
    auto walk_abortable(const AbortableOpVisitor& visitor) -> WalkResult;
    auto walk_abortable(const ConstAbortableOpVisitor& visitor) const -> WalkResult;

    /// Unregisters this operation and everything nested in it from the
    /// use-lists of their operands, and clears the successor lists.
    void drop_all_references();

private:
    friend class Block;

    Operation() = default;

    std::string name_;
    std::string kind_;
    std::vector<Value*> operands_;
    std::vector<Box<OpResult>> results_;
    std::vector<Block*> successors_;
    AttrDict attributes_;
    std::vector<Box<Region>> regions_;
    Block* parent_ = nullptr;
};

// ============================================================================
// Block
// ============================================================================

class Block {
public:
    explicit Block(const std::vector<Attribute>& arg_types = {});
    ~Block();

    Block(const Block&) = delete;
    auto operator=(const Block&) -> Block& = delete;

    // Arguments

    [[nodiscard]] auto num_args() const -> size_t {
        return args_.size();
    }

    [[nodiscard]] auto arg(size_t index) const -> BlockArgument& {
        return *args_.at(index);
    }

    [[nodiscard]] auto args() const -> std::vector<BlockArgument*>;

    [[nodiscard]] auto arg_types() const -> std::vector<Attribute>;

    /// Appends a new argument; its owner and index never change afterwards.
    auto add_argument(Attribute type) -> BlockArgument&;

    // Operations

    [[nodiscard]] auto ops() const -> const std::vector<Box<Operation>>& {
        return ops_;
    }

    [[nodiscard]] auto empty() const -> bool {
        return ops_.empty();
    }

    [[nodiscard]] auto size() const -> size_t {
        return ops_.size();
    }

    [[nodiscard]] auto index_of(const Operation& op) const -> std::optional<size_t>;

    auto push_back(Box<Operation> op) -> Operation&;
    auto insert(size_t position, Box<Operation> op) -> Operation&;
    auto insert_before(const Operation& anchor, Box<Operation> op) -> Operation&;
    auto insert_after(const Operation& anchor, Box<Operation> op) -> Operation&;

    /// Unlinks `op` and hands ownership back to the caller.
    auto remove(Operation& op) -> Box<Operation>;

    /// Unlinks and destroys `op`. Its results must have no uses left.
    void erase(Operation& op);

    // Parents

    [[nodiscard]] auto parent_region() const -> Region* {
        return parent_;
    }

    [[nodiscard]] auto parent_op() const -> Operation*;

private:
    friend class Region;

    auto position_of(const Operation& op) const -> size_t;

    std::vector<Box<BlockArgument>> args_;
    std::vector<Box<Operation>> ops_;
    Region* parent_ = nullptr;
};

// ============================================================================
// Region
// ============================================================================

class Region {
public:
    Region() = default;
    ~Region();

    Region(const Region&) = delete;
    auto operator=(const Region&) -> Region& = delete;

    [[nodiscard]] auto blocks() const -> const std::vector<Box<Block>>& {
        return blocks_;
    }

    [[nodiscard]] auto empty() const -> bool {
        return blocks_.empty();
    }

    /// The block at `index`, the first one by default.
    [[nodiscard]] auto block(size_t index = 0) const -> Block& {
        return *blocks_.at(index);
    }

    /// Operations of the first block.
    [[nodiscard]] auto ops() const -> const std::vector<Box<Operation>>& {
        return block().ops();
    }

    [[nodiscard]] auto index_of(const Block& block) const -> std::optional<size_t>;

    auto push_back(Box<Block> block) -> Block&;

    /// Creates and appends a block with the given argument types.
    auto add_block(const std::vector<Attribute>& arg_types = {}) -> Block&;

    [[nodiscard]] auto parent_op() const -> Operation* {
        return parent_;
    }

    void walk(const OpVisitor& visitor);
    void walk(const ConstOpVisitor& visitor) const;
    auto walk_abortable(const AbortableOpVisitor& visitor) -> WalkResult;
    auto walk_abortable(const ConstAbortableOpVisitor& visitor) const -> WalkResult;

    void drop_all_references();

private:
    friend class Operation;

    std::vector<Box<Block>> blocks_;
    Operation* parent_ = nullptr;
};

// ============================================================================
// Helpers
// ============================================================================

/// Builds an empty `builtin.module`: one region holding one block.
[[nodiscard]] auto create_module() -> Box<Operation>;

/// Number of operations nested inside `op`, not counting `op` itself.
[[nodiscard]] auto count_ops(const Operation& op) -> size_t;

/// True if any operation inside `region` uses `value` as an operand.
[[nodiscard]] auto is_value_used_inside(const Region& region, const Value& value) -> bool;

/// Stable printable reference to an operation: `kind@r.b.o/r.b.o`, the
/// position path from the outermost ancestor. `@root` for an unparented op.
[[nodiscard]] auto describe(const Operation& op) -> std::string;

/// `<op-ref>#<index>` for results, `^<block-path>:arg<index>` for arguments.
[[nodiscard]] auto describe(const Value& value) -> std::string;

[[nodiscard]] auto describe(const Block& block) -> std::string;

} // namespace irkit::ir
