// Core IR implementation: construction, use-list upkeep, traversal

#include "ir/ir.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace irkit::ir {

// ============================================================================
// Value
// ============================================================================

void Value::add_use(Use use) {
    uses_.push_back(use);
}

void Value::remove_use(Use use) {
    auto it = std::find(uses_.begin(), uses_.end(), use);
    if (it != uses_.end()) {
        uses_.erase(it);
    }
}

void Value::replace_all_uses_with(Value& replacement) {
    if (&replacement == this)
        return;

    // set_operand edits uses_, so iterate over a snapshot
    auto snapshot = uses_;
    for (const auto& use : snapshot) {
        use.user->set_operand(use.operand_index, &replacement);
    }
}

auto Value::defining_op() const -> Operation* {
    if (const auto* result = as_op_result()) {
        return &result->owner();
    }
    return nullptr;
}

auto Value::as_op_result() -> OpResult* {
    return kind_ == ValueKind::OpResult ? static_cast<OpResult*>(this) : nullptr;
}

auto Value::as_op_result() const -> const OpResult* {
    return kind_ == ValueKind::OpResult ? static_cast<const OpResult*>(this) : nullptr;
}

auto Value::as_block_argument() -> BlockArgument* {
    return kind_ == ValueKind::BlockArgument ? static_cast<BlockArgument*>(this) : nullptr;
}

auto Value::as_block_argument() const -> const BlockArgument* {
    return kind_ == ValueKind::BlockArgument ? static_cast<const BlockArgument*>(this) : nullptr;
}

// ============================================================================
// Operation
// ============================================================================

auto Operation::create(OperationState state) -> Box<Operation> {
    Box<Operation> op(new Operation());
    op->kind_ = std::move(state.kind);
    op->name_ = state.name.empty() ? op->kind_ : std::move(state.name);
    op->attributes_ = std::move(state.attributes);
    op->successors_ = std::move(state.successors);

    op->operands_.reserve(state.operands.size());
    for (size_t i = 0; i < state.operands.size(); ++i) {
        Value* operand = state.operands[i];
        if (operand == nullptr) {
            throw std::invalid_argument("operand " + std::to_string(i) + " of " + op->kind_ +
                                        " is null");
        }
        op->operands_.push_back(operand);
        operand->add_use(Use{op.get(), static_cast<unsigned>(i)});
    }

    op->results_.reserve(state.result_types.size());
    for (size_t i = 0; i < state.result_types.size(); ++i) {
        op->results_.push_back(
            make_box<OpResult>(op.get(), static_cast<unsigned>(i), std::move(state.result_types[i])));
    }

    for (auto& region : state.regions) {
        region->parent_ = op.get();
        op->regions_.push_back(std::move(region));
    }

    return op;
}

Operation::~Operation() {
    drop_all_references();
}

void Operation::set_operand(size_t index, Value* value) {
    if (value == nullptr) {
        throw std::invalid_argument("cannot set a null operand on " + kind_);
    }
    Value* old = operands_.at(index);
    if (old == value)
        return;

    Use use{this, static_cast<unsigned>(index)};
    old->remove_use(use);
    operands_[index] = value;
    value->add_use(use);
}

auto Operation::results() const -> std::vector<OpResult*> {
    std::vector<OpResult*> out;
    out.reserve(results_.size());
    for (const auto& result : results_) {
        out.push_back(result.get());
    }
    return out;
}

auto Operation::result_types() const -> std::vector<Attribute> {
    std::vector<Attribute> out;
    out.reserve(results_.size());
    for (const auto& result : results_) {
        out.push_back(result->type());
    }
    return out;
}

auto Operation::has_uses() const -> bool {
    return std::any_of(results_.begin(), results_.end(),
                       [](const auto& result) { return result->has_uses(); });
}

auto Operation::get_attribute(const std::string& name) const -> const Attribute* {
    auto it = attributes_.find(name);
    return it != attributes_.end() ? &it->second : nullptr;
}

auto Operation::parent_op() const -> Operation* {
    return parent_ != nullptr ? parent_->parent_op() : nullptr;
}

void Operation::walk(const OpVisitor& visitor) {
    visitor(*this);
    for (auto& region : regions_) {
        region->walk(visitor);
    }
}

void Operation::walk(const ConstOpVisitor& visitor) const {
    visitor(*this);
    for (const auto& region : regions_) {
        std::as_const(*region).walk(visitor);
    }
}

auto Operation::walk_abortable(const AbortableOpVisitor& visitor) -> WalkResult {
    if (visitor(*this) == WalkResult::Interrupt)
        return WalkResult::Interrupt;
    for (auto& region : regions_) {
        if (region->walk_abortable(visitor) == WalkResult::Interrupt)
            return WalkResult::Interrupt;
    }
    return WalkResult::Advance;
}

auto Operation::walk_abortable(const ConstAbortableOpVisitor& visitor) const -> WalkResult {
    if (visitor(*this) == WalkResult::Interrupt)
        return WalkResult::Interrupt;
    for (const auto& region : regions_) {
        if (std::as_const(*region).walk_abortable(visitor) == WalkResult::Interrupt)
            return WalkResult::Interrupt;
    }
    return WalkResult::Advance;
}

void Operation::drop_all_references() {
    for (size_t i = 0; i < operands_.size(); ++i) {
        operands_[i]->remove_use(Use{this, static_cast<unsigned>(i)});
    }
    operands_.clear();
    successors_.clear();
    for (auto& region : regions_) {
        region->drop_all_references();
    }
}

// ============================================================================
// Block
// ============================================================================

Block::Block(const std::vector<Attribute>& arg_types) {
    for (const auto& type : arg_types) {
        add_argument(type);
    }
}

Block::~Block() {
    // Operations may use values defined by earlier siblings, so unlink every
    // use before the first definition goes away.
    for (auto& op : ops_) {
        op->drop_all_references();
    }
    ops_.clear();
}

auto Block::args() const -> std::vector<BlockArgument*> {
    std::vector<BlockArgument*> out;
    out.reserve(args_.size());
    for (const auto& arg : args_) {
        out.push_back(arg.get());
    }
    return out;
}

auto Block::arg_types() const -> std::vector<Attribute> {
    std::vector<Attribute> out;
    out.reserve(args_.size());
    for (const auto& arg : args_) {
        out.push_back(arg->type());
    }
    return out;
}

auto Block::add_argument(Attribute type) -> BlockArgument& {
    args_.push_back(make_box<BlockArgument>(this, static_cast<unsigned>(args_.size()), std::move(type)));
    return *args_.back();
}

auto Block::index_of(const Operation& op) const -> std::optional<size_t> {
    for (size_t i = 0; i < ops_.size(); ++i) {
        if (ops_[i].get() == &op)
            return i;
    }
    return std::nullopt;
}

auto Block::position_of(const Operation& op) const -> size_t {
    auto index = index_of(op);
    if (!index) {
        throw std::invalid_argument(describe(op) + " is not in this block");
    }
    return *index;
}

auto Block::push_back(Box<Operation> op) -> Operation& {
    return insert(ops_.size(), std::move(op));
}

auto Block::insert(size_t position, Box<Operation> op) -> Operation& {
    if (op->parent_ != nullptr) {
        throw std::logic_error(describe(*op) + " is already linked into a block");
    }
    op->parent_ = this;
    auto it = ops_.insert(ops_.begin() + static_cast<std::ptrdiff_t>(position), std::move(op));
    return **it;
}

auto Block::insert_before(const Operation& anchor, Box<Operation> op) -> Operation& {
    return insert(position_of(anchor), std::move(op));
}

auto Block::insert_after(const Operation& anchor, Box<Operation> op) -> Operation& {
    return insert(position_of(anchor) + 1, std::move(op));
}

auto Block::remove(Operation& op) -> Box<Operation> {
    size_t index = position_of(op);
    Box<Operation> owned = std::move(ops_[index]);
    ops_.erase(ops_.begin() + static_cast<std::ptrdiff_t>(index));
    owned->parent_ = nullptr;
    return owned;
}

void Block::erase(Operation& op) {
    if (op.has_uses()) {
        throw std::logic_error("cannot erase " + describe(op) + ": results still have uses");
    }
    auto owned = remove(op);
    IRKIT_LOG_TRACE("ir", "erased " << owned->kind());
}

auto Block::parent_op() const -> Operation* {
    return parent_ != nullptr ? parent_->parent_op() : nullptr;
}

// ============================================================================
// Region
// ============================================================================

Region::~Region() {
    // A block may use values defined in a dominating sibling block
    drop_all_references();
    blocks_.clear();
}

auto Region::index_of(const Block& block) const -> std::optional<size_t> {
    for (size_t i = 0; i < blocks_.size(); ++i) {
        if (blocks_[i].get() == &block)
            return i;
    }
    return std::nullopt;
}

auto Region::push_back(Box<Block> block) -> Block& {
    block->parent_ = this;
    blocks_.push_back(std::move(block));
    return *blocks_.back();
}

auto Region::add_block(const std::vector<Attribute>& arg_types) -> Block& {
    return push_back(make_box<Block>(arg_types));
}

void Region::walk(const OpVisitor& visitor) {
    for (auto& block : blocks_) {
        for (auto& op : block->ops_) {
            op->walk(visitor);
        }
    }
}

void Region::walk(const ConstOpVisitor& visitor) const {
    for (const auto& block : blocks_) {
        for (const auto& op : block->ops_) {
            std::as_const(*op).walk(visitor);
        }
    }
}

auto Region::walk_abortable(const AbortableOpVisitor& visitor) -> WalkResult {
    for (auto& block : blocks_) {
        for (auto& op : block->ops_) {
            if (op->walk_abortable(visitor) == WalkResult::Interrupt)
                return WalkResult::Interrupt;
        }
    }
    return WalkResult::Advance;
}

auto Region::walk_abortable(const ConstAbortableOpVisitor& visitor) const -> WalkResult {
    for (const auto& block : blocks_) {
        for (const auto& op : block->ops_) {
            if (std::as_const(*op).walk_abortable(visitor) == WalkResult::Interrupt)
                return WalkResult::Interrupt;
        }
    }
    return WalkResult::Advance;
}

void Region::drop_all_references() {
    for (auto& block : blocks_) {
        for (auto& op : block->ops_) {
            op->drop_all_references();
        }
    }
}

// ============================================================================
// Helpers
// ============================================================================

auto create_module() -> Box<Operation> {
    OperationState state{"builtin.module"};
    auto body = make_box<Region>();
    body->add_block();
    state.regions.push_back(std::move(body));
    return Operation::create(std::move(state));
}

auto count_ops(const Operation& op) -> size_t {
    size_t count = 0;
    op.walk([&count](const Operation&) { ++count; });
    return count - 1;
}

auto is_value_used_inside(const Region& region, const Value& value) -> bool {
    auto found = region.walk_abortable([&value](const Operation& op) {
        for (const Value* operand : op.operands()) {
            if (operand == &value)
                return WalkResult::Interrupt;
        }
        return WalkResult::Advance;
    });
    return found == WalkResult::Interrupt;
}

namespace {

/// "r.b.o" segments from the outermost ancestor down to `op`.
auto position_path(const Operation& op) -> std::string {
    std::vector<std::string> segments;
    const Operation* current = &op;

    while (const Block* block = current->parent_block()) {
        std::string op_index = std::to_string(*block->index_of(*current));
        const Region* region = block->parent_region();
        if (region == nullptr) {
            segments.push_back("_._." + op_index);
            break;
        }
        std::string block_index = std::to_string(*region->index_of(*block));
        const Operation* owner = region->parent_op();
        if (owner == nullptr) {
            segments.push_back("_." + block_index + "." + op_index);
            break;
        }

        size_t region_index = 0;
        while (owner->regions()[region_index].get() != region) {
            ++region_index;
        }
        segments.push_back(std::to_string(region_index) + "." + block_index + "." + op_index);
        current = owner;
    }

    std::string path;
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        if (!path.empty())
            path += "/";
        path += *it;
    }
    return path;
}

} // namespace

auto describe(const Operation& op) -> std::string {
    std::string path = position_path(op);
    return op.kind() + "@" + (path.empty() ? "root" : path);
}

auto describe(const Block& block) -> std::string {
    const Region* region = block.parent_region();
    if (region == nullptr || region->parent_op() == nullptr) {
        return "detached";
    }
    const Operation* owner = region->parent_op();
    size_t region_index = 0;
    while (owner->regions()[region_index].get() != region) {
        ++region_index;
    }

    std::string owner_path = position_path(*owner);
    std::string local = std::to_string(region_index) + "." + std::to_string(*region->index_of(block));
    return owner_path.empty() ? local : owner_path + "/" + local;
}

auto describe(const Value& value) -> std::string {
    if (const auto* result = value.as_op_result()) {
        return describe(result->owner()) + "#" + std::to_string(result->index());
    }
    const auto* arg = value.as_block_argument();
    return "^" + describe(arg->owner()) + ":arg" + std::to_string(arg->index());
}

} // namespace irkit::ir
