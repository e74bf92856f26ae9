#include "match/query.hpp"

#include "log/log.hpp"

#include <set>
#include <stdexcept>

namespace irkit::match {

using ir::IrErrorKind;

// ============================================================================
// Bindings
// ============================================================================

auto MatchContext::lookup(const std::string& name) const -> const Binding* {
    auto it = bindings_.find(name);
    return it != bindings_.end() ? &it->second : nullptr;
}

auto MatchContext::bind(const std::string& name, Binding value) -> bool {
    auto [it, inserted] = bindings_.try_emplace(name, value);
    if (inserted)
        return true;
    return it->second == value;
}

auto Match::operation(const std::string& name) const -> ir::Operation* {
    auto it = bindings.find(name);
    if (it == bindings.end())
        return nullptr;
    const auto* op = std::get_if<ir::Operation*>(&it->second);
    return op != nullptr ? *op : nullptr;
}

auto Match::attribute(const std::string& name) const -> const ir::Attribute* {
    auto it = bindings.find(name);
    if (it == bindings.end())
        return nullptr;
    return std::get_if<ir::Attribute>(&it->second);
}

auto Match::value(const std::string& name) const -> ir::Value* {
    auto it = bindings.find(name);
    if (it == bindings.end())
        return nullptr;
    const auto* value = std::get_if<ir::Value*>(&it->second);
    return value != nullptr ? *value : nullptr;
}

// ============================================================================
// Variables
// ============================================================================

auto variable_kind_name(VariableKind kind) -> const char* {
    switch (kind) {
    case VariableKind::Operation:
        return "operation";
    case VariableKind::Attribute:
        return "attribute";
    case VariableKind::Value:
        return "value";
    case VariableKind::OpResult:
        return "op-result";
    }
    return "unknown";
}

auto OperationVariable::get(const MatchContext& ctx) const -> ir::Operation* {
    const Binding* binding = ctx.lookup(name());
    if (binding == nullptr)
        return nullptr;
    const auto* op = std::get_if<ir::Operation*>(binding);
    return op != nullptr ? *op : nullptr;
}

auto OperationVariable::set(MatchContext& ctx, ir::Operation& op) const -> bool {
    return bind(ctx, &op);
}

auto AttributeVariable::get(const MatchContext& ctx) const -> const ir::Attribute* {
    const Binding* binding = ctx.lookup(name());
    return binding != nullptr ? std::get_if<ir::Attribute>(binding) : nullptr;
}

auto AttributeVariable::set(MatchContext& ctx, ir::Attribute attr) const -> bool {
    return bind(ctx, std::move(attr));
}

auto ValueVariable::get(const MatchContext& ctx) const -> ir::Value* {
    const Binding* binding = ctx.lookup(name());
    if (binding == nullptr)
        return nullptr;
    const auto* value = std::get_if<ir::Value*>(binding);
    return value != nullptr ? *value : nullptr;
}

auto ValueVariable::set(MatchContext& ctx, ir::Value& value) const -> bool {
    if (kind() == VariableKind::OpResult && value.as_op_result() == nullptr)
        return false;
    return bind(ctx, &value);
}

auto OpResultVariable::get_result(const MatchContext& ctx) const -> ir::OpResult* {
    ir::Value* value = get(ctx);
    return value != nullptr ? value->as_op_result() : nullptr;
}

// ============================================================================
// Constraints
// ============================================================================

auto TypeConstraint::match(MatchContext& ctx) const -> bool {
    ir::Operation* op = op_.get(ctx);
    return op != nullptr && op->kind() == kind_;
}

auto TypeConstraint::inputs() const -> std::vector<std::string> {
    return {op_.name()};
}

auto TypeConstraint::describe() const -> std::string {
    return op_.name() + " is " + kind_;
}

auto EqConstraint::match(MatchContext& ctx) const -> bool {
    const Binding* lhs = ctx.lookup(lhs_);
    const Binding* rhs = ctx.lookup(rhs_);
    return lhs != nullptr && rhs != nullptr && *lhs == *rhs;
}

auto EqConstraint::inputs() const -> std::vector<std::string> {
    return {lhs_, rhs_};
}

auto EqConstraint::describe() const -> std::string {
    return lhs_ + " == " + rhs_;
}

auto AttributeValueConstraint::match(MatchContext& ctx) const -> bool {
    const ir::Attribute* attr = attr_.get(ctx);
    return attr != nullptr && *attr == expected_;
}

auto AttributeValueConstraint::inputs() const -> std::vector<std::string> {
    return {attr_.name()};
}

auto AttributeValueConstraint::describe() const -> std::string {
    return attr_.name() + " == " + expected_.to_string();
}

auto OperationAttributeConstraint::match(MatchContext& ctx) const -> bool {
    ir::Operation* op = op_.get(ctx);
    if (op == nullptr)
        return false;
    const ir::Attribute* attr = op->get_attribute(attr_name_);
    return attr != nullptr && out_.set(ctx, *attr);
}

auto OperationAttributeConstraint::inputs() const -> std::vector<std::string> {
    return {op_.name()};
}

auto OperationAttributeConstraint::outputs() const -> std::vector<std::string> {
    return {out_.name()};
}

auto OperationAttributeConstraint::describe() const -> std::string {
    return out_.name() + " = " + op_.name() + "." + attr_name_;
}

namespace {

enum class FieldSlot { Operand, Result };

auto resolve_field(const FieldRef& field, const ir::Operation& op, FieldSlot slot)
    -> std::optional<size_t> {
    if (field.index) {
        return field.index;
    }
    const ir::OpDefinition* def = field.registry->lookup(op.kind());
    if (def == nullptr)
        return std::nullopt;
    return slot == FieldSlot::Operand ? def->operand_index(field.name)
                                      : def->result_index(field.name);
}

} // namespace

auto FieldRef::describe() const -> std::string {
    return index ? std::to_string(*index) : name;
}

auto OperationOperandConstraint::match(MatchContext& ctx) const -> bool {
    ir::Operation* op = op_.get(ctx);
    if (op == nullptr)
        return false;
    auto index = resolve_field(field_, *op, FieldSlot::Operand);
    if (!index || *index >= op->num_operands())
        return false;
    return out_.set(ctx, *op->operand(*index));
}

auto OperationOperandConstraint::inputs() const -> std::vector<std::string> {
    return {op_.name()};
}

auto OperationOperandConstraint::outputs() const -> std::vector<std::string> {
    return {out_.name()};
}

auto OperationOperandConstraint::describe() const -> std::string {
    return out_.name() + " = " + op_.name() + ".operand[" + field_.describe() + "]";
}

auto OperationResultConstraint::match(MatchContext& ctx) const -> bool {
    ir::Operation* op = op_.get(ctx);
    if (op == nullptr)
        return false;
    auto index = resolve_field(field_, *op, FieldSlot::Result);
    if (!index || *index >= op->num_results())
        return false;
    return out_.set(ctx, op->result(*index));
}

auto OperationResultConstraint::inputs() const -> std::vector<std::string> {
    return {op_.name()};
}

auto OperationResultConstraint::outputs() const -> std::vector<std::string> {
    return {out_.name()};
}

auto OperationResultConstraint::describe() const -> std::string {
    return out_.name() + " = " + op_.name() + ".result[" + field_.describe() + "]";
}

auto OpResultOpConstraint::match(MatchContext& ctx) const -> bool {
    ir::OpResult* result = result_.get_result(ctx);
    return result != nullptr && out_.set(ctx, result->owner());
}

auto OpResultOpConstraint::inputs() const -> std::vector<std::string> {
    return {result_.name()};
}

auto OpResultOpConstraint::outputs() const -> std::vector<std::string> {
    return {out_.name()};
}

auto OpResultOpConstraint::describe() const -> std::string {
    return out_.name() + " = defining op of " + result_.name();
}

auto ValueTypeConstraint::match(MatchContext& ctx) const -> bool {
    ir::Value* value = value_.get(ctx);
    return value != nullptr && out_.set(ctx, value->type());
}

auto ValueTypeConstraint::inputs() const -> std::vector<std::string> {
    return {value_.name()};
}

auto ValueTypeConstraint::outputs() const -> std::vector<std::string> {
    return {out_.name()};
}

auto ValueTypeConstraint::describe() const -> std::string {
    return out_.name() + " = type of " + value_.name();
}

// ============================================================================
// Query
// ============================================================================

Query::Query(std::string kind) : root_kind_(std::move(kind)), root_("root") {
    variables_.emplace_back(root_.name(), VariableKind::Operation);
}

auto Query::root(std::string kind) -> Query {
    Query query(std::move(kind));
    query.add_constraint<TypeConstraint>(query.root_, query.root_kind_);
    return query;
}

void Query::declare(const std::string& name, VariableKind kind) {
    for (const auto& [existing, _] : variables_) {
        if (existing == name) {
            throw std::invalid_argument("query variable declared twice: " + name);
        }
    }
    variables_.emplace_back(name, kind);
}

auto Query::add_constraint(Box<Constraint> constraint) -> Query& {
    constraints_.push_back(std::move(constraint));
    return *this;
}

auto Query::validate() const -> Result<Unit, IrError> {
    std::set<std::string> bound{root_.name()};

    for (const auto& constraint : constraints_) {
        for (const auto& input : constraint->inputs()) {
            if (bound.count(input) == 0) {
                return IrError{IrErrorKind::UnboundVariable,
                               "constraint '" + constraint->describe() +
                                   "' reads a variable no earlier constraint binds",
                               input};
            }
        }
        for (const auto& output : constraint->outputs()) {
            bound.insert(output);
        }
    }

    for (const auto& [name, _] : variables_) {
        if (bound.count(name) == 0) {
            return IrError{IrErrorKind::UnboundVariable, "variable is never bound", name};
        }
    }
    return Unit{};
}

auto Query::match(ir::Operation& op) const -> std::optional<Match> {
    MatchContext ctx;
    root_.set(ctx, op);

    for (const auto& constraint : constraints_) {
        if (!constraint->match(ctx)) {
            IRKIT_LOG_TRACE("match", ir::describe(op) << ": failed '" << constraint->describe()
                                                      << "'");
            return std::nullopt;
        }
    }

    for (const auto& [name, _] : variables_) {
        if (!ctx.is_bound(name)) {
            IRKIT_LOG_TRACE("match", ir::describe(op) << ": '" << name << "' left unbound");
            return std::nullopt;
        }
    }
    return Match{ctx.bindings()};
}

auto Query::matches(ir::Operation& module) const -> std::vector<Match> {
    std::vector<Match> found;
    module.walk([&](ir::Operation& op) {
        if (auto m = match(op)) {
            found.push_back(std::move(*m));
        }
    });
    IRKIT_LOG_DEBUG("match", root_kind_ << " query: " << found.size() << " matches in "
                                        << ir::describe(module));
    return found;
}

} // namespace irkit::match
