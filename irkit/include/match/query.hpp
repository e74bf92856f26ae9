//! # Constraint Matcher
//!
//! Declarative structural queries over the core IR.
//!
//! A Query owns named, typed variables and an ordered list of constraints.
//! The variable `root` is bound to the operation under test before anything
//! runs, and the first constraint checks its kind. Constraints then run
//! strictly in declaration order and the first one that fails ends the
//! match. A constraint may only read variables bound by the root or by an
//! earlier constraint; reading an unbound variable is a failed match.
//!
//! Binding a variable that is already bound succeeds only when the new value
//! equals the old one, so two constraints that bind the same name must agree.
//!
//! ```cpp
//! auto query = Query::root("arith.addi");
//! auto lhs = query.add_variable<OpResultVariable>("lhs");
//! auto lhs_op = query.add_variable<OperationVariable>("lhs_op");
//! query.add_constraint<OperationOperandConstraint>(query.root_variable(), registry, "lhs", lhs);
//! query.add_constraint<OpResultOpConstraint>(lhs, lhs_op);
//! query.add_constraint<TypeConstraint>(lhs_op, "arith.constant");
//! if (auto m = query.match(op)) { ... }
//! ```

#pragma once

#include "common.hpp"
#include "ir/attribute.hpp"
#include "ir/ir.hpp"
#include "ir/op_registry.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace irkit::match {

using ir::IrError;

// ============================================================================
// Bindings
// ============================================================================

using Binding = std::variant<ir::Operation*, ir::Attribute, ir::Value*>;

using BindingMap = std::map<std::string, Binding>;

class MatchContext {
public:
    [[nodiscard]] auto lookup(const std::string& name) const -> const Binding*;

    /// Binds `name`, or checks it against the existing binding.
    auto bind(const std::string& name, Binding value) -> bool;

    [[nodiscard]] auto is_bound(const std::string& name) const -> bool {
        return bindings_.count(name) > 0;
    }

    [[nodiscard]] auto bindings() const -> const BindingMap& {
        return bindings_;
    }

private:
    BindingMap bindings_;
};

/// A successful match: one binding per declared variable.
struct Match {
    BindingMap bindings;

    [[nodiscard]] auto operation(const std::string& name) const -> ir::Operation*;
    [[nodiscard]] auto attribute(const std::string& name) const -> const ir::Attribute*;
    [[nodiscard]] auto value(const std::string& name) const -> ir::Value*;
};

// ============================================================================
// Variables
// ============================================================================

enum class VariableKind { Operation, Attribute, Value, OpResult };

[[nodiscard]] auto variable_kind_name(VariableKind kind) -> const char*;

/// Named binding slot. Handles are cheap to copy; the binding itself lives
/// in the MatchContext.
class Variable {
public:
    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto kind() const -> VariableKind {
        return kind_;
    }

protected:
    Variable(std::string name, VariableKind kind) : name_(std::move(name)), kind_(kind) {}

    auto bind(MatchContext& ctx, Binding value) const -> bool {
        return ctx.bind(name_, std::move(value));
    }

private:
    std::string name_;
    VariableKind kind_;
};

class OperationVariable : public Variable {
public:
    static constexpr VariableKind KIND = VariableKind::Operation;

    explicit OperationVariable(std::string name) : Variable(std::move(name), KIND) {}

    [[nodiscard]] auto get(const MatchContext& ctx) const -> ir::Operation*;
    auto set(MatchContext& ctx, ir::Operation& op) const -> bool;
};

class AttributeVariable : public Variable {
public:
    static constexpr VariableKind KIND = VariableKind::Attribute;

    explicit AttributeVariable(std::string name) : Variable(std::move(name), KIND) {}

    [[nodiscard]] auto get(const MatchContext& ctx) const -> const ir::Attribute*;
    auto set(MatchContext& ctx, ir::Attribute attr) const -> bool;
};

class ValueVariable : public Variable {
public:
    static constexpr VariableKind KIND = VariableKind::Value;

    explicit ValueVariable(std::string name) : Variable(std::move(name), KIND) {}

    [[nodiscard]] auto get(const MatchContext& ctx) const -> ir::Value*;

    /// Fails for a block argument when this is an OpResultVariable.
    auto set(MatchContext& ctx, ir::Value& value) const -> bool;

protected:
    ValueVariable(std::string name, VariableKind kind) : Variable(std::move(name), kind) {}
};

class OpResultVariable : public ValueVariable {
public:
    static constexpr VariableKind KIND = VariableKind::OpResult;

    explicit OpResultVariable(std::string name) : ValueVariable(std::move(name), KIND) {}

    [[nodiscard]] auto get_result(const MatchContext& ctx) const -> ir::OpResult*;
};

// ============================================================================
// Constraints
// ============================================================================

class Constraint {
public:
    virtual ~Constraint() = default;

    [[nodiscard]] virtual auto match(MatchContext& ctx) const -> bool = 0;

    /// Variables read. Each must be bound before this constraint runs.
    [[nodiscard]] virtual auto inputs() const -> std::vector<std::string> = 0;

    /// Variables bound.
    [[nodiscard]] virtual auto outputs() const -> std::vector<std::string> {
        return {};
    }

    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

/// The bound operation has the given kind.
class TypeConstraint : public Constraint {
public:
    TypeConstraint(OperationVariable op, std::string kind)
        : op_(std::move(op)), kind_(std::move(kind)) {}

    auto match(MatchContext& ctx) const -> bool override;
    auto inputs() const -> std::vector<std::string> override;
    auto describe() const -> std::string override;

private:
    OperationVariable op_;
    std::string kind_;
};

/// Two bound variables hold equal bindings.
class EqConstraint : public Constraint {
public:
    EqConstraint(const Variable& lhs, const Variable& rhs) : lhs_(lhs.name()), rhs_(rhs.name()) {}

    auto match(MatchContext& ctx) const -> bool override;
    auto inputs() const -> std::vector<std::string> override;
    auto describe() const -> std::string override;

private:
    std::string lhs_;
    std::string rhs_;
};

/// The bound attribute equals a constant.
class AttributeValueConstraint : public Constraint {
public:
    AttributeValueConstraint(AttributeVariable attr, ir::Attribute expected)
        : attr_(std::move(attr)), expected_(std::move(expected)) {}

    auto match(MatchContext& ctx) const -> bool override;
    auto inputs() const -> std::vector<std::string> override;
    auto describe() const -> std::string override;

private:
    AttributeVariable attr_;
    ir::Attribute expected_;
};

/// Binds `out` to the named attribute of the bound operation. Fails when the
/// attribute is absent.
class OperationAttributeConstraint : public Constraint {
public:
    OperationAttributeConstraint(OperationVariable op, std::string attr_name, AttributeVariable out)
        : op_(std::move(op)), attr_name_(std::move(attr_name)), out_(std::move(out)) {}

    auto match(MatchContext& ctx) const -> bool override;
    auto inputs() const -> std::vector<std::string> override;
    auto outputs() const -> std::vector<std::string> override;
    auto describe() const -> std::string override;

private:
    OperationVariable op_;
    std::string attr_name_;
    AttributeVariable out_;
};

/// Where a field projection finds its slot: a fixed index, or a name looked
/// up in the kind's registered definition.
struct FieldRef {
    std::optional<size_t> index;
    const ir::KindRegistry* registry = nullptr;
    std::string name;

    [[nodiscard]] auto describe() const -> std::string;
};

/// Binds `out` to an operand of the bound operation.
class OperationOperandConstraint : public Constraint {
public:
    OperationOperandConstraint(OperationVariable op, size_t index, ValueVariable out)
        : op_(std::move(op)), field_{index, nullptr, {}}, out_(std::move(out)) {}

    OperationOperandConstraint(OperationVariable op, const ir::KindRegistry& registry,
                               std::string field, ValueVariable out)
        : op_(std::move(op)), field_{std::nullopt, &registry, std::move(field)},
          out_(std::move(out)) {}

    auto match(MatchContext& ctx) const -> bool override;
    auto inputs() const -> std::vector<std::string> override;
    auto outputs() const -> std::vector<std::string> override;
    auto describe() const -> std::string override;

private:
    OperationVariable op_;
    FieldRef field_;
    ValueVariable out_;
};

/// Binds `out` to a result of the bound operation.
class OperationResultConstraint : public Constraint {
public:
    OperationResultConstraint(OperationVariable op, size_t index, ValueVariable out)
        : op_(std::move(op)), field_{index, nullptr, {}}, out_(std::move(out)) {}

    OperationResultConstraint(OperationVariable op, const ir::KindRegistry& registry,
                              std::string field, ValueVariable out)
        : op_(std::move(op)), field_{std::nullopt, &registry, std::move(field)},
          out_(std::move(out)) {}

    auto match(MatchContext& ctx) const -> bool override;
    auto inputs() const -> std::vector<std::string> override;
    auto outputs() const -> std::vector<std::string> override;
    auto describe() const -> std::string override;

private:
    OperationVariable op_;
    FieldRef field_;
    ValueVariable out_;
};

/// Binds `out` to the operation defining the bound result.
class OpResultOpConstraint : public Constraint {
public:
    OpResultOpConstraint(OpResultVariable result, OperationVariable out)
        : result_(std::move(result)), out_(std::move(out)) {}

    auto match(MatchContext& ctx) const -> bool override;
    auto inputs() const -> std::vector<std::string> override;
    auto outputs() const -> std::vector<std::string> override;
    auto describe() const -> std::string override;

private:
    OpResultVariable result_;
    OperationVariable out_;
};

/// Binds `out` to the type of the bound value.
class ValueTypeConstraint : public Constraint {
public:
    ValueTypeConstraint(ValueVariable value, AttributeVariable out)
        : value_(std::move(value)), out_(std::move(out)) {}

    auto match(MatchContext& ctx) const -> bool override;
    auto inputs() const -> std::vector<std::string> override;
    auto outputs() const -> std::vector<std::string> override;
    auto describe() const -> std::string override;

private:
    ValueVariable value_;
    AttributeVariable out_;
};

// ============================================================================
// Query
// ============================================================================

class Query {
public:
    /// A query whose root variable must be an operation of `kind`.
    [[nodiscard]] static auto root(std::string kind) -> Query;

    [[nodiscard]] auto root_variable() const -> const OperationVariable& {
        return root_;
    }

    [[nodiscard]] auto root_kind() const -> const std::string& {
        return root_kind_;
    }

    /// Declares a variable. Throws std::invalid_argument on a duplicate name.
    template <typename V> auto add_variable(std::string name) -> V {
        declare(name, V::KIND);
        return V(std::move(name));
    }

    auto add_constraint(Box<Constraint> constraint) -> Query&;

    template <typename C, typename... Args> auto add_constraint(Args&&... args) -> Query& {
        return add_constraint(make_box<C>(std::forward<Args>(args)...));
    }

    /// Checks that every constraint only reads variables bound before it
    /// and that every declared variable is bound by some constraint.
    [[nodiscard]] auto validate() const -> Result<Unit, IrError>;

    [[nodiscard]] auto match(ir::Operation& op) const -> std::optional<Match>;

    /// Every operation nested in `module` (and `module` itself) that
    /// matches, in walk order. Each call scans afresh.
    [[nodiscard]] auto matches(ir::Operation& module) const -> std::vector<Match>;

    [[nodiscard]] auto num_variables() const -> size_t {
        return variables_.size();
    }

    [[nodiscard]] auto num_constraints() const -> size_t {
        return constraints_.size();
    }

private:
    explicit Query(std::string kind);

    void declare(const std::string& name, VariableKind kind);

    std::string root_kind_;
    OperationVariable root_;
    std::vector<std::pair<std::string, VariableKind>> variables_;
    std::vector<Box<Constraint>> constraints_;
};

} // namespace irkit::match
