#include "dialects/arith.hpp"

namespace irkit::dialects {

using ir::Attribute;
using ir::IrError;
using ir::IrErrorKind;
using ir::Operation;
using ir::OperationState;

namespace arith {

auto predicate_name(CmpPredicate predicate) -> const char* {
    switch (predicate) {
    case CmpPredicate::Eq:
        return "eq";
    case CmpPredicate::Ne:
        return "ne";
    case CmpPredicate::Slt:
        return "slt";
    case CmpPredicate::Sle:
        return "sle";
    case CmpPredicate::Sgt:
        return "sgt";
    case CmpPredicate::Sge:
        return "sge";
    case CmpPredicate::Ult:
        return "ult";
    case CmpPredicate::Ule:
        return "ule";
    case CmpPredicate::Ugt:
        return "ugt";
    case CmpPredicate::Uge:
        return "uge";
    }
    return "unknown";
}

auto constant(int64_t value, uint32_t width) -> Box<Operation> {
    OperationState state{CONSTANT};
    state.result_types = {ir::IntegerType{width}};
    state.attributes["value"] = ir::int_attr(value, width);
    return Operation::create(std::move(state));
}

namespace {

auto binary(const char* kind, ir::Value& lhs, ir::Value& rhs) -> Box<Operation> {
    OperationState state{kind};
    state.operands = {&lhs, &rhs};
    state.result_types = {lhs.type()};
    return Operation::create(std::move(state));
}

} // namespace

auto addi(ir::Value& lhs, ir::Value& rhs) -> Box<Operation> {
    return binary(ADDI, lhs, rhs);
}

auto subi(ir::Value& lhs, ir::Value& rhs) -> Box<Operation> {
    return binary(SUBI, lhs, rhs);
}

auto muli(ir::Value& lhs, ir::Value& rhs) -> Box<Operation> {
    return binary(MULI, lhs, rhs);
}

auto cmpi(CmpPredicate predicate, ir::Value& lhs, ir::Value& rhs) -> Box<Operation> {
    OperationState state{CMPI};
    state.operands = {&lhs, &rhs};
    state.result_types = {ir::i1()};
    state.attributes["predicate"] = ir::int_attr(static_cast<int64_t>(predicate));
    return Operation::create(std::move(state));
}

auto constant_value(const Operation& op) -> std::optional<int64_t> {
    if (op.kind() != CONSTANT)
        return std::nullopt;
    const Attribute* value = op.get_attribute("value");
    if (value == nullptr)
        return std::nullopt;
    if (const auto* integer = value->get_if<ir::IntegerAttr>()) {
        return integer->value;
    }
    return std::nullopt;
}

auto constant_value(const ir::Value& value) -> std::optional<int64_t> {
    const Operation* producer = value.defining_op();
    if (producer == nullptr)
        return std::nullopt;
    return constant_value(*producer);
}

} // namespace arith

// ============================================================================
// Verification
// ============================================================================

namespace {

auto fail(const Operation& op, std::string message) -> Result<Unit, IrError> {
    return IrError{IrErrorKind::VerificationFailed, std::move(message), ir::describe(op)};
}

auto verify_constant(const Operation& op) -> Result<Unit, IrError> {
    const Attribute* value = op.get_attribute("value");
    if (value == nullptr)
        return fail(op, "constant has no 'value' attribute");
    const auto* integer = value->get_if<ir::IntegerAttr>();
    if (integer == nullptr)
        return fail(op, "constant value is a " + std::string(value->kind_name()) + ", not an integer");
    if (!(op.result().type() == Attribute(integer->type)))
        return fail(op, "constant value type " + Attribute(integer->type).to_string() +
                            " does not match result type " + op.result().type().to_string());
    return Unit{};
}

auto verify_binary(const Operation& op) -> Result<Unit, IrError> {
    const Attribute& type = op.operand(0)->type();
    if (!(op.operand(1)->type() == type) || !(op.result().type() == type))
        return fail(op, "operands and result must share one integer type");
    if (!type.is<ir::IntegerType>())
        return fail(op, "expected an integer type, got " + type.to_string());
    return Unit{};
}

auto verify_cmpi(const Operation& op) -> Result<Unit, IrError> {
    if (!(op.operand(0)->type() == op.operand(1)->type()))
        return fail(op, "compared values must share one type");
    if (!(op.result().type() == ir::i1()))
        return fail(op, "comparison must produce i1");
    const Attribute* predicate = op.get_attribute("predicate");
    const auto* integer = predicate != nullptr ? predicate->get_if<ir::IntegerAttr>() : nullptr;
    if (integer == nullptr)
        return fail(op, "comparison has no integer 'predicate' attribute");
    if (integer->value < 0 || integer->value > static_cast<int64_t>(arith::CmpPredicate::Uge))
        return fail(op, "predicate " + std::to_string(integer->value) + " is out of range");
    return Unit{};
}

} // namespace

auto register_arith_dialect(ir::KindRegistry& registry) -> Result<Unit, IrError> {
    std::vector<ir::OpDefinition> defs = {
        {arith::CONSTANT, {}, {"result"}, verify_constant},
        {arith::ADDI, {"lhs", "rhs"}, {"result"}, verify_binary},
        {arith::SUBI, {"lhs", "rhs"}, {"result"}, verify_binary},
        {arith::MULI, {"lhs", "rhs"}, {"result"}, verify_binary},
        {arith::CMPI, {"lhs", "rhs"}, {"result"}, verify_cmpi},
    };
    for (auto& def : defs) {
        auto registered = registry.register_kind(std::move(def));
        if (is_err(registered))
            return registered;
    }
    return Unit{};
}

} // namespace irkit::dialects
