#include "dialects/cf.hpp"

namespace irkit::dialects {

using ir::IrError;
using ir::IrErrorKind;
using ir::Operation;

namespace cf {

auto br(ir::Block& dest, std::vector<ir::Value*> args) -> Box<Operation> {
    ir::OperationState state{BR};
    state.operands = std::move(args);
    state.successors = {&dest};
    return Operation::create(std::move(state));
}

auto cond_br(ir::Value& condition, ir::Block& true_dest, ir::Block& false_dest)
    -> Box<Operation> {
    ir::OperationState state{COND_BR};
    state.operands = {&condition};
    state.successors = {&true_dest, &false_dest};
    return Operation::create(std::move(state));
}

} // namespace cf

namespace {

auto verify_br(const Operation& op) -> Result<Unit, IrError> {
    if (op.successors().size() != 1) {
        return IrError{IrErrorKind::VerificationFailed, "br needs exactly one successor",
                       ir::describe(op)};
    }
    const ir::Block* dest = op.successors().front();
    if (dest->num_args() != op.num_operands()) {
        return IrError{IrErrorKind::VerificationFailed,
                       "br forwards " + std::to_string(op.num_operands()) + " values to a block with " +
                           std::to_string(dest->num_args()) + " arguments",
                       ir::describe(op)};
    }
    return Unit{};
}

auto verify_cond_br(const Operation& op) -> Result<Unit, IrError> {
    if (op.successors().size() != 2) {
        return IrError{IrErrorKind::VerificationFailed, "cond_br needs exactly two successors",
                       ir::describe(op)};
    }
    if (!(op.operand(0)->type() == ir::i1())) {
        return IrError{IrErrorKind::VerificationFailed, "cond_br condition must be i1",
                       ir::describe(op)};
    }
    return Unit{};
}

} // namespace

auto register_cf_dialect(ir::KindRegistry& registry) -> Result<Unit, IrError> {
    auto registered = registry.register_kind({cf::BR, {}, {}, verify_br, true});
    if (is_err(registered))
        return registered;
    return registry.register_kind({cf::COND_BR, {"condition"}, {}, verify_cond_br});
}

} // namespace irkit::dialects
