#include "dialects/builtin.hpp"

namespace irkit::dialects {

using ir::IrError;
using ir::IrErrorKind;
using ir::Operation;

namespace builtin {

auto unrealized_cast(ir::Value& input, ir::Attribute type) -> Box<Operation> {
    ir::OperationState state{UNREALIZED_CAST};
    state.operands = {&input};
    state.result_types = {std::move(type)};
    return Operation::create(std::move(state));
}

} // namespace builtin

namespace {

auto verify_module(const Operation& op) -> Result<Unit, IrError> {
    if (op.num_regions() != 1 || op.region().empty()) {
        return IrError{IrErrorKind::VerificationFailed,
                       "module must hold exactly one non-empty region", ir::describe(op)};
    }
    if (op.num_operands() != 0 || op.num_results() != 0) {
        return IrError{IrErrorKind::VerificationFailed, "module takes no operands and has no results",
                       ir::describe(op)};
    }
    return Unit{};
}

} // namespace

auto register_builtin_dialect(ir::KindRegistry& registry) -> Result<Unit, IrError> {
    auto registered = registry.register_kind({builtin::MODULE, {}, {}, verify_module});
    if (is_err(registered))
        return registered;
    return registry.register_kind({builtin::UNREALIZED_CAST, {"input"}, {"output"}, nullptr});
}

} // namespace irkit::dialects
