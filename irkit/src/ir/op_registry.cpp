#include "ir/op_registry.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace irkit::ir {

namespace {

auto find_field(const std::vector<std::string>& fields, const std::string& field)
    -> std::optional<size_t> {
    auto it = std::find(fields.begin(), fields.end(), field);
    if (it == fields.end())
        return std::nullopt;
    return static_cast<size_t>(it - fields.begin());
}

} // namespace

auto OpDefinition::operand_index(const std::string& field) const -> std::optional<size_t> {
    return find_field(operand_names, field);
}

auto OpDefinition::result_index(const std::string& field) const -> std::optional<size_t> {
    return find_field(result_names, field);
}

auto KindRegistry::register_kind(OpDefinition def) -> Result<Unit, IrError> {
    if (kinds_.count(def.name) > 0) {
        return IrError{IrErrorKind::DuplicateKind, "operation kind registered twice", def.name};
    }
    IRKIT_LOG_DEBUG("registry", "registered " << def.name);
    std::string name = def.name;
    kinds_.emplace(std::move(name), std::move(def));
    return Unit{};
}

auto KindRegistry::lookup(const std::string& kind) const -> const OpDefinition* {
    auto it = kinds_.find(kind);
    return it != kinds_.end() ? &it->second : nullptr;
}

auto KindRegistry::lookup_or_error(const std::string& kind) const
    -> Result<const OpDefinition*, IrError> {
    if (const auto* def = lookup(kind)) {
        return def;
    }
    return IrError{IrErrorKind::UnknownKind, "operation kind is not registered", kind};
}

auto KindRegistry::create(const std::string& kind, OperationState state) const
    -> Result<Box<Operation>, IrError> {
    auto def = lookup_or_error(kind);
    if (is_err(def)) {
        return unwrap_err(def);
    }

    state.kind = kind;
    auto op = Operation::create(std::move(state));

    if (verify_on_create_) {
        auto verified = verify_one(*op);
        if (is_err(verified)) {
            return unwrap_err(verified);
        }
    }
    return std::move(op);
}

auto KindRegistry::verify(const Operation& op) const -> Result<Unit, IrError> {
    std::optional<IrError> failure;
    op.walk_abortable([&](const Operation& nested) {
        auto result = verify_one(nested);
        if (is_err(result)) {
            failure = unwrap_err(result);
            return WalkResult::Interrupt;
        }
        return WalkResult::Advance;
    });

    if (failure) {
        IRKIT_LOG_WARN("registry", to_string(*failure));
        return *failure;
    }
    return Unit{};
}

auto KindRegistry::verify_one(const Operation& op) const -> Result<Unit, IrError> {
    const auto* def = lookup(op.kind());
    if (def == nullptr) {
        return IrError{IrErrorKind::UnknownKind, "operation kind is not registered", describe(op)};
    }

    size_t named = def->operand_names.size();
    if (def->variadic_operands ? op.num_operands() < named : op.num_operands() != named) {
        return IrError{IrErrorKind::VerificationFailed,
                       "expected " + std::string(def->variadic_operands ? "at least " : "") +
                           std::to_string(named) + " operands, got " +
                           std::to_string(op.num_operands()),
                       describe(op)};
    }
    if (op.num_results() != def->result_names.size()) {
        return IrError{IrErrorKind::VerificationFailed,
                       "expected " + std::to_string(def->result_names.size()) + " results, got " +
                           std::to_string(op.num_results()),
                       describe(op)};
    }

    if (def->verify) {
        return def->verify(op);
    }
    return Unit{};
}

} // namespace irkit::ir
