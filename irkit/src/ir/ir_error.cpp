#include "ir/ir_error.hpp"

#include "ir/ir.hpp"

namespace irkit::ir {

auto error_kind_name(IrErrorKind kind) -> const char* {
    switch (kind) {
    case IrErrorKind::UnresolvedValue:
        return "unresolved-value";
    case IrErrorKind::UnresolvedBlock:
        return "unresolved-block";
    case IrErrorKind::UnknownKind:
        return "unknown-kind";
    case IrErrorKind::DuplicateKind:
        return "duplicate-kind";
    case IrErrorKind::VerificationFailed:
        return "verification-failed";
    case IrErrorKind::UnhandledCase:
        return "unhandled-case";
    case IrErrorKind::AttributeKindMismatch:
        return "attribute-kind-mismatch";
    case IrErrorKind::UnboundVariable:
        return "unbound-variable";
    }
    return "unknown";
}

auto to_string(const IrError& error) -> std::string {
    std::string out = error_kind_name(error.kind);
    out += ": ";
    out += error.message;
    if (!error.subject.empty()) {
        out += " [" + error.subject + "]";
    }
    return out;
}

auto unhandled_case(const Operation& op, const std::string& what) -> DiagnosticError {
    return DiagnosticError(IrError{IrErrorKind::UnhandledCase, what, describe(op)});
}

} // namespace irkit::ir
