#pragma once

// IR error taxonomy
//
// Recoverable failures travel as IrError inside a Result. Programming errors
// (touching a sealed container, breaking the mutation contract) throw one of
// the logic_error subclasses below. DiagnosticError is the catchable failure
// raised by dialect code that meets a case it cannot handle.

#include <stdexcept>
#include <string>

namespace irkit::ir {

class Operation;

enum class IrErrorKind {
    UnresolvedValue,
    UnresolvedBlock,
    UnknownKind,
    DuplicateKind,
    VerificationFailed,
    UnhandledCase,
    AttributeKindMismatch,
    UnboundVariable,
};

struct IrError {
    IrErrorKind kind;
    std::string message;
    std::string subject; // Stable reference to the offending op/value/block, may be empty
};

[[nodiscard]] auto error_kind_name(IrErrorKind kind) -> const char*;

/// "unresolved-value: operand used before definition [arith.addi@0.0.1]"
[[nodiscard]] auto to_string(const IrError& error) -> std::string;

/// Thrown when a sealed container is asked to change.
class ImmutabilityViolation : public std::logic_error {
public:
    explicit ImmutabilityViolation(const std::string& what) : std::logic_error(what) {}
};

/// Thrown when the mutation API is used against its contract.
class RewriteError : public std::logic_error {
public:
    explicit RewriteError(const std::string& what) : std::logic_error(what) {}
};

/// Catchable diagnostic carrying the IrError that describes it.
class DiagnosticError : public std::runtime_error {
public:
    explicit DiagnosticError(IrError error)
        : std::runtime_error(to_string(error)), error_(std::move(error)) {}

    [[nodiscard]] auto error() const -> const IrError& {
        return error_;
    }

private:
    IrError error_;
};

/// Builds the diagnostic for a dialect dispatch that has no case for `op`.
[[nodiscard]] auto unhandled_case(const Operation& op, const std::string& what) -> DiagnosticError;

} // namespace irkit::ir
