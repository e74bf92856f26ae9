// Operation Kind Registry
//
// Maps an operation-kind name to its definition: named operand and result
// slots plus an optional verification hook. The registry is an ordinary
// object, built once at startup by whoever assembles the dialects it needs
// and passed by reference to the code that builds or verifies operations.
// Kinds are never unregistered.

#pragma once

#include "common.hpp"
#include "ir/ir.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace irkit::ir {

using VerifyHook = std::function<Result<Unit, IrError>(const Operation&)>;

struct OpDefinition {
    std::string name;
    std::vector<std::string> operand_names;
    std::vector<std::string> result_names;
    VerifyHook verify;
    // Accepts extra operands after the named ones
    bool variadic_operands = false;

    [[nodiscard]] auto operand_index(const std::string& field) const -> std::optional<size_t>;
    [[nodiscard]] auto result_index(const std::string& field) const -> std::optional<size_t>;
};

class KindRegistry {
public:
    /// With `verify_on_create`, create() runs the kind's verify hook on every
    /// operation it builds.
    explicit KindRegistry(bool verify_on_create = false) : verify_on_create_(verify_on_create) {}

    /// Fails with DuplicateKind if `def.name` is already registered.
    auto register_kind(OpDefinition def) -> Result<Unit, IrError>;

    /// Returns nullptr for an unknown kind.
    [[nodiscard]] auto lookup(const std::string& kind) const -> const OpDefinition*;

    [[nodiscard]] auto lookup_or_error(const std::string& kind) const
        -> Result<const OpDefinition*, IrError>;

    /// Builds an operation of a registered kind.
    [[nodiscard]] auto create(const std::string& kind, OperationState state) const
        -> Result<Box<Operation>, IrError>;

    /// Runs structural arity checks and verify hooks over `op` and every
    /// operation nested in it. Stops at the first failure.
    [[nodiscard]] auto verify(const Operation& op) const -> Result<Unit, IrError>;

    [[nodiscard]] auto size() const -> size_t {
        return kinds_.size();
    }

    [[nodiscard]] auto verify_on_create() const -> bool {
        return verify_on_create_;
    }

private:
    auto verify_one(const Operation& op) const -> Result<Unit, IrError>;

    std::unordered_map<std::string, OpDefinition> kinds_;
    bool verify_on_create_;
};

} // namespace irkit::ir
