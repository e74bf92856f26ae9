// Conversion between the core IR and the immutable IR
//
// from_mutable walks a mutable operation once and mirrors it into an arena.
// It records which immutable value and block stand for each mutable one, so
// later operands resolve to what was already built. An operand whose
// producer has not been visited yet is converted on the spot and reused when
// the walk reaches it.
//
// to_mutable is the inverse. It builds a fresh mutable subtree and leaves
// the immutable source alone. A value or block missing from the maps is
// reported as an unresolved reference, never patched over.

#pragma once

#include "common.hpp"
#include "imm/immutable_ir.hpp"
#include "ir/ir.hpp"

#include <unordered_map>

namespace irkit::imm {

using ir::IrError;

/// Correspondence recorded by from_mutable.
struct ImmutableMapping {
    std::unordered_map<const ir::Value*, const IValue*> values;
    std::unordered_map<const ir::Block*, const IBlock*> blocks;
};

/// Correspondence recorded by to_mutable.
struct MutableMapping {
    std::unordered_map<const IValue*, ir::Value*> values;
    std::unordered_map<const IBlock*, ir::Block*> blocks;
};

[[nodiscard]] auto from_mutable(IrArena& arena, const ir::Operation& op)
    -> Result<const IOp*, IrError>;

/// Operands and successors already present in `mapping` resolve to their
/// recorded counterparts; everything converted is added to it.
[[nodiscard]] auto from_mutable(IrArena& arena, const ir::Operation& op, ImmutableMapping& mapping)
    -> Result<const IOp*, IrError>;

[[nodiscard]] auto to_mutable(const IOp& op) -> Result<Box<ir::Operation>, IrError>;

/// Operands and successors of `op` (and of everything nested in it) that
/// are defined outside `op` must already be in `mapping`.
[[nodiscard]] auto to_mutable(const IOp& op, MutableMapping& mapping)
    -> Result<Box<ir::Operation>, IrError>;

[[nodiscard]] auto to_mutable(const IRegion& region, MutableMapping& mapping)
    -> Result<Box<ir::Region>, IrError>;

} // namespace irkit::imm
