// Functional rewriting over the immutable IR
//
// new_op and from_op build operations whose operands may be operations that
// are not yet in any block. Such an operand contributes its first result and
// is folded into the returned chain, which lists every operation that has to
// be inserted, in definition order, with the new operation last. An
// operation reached through several operands appears in the chain once, at
// its earliest required position.
//
// rebuild_block_with_substitution produces a new block in which substituted
// values are replaced. Operations and nested blocks that do not reach a
// substituted value are reused as they are.

#pragma once

#include "common.hpp"
#include "imm/immutable_ir.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace irkit::imm {

using OpChain = std::vector<const IOp*>;

/// An existing value, a not-yet-inserted operation, or a chain ending in
/// the operation whose first result is meant.
using Operand = std::variant<const IValue*, const IOp*, OpChain>;

/// Old-to-new correspondence threaded through a rebuild.
struct Substitution {
    std::unordered_map<const IValue*, const IValue*> values;
    std::unordered_map<const IBlock*, const IBlock*> blocks;

    /// The replacement for `value`, or `value` itself.
    [[nodiscard]] auto lookup(const IValue* value) const -> const IValue*;
    [[nodiscard]] auto lookup(const IBlock* block) const -> const IBlock*;

    [[nodiscard]] auto contains(const IValue* value) const -> bool {
        return values.count(value) > 0;
    }

    [[nodiscard]] auto contains(const IBlock* block) const -> bool {
        return blocks.count(block) > 0;
    }
};

struct OpFields {
    std::vector<Operand> operands;
    std::vector<Attribute> result_types;
    AttrDict attributes;
    std::vector<const IBlock*> successors;
    std::vector<const IRegion*> regions;
};

/// Fields left empty keep the value of the operation being derived from.
struct OpOverrides {
    std::optional<std::vector<Operand>> operands;
    std::optional<std::vector<Attribute>> result_types;
    std::optional<AttrDict> attributes;
    std::optional<std::vector<const IBlock*>> successors;
    std::optional<std::vector<const IRegion*>> regions;
};

/// Builds a brand-new operation of `kind`.
///
/// Throws std::invalid_argument when an operation operand has no result.
auto new_op(IrArena& arena, const std::string& kind, OpFields fields = {}) -> OpChain;

/// Derives a new operation from `old_op`. Without an attribute override the
/// new operation shares `old_op`'s OpData.
///
/// With `env`, operands and successors are remapped through it and every
/// result of `old_op` is mapped to the matching new result.
auto from_op(IrArena& arena, const IOp& old_op, OpOverrides overrides = {},
             Substitution* env = nullptr) -> OpChain;

/// New block with the argument types of `old_block` and freshly minted
/// arguments. References to `old_block`'s arguments are remapped to the new
/// ones unless `env` already substitutes them. `env` gains every mapping the
/// rebuild creates.
auto rebuild_block_with_substitution(IrArena& arena, const IBlock& old_block, Substitution& env)
    -> const IBlock*;

/// Same, with `ops` taking the place of `old_block`'s operations.
auto rebuild_block_with_substitution(IrArena& arena, const SealedList<const IOp*>& ops,
                                     const IBlock& old_block, Substitution& env)
    -> const IBlock*;

/// Rewrite callback: the replacement chain for an operation, whose last
/// operation's results stand in for the original's, or nullopt to keep it.
using BlockRewriteFn = std::function<std::optional<OpChain>(const IOp&)>;

/// Applies `fn` to every operation of `block` in order and returns the
/// rewritten block. Operations that neither match nor depend on a rewritten
/// result are shared with `block`.
auto rewrite_block(IrArena& arena, const IBlock& block, const BlockRewriteFn& fn)
    -> const IBlock*;

} // namespace irkit::imm
