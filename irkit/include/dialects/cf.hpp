#pragma once

// cf dialect
//
// Unstructured control flow between the blocks of one region. Branch
// operands are forwarded to the arguments of the destination block.

#include "common.hpp"
#include "ir/ir.hpp"
#include "ir/op_registry.hpp"

#include <vector>

namespace irkit::dialects {

namespace cf {

constexpr const char* BR = "cf.br";
constexpr const char* COND_BR = "cf.cond_br";

[[nodiscard]] auto br(ir::Block& dest, std::vector<ir::Value*> args = {}) -> Box<ir::Operation>;

/// Branches to `true_dest` when `condition` (an i1) is set.
[[nodiscard]] auto cond_br(ir::Value& condition, ir::Block& true_dest, ir::Block& false_dest)
    -> Box<ir::Operation>;

} // namespace cf

auto register_cf_dialect(ir::KindRegistry& registry) -> Result<Unit, ir::IrError>;

} // namespace irkit::dialects
