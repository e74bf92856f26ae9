#pragma once

// builtin dialect
//
// The module root and the cast placeholder left behind by partial lowering.

#include "common.hpp"
#include "ir/ir.hpp"
#include "ir/op_registry.hpp"

namespace irkit::dialects {

namespace builtin {

constexpr const char* MODULE = "builtin.module";
constexpr const char* UNREALIZED_CAST = "builtin.unrealized_conversion_cast";

/// Casts `input` to `type` without saying how.
[[nodiscard]] auto unrealized_cast(ir::Value& input, ir::Attribute type) -> Box<ir::Operation>;

} // namespace builtin

auto register_builtin_dialect(ir::KindRegistry& registry) -> Result<Unit, ir::IrError>;

} // namespace irkit::dialects
