#pragma once

// arith dialect
//
// Integer constants, wrapping binary arithmetic and comparisons. Operand
// fields are named `lhs` and `rhs`, the single result `result`.

#include "common.hpp"
#include "ir/ir.hpp"
#include "ir/op_registry.hpp"

#include <cstdint>
#include <optional>

namespace irkit::dialects {

namespace arith {

constexpr const char* CONSTANT = "arith.constant";
constexpr const char* ADDI = "arith.addi";
constexpr const char* SUBI = "arith.subi";
constexpr const char* MULI = "arith.muli";
constexpr const char* CMPI = "arith.cmpi";

/// Comparison predicates, stored as their integer value in the `predicate`
/// attribute of arith.cmpi.
enum class CmpPredicate : int64_t {
    Eq = 0,
    Ne = 1,
    Slt = 2,
    Sle = 3,
    Sgt = 4,
    Sge = 5,
    Ult = 6,
    Ule = 7,
    Ugt = 8,
    Uge = 9,
};

[[nodiscard]] auto predicate_name(CmpPredicate predicate) -> const char*;

/// Integer constant of the given bit width.
[[nodiscard]] auto constant(int64_t value, uint32_t width = 64) -> Box<ir::Operation>;

[[nodiscard]] auto addi(ir::Value& lhs, ir::Value& rhs) -> Box<ir::Operation>;
[[nodiscard]] auto subi(ir::Value& lhs, ir::Value& rhs) -> Box<ir::Operation>;
[[nodiscard]] auto muli(ir::Value& lhs, ir::Value& rhs) -> Box<ir::Operation>;

/// Produces an i1.
[[nodiscard]] auto cmpi(CmpPredicate predicate, ir::Value& lhs, ir::Value& rhs)
    -> Box<ir::Operation>;

/// The integer held by an arith.constant, nullopt for anything else.
[[nodiscard]] auto constant_value(const ir::Operation& op) -> std::optional<int64_t>;

/// Same as constant_value() on the producer of `value`.
[[nodiscard]] auto constant_value(const ir::Value& value) -> std::optional<int64_t>;

} // namespace arith

auto register_arith_dialect(ir::KindRegistry& registry) -> Result<Unit, ir::IrError>;

} // namespace irkit::dialects
