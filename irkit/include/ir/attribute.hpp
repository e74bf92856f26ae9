#pragma once

// IR Attributes
//
// Attributes are immutable values attached to operations or used as the type
// of a value. The set of attribute kinds is closed: every consumer switches
// over the variant and the compiler checks that each kind is handled.
// Equality and hashing are structural.

#include "common.hpp"
#include "ir/ir_error.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace irkit::ir {

class Attribute;

// ============================================================================
// Attribute Kinds
// ============================================================================

struct UnitAttr {
    auto operator==(const UnitAttr&) const -> bool = default;
};

struct IntegerType {
    uint32_t width;
    auto operator==(const IntegerType&) const -> bool = default;
};

struct FloatType {
    uint32_t width;
    auto operator==(const FloatType&) const -> bool = default;
};

struct IndexType {
    auto operator==(const IndexType&) const -> bool = default;
};

struct IntegerAttr {
    int64_t value;
    IntegerType type;
    auto operator==(const IntegerAttr&) const -> bool = default;
};

struct FloatAttr {
    double value;
    FloatType type;
    auto operator==(const FloatAttr&) const -> bool = default;
};

struct StringAttr {
    std::string value;
    auto operator==(const StringAttr&) const -> bool = default;
};

struct BoolAttr {
    bool value;
    auto operator==(const BoolAttr&) const -> bool = default;
};

struct ArrayAttr {
    std::vector<Attribute> elements;
    auto operator==(const ArrayAttr& other) const -> bool;
};

using AttributeKind = std::variant<UnitAttr, IntegerType, FloatType, IndexType, IntegerAttr,
                                   FloatAttr, StringAttr, BoolAttr, ArrayAttr>;

// ============================================================================
// Attribute
// ============================================================================

/// Immutable attribute value. Copies share one storage record.
class Attribute {
public:
    /// The unit attribute.
    Attribute();

    template <typename T,
              typename = std::enable_if_t<std::is_constructible_v<AttributeKind, T&&> &&
                                          !std::is_same_v<std::decay_t<T>, Attribute>>>
    Attribute(T&& kind) : storage_(std::make_shared<const AttributeKind>(std::forward<T>(kind))) {}

    [[nodiscard]] auto kind() const -> const AttributeKind& {
        return *storage_;
    }

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(*storage_);
    }

    template <typename T> [[nodiscard]] auto get_if() const -> const T* {
        return std::get_if<T>(storage_.get());
    }

    /// Typed access that fails with AttributeKindMismatch on the wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> Result<T, IrError> {
        if (const T* value = get_if<T>()) {
            return *value;
        }
        return IrError{IrErrorKind::AttributeKindMismatch,
                       std::string("attribute is not a ") + kind_name_of<T>(), to_string()};
    }

    /// Name of the active kind, e.g. "integer" or "array".
    [[nodiscard]] auto kind_name() const -> const char*;

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto hash() const -> size_t;

    auto operator==(const Attribute& other) const -> bool;

private:
    template <typename T> static auto kind_name_of() -> const char*;

    std::shared_ptr<const AttributeKind> storage_;
};

/// Attributes of an operation, ordered by name.
using AttrDict = std::map<std::string, Attribute>;

[[nodiscard]] auto to_string(const AttrDict& attrs) -> std::string;

// Common constructors
[[nodiscard]] auto i1() -> Attribute;
[[nodiscard]] auto i32() -> Attribute;
[[nodiscard]] auto i64() -> Attribute;
[[nodiscard]] auto f64() -> Attribute;
[[nodiscard]] auto index_type() -> Attribute;
[[nodiscard]] auto int_attr(int64_t value, uint32_t width = 64) -> Attribute;
[[nodiscard]] auto string_attr(std::string value) -> Attribute;

template <typename T> auto Attribute::kind_name_of() -> const char* {
    if constexpr (std::is_same_v<T, UnitAttr>) {
        return "unit";
    } else if constexpr (std::is_same_v<T, IntegerType>) {
        return "integer type";
    } else if constexpr (std::is_same_v<T, FloatType>) {
        return "float type";
    } else if constexpr (std::is_same_v<T, IndexType>) {
        return "index type";
    } else if constexpr (std::is_same_v<T, IntegerAttr>) {
        return "integer";
    } else if constexpr (std::is_same_v<T, FloatAttr>) {
        return "float";
    } else if constexpr (std::is_same_v<T, StringAttr>) {
        return "string";
    } else if constexpr (std::is_same_v<T, BoolAttr>) {
        return "bool";
    } else {
        static_assert(std::is_same_v<T, ArrayAttr>, "not an attribute kind");
        return "array";
    }
}

} // namespace irkit::ir

template <> struct std::hash<irkit::ir::Attribute> {
    auto operator()(const irkit::ir::Attribute& attr) const noexcept -> size_t {
        return attr.hash();
    }
};
