// Attribute printing, equality and hashing

#include "ir/attribute.hpp"

#include <functional>
#include <sstream>

namespace irkit::ir {

namespace {

void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

auto integer_type_name(const IntegerType& type) -> std::string {
    return "i" + std::to_string(type.width);
}

auto float_type_name(const FloatType& type) -> std::string {
    return "f" + std::to_string(type.width);
}

} // namespace

auto ArrayAttr::operator==(const ArrayAttr& other) const -> bool {
    return elements == other.elements;
}

Attribute::Attribute() : storage_(std::make_shared<const AttributeKind>(UnitAttr{})) {}

auto Attribute::operator==(const Attribute& other) const -> bool {
    return storage_ == other.storage_ || *storage_ == *other.storage_;
}

auto Attribute::kind_name() const -> const char* {
    return std::visit(
        [](const auto& kind) -> const char* {
            return kind_name_of<std::decay_t<decltype(kind)>>();
        },
        *storage_);
}

auto Attribute::to_string() const -> std::string {
    return std::visit(
        [](const auto& kind) -> std::string {
            using T = std::decay_t<decltype(kind)>;

            if constexpr (std::is_same_v<T, UnitAttr>) {
                return "unit";
            } else if constexpr (std::is_same_v<T, IntegerType>) {
                return integer_type_name(kind);
            } else if constexpr (std::is_same_v<T, FloatType>) {
                return float_type_name(kind);
            } else if constexpr (std::is_same_v<T, IndexType>) {
                return "index";
            } else if constexpr (std::is_same_v<T, IntegerAttr>) {
                return std::to_string(kind.value) + " : " + integer_type_name(kind.type);
            } else if constexpr (std::is_same_v<T, FloatAttr>) {
                std::ostringstream oss;
                oss << kind.value << " : " << float_type_name(kind.type);
                return oss.str();
            } else if constexpr (std::is_same_v<T, StringAttr>) {
                return "\"" + kind.value + "\"";
            } else if constexpr (std::is_same_v<T, BoolAttr>) {
                return kind.value ? "true" : "false";
            } else {
                static_assert(std::is_same_v<T, ArrayAttr>);
                std::string out = "[";
                for (size_t i = 0; i < kind.elements.size(); ++i) {
                    if (i > 0)
                        out += ", ";
                    out += kind.elements[i].to_string();
                }
                return out + "]";
            }
        },
        *storage_);
}

auto Attribute::hash() const -> size_t {
    size_t seed = storage_->index();
    std::visit(
        [&seed](const auto& kind) {
            using T = std::decay_t<decltype(kind)>;

            if constexpr (std::is_same_v<T, IntegerType> || std::is_same_v<T, FloatType>) {
                hash_combine(seed, std::hash<uint32_t>{}(kind.width));
            } else if constexpr (std::is_same_v<T, IntegerAttr>) {
                hash_combine(seed, std::hash<int64_t>{}(kind.value));
                hash_combine(seed, std::hash<uint32_t>{}(kind.type.width));
            } else if constexpr (std::is_same_v<T, FloatAttr>) {
                hash_combine(seed, std::hash<double>{}(kind.value));
                hash_combine(seed, std::hash<uint32_t>{}(kind.type.width));
            } else if constexpr (std::is_same_v<T, StringAttr>) {
                hash_combine(seed, std::hash<std::string>{}(kind.value));
            } else if constexpr (std::is_same_v<T, BoolAttr>) {
                hash_combine(seed, std::hash<bool>{}(kind.value));
            } else if constexpr (std::is_same_v<T, ArrayAttr>) {
                for (const auto& element : kind.elements) {
                    hash_combine(seed, element.hash());
                }
            }
        },
        *storage_);
    return seed;
}

auto to_string(const AttrDict& attrs) -> std::string {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, attr] : attrs) {
        if (!first)
            out += ", ";
        first = false;
        out += name + " = " + attr.to_string();
    }
    return out + "}";
}

auto i1() -> Attribute {
    return IntegerType{1};
}

auto i32() -> Attribute {
    return IntegerType{32};
}

auto i64() -> Attribute {
    return IntegerType{64};
}

auto f64() -> Attribute {
    return FloatType{64};
}

auto index_type() -> Attribute {
    return IndexType{};
}

auto int_attr(int64_t value, uint32_t width) -> Attribute {
    return IntegerAttr{value, IntegerType{width}};
}

auto string_attr(std::string value) -> Attribute {
    return StringAttr{std::move(value)};
}

} // namespace irkit::ir
