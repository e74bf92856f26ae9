//! # Common Definitions
//!
//! Types and helpers shared by every irkit component.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Result Type**: Error handling for recoverable failures
//! - **Smart Pointers**: Aliases for unique and shared ownership
//!
//! ## Conventions
//!
//! - Recoverable failures are returned as `Result<T, E>`
//! - A negative answer that is not a failure is an empty `std::optional`
//! - Misuse of a builder or of the mutation API throws a `std::logic_error`
//!   subclass and is treated as a programming error

#ifndef IRKIT_COMMON_HPP
#define IRKIT_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace irkit {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<const OpDefinition*, IrError> def = registry.lookup_or_error("arith.addi");
/// if (is_ok(def)) {
///     auto* d = unwrap(def);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Success payload for operations that produce no value.
using Unit = std::monostate;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace irkit

#endif // IRKIT_COMMON_HPP
