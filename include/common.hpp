//! # Common Definitions
//!
//! Types shared by every pystruct component.
//!
//! - `Result<T, E>`: the return type of every fallible operation. pystruct
//!   does not throw; errors travel as values up to the command that
//!   reports them.
//! - `SourceLocation` / `SourceSpan`: byte positions inside a Python file.
//! - `ConfigurationError`: the fatal, pre-extraction error kind.
//! - `Box<T>` / `Rc<T>`: unique and shared ownership. Entity trees share
//!   their children as `Rc<const T>`.

#ifndef PYSTRUCT_COMMON_HPP
#define PYSTRUCT_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pystruct {

/// Reported by `pystruct --version`.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Source Positions
// ============================================================================

/// A position inside one source file. `line` and `column` count from 1,
/// `offset` counts bytes from 0. `length` is the width of the token that
/// starts here, when the location belongs to a token.
struct SourceLocation {
    uint32_t line = 1;
    uint32_t column = 1;
    uint32_t offset = 0;
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// Half-open byte range `[start.offset, end.offset)` of a statement or
/// expression.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;
};

// ============================================================================
// Result
// ============================================================================

/// Success value `T` or error `E`. `T` and `E` must be distinct types.
///
/// ```cpp
/// auto pipeline = filter::FilterPipeline::create(registry, "EmptyFilter");
/// if (is_err(pipeline)) {
///     std::cerr << unwrap_err(pipeline).message << "\n";
///     return 1;
/// }
/// auto kept = unwrap(pipeline).apply(repository, report);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// The success value. Throws `std::bad_variant_access` on an error; check
/// with `is_ok()` first.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// The error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Errors
// ============================================================================

/// An invalid run configuration: an unknown filter name, a missing
/// repository identity, a bad worker count. Always fatal, and always
/// detected before any file is read.
struct ConfigurationError {
    std::string message;

    [[nodiscard]] auto operator==(const ConfigurationError& other) const -> bool = default;
};

// ============================================================================
// Ownership
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;

/// Entity trees hold their children as `Rc<const T>` so a filtered tree can
/// share every unchanged subtree with its input.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace pystruct

#endif // PYSTRUCT_COMMON_HPP
