//! # Structural Syntax Tree
//!
//! This module defines the syntax tree produced by the structural parser.
//! It keeps exactly what the extractor needs and nothing more:
//!
//! - **Definitions**: `def`/`async def` (`FuncDef`) and `class` (`ClassDef`)
//!   with decorators, parameters, annotations and the verbatim body text
//! - **Assignments**: simple-name targets with an optional annotation
//!   (`AssignStmt`), the source of class fields
//! - **Compound statements**: `if`, `for`, `while`, `try`, `with`, `match`,
//!   ... (`CompoundStmt`) whose suites may contain nested definitions
//! - **Everything else**: a `SimpleStmt` that records only its span
//!
//! Expressions are not modeled. Annotations, defaults, bases and decorator
//! texts are stored as strings rendered from their tokens (see
//! `expr_text.hpp`).
//!
//! ## Ownership
//!
//! Nodes own their strings, so a tree stays valid after the `Source` and the
//! token vector it was built from are destroyed.

#ifndef PYSTRUCT_PARSER_AST_HPP
#define PYSTRUCT_PARSER_AST_HPP

#include "common.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pystruct::parser {

struct Stmt;
using StmtPtr = Box<Stmt>;

// ============================================================================
// Parameters and Decorators
// ============================================================================

/// Position class of a parameter in a `def` header.
enum class ParamKind {
    PositionalOnly, ///< Before a `/` separator.
    Regular,        ///< Positional-or-keyword.
    VarArgs,        ///< `*args`
    KeywordOnly,    ///< After `*` or `*args`.
    VarKeywords,    ///< `**kwargs`
};

/// A declared parameter: `name: annotation = default`.
struct Param {
    std::string name;
    ParamKind kind = ParamKind::Regular;
    std::optional<std::string> annotation;    ///< Normalized annotation text.
    std::optional<std::string> default_value; ///< Normalized default expression.
    SourceLocation location;                  ///< Location of the name.
};

/// A decorator line: `@property`, `@app.route("/", methods=["GET"])`.
struct Decorator {
    std::string text; ///< Verbatim source from `@` to the end of the expression.
    SourceSpan span;
};

// ============================================================================
// Statements
// ============================================================================

/// A function definition, top-level or nested.
///
/// # Example
///
/// ```python
/// @cache
/// async def fetch(url: str, *, retries: int = 3) -> bytes:
///     ...
/// ```
struct FuncDef {
    std::string name;
    SourceLocation name_location;
    bool is_async = false;
    std::vector<Decorator> decorators;
    std::vector<Param> params;
    std::optional<std::string> returns; ///< Normalized return annotation.
    std::string body_text;              ///< Verbatim suite text, header excluded.
    std::vector<StmtPtr> body;
};

/// A class definition, top-level or nested.
struct ClassDef {
    std::string name;
    SourceLocation name_location;
    std::vector<Decorator> decorators;
    std::vector<std::string> bases;    ///< Positional bases, normalized text.
    std::vector<std::string> keywords; ///< `metaclass=ABCMeta`, ...
    std::string body_text;
    std::vector<StmtPtr> body;
};

/// An assignment whose targets include at least one plain name.
///
/// `x = 1` has targets `{x}`; `a = b = 0` has `{a, b}`; `x: int` has target
/// `{x}` and annotation `int`. Targets like `self.x` or `a[0]` are not names
/// and are dropped; tuple targets are not unpacked.
struct AssignStmt {
    std::vector<std::string> targets;
    std::optional<std::string> annotation;
    bool has_value = false;
};

/// Any statement with a suite other than `def` and `class`.
struct CompoundStmt {
    std::string keyword;       ///< `if`, `for`, `try`, `match`, ...
    std::vector<StmtPtr> body; ///< All suites (including `else`, `except`, ...) in order.
};

/// Any other simple statement (expression, import, return, ...).
struct SimpleStmt {};

/// A statement node.
struct Stmt {
    std::variant<FuncDef, ClassDef, AssignStmt, CompoundStmt, SimpleStmt> kind;
    SourceSpan span;

    /// Checks if this statement is of kind `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this statement as kind `T`. Throws if not that kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    /// Gets this statement as kind `T` (const). Throws if not that kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }
};

// ============================================================================
// Module
// ============================================================================

/// A parsed source file.
struct Module {
    std::string name;          ///< Display name (usually the file path).
    std::vector<StmtPtr> body; ///< Top-level statements in source order.
};

} // namespace pystruct::parser

#endif // PYSTRUCT_PARSER_AST_HPP
