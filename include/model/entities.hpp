//! # Entity Model
//!
//! The immutable entity tree produced by extraction:
//!
//! ```text
//! Repository
//! └── Module (one per file)
//!     ├── Function ── Parameter*
//!     └── Class
//!         ├── Method ── Parameter*
//!         └── Field*
//! ```
//!
//! ## Sharing
//!
//! Children are held as `Rc<const T>`. A filtered tree is a new root that
//! shares every untouched subtree with its input, so trees are never edited
//! in place and comparing a tree before and after filtering is cheap.
//!
//! ## Signatures
//!
//! `Callable::signature` and `Callable::full_signature` are derived values.
//! Build callables with `make_callable()` (see `model/signature.hpp`), which
//! computes both from the other fields.

#ifndef PYSTRUCT_MODEL_ENTITIES_HPP
#define PYSTRUCT_MODEL_ENTITIES_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pystruct::model {

// ============================================================================
// Parameters
// ============================================================================

/// Position class of a parameter.
enum class ParameterKind {
    PositionalOnly,
    Regular,
    VarArgs,     ///< `*args`
    KeywordOnly,
    VarKeywords, ///< `**kwargs`
};

/// Returns the schema name of a kind (e.g., "var_args").
[[nodiscard]] auto parameter_kind_name(ParameterKind kind) -> std::string_view;

/// Parses a schema name produced by `parameter_kind_name()`.
[[nodiscard]] auto parse_parameter_kind(std::string_view name) -> std::optional<ParameterKind>;

/// A declared parameter.
struct Parameter {
    std::string name;
    std::optional<std::string> type; ///< Annotation text, absent when undeclared.
    uint32_t line_number = 0;        ///< 1-based line of the name.
    uint32_t col_offset = 0;         ///< 1-based column of the name.
    ParameterKind kind = ParameterKind::Regular;

    [[nodiscard]] auto operator==(const Parameter& other) const -> bool = default;
};

// ============================================================================
// Callables
// ============================================================================

/// The fields shared by functions and methods.
struct Callable {
    std::string name;
    std::vector<Parameter> parameters;
    std::string annotations;                ///< Decorator lines, verbatim, `\n`-joined.
    std::optional<std::string> return_type; ///< Normalized return annotation.
    std::string body;                       ///< Verbatim body text.
    std::string signature;                  ///< Derived, see make_callable().
    std::string full_signature;             ///< Derived, see make_callable().
    uint32_t line_number = 0;               ///< 1-based line of the name.
    uint32_t col_offset = 0;                ///< 1-based column of the name.

    /// True if the parameters or the return carry at least one declared type.
    [[nodiscard]] auto has_type_annotation() const -> bool;

    [[nodiscard]] auto operator==(const Callable& other) const -> bool = default;
};

/// A module-level function.
struct Function {
    Callable callable;
    std::string file; ///< Relative path of the defining module.

    [[nodiscard]] auto operator==(const Function& other) const -> bool = default;
};

/// A method defined directly in a class body.
struct Method {
    Callable callable;
    bool is_constructor = false; ///< Named `__init__`.

    [[nodiscard]] auto operator==(const Method& other) const -> bool = default;
};

// ============================================================================
// Classes and Modules
// ============================================================================

/// A class-level assignment target: `x = 0`, `x: int`, `x: int = 0`.
struct Field {
    std::string name;
    std::optional<std::string> type;

    [[nodiscard]] auto operator==(const Field& other) const -> bool = default;
};

/// A module-level class.
struct Class {
    std::string name;
    std::vector<Rc<const Method>> methods;
    std::vector<std::string> superclasses; ///< As written, unresolved.
    std::vector<Field> fields;
    std::string file; ///< Relative path of the defining module.
};

/// One source file.
struct Module {
    std::string name;      ///< File stem.
    std::string file_path; ///< Path relative to the repository root, `/`-separated.
    std::vector<Rc<const Function>> functions;
    std::vector<Rc<const Class>> classes;

    [[nodiscard]] auto is_empty() const -> bool {
        return functions.empty() && classes.empty();
    }
};

/// The declared identity of an analyzed repository.
struct RepositoryIdentity {
    std::string name;
    std::string url;
    std::string pypi_tag;
    std::string git_commit_hash;

    [[nodiscard]] auto operator==(const RepositoryIdentity& other) const -> bool = default;
};

/// An analyzed repository.
struct Repository {
    RepositoryIdentity identity;
    std::vector<Rc<const Module>> modules;
};

/// A dataset: the repositories of one output file, in order.
using Dataset = std::vector<Rc<const Repository>>;

// Deep, value-based equality (pointees are compared, not pointers).
[[nodiscard]] auto operator==(const Class& a, const Class& b) -> bool;
[[nodiscard]] auto operator==(const Module& a, const Module& b) -> bool;
[[nodiscard]] auto operator==(const Repository& a, const Repository& b) -> bool;
[[nodiscard]] auto datasets_equal(const Dataset& a, const Dataset& b) -> bool;

} // namespace pystruct::model

#endif // PYSTRUCT_MODEL_ENTITIES_HPP
