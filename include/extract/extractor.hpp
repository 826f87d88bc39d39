//! # Syntax Extractor
//!
//! Maps one parsed file to a `model::Module`:
//!
//! | Syntax (outermost scope only) | Entity |
//! |-------------------------------|--------|
//! | `def` / `async def` | `Function` |
//! | `class` | `Class` |
//! | `def` directly in a class body | `Method` |
//! | `name = ...` / `name: T [= ...]` in a class body | `Field` |
//! | positional class argument | superclass |
//!
//! Definitions nested anywhere else (inside functions, methods, `if`
//! blocks, nested classes) are parsed for validity but not surfaced.

#ifndef PYSTRUCT_EXTRACT_EXTRACTOR_HPP
#define PYSTRUCT_EXTRACT_EXTRACTOR_HPP

#include "common.hpp"
#include "extract/failure.hpp"
#include "lexer/source.hpp"
#include "model/entities.hpp"
#include "parser/ast.hpp"

#include <string>

namespace pystruct::extract {

/// Parses `source` and extracts its module. A parse error becomes a
/// `Syntax` failure carrying the diagnostic and its position.
[[nodiscard]] auto extract_module(const lexer::Source& source, const std::string& relative_path)
    -> Result<model::Module, ExtractionFailure>;

/// Extracts a module from an already parsed tree.
[[nodiscard]] auto module_from_ast(const parser::Module& ast, const std::string& relative_path)
    -> model::Module;

/// Returns the module name for a relative path: its file stem.
[[nodiscard]] auto module_name_for(const std::string& relative_path) -> std::string;

} // namespace pystruct::extract

#endif // PYSTRUCT_EXTRACT_EXTRACTOR_HPP
