//! # Expression Text Rendering
//!
//! Renders a run of expression tokens back to source text with canonical
//! spacing. Annotations, return types, defaults and base classes are stored
//! in this form, so two annotations that differ only in layout compare equal:
//!
//! | Source | Rendered |
//! |--------|----------|
//! | `Dict[ str,int ]` | `Dict[str, int]` |
//! | `int|None` | `int \| None` |
//! | `Optional["Node"]` | `Optional['Node']` |
//! | `Callable[[int],\n    str]` | `Callable[[int], str]` |
//! | `Literal[-1]` | `Literal[-1]` |
//! | `(int)` | `int` |
//! | `-(a + b)`, `(a, b)` | unchanged |
//! | `r'raw'`, `u"raw"` | `'raw'` |
//!
//! Comments and line breaks never reach the token stream, so they never
//! affect the result.

#ifndef PYSTRUCT_PARSER_EXPR_TEXT_HPP
#define PYSTRUCT_PARSER_EXPR_TEXT_HPP

#include "lexer/token.hpp"

#include <span>
#include <string>
#include <string_view>

namespace pystruct::parser {

/// Renders `tokens` as normalized expression text.
[[nodiscard]] auto render_tokens(std::span<const lexer::Token> tokens) -> std::string;

/// Normalizes one string literal.
///
/// Raw and plain literals without escapes are rewritten the way Python's
/// repr() prints their value: single quotes unless the value holds a `'` and
/// no `"`, so `r"a\d"` becomes `'a\\d'` and `"it's"` stays as is. A `u`
/// prefix is dropped. Literals with escapes only swap `"` for `'` when the
/// contents hold neither quote. F-strings are returned as is.
[[nodiscard]] auto normalize_string_literal(std::string_view lexeme) -> std::string;

} // namespace pystruct::parser

#endif // PYSTRUCT_PARSER_EXPR_TEXT_HPP
