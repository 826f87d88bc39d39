//! # Token Definitions
//!
//! This module defines the token types produced by the Python lexer.
//!
//! ## Overview
//!
//! Tokens are categorized into:
//!
//! - **Layout**: `Newline`, `Indent`, `Dedent` derived from line structure
//! - **Literals**: Numbers and strings (all prefixes, triple-quoted included)
//! - **Keywords**: The hard keywords of Python 3; soft keywords (`match`,
//!   `case`, `type`, `_`) are identifiers
//! - **Delimiters and operators**: The punctuation the structural parser
//!   needs by name; every other operator is a generic `Operator`
//!
//! ## Layout Tokens
//!
//! Like CPython's tokenizer, a `Newline` ends each logical line, `Indent`
//! opens a deeper block and one `Dedent` closes each level. Line breaks
//! inside brackets, after a backslash continuation, and on blank or
//! comment-only lines produce no tokens.

#ifndef PYSTRUCT_LEXER_TOKEN_HPP
#define PYSTRUCT_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace pystruct::lexer {

/// All token kinds of the Python lexer.
enum class TokenKind : uint8_t {
    // ========================================================================
    // Layout
    // ========================================================================
    Eof,     ///< End of input stream
    Newline, ///< End of a logical line
    Indent,  ///< Start of a more deeply indented block
    Dedent,  ///< End of an indented block

    // ========================================================================
    // Literals and Names
    // ========================================================================
    Identifier, ///< `foo`, `_bar`, `naïve`
    Number,     ///< `42`, `0xFF`, `1_000`, `3.14`, `1e-3`, `2j`
    String,     ///< `"a"`, `'b'`, `"""doc"""`, `rb'\x00'`, `f"{x}"`

    // ========================================================================
    // Keywords
    // ========================================================================
    KwFalse,
    KwNone,
    KwTrue,
    KwAnd,
    KwAs,
    KwAssert,
    KwAsync,
    KwAwait,
    KwBreak,
    KwClass,
    KwContinue,
    KwDef,
    KwDel,
    KwElif,
    KwElse,
    KwExcept,
    KwFinally,
    KwFor,
    KwFrom,
    KwGlobal,
    KwIf,
    KwImport,
    KwIn,
    KwIs,
    KwLambda,
    KwNonlocal,
    KwNot,
    KwOr,
    KwPass,
    KwRaise,
    KwReturn,
    KwTry,
    KwWhile,
    KwWith,
    KwYield,

    // ========================================================================
    // Delimiters
    // ========================================================================
    LParen,      ///< `(`
    RParen,      ///< `)`
    LBracket,    ///< `[`
    RBracket,    ///< `]`
    LBrace,      ///< `{`
    RBrace,      ///< `}`
    Colon,       ///< `:`
    Comma,       ///< `,`
    Semi,        ///< `;`
    Dot,         ///< `.`
    Ellipsis,    ///< `...`
    Arrow,       ///< `->`
    At,          ///< `@`
    Assign,      ///< `=`
    ColonAssign, ///< `:=`
    Star,        ///< `*`
    DoubleStar,  ///< `**`
    Slash,       ///< `/`
    Pipe,        ///< `|`

    // ========================================================================
    // Other Operators
    // ========================================================================
    AugAssign, ///< `+=`, `-=`, `*=`, `@=`, `//=`, `**=`, `>>=`, ...
    Operator,  ///< `+`, `-`, `%`, `//`, `==`, `!=`, `<`, `<=`, `~`, `^`, `&`, `<<`, ...

    Error, ///< Lexer error (see Lexer::errors())
};

/// A token with its source position and raw text.
///
/// `lexeme` is a view into the Source the token was lexed from; layout
/// tokens have an empty lexeme.
struct Token {
    TokenKind kind;
    SourceSpan span;
    std::string_view lexeme;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    [[nodiscard]] auto is_error() const -> bool {
        return kind == TokenKind::Error;
    }

    /// Returns true for `KwFalse` through `KwYield`.
    [[nodiscard]] auto is_keyword() const -> bool {
        return kind >= TokenKind::KwFalse && kind <= TokenKind::KwYield;
    }

    /// Returns true for tokens that read as words (names, keywords, numbers,
    /// strings). Two adjacent word tokens need a space between them when
    /// the token stream is rendered back to text.
    [[nodiscard]] auto is_word() const -> bool {
        return kind == TokenKind::Identifier || kind == TokenKind::Number ||
               kind == TokenKind::String || is_keyword();
    }
};

/// Returns a display name for a token kind (e.g., "identifier", "'def'").
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

} // namespace pystruct::lexer

#endif // PYSTRUCT_LEXER_TOKEN_HPP
