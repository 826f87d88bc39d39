//! # Python Lexer
//!
//! This module implements the tokenizer for Python 3 source text. It turns a
//! `Source` into the token stream consumed by the structural parser.
//!
//! ## Features
//!
//! - **Indentation tracking**: Emits `Indent`/`Dedent` from a column stack
//!   (tabs advance to the next multiple of 8, as in CPython)
//! - **Implicit line joining**: No `Newline` inside `()`, `[]` or `{}`
//! - **Explicit line joining**: A trailing backslash continues the line
//! - **All string forms**: Single, double and triple quotes with any valid
//!   prefix (`r`, `b`, `u`, `f`, `rb`, `fr`, ... in any case)
//! - **Error collection**: Errors are recorded and lexing continues, so a
//!   caller sees the first error with its exact location
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("def f(x):\n    return x\n");
//! Lexer lexer(source);
//! auto tokens = lexer.tokenize();
//! // def f ( x ) : NEWLINE INDENT return x NEWLINE DEDENT EOF
//! ```

#ifndef PYSTRUCT_LEXER_LEXER_HPP
#define PYSTRUCT_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace pystruct::lexer {

/// An error encountered during lexing.
struct LexerError {
    std::string message; ///< Human-readable error description.
    SourceSpan span;     ///< Location of the error in source.
};

/// Tokenizer for one Python source file.
///
/// The lexer is single-use: construct it, call `tokenize()` (or
/// `next_token()` until `Eof`), then inspect `errors()`.
class Lexer {
public:
    /// Indentation levels a file may open, as in CPython ("too many levels
    /// of indentation"). Suites are parsed recursively, so this also bounds
    /// parser stack depth.
    static constexpr size_t MAX_INDENT_LEVELS = 100;

    /// Unclosed brackets allowed at once ("too many nested parentheses").
    static constexpr size_t MAX_BRACKET_DEPTH = 200;

    /// Constructs a lexer for the given source.
    ///
    /// The source must outlive the lexer and every token it produces.
    explicit Lexer(const Source& source);

    /// Returns the next token from the source.
    ///
    /// Returns `TokenKind::Eof` (repeatedly) once the input is exhausted.
    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the entire source. The result always ends with `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    // ========================================================================
    // State
    // ========================================================================

    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexerError> errors_;

    std::vector<uint32_t> indent_stack_{0}; ///< Open indentation columns.
    int pending_dedents_ = 0;               ///< Dedents still to emit.
    bool at_line_start_ = true;             ///< Next token starts a logical line.
    bool line_has_tokens_ = false;          ///< Current logical line emitted a token.
    bool finished_ = false;                 ///< EOF layout tokens were emitted.

    struct OpenBracket {
        char ch;
        size_t offset;
    };
    std::vector<OpenBracket> brackets_; ///< Unclosed `(`, `[`, `{`.

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;
    [[nodiscard]] auto make_layout_token(TokenKind kind) -> Token;
    [[nodiscard]] auto make_error_token(const std::string& message) -> Token;
    void report_error(const std::string& message, size_t offset);

    // ========================================================================
    // Layout
    // ========================================================================

    /// Measures the indentation of the next non-blank line and returns the
    /// `Indent`/`Dedent`/`Error` token it implies, if any.
    [[nodiscard]] auto lex_line_start(Token& out) -> bool;

    /// Skips spaces, comments and line continuations (and, inside
    /// brackets, line breaks). Returns false on a stray backslash.
    auto skip_whitespace() -> bool;

    /// Emits the trailing `Newline`, closing `Dedent`s and `Eof`.
    [[nodiscard]] auto lex_eof() -> Token;

    /// Consumes one line terminator (`\n`, `\r\n` or `\r`).
    void consume_line_break();

    // ========================================================================
    // Token Lexers
    // ========================================================================

    /// Length of a string prefix (`rb`, `f`, ...) directly followed by a
    /// quote at the current position, or 0.
    [[nodiscard]] auto string_prefix_length() const -> size_t;

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_string(size_t prefix_len) -> Token;
    [[nodiscard]] auto lex_operator() -> Token;
};

/// Returns the keyword table (identifier text to keyword kind).
auto get_keywords() -> const std::unordered_map<std::string_view, TokenKind>&;

/// True if `c` can start an identifier. Bytes >= 0x80 are accepted so that
/// UTF-8 identifiers lex as one name.
[[nodiscard]] inline auto is_ident_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || u == '_' || u >= 0x80;
}

[[nodiscard]] inline auto is_ident_continue(char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

} // namespace pystruct::lexer

#endif // PYSTRUCT_LEXER_LEXER_HPP
