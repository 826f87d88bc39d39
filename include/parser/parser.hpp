//! # Structural Parser
//!
//! Recursive-descent parser that turns the Python token stream into the
//! structural tree of `ast.hpp`. It validates the statement-level grammar
//! (layout, suites, definition headers, parameter lists) and skips over
//! expressions by bracket depth, which is all the extractor needs.
//!
//! Parsing stops at the first error: a file either parses completely or
//! yields one `ParseError` with the location of the problem.

#ifndef PYSTRUCT_PARSER_PARSER_HPP
#define PYSTRUCT_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "parser/ast.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace pystruct::parser {

// Parser error
struct ParseError {
    std::string message;
    SourceSpan span;
};

// Parser for one Python source file
class Parser {
public:
    /// `tokens` must come from lexing `source`; the source is used to slice
    /// verbatim body and decorator text.
    Parser(const lexer::Source& source, std::vector<lexer::Token> tokens);

    // Parse entire module
    [[nodiscard]] auto parse_module(const std::string& name) -> Result<Module, ParseError>;

private:
    /// A half-open range of token indices.
    struct TokenRange {
        size_t begin;
        size_t end;

        [[nodiscard]] auto empty() const -> bool {
            return begin == end;
        }
    };

    /// A parsed suite and its verbatim text.
    struct Suite {
        std::vector<StmtPtr> stmts;
        std::string text;
    };

    const lexer::Source& source_;
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    size_t last_end_offset_ = 0; ///< End offset of the last consumed non-layout token.

    // Token access
    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto peek_next() const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    [[nodiscard]] auto check_next(lexer::TokenKind kind) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    auto expect(lexer::TokenKind kind, const std::string& message)
        -> Result<lexer::Token, ParseError>;

    // Error construction
    [[nodiscard]] auto error_here(const std::string& message) const -> ParseError;
    [[nodiscard]] auto error_at(const lexer::Token& token, const std::string& message) const
        -> ParseError;

    // Expression skipping
    /// Consumes tokens up to (not including) the first depth-0 token whose
    /// kind is in `stops`, or the end of the logical line. Commas, `=` and
    /// `:` that belong to a lambda are never stops.
    auto scan_expression(std::initializer_list<lexer::TokenKind> stops) -> TokenRange;
    /// Consumes a bracketed group starting at the current opening bracket.
    void skip_group();
    [[nodiscard]] auto render(TokenRange range) const -> std::string;
    [[nodiscard]] auto span_from(const lexer::Token& start) const -> SourceSpan;
    [[nodiscard]] auto find_error_token(TokenRange range) const -> const lexer::Token*;

    // Statements
    auto parse_statement() -> Result<std::vector<StmtPtr>, ParseError>;
    auto parse_simple_line() -> Result<std::vector<StmtPtr>, ParseError>;
    auto parse_simple_stmt(TokenRange range) -> Result<StmtPtr, ParseError>;
    auto parse_compound() -> Result<StmtPtr, ParseError>;
    auto parse_suite() -> Result<Suite, ParseError>;
    [[nodiscard]] auto is_soft_compound_header() const -> bool;

    // Definitions
    auto parse_decorated() -> Result<StmtPtr, ParseError>;
    auto parse_func_def(std::vector<Decorator> decorators) -> Result<StmtPtr, ParseError>;
    auto parse_class_def(std::vector<Decorator> decorators) -> Result<StmtPtr, ParseError>;
    auto parse_params() -> Result<std::vector<Param>, ParseError>;
    /// Parses the optional `: annotation` and `= default` after a parameter name.
    auto parse_param_tail(Param& param, bool allow_default) -> Result<bool, ParseError>;
    auto parse_class_args(ClassDef& cls) -> Result<bool, ParseError>;
};

/// Lexes and parses `source`. The first lexer error, if any, is reported as
/// the parse error.
[[nodiscard]] auto parse_source(const lexer::Source& source) -> Result<Module, ParseError>;

} // namespace pystruct::parser

#endif // PYSTRUCT_PARSER_PARSER_HPP
