//! # Parser Core
//!
//! This file implements the core parser infrastructure.
//!
//! ## Token Navigation
//!
//! | Method        | Description                        |
//! |---------------|------------------------------------|
//! | `peek()`      | Look at current token              |
//! | `peek_next()` | Look at next token                 |
//! | `advance()`   | Consume and return current token   |
//! | `previous()`  | Get last consumed token            |
//! | `match()`     | Consume token if it matches        |
//! | `check()`     | Check current token without consuming |
//! | `expect()`    | Require specific token or error    |
//!
//! ## Expression Skipping
//!
//! Expressions are consumed by bracket depth with `scan_expression()`; the
//! resulting token range is rendered to normalized text on demand.

#include "parser/expr_text.hpp"
#include "parser/parser.hpp"

#include <algorithm>

namespace pystruct::parser {

using lexer::Token;
using lexer::TokenKind;

namespace {

auto is_layout(const Token& token) -> bool {
    return token.is_one_of(
        {TokenKind::Newline, TokenKind::Indent, TokenKind::Dedent, TokenKind::Eof});
}

} // namespace

Parser::Parser(const lexer::Source& source, std::vector<lexer::Token> tokens)
    : source_(source), tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        auto loc = source_.location(source_.length());
        tokens_.push_back(Token{.kind = TokenKind::Eof, .span = {loc, loc}, .lexeme = {}});
    }
}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek() const -> const Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back(); // Eof
    }
    return tokens_[pos_];
}

auto Parser::peek_next() const -> const Token& {
    if (pos_ + 1 >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_ + 1];
}

auto Parser::previous() const -> const Token& {
    if (pos_ == 0) {
        return tokens_[0];
    }
    return tokens_[pos_ - 1];
}

auto Parser::advance() -> const Token& {
    if (!is_at_end()) {
        const auto& token = tokens_[pos_];
        if (!is_layout(token)) {
            last_end_offset_ = token.span.start.offset + token.span.start.length;
        }
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::check_next(TokenKind kind) const -> bool {
    return peek_next().kind == kind;
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(TokenKind kind, const std::string& message) -> Result<Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    return ParseError{.message = message + ", found " +
                                 std::string(lexer::token_kind_to_string(peek().kind)),
                      .span = peek().span};
}

// ============================================================================
// Errors
// ============================================================================

auto Parser::error_here(const std::string& message) const -> ParseError {
    return error_at(peek(), message);
}

auto Parser::error_at(const Token& token, const std::string& message) const -> ParseError {
    return ParseError{.message = message, .span = token.span};
}

auto Parser::find_error_token(TokenRange range) const -> const Token* {
    for (size_t i = range.begin; i < range.end; ++i) {
        if (tokens_[i].is_error()) {
            return &tokens_[i];
        }
    }
    return nullptr;
}

// ============================================================================
// Expression Skipping
// ============================================================================

auto Parser::scan_expression(std::initializer_list<TokenKind> stops) -> TokenRange {
    size_t begin = pos_;
    int depth = 0;
    int open_lambdas = 0;

    while (!is_at_end()) {
        const auto& token = peek();
        if (depth == 0) {
            if (token.is_one_of({TokenKind::Newline, TokenKind::Indent, TokenKind::Dedent})) {
                break;
            }
            if (open_lambdas > 0 && token.is(TokenKind::Colon)) {
                --open_lambdas;
                advance();
                continue;
            }
            bool stop = std::find(stops.begin(), stops.end(), token.kind) != stops.end();
            bool lambda_owned = open_lambdas > 0 && token.is_one_of({TokenKind::Comma,
                                                                     TokenKind::Assign});
            if (stop && !lambda_owned) {
                break;
            }
            if (token.is(TokenKind::KwLambda)) {
                ++open_lambdas;
            }
        }

        if (token.is_one_of({TokenKind::LParen, TokenKind::LBracket, TokenKind::LBrace})) {
            ++depth;
        } else if (token.is_one_of({TokenKind::RParen, TokenKind::RBracket, TokenKind::RBrace})) {
            if (depth == 0) {
                break;
            }
            --depth;
        }
        advance();
    }

    return TokenRange{.begin = begin, .end = pos_};
}

void Parser::skip_group() {
    int depth = 0;
    while (!is_at_end()) {
        const auto& token = advance();
        if (token.is_one_of({TokenKind::LParen, TokenKind::LBracket, TokenKind::LBrace})) {
            ++depth;
        } else if (token.is_one_of({TokenKind::RParen, TokenKind::RBracket, TokenKind::RBrace})) {
            if (--depth <= 0) {
                return;
            }
        }
    }
}

auto Parser::render(TokenRange range) const -> std::string {
    return render_tokens(
        std::span<const Token>(tokens_.data() + range.begin, range.end - range.begin));
}

auto Parser::span_from(const Token& start) const -> SourceSpan {
    size_t end = last_end_offset_ > 0 ? last_end_offset_ - 1 : 0;
    return SourceSpan{.start = start.span.start, .end = source_.location(end)};
}

// ============================================================================
// Module
// ============================================================================

auto Parser::parse_module(const std::string& name) -> Result<Module, ParseError> {
    Module module{.name = name, .body = {}};

    while (!is_at_end()) {
        if (match(TokenKind::Newline)) {
            continue;
        }
        auto stmts = parse_statement();
        if (is_err(stmts)) {
            return unwrap_err(stmts);
        }
        for (auto& stmt : unwrap(stmts)) {
            module.body.push_back(std::move(stmt));
        }
    }

    return module;
}

auto parse_source(const lexer::Source& source) -> Result<Module, ParseError> {
    lexer::Lexer lex(source);
    auto tokens = lex.tokenize();
    if (lex.has_errors()) {
        const auto& error = lex.errors().front();
        return ParseError{.message = error.message, .span = error.span};
    }

    Parser parser(source, std::move(tokens));
    return parser.parse_module(std::string(source.filename()));
}

} // namespace pystruct::parser
