//! # Statement Parsing
//!
//! Logical lines become statements:
//!
//! | Line | Node |
//! |------|------|
//! | `def ...:` / `async def ...:` | `FuncDef` (see parser_decl.cpp) |
//! | `class ...:` | `ClassDef` |
//! | `@decorator` | decorates the next `FuncDef` / `ClassDef` |
//! | `if`/`while`/`for`/`try`/`with`/`match`/`case` | `CompoundStmt` |
//! | `name = ...`, `name: T = ...` | `AssignStmt` |
//! | anything else | `SimpleStmt` |
//!
//! A simple line may hold several statements separated by `;`. A suite is
//! either an indented block or simple statements after the header's colon.

#include "parser/parser.hpp"

#include <algorithm>

namespace pystruct::parser {

using lexer::Token;
using lexer::TokenKind;

namespace {

auto single(Result<StmtPtr, ParseError> result) -> Result<std::vector<StmtPtr>, ParseError> {
    if (is_err(result)) {
        return unwrap_err(result);
    }
    std::vector<StmtPtr> stmts;
    stmts.push_back(std::move(unwrap(result)));
    return stmts;
}

auto is_compound_keyword(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::KwIf:
    case TokenKind::KwWhile:
    case TokenKind::KwFor:
    case TokenKind::KwTry:
    case TokenKind::KwWith:
    case TokenKind::KwDef:
    case TokenKind::KwClass:
    case TokenKind::KwAsync:
    case TokenKind::At:
        return true;
    default:
        return false;
    }
}

/// Keywords that can never appear inside a simple statement.
auto is_block_only_keyword(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::KwDef:
    case TokenKind::KwClass:
    case TokenKind::KwElif:
    case TokenKind::KwExcept:
    case TokenKind::KwFinally:
    case TokenKind::KwWhile:
    case TokenKind::KwTry:
    case TokenKind::KwWith:
        return true;
    default:
        return false;
    }
}

/// Indices of depth-0 tokens of `kind` in `[begin, end)`, ignoring those
/// that belong to a lambda's parameter list.
auto top_level_positions(const std::vector<Token>& tokens, size_t begin, size_t end,
                         TokenKind kind) -> std::vector<size_t> {
    std::vector<size_t> positions;
    int depth = 0;
    int open_lambdas = 0;
    for (size_t i = begin; i < end; ++i) {
        const auto& token = tokens[i];
        if (token.is_one_of({TokenKind::LParen, TokenKind::LBracket, TokenKind::LBrace})) {
            ++depth;
        } else if (token.is_one_of({TokenKind::RParen, TokenKind::RBracket, TokenKind::RBrace})) {
            --depth;
        } else if (depth == 0) {
            if (token.is(TokenKind::KwLambda)) {
                ++open_lambdas;
            } else if (token.is(TokenKind::Colon) && open_lambdas > 0) {
                --open_lambdas;
            } else if (token.is(kind) && open_lambdas == 0) {
                positions.push_back(i);
            }
        }
    }
    return positions;
}

} // namespace

// ============================================================================
// Dispatch
// ============================================================================

auto Parser::parse_statement() -> Result<std::vector<StmtPtr>, ParseError> {
    const auto& token = peek();

    switch (token.kind) {
    case TokenKind::Indent:
        return error_here("unexpected indent");
    case TokenKind::Dedent:
        return error_here("unexpected unindent");
    case TokenKind::Error:
        return error_here("invalid syntax");
    case TokenKind::At:
        return single(parse_decorated());
    case TokenKind::KwDef:
        return single(parse_func_def({}));
    case TokenKind::KwClass:
        return single(parse_class_def({}));
    case TokenKind::KwAsync:
        if (check_next(TokenKind::KwDef)) {
            return single(parse_func_def({}));
        }
        if (check_next(TokenKind::KwFor) || check_next(TokenKind::KwWith)) {
            return single(parse_compound());
        }
        return error_here("invalid syntax");
    case TokenKind::KwIf:
    case TokenKind::KwWhile:
    case TokenKind::KwFor:
    case TokenKind::KwTry:
    case TokenKind::KwWith:
        return single(parse_compound());
    case TokenKind::KwElif:
    case TokenKind::KwElse:
    case TokenKind::KwExcept:
    case TokenKind::KwFinally:
        return error_here("invalid syntax: '" + std::string(token.lexeme) +
                          "' without a matching block");
    case TokenKind::Identifier:
        if (is_soft_compound_header()) {
            return single(parse_compound());
        }
        return parse_simple_line();
    default:
        return parse_simple_line();
    }
}

auto Parser::is_soft_compound_header() const -> bool {
    const auto& token = peek();
    if (token.lexeme != "match" && token.lexeme != "case") {
        return false;
    }
    if (peek_next().is_one_of({TokenKind::Colon, TokenKind::Assign, TokenKind::AugAssign,
                               TokenKind::Dot, TokenKind::Comma, TokenKind::Semi,
                               TokenKind::Newline, TokenKind::Eof})) {
        return false;
    }

    size_t end = pos_ + 1;
    while (end < tokens_.size() &&
           !tokens_[end].is_one_of({TokenKind::Newline, TokenKind::Eof})) {
        ++end;
    }
    return !top_level_positions(tokens_, pos_ + 1, end, TokenKind::Colon).empty();
}

// ============================================================================
// Simple Statements
// ============================================================================

auto Parser::parse_simple_line() -> Result<std::vector<StmtPtr>, ParseError> {
    std::vector<StmtPtr> stmts;

    while (true) {
        auto range = scan_expression({TokenKind::Semi});
        if (range.empty()) {
            return error_here("invalid syntax");
        }
        auto stmt = parse_simple_stmt(range);
        if (is_err(stmt)) {
            return unwrap_err(stmt);
        }
        stmts.push_back(std::move(unwrap(stmt)));

        if (!match(TokenKind::Semi)) {
            break;
        }
        if (check(TokenKind::Newline) || is_at_end()) {
            break;
        }
    }

    if (!match(TokenKind::Newline) && !is_at_end()) {
        return error_here("invalid syntax");
    }
    return stmts;
}

auto Parser::parse_simple_stmt(TokenRange range) -> Result<StmtPtr, ParseError> {
    if (const auto* bad = find_error_token(range)) {
        return error_at(*bad, "invalid syntax");
    }
    for (size_t i = range.begin; i < range.end; ++i) {
        if (is_block_only_keyword(tokens_[i].kind)) {
            return error_at(tokens_[i], "invalid syntax");
        }
    }

    const auto& first = tokens_[range.begin];
    SourceSpan span{.start = first.span.start, .end = tokens_[range.end - 1].span.end};
    auto make_stmt = [&](auto kind) {
        return make_box<Stmt>(Stmt{.kind = std::move(kind), .span = span});
    };

    if (first.is_keyword()) {
        return make_stmt(SimpleStmt{});
    }

    // name: annotation [= value]
    if (range.end - range.begin >= 2 && first.is(TokenKind::Identifier) &&
        tokens_[range.begin + 1].is(TokenKind::Colon)) {
        auto assigns = top_level_positions(tokens_, range.begin + 2, range.end, TokenKind::Assign);
        size_t annotation_end = assigns.empty() ? range.end : assigns.front();
        if (annotation_end == range.begin + 2) {
            return error_at(tokens_[range.begin + 1], "expected annotation after ':'");
        }
        if (!assigns.empty() && assigns.front() + 1 == range.end) {
            return error_at(tokens_[assigns.front()], "expected value after '='");
        }
        return make_stmt(AssignStmt{
            .targets = {std::string(first.lexeme)},
            .annotation = render(TokenRange{.begin = range.begin + 2, .end = annotation_end}),
            .has_value = !assigns.empty(),
        });
    }

    auto assigns = top_level_positions(tokens_, range.begin, range.end, TokenKind::Assign);
    if (assigns.empty()) {
        return make_stmt(SimpleStmt{});
    }

    std::vector<std::string> targets;
    size_t segment_begin = range.begin;
    for (size_t assign : assigns) {
        if (assign == segment_begin) {
            return error_at(tokens_[assign], "invalid syntax");
        }
        if (assign == segment_begin + 1 && tokens_[segment_begin].is(TokenKind::Identifier)) {
            targets.emplace_back(tokens_[segment_begin].lexeme);
        }
        segment_begin = assign + 1;
    }
    if (segment_begin == range.end) {
        return error_at(tokens_[assigns.back()], "expected value after '='");
    }

    if (targets.empty()) {
        return make_stmt(SimpleStmt{});
    }
    return make_stmt(
        AssignStmt{.targets = std::move(targets), .annotation = {}, .has_value = true});
}

// ============================================================================
// Compound Statements
// ============================================================================

auto Parser::parse_compound() -> Result<StmtPtr, ParseError> {
    Token start = peek();

    std::string keyword;
    if (match(TokenKind::KwAsync)) {
        keyword = "async ";
    }
    Token head = advance();
    keyword += std::string(head.lexeme);

    CompoundStmt stmt{.keyword = keyword, .body = {}};

    // Parses `<header> : <suite>` after the introducing keyword.
    auto parse_clause = [&](const Token& clause) -> std::optional<ParseError> {
        bool needs_expression = !clause.is_one_of(
            {TokenKind::KwTry, TokenKind::KwElse, TokenKind::KwFinally, TokenKind::KwExcept});
        bool allows_expression =
            !clause.is_one_of({TokenKind::KwTry, TokenKind::KwElse, TokenKind::KwFinally});

        auto header = scan_expression({TokenKind::Colon});
        if (const auto* bad = find_error_token(header)) {
            return error_at(*bad, "invalid syntax");
        }
        if (header.empty() && needs_expression) {
            return error_here("invalid syntax");
        }
        if (!header.empty() && !allows_expression) {
            return error_at(tokens_[header.begin], "expected ':'");
        }

        auto colon = expect(TokenKind::Colon, "expected ':'");
        if (is_err(colon)) {
            return unwrap_err(colon);
        }

        auto suite = parse_suite();
        if (is_err(suite)) {
            return unwrap_err(suite);
        }
        for (auto& child : unwrap(suite).stmts) {
            stmt.body.push_back(std::move(child));
        }
        return std::nullopt;
    };

    if (auto error = parse_clause(head)) {
        return *error;
    }

    bool has_handler = false;
    while (true) {
        const auto& next = peek();
        bool continues = false;
        if (head.is(TokenKind::KwIf)) {
            continues = next.is_one_of({TokenKind::KwElif, TokenKind::KwElse});
        } else if (head.is_one_of({TokenKind::KwFor, TokenKind::KwWhile})) {
            continues = next.is(TokenKind::KwElse);
        } else if (head.is(TokenKind::KwTry)) {
            continues = next.is_one_of(
                {TokenKind::KwExcept, TokenKind::KwElse, TokenKind::KwFinally});
        }
        if (!continues) {
            break;
        }

        Token clause = advance();
        if (clause.is_one_of({TokenKind::KwExcept, TokenKind::KwFinally})) {
            has_handler = true;
        }
        if (auto error = parse_clause(clause)) {
            return *error;
        }
        if (clause.is(TokenKind::KwFinally) ||
            (clause.is(TokenKind::KwElse) && !head.is(TokenKind::KwTry))) {
            break;
        }
    }

    if (head.is(TokenKind::KwTry) && !has_handler) {
        return error_here("expected 'except' or 'finally' block");
    }

    return make_box<Stmt>(Stmt{.kind = std::move(stmt), .span = span_from(start)});
}

auto Parser::parse_suite() -> Result<Suite, ParseError> {
    Suite suite;

    if (match(TokenKind::Newline)) {
        if (!check(TokenKind::Indent)) {
            return error_here("expected an indented block");
        }
        advance();

        size_t text_start = source_.line_start(peek().span.start.line);
        while (!check(TokenKind::Dedent) && !is_at_end()) {
            auto stmts = parse_statement();
            if (is_err(stmts)) {
                return unwrap_err(stmts);
            }
            for (auto& stmt : unwrap(stmts)) {
                suite.stmts.push_back(std::move(stmt));
            }
        }
        match(TokenKind::Dedent);

        suite.text = std::string(source_.slice(text_start, last_end_offset_));
        return suite;
    }

    if (is_at_end()) {
        return error_here("expected an indented block");
    }
    if (is_compound_keyword(peek().kind) || check(TokenKind::Indent)) {
        return error_here("invalid syntax");
    }

    size_t text_start = peek().span.start.offset;
    auto stmts = parse_simple_line();
    if (is_err(stmts)) {
        return unwrap_err(stmts);
    }
    suite.stmts = std::move(unwrap(stmts));
    suite.text = std::string(source_.slice(text_start, last_end_offset_));
    return suite;
}

} // namespace pystruct::parser
