//! # Definition Parsing
//!
//! This file implements parsing of the definitions the extractor surfaces.
//!
//! ## Function Definitions
//!
//! ```python
//! @decorator
//! async def name[T](a, /, b: int = 0, *args: str, c, **kw) -> T:
//!     body
//! ```
//!
//! PEP 695 type parameter lists (`[T]`) are skipped. Parameter lists are
//! checked for the ordering rules of the grammar: one `/` before any `*`,
//! at most one `*`, named parameters after a bare `*`, nothing after
//! `**kwargs`, and no non-default positional parameter after a default.
//!
//! ## Class Definitions
//!
//! ```python
//! class Name(Base1, pkg.Base2, Generic[T], metaclass=ABCMeta):
//!     body
//! ```
//!
//! Positional arguments become `bases`; keyword arguments become `keywords`.
//! Unpacked arguments (`*bases`, `**kwds`) are not recorded.

#include "parser/parser.hpp"

namespace pystruct::parser {

using lexer::Token;
using lexer::TokenKind;

// ============================================================================
// Decorators
// ============================================================================

auto Parser::parse_decorated() -> Result<StmtPtr, ParseError> {
    std::vector<Decorator> decorators;

    while (check(TokenKind::At)) {
        Token at = advance();
        auto range = scan_expression({});
        if (range.empty()) {
            return error_here("expected decorator expression after '@'");
        }
        if (const auto* bad = find_error_token(range)) {
            return error_at(*bad, "invalid syntax");
        }
        decorators.push_back(Decorator{
            .text = std::string(source_.slice(at.span.start.offset, last_end_offset_)),
            .span = span_from(at),
        });
        if (!match(TokenKind::Newline)) {
            return error_here("expected newline after decorator");
        }
    }

    if (check(TokenKind::KwDef) || (check(TokenKind::KwAsync) && check_next(TokenKind::KwDef))) {
        return parse_func_def(std::move(decorators));
    }
    if (check(TokenKind::KwClass)) {
        return parse_class_def(std::move(decorators));
    }
    return error_here("expected 'def' or 'class' after decorator");
}

// ============================================================================
// Functions
// ============================================================================

auto Parser::parse_func_def(std::vector<Decorator> decorators) -> Result<StmtPtr, ParseError> {
    SourceLocation start = decorators.empty() ? peek().span.start : decorators.front().span.start;

    FuncDef func;
    func.decorators = std::move(decorators);
    func.is_async = match(TokenKind::KwAsync);

    auto def = expect(TokenKind::KwDef, "expected 'def'");
    if (is_err(def)) {
        return unwrap_err(def);
    }

    auto name = expect(TokenKind::Identifier, "expected function name after 'def'");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    func.name = std::string(unwrap(name).lexeme);
    func.name_location = unwrap(name).span.start;

    if (check(TokenKind::LBracket)) {
        skip_group();
    }

    auto lparen = expect(TokenKind::LParen, "expected '(' after function name");
    if (is_err(lparen)) {
        return unwrap_err(lparen);
    }

    auto params = parse_params();
    if (is_err(params)) {
        return unwrap_err(params);
    }
    func.params = std::move(unwrap(params));

    if (match(TokenKind::Arrow)) {
        auto range = scan_expression({TokenKind::Colon});
        if (range.empty()) {
            return error_here("expected return annotation after '->'");
        }
        if (const auto* bad = find_error_token(range)) {
            return error_at(*bad, "invalid syntax");
        }
        func.returns = render(range);
    }

    auto colon = expect(TokenKind::Colon, "expected ':' after function signature");
    if (is_err(colon)) {
        return unwrap_err(colon);
    }

    auto suite = parse_suite();
    if (is_err(suite)) {
        return unwrap_err(suite);
    }
    func.body = std::move(unwrap(suite).stmts);
    func.body_text = std::move(unwrap(suite).text);

    SourceSpan span{.start = start, .end = source_.location(last_end_offset_ - 1)};
    return make_box<Stmt>(Stmt{.kind = std::move(func), .span = span});
}

auto Parser::parse_params() -> Result<std::vector<Param>, ParseError> {
    std::vector<Param> params;
    bool seen_slash = false;
    bool seen_star = false;
    bool seen_default = false;
    bool seen_var_keywords = false;
    bool bare_star = false;

    while (!check(TokenKind::RParen)) {
        if (is_at_end() || check(TokenKind::Newline)) {
            return error_here("expected ')'");
        }
        if (seen_var_keywords) {
            return error_here("arguments cannot follow var-keyword argument");
        }

        Token token = peek();
        if (token.is(TokenKind::Slash)) {
            if (params.empty()) {
                return error_at(token, "at least one argument must precede /");
            }
            if (seen_slash) {
                return error_at(token, "/ may appear only once");
            }
            if (seen_star) {
                return error_at(token, "/ must be ahead of *");
            }
            for (auto& param : params) {
                param.kind = ParamKind::PositionalOnly;
            }
            seen_slash = true;
            advance();
        } else if (token.is(TokenKind::Star)) {
            if (seen_star) {
                return error_at(token, "* argument may appear only once");
            }
            seen_star = true;
            advance();
            if (check(TokenKind::Identifier)) {
                Token name = advance();
                Param param{.name = std::string(name.lexeme),
                            .kind = ParamKind::VarArgs,
                            .annotation = {},
                            .default_value = {},
                            .location = name.span.start};
                auto tail = parse_param_tail(param, false);
                if (is_err(tail)) {
                    return unwrap_err(tail);
                }
                params.push_back(std::move(param));
            } else {
                bare_star = true;
            }
        } else if (token.is(TokenKind::DoubleStar)) {
            advance();
            auto name = expect(TokenKind::Identifier, "expected parameter name after '**'");
            if (is_err(name)) {
                return unwrap_err(name);
            }
            Param param{.name = std::string(unwrap(name).lexeme),
                        .kind = ParamKind::VarKeywords,
                        .annotation = {},
                        .default_value = {},
                        .location = unwrap(name).span.start};
            auto tail = parse_param_tail(param, false);
            if (is_err(tail)) {
                return unwrap_err(tail);
            }
            params.push_back(std::move(param));
            seen_var_keywords = true;
        } else if (token.is(TokenKind::Identifier)) {
            advance();
            Param param{.name = std::string(token.lexeme),
                        .kind = seen_star ? ParamKind::KeywordOnly : ParamKind::Regular,
                        .annotation = {},
                        .default_value = {},
                        .location = token.span.start};
            auto tail = parse_param_tail(param, true);
            if (is_err(tail)) {
                return unwrap_err(tail);
            }
            if (!seen_star) {
                if (param.default_value) {
                    seen_default = true;
                } else if (seen_default) {
                    return error_at(token,
                                    "parameter without a default follows parameter with a default");
                }
            }
            bare_star = false;
            params.push_back(std::move(param));
        } else {
            return error_at(token, "expected parameter name");
        }

        if (!match(TokenKind::Comma) && !check(TokenKind::RParen)) {
            return error_here("expected ',' or ')' in parameter list");
        }
    }

    if (bare_star) {
        return error_here("named arguments must follow bare *");
    }
    advance(); // ')'
    return params;
}

auto Parser::parse_param_tail(Param& param, bool allow_default) -> Result<bool, ParseError> {
    if (match(TokenKind::Colon)) {
        auto range = scan_expression({TokenKind::Comma, TokenKind::Assign, TokenKind::RParen});
        if (range.empty()) {
            return error_here("expected annotation after ':'");
        }
        if (const auto* bad = find_error_token(range)) {
            return error_at(*bad, "invalid syntax");
        }
        param.annotation = render(range);
    }

    if (check(TokenKind::Assign)) {
        if (!allow_default) {
            return error_here(
                "var-positional and var-keyword arguments cannot have default values");
        }
        advance();
        auto range = scan_expression({TokenKind::Comma, TokenKind::RParen});
        if (range.empty()) {
            return error_here("expected default value after '='");
        }
        if (const auto* bad = find_error_token(range)) {
            return error_at(*bad, "invalid syntax");
        }
        param.default_value = render(range);
    }

    return true;
}

// ============================================================================
// Classes
// ============================================================================

auto Parser::parse_class_def(std::vector<Decorator> decorators) -> Result<StmtPtr, ParseError> {
    SourceLocation start = decorators.empty() ? peek().span.start : decorators.front().span.start;

    ClassDef cls;
    cls.decorators = std::move(decorators);

    auto kw = expect(TokenKind::KwClass, "expected 'class'");
    if (is_err(kw)) {
        return unwrap_err(kw);
    }

    auto name = expect(TokenKind::Identifier, "expected class name after 'class'");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    cls.name = std::string(unwrap(name).lexeme);
    cls.name_location = unwrap(name).span.start;

    if (check(TokenKind::LBracket)) {
        skip_group();
    }

    if (match(TokenKind::LParen)) {
        auto args = parse_class_args(cls);
        if (is_err(args)) {
            return unwrap_err(args);
        }
    }

    auto colon = expect(TokenKind::Colon, "expected ':' after class header");
    if (is_err(colon)) {
        return unwrap_err(colon);
    }

    auto suite = parse_suite();
    if (is_err(suite)) {
        return unwrap_err(suite);
    }
    cls.body = std::move(unwrap(suite).stmts);
    cls.body_text = std::move(unwrap(suite).text);

    SourceSpan span{.start = start, .end = source_.location(last_end_offset_ - 1)};
    return make_box<Stmt>(Stmt{.kind = std::move(cls), .span = span});
}

auto Parser::parse_class_args(ClassDef& cls) -> Result<bool, ParseError> {
    while (!check(TokenKind::RParen)) {
        if (is_at_end() || check(TokenKind::Newline)) {
            return error_here("expected ')'");
        }

        auto range = scan_expression({TokenKind::Comma, TokenKind::RParen});
        if (range.empty()) {
            return error_here("invalid syntax");
        }
        if (const auto* bad = find_error_token(range)) {
            return error_at(*bad, "invalid syntax");
        }

        const auto& first = tokens_[range.begin];
        bool keyword = range.end - range.begin >= 2 && first.is(TokenKind::Identifier) &&
                       tokens_[range.begin + 1].is(TokenKind::Assign);
        if (keyword) {
            cls.keywords.push_back(render(range));
        } else if (!first.is_one_of({TokenKind::Star, TokenKind::DoubleStar})) {
            cls.bases.push_back(render(range));
        }

        if (!match(TokenKind::Comma) && !check(TokenKind::RParen)) {
            return error_here("expected ',' or ')' in class arguments");
        }
    }

    advance(); // ')'
    return true;
}

} // namespace pystruct::parser
