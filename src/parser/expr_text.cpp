//! # Expression Text Rendering
//!
//! Spacing rules, checked in order for each pair of adjacent tokens:
//!
//! | Situation | Space |
//! |-----------|-------|
//! | before `,` or a closing bracket | no |
//! | after an opening bracket, around `.` | no |
//! | after a unary operator | no |
//! | before `:` | no |
//! | after `,` | yes |
//! | after `:` | only in a `{}` display or after a lambda's parameters |
//! | around `=` | no (keyword arguments) |
//! | around a binary operator, `\|`, `->`, `:=` | yes |
//! | before `(`/`[` | only after a keyword |
//! | between two words | yes |
//!
//! Grouping parentheses around a single primary, or around the whole
//! expression, are dropped first: `(int)` renders as `int`, `(a + b)` as
//! `a + b`, while `-(a + b)`, `()`, `(a,)` and `f(x)` keep theirs.

#include "parser/expr_text.hpp"

#include <vector>

namespace pystruct::parser {

using lexer::Token;
using lexer::TokenKind;

namespace {

auto is_open_bracket(TokenKind kind) -> bool {
    return kind == TokenKind::LParen || kind == TokenKind::LBracket || kind == TokenKind::LBrace;
}

auto is_close_bracket(TokenKind kind) -> bool {
    return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
}

/// Keywords that end an operand rather than expect one.
auto is_value_keyword(TokenKind kind) -> bool {
    return kind == TokenKind::KwTrue || kind == TokenKind::KwFalse || kind == TokenKind::KwNone;
}

auto is_operator_like(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::Operator:
    case TokenKind::Star:
    case TokenKind::DoubleStar:
    case TokenKind::Slash:
    case TokenKind::Pipe:
    case TokenKind::At:
    case TokenKind::Arrow:
    case TokenKind::ColonAssign:
    case TokenKind::AugAssign:
        return true;
    default:
        return false;
    }
}

/// True when `prev` leaves the renderer expecting an operand, so a `-`,
/// `+`, `*` or `**` that follows it is a prefix operator.
auto expects_operand(const Token* prev) -> bool {
    if (prev == nullptr) {
        return true;
    }
    if (is_open_bracket(prev->kind) || is_operator_like(prev->kind)) {
        return true;
    }
    if (prev->is_keyword()) {
        return !is_value_keyword(prev->kind);
    }
    switch (prev->kind) {
    case TokenKind::Comma:
    case TokenKind::Colon:
    case TokenKind::Assign:
    case TokenKind::Semi:
        return true;
    default:
        return false;
    }
}

auto can_be_unary(const Token& token) -> bool {
    if (token.is(TokenKind::Star) || token.is(TokenKind::DoubleStar)) {
        return true;
    }
    return token.is(TokenKind::Operator) &&
           (token.lexeme == "-" || token.lexeme == "+" || token.lexeme == "~");
}

/// Python's repr() of a str or bytes value: single quotes unless the value
/// holds a `'` and no `"`.
auto quote_like_repr(std::string_view value, bool bytes) -> std::string {
    bool double_quoted =
        value.find('\'') != std::string_view::npos && value.find('"') == std::string_view::npos;
    char quote = double_quoted ? '"' : '\'';
    std::string out = bytes ? "b" : "";
    out += quote;
    for (char c : value) {
        auto byte = static_cast<unsigned char>(c);
        if (c == quote || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (byte < 0x20 || byte == 0x7f || (bytes && byte >= 0x80)) {
            static constexpr char hex[] = "0123456789abcdef";
            out += "\\x";
            out += hex[byte >> 4];
            out += hex[byte & 0xf];
        } else {
            out += c;
        }
    }
    out += quote;
    return out;
}

/// True when the group `(` at `open` ... `)` at `close` adds nothing: its
/// contents are a single primary (a name, literal, attribute, subscript or
/// call), or the group spans the whole expression and is not a tuple,
/// generator or `yield`.
auto is_redundant_group(std::span<const Token> tokens, size_t open, size_t close, bool whole)
    -> bool {
    if (close == open + 1) {
        return false; // ()
    }
    if (!whole && open > 0 && !expects_operand(&tokens[open - 1])) {
        return false; // call
    }
    size_t depth = 0;
    size_t strings = 0;
    bool primary = true;
    for (size_t i = open + 1; i < close; ++i) {
        const auto& token = tokens[i];
        if (is_open_bracket(token.kind)) {
            ++depth;
            continue;
        }
        if (is_close_bracket(token.kind)) {
            --depth;
            continue;
        }
        if (depth > 0) {
            continue;
        }
        if (token.is_one_of({TokenKind::Comma, TokenKind::KwFor, TokenKind::KwYield,
                             TokenKind::ColonAssign})) {
            return false;
        }
        if (token.is(TokenKind::String) && ++strings > 1) {
            return false; // implicit concatenation
        }
        if (is_operator_like(token.kind) || token.is(TokenKind::Colon) ||
            token.is(TokenKind::Assign)) {
            primary = false;
        } else if (token.is_keyword() && !is_value_keyword(token.kind)) {
            primary = false;
        }
    }
    // `(1).real` needs its parentheses.
    if (close == open + 2 && tokens[open + 1].is(TokenKind::Number) && close + 1 < tokens.size() &&
        tokens[close + 1].is(TokenKind::Dot)) {
        return false;
    }
    return primary || whole;
}

/// Marks the parentheses render_tokens() leaves out.
auto redundant_groups(std::span<const Token> tokens) -> std::vector<bool> {
    std::vector<bool> dropped(tokens.size(), false);
    std::vector<size_t> match(tokens.size(), tokens.size());
    std::vector<size_t> open;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (is_open_bracket(tokens[i].kind)) {
            open.push_back(i);
        } else if (is_close_bracket(tokens[i].kind) && !open.empty()) {
            match[open.back()] = i;
            open.pop_back();
        }
    }

    // Layout tokens never count toward "the whole expression".
    size_t first = 0;
    size_t last = tokens.size();
    auto is_layout = [](const Token& t) {
        return t.is_one_of(
            {TokenKind::Newline, TokenKind::Indent, TokenKind::Dedent, TokenKind::Eof});
    };
    while (first < last && is_layout(tokens[first])) {
        ++first;
    }
    while (last > first && is_layout(tokens[last - 1])) {
        --last;
    }

    while (first < last && tokens[first].is(TokenKind::LParen) && match[first] == last - 1 &&
           is_redundant_group(tokens, first, last - 1, true)) {
        dropped[first] = true;
        dropped[last - 1] = true;
        ++first;
        --last;
    }
    for (size_t i = first; i < last; ++i) {
        if (tokens[i].is(TokenKind::LParen) && match[i] < last &&
            is_redundant_group(tokens, i, match[i], false)) {
            dropped[i] = true;
            dropped[match[i]] = true;
        }
    }
    return dropped;
}

} // namespace

auto normalize_string_literal(std::string_view lexeme) -> std::string {
    auto prefix_len = lexeme.find_first_of("'\"");
    if (prefix_len == std::string_view::npos) {
        return std::string(lexeme);
    }
    bool raw = false;
    bool bytes = false;
    for (char c : lexeme.substr(0, prefix_len)) {
        switch (c) {
        case 'r':
        case 'R':
            raw = true;
            break;
        case 'b':
        case 'B':
            bytes = true;
            break;
        case 'u':
        case 'U':
            break;
        default:
            return std::string(lexeme); // f-strings and template strings
        }
    }

    auto body = lexeme.substr(prefix_len);
    size_t quote_len = body.starts_with("\"\"\"") || body.starts_with("'''") ? 3 : 1;
    if (body.size() < 2 * quote_len) {
        return std::string(lexeme);
    }
    auto inner = body.substr(quote_len, body.size() - 2 * quote_len);
    if (raw || inner.find('\\') == std::string_view::npos) {
        return quote_like_repr(inner, bytes);
    }
    // Escapes read the same under either quote; only the quote can change.
    std::string out = bytes ? "b" : "";
    if (quote_len == 1 && inner.find_first_of("'\"") == std::string_view::npos) {
        return out + "'" + std::string(inner) + "'";
    }
    return out + std::string(body);
}

auto render_tokens(std::span<const Token> tokens) -> std::string {
    std::string out;
    std::vector<TokenKind> brackets;
    std::vector<size_t> lambda_depths; // bracket depth of each lambda awaiting its ':'

    auto dropped = redundant_groups(tokens);

    const Token* prev = nullptr;
    bool prev_unary = false;
    bool prev_colon_spaced = false;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (dropped[i] || token.is_one_of({TokenKind::Newline, TokenKind::Indent,
                                           TokenKind::Dedent, TokenKind::Eof})) {
            continue;
        }

        bool unary = can_be_unary(token) &&
                     (token.lexeme == "~" || expects_operand(prev));
        bool binary = is_operator_like(token.kind) && !unary;

        bool space = false;
        if (prev == nullptr) {
            space = false;
        } else if (token.is(TokenKind::Comma) || is_close_bracket(token.kind)) {
            space = false;
        } else if (is_open_bracket(prev->kind)) {
            space = false;
        } else if (token.is(TokenKind::Dot) || prev->is(TokenKind::Dot)) {
            space = false;
        } else if (prev_unary) {
            space = false;
        } else if (token.is(TokenKind::Colon)) {
            space = false;
        } else if (prev->is(TokenKind::Comma)) {
            space = true;
        } else if (prev->is(TokenKind::Colon)) {
            space = prev_colon_spaced;
        } else if (token.is(TokenKind::Assign) || prev->is(TokenKind::Assign)) {
            space = false;
        } else if (binary || (is_operator_like(prev->kind))) {
            space = true;
        } else if (is_open_bracket(token.kind)) {
            space = prev->is_keyword() && !is_value_keyword(prev->kind);
        } else {
            space = true;
        }

        if (space) {
            out += ' ';
        }

        bool colon_spaced = false;
        if (token.is(TokenKind::Colon)) {
            if (!lambda_depths.empty() && lambda_depths.back() == brackets.size()) {
                lambda_depths.pop_back();
                colon_spaced = true;
            } else {
                colon_spaced = !brackets.empty() && brackets.back() == TokenKind::LBrace;
            }
        } else if (token.is(TokenKind::KwLambda)) {
            lambda_depths.push_back(brackets.size());
        } else if (is_open_bracket(token.kind)) {
            brackets.push_back(token.kind);
        } else if (is_close_bracket(token.kind) && !brackets.empty()) {
            brackets.pop_back();
        }

        if (token.is(TokenKind::String)) {
            out += normalize_string_literal(token.lexeme);
        } else {
            out += token.lexeme;
        }

        prev = &token;
        prev_unary = unary;
        prev_colon_spaced = colon_spaced;
    }

    return out;
}

} // namespace pystruct::parser
