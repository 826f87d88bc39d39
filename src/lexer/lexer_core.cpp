//! # Lexer Core
//!
//! This file implements core lexer functionality including:
//!
//! - **Keyword table**: Maps identifier text to token kinds
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_layout_token()`, `make_error_token()`
//! - **Layout**: Indentation stack, logical line ends, end-of-file dedents
//! - **Dispatch**: `next_token()` routes to the specialized token lexers
//!
//! ## Logical Lines
//!
//! | Situation | Tokens |
//! |-----------|--------|
//! | Blank or comment-only line | none |
//! | Line break inside brackets | none |
//! | Backslash before line break | none |
//! | Other line break | `Newline` |
//! | Deeper indentation | `Indent` |
//! | Shallower indentation | one `Dedent` per closed level |
//! | End of input | `Newline` (if the last line had tokens), `Dedent`s, `Eof` |

#include "lexer/lexer.hpp"

namespace pystruct::lexer {

namespace {

const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    {"False", TokenKind::KwFalse},       {"None", TokenKind::KwNone},
    {"True", TokenKind::KwTrue},         {"and", TokenKind::KwAnd},
    {"as", TokenKind::KwAs},             {"assert", TokenKind::KwAssert},
    {"async", TokenKind::KwAsync},       {"await", TokenKind::KwAwait},
    {"break", TokenKind::KwBreak},       {"class", TokenKind::KwClass},
    {"continue", TokenKind::KwContinue}, {"def", TokenKind::KwDef},
    {"del", TokenKind::KwDel},           {"elif", TokenKind::KwElif},
    {"else", TokenKind::KwElse},         {"except", TokenKind::KwExcept},
    {"finally", TokenKind::KwFinally},   {"for", TokenKind::KwFor},
    {"from", TokenKind::KwFrom},         {"global", TokenKind::KwGlobal},
    {"if", TokenKind::KwIf},             {"import", TokenKind::KwImport},
    {"in", TokenKind::KwIn},             {"is", TokenKind::KwIs},
    {"lambda", TokenKind::KwLambda},     {"nonlocal", TokenKind::KwNonlocal},
    {"not", TokenKind::KwNot},           {"or", TokenKind::KwOr},
    {"pass", TokenKind::KwPass},         {"raise", TokenKind::KwRaise},
    {"return", TokenKind::KwReturn},     {"try", TokenKind::KwTry},
    {"while", TokenKind::KwWhile},       {"with", TokenKind::KwWith},
    {"yield", TokenKind::KwYield},
};

} // anonymous namespace

auto get_keywords() -> const std::unordered_map<std::string_view, TokenKind>& {
    return KEYWORDS;
}

Lexer::Lexer(const Source& source) : source_(source) {}

// ============================================================================
// Character Access
// ============================================================================

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

// ============================================================================
// Token Creation
// ============================================================================

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_ > token_start_ ? pos_ - 1 : token_start_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);
    end_loc.length = start_loc.length;

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = source_.slice(token_start_, pos_)};
}

auto Lexer::make_layout_token(TokenKind kind) -> Token {
    auto loc = source_.location(token_start_);
    loc.length = 0;
    return Token{.kind = kind, .span = {loc, loc}, .lexeme = {}};
}

auto Lexer::make_error_token(const std::string& message) -> Token {
    report_error(message, token_start_);
    return make_token(TokenKind::Error);
}

void Lexer::report_error(const std::string& message, size_t offset) {
    auto start_loc = source_.location(offset);
    auto end_loc = source_.location(pos_ > offset ? pos_ : offset);
    errors_.push_back(LexerError{.message = message, .span = {start_loc, end_loc}});
}

// ============================================================================
// Layout
// ============================================================================

void Lexer::consume_line_break() {
    if (peek() == '\r') {
        advance();
        if (peek() == '\n') {
            advance();
        }
    } else if (peek() == '\n') {
        advance();
    }
}

auto Lexer::lex_line_start(Token& out) -> bool {
    while (true) {
        uint32_t column = 0;
        while (!is_at_end()) {
            char c = peek();
            if (c == ' ') {
                ++column;
            } else if (c == '\t') {
                column = (column / 8 + 1) * 8;
            } else if (c == '\f') {
                column = 0;
            } else {
                break;
            }
            advance();
        }

        if (peek() == '#') {
            while (!is_at_end() && peek() != '\n' && peek() != '\r') {
                advance();
            }
        }
        if (is_at_end()) {
            at_line_start_ = false;
            return false;
        }
        if (peek() == '\n' || peek() == '\r') {
            consume_line_break();
            continue;
        }

        at_line_start_ = false;
        token_start_ = pos_;
        uint32_t current = indent_stack_.back();

        if (column > current) {
            if (indent_stack_.size() >= MAX_INDENT_LEVELS) {
                report_error("too many levels of indentation", pos_);
                out = make_layout_token(TokenKind::Error);
                return true;
            }
            indent_stack_.push_back(column);
            out = make_layout_token(TokenKind::Indent);
            return true;
        }

        if (column < current) {
            int dedents = 0;
            while (indent_stack_.size() > 1 && indent_stack_.back() > column) {
                indent_stack_.pop_back();
                ++dedents;
            }
            if (indent_stack_.back() != column) {
                report_error("unindent does not match any outer indentation level", pos_);
                out = make_layout_token(TokenKind::Error);
                return true;
            }
            pending_dedents_ = dedents - 1;
            out = make_layout_token(TokenKind::Dedent);
            return true;
        }

        return false;
    }
}

auto Lexer::skip_whitespace() -> bool {
    while (!is_at_end()) {
        switch (peek()) {
        case ' ':
        case '\t':
        case '\f':
            advance();
            break;
        case '#':
            while (!is_at_end() && peek() != '\n' && peek() != '\r') {
                advance();
            }
            break;
        case '\\':
            if (peek_next() != '\n' && peek_next() != '\r') {
                return false;
            }
            advance();
            consume_line_break();
            break;
        case '\n':
        case '\r':
            if (brackets_.empty()) {
                return true;
            }
            consume_line_break();
            break;
        default:
            return true;
        }
    }
    return true;
}

auto Lexer::lex_eof() -> Token {
    token_start_ = pos_;

    if (!brackets_.empty()) {
        auto open = brackets_.back();
        brackets_.clear();
        report_error("'" + std::string(1, open.ch) + "' was never closed", open.offset);
    }

    if (line_has_tokens_) {
        line_has_tokens_ = false;
        at_line_start_ = true;
        return make_layout_token(TokenKind::Newline);
    }

    finished_ = true;
    if (indent_stack_.size() > 1) {
        pending_dedents_ = static_cast<int>(indent_stack_.size()) - 2;
        indent_stack_.resize(1);
        return make_layout_token(TokenKind::Dedent);
    }
    return make_layout_token(TokenKind::Eof);
}

// ============================================================================
// Dispatch
// ============================================================================

auto Lexer::next_token() -> Token {
    if (pending_dedents_ > 0) {
        --pending_dedents_;
        token_start_ = pos_;
        return make_layout_token(TokenKind::Dedent);
    }
    if (finished_) {
        token_start_ = pos_;
        return make_layout_token(TokenKind::Eof);
    }

    if (at_line_start_ && brackets_.empty()) {
        Token layout{};
        if (lex_line_start(layout)) {
            return layout;
        }
    }

    if (!skip_whitespace()) {
        token_start_ = pos_;
        advance();
        line_has_tokens_ = true;
        return make_error_token("unexpected character after line continuation character");
    }

    if (is_at_end()) {
        return lex_eof();
    }

    token_start_ = pos_;
    char c = peek();

    if (c == '\n' || c == '\r') {
        consume_line_break();
        at_line_start_ = true;
        line_has_tokens_ = false;
        return make_token(TokenKind::Newline);
    }

    line_has_tokens_ = true;

    if (is_ident_start(c)) {
        size_t prefix = string_prefix_length();
        if (prefix > 0) {
            return lex_string(prefix);
        }
        return lex_identifier();
    }

    if ((c >= '0' && c <= '9') || (c == '.' && peek_next() >= '0' && peek_next() <= '9')) {
        return lex_number();
    }

    if (c == '"' || c == '\'') {
        return lex_string(0);
    }

    return lex_operator();
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().is_eof()) {
            break;
        }
    }
    return tokens;
}

} // namespace pystruct::lexer
