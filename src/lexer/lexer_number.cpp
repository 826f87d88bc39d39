//! # Number Lexing
//!
//! Numeric literals are kept as text; the extractor never evaluates them.
//! Accepted forms:
//!
//! | Form | Examples |
//! |------|----------|
//! | Decimal | `0`, `42`, `1_000_000` |
//! | Prefixed | `0xFF`, `0o755`, `0b1010` |
//! | Float | `3.14`, `.5`, `1.`, `1e10`, `2.5E-3` |
//! | Imaginary | `2j`, `1.5J` |

#include "lexer/lexer.hpp"

namespace pystruct::lexer {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

} // namespace

auto Lexer::lex_number() -> Token {
    char c = peek();
    char next = peek_next();

    if (c == '0' && (next == 'x' || next == 'X' || next == 'o' || next == 'O' || next == 'b' ||
                     next == 'B')) {
        advance();
        advance();
        bool any = false;
        while (!is_at_end() && (is_ident_continue(peek()))) {
            advance();
            any = true;
        }
        if (!any) {
            return make_error_token("invalid numeric literal");
        }
        return make_token(TokenKind::Number);
    }

    while (is_digit(peek()) || peek() == '_') {
        advance();
    }

    if (peek() == '.') {
        advance();
        while (is_digit(peek()) || peek() == '_') {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        size_t n = 1;
        if (peek_n(1) == '+' || peek_n(1) == '-') {
            n = 2;
        }
        if (is_digit(peek_n(n))) {
            for (size_t i = 0; i < n; ++i) {
                advance();
            }
            while (is_digit(peek()) || peek() == '_') {
                advance();
            }
        }
    }

    if (peek() == 'j' || peek() == 'J') {
        advance();
    }

    return make_token(TokenKind::Number);
}

} // namespace pystruct::lexer
