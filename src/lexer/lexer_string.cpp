//! # String Lexing
//!
//! String literals of every form lex to a single `String` token whose
//! lexeme is the literal exactly as written, prefix and quotes included.
//! Escapes are skipped, not decoded: a backslash always consumes the
//! following character, so `"\""` and `r"\""` both end at the last quote.
//!
//! f-string replacement fields are not tokenized separately.

#include "lexer/lexer.hpp"

namespace pystruct::lexer {

auto Lexer::lex_string(size_t prefix_len) -> Token {
    for (size_t i = 0; i < prefix_len; ++i) {
        advance();
    }

    char quote = advance();
    bool triple = peek() == quote && peek_next() == quote;
    if (triple) {
        advance();
        advance();
    }

    while (!is_at_end()) {
        char c = advance();

        if (c == '\\') {
            if (!is_at_end()) {
                advance();
            }
            continue;
        }

        if (c == quote) {
            if (!triple) {
                return make_token(TokenKind::String);
            }
            if (peek() == quote && peek_next() == quote) {
                advance();
                advance();
                return make_token(TokenKind::String);
            }
            continue;
        }

        if ((c == '\n' || c == '\r') && !triple) {
            --pos_;
            return make_error_token("unterminated string literal");
        }
    }

    return make_error_token(triple ? "unterminated triple-quoted string literal"
                                   : "unterminated string literal");
}

} // namespace pystruct::lexer
