//! # Identifier Lexing
//!
//! Names and keywords. Any byte >= 0x80 is treated as an identifier
//! character, which keeps UTF-8 names (`naïve`, `δ`) in one token without
//! decoding them.

#include "lexer/lexer.hpp"

namespace pystruct::lexer {

auto Lexer::string_prefix_length() const -> size_t {
    // Valid prefixes: r, u, b, f and the two-letter combinations rb, br,
    // fr, rf, in any case.
    auto lower = [](char c) { return static_cast<char>(c >= 'A' && c <= 'Z' ? c + 32 : c); };
    auto is_quote = [](char c) { return c == '"' || c == '\''; };

    char c0 = lower(peek());
    if (c0 != 'r' && c0 != 'u' && c0 != 'b' && c0 != 'f') {
        return 0;
    }
    if (is_quote(peek_next())) {
        return 1;
    }

    char c1 = lower(peek_next());
    bool pair = (c0 == 'r' && (c1 == 'b' || c1 == 'f')) || (c1 == 'r' && (c0 == 'b' || c0 == 'f'));
    if (pair && is_quote(peek_n(2))) {
        return 2;
    }
    return 0;
}

auto Lexer::lex_identifier() -> Token {
    while (!is_at_end() && is_ident_continue(peek())) {
        advance();
    }

    auto text = source_.slice(token_start_, pos_);
    auto it = get_keywords().find(text);
    if (it != get_keywords().end()) {
        return make_token(it->second);
    }
    return make_token(TokenKind::Identifier);
}

} // namespace pystruct::lexer
