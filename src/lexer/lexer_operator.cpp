//! # Operator Lexing
//!
//! Longest-match lexing of Python punctuation, plus bracket balancing.
//! Brackets are tracked on a stack so that line breaks inside them are
//! ignored and mismatches are reported where they occur.

#include "lexer/lexer.hpp"

#include <array>

namespace pystruct::lexer {

namespace {

struct OperatorSpelling {
    std::string_view text;
    TokenKind kind;
};

// Ordered longest first so the first prefix match wins.
constexpr std::array<OperatorSpelling, 41> OPERATORS = {{
    {"**=", TokenKind::AugAssign}, {"//=", TokenKind::AugAssign}, {">>=", TokenKind::AugAssign},
    {"<<=", TokenKind::AugAssign}, {"...", TokenKind::Ellipsis},  {"->", TokenKind::Arrow},
    {":=", TokenKind::ColonAssign}, {"**", TokenKind::DoubleStar}, {"//", TokenKind::Operator},
    {"==", TokenKind::Operator},   {"!=", TokenKind::Operator},   {"<=", TokenKind::Operator},
    {">=", TokenKind::Operator},   {"<<", TokenKind::Operator},   {">>", TokenKind::Operator},
    {"+=", TokenKind::AugAssign},  {"-=", TokenKind::AugAssign},  {"*=", TokenKind::AugAssign},
    {"/=", TokenKind::AugAssign},  {"%=", TokenKind::AugAssign},  {"&=", TokenKind::AugAssign},
    {"|=", TokenKind::AugAssign},  {"^=", TokenKind::AugAssign},  {"@=", TokenKind::AugAssign},
    {":", TokenKind::Colon},       {",", TokenKind::Comma},       {";", TokenKind::Semi},
    {".", TokenKind::Dot},         {"@", TokenKind::At},          {"=", TokenKind::Assign},
    {"*", TokenKind::Star},        {"/", TokenKind::Slash},       {"|", TokenKind::Pipe},
    {"+", TokenKind::Operator},    {"-", TokenKind::Operator},    {"%", TokenKind::Operator},
    {"<", TokenKind::Operator},    {">", TokenKind::Operator},    {"&", TokenKind::Operator},
    {"^", TokenKind::Operator},    {"~", TokenKind::Operator},
}};

auto closing_for(char open) -> char {
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    default:
        return '}';
    }
}

} // namespace

auto Lexer::lex_operator() -> Token {
    char c = peek();

    switch (c) {
    case '(':
    case '[':
    case '{': {
        if (brackets_.size() >= MAX_BRACKET_DEPTH) {
            advance();
            return make_error_token("too many nested parentheses");
        }
        brackets_.push_back(OpenBracket{.ch = c, .offset = pos_});
        advance();
        return make_token(c == '(' ? TokenKind::LParen
                                   : (c == '[' ? TokenKind::LBracket : TokenKind::LBrace));
    }
    case ')':
    case ']':
    case '}': {
        advance();
        if (brackets_.empty()) {
            return make_error_token("unmatched '" + std::string(1, c) + "'");
        }
        char open = brackets_.back().ch;
        brackets_.pop_back();
        if (closing_for(open) != c) {
            return make_error_token("closing parenthesis '" + std::string(1, c) +
                                    "' does not match opening parenthesis '" +
                                    std::string(1, open) + "'");
        }
        return make_token(c == ')' ? TokenKind::RParen
                                   : (c == ']' ? TokenKind::RBracket : TokenKind::RBrace));
    }
    default:
        break;
    }

    auto rest = source_.slice(pos_, pos_ + 3);
    for (const auto& op : OPERATORS) {
        if (rest.starts_with(op.text)) {
            pos_ += op.text.size();
            return make_token(op.kind);
        }
    }

    advance();
    return make_error_token("invalid character '" + std::string(1, c) + "'");
}

} // namespace pystruct::lexer
