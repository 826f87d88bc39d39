//! # Token Utilities
//!
//! Display names for token kinds, used in parser diagnostics such as
//! "expected ':' after function signature, found 'newline'".

#include "lexer/token.hpp"

namespace pystruct::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of file";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::Indent:
        return "indent";
    case TokenKind::Dedent:
        return "dedent";

    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Number:
        return "number";
    case TokenKind::String:
        return "string";

    case TokenKind::KwFalse:
        return "'False'";
    case TokenKind::KwNone:
        return "'None'";
    case TokenKind::KwTrue:
        return "'True'";
    case TokenKind::KwAnd:
        return "'and'";
    case TokenKind::KwAs:
        return "'as'";
    case TokenKind::KwAssert:
        return "'assert'";
    case TokenKind::KwAsync:
        return "'async'";
    case TokenKind::KwAwait:
        return "'await'";
    case TokenKind::KwBreak:
        return "'break'";
    case TokenKind::KwClass:
        return "'class'";
    case TokenKind::KwContinue:
        return "'continue'";
    case TokenKind::KwDef:
        return "'def'";
    case TokenKind::KwDel:
        return "'del'";
    case TokenKind::KwElif:
        return "'elif'";
    case TokenKind::KwElse:
        return "'else'";
    case TokenKind::KwExcept:
        return "'except'";
    case TokenKind::KwFinally:
        return "'finally'";
    case TokenKind::KwFor:
        return "'for'";
    case TokenKind::KwFrom:
        return "'from'";
    case TokenKind::KwGlobal:
        return "'global'";
    case TokenKind::KwIf:
        return "'if'";
    case TokenKind::KwImport:
        return "'import'";
    case TokenKind::KwIn:
        return "'in'";
    case TokenKind::KwIs:
        return "'is'";
    case TokenKind::KwLambda:
        return "'lambda'";
    case TokenKind::KwNonlocal:
        return "'nonlocal'";
    case TokenKind::KwNot:
        return "'not'";
    case TokenKind::KwOr:
        return "'or'";
    case TokenKind::KwPass:
        return "'pass'";
    case TokenKind::KwRaise:
        return "'raise'";
    case TokenKind::KwReturn:
        return "'return'";
    case TokenKind::KwTry:
        return "'try'";
    case TokenKind::KwWhile:
        return "'while'";
    case TokenKind::KwWith:
        return "'with'";
    case TokenKind::KwYield:
        return "'yield'";

    case TokenKind::LParen:
        return "'('";
    case TokenKind::RParen:
        return "')'";
    case TokenKind::LBracket:
        return "'['";
    case TokenKind::RBracket:
        return "']'";
    case TokenKind::LBrace:
        return "'{'";
    case TokenKind::RBrace:
        return "'}'";
    case TokenKind::Colon:
        return "':'";
    case TokenKind::Comma:
        return "','";
    case TokenKind::Semi:
        return "';'";
    case TokenKind::Dot:
        return "'.'";
    case TokenKind::Ellipsis:
        return "'...'";
    case TokenKind::Arrow:
        return "'->'";
    case TokenKind::At:
        return "'@'";
    case TokenKind::Assign:
        return "'='";
    case TokenKind::ColonAssign:
        return "':='";
    case TokenKind::Star:
        return "'*'";
    case TokenKind::DoubleStar:
        return "'**'";
    case TokenKind::Slash:
        return "'/'";
    case TokenKind::Pipe:
        return "'|'";

    case TokenKind::AugAssign:
        return "augmented assignment";
    case TokenKind::Operator:
        return "operator";
    case TokenKind::Error:
        return "error";
    }
    return "unknown";
}

} // namespace pystruct::lexer
