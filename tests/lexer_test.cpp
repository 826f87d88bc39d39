//! # Lexer Tests
//!
//! Test Coverage:
//! - Keywords, identifiers, soft keywords
//! - Layout tokens (NEWLINE, INDENT, DEDENT) and blank/comment lines
//! - Implicit line joining inside brackets, explicit `\` continuation
//! - Numbers, strings with prefixes, triple-quoted strings
//! - Operators, augmented assignment, `->`, `:=`, `...`
//! - Error reporting with locations

#include "lexer/lexer.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace pystruct;
using namespace pystruct::lexer;

class LexerTest : public ::testing::Test {
protected:
    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = Source::from_string(code, "test.py");
        Lexer lexer(source_);
        auto tokens = lexer.tokenize();
        errors_ = lexer.errors();
        return tokens;
    }

    auto kinds(const std::string& code) -> std::vector<TokenKind> {
        std::vector<TokenKind> out;
        for (const auto& token : lex(code)) {
            out.push_back(token.kind);
        }
        return out;
    }

    auto first_error() const -> std::string {
        return errors_.empty() ? std::string{} : errors_.front().message;
    }

    Source source_ = Source::from_string("");
    std::vector<LexerError> errors_;
};

// ============================================================================
// Names and Keywords
// ============================================================================

TEST_F(LexerTest, Keywords) {
    auto tokens = lex("def class return async await lambda None True False");
    ASSERT_GE(tokens.size(), 9u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwDef);
    EXPECT_EQ(tokens[1].kind, TokenKind::KwClass);
    EXPECT_EQ(tokens[2].kind, TokenKind::KwReturn);
    EXPECT_EQ(tokens[3].kind, TokenKind::KwAsync);
    EXPECT_EQ(tokens[4].kind, TokenKind::KwAwait);
    EXPECT_EQ(tokens[5].kind, TokenKind::KwLambda);
    EXPECT_EQ(tokens[6].kind, TokenKind::KwNone);
    EXPECT_EQ(tokens[7].kind, TokenKind::KwTrue);
    EXPECT_EQ(tokens[8].kind, TokenKind::KwFalse);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, SoftKeywordsAreIdentifiers) {
    auto tokens = lex("match case type _");
    EXPECT_EQ(tokens[0].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[0].lexeme, "match");
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[2].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[3].kind, TokenKind::Identifier);
}

TEST_F(LexerTest, IdentifierLocation) {
    auto tokens = lex("x = 1\n  \ny = 2\n");
    // x = 1 NEWLINE y = 2 NEWLINE EOF
    ASSERT_EQ(tokens.size(), 9u);
    EXPECT_EQ(tokens[4].lexeme, "y");
    EXPECT_EQ(tokens[4].span.start.line, 3u);
    EXPECT_EQ(tokens[4].span.start.column, 1u);
}

// ============================================================================
// Layout
// ============================================================================

TEST_F(LexerTest, FunctionBlockLayout) {
    auto result = kinds("def f(x):\n    return x\n");
    std::vector<TokenKind> expected = {
        TokenKind::KwDef,      TokenKind::Identifier, TokenKind::LParen,
        TokenKind::Identifier, TokenKind::RParen,     TokenKind::Colon,
        TokenKind::Newline,    TokenKind::Indent,     TokenKind::KwReturn,
        TokenKind::Identifier, TokenKind::Newline,    TokenKind::Dedent,
        TokenKind::Eof};
    EXPECT_EQ(result, expected);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, MissingFinalNewline) {
    auto result = kinds("x = 1");
    std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::Assign,
                                       TokenKind::Number, TokenKind::Newline, TokenKind::Eof};
    EXPECT_EQ(result, expected);
}

TEST_F(LexerTest, BlankAndCommentLinesProduceNothing) {
    auto result = kinds("# header\n\nx = 1\n    # indented comment\n\n");
    std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::Assign,
                                       TokenKind::Number, TokenKind::Newline, TokenKind::Eof};
    EXPECT_EQ(result, expected);
}

TEST_F(LexerTest, NestedDedentsAtOnce) {
    auto result = kinds("class A:\n    def f(self):\n        pass\nx = 1\n");
    size_t dedents = 0;
    size_t indents = 0;
    for (auto kind : result) {
        dedents += kind == TokenKind::Dedent ? 1 : 0;
        indents += kind == TokenKind::Indent ? 1 : 0;
    }
    EXPECT_EQ(indents, 2u);
    EXPECT_EQ(dedents, 2u);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, ImplicitLineJoining) {
    auto result = kinds("f(a,\n  b)\n");
    std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::LParen,
                                       TokenKind::Identifier, TokenKind::Comma,
                                       TokenKind::Identifier, TokenKind::RParen,
                                       TokenKind::Newline,    TokenKind::Eof};
    EXPECT_EQ(result, expected);
}

TEST_F(LexerTest, ExplicitLineContinuation) {
    auto result = kinds("x = 1 + \\\n    2\n");
    std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::Assign,
                                       TokenKind::Number,     TokenKind::Operator,
                                       TokenKind::Number,     TokenKind::Newline,
                                       TokenKind::Eof};
    EXPECT_EQ(result, expected);
}

TEST_F(LexerTest, CrlfLineEndings) {
    auto result = kinds("def f():\r\n    pass\r\n");
    EXPECT_EQ(result.back(), TokenKind::Eof);
    EXPECT_TRUE(errors_.empty());
    EXPECT_EQ(std::count(result.begin(), result.end(), TokenKind::Indent), 1);
}

// ============================================================================
// Literals
// ============================================================================

TEST_F(LexerTest, Numbers) {
    auto tokens = lex("42 0xFF 1_000 3.14 .5 1e-3 2j");
    for (size_t i = 0; i < 7; ++i) {
        EXPECT_EQ(tokens[i].kind, TokenKind::Number) << "token " << i;
    }
    EXPECT_EQ(tokens[5].lexeme, "1e-3");
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, StringPrefixes) {
    auto tokens = lex("'a' \"b\" rb'\\x00' f\"{x}\" u'c'");
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(tokens[i].kind, TokenKind::String) << "token " << i;
    }
    EXPECT_EQ(tokens[2].lexeme, "rb'\\x00'");
    EXPECT_EQ(tokens[3].lexeme, "f\"{x}\"");
}

TEST_F(LexerTest, TripleQuotedStringSpansLines) {
    auto tokens = lex("x = \"\"\"line one\nline two\"\"\"\ny = 1\n");
    ASSERT_GE(tokens.size(), 5u);
    EXPECT_EQ(tokens[2].kind, TokenKind::String);
    EXPECT_EQ(tokens[2].lexeme, "\"\"\"line one\nline two\"\"\"");
    EXPECT_EQ(tokens[3].kind, TokenKind::Newline);
    EXPECT_EQ(tokens[4].lexeme, "y");
    EXPECT_EQ(tokens[4].span.start.line, 3u);
}

TEST_F(LexerTest, EscapedQuoteInString) {
    auto tokens = lex("'it\\'s'");
    EXPECT_EQ(tokens[0].kind, TokenKind::String);
    EXPECT_EQ(tokens[0].lexeme, "'it\\'s'");
    EXPECT_TRUE(errors_.empty());
}

// ============================================================================
// Operators
// ============================================================================

TEST_F(LexerTest, Delimiters) {
    auto tokens = lex("-> := ... ** * / | @ = ;");
    EXPECT_EQ(tokens[0].kind, TokenKind::Arrow);
    EXPECT_EQ(tokens[1].kind, TokenKind::ColonAssign);
    EXPECT_EQ(tokens[2].kind, TokenKind::Ellipsis);
    EXPECT_EQ(tokens[3].kind, TokenKind::DoubleStar);
    EXPECT_EQ(tokens[4].kind, TokenKind::Star);
    EXPECT_EQ(tokens[5].kind, TokenKind::Slash);
    EXPECT_EQ(tokens[6].kind, TokenKind::Pipe);
    EXPECT_EQ(tokens[7].kind, TokenKind::At);
    EXPECT_EQ(tokens[8].kind, TokenKind::Assign);
    EXPECT_EQ(tokens[9].kind, TokenKind::Semi);
}

TEST_F(LexerTest, OperatorsAndAugmentedAssignment) {
    auto tokens = lex("a // b == c += 1 **= 2 != d");
    EXPECT_EQ(tokens[1].kind, TokenKind::Operator);
    EXPECT_EQ(tokens[1].lexeme, "//");
    EXPECT_EQ(tokens[3].kind, TokenKind::Operator);
    EXPECT_EQ(tokens[3].lexeme, "==");
    EXPECT_EQ(tokens[5].kind, TokenKind::AugAssign);
    EXPECT_EQ(tokens[5].lexeme, "+=");
    EXPECT_EQ(tokens[7].kind, TokenKind::AugAssign);
    EXPECT_EQ(tokens[7].lexeme, "**=");
    EXPECT_EQ(tokens[9].kind, TokenKind::Operator);
    EXPECT_EQ(tokens[9].lexeme, "!=");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(LexerTest, UnterminatedString) {
    lex("x = 'abc\ny = 1\n");
    EXPECT_EQ(first_error(), "unterminated string literal");
    EXPECT_EQ(errors_.front().span.start.line, 1u);
    EXPECT_EQ(errors_.front().span.start.column, 5u);
}

TEST_F(LexerTest, UnterminatedTripleQuotedString) {
    lex("x = \"\"\"never closed\n\n");
    EXPECT_EQ(first_error(), "unterminated triple-quoted string literal");
}

TEST_F(LexerTest, InvalidNumericLiteral) {
    lex("x = 0x\n");
    EXPECT_EQ(first_error(), "invalid numeric literal");
}

TEST_F(LexerTest, UnmatchedClosingBracket) {
    lex("x = 1)\n");
    EXPECT_EQ(first_error(), "unmatched ')'");
}

TEST_F(LexerTest, UnclosedBracket) {
    lex("x = (1,\n2\n");
    EXPECT_EQ(first_error(), "'(' was never closed");
    EXPECT_EQ(errors_.front().span.start.column, 5u);
}

TEST_F(LexerTest, InvalidCharacter) {
    lex("x = $\n");
    EXPECT_EQ(first_error(), "invalid character '$'");
}

TEST_F(LexerTest, InconsistentDedent) {
    lex("if x:\n        a = 1\n    b = 2\n");
    EXPECT_EQ(first_error(), "unindent does not match any outer indentation level");
    EXPECT_EQ(errors_.front().span.start.line, 3u);
}

TEST_F(LexerTest, IndentationDepthLimit) {
    auto nested = [](size_t levels) {
        std::string code;
        for (size_t i = 0; i < levels; ++i) {
            code += std::string(i, ' ') + "if x:\n";
        }
        return code + std::string(levels, ' ') + "pass\n";
    };

    lex(nested(Lexer::MAX_INDENT_LEVELS - 1));
    EXPECT_TRUE(errors_.empty()) << first_error();

    lex(nested(Lexer::MAX_INDENT_LEVELS));
    EXPECT_EQ(first_error(), "too many levels of indentation");
    EXPECT_EQ(errors_.front().span.start.line, Lexer::MAX_INDENT_LEVELS + 1);
}

TEST_F(LexerTest, BracketDepthLimit) {
    auto nested = [](size_t depth) {
        return "x = " + std::string(depth, '(') + "1" + std::string(depth, ')') + "\n";
    };

    lex(nested(Lexer::MAX_BRACKET_DEPTH));
    EXPECT_TRUE(errors_.empty()) << first_error();

    lex(nested(Lexer::MAX_BRACKET_DEPTH + 1));
    EXPECT_EQ(first_error(), "too many nested parentheses");
}

TEST_F(LexerTest, StrayBackslash) {
    lex("x = 1 \\ y\n");
    EXPECT_EQ(first_error(), "unexpected character after line continuation character");
}
