#include "lexer/lexer.hpp"
#include "lexer/source.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace wolf;
using namespace wolf::lexer;

class LexerTest : public ::testing::Test {
protected:
    // Keep source alive so Token.lexeme (string_view) remains valid
    std::unique_ptr<Source> source_;

    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto result = lexer.tokenize();
        EXPECT_TRUE(is_ok(result)) << unwrap_err(result).message;
        return is_ok(result) ? unwrap(result) : std::vector<Token>{};
    }

    auto lex_error(const std::string& code) -> LexerError {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto result = lexer.tokenize();
        EXPECT_TRUE(is_err(result));
        return is_err(result) ? unwrap_err(result) : LexerError{};
    }

    auto kinds(const std::string& code) -> std::vector<TokenKind> {
        std::vector<TokenKind> out;
        for (const auto& token : lex(code)) {
            out.push_back(token.kind);
        }
        return out;
    }

    auto lex_one(const std::string& code) -> Token {
        auto tokens = lex(code);
        EXPECT_GE(tokens.size(), 1u);
        return tokens.empty() ? Token{} : tokens[0];
    }
};

// ============================================================================
// Token Kinds
// ============================================================================

TEST_F(LexerTest, Keyword) {
    EXPECT_EQ(lex_one("let").kind, TokenKind::KwLet);
}

TEST_F(LexerTest, KeywordPrefixIsIdentifier) {
    auto token = lex_one("letter");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.lexeme, "letter");

    EXPECT_EQ(lex_one("Let").kind, TokenKind::Identifier);
    EXPECT_EQ(lex_one("let_").kind, TokenKind::Identifier);
}

TEST_F(LexerTest, Identifiers) {
    auto token = lex_one("foo");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.lexeme, "foo");

    EXPECT_EQ(lex_one("_private").lexeme, "_private");
    EXPECT_EQ(lex_one("x1_y2").lexeme, "x1_y2");
}

TEST_F(LexerTest, IntegerLiterals) {
    auto token = lex_one("42");
    EXPECT_EQ(token.kind, TokenKind::IntLiteral);
    EXPECT_EQ(token.lexeme, "42");

    // Conversion happens in the parser, so out-of-range digits still lex.
    EXPECT_EQ(lex_one("99999999999999999999").kind, TokenKind::IntLiteral);
    EXPECT_EQ(lex_one("007").lexeme, "007");
}

TEST_F(LexerTest, DigitsThenLettersSplit) {
    auto tokens = lex("12ab");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::IntLiteral);
    EXPECT_EQ(tokens[0].lexeme, "12");
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[1].lexeme, "ab");
    EXPECT_TRUE(tokens[2].is_eof());
}

TEST_F(LexerTest, Operators) {
    EXPECT_EQ(lex_one("+").kind, TokenKind::Plus);
    EXPECT_EQ(lex_one("-").kind, TokenKind::Minus);
    EXPECT_EQ(lex_one("*").kind, TokenKind::Star);
    EXPECT_EQ(lex_one("/").kind, TokenKind::Slash);
    EXPECT_EQ(lex_one("=").kind, TokenKind::Assign);
}

TEST_F(LexerTest, Delimiters) {
    EXPECT_EQ(lex_one(";").kind, TokenKind::Semi);
    EXPECT_EQ(lex_one("(").kind, TokenKind::LParen);
    EXPECT_EQ(lex_one(")").kind, TokenKind::RParen);
}

TEST_F(LexerTest, LetStatement) {
    EXPECT_EQ(kinds("let x = (1 + 2) * 3;"),
              (std::vector<TokenKind>{TokenKind::KwLet, TokenKind::Identifier, TokenKind::Assign,
                                      TokenKind::LParen, TokenKind::IntLiteral, TokenKind::Plus,
                                      TokenKind::IntLiteral, TokenKind::RParen, TokenKind::Star,
                                      TokenKind::IntLiteral, TokenKind::Semi, TokenKind::Eof}));
}

// ============================================================================
// Whitespace and End of Input
// ============================================================================

TEST_F(LexerTest, EmptyInput) {
    auto tokens = lex("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokens[0].is_eof());
}

TEST_F(LexerTest, WhitespaceOnly) {
    auto tokens = lex(" \t\r\n  \n");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokens[0].is_eof());
}

TEST_F(LexerTest, EofRepeats) {
    source_ = std::make_unique<Source>(Source::from_string("x"));
    Lexer lexer(*source_);

    auto first = lexer.next_token();
    ASSERT_TRUE(is_ok(first));
    EXPECT_EQ(unwrap(first).kind, TokenKind::Identifier);

    for (int i = 0; i < 3; ++i) {
        auto eof = lexer.next_token();
        ASSERT_TRUE(is_ok(eof));
        EXPECT_TRUE(unwrap(eof).is_eof());
    }
}

// ============================================================================
// Positions
// ============================================================================

TEST_F(LexerTest, LineAndColumn) {
    auto tokens = lex("let x\n  = 5;");
    ASSERT_EQ(tokens.size(), 6u);

    EXPECT_EQ(tokens[0].line(), 1u);
    EXPECT_EQ(tokens[0].column(), 1u);
    EXPECT_EQ(tokens[1].line(), 1u);
    EXPECT_EQ(tokens[1].column(), 5u);
    EXPECT_EQ(tokens[2].line(), 2u);
    EXPECT_EQ(tokens[2].column(), 3u);
    EXPECT_EQ(tokens[3].line(), 2u);
    EXPECT_EQ(tokens[3].column(), 5u);
    EXPECT_EQ(tokens[4].column(), 6u);
}

TEST_F(LexerTest, SpanCoversLexeme) {
    auto tokens = lex("  abc");
    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].span.start.offset, 2u);
    EXPECT_EQ(tokens[0].span.start.length, 3u);
    EXPECT_EQ(tokens[0].span.end.column, 5u);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(LexerTest, UnexpectedCharacter) {
    auto err = lex_error("let x = 5 $ 3;");
    EXPECT_EQ(err.character, '$');
    EXPECT_EQ(err.span.start.line, 1u);
    EXPECT_EQ(err.span.start.column, 11u);
    EXPECT_EQ(err.message, "Unexpected character '$' at line 1, column 11");
}

TEST_F(LexerTest, UnexpectedCharacterOnLaterLine) {
    auto err = lex_error("1;\n  2 % 3;");
    EXPECT_EQ(err.character, '%');
    EXPECT_EQ(err.span.start.line, 2u);
    EXPECT_EQ(err.span.start.column, 5u);
}

TEST_F(LexerTest, ErrorIsSticky) {
    source_ = std::make_unique<Source>(Source::from_string("#"));
    Lexer lexer(*source_);

    auto first = lexer.next_token();
    auto second = lexer.next_token();
    ASSERT_TRUE(is_err(first));
    ASSERT_TRUE(is_err(second));
    EXPECT_EQ(unwrap_err(first).span.start.offset, unwrap_err(second).span.start.offset);
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(LexerTest, LexemesConcatenateToSourceWithoutWhitespace) {
    const std::string code = "let total = ( 10+ 2 )*\n\tcount / 4 ;\nlet y=total-1;";
    std::string expected;
    for (char c : code) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            expected += c;
        }
    }

    std::string joined;
    for (const auto& token : lex(code)) {
        joined += token.lexeme;
    }
    EXPECT_EQ(joined, expected);
}

TEST_F(LexerTest, TokenNames) {
    EXPECT_EQ(token_kind_name(TokenKind::IntLiteral), "IntLiteral");
    EXPECT_EQ(token_kind_name(TokenKind::KwLet), "KwLet");
    EXPECT_EQ(token_kind_to_string(TokenKind::Semi), "';'");
    EXPECT_EQ(token_kind_to_string(TokenKind::Eof), "end of input");
}
