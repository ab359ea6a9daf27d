//! # wolf Parser
//!
//! A recursive-descent, single-token-lookahead parser:
//!
//! ```text
//! program    := statement* EOF
//! statement  := "let" IDENT "=" expression ";"
//!             | expression ";"
//! expression := term (("+"|"-") term)*
//! term       := primary (("*"|"/") primary)*
//! primary    := NUMBER | IDENT | "(" expression ")"
//! ```
//!
//! Parsing stops at the first error. Tokens are never modified; the parser
//! only moves a cursor over them.

#ifndef WOLF_PARSER_PARSER_HPP
#define WOLF_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "parser/ast.hpp"

#include <string>
#include <variant>
#include <vector>

namespace wolf::parser {

/// The first syntax error in a token stream.
struct ParseError {
    std::string expected; ///< What the grammar required, e.g. "';'".
    std::string found;    ///< The offending token, e.g. "integer '5'".
    std::string message;  ///< Full one-line description including position.
    SourceSpan span;      ///< Location of the offending token.
};

/// Parser over an owned token vector that ends with `Eof`.
class Parser {
public:
    explicit Parser(std::vector<lexer::Token> tokens);

    /// Parses the whole token stream.
    [[nodiscard]] auto parse_program() -> Result<Program, ParseError>;

    /// Parses one statement at the cursor.
    [[nodiscard]] auto parse_statement() -> Result<StmtPtr, ParseError>;

    /// Parses one expression at the cursor.
    [[nodiscard]] auto parse_expression() -> Result<ExprPtr, ParseError>;

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;

    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;

    /// Consumes the current token only if it is exactly `kind`.
    auto match(lexer::TokenKind kind) -> bool;

    /// Consumes a `kind` token or fails with `expected` as the requirement.
    auto expect(lexer::TokenKind kind, const std::string& expected)
        -> Result<lexer::Token, ParseError>;

    [[nodiscard]] auto error_at_current(const std::string& expected) const -> ParseError;

    auto parse_let_statement() -> Result<StmtPtr, ParseError>;
    auto parse_expression_statement() -> Result<StmtPtr, ParseError>;
    auto parse_term() -> Result<ExprPtr, ParseError>;
    auto parse_primary() -> Result<ExprPtr, ParseError>;
    auto parse_number() -> Result<ExprPtr, ParseError>;
};

// ============================================================================
// Front End Convenience
// ============================================================================

/// The first error produced by either the lexer or the parser.
using FrontendError = std::variant<lexer::LexerError, ParseError>;

/// Returns the message carried by either alternative.
[[nodiscard]] auto frontend_error_message(const FrontendError& error) -> const std::string&;

/// Returns the location carried by either alternative.
[[nodiscard]] auto frontend_error_span(const FrontendError& error) -> const SourceSpan&;

/// Lexes and parses a complete source. `source` must outlive the call.
[[nodiscard]] auto parse_source(const lexer::Source& source) -> Result<Program, FrontendError>;

} // namespace wolf::parser

#endif // WOLF_PARSER_PARSER_HPP
