//! # Parser Core
//!
//! ## Token Navigation
//!
//! | Method       | Description                                  |
//! |--------------|----------------------------------------------|
//! | `peek()`     | Look at the current token                    |
//! | `advance()`  | Consume and return the current token         |
//! | `previous()` | Last consumed token                          |
//! | `check()`    | Test the current token without consuming     |
//! | `match()`    | Consume the current token on an exact match  |
//! | `expect()`   | Require a token kind or fail                 |

#include "log/log.hpp"
#include "parser/parser.hpp"

namespace wolf::parser {

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        tokens_.push_back(lexer::Token{.kind = lexer::TokenKind::Eof,
                                       .span = tokens_.empty() ? SourceSpan{} : tokens_.back().span,
                                       .lexeme = {}});
    }
}

auto Parser::peek() const -> const lexer::Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_];
}

auto Parser::previous() const -> const lexer::Token& {
    if (pos_ == 0) {
        return tokens_[0];
    }
    return tokens_[pos_ - 1];
}

auto Parser::advance() -> const lexer::Token& {
    if (!is_at_end()) {
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

auto Parser::check(lexer::TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::match(lexer::TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(lexer::TokenKind kind, const std::string& expected)
    -> Result<lexer::Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    return error_at_current(expected);
}

auto Parser::error_at_current(const std::string& expected) const -> ParseError {
    const auto& tok = peek();
    std::string found = lexer::describe_token(tok);
    std::string message = "Expected " + expected + ", found " + found + " at line " +
                          std::to_string(tok.line()) + ", column " + std::to_string(tok.column());

    return ParseError{
        .expected = expected, .found = std::move(found), .message = std::move(message),
        .span = tok.span};
}

auto Parser::parse_program() -> Result<Program, ParseError> {
    Program program;

    while (!is_at_end()) {
        auto stmt = parse_statement();
        if (is_err(stmt)) {
            WOLF_LOG_DEBUG("parser", unwrap_err(stmt).message);
            return unwrap_err(stmt);
        }
        program.statements.push_back(std::move(unwrap(stmt)));
    }

    WOLF_LOG_TRACE("parser", "Parsed " << program.statements.size() << " statements");
    return program;
}

// ============================================================================
// Front End Convenience
// ============================================================================

auto frontend_error_message(const FrontendError& error) -> const std::string& {
    return std::visit([](const auto& e) -> const std::string& { return e.message; }, error);
}

auto frontend_error_span(const FrontendError& error) -> const SourceSpan& {
    return std::visit([](const auto& e) -> const SourceSpan& { return e.span; }, error);
}

auto parse_source(const lexer::Source& source) -> Result<Program, FrontendError> {
    lexer::Lexer lex(source);
    auto tokens = lex.tokenize();
    if (is_err(tokens)) {
        return FrontendError{unwrap_err(tokens)};
    }

    Parser parser(std::move(unwrap(tokens)));
    auto program = parser.parse_program();
    if (is_err(program)) {
        return FrontendError{unwrap_err(program)};
    }
    return std::move(unwrap(program));
}

} // namespace wolf::parser
