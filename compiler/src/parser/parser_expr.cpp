//! # Expression Parsing
//!
//! Two precedence levels, both left-associative:
//!
//! | Level      | Operators |
//! |------------|-----------|
//! | expression | `+` `-`   |
//! | term       | `*` `/`   |
//!
//! Parentheses in `primary` override both.

#include "parser/parser.hpp"

#include <charconv>
#include <optional>

namespace wolf::parser {

namespace {

auto additive_op(lexer::TokenKind kind) -> std::optional<BinaryOp> {
    switch (kind) {
    case lexer::TokenKind::Plus:
        return BinaryOp::Add;
    case lexer::TokenKind::Minus:
        return BinaryOp::Subtract;
    default:
        return std::nullopt;
    }
}

auto multiplicative_op(lexer::TokenKind kind) -> std::optional<BinaryOp> {
    switch (kind) {
    case lexer::TokenKind::Star:
        return BinaryOp::Multiply;
    case lexer::TokenKind::Slash:
        return BinaryOp::Divide;
    default:
        return std::nullopt;
    }
}

} // anonymous namespace

auto Parser::parse_expression() -> Result<ExprPtr, ParseError> {
    auto left = parse_term();
    if (is_err(left))
        return unwrap_err(left);
    ExprPtr expr = std::move(unwrap(left));

    while (auto op = additive_op(peek().kind)) {
        advance();
        auto right = parse_term();
        if (is_err(right))
            return unwrap_err(right);
        expr = make_binary(*op, std::move(expr), std::move(unwrap(right)));
    }

    return expr;
}

auto Parser::parse_term() -> Result<ExprPtr, ParseError> {
    auto left = parse_primary();
    if (is_err(left))
        return unwrap_err(left);
    ExprPtr expr = std::move(unwrap(left));

    while (auto op = multiplicative_op(peek().kind)) {
        advance();
        auto right = parse_primary();
        if (is_err(right))
            return unwrap_err(right);
        expr = make_binary(*op, std::move(expr), std::move(unwrap(right)));
    }

    return expr;
}

auto Parser::parse_primary() -> Result<ExprPtr, ParseError> {
    if (check(lexer::TokenKind::IntLiteral)) {
        return parse_number();
    }

    if (match(lexer::TokenKind::Identifier)) {
        const auto& tok = previous();
        return make_identifier(std::string(tok.lexeme), tok.span);
    }

    if (check(lexer::TokenKind::LParen)) {
        auto open_span = advance().span;
        auto inner = parse_expression();
        if (is_err(inner))
            return unwrap_err(inner);

        auto close = expect(lexer::TokenKind::RParen, "')' to close '('");
        if (is_err(close))
            return unwrap_err(close);

        unwrap(inner)->span = SourceSpan::merge(open_span, unwrap(close).span);
        return inner;
    }

    return error_at_current("expression");
}

auto Parser::parse_number() -> Result<ExprPtr, ParseError> {
    const auto& tok = peek();

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(tok.lexeme.data(), tok.lexeme.data() + tok.lexeme.size(), value);
    if (ec != std::errc{} || ptr != tok.lexeme.data() + tok.lexeme.size()) {
        return error_at_current("integer literal within the signed 64-bit range");
    }

    auto span = advance().span;
    return make_number(value, span);
}

} // namespace wolf::parser
