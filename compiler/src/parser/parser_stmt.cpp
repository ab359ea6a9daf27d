//! # Statement Parsing
//!
//! ```text
//! statement := "let" IDENT "=" expression ";"
//!            | expression ";"
//! ```

#include "parser/parser.hpp"

namespace wolf::parser {

auto Parser::parse_statement() -> Result<StmtPtr, ParseError> {
    if (check(lexer::TokenKind::KwLet)) {
        return parse_let_statement();
    }
    return parse_expression_statement();
}

auto Parser::parse_let_statement() -> Result<StmtPtr, ParseError> {
    auto start_span = advance().span;

    auto name_tok = expect(lexer::TokenKind::Identifier, "identifier after 'let'");
    if (is_err(name_tok))
        return unwrap_err(name_tok);
    std::string name(unwrap(name_tok).lexeme);

    auto assign = expect(lexer::TokenKind::Assign, "'=' after variable name '" + name + "'");
    if (is_err(assign))
        return unwrap_err(assign);

    auto value = parse_expression();
    if (is_err(value))
        return unwrap_err(value);

    auto semi = expect(lexer::TokenKind::Semi, "';' after variable declaration");
    if (is_err(semi))
        return unwrap_err(semi);

    auto span = SourceSpan::merge(start_span, unwrap(semi).span);
    return make_box<Stmt>(
        Stmt{.kind = VariableDeclaration{.name = std::move(name), .value = std::move(unwrap(value))},
             .span = span});
}

auto Parser::parse_expression_statement() -> Result<StmtPtr, ParseError> {
    auto expr = parse_expression();
    if (is_err(expr))
        return unwrap_err(expr);

    auto semi = expect(lexer::TokenKind::Semi, "';' after expression");
    if (is_err(semi))
        return unwrap_err(semi);

    auto span = SourceSpan::merge(unwrap(expr)->span, unwrap(semi).span);
    return make_box<Stmt>(
        Stmt{.kind = ExpressionStatement{.expr = std::move(unwrap(expr))}, .span = span});
}

} // namespace wolf::parser
