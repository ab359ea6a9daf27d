//! # Token Utilities
//!
//! Display names for token kinds, used by diagnostics and the `lex` command.

#include "lexer/token.hpp"

#include <string>

namespace wolf::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of input";
    case TokenKind::IntLiteral:
        return "integer";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::KwLet:
        return "'let'";
    case TokenKind::Plus:
        return "'+'";
    case TokenKind::Minus:
        return "'-'";
    case TokenKind::Star:
        return "'*'";
    case TokenKind::Slash:
        return "'/'";
    case TokenKind::Assign:
        return "'='";
    case TokenKind::Semi:
        return "';'";
    case TokenKind::LParen:
        return "'('";
    case TokenKind::RParen:
        return "')'";
    }
    return "unknown";
}

auto token_kind_name(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "Eof";
    case TokenKind::IntLiteral:
        return "IntLiteral";
    case TokenKind::Identifier:
        return "Identifier";
    case TokenKind::KwLet:
        return "KwLet";
    case TokenKind::Plus:
        return "Plus";
    case TokenKind::Minus:
        return "Minus";
    case TokenKind::Star:
        return "Star";
    case TokenKind::Slash:
        return "Slash";
    case TokenKind::Assign:
        return "Assign";
    case TokenKind::Semi:
        return "Semi";
    case TokenKind::LParen:
        return "LParen";
    case TokenKind::RParen:
        return "RParen";
    }
    return "Unknown";
}

auto describe_token(const Token& token) -> std::string {
    switch (token.kind) {
    case TokenKind::IntLiteral:
    case TokenKind::Identifier:
        return std::string(token_kind_to_string(token.kind)) + " '" + std::string(token.lexeme) +
               "'";
    default:
        return std::string(token_kind_to_string(token.kind));
    }
}

} // namespace wolf::lexer
