//! # Lexer Core
//!
//! Character access, token construction, whitespace skipping and the
//! identifier and number scanners.

#include "lexer/lexer.hpp"

#include <unordered_map>

namespace wolf::lexer {

namespace {

const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    {"let", TokenKind::KwLet},
};

} // anonymous namespace

auto is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::make_token(TokenKind kind) const -> Token {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_ > token_start_ ? pos_ - 1 : token_start_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);
    end_loc.length = start_loc.length;

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = source_.slice(token_start_, pos_)};
}

auto Lexer::make_error(char c) const -> LexerError {
    auto loc = source_.location(token_start_);

    std::string message = "Unexpected character '";
    message += c;
    message += "' at line " + std::to_string(loc.line) + ", column " + std::to_string(loc.column);

    return LexerError{.character = c, .message = std::move(message), .span = {loc, loc}};
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        switch (peek()) {
        case ' ':
        case '\t':
        case '\r':
        case '\n':
            advance();
            break;
        default:
            return;
        }
    }
}

auto Lexer::lex_identifier() -> Token {
    while (is_identifier_continue(peek())) {
        advance();
    }

    auto text = source_.slice(token_start_, pos_);
    auto it = KEYWORDS.find(text);
    return make_token(it != KEYWORDS.end() ? it->second : TokenKind::Identifier);
}

auto Lexer::lex_number() -> Token {
    while (peek() >= '0' && peek() <= '9') {
        advance();
    }
    return make_token(TokenKind::IntLiteral);
}

} // namespace wolf::lexer
