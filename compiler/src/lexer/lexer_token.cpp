//! # Lexer - Token Dispatch
//!
//! The `next_token()` entry point and whole-input tokenization.
//!
//! ## Dispatch Order
//!
//! 1. Skip whitespace
//! 2. Return `Eof` at end of input
//! 3. Identifiers and keywords
//! 4. Integer literals
//! 5. Single-character operators and delimiters
//! 6. Anything else is an error

#include "lexer/lexer.hpp"
#include "log/log.hpp"

namespace wolf::lexer {

auto Lexer::next_token() -> Result<Token, LexerError> {
    skip_whitespace();
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (is_identifier_start(c)) {
        return lex_identifier();
    }

    if (c >= '0' && c <= '9') {
        return lex_number();
    }

    advance();
    switch (c) {
    case '+':
        return make_token(TokenKind::Plus);
    case '-':
        return make_token(TokenKind::Minus);
    case '*':
        return make_token(TokenKind::Star);
    case '/':
        return make_token(TokenKind::Slash);
    case '=':
        return make_token(TokenKind::Assign);
    case ';':
        return make_token(TokenKind::Semi);
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    default:
        // Leave the cursor on the bad byte so a retry reports it again.
        pos_ = token_start_;
        return make_error(c);
    }
}

auto Lexer::tokenize() -> Result<std::vector<Token>, LexerError> {
    std::vector<Token> tokens;

    while (true) {
        auto result = next_token();
        if (is_err(result)) {
            const auto& err = unwrap_err(result);
            WOLF_LOG_DEBUG("lexer", err.message);
            return err;
        }

        tokens.push_back(unwrap(result));
        if (tokens.back().is_eof()) {
            break;
        }
    }

    WOLF_LOG_TRACE("lexer", "Lexed " << tokens.size() << " tokens from " << source_.filename());
    return tokens;
}

} // namespace wolf::lexer
