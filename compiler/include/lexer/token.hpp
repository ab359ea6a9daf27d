//! # Tokens
//!
//! Token kinds and the `Token` value produced by the lexer.
//!
//! | Category   | Tokens                                |
//! |------------|---------------------------------------|
//! | Literals   | `IntLiteral`                          |
//! | Names      | `Identifier`, `KwLet`                 |
//! | Operators  | `+` `-` `*` `/` `=`                   |
//! | Delimiters | `;` `(` `)`                           |
//! | Special    | `Eof`                                 |

#ifndef WOLF_LEXER_TOKEN_HPP
#define WOLF_LEXER_TOKEN_HPP

#include "common.hpp"

#include <string_view>

namespace wolf::lexer {

/// The kind of a lexical token.
enum class TokenKind : uint8_t {
    Eof, ///< End of input, repeated indefinitely

    IntLiteral, ///< Run of ASCII digits, unconverted
    Identifier, ///< `[A-Za-z_][A-Za-z0-9_]*`

    KwLet, ///< `let`

    Plus,   ///< `+`
    Minus,  ///< `-`
    Star,   ///< `*`
    Slash,  ///< `/`
    Assign, ///< `=`

    Semi,   ///< `;`
    LParen, ///< `(`
    RParen, ///< `)`
};

/// A lexical token.
///
/// The lexeme is a view into the `Source` the token came from, so tokens
/// must not outlive it.
struct Token {
    TokenKind kind;
    SourceSpan span;
    std::string_view lexeme;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// 1-based line of the first character.
    [[nodiscard]] auto line() const -> uint32_t {
        return span.start.line;
    }

    /// 1-based column of the first character.
    [[nodiscard]] auto column() const -> uint32_t {
        return span.start.column;
    }
};

/// Returns a display name for a token kind ("integer", "'let'", "';'").
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Returns the canonical name of a token kind ("IntLiteral", "Semi").
[[nodiscard]] auto token_kind_name(TokenKind kind) -> std::string_view;

/// Describes a concrete token for diagnostics: `identifier 'x'`, `';'`, `end of input`.
[[nodiscard]] auto describe_token(const Token& token) -> std::string;

} // namespace wolf::lexer

#endif // WOLF_LEXER_TOKEN_HPP
