//! # wolf Lexer
//!
//! Converts source text into positioned tokens.
//!
//! - Whitespace (space, tab, CR, LF) separates tokens and is discarded.
//! - Identifiers are `[A-Za-z_][A-Za-z0-9_]*`; `let` becomes `KwLet`.
//! - Integer literals are maximal runs of ASCII digits. Conversion to a
//!   number happens in the parser.
//! - `+ - * / = ; ( )` are single-character tokens.
//! - Any other byte is a `LexerError`; lexing never aborts the process.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("let x = 42;");
//! Lexer lexer(source);
//! auto tokens = lexer.tokenize();
//! if (is_err(tokens)) {
//!     report(unwrap_err(tokens));
//! }
//! ```

#ifndef WOLF_LEXER_LEXER_HPP
#define WOLF_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace wolf::lexer {

/// An unrecognized character in the input.
struct LexerError {
    char character;      ///< The offending byte.
    std::string message; ///< Human-readable description.
    SourceSpan span;     ///< Location of the offending byte.
};

/// Lexical analyzer over a borrowed `Source`.
class Lexer {
public:
    /// The source must outlive the lexer and every token it returns.
    explicit Lexer(const Source& source);

    /// Returns the next token and advances past it.
    ///
    /// Once the input is exhausted every call returns an `Eof` token.
    [[nodiscard]] auto next_token() -> Result<Token, LexerError>;

    /// Lexes the remaining input, including the final `Eof`.
    ///
    /// Stops at the first unrecognized character.
    [[nodiscard]] auto tokenize() -> Result<std::vector<Token>, LexerError>;

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    [[nodiscard]] auto make_token(TokenKind kind) const -> Token;
    [[nodiscard]] auto make_error(char c) const -> LexerError;

    void skip_whitespace();

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
};

/// Returns true for `[A-Za-z_]`.
[[nodiscard]] auto is_identifier_start(char c) -> bool;

/// Returns true for `[A-Za-z0-9_]`.
[[nodiscard]] auto is_identifier_continue(char c) -> bool;

} // namespace wolf::lexer

#endif // WOLF_LEXER_LEXER_HPP
