//! # Source Text
//!
//! Owns the text of one compilation unit and maps byte offsets to 1-based
//! line/column positions.
//!
//! ```cpp
//! auto loaded = Source::from_file("answer.wolf");
//! if (is_err(loaded)) {
//!     std::cerr << unwrap_err(loaded) << "\n";
//!     return;
//! }
//! const Source& source = unwrap(loaded);
//! SourceLocation loc = source.location(4);
//! ```

#ifndef WOLF_LEXER_SOURCE_HPP
#define WOLF_LEXER_SOURCE_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wolf::lexer {

/// A source file with a line index.
///
/// Views returned by `content()`, `slice()` and `line()`, and the `file`
/// field of every `SourceLocation` it produces, stay valid as long as the
/// Source object exists and is not moved.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns `[start, end)`, clamped to the content.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Reads a file from disk. The error is a human-readable reason.
    [[nodiscard]] static auto from_file(const std::filesystem::path& path)
        -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace wolf::lexer

#endif // WOLF_LEXER_SOURCE_HPP
