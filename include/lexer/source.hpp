//! # Source File Management
//!
//! This module provides the in-memory representation of one Python source
//! file. It owns the text, maps byte offsets to line/column positions, and
//! hands out slices for token lexemes and definition bodies.
//!
//! ## Features
//!
//! - **Byte columns**: Columns count bytes, matching CPython's `col_offset`
//! - **Line tracking**: O(log n) line lookup from byte offsets
//! - **BOM handling**: A leading UTF-8 byte order mark is stripped on load
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("def f(x):\n    return x\n", "mod.py");
//! SourceLocation loc = source.location(4); // line 1, column 5
//! std::string_view line = source.line(2);  // "    return x"
//! ```

#ifndef PYSTRUCT_LEXER_SOURCE_HPP
#define PYSTRUCT_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pystruct::lexer {

/// One source file with efficient location tracking.
///
/// String views returned by `content()`, `slice()` and `line()` are valid as
/// long as the Source object exists and is not moved.
class Source {
public:
    /// Constructs a source from a filename and content.
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

    /// Returns the byte at the given offset, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns a substring from `start` to `end` (exclusive), clamped to bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns the byte offset at which a 1-based line starts.
    [[nodiscard]] auto line_start(uint32_t line_num) const -> size_t;

    /// Returns the byte offset just past a 1-based line's last character,
    /// excluding the line terminator.
    [[nodiscard]] auto line_end(uint32_t line_num) const -> size_t;

    /// Returns the content of a specific line (1-indexed), without its
    /// terminator. Empty if the line number is out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a source file from disk.
    ///
    /// Returns an error string if the file cannot be opened or read. The
    /// source is named `display_name`, or `path` when that is empty. A
    /// leading UTF-8 byte order mark is dropped.
    [[nodiscard]] static auto from_file(const std::string& path, std::string display_name = {})
        -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace pystruct::lexer

#endif // PYSTRUCT_LEXER_SOURCE_HPP
