//! # JSON Error Types
//!
//! Error type returned by the JSON parser. Dataset and manifest loaders wrap
//! it into their own error types, keeping the location for diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! auto error = JsonError::make("Expected ':' after object key", 5, 12);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "line 5, column 12: Expected ':' after object key"
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace pystruct::json {

/// An error encountered while parsing JSON text.
///
/// `line` and `column` are 1-based; both are 0 when the location is unknown.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    /// Creates an error with message only.
    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    /// Creates an error with full location information.
    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as `"line X, column Y: message"`, dropping the
    /// parts of the location that are unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace pystruct::json
