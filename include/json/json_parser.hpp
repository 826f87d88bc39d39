//! # JSON Parser
//!
//! Recursive descent parser producing `JsonValue` trees. Used to read run
//! manifests and previously written datasets.
//!
//! - Numbers without a fraction or exponent parse as integers
//! - Object keys keep their input order; a repeated key keeps its first
//!   position and its last value
//! - Nesting is limited to `MAX_DEPTH` levels
//! - Errors carry the 1-based line and column of the offending character
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"name": "requests", "jobs": 4})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.get("name")->as_string() << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace pystruct::json {

/// Single-pass JSON parser over an in-memory buffer.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses exactly one JSON value followed by optional whitespace.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

    static constexpr size_t MAX_DEPTH = 512;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;
    void skip_whitespace();
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_literal() -> Result<JsonValue, JsonError>;
    auto parse_hex4() -> Result<unsigned, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace pystruct::json
