//! # JSON Parser Implementation
//!
//! Scans the input directly (no separate token stream) and builds the value
//! tree recursively. Line and column are tracked on every `advance()` so
//! errors point at the offending character.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace pystruct::json {

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto JsonParser::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

auto JsonParser::is_at_end() const -> bool {
    return pos_ >= input_.size();
}

void JsonParser::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_, pos_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    skip_whitespace();
    if (!is_at_end()) {
        return make_error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }

    char c = peek();
    switch (c) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_literal();
    case '\0':
        if (is_at_end()) {
            return make_error("Unexpected end of input");
        }
        break;
    default:
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_number();
        }
        break;
    }
    return make_error("Unexpected character: " + std::string(1, c));
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'
    JsonValue obj = json_object();

    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return obj;
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return make_error("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (advance() != ':') {
            return make_error("Expected ':' after object key");
        }
        skip_whitespace();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj.set(std::move(unwrap(key)), std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            --depth_;
            return obj;
        }
        if (c != ',') {
            return make_error("Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['
    JsonValue arr = json_array();

    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return arr;
    }

    while (true) {
        skip_whitespace();
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            --depth_;
            return arr;
        }
        if (c != ',') {
            return make_error("Expected ',' or ']' in array");
        }
    }
}

auto JsonParser::parse_hex4() -> Result<unsigned, JsonError> {
    if (pos_ + 4 > input_.size()) {
        return make_error("Incomplete unicode escape sequence");
    }
    unsigned value = 0;
    auto hex = input_.substr(pos_, 4);
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, value, 16);
    if (ec != std::errc{} || ptr != hex.data() + 4) {
        return make_error("Invalid unicode escape sequence");
    }
    for (int i = 0; i < 4; ++i) {
        advance();
    }
    return value;
}

namespace {

void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // opening quote
    std::string value;

    while (!is_at_end()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("Control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto cp = parse_hex4();
            if (is_err(cp)) {
                return unwrap_err(cp);
            }
            unsigned code = unwrap(cp);
            // High surrogate: combine with the following \uDC00-\uDFFF.
            if (code >= 0xD800 && code <= 0xDBFF && peek() == '\\' && pos_ + 1 < input_.size() &&
                input_[pos_ + 1] == 'u') {
                advance();
                advance();
                auto low = parse_hex4();
                if (is_err(low)) {
                    return unwrap_err(low);
                }
                unsigned low_code = unwrap(low);
                if (low_code >= 0xDC00 && low_code <= 0xDFFF) {
                    code = 0x10000 + ((code - 0xD800) << 10) + (low_code - 0xDC00);
                } else {
                    append_utf8(value, code);
                    code = low_code;
                }
            }
            append_utf8(value, code);
            break;
        }
        default:
            return make_error("Invalid escape sequence: \\" + std::string(1, escaped));
        }
    }

    return make_error("Unterminated string");
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (peek() == '0') {
        advance();
    } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    } else {
        return make_error("Invalid number");
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return make_error("Expected digit after decimal point");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return make_error("Expected digit in exponent");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    auto text = input_.substr(start, pos_ - start);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return JsonValue(value);
        }
        // Overflow falls through to double.
    }
    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonParser::parse_literal() -> Result<JsonValue, JsonError> {
    auto rest = input_.substr(pos_);
    auto consume = [this](size_t n) {
        for (size_t i = 0; i < n; ++i) {
            advance();
        }
    };
    if (rest.starts_with("true")) {
        consume(4);
        return JsonValue(true);
    }
    if (rest.starts_with("false")) {
        consume(5);
        return JsonValue(false);
    }
    if (rest.starts_with("null")) {
        consume(4);
        return JsonValue();
    }
    return make_error("Unknown literal");
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace pystruct::json
