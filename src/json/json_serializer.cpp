//! # JSON Serializer
//!
//! Converts `JsonValue` trees to text, either compact or indented.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Backspace, form feed, LF, CR, tab | `\b`, `\f`, `\n`, `\r`, `\t` |
//! | Other control (0x00-0x1F) | `\uXXXX` |
//!
//! Bytes at or above 0x80 are written as-is, so UTF-8 source text (bodies,
//! docstrings) round-trips unchanged.
//!
//! ## Indented Layout
//!
//! Empty arrays and objects render as `[]` and `{}`. Otherwise each element
//! or member goes on its own line, members as `"key": value`.

#include "json/json_value.hpp"

#include <cmath>
#include <cstdio>
#include <ostream>
#include <sstream>

namespace pystruct::json {

namespace {

void append_escaped(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

void append_number(std::string& out, const JsonNumber& num) {
    if (num.is_integer()) {
        out += std::to_string(num.i64);
        return;
    }
    if (!std::isfinite(num.f64)) {
        // JSON has no representation for NaN or infinity.
        out += "null";
        return;
    }
    std::ostringstream oss;
    oss.precision(17);
    oss << num.f64;
    std::string text = oss.str();
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    out += text;
}

void append_scalar(std::string& out, const JsonValue& value) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        append_number(out, value.as_number());
    } else {
        append_escaped(out, value.as_string());
    }
}

void serialize(const JsonValue& value, std::string& out, int indent, int depth) {
    const bool pretty = indent > 0;
    auto newline = [&](int level) {
        if (pretty) {
            out += '\n';
            out.append(static_cast<size_t>(level * indent), ' ');
        }
    };

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            newline(depth + 1);
            serialize(arr[i], out, indent, depth + 1);
        }
        newline(depth);
        out += ']';
        return;
    }

    if (value.is_object()) {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        for (size_t i = 0; i < obj.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            newline(depth + 1);
            append_escaped(out, obj[i].first);
            out += pretty ? ": " : ":";
            serialize(obj[i].second, out, indent, depth + 1);
        }
        newline(depth);
        out += '}';
        return;
    }

    append_scalar(out, value);
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, 0, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent < 1 ? 1 : indent, 0);
    return out;
}

auto JsonValue::write_to_pretty(std::ostream& os, int indent) const -> std::ostream& {
    return os << to_string_pretty(indent);
}

} // namespace pystruct::json
