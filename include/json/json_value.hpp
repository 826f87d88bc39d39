//! # JSON Value Types
//!
//! This module provides the JSON value type used by the dataset serializer,
//! the run report, and the run manifest loader.
//!
//! ## Features
//!
//! - **Integer precision**: Numbers without decimals are stored as `int64_t`
//! - **Insertion-ordered objects**: Keys serialize in the order they were set,
//!   so the dataset schema's field order is part of the output
//! - **Value semantics**: `JsonValue` can be moved and compared; `clone()`
//!   makes a deep copy
//!
//! ## Example
//!
//! ```cpp
//! #include "json/json_value.hpp"
//! using namespace pystruct::json;
//!
//! auto param = json_object();
//! param.set("identifier", JsonValue("x"));
//! param.set("type", JsonValue());       // null
//! param.set("line_number", JsonValue(3));
//!
//! if (auto* name = param.get("identifier"); name && name->is_string()) {
//!     std::cout << name->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pystruct::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object: key-value pairs in insertion order.
///
/// Keys are unique; `JsonValue::set()` replaces the value of an existing key
/// in place.
using JsonObject = std::vector<std::pair<std::string, JsonValue>>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number that remembers whether it was written as an integer.
///
/// `42` is stored as `Int64`; `42.0`, `1e3` and integers that overflow
/// `int64_t` are stored as `Double`.
struct JsonNumber {
    enum class Kind : uint8_t { Int64, Double };

    Kind kind = Kind::Int64;
    int64_t i64 = 0;
    double f64 = 0.0;

    JsonNumber() = default;
    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    /// Returns the value as an integer if it is one, or a double with no
    /// fractional part that fits in `int64_t`.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t>;

    /// Returns the value as a double (lossy for very large integers).
    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return false;
        }
        return kind == Kind::Int64 ? i64 == other.i64 : f64 == other.f64;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// A JSON value: null, boolean, number, string, array, or object.
///
/// Arrays and objects are boxed so the type can be recursive. The type is
/// move-only; use `clone()` for a deep copy.
///
/// | JSON Type | Query | Accessor |
/// |-----------|-------|----------|
/// | `null` | `is_null()` | - |
/// | `true/false` | `is_bool()` | `as_bool()` |
/// | number | `is_number()` | `as_number()`, `as_i64()` |
/// | string | `is_string()` | `as_string()` |
/// | array | `is_array()` | `as_array()`, `operator[]` |
/// | object | `is_object()` | `as_object()`, `get()` |
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    /// Default constructor creates a `null` value.
    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(JsonNumber value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    /// Creates a string value, or `null` when `value` is empty.
    static auto optional_string(const std::optional<std::string>& value) -> JsonValue {
        return value ? JsonValue(*value) : JsonValue();
    }

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    /// Returns `true` if this is a number stored as an integer.
    [[nodiscard]] auto is_integer() const -> bool {
        auto* num = std::get_if<JsonNumber>(&data);
        return num && num->is_integer();
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Accessors
    // ========================================================================
    //
    // All accessors throw `std::bad_variant_access` on a type mismatch;
    // callers that read untrusted input check the type first.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Returns the integer value, or nullopt when this is not an integral number.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->try_as_i64();
        }
        return std::nullopt;
    }

    // ========================================================================
    // Object Access
    // ========================================================================

    /// Gets a value from an object by key.
    ///
    /// Returns `nullptr` if this is not an object or the key does not exist.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue*;

    /// Returns `true` if this object contains the given key.
    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return get(key) != nullptr;
    }

    /// Sets a key-value pair in an object, keeping the key's original
    /// position when it already exists.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an object.
    void set(std::string key, JsonValue value);

    // ========================================================================
    // Array Access
    // ========================================================================

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Gets the size of an array or object. Returns `0` for other types.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    /// Pushes a value to an array.
    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Serializes to compact JSON (no whitespace).
    [[nodiscard]] auto to_string() const -> std::string;

    /// Serializes to indented JSON, one member or element per line.
    [[nodiscard]] auto to_string_pretty(int indent = 4) const -> std::string;

    /// Writes indented JSON to a stream.
    auto write_to_pretty(std::ostream& os, int indent = 4) const -> std::ostream&;

    // ========================================================================
    // Copy and Comparison
    // ========================================================================

    /// Makes a deep copy of this value.
    [[nodiscard]] auto clone() const -> JsonValue;

    /// Structural equality. Object members are compared in order.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace pystruct::json
