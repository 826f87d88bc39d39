//! # JSON Value Implementation
//!
//! Object lookup and update, deep copy, and structural equality for
//! `JsonValue`. Serialization lives in `json_serializer.cpp`.

#include "json/json_value.hpp"

#include <cmath>
#include <limits>
#include <type_traits>

namespace pystruct::json {

auto JsonNumber::try_as_i64() const -> std::optional<int64_t> {
    if (kind == Kind::Int64) {
        return i64;
    }
    // 2^63 is exactly representable; anything at or above it overflows.
    constexpr double limit = 9223372036854775808.0;
    if (std::isfinite(f64) && std::trunc(f64) == f64 && f64 >= -limit && f64 < limit) {
        return static_cast<int64_t>(f64);
    }
    return std::nullopt;
}

auto JsonValue::get(std::string_view key) const -> const JsonValue* {
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        for (const auto& [k, v] : **obj) {
            if (k == key) {
                return &v;
            }
        }
    }
    return nullptr;
}

void JsonValue::set(std::string key, JsonValue value) {
    auto& obj = as_object_mut();
    for (auto& [k, v] : obj) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    obj.emplace_back(std::move(key), std::move(value));
}

auto JsonValue::clone() const -> JsonValue {
    return std::visit(
        [](const auto& v) -> JsonValue {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return JsonValue();
            } else if constexpr (std::is_same_v<T, Box<JsonArray>>) {
                JsonArray copy;
                copy.reserve(v->size());
                for (const auto& item : *v) {
                    copy.push_back(item.clone());
                }
                return JsonValue(std::move(copy));
            } else if constexpr (std::is_same_v<T, Box<JsonObject>>) {
                JsonObject copy;
                copy.reserve(v->size());
                for (const auto& [k, item] : *v) {
                    copy.emplace_back(k, item.clone());
                }
                return JsonValue(std::move(copy));
            } else {
                return JsonValue(v);
            }
        },
        data);
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (!(a[i] == b[i])) {
                return false;
            }
        }
        return true;
    }

    if (is_object()) {
        const auto& a = as_object();
        const auto& b = other.as_object();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i].first != b[i].first || !(a[i].second == b[i].second)) {
                return false;
            }
        }
        return true;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    return as_string() == other.as_string();
}

} // namespace pystruct::json
