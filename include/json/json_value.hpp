//! # JSON Document Model
//!
//! The tree the report writer and the snapshot dump build before printing.
//! Only what those documents contain is modelled: null, booleans, integers
//! (line numbers, counts), strings, arrays and key-ordered objects. Ordered
//! keys make every printed document byte-identical across runs.
//!
//! ```cpp
//! using namespace semdiff::json;
//!
//! auto call = json_object();
//! call.set("callee", json_string("self.push"));
//! call.set("arg_count", json_uint(1));
//!
//! auto root = json_object();
//! root.object_at("src/lib.rs").set("run", std::move(call));
//! std::string text = root.to_string_pretty();
//! ```

#ifndef SEMDIFF_JSON_JSON_VALUE_HPP
#define SEMDIFF_JSON_JSON_VALUE_HPP

#include "common.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace semdiff::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/// Move-only JSON value. Containers are boxed to keep the variant small.
struct JsonValue {
    using Null = std::monostate;
    using Data = std::variant<Null, bool, int64_t, uint64_t, std::string, Box<JsonArray>,
                              Box<JsonObject>>;

    Data data;

    JsonValue() = default;
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(uint64_t value) : data(value) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<int64_t>(data) || std::holds_alternative<uint64_t>(data);
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

    // Accessors throw std::bad_variant_access on a kind mismatch; callers
    // check first or built the value themselves.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    /// Unsigned values above INT64_MAX saturate.
    [[nodiscard]] auto as_i64() const -> int64_t;
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Object member, or nullptr when absent or when this is not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array()[index];
    }

    /// Members of an object or elements of an array; 0 for scalars.
    [[nodiscard]] auto size() const -> size_t;

    void push(JsonValue value);
    void set(const std::string& key, JsonValue value);

    /// The object stored under `key`, created empty if missing.
    auto object_at(const std::string& key) -> JsonValue&;

    /// No whitespace at all.
    [[nodiscard]] auto to_string() const -> std::string;

    /// One member per line, `indent` spaces per level, no trailing newline.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    void write_pretty(std::ostream& os, int indent = 2) const;
};

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_uint(uint64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace semdiff::json

#endif // SEMDIFF_JSON_JSON_VALUE_HPP
