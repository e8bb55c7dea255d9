//! # JSON Value
//!
//! Lookup and mutation. Printing lives in `json_serializer.cpp`.

#include "json/json_value.hpp"

#include <limits>

namespace semdiff::json {

auto JsonValue::as_i64() const -> int64_t {
    if (const auto* value = std::get_if<int64_t>(&data)) {
        return *value;
    }
    auto value = std::get<uint64_t>(data);
    constexpr auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return value > max ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(value);
}

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    const auto* obj = std::get_if<Box<JsonObject>>(&data);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = (*obj)->find(key);
    return it == (*obj)->end() ? nullptr : &it->second;
}

auto JsonValue::size() const -> size_t {
    if (const auto* arr = std::get_if<Box<JsonArray>>(&data)) {
        return (*arr)->size();
    }
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->size();
    }
    return 0;
}

void JsonValue::push(JsonValue value) {
    std::get<Box<JsonArray>>(data)->push_back(std::move(value));
}

void JsonValue::set(const std::string& key, JsonValue value) {
    std::get<Box<JsonObject>>(data)->insert_or_assign(key, std::move(value));
}

auto JsonValue::object_at(const std::string& key) -> JsonValue& {
    auto& members = *std::get<Box<JsonObject>>(data);
    auto it = members.find(key);
    if (it == members.end()) {
        it = members.emplace(key, json_object()).first;
    }
    return it->second;
}

} // namespace semdiff::json
