#pragma once

#include <labyrinth/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace labyrinth::content {

// ============================================================================
// LoadResult - Items that parsed plus one message per item that did not
// ============================================================================

template<typename T>
struct LoadResult {
    std::vector<T> items;
    std::vector<std::string> errors;

    bool success() const { return errors.empty(); }
};

// Read a whole content file. nullopt (and the reason in out_error) when the
// file is missing or is not valid JSON.
inline std::optional<nlohmann::json> load_json_file(const std::string& path, std::string& out_error) {
    std::ifstream file(path);
    if (!file) {
        out_error = "Failed to open file: " + path;
        core::log(core::LogLevel::Error, "[Content] {}", out_error);
        return std::nullopt;
    }

    auto doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        out_error = "Parse error in " + path + ": not valid JSON";
        core::log(core::LogLevel::Error, "[Content] {}", out_error);
        return std::nullopt;
    }
    return doc;
}

// Run deserialize over every element of root[array_key]. The deserializer
// has the shape std::optional<T>(const nlohmann::json&, std::string& error);
// a rejected element is reported as "Item <index>: <error>" and the rest
// are still read.
template<typename T, typename Deserializer>
LoadResult<T> parse_json_array(const nlohmann::json& root, Deserializer deserialize, const std::string& array_key) {
    LoadResult<T> result;

    if (!root.is_object() || !root.contains(array_key)) {
        result.errors.push_back("Missing key '" + array_key + "' in JSON");
        return result;
    }
    const auto& elements = root[array_key];
    if (!elements.is_array()) {
        result.errors.push_back("Key '" + array_key + "' is not an array");
        return result;
    }

    for (size_t i = 0; i < elements.size(); ++i) {
        const std::string prefix = "Item " + std::to_string(i);
        if (!elements[i].is_object()) {
            result.errors.push_back(prefix + " is not an object");
            continue;
        }

        std::string error;
        if (auto item = deserialize(elements[i], error)) {
            result.items.push_back(std::move(*item));
        } else {
            result.errors.push_back(prefix + ": " + error);
        }
    }
    return result;
}

// ============================================================================
// Field access for the item deserializers
// ============================================================================
//
// get_* return the fallback when the key is absent or holds another type.
// require_* and read_int fill error and return false when the key is absent
// (required fields only), mistyped, or an integer outside the range of int.

namespace json_helpers {

enum class FieldType { String, Integer, Array, Object };

inline bool has_type(const nlohmann::json& value, FieldType type) {
    switch (type) {
        case FieldType::String: return value.is_string();
        case FieldType::Integer: return value.is_number_integer();
        case FieldType::Array: return value.is_array();
        case FieldType::Object: return value.is_object();
    }
    return false;
}

inline const char* describe(FieldType type) {
    switch (type) {
        case FieldType::String: return "a string";
        case FieldType::Integer: return "an integer";
        case FieldType::Array: return "an array";
        case FieldType::Object: return "an object";
    }
    return "a value";
}

// JSON integers are 64 bit; content fields are int
inline bool fits_int(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
    }
    int64_t v = value.get<int64_t>();
    return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
}

inline bool require_field(const nlohmann::json& j, const std::string& key, FieldType type, std::string& error) {
    auto it = j.find(key);
    if (it == j.end()) {
        error = "Missing required field '" + key + "'";
        return false;
    }
    if (!has_type(*it, type)) {
        error = "Field '" + key + "' must be " + describe(type);
        return false;
    }
    if (type == FieldType::Integer && !fits_int(*it)) {
        error = "Field '" + key + "' is out of range: " + it->dump();
        return false;
    }
    return true;
}

inline bool require_string(const nlohmann::json& j, const std::string& key, std::string& error) {
    return require_field(j, key, FieldType::String, error);
}

inline bool require_int(const nlohmann::json& j, const std::string& key, std::string& error) {
    return require_field(j, key, FieldType::Integer, error);
}

inline bool require_array(const nlohmann::json& j, const std::string& key, std::string& error) {
    return require_field(j, key, FieldType::Array, error);
}

inline bool require_object(const nlohmann::json& j, const std::string& key, std::string& error) {
    return require_field(j, key, FieldType::Object, error);
}

inline std::string get_string(const nlohmann::json& j, const std::string& key, const std::string& fallback = "") {
    auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : fallback;
}

// Optional integer: out keeps fallback when the key is absent
inline bool read_int(const nlohmann::json& j, const std::string& key, int fallback, int& out, std::string& error) {
    out = fallback;
    if (!j.contains(key)) {
        return true;
    }
    if (!require_field(j, key, FieldType::Integer, error)) {
        return false;
    }
    out = j[key].get<int>();
    return true;
}

inline double get_double(const nlohmann::json& j, const std::string& key, double fallback = 0.0) {
    auto it = j.find(key);
    return it != j.end() && it->is_number() ? it->get<double>() : fallback;
}

inline float get_float(const nlohmann::json& j, const std::string& key, float fallback = 0.0f) {
    return static_cast<float>(get_double(j, key, fallback));
}

inline bool get_bool(const nlohmann::json& j, const std::string& key, bool fallback = false) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() ? it->get<bool>() : fallback;
}

// Non-string elements are skipped
inline std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> values;
    auto it = j.find(key);
    if (it != j.end() && it->is_array()) {
        for (const auto& element : *it) {
            if (element.is_string()) {
                values.push_back(element.get<std::string>());
            }
        }
    }
    return values;
}

} // namespace json_helpers

} // namespace labyrinth::content
