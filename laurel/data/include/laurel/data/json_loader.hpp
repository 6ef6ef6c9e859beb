#pragma once

#include <laurel/core/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace laurel::data {

// ============================================================================
// LoadResult - Items read from a JSON array plus everything that went wrong
// ============================================================================

template<typename T>
struct LoadResult {
    std::vector<T> items;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    size_t total_processed = 0;

    bool success() const { return errors.empty(); }
    size_t loaded_count() const { return items.size(); }
    size_t error_count() const { return errors.size(); }
};

// Load and parse a JSON file, nullopt when the file is missing or malformed
inline std::optional<nlohmann::json> load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log_error("json", "Failed to open file: {}", path);
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        core::log_error("json", "Parse error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// parse_json_array - Deserialize every object of an array
// ============================================================================

// Deserializer signature:
//   std::optional<T> deserialize(const nlohmann::json& obj, std::string& out_error)
// A nullopt return records out_error against the item index.

template<typename T, typename Deserializer>
LoadResult<T> parse_json_array(const nlohmann::json& root, Deserializer deserialize_fn,
                               const std::string& array_key = "") {
    LoadResult<T> result;

    const nlohmann::json* arr = &root;
    if (!array_key.empty()) {
        if (!root.is_object() || !root.contains(array_key)) {
            result.errors.push_back("Missing key '" + array_key + "' in JSON");
            return result;
        }
        arr = &root[array_key];
    }

    if (!arr->is_array()) {
        result.errors.push_back(array_key.empty() ? std::string("Expected root to be an array")
                                                  : "Key '" + array_key + "' is not an array");
        return result;
    }

    result.items.reserve(arr->size());
    size_t index = 0;

    for (const auto& item : *arr) {
        ++result.total_processed;

        if (!item.is_object()) {
            result.warnings.push_back("Item at index " + std::to_string(index) + " is not an object, skipping");
            ++index;
            continue;
        }

        std::string error;
        auto obj_opt = deserialize_fn(item, error);
        if (obj_opt) {
            result.items.push_back(std::move(*obj_opt));
        } else {
            result.errors.push_back("Item " + std::to_string(index) + ": " + error);
        }

        ++index;
    }

    return result;
}

// ============================================================================
// JSON Value Helpers
// ============================================================================

namespace json_helpers {

// Check if required field exists and is a string
inline bool require_string(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    if (!j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!j[key].is_string()) {
        out_error = "Field '" + key + "' must be a string";
        return false;
    }
    return true;
}

} // namespace json_helpers

} // namespace laurel::data
