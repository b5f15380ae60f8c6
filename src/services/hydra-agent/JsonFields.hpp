#pragma once

#include <nlohmann/json.hpp>

#include <string>

// Reads a string member of a JSON object. Missing members and members of any
// other type read as empty.
inline std::string StringField(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}
