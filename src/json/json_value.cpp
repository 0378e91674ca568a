//! # JSON Value Implementation
//!
//! Deep copy and structural equality for `JsonValue`.

#include "json/json_value.hpp"

namespace conform::json {

auto JsonValue::clone() const -> JsonValue {
    if (is_array()) {
        JsonArray copy;
        copy.reserve(as_array().size());
        for (const auto& item : as_array()) {
            copy.push_back(item.clone());
        }
        return JsonValue(std::move(copy));
    }
    if (is_object()) {
        JsonObject copy;
        for (const auto& [key, value] : as_object()) {
            copy.emplace(key, value.clone());
        }
        return JsonValue(std::move(copy));
    }
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
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
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (!(lhs[i] == rhs[i])) {
                return false;
            }
        }
        return true;
    }
    const auto& lhs = as_object();
    const auto& rhs = other.as_object();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    auto it = rhs.begin();
    for (const auto& [key, value] : lhs) {
        if (key != it->first || !(value == it->second)) {
            return false;
        }
        ++it;
    }
    return true;
}

} // namespace conform::json
