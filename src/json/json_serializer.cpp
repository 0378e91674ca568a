//! # JSON Serializer
//!
//! Compact and pretty serialization of `JsonValue`. Object keys come out in
//! map order, so output is deterministic.

#include "json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace conform::json {

namespace {

void append_escaped(const std::string& s, std::string& out) {
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
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                out += oss.str();
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

auto format_number(const JsonNumber& num) -> std::string {
    if (num.kind == JsonNumber::Kind::Int64) {
        return std::to_string(num.i64);
    }
    // JSON has no NaN or infinity.
    if (std::isnan(num.f64) || std::isinf(num.f64)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << num.f64;
    std::string result = oss.str();
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

void serialize(const JsonValue& value, std::string& out, int indent, int depth) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        out += format_number(value.as_number());
    } else if (value.is_string()) {
        append_escaped(value.as_string(), out);
    } else if (value.is_array()) {
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
            if (indent > 0) {
                out += '\n';
                out.append(static_cast<size_t>((depth + 1) * indent), ' ');
            }
            serialize(arr[i], out, indent, depth + 1);
        }
        if (indent > 0) {
            out += '\n';
            out.append(static_cast<size_t>(depth * indent), ' ');
        }
        out += ']';
    } else {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        bool first = true;
        for (const auto& [key, item] : obj) {
            if (!first) {
                out += ',';
            }
            first = false;
            if (indent > 0) {
                out += '\n';
                out.append(static_cast<size_t>((depth + 1) * indent), ' ');
            }
            append_escaped(key, out);
            out += indent > 0 ? ": " : ":";
            serialize(item, out, indent, depth + 1);
        }
        if (indent > 0) {
            out += '\n';
            out.append(static_cast<size_t>(depth * indent), ' ');
        }
        out += '}';
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, 0, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent, 0);
    return out;
}

} // namespace conform::json
