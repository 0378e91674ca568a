#include "config/toml_reader.hpp"

#include <charconv>
#include <set>
#include <sstream>

namespace conform::config {

namespace {

auto trim(std::string_view text) -> std::string_view {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

auto is_bare_key_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

auto is_bare_key(std::string_view key) -> bool {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!is_bare_key_char(c)) {
            return false;
        }
    }
    return true;
}

/// Drops a `#` comment that is not inside a string.
auto strip_comment(std::string_view line) -> std::string_view {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
        } else if (c == '"') {
            in_string = true;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

/// True once every `[` outside strings has its `]`.
auto brackets_closed(std::string_view text) -> bool {
    int depth = 0;
    bool in_string = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
        } else if (c == '"') {
            in_string = true;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        }
    }
    return depth <= 0;
}

/// Parses a basic string starting at `text[pos] == '"'`; leaves `pos` after
/// the closing quote.
auto parse_string(std::string_view text, size_t& pos, uint32_t line)
    -> Result<std::string, TomlError> {
    std::string out;
    ++pos;
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= text.size()) {
            break;
        }
        char escaped = text[pos++];
        switch (escaped) {
        case '"':
            out += '"';
            break;
        case '\\':
            out += '\\';
            break;
        case 'n':
            out += '\n';
            break;
        case 't':
            out += '\t';
            break;
        case 'r':
            out += '\r';
            break;
        default:
            return TomlError{std::string("unsupported escape '\\") + escaped + "'", line};
        }
    }
    return TomlError{"unterminated string", line};
}

auto skip_blank(std::string_view text, size_t pos) -> size_t {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' ||
                                 text[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

auto parse_array(std::string_view text, uint32_t line) -> Result<TomlValue, TomlError> {
    std::vector<std::string> items;
    size_t pos = skip_blank(text, 1);

    while (true) {
        if (pos >= text.size()) {
            return TomlError{"unterminated array", line};
        }
        if (text[pos] == ']') {
            ++pos;
            break;
        }
        if (text[pos] != '"') {
            return TomlError{"arrays may only contain strings", line};
        }
        auto item = parse_string(text, pos, line);
        if (is_err(item)) {
            return unwrap_err(item);
        }
        items.push_back(std::move(unwrap(item)));

        pos = skip_blank(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            pos = skip_blank(text, pos + 1);
        } else if (pos < text.size() && text[pos] != ']') {
            return TomlError{"expected ',' or ']' in array", line};
        }
    }

    if (!trim(text.substr(pos)).empty()) {
        return TomlError{"unexpected text after array", line};
    }
    return TomlValue{std::move(items)};
}

auto parse_integer(std::string_view text, uint32_t line) -> Result<TomlValue, TomlError> {
    std::string digits;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '_' && i > 0 && i + 1 < text.size()) {
            continue;
        }
        if (c == '+' && i == 0) {
            continue;
        }
        digits += c;
    }

    int64_t value = 0;
    const char* begin = digits.data();
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc::result_out_of_range) {
        return TomlError{"integer out of range: " + std::string(text), line};
    }
    if (ec != std::errc() || ptr != end || digits.empty()) {
        return TomlError{"unsupported value: " + std::string(text), line};
    }
    return TomlValue{value};
}

auto parse_value(std::string_view text, uint32_t line) -> Result<TomlValue, TomlError> {
    if (text.empty()) {
        return TomlError{"missing value", line};
    }
    if (text == "true") {
        return TomlValue{true};
    }
    if (text == "false") {
        return TomlValue{false};
    }
    if (text.front() == '"') {
        size_t pos = 0;
        auto str = parse_string(text, pos, line);
        if (is_err(str)) {
            return unwrap_err(str);
        }
        if (!trim(text.substr(pos)).empty()) {
            return TomlError{"unexpected text after string", line};
        }
        return TomlValue{std::move(unwrap(str))};
    }
    if (text.front() == '[') {
        return parse_array(text, line);
    }
    if (text.front() == '{') {
        return TomlError{"inline tables are not supported", line};
    }
    return parse_integer(text, line);
}

auto valid_table_name(std::string_view name) -> bool {
    size_t start = 0;
    while (true) {
        size_t dot = name.find('.', start);
        std::string_view part = name.substr(start, dot == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : dot - start);
        if (!is_bare_key(part)) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        start = dot + 1;
    }
}

} // namespace

auto parse_toml(std::string_view text) -> Result<TomlDocument, TomlError> {
    TomlDocument doc;
    doc.tables.push_back(TomlTable{"", 0, {}});
    std::set<std::string> seen_tables;
    std::set<std::string> seen_keys;

    std::istringstream stream{std::string(text)};
    std::string raw;
    uint32_t line_number = 0;

    while (std::getline(stream, raw)) {
        line_number++;
        std::string_view line = trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }

        // Section header
        if (line.front() == '[') {
            if (line.size() >= 2 && line[1] == '[') {
                return TomlError{"arrays of tables are not supported", line_number};
            }
            if (line.back() != ']') {
                return TomlError{"malformed table header", line_number};
            }
            std::string name(trim(line.substr(1, line.size() - 2)));
            if (!valid_table_name(name)) {
                return TomlError{"invalid table name '" + name + "'", line_number};
            }
            if (!seen_tables.insert(name).second) {
                return TomlError{"duplicate table [" + name + "]", line_number};
            }
            doc.tables.push_back(TomlTable{name, line_number, {}});
            seen_keys.clear();
            continue;
        }

        // key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            return TomlError{"expected 'key = value'", line_number};
        }
        std::string_view key_text = trim(line.substr(0, eq_pos));
        std::string key;
        if (!key_text.empty() && key_text.front() == '"') {
            size_t pos = 0;
            auto quoted = parse_string(key_text, pos, line_number);
            if (is_err(quoted) || pos != key_text.size()) {
                return TomlError{"malformed quoted key", line_number};
            }
            key = std::move(unwrap(quoted));
        } else if (is_bare_key(key_text)) {
            key = std::string(key_text);
        } else {
            return TomlError{"invalid key '" + std::string(key_text) + "'", line_number};
        }

        std::string value_text(trim(line.substr(eq_pos + 1)));
        uint32_t value_line = line_number;
        if (!value_text.empty() && value_text.front() == '[') {
            // Multi-line array: keep reading until the brackets balance.
            while (!brackets_closed(value_text) && std::getline(stream, raw)) {
                line_number++;
                value_text += '\n';
                value_text += trim(strip_comment(raw));
            }
        }

        auto value = parse_value(value_text, value_line);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        if (!seen_keys.insert(key).second) {
            return TomlError{"duplicate key '" + key + "'", value_line};
        }
        doc.tables.back().entries.push_back(
            TomlEntry{std::move(key), std::move(unwrap(value)), value_line});
    }

    return doc;
}

} // namespace conform::config
