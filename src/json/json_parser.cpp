//! # JSON Parser Implementation
//!
//! Single-pass recursive descent over the input with line/column tracking
//! for error messages.

#include "json/json_parser.hpp"

#include <charconv>
#include <cstdlib>

namespace conform::json {

namespace {

void append_utf8(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto JsonParser::advance() -> char {
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = input_[pos_];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
            break;
        advance();
    }
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_, pos_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto value = parse_value();
    if (is_err(value)) {
        return value;
    }
    skip_whitespace();
    if (pos_ < input_.size()) {
        return make_error("unexpected trailing characters");
    }
    return value;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    switch (peek()) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
        return parse_literal("true", JsonValue(true));
    case 'f':
        return parse_literal("false", JsonValue(false));
    case 'n':
        return parse_literal("null", JsonValue());
    case '\0':
        return make_error("unexpected end of input");
    default:
        if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
            return parse_number();
        }
        return make_error(std::string("unexpected character '") + peek() + "'");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("maximum nesting depth exceeded");
    }
    advance(); // '{'
    JsonObject obj;

    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return make_error("expected string key");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }
        skip_whitespace();
        if (peek() != ':') {
            return make_error("expected ':' after object key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == '}') {
            advance();
            break;
        }
        return make_error("expected ',' or '}' in object");
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("maximum nesting depth exceeded");
    }
    advance(); // '['
    JsonArray arr;

    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == ']') {
            advance();
            break;
        }
        return make_error("expected ',' or ']' in array");
    }

    --depth_;
    return JsonValue(std::move(arr));
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // opening quote
    std::string out;

    while (true) {
        if (pos_ >= input_.size()) {
            return make_error("unterminated string");
        }
        char c = advance();
        if (c == '"') {
            return out;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("control character in string");
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos_ >= input_.size()) {
            return make_error("unterminated escape sequence");
        }
        char esc = advance();
        switch (esc) {
        case '"':
            out += '"';
            break;
        case '\\':
            out += '\\';
            break;
        case '/':
            out += '/';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case 'u': {
            auto read_hex4 = [this]() -> int {
                if (pos_ + 4 > input_.size())
                    return -1;
                int value = 0;
                for (int i = 0; i < 4; ++i) {
                    int digit = hex_value(advance());
                    if (digit < 0)
                        return -1;
                    value = value * 16 + digit;
                }
                return value;
            };
            int cp = read_hex4();
            if (cp < 0) {
                return make_error("invalid unicode escape");
            }
            // High surrogate must be followed by a low surrogate.
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (peek() != '\\' || pos_ + 1 >= input_.size() || input_[pos_ + 1] != 'u') {
                    return make_error("unpaired surrogate in unicode escape");
                }
                advance();
                advance();
                int low = read_hex4();
                if (low < 0xDC00 || low > 0xDFFF) {
                    return make_error("invalid low surrogate in unicode escape");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(static_cast<uint32_t>(cp), out);
            break;
        }
        default:
            return make_error(std::string("invalid escape '\\") + esc + "'");
        }
    }
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (!(peek() >= '0' && peek() <= '9')) {
        return make_error("expected digit");
    }
    while (peek() >= '0' && peek() <= '9') {
        advance();
    }
    if (peek() == '.') {
        is_float = true;
        advance();
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error("expected digit after decimal point");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error("expected digit in exponent");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }

    auto text = input_.substr(start, pos_ - start);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            return JsonValue(value);
        }
    }
    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonParser::parse_literal(std::string_view word, JsonValue value)
    -> Result<JsonValue, JsonError> {
    if (input_.substr(pos_, word.size()) != word) {
        return make_error("invalid literal");
    }
    for (size_t i = 0; i < word.size(); ++i) {
        advance();
    }
    return value;
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace conform::json
