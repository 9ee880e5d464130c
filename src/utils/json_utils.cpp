#include "utils/json_utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace voicestream {
namespace utils {

const JsonValue JsonValue::null_value_;

JsonValue JsonValue::object() {
    JsonValue value;
    value.setObject();
    return value;
}

JsonValue JsonValue::array() {
    JsonValue value;
    value.setArray();
    return value;
}

const JsonValue& JsonValue::getProperty(const std::string& key) const {
    auto it = object_value_.find(key);
    return (it != object_value_.end()) ? it->second : null_value_;
}

std::string JsonValue::getString(const std::string& key, const std::string& fallback) const {
    const JsonValue& value = getProperty(key);
    return value.isString() ? value.asString() : fallback;
}

double JsonValue::getNumber(const std::string& key, double fallback) const {
    const JsonValue& value = getProperty(key);
    return value.isNumber() ? value.asNumber() : fallback;
}

bool JsonValue::getBool(const std::string& key, bool fallback) const {
    const JsonValue& value = getProperty(key);
    return value.isBool() ? value.asBool() : fallback;
}

JsonValue JsonParser::parse(const std::string& json) {
    size_t pos = 0;
    JsonValue value = parseValue(json, pos, 0);
    skipWhitespace(json, pos);
    if (pos != json.length()) {
        throw std::runtime_error("Unexpected trailing characters in JSON");
    }
    return value;
}

bool JsonParser::tryParse(const std::string& json, JsonValue& out) {
    try {
        out = parse(json);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string JsonParser::stringify(const JsonValue& value) {
    return stringifyValue(value);
}

JsonValue JsonParser::parseValue(const std::string& json, size_t& pos, int depth) {
    skipWhitespace(json, pos);

    if (pos >= json.length()) {
        throw std::runtime_error("Unexpected end of JSON");
    }
    if (depth > kMaxDepth) {
        throw std::runtime_error("JSON nesting too deep");
    }

    char c = json[pos];

    if (c == '{') {
        return parseObject(json, pos, depth + 1);
    } else if (c == '[') {
        return parseArray(json, pos, depth + 1);
    } else if (c == '"') {
        return parseString(json, pos);
    } else if (c == 't' || c == 'f' || c == 'n') {
        return parseLiteral(json, pos);
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parseNumber(json, pos);
    }
    throw std::runtime_error("Unexpected character: " + std::string(1, c));
}

JsonValue JsonParser::parseObject(const std::string& json, size_t& pos, int depth) {
    JsonValue obj = JsonValue::object();

    pos++; // Skip '{'
    skipWhitespace(json, pos);

    if (pos < json.length() && json[pos] == '}') {
        pos++;
        return obj;
    }

    while (true) {
        skipWhitespace(json, pos);

        if (pos >= json.length() || json[pos] != '"') {
            throw std::runtime_error("Expected string key in object");
        }

        JsonValue key = parseString(json, pos);
        skipWhitespace(json, pos);

        if (pos >= json.length() || json[pos] != ':') {
            throw std::runtime_error("Expected ':' after object key");
        }
        pos++; // Skip ':'

        JsonValue value = parseValue(json, pos, depth);
        obj.setObjectProperty(key.asString(), value);

        skipWhitespace(json, pos);

        if (pos >= json.length()) {
            throw std::runtime_error("Unexpected end of JSON in object");
        }

        if (json[pos] == '}') {
            pos++;
            return obj;
        } else if (json[pos] == ',') {
            pos++;
        } else {
            throw std::runtime_error("Expected ',' or '}' in object");
        }
    }
}

JsonValue JsonParser::parseArray(const std::string& json, size_t& pos, int depth) {
    JsonValue arr = JsonValue::array();

    pos++; // Skip '['
    skipWhitespace(json, pos);

    if (pos < json.length() && json[pos] == ']') {
        pos++;
        return arr;
    }

    while (true) {
        arr.addArrayElement(parseValue(json, pos, depth));

        skipWhitespace(json, pos);

        if (pos >= json.length()) {
            throw std::runtime_error("Unexpected end of JSON in array");
        }

        if (json[pos] == ']') {
            pos++;
            return arr;
        } else if (json[pos] == ',') {
            pos++;
        } else {
            throw std::runtime_error("Expected ',' or ']' in array");
        }
    }
}

JsonValue JsonParser::parseString(const std::string& json, size_t& pos) {
    pos++; // Skip opening '"'
    std::string result;

    while (pos < json.length()) {
        char c = json[pos];

        if (c == '"') {
            pos++;
            return JsonValue(result);
        }

        if (static_cast<unsigned char>(c) < 0x20) {
            throw std::runtime_error("Unescaped control character in string");
        }

        if (c != '\\') {
            result += c;
            pos++;
            continue;
        }

        pos++; // Skip '\'
        if (pos >= json.length()) {
            throw std::runtime_error("Unexpected end of JSON in string escape");
        }

        char escaped = json[pos];
        switch (escaped) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                uint32_t codepoint = parseHex4(json, pos + 1);
                pos += 4;
                // Surrogate pair
                if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                    if (pos + 2 < json.length() && json[pos + 1] == '\\' && json[pos + 2] == 'u') {
                        uint32_t low = parseHex4(json, pos + 3);
                        if (low < 0xDC00 || low > 0xDFFF) {
                            throw std::runtime_error("Invalid low surrogate in string");
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    } else {
                        throw std::runtime_error("Unpaired surrogate in string");
                    }
                }
                appendUtf8(result, codepoint);
                break;
            }
            default:
                throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
        }
        pos++;
    }

    throw std::runtime_error("Unterminated string");
}

uint32_t JsonParser::parseHex4(const std::string& json, size_t pos) {
    if (pos + 4 > json.length()) {
        throw std::runtime_error("Truncated unicode escape");
    }
    uint32_t value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = json[i];
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            throw std::runtime_error("Invalid unicode escape");
        }
    }
    return value;
}

void JsonParser::appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

JsonValue JsonParser::parseNumber(const std::string& json, size_t& pos) {
    size_t start = pos;

    if (json[pos] == '-') {
        pos++;
    }

    if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
        throw std::runtime_error("Invalid number format");
    }

    if (json[pos] == '0') {
        pos++;
    } else {
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }

    if (pos < json.length() && json[pos] == '.') {
        pos++;
        if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
            throw std::runtime_error("Invalid number format");
        }
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }

    if (pos < json.length() && (json[pos] == 'e' || json[pos] == 'E')) {
        pos++;
        if (pos < json.length() && (json[pos] == '+' || json[pos] == '-')) {
            pos++;
        }
        if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
            throw std::runtime_error("Invalid number format");
        }
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }

    return JsonValue(std::stod(json.substr(start, pos - start)));
}

JsonValue JsonParser::parseLiteral(const std::string& json, size_t& pos) {
    if (json.compare(pos, 4, "true") == 0) {
        pos += 4;
        return JsonValue(true);
    } else if (json.compare(pos, 5, "false") == 0) {
        pos += 5;
        return JsonValue(false);
    } else if (json.compare(pos, 4, "null") == 0) {
        pos += 4;
        return JsonValue();
    }
    throw std::runtime_error("Invalid literal");
}

void JsonParser::skipWhitespace(const std::string& json, size_t& pos) {
    while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        pos++;
    }
}

std::string JsonParser::stringifyValue(const JsonValue& value) {
    switch (value.getType()) {
        case JsonType::NULL_VALUE:
            return "null";
        case JsonType::BOOLEAN:
            return value.asBool() ? "true" : "false";
        case JsonType::NUMBER:
            return stringifyNumber(value.asNumber());
        case JsonType::STRING:
            return "\"" + escapeString(value.asString()) + "\"";
        case JsonType::ARRAY: {
            std::string result = "[";
            const auto& arr = value.asArray();
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) result += ",";
                result += stringifyValue(arr[i]);
            }
            result += "]";
            return result;
        }
        case JsonType::OBJECT: {
            std::string result = "{";
            bool first = true;
            for (const auto& pair : value.asObject()) {
                if (!first) result += ",";
                result += "\"" + escapeString(pair.first) + "\":" + stringifyValue(pair.second);
                first = false;
            }
            result += "}";
            return result;
        }
    }
    return "null";
}

std::string JsonParser::stringifyNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss.precision(15);
    oss << value;
    return oss.str();
}

std::string JsonParser::escapeString(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // namespace utils
} // namespace voicestream
