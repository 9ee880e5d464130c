#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace voicestream {
namespace utils {

enum class JsonType {
    NULL_VALUE,
    BOOLEAN,
    NUMBER,
    STRING,
    ARRAY,
    OBJECT
};

class JsonValue {
public:
    JsonValue() : type_(JsonType::NULL_VALUE) {}
    explicit JsonValue(bool value) : type_(JsonType::BOOLEAN), bool_value_(value) {}
    explicit JsonValue(double value) : type_(JsonType::NUMBER), number_value_(value) {}
    explicit JsonValue(int value) : type_(JsonType::NUMBER), number_value_(static_cast<double>(value)) {}
    explicit JsonValue(const std::string& value) : type_(JsonType::STRING), string_value_(value) {}
    explicit JsonValue(const char* value) : type_(JsonType::STRING), string_value_(value ? value : "") {}

    static JsonValue object();
    static JsonValue array();

    JsonType getType() const { return type_; }
    bool isNull() const { return type_ == JsonType::NULL_VALUE; }
    bool isObject() const { return type_ == JsonType::OBJECT; }
    bool isArray() const { return type_ == JsonType::ARRAY; }
    bool isString() const { return type_ == JsonType::STRING; }
    bool isNumber() const { return type_ == JsonType::NUMBER; }
    bool isBool() const { return type_ == JsonType::BOOLEAN; }

    bool asBool() const { return bool_value_; }
    double asNumber() const { return number_value_; }
    int64_t asInt() const { return static_cast<int64_t>(number_value_); }
    const std::string& asString() const { return string_value_; }

    void setBool(bool value) { type_ = JsonType::BOOLEAN; bool_value_ = value; }
    void setNumber(double value) { type_ = JsonType::NUMBER; number_value_ = value; }
    void setString(const std::string& value) { type_ = JsonType::STRING; string_value_ = value; }

    // Array operations
    void setArray() { type_ = JsonType::ARRAY; array_value_.clear(); }
    void addArrayElement(const JsonValue& value) { array_value_.push_back(value); }
    const std::vector<JsonValue>& asArray() const { return array_value_; }

    // Object operations
    void setObject() { type_ = JsonType::OBJECT; object_value_.clear(); }
    void setObjectProperty(const std::string& key, const JsonValue& value) { object_value_[key] = value; }
    const std::map<std::string, JsonValue>& asObject() const { return object_value_; }
    bool hasProperty(const std::string& key) const { return object_value_.find(key) != object_value_.end(); }
    const JsonValue& getProperty(const std::string& key) const;

    // Typed lookups that fall back when the key is missing or has another type
    std::string getString(const std::string& key, const std::string& fallback = "") const;
    double getNumber(const std::string& key, double fallback = 0.0) const;
    bool getBool(const std::string& key, bool fallback = false) const;

private:
    JsonType type_;
    bool bool_value_ = false;
    double number_value_ = 0.0;
    std::string string_value_;
    std::vector<JsonValue> array_value_;
    std::map<std::string, JsonValue> object_value_;
    static const JsonValue null_value_;
};

/**
 * Minimal JSON reader/writer used for REST bodies, WebSocket frames and
 * configuration files. parse() throws std::runtime_error on malformed input,
 * including trailing characters after the top-level value.
 */
class JsonParser {
public:
    static JsonValue parse(const std::string& json);
    static bool tryParse(const std::string& json, JsonValue& out);
    static std::string stringify(const JsonValue& value);

private:
    static JsonValue parseValue(const std::string& json, size_t& pos, int depth);
    static JsonValue parseObject(const std::string& json, size_t& pos, int depth);
    static JsonValue parseArray(const std::string& json, size_t& pos, int depth);
    static JsonValue parseString(const std::string& json, size_t& pos);
    static JsonValue parseNumber(const std::string& json, size_t& pos);
    static JsonValue parseLiteral(const std::string& json, size_t& pos);
    static uint32_t parseHex4(const std::string& json, size_t pos);
    static void appendUtf8(std::string& out, uint32_t codepoint);

    static void skipWhitespace(const std::string& json, size_t& pos);
    static std::string stringifyValue(const JsonValue& value);
    static std::string stringifyNumber(double value);
    static std::string escapeString(const std::string& str);

    static constexpr int kMaxDepth = 64;
};

} // namespace utils
} // namespace voicestream
