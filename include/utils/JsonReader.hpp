/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Smallville {

class JsonValue;

// Ordered map keeps written snapshot files stable between saves
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

// Order matches the alternatives of JsonValue::ValueType
enum class JsonType : uint8_t { Null, Boolean, Number, String, Array, Object };

const char* toString(JsonType type);

inline std::ostream& operator<<(std::ostream& os, JsonType type) {
    return os << toString(type);
}

/**
 * A parsed JSON document node. Numbers are held as double; integer reads go
 * through tryAsInt(), which only accepts whole values inside int's range.
 */
class JsonValue {
public:
    using ValueType =
        std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;

    JsonValue() = default;
    explicit JsonValue(std::nullptr_t) {}
    explicit JsonValue(bool value) : m_value(value) {}
    explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
    explicit JsonValue(double value) : m_value(value) {}
    explicit JsonValue(std::string value) : m_value(std::move(value)) {}
    explicit JsonValue(const char* value) : m_value(std::string(value)) {}
    explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
    explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

    JsonType getType() const { return static_cast<JsonType>(m_value.index()); }
    bool isNull() const { return getType() == JsonType::Null; }
    bool isBool() const { return getType() == JsonType::Boolean; }
    bool isNumber() const { return getType() == JsonType::Number; }
    bool isString() const { return getType() == JsonType::String; }
    bool isArray() const { return getType() == JsonType::Array; }
    bool isObject() const { return getType() == JsonType::Object; }

    // Checked reads; a wrong type throws std::bad_variant_access
    bool asBool() const { return std::get<bool>(m_value); }
    double asNumber() const { return std::get<double>(m_value); }
    const std::string& asString() const { return std::get<std::string>(m_value); }
    const JsonArray& asArray() const { return std::get<JsonArray>(m_value); }
    const JsonObject& asObject() const { return std::get<JsonObject>(m_value); }
    JsonArray& asArray() { return std::get<JsonArray>(m_value); }
    JsonObject& asObject() { return std::get<JsonObject>(m_value); }

    // Throws std::out_of_range for fractions and values outside int
    int asInt() const;

    std::optional<bool> tryAsBool() const;
    std::optional<double> tryAsNumber() const;
    // nullopt unless the value is a whole number representable as int
    std::optional<int> tryAsInt() const;
    std::optional<std::string> tryAsString() const;
    const JsonArray* tryAsArray() const { return std::get_if<JsonArray>(&m_value); }
    const JsonObject* tryAsObject() const { return std::get_if<JsonObject>(&m_value); }

    bool hasKey(const std::string& key) const;
    // Missing keys and out-of-range indices read as null
    const JsonValue& operator[](const std::string& key) const;
    const JsonValue& operator[](size_t index) const;
    size_t size() const;

    bool operator==(const JsonValue& other) const { return m_value == other.m_value; }

    /**
     * @brief Serialize to JSON text
     * @param indent Spaces per nesting level; negative writes a single line
     */
    std::string toString(int indent = -1) const;

private:
    void writeToStream(std::ostream& stream, int indent, int depth) const;

    ValueType m_value{nullptr};
};

/**
 * Recursive-descent reader. Failures leave the root null and record a
 * "Line L, Column C: ..." message in getLastError().
 */
class JsonReader {
public:
    JsonReader() = default;

    bool loadFromFile(const std::string& path);
    bool parse(const std::string& jsonString);
    const JsonValue& getRoot() const { return m_root; }
    const std::string& getLastError() const { return m_lastError; }

private:
    bool parseValue(JsonValue& out, int depth);
    bool parseObject(JsonValue& out, int depth);
    bool parseArray(JsonValue& out, int depth);
    bool parseString(std::string& out);
    bool parseNumber(JsonValue& out);
    bool parseLiteral(const char* literal, JsonValue value, JsonValue& out);
    bool parseUnicodeEscape(uint32_t& codepoint);

    char peek() const;
    char advance();
    void skipWhitespace();
    bool atEnd() const { return m_position >= m_input.length(); }
    void setError(const std::string& message);

    std::string m_input;
    size_t m_position{0};
    size_t m_line{1};
    size_t m_column{1};
    std::string m_lastError;
    JsonValue m_root;
};

/**
 * @brief Write a value to a file as indented JSON
 * @return false if the file could not be written
 */
bool writeJsonFile(const std::string& path, const JsonValue& value);

} // namespace Smallville

#endif // JSONREADER_HPP
