/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Smallville {

namespace {

// Guards against stack exhaustion on hostile input
constexpr int MAX_NESTING_DEPTH = 256;

void writeEscapedString(std::ostream& stream, const std::string& str) {
    stream << '"';
    for (char c : str) {
        switch (c) {
        case '"':
            stream << "\\\"";
            break;
        case '\\':
            stream << "\\\\";
            break;
        case '\b':
            stream << "\\b";
            break;
        case '\f':
            stream << "\\f";
            break;
        case '\n':
            stream << "\\n";
            break;
        case '\r':
            stream << "\\r";
            break;
        case '\t':
            stream << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                stream << std::format("\\u{:04x}", static_cast<unsigned>(c));
            } else {
                stream << c;
            }
        }
    }
    stream << '"';
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
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

} // anonymous namespace

const char* toString(JsonType type) {
    switch (type) {
    case JsonType::Null:
        return "Null";
    case JsonType::Boolean:
        return "Boolean";
    case JsonType::Number:
        return "Number";
    case JsonType::String:
        return "String";
    case JsonType::Array:
        return "Array";
    case JsonType::Object:
        return "Object";
    }
    return "Unknown";
}

std::optional<bool> JsonValue::tryAsBool() const {
    if (const bool* value = std::get_if<bool>(&m_value))
        return *value;
    return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
    if (const double* value = std::get_if<double>(&m_value))
        return *value;
    return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
    const double* value = std::get_if<double>(&m_value);
    // NaN fails both range comparisons
    if (value == nullptr ||
        !(*value >= static_cast<double>(std::numeric_limits<int>::min()) &&
          *value <= static_cast<double>(std::numeric_limits<int>::max())) ||
        std::trunc(*value) != *value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

int JsonValue::asInt() const {
    const auto value = tryAsInt();
    if (!value) {
        throw std::out_of_range(std::format("JSON number {} is not an int", asNumber()));
    }
    return *value;
}

std::optional<std::string> JsonValue::tryAsString() const {
    if (const std::string* value = std::get_if<std::string>(&m_value))
        return *value;
    return std::nullopt;
}

bool JsonValue::hasKey(const std::string& key) const {
    return isObject() && asObject().contains(key);
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue null_value;
    if (!isObject())
        return null_value;
    const auto& obj = asObject();
    auto it = obj.find(key);
    return (it != obj.end()) ? it->second : null_value;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    static const JsonValue null_value;
    if (!isArray() || index >= asArray().size())
        return null_value;
    return asArray()[index];
}

size_t JsonValue::size() const {
    if (isArray())
        return asArray().size();
    if (isObject())
        return asObject().size();
    return 0;
}

std::string JsonValue::toString(int indent) const {
    std::ostringstream oss;
    writeToStream(oss, indent, 0);
    return oss.str();
}

void JsonValue::writeToStream(std::ostream& stream, int indent, int depth) const {
    const bool pretty = indent >= 0;
    auto newline = [&](int level) {
        if (pretty) {
            stream << '\n' << std::string(static_cast<size_t>(indent * level), ' ');
        }
    };

    switch (getType()) {
    case JsonType::Null:
        stream << "null";
        break;
    case JsonType::Boolean:
        stream << (asBool() ? "true" : "false");
        break;
    case JsonType::Number: {
        double num = asNumber();
        if (std::floor(num) == num && std::abs(num) < 1e15) {
            stream << static_cast<long long>(num);
        } else {
            stream << std::format("{}", num);
        }
        break;
    }
    case JsonType::String:
        writeEscapedString(stream, asString());
        break;
    case JsonType::Array: {
        const auto& arr = asArray();
        stream << '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0)
                stream << ',';
            newline(depth + 1);
            arr[i].writeToStream(stream, indent, depth + 1);
        }
        if (!arr.empty())
            newline(depth);
        stream << ']';
        break;
    }
    case JsonType::Object: {
        const auto& obj = asObject();
        stream << '{';
        bool first = true;
        for (const auto& [key, value] : obj) {
            if (!first)
                stream << ',';
            first = false;
            newline(depth + 1);
            writeEscapedString(stream, key);
            stream << (pretty ? ": " : ":");
            value.writeToStream(stream, indent, depth + 1);
        }
        if (!obj.empty())
            newline(depth);
        stream << '}';
        break;
    }
    }
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_lastError = "Could not open file: " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

bool JsonReader::parse(const std::string& jsonString) {
    m_lastError.clear();
    m_input = jsonString;
    m_position = 0;
    m_line = 1;
    m_column = 1;
    m_root = JsonValue();

    JsonValue result;
    skipWhitespace();
    if (atEnd()) {
        setError("Empty JSON input");
        return false;
    }
    if (!parseValue(result, 0)) {
        return false;
    }

    skipWhitespace();
    if (!atEnd()) {
        setError("Unexpected data after JSON value");
        return false;
    }

    m_root = std::move(result);
    return true;
}

void JsonReader::setError(const std::string& message) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
}

char JsonReader::peek() const {
    return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
    if (atEnd())
        return '\0';

    char c = m_input[m_position++];
    if (c == '\n') {
        m_line++;
        m_column = 1;
    } else {
        m_column++;
    }
    return c;
}

void JsonReader::skipWhitespace() {
    while (!atEnd()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
            break;
        advance();
    }
}

bool JsonReader::parseValue(JsonValue& out, int depth) {
    if (depth > MAX_NESTING_DEPTH) {
        setError("Nesting too deep");
        return false;
    }

    skipWhitespace();
    switch (peek()) {
    case '{':
        return parseObject(out, depth);
    case '[':
        return parseArray(out, depth);
    case '"': {
        std::string str;
        if (!parseString(str))
            return false;
        out = JsonValue(std::move(str));
        return true;
    }
    case 't':
        return parseLiteral("true", JsonValue(true), out);
    case 'f':
        return parseLiteral("false", JsonValue(false), out);
    case 'n':
        return parseLiteral("null", JsonValue(), out);
    case '\0':
        setError("Unexpected end of input");
        return false;
    default:
        if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
            return parseNumber(out);
        }
        setError("Unexpected character: " + std::string(1, peek()));
        return false;
    }
}

bool JsonReader::parseObject(JsonValue& out, int depth) {
    advance(); // '{'
    JsonObject result;

    skipWhitespace();
    if (peek() == '}') {
        advance();
        out = JsonValue(std::move(result));
        return true;
    }

    while (true) {
        skipWhitespace();
        if (peek() != '"') {
            setError("Expected string key in object");
            return false;
        }
        std::string key;
        if (!parseString(key))
            return false;

        skipWhitespace();
        if (advance() != ':') {
            setError("Expected ':' after object key");
            return false;
        }

        JsonValue value;
        if (!parseValue(value, depth + 1))
            return false;
        result[key] = std::move(value);

        skipWhitespace();
        char c = advance();
        if (c == '}')
            break;
        if (c != ',') {
            setError("Expected '}' or ',' in object");
            return false;
        }
    }

    out = JsonValue(std::move(result));
    return true;
}

bool JsonReader::parseArray(JsonValue& out, int depth) {
    advance(); // '['
    JsonArray result;

    skipWhitespace();
    if (peek() == ']') {
        advance();
        out = JsonValue(std::move(result));
        return true;
    }

    while (true) {
        JsonValue value;
        if (!parseValue(value, depth + 1))
            return false;
        result.push_back(std::move(value));

        skipWhitespace();
        char c = advance();
        if (c == ']')
            break;
        if (c != ',') {
            setError("Expected ']' or ',' in array");
            return false;
        }
    }

    out = JsonValue(std::move(result));
    return true;
}

bool JsonReader::parseString(std::string& out) {
    advance(); // opening quote
    out.clear();

    while (!atEnd()) {
        char c = advance();

        if (c == '"')
            return true;

        if (static_cast<unsigned char>(c) < 0x20) {
            setError("Unescaped control character in string");
            return false;
        }

        if (c != '\\') {
            out += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            out += escaped;
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
            uint32_t codepoint = 0;
            if (!parseUnicodeEscape(codepoint))
                return false;
            appendUtf8(out, codepoint);
            break;
        }
        default:
            setError("Invalid escape sequence: \\" + std::string(1, escaped));
            return false;
        }
    }

    setError("Unterminated string");
    return false;
}

bool JsonReader::parseNumber(JsonValue& out) {
    const size_t start = m_position;

    if (peek() == '-')
        advance();

    auto consumeDigits = [this]() {
        size_t count = 0;
        while (peek() >= '0' && peek() <= '9') {
            advance();
            ++count;
        }
        return count;
    };

    if (peek() == '0') {
        advance();
    } else if (consumeDigits() == 0) {
        setError("Invalid number format");
        return false;
    }

    if (peek() == '.') {
        advance();
        if (consumeDigits() == 0) {
            setError("Invalid number format: expected digit after decimal point");
            return false;
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        advance();
        if (peek() == '+' || peek() == '-')
            advance();
        if (consumeDigits() == 0) {
            setError("Invalid number format: expected digit in exponent");
            return false;
        }
    }

    double value = 0.0;
    const char* first = m_input.data() + start;
    const char* last = m_input.data() + m_position;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        setError("Invalid number: " + std::string(first, last));
        return false;
    }

    out = JsonValue(value);
    return true;
}

bool JsonReader::parseLiteral(const char* literal, JsonValue value, JsonValue& out) {
    for (const char* p = literal; *p != '\0'; ++p) {
        if (advance() != *p) {
            setError(std::format("Invalid token, expected '{}'", literal));
            return false;
        }
    }
    out = std::move(value);
    return true;
}

bool JsonReader::parseUnicodeEscape(uint32_t& codepoint) {
    codepoint = 0;
    for (int i = 0; i < 4; ++i) {
        char c = advance();
        uint32_t digit;
        if (c >= '0' && c <= '9') {
            digit = static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<uint32_t>(c - 'A' + 10);
        } else {
            setError("Invalid Unicode escape sequence");
            return false;
        }
        codepoint = (codepoint << 4) | digit;
    }
    return true;
}

bool writeJsonFile(const std::string& path, const JsonValue& value) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << value.toString(2) << '\n';
    file.close();
    return !file.fail();
}

} // namespace Smallville
