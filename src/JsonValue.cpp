#include "JsonValue.h"

#include "CommonUtils.h"
#include "HeliosExceptions.h"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace {
constexpr size_t kMaxNestingDepth = 64;

void appendUtf8(std::string& out, uint32_t codePoint) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue(0);
        skipWhitespace();
        if (position != text.size()) {
            fail("Unexpected trailing JSON content");
        }
        return value;
    }

private:
    const std::string& text;
    size_t position = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw Helios::JsonException(what + " at offset " + std::to_string(position));
    }

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) {
            fail("Unexpected end of JSON input");
        }
        return text[position];
    }

    char take() {
        if (position >= text.size()) {
            fail("Unexpected end of JSON input");
        }
        return text[position++];
    }

    void expect(char expected) {
        if (take() != expected) {
            --position;
            fail(std::string("Expected JSON character '") + expected + "'");
        }
    }

    JsonValue parseValue(size_t depth) {
        if (depth > kMaxNestingDepth) {
            fail("JSON nesting too deep");
        }
        skipWhitespace();
        const char c = peek();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == '"') return parseString();
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        fail("Invalid JSON token");
    }

    JsonValue parseObject(size_t depth) {
        JsonValue object;
        object.type = JsonValue::Type::Object;

        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            return object;
        }

        while (true) {
            skipWhitespace();
            JsonValue key = parseString();
            skipWhitespace();
            expect(':');
            JsonValue value = parseValue(depth + 1);
            // Last duplicate wins.
            object.objectValue[key.stringValue] = std::move(value);

            skipWhitespace();
            const char next = take();
            if (next == '}') break;
            if (next != ',') fail("Expected ',' or '}' in JSON object");
        }
        return object;
    }

    JsonValue parseArray(size_t depth) {
        JsonValue array;
        array.type = JsonValue::Type::Array;

        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue(depth + 1));
            skipWhitespace();
            const char next = take();
            if (next == ']') break;
            if (next != ',') fail("Expected ',' or ']' in JSON array");
        }
        return array;
    }

    uint32_t parseHex4() {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = take();
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else fail("Invalid \\u escape in JSON string");
        }
        return value;
    }

    JsonValue parseString() {
        JsonValue str;
        str.type = JsonValue::Type::String;

        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("Unescaped control character in JSON string");
            }
            if (c != '\\') {
                str.stringValue.push_back(c);
                continue;
            }
            const char escaped = take();
            switch (escaped) {
                case '"': str.stringValue.push_back('"'); break;
                case '\\': str.stringValue.push_back('\\'); break;
                case '/': str.stringValue.push_back('/'); break;
                case 'b': str.stringValue.push_back('\b'); break;
                case 'f': str.stringValue.push_back('\f'); break;
                case 'n': str.stringValue.push_back('\n'); break;
                case 'r': str.stringValue.push_back('\r'); break;
                case 't': str.stringValue.push_back('\t'); break;
                case 'u': {
                    uint32_t codePoint = parseHex4();
                    if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
                        if (take() != '\\' || take() != 'u') {
                            fail("Unpaired surrogate in JSON string");
                        }
                        const uint32_t low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("Invalid low surrogate in JSON string");
                        }
                        codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
                    } else if (codePoint >= 0xDC00 && codePoint <= 0xDFFF) {
                        fail("Unpaired surrogate in JSON string");
                    }
                    appendUtf8(str.stringValue, codePoint);
                    break;
                }
                default:
                    fail("Unsupported escaped character in JSON string");
            }
        }
        return str;
    }

    JsonValue parseBoolean() {
        JsonValue value;
        value.type = JsonValue::Type::Bool;
        if (text.compare(position, 4, "true") == 0) {
            value.booleanValue = true;
            position += 4;
            return value;
        }
        if (text.compare(position, 5, "false") == 0) {
            value.booleanValue = false;
            position += 5;
            return value;
        }
        fail("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) {
            fail("Invalid JSON null value");
        }
        position += 4;
        return JsonValue{};
    }

    void consumeDigits() {
        while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    JsonValue parseNumber() {
        const size_t start = position;
        if (peek() == '-') take();

        if (std::isdigit(static_cast<unsigned char>(peek())) == 0) {
            fail("Invalid JSON number");
        }
        if (peek() == '0') {
            take();
        } else {
            consumeDigits();
        }

        if (position < text.size() && text[position] == '.') {
            ++position;
            if (position >= text.size() || std::isdigit(static_cast<unsigned char>(text[position])) == 0) {
                fail("Invalid JSON number fraction");
            }
            consumeDigits();
        }

        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) {
                ++position;
            }
            if (position >= text.size() || std::isdigit(static_cast<unsigned char>(text[position])) == 0) {
                fail("Invalid JSON number exponent");
            }
            consumeDigits();
        }

        const std::string token = text.substr(start, position - start);
        JsonValue number;
        number.type = JsonValue::Type::Number;
        // Overflow yields +/-HUGE_VAL; callers decide whether that is acceptable.
        number.numberValue = std::strtod(token.c_str(), nullptr);
        return number;
    }
};
} // namespace

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    auto it = objectValue.find(key);
    if (it == objectValue.end()) return nullptr;
    return &it->second;
}

std::string JsonValue::dump() const {
    switch (type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return booleanValue ? "true" : "false";
        case Type::Number:
            return CommonUtils::formatDouble(numberValue);
        case Type::String:
            return "\"" + escapeJsonString(stringValue) + "\"";
        case Type::Array: {
            std::ostringstream out;
            out << '[';
            for (size_t i = 0; i < arrayValue.size(); ++i) {
                if (i > 0) out << ',';
                out << arrayValue[i].dump();
            }
            out << ']';
            return out.str();
        }
        case Type::Object: {
            std::ostringstream out;
            out << '{';
            bool first = true;
            for (const auto& kv : objectValue) {
                if (!first) out << ',';
                first = false;
                out << '"' << escapeJsonString(kv.first) << "\":" << kv.second.dump();
            }
            out << '}';
            return out.str();
        }
    }
    return "null";
}

JsonValue JsonValue::parse(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out << buffer;
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}
