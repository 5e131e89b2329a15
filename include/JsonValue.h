#pragma once

#include <string>
#include <unordered_map>
#include <vector>

// Minimal JSON document model used for request bodies and pack inputs.
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::unordered_map<std::string, JsonValue> objectValue;

    bool isNull() const noexcept { return type == Type::Null; }
    bool isBool() const noexcept { return type == Type::Bool; }
    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }

    const JsonValue* find(const std::string& key) const;
    std::string dump() const;

    /**
     * @brief Parses a complete JSON text.
     * @throws Helios::JsonException on syntax errors, trailing content or
     *         nesting deeper than 64 levels.
     */
    static JsonValue parse(const std::string& text);
};

std::string escapeJsonString(const std::string& value);
