#include "RequestValidator.h"

#include "CommonUtils.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace {
using Helios::FieldViolation;

size_t skipDigits(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) ++pos;
    return pos;
}

// Optional sign, digits with an optional fraction, optional exponent; or
// inf / infinity / nan. Hex floats and other strtod extensions are refused.
bool isDecimalLiteral(const std::string& text) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;

    const std::string rest = CommonUtils::toLower(text.substr(pos));
    if (rest == "inf" || rest == "infinity" || rest == "nan") return true;

    const size_t intEnd = skipDigits(text, pos);
    size_t digits = intEnd - pos;
    pos = intEnd;
    if (pos < text.size() && text[pos] == '.') {
        const size_t fracEnd = skipDigits(text, pos + 1);
        digits += fracEnd - (pos + 1);
        pos = fracEnd;
    }
    if (digits == 0) return false;

    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;
        const size_t expEnd = skipDigits(text, pos);
        if (expEnd == pos) return false;
        pos = expEnd;
    }
    return pos == text.size();
}

// Lax float parsing: numeric strings such as "25.5" are accepted.
bool coerceNumber(const JsonValue& value, double& out) {
    if (value.isNumber()) {
        out = value.numberValue;
        return true;
    }
    if (!value.isString()) {
        return false;
    }
    const std::string text = CommonUtils::trim(value.stringValue);
    if (!isDecimalLiteral(text)) {
        return false;
    }
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return false;
    }
    out = parsed;
    return true;
}

FieldViolation makeViolation(const std::string& field,
                             const std::string& type,
                             const std::string& message,
                             const JsonValue* input,
                             const std::string& contextJson = "") {
    FieldViolation v;
    v.field = field;
    v.type = type;
    v.message = message;
    v.inputJson = input != nullptr ? input->dump() : "";
    v.contextJson = contextJson;
    return v;
}
} // namespace

std::vector<FieldViolation> RequestValidator::checkBounds(const FeatureField& field, double value) {
    std::vector<FieldViolation> out;
    JsonValue input;
    input.type = JsonValue::Type::Number;
    input.numberValue = value;

    if (!std::isfinite(value)) {
        out.push_back(makeViolation(field.wireName, "finite_number", "Input should be a finite number", &input));
        return out;
    }
    if (field.minInclusive && value < *field.minInclusive) {
        const std::string bound = CommonUtils::formatDouble(*field.minInclusive);
        out.push_back(makeViolation(field.wireName,
                                    "greater_than_equal",
                                    "Input should be greater than or equal to " + bound,
                                    &input,
                                    "{\"ge\":" + bound + "}"));
    }
    if (field.maxInclusive && value > *field.maxInclusive) {
        const std::string bound = CommonUtils::formatDouble(*field.maxInclusive);
        out.push_back(makeViolation(field.wireName,
                                    "less_than_equal",
                                    "Input should be less than or equal to " + bound,
                                    &input,
                                    "{\"le\":" + bound + "}"));
    }
    return out;
}

FeatureRecord RequestValidator::validate(const JsonValue& payload) {
    if (!payload.isObject()) {
        throw Helios::ValidationException({makeViolation("", "model_attributes_type",
                                                         "Input should be a valid dictionary or object", &payload)});
    }

    FeatureRecord record;
    std::vector<FieldViolation> violations;
    for (const auto& field : featureLayout()) {
        const JsonValue* node = payload.find(field.wireName);
        if (node == nullptr) {
            violations.push_back(makeViolation(field.wireName, "missing", "Field required", nullptr));
            continue;
        }

        double value = 0.0;
        if (!coerceNumber(*node, value)) {
            violations.push_back(makeViolation(field.wireName, "float_parsing",
                                               "Input should be a valid number", node));
            continue;
        }

        auto fieldViolations = checkBounds(field, value);
        if (!fieldViolations.empty()) {
            violations.insert(violations.end(), fieldViolations.begin(), fieldViolations.end());
            continue;
        }
        record.*(field.member) = value;
    }

    if (!violations.empty()) {
        throw Helios::ValidationException(std::move(violations));
    }
    return record;
}

FeatureRecord RequestValidator::validateBody(const std::string& body) {
    JsonValue payload;
    try {
        payload = JsonValue::parse(body);
    } catch (const Helios::JsonException& e) {
        FieldViolation v;
        v.type = "json_invalid";
        v.message = std::string("JSON decode error: ") + e.what();
        throw Helios::ValidationException({v});
    }
    return validate(payload);
}
