#pragma once

#include "FeatureRecord.h"
#include "HeliosExceptions.h"
#include "JsonValue.h"

#include <string>
#include <vector>

// Turns an inbound payload into a range-checked FeatureRecord.
class RequestValidator {
public:
    /**
     * @brief Validates a parsed JSON payload field by field.
     * @post Every violated field is reported, not only the first.
     * @throws Helios::ValidationException listing all violations.
     */
    static FeatureRecord validate(const JsonValue& payload);

    /**
     * @brief Parses then validates a request body.
     * @throws Helios::ValidationException (json_invalid when the body is not JSON).
     */
    static FeatureRecord validateBody(const std::string& body);

    /// Bound checks only; returns the violations for one already-numeric value.
    static std::vector<Helios::FieldViolation> checkBounds(const FeatureField& field, double value);
};
