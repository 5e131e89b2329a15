#ifndef HELIOS_EXCEPTIONS_H
#define HELIOS_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Helios {

class HeliosException : public std::runtime_error {
public:
    explicit HeliosException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public HeliosException {
public:
    explicit IOException(const std::string& message) : HeliosException("IO Error: " + message) {}
};

class ConfigurationException : public HeliosException {
public:
    explicit ConfigurationException(const std::string& message) : HeliosException("Configuration Error: " + message) {}
};

class ArtifactException : public HeliosException {
public:
    explicit ArtifactException(const std::string& message) : HeliosException("Artifact Error: " + message) {}
};

class JsonException : public HeliosException {
public:
    explicit JsonException(const std::string& message) : HeliosException(message) {}
};

// One rejected request field. `type` is the machine-readable reason
// (missing, float_parsing, greater_than_equal, ...).
struct FieldViolation {
    std::string field;
    std::string type;
    std::string message;
    std::string inputJson;   // raw offending value as JSON, empty when absent
    std::string contextJson; // e.g. {"ge":-10}, empty when not applicable
};

class ValidationException : public HeliosException {
public:
    explicit ValidationException(std::vector<FieldViolation> violationsValue)
        : HeliosException(summarize(violationsValue)), violationList(std::move(violationsValue)) {}

    const std::vector<FieldViolation>& violations() const noexcept { return violationList; }

private:
    static std::string summarize(const std::vector<FieldViolation>& items) {
        std::string out = "Validation Error: " + std::to_string(items.size()) + " invalid field(s)";
        for (const auto& v : items) {
            out += "; " + v.field + " (" + v.type + ")";
        }
        return out;
    }

    std::vector<FieldViolation> violationList;
};

class ServiceUnavailableException : public HeliosException {
public:
    explicit ServiceUnavailableException(const std::string& message) : HeliosException("Service Unavailable: " + message) {}
};

class InferenceException : public HeliosException {
public:
    explicit InferenceException(const std::string& message) : HeliosException("Inference Error: " + message) {}
};

} // namespace Helios

#endif // HELIOS_EXCEPTIONS_H
