#pragma once

#include "FeatureRecord.h"
#include "ModelRegistry.h"

#include <string>
#include <vector>

struct PredictionResult {
    double value = 0.0;
    std::string unit = "Watts";
    std::string modelVersion;
};

// Scales a feature vector with the active scaler and scores it with the
// active regressor. Stateless apart from the registry reference.
class InferenceEngine {
public:
    explicit InferenceEngine(const ModelRegistry& registry);

    /**
     * @throws Helios::ServiceUnavailableException if no model is loaded.
     * @throws Helios::InferenceException on shape mismatch or numeric failure.
     */
    PredictionResult predict(const FeatureVector& features) const;

    /// Variant for vectors of arbitrary length; same error contract.
    PredictionResult predictRaw(const std::vector<double>& features) const;

private:
    const ModelRegistry& registry;
};
