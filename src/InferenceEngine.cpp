#include "InferenceEngine.h"

#include "HeliosExceptions.h"

#include <exception>
#include <iostream>
#include <memory>

InferenceEngine::InferenceEngine(const ModelRegistry& registryRef) : registry(registryRef) {}

PredictionResult InferenceEngine::predict(const FeatureVector& features) const {
    return predictRaw(FeatureAssembler::toDynamic(features));
}

PredictionResult InferenceEngine::predictRaw(const std::vector<double>& features) const {
    const std::shared_ptr<const ArtifactPair> pair = registry.current();

    PredictionResult result;
    result.modelVersion = pair->version;
    try {
        const std::vector<double> scaled = pair->scaler.transform(features);
        result.value = pair->regressor.predict(scaled);
    } catch (const Helios::InferenceException& e) {
        std::cerr << "[HeliosInference][Error] version=" << pair->version << " error=" << e.what() << "\n";
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[HeliosInference][Error] version=" << pair->version << " error=" << e.what() << "\n";
        throw Helios::InferenceException(e.what());
    }
    return result;
}
