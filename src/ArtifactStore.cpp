#include "ArtifactStore.h"

#include "FeatureRecord.h"
#include "HeliosExceptions.h"

#include <filesystem>
#include <system_error>
#include <utility>

ArtifactPair::ArtifactPair(StandardScaler scalerValue, ForestRegressor regressorValue, std::string versionValue)
    : scaler(std::move(scalerValue)), regressor(std::move(regressorValue)), version(std::move(versionValue)) {}

ArtifactStore::ArtifactStore(std::string baseDirectory) : baseDir(std::move(baseDirectory)) {}

ArtifactPaths ArtifactStore::pathsFor(const std::string& version) const {
    if (version.empty()) {
        throw Helios::ArtifactException("Model version tag cannot be empty");
    }
    if (version.find('/') != std::string::npos || version.find('\\') != std::string::npos || version == "." ||
        version == "..") {
        throw Helios::ArtifactException("Model version tag must not contain path separators: " + version);
    }

    const std::filesystem::path base(baseDir);
    ArtifactPaths paths;
    paths.scalerPath = (base / ("scaler_" + version + ".bin")).string();
    paths.modelPath = (base / ("model_" + version + ".bin")).string();
    return paths;
}

ArtifactPair ArtifactStore::load(const std::string& version) const {
    const ArtifactPaths paths = pathsFor(version);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(paths.scalerPath, ec)) {
        throw Helios::IOException("Scaler artifact not found: " + paths.scalerPath);
    }
    if (!std::filesystem::is_regular_file(paths.modelPath, ec)) {
        throw Helios::IOException("Model artifact not found: " + paths.modelPath);
    }

    StandardScaler scaler = StandardScaler::loadBinary(paths.scalerPath);
    ForestRegressor regressor = ForestRegressor::loadBinary(paths.modelPath);

    if (scaler.featureCount() != regressor.featureCount()) {
        throw Helios::ArtifactException("Scaler/model feature count mismatch for version " + version + ": " +
                                        std::to_string(scaler.featureCount()) + " vs " +
                                        std::to_string(regressor.featureCount()));
    }
    if (scaler.featureCount() != kFeatureCount) {
        throw Helios::ArtifactException("Artifacts for version " + version + " expect " +
                                        std::to_string(scaler.featureCount()) + " features, service provides " +
                                        std::to_string(kFeatureCount));
    }

    return ArtifactPair(std::move(scaler), std::move(regressor), version);
}

void ArtifactStore::save(const StandardScaler& scaler, const ForestRegressor& regressor, const std::string& version) const {
    const ArtifactPaths paths = pathsFor(version);

    std::error_code ec;
    std::filesystem::create_directories(baseDir, ec);
    if (ec) {
        throw Helios::IOException("Could not create artifact directory " + baseDir + ": " + ec.message());
    }

    scaler.saveBinary(paths.scalerPath);
    regressor.saveBinary(paths.modelPath);
}
