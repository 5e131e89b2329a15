#pragma once

#include "ForestRegressor.h"
#include "StandardScaler.h"

#include <string>

// Scaler + regressor fitted together for one model generation. Shared as
// std::shared_ptr<const ArtifactPair> once installed.
struct ArtifactPair {
    StandardScaler scaler;
    ForestRegressor regressor;
    std::string version;

    ArtifactPair(StandardScaler scalerValue, ForestRegressor regressorValue, std::string versionValue);
};

struct ArtifactPaths {
    std::string scalerPath;
    std::string modelPath;
};

// Resolves versioned artifact files under a fixed base directory:
//   <baseDir>/scaler_<version>.bin and <baseDir>/model_<version>.bin
class ArtifactStore {
public:
    explicit ArtifactStore(std::string baseDirectory);

    const std::string& baseDirectory() const noexcept { return baseDir; }

    /// @throws Helios::ArtifactException for empty tags or tags containing path separators.
    ArtifactPaths pathsFor(const std::string& version) const;

    /**
     * @brief Loads and cross-checks both artifacts of a version.
     * @throws Helios::IOException when a file is missing or unreadable.
     * @throws Helios::ArtifactException on corrupt files or a feature-count
     *         mismatch between scaler, regressor and the served record.
     */
    ArtifactPair load(const std::string& version) const;

    /// Writes both files for a version, creating the base directory if needed.
    void save(const StandardScaler& scaler, const ForestRegressor& regressor, const std::string& version) const;

private:
    std::string baseDir;
};
