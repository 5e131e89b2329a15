#pragma once

#include <string>
#include <vector>

// Fitted per-feature z-score transform: (x - mean) / scale.
class StandardScaler {
public:
    StandardScaler() = default;

    /**
     * @brief Builds a scaler from fitted statistics.
     * @throws Helios::ArtifactException if sizes differ, the vectors are empty,
     *         or any value is non-finite / a scale is zero.
     */
    StandardScaler(std::vector<double> meanValues, std::vector<double> scaleValues);

    size_t featureCount() const noexcept { return means.size(); }
    const std::vector<double>& mean() const noexcept { return means; }
    const std::vector<double>& scale() const noexcept { return scales; }

    /// @throws Helios::InferenceException on length mismatch or non-finite output.
    std::vector<double> transform(const std::vector<double>& features) const;

    void saveBinary(const std::string& filename) const;
    static StandardScaler loadBinary(const std::string& filename);

private:
    std::vector<double> means;
    std::vector<double> scales;
};
