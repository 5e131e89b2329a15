#include "StandardScaler.h"

#include "BinaryIO.h"
#include "HeliosExceptions.h"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <utility>

namespace {
constexpr char kScalerSignature[] = "HELIOS_SCALER_V1";
constexpr uint32_t kScalerFormatVersion = 1;
constexpr uint64_t kMaxFeatures = 4096;
} // namespace

StandardScaler::StandardScaler(std::vector<double> meanValues, std::vector<double> scaleValues)
    : means(std::move(meanValues)), scales(std::move(scaleValues)) {
    if (means.empty()) {
        throw Helios::ArtifactException("Scaler must describe at least one feature");
    }
    if (means.size() != scales.size()) {
        throw Helios::ArtifactException("Scaler mean/scale length mismatch: " + std::to_string(means.size()) +
                                        " vs " + std::to_string(scales.size()));
    }
    for (size_t i = 0; i < means.size(); ++i) {
        if (!std::isfinite(means[i])) {
            throw Helios::ArtifactException("Scaler mean[" + std::to_string(i) + "] is not finite");
        }
        if (!std::isfinite(scales[i]) || scales[i] == 0.0) {
            throw Helios::ArtifactException("Scaler scale[" + std::to_string(i) + "] must be finite and non-zero");
        }
    }
}

std::vector<double> StandardScaler::transform(const std::vector<double>& features) const {
    if (features.size() != means.size()) {
        throw Helios::InferenceException("Scaler expects " + std::to_string(means.size()) +
                                         " features, got " + std::to_string(features.size()));
    }
    std::vector<double> out(features.size());
    for (size_t i = 0; i < features.size(); ++i) {
        out[i] = (features[i] - means[i]) / scales[i];
        if (!std::isfinite(out[i])) {
            throw Helios::InferenceException("Scaled feature " + std::to_string(i) + " is not finite");
        }
    }
    return out;
}

void StandardScaler::saveBinary(const std::string& filename) const {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) throw Helios::IOException("Could not open " + filename + " for writing");

    out.write(kScalerSignature, sizeof(kScalerSignature));
    BinaryIO::ChecksumWriter writer(out);
    writer.put(kScalerFormatVersion);
    writer.put(static_cast<uint64_t>(means.size()));
    for (double m : means) writer.put(m);
    for (double s : scales) writer.put(s);
    writer.finish();

    out.flush();
    if (!out) throw Helios::IOException("Failed to flush " + filename);
}

StandardScaler StandardScaler::loadBinary(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Helios::IOException("Could not open " + filename + " for reading");

    char signature[sizeof(kScalerSignature)] = {};
    in.read(signature, sizeof(signature));
    if (!in) throw Helios::ArtifactException("Failed to read scaler signature from " + filename);
    if (std::string(signature, sizeof(signature) - 1) != kScalerSignature || signature[sizeof(signature) - 1] != '\0') {
        throw Helios::ArtifactException("Unsupported or invalid scaler signature in " + filename);
    }

    BinaryIO::ChecksumReader reader(in);
    const uint32_t version = reader.get<uint32_t>();
    if (version != kScalerFormatVersion) {
        throw Helios::ArtifactException("Unsupported scaler format version " + std::to_string(version) + " in " + filename);
    }

    const uint64_t count = reader.get<uint64_t>();
    if (count == 0 || count > kMaxFeatures) {
        throw Helios::ArtifactException("Invalid scaler feature count in " + filename);
    }

    std::vector<double> meanValues(static_cast<size_t>(count));
    std::vector<double> scaleValues(static_cast<size_t>(count));
    for (double& m : meanValues) m = reader.get<double>();
    for (double& s : scaleValues) s = reader.get<double>();
    reader.verify(filename);

    return StandardScaler(std::move(meanValues), std::move(scaleValues));
}
