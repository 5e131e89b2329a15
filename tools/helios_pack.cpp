// helios_pack.cpp
// Converts a JSON export of a fitted scaler + random forest into the binary
// artifacts the service loads.
// Usage: helios_pack <export.json> <artifact-dir> [--version <tag>]

#include "ArtifactPacker.h"
#include "ArtifactStore.h"
#include "HeliosExceptions.h"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: helios_pack <export.json> <artifact-dir> [--version <tag>]\n";
        return 2;
    }
    const std::string inputPath = argv[1];
    const std::string artifactDir = argv[2];

    std::string versionOverride;
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--version" && i + 1 < argc) {
            versionOverride = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    try {
        PackedArtifacts packed = ArtifactPacker::fromFile(inputPath);
        const std::string version = versionOverride.empty() ? packed.version : versionOverride;
        if (version.empty()) {
            std::cerr << "[HeliosPack Error] no version in " << inputPath << " and no --version given\n";
            return 2;
        }

        const ArtifactStore store(artifactDir);
        store.save(packed.scaler, packed.regressor, version);

        // Read back through the same path the service uses.
        const ArtifactPair check = store.load(version);
        const ArtifactPaths paths = store.pathsFor(version);
        std::cout << "[HeliosPack] version=" << check.version
                  << " features=" << check.scaler.featureCount()
                  << " trees=" << check.regressor.treeCount()
                  << " scaler=" << paths.scalerPath
                  << " model=" << paths.modelPath << "\n";
    } catch (const Helios::HeliosException& e) {
        std::cerr << "[HeliosPack Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[HeliosPack Exception] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
