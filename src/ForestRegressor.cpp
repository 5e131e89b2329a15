#include "ForestRegressor.h"

#include "BinaryIO.h"
#include "HeliosExceptions.h"

#include <cmath>
#include <fstream>
#include <utility>

namespace {
constexpr char kForestSignature[] = "HELIOS_FOREST_V1";
constexpr uint32_t kForestFormatVersion = 1;
constexpr uint64_t kMaxFeatures = 4096;
constexpr uint64_t kMaxTrees = 100000;
constexpr uint64_t kMaxNodesPerTree = 10000000;

std::string treeLabel(size_t treeIndex, size_t node) {
    return "tree " + std::to_string(treeIndex) + " node " + std::to_string(node);
}
} // namespace

ForestRegressor::ForestRegressor(size_t featureCount, std::vector<RegressionTree> trees)
    : inputDim(featureCount), forest(std::move(trees)) {
    if (inputDim == 0) {
        throw Helios::ArtifactException("Forest must consume at least one feature");
    }
    if (forest.empty()) {
        throw Helios::ArtifactException("Forest has no trees");
    }
    for (size_t t = 0; t < forest.size(); ++t) {
        validateTree(forest[t], inputDim, t);
    }
}

void ForestRegressor::validateTree(const RegressionTree& tree, size_t featureCount, size_t treeIndex) {
    const size_t n = tree.nodeCount();
    if (n == 0) {
        throw Helios::ArtifactException("Tree " + std::to_string(treeIndex) + " has no nodes");
    }
    if (tree.left.size() != n || tree.right.size() != n || tree.feature.size() != n || tree.threshold.size() != n) {
        throw Helios::ArtifactException("Tree " + std::to_string(treeIndex) + " has ragged node arrays");
    }

    const auto nodes = static_cast<int64_t>(n);
    for (size_t i = 0; i < n; ++i) {
        const int64_t self = static_cast<int64_t>(i);
        if (tree.left[i] == -1) {
            if (tree.right[i] != -1) {
                throw Helios::ArtifactException(treeLabel(treeIndex, i) + " has only one child");
            }
            if (!std::isfinite(tree.value[i])) {
                throw Helios::ArtifactException(treeLabel(treeIndex, i) + " leaf value is not finite");
            }
            continue;
        }
        if (tree.left[i] <= self || tree.left[i] >= nodes || tree.right[i] <= self || tree.right[i] >= nodes) {
            throw Helios::ArtifactException(treeLabel(treeIndex, i) + " has an out-of-order child index");
        }
        if (tree.feature[i] < 0 || tree.feature[i] >= static_cast<int64_t>(featureCount)) {
            throw Helios::ArtifactException(treeLabel(treeIndex, i) + " splits on unknown feature " +
                                            std::to_string(tree.feature[i]));
        }
        if (std::isnan(tree.threshold[i])) {
            throw Helios::ArtifactException(treeLabel(treeIndex, i) + " threshold is NaN");
        }
    }
}

double ForestRegressor::predict(const std::vector<double>& scaledFeatures) const {
    if (forest.empty()) {
        throw Helios::InferenceException("Forest is empty");
    }
    if (scaledFeatures.size() != inputDim) {
        throw Helios::InferenceException("Forest expects " + std::to_string(inputDim) +
                                         " features, got " + std::to_string(scaledFeatures.size()));
    }

    double sum = 0.0;
    for (const auto& tree : forest) {
        size_t node = 0;
        // Child indices strictly increase, so the walk ends at a leaf.
        while (tree.left[node] != -1) {
            const double x = scaledFeatures[static_cast<size_t>(tree.feature[node])];
            node = static_cast<size_t>(x <= tree.threshold[node] ? tree.left[node] : tree.right[node]);
        }
        sum += tree.value[node];
    }

    const double prediction = sum / static_cast<double>(forest.size());
    if (!std::isfinite(prediction)) {
        throw Helios::InferenceException("Forest produced a non-finite prediction");
    }
    return prediction;
}

void ForestRegressor::saveBinary(const std::string& filename) const {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) throw Helios::IOException("Could not open " + filename + " for writing");

    out.write(kForestSignature, sizeof(kForestSignature));
    BinaryIO::ChecksumWriter writer(out);
    writer.put(kForestFormatVersion);
    writer.put(static_cast<uint64_t>(inputDim));
    writer.put(static_cast<uint64_t>(forest.size()));
    for (const auto& tree : forest) {
        writer.put(static_cast<uint64_t>(tree.nodeCount()));
        for (size_t i = 0; i < tree.nodeCount(); ++i) {
            writer.put(tree.left[i]);
            writer.put(tree.right[i]);
            writer.put(tree.feature[i]);
            writer.put(tree.threshold[i]);
            writer.put(tree.value[i]);
        }
    }
    writer.finish();

    out.flush();
    if (!out) throw Helios::IOException("Failed to flush " + filename);
}

ForestRegressor ForestRegressor::loadBinary(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Helios::IOException("Could not open " + filename + " for reading");

    char signature[sizeof(kForestSignature)] = {};
    in.read(signature, sizeof(signature));
    if (!in) throw Helios::ArtifactException("Failed to read forest signature from " + filename);
    if (std::string(signature, sizeof(signature) - 1) != kForestSignature || signature[sizeof(signature) - 1] != '\0') {
        throw Helios::ArtifactException("Unsupported or invalid forest signature in " + filename);
    }

    BinaryIO::ChecksumReader reader(in);
    const uint32_t version = reader.get<uint32_t>();
    if (version != kForestFormatVersion) {
        throw Helios::ArtifactException("Unsupported forest format version " + std::to_string(version) + " in " + filename);
    }

    const uint64_t featureCount = reader.get<uint64_t>();
    if (featureCount == 0 || featureCount > kMaxFeatures) {
        throw Helios::ArtifactException("Invalid forest feature count in " + filename);
    }
    const uint64_t treeCount = reader.get<uint64_t>();
    if (treeCount == 0 || treeCount > kMaxTrees) {
        throw Helios::ArtifactException("Invalid forest tree count in " + filename);
    }

    std::vector<RegressionTree> trees;
    trees.reserve(static_cast<size_t>(treeCount));
    for (uint64_t t = 0; t < treeCount; ++t) {
        const uint64_t nodeCount = reader.get<uint64_t>();
        if (nodeCount == 0 || nodeCount > kMaxNodesPerTree) {
            throw Helios::ArtifactException("Invalid node count for tree " + std::to_string(t) + " in " + filename);
        }
        RegressionTree tree;
        const auto n = static_cast<size_t>(nodeCount);
        tree.left.resize(n);
        tree.right.resize(n);
        tree.feature.resize(n);
        tree.threshold.resize(n);
        tree.value.resize(n);
        for (size_t i = 0; i < n; ++i) {
            tree.left[i] = reader.get<int64_t>();
            tree.right[i] = reader.get<int64_t>();
            tree.feature[i] = reader.get<int64_t>();
            tree.threshold[i] = reader.get<double>();
            tree.value[i] = reader.get<double>();
        }
        trees.push_back(std::move(tree));
    }
    reader.verify(filename);

    return ForestRegressor(static_cast<size_t>(featureCount), std::move(trees));
}
