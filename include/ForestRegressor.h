#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Binary regression tree in flat array form. Node i is a leaf when
// left[i] == -1; otherwise samples with x[feature[i]] <= threshold[i]
// descend to left[i], the rest to right[i].
struct RegressionTree {
    std::vector<int64_t> left;
    std::vector<int64_t> right;
    std::vector<int64_t> feature;
    std::vector<double> threshold;
    std::vector<double> value;

    size_t nodeCount() const noexcept { return value.size(); }
};

// Random-forest regressor: prediction is the mean of the tree outputs.
class ForestRegressor {
public:
    ForestRegressor() = default;

    /**
     * @brief Builds a forest after structural validation of every tree.
     * @pre Children of node i have indices greater than i.
     * @throws Helios::ArtifactException on an empty forest, ragged node
     *         arrays, out-of-range children/features, or non-finite values.
     */
    ForestRegressor(size_t featureCount, std::vector<RegressionTree> trees);

    size_t featureCount() const noexcept { return inputDim; }
    size_t treeCount() const noexcept { return forest.size(); }
    const std::vector<RegressionTree>& trees() const noexcept { return forest; }

    /// @throws Helios::InferenceException on length mismatch or non-finite output.
    double predict(const std::vector<double>& scaledFeatures) const;

    void saveBinary(const std::string& filename) const;
    static ForestRegressor loadBinary(const std::string& filename);

private:
    static void validateTree(const RegressionTree& tree, size_t featureCount, size_t treeIndex);

    size_t inputDim = 0;
    std::vector<RegressionTree> forest;
};
