#include "ArtifactPacker.h"

#include "HeliosExceptions.h"

#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace {
const JsonValue& requireKey(const JsonValue& object, const std::string& key, const std::string& context) {
    const JsonValue* node = object.find(key);
    if (node == nullptr) {
        throw Helios::ArtifactException(context + " requires key '" + key + "'");
    }
    return *node;
}

std::vector<double> doubleArray(const JsonValue& node, const std::string& label) {
    if (!node.isArray()) {
        throw Helios::ArtifactException(label + " must be a numeric array");
    }
    std::vector<double> out;
    out.reserve(node.arrayValue.size());
    for (const auto& item : node.arrayValue) {
        if (!item.isNumber()) {
            throw Helios::ArtifactException(label + " must contain numbers only");
        }
        out.push_back(item.numberValue);
    }
    return out;
}

std::vector<int64_t> integerArray(const JsonValue& node, const std::string& label) {
    const std::vector<double> values = doubleArray(node, label);
    std::vector<int64_t> out;
    out.reserve(values.size());
    for (double v : values) {
        if (!std::isfinite(v) || std::floor(v) != v || std::fabs(v) > 9.0e15) {
            throw Helios::ArtifactException(label + " must contain integers only");
        }
        out.push_back(static_cast<int64_t>(v));
    }
    return out;
}

// Leaf values may be exported either flat ([v0, v1, ...]) or in the
// nested [[[v0]], [[v1]], ...] shape of the fitted tree's value array.
std::vector<double> leafValues(const JsonValue& node, const std::string& label) {
    if (!node.isArray()) {
        throw Helios::ArtifactException(label + " must be an array");
    }
    std::vector<double> out;
    out.reserve(node.arrayValue.size());
    for (const auto& item : node.arrayValue) {
        const JsonValue* cursor = &item;
        while (cursor->isArray()) {
            if (cursor->arrayValue.size() != 1) {
                throw Helios::ArtifactException(label + " entries must hold exactly one output");
            }
            cursor = &cursor->arrayValue.front();
        }
        if (!cursor->isNumber()) {
            throw Helios::ArtifactException(label + " must contain numbers only");
        }
        out.push_back(cursor->numberValue);
    }
    return out;
}

RegressionTree parseTree(const JsonValue& node, size_t index) {
    const std::string context = "forest.trees[" + std::to_string(index) + "]";
    if (!node.isObject()) {
        throw Helios::ArtifactException(context + " must be an object");
    }
    RegressionTree tree;
    tree.left = integerArray(requireKey(node, "children_left", context), context + ".children_left");
    tree.right = integerArray(requireKey(node, "children_right", context), context + ".children_right");
    tree.feature = integerArray(requireKey(node, "feature", context), context + ".feature");
    tree.threshold = doubleArray(requireKey(node, "threshold", context), context + ".threshold");
    tree.value = leafValues(requireKey(node, "value", context), context + ".value");

    // Leaves are exported with feature -2 and threshold -2; normalise them.
    for (size_t i = 0; i < tree.left.size() && i < tree.feature.size(); ++i) {
        if (tree.left[i] == -1) {
            tree.feature[i] = -1;
        }
    }
    return tree;
}
} // namespace

namespace ArtifactPacker {

PackedArtifacts fromJson(const JsonValue& document) {
    if (!document.isObject()) {
        throw Helios::ArtifactException("Pack document must be a JSON object");
    }

    std::string version;
    if (const JsonValue* versionNode = document.find("version"); versionNode != nullptr) {
        if (!versionNode->isString()) {
            throw Helios::ArtifactException("'version' must be a string");
        }
        version = versionNode->stringValue;
    }

    const JsonValue& scalerNode = requireKey(document, "scaler", "pack document");
    if (!scalerNode.isObject()) {
        throw Helios::ArtifactException("'scaler' must be an object");
    }
    StandardScaler scaler(doubleArray(requireKey(scalerNode, "mean", "scaler"), "scaler.mean"),
                          doubleArray(requireKey(scalerNode, "scale", "scaler"), "scaler.scale"));

    const JsonValue& forestNode = requireKey(document, "forest", "pack document");
    if (!forestNode.isObject()) {
        throw Helios::ArtifactException("'forest' must be an object");
    }
    size_t featureCount = scaler.featureCount();
    if (const JsonValue* nFeatures = forestNode.find("n_features"); nFeatures != nullptr) {
        if (!nFeatures->isNumber() || nFeatures->numberValue < 1 || std::floor(nFeatures->numberValue) != nFeatures->numberValue) {
            throw Helios::ArtifactException("forest.n_features must be a positive integer");
        }
        featureCount = static_cast<size_t>(nFeatures->numberValue);
    }

    const JsonValue& treesNode = requireKey(forestNode, "trees", "forest");
    if (!treesNode.isArray()) {
        throw Helios::ArtifactException("forest.trees must be an array");
    }
    std::vector<RegressionTree> trees;
    trees.reserve(treesNode.arrayValue.size());
    for (size_t i = 0; i < treesNode.arrayValue.size(); ++i) {
        trees.push_back(parseTree(treesNode.arrayValue[i], i));
    }

    ForestRegressor regressor(featureCount, std::move(trees));
    if (regressor.featureCount() != scaler.featureCount()) {
        throw Helios::ArtifactException("Scaler has " + std::to_string(scaler.featureCount()) +
                                        " features but forest expects " + std::to_string(regressor.featureCount()));
    }

    return PackedArtifacts{std::move(version), std::move(scaler), std::move(regressor)};
}

PackedArtifacts fromFile(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw Helios::IOException("Failed to open pack input: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    JsonValue document;
    try {
        document = JsonValue::parse(buffer.str());
    } catch (const Helios::JsonException& e) {
        throw Helios::ArtifactException("Pack input " + path + " is not valid JSON: " + e.what());
    }
    return fromJson(document);
}

} // namespace ArtifactPacker
