#pragma once

#include "ForestRegressor.h"
#include "JsonValue.h"
#include "StandardScaler.h"

#include <string>

// Converts the JSON export of a fitted scaler and random forest (the
// per-tree children_left / children_right / feature / threshold / value
// arrays) into in-memory artifacts.
struct PackedArtifacts {
    std::string version;
    StandardScaler scaler;
    ForestRegressor regressor;
};

namespace ArtifactPacker {

/// @throws Helios::ArtifactException on missing keys, wrong types or invalid structure.
PackedArtifacts fromJson(const JsonValue& document);

/// @throws Helios::IOException when the file cannot be read, plus the fromJson errors.
PackedArtifacts fromFile(const std::string& path);

} // namespace ArtifactPacker
