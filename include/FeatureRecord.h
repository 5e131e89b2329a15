#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

// One validated forecast request.
struct FeatureRecord {
    double temperature = 0.0; // ambient temperature, degrees Celsius
    double humidity = 0.0;    // relative humidity, percent
    double ghi = 0.0;         // global horizontal irradiance, W/m^2
    double hourSin = 0.0;     // sin(2*pi*hour/24)
    double hourCos = 0.0;     // cos(2*pi*hour/24)
    double powerT1 = 0.0;     // power output one hour ago, W
    double powerT2 = 0.0;     // power output two hours ago, W
};

constexpr size_t kFeatureCount = 7;

using FeatureVector = std::array<double, kFeatureCount>;

struct FeatureField {
    const char* wireName;
    double FeatureRecord::*member;
    std::optional<double> minInclusive;
    std::optional<double> maxInclusive;
    const char* description;
    double example;
};

// Column order the scaler and regressor were fitted with. Reordering this
// table changes every prediction without any error being raised.
inline const std::array<FeatureField, kFeatureCount>& featureLayout() {
    static const std::array<FeatureField, kFeatureCount> layout = {{
        {"temperature", &FeatureRecord::temperature, -10.0, 60.0, "Ambient temperature in Celsius", 25.5},
        {"humidity", &FeatureRecord::humidity, 0.0, 100.0, "Relative humidity %", 45.0},
        {"ghi", &FeatureRecord::ghi, 0.0, std::nullopt, "Global Horizontal Irradiance", 600.5},
        {"hour_sin", &FeatureRecord::hourSin, std::nullopt, std::nullopt, "Cyclical hour feature (Sine)", -0.5},
        {"hour_cos", &FeatureRecord::hourCos, std::nullopt, std::nullopt, "Cyclical hour feature (Cosine)", -0.866},
        {"power_t_1", &FeatureRecord::powerT1, 0.0, std::nullopt, "Power output 1 hour ago", 150.0},
        {"power_t_2", &FeatureRecord::powerT2, 0.0, std::nullopt, "Power output 2 hours ago", 140.0},
    }};
    return layout;
}

namespace FeatureAssembler {

inline FeatureVector assemble(const FeatureRecord& record) {
    FeatureVector out{};
    const auto& layout = featureLayout();
    for (size_t i = 0; i < layout.size(); ++i) {
        out[i] = record.*(layout[i].member);
    }
    return out;
}

inline std::vector<double> toDynamic(const FeatureVector& vector) {
    return std::vector<double>(vector.begin(), vector.end());
}

} // namespace FeatureAssembler
