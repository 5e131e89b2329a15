#include <gtest/gtest.h>

#include "HeliosExceptions.h"
#include "RequestValidator.h"

#include <map>
#include <string>
#include <vector>

namespace {
// Example payload with selected fields replaced by raw JSON text. An empty
// replacement drops the field.
std::string bodyWith(const std::map<std::string, std::string>& overrides) {
    std::string body = "{";
    bool first = true;
    for (const auto& field : featureLayout()) {
        std::string value = std::to_string(field.example);
        auto it = overrides.find(field.wireName);
        if (it != overrides.end()) {
            if (it->second.empty()) continue;
            value = it->second;
        }
        if (!first) body += ",";
        first = false;
        body += "\"" + std::string(field.wireName) + "\":" + value;
    }
    return body + "}";
}

std::vector<Helios::FieldViolation> violationsFor(const std::string& body) {
    try {
        RequestValidator::validateBody(body);
    } catch (const Helios::ValidationException& e) {
        return e.violations();
    }
    return {};
}

bool accepted(const std::string& field, const std::string& value) {
    return violationsFor(bodyWith({{field, value}})).empty();
}
} // namespace

TEST(RequestValidatorTest, ExamplePayloadIsAccepted) {
    const FeatureRecord r = RequestValidator::validateBody(bodyWith({}));
    EXPECT_DOUBLE_EQ(r.temperature, 25.5);
    EXPECT_DOUBLE_EQ(r.humidity, 45.0);
    EXPECT_DOUBLE_EQ(r.ghi, 600.5);
    EXPECT_DOUBLE_EQ(r.hourSin, -0.5);
    EXPECT_DOUBLE_EQ(r.hourCos, -0.866);
    EXPECT_DOUBLE_EQ(r.powerT1, 150.0);
    EXPECT_DOUBLE_EQ(r.powerT2, 140.0);
}

TEST(RequestValidatorTest, TemperatureBoundsAreInclusive) {
    EXPECT_TRUE(accepted("temperature", "-10"));
    EXPECT_TRUE(accepted("temperature", "60"));
    EXPECT_FALSE(accepted("temperature", "-10.0001"));
    EXPECT_FALSE(accepted("temperature", "60.0001"));
}

TEST(RequestValidatorTest, TemperatureViolationsCarryBoundKind) {
    auto low = violationsFor(bodyWith({{"temperature", "-10.0001"}}));
    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(low[0].field, "temperature");
    EXPECT_EQ(low[0].type, "greater_than_equal");
    EXPECT_EQ(low[0].contextJson, "{\"ge\":-10}");

    auto high = violationsFor(bodyWith({{"temperature", "60.0001"}}));
    ASSERT_EQ(high.size(), 1u);
    EXPECT_EQ(high[0].type, "less_than_equal");
    EXPECT_EQ(high[0].contextJson, "{\"le\":60}");
}

TEST(RequestValidatorTest, HumidityBounds) {
    EXPECT_TRUE(accepted("humidity", "0"));
    EXPECT_TRUE(accepted("humidity", "100"));
    EXPECT_FALSE(accepted("humidity", "-0.5"));
    EXPECT_FALSE(accepted("humidity", "100.5"));
}

TEST(RequestValidatorTest, NonNegativeFieldsAcceptZeroRejectNegative) {
    for (const std::string field : {"ghi", "power_t_1", "power_t_2"}) {
        EXPECT_TRUE(accepted(field, "0")) << field;
        EXPECT_TRUE(accepted(field, "1e6")) << field;
        EXPECT_FALSE(accepted(field, "-1")) << field;
    }
}

// hour_sin / hour_cos are passed through without range checks.
TEST(RequestValidatorTest, CyclicalHourFeaturesAreUnconstrained) {
    EXPECT_TRUE(accepted("hour_sin", "5"));
    EXPECT_TRUE(accepted("hour_cos", "-42"));
    const FeatureRecord r = RequestValidator::validateBody(bodyWith({{"hour_sin", "1"}, {"hour_cos", "1"}}));
    EXPECT_DOUBLE_EQ(r.hourSin, 1.0);
    EXPECT_DOUBLE_EQ(r.hourCos, 1.0);
}

TEST(RequestValidatorTest, ReportsEveryViolatedField) {
    auto violations = violationsFor(bodyWith({{"temperature", "100"}, {"humidity", "-1"}, {"ghi", "-5"}}));
    ASSERT_EQ(violations.size(), 3u);
    EXPECT_EQ(violations[0].field, "temperature");
    EXPECT_EQ(violations[1].field, "humidity");
    EXPECT_EQ(violations[2].field, "ghi");
}

TEST(RequestValidatorTest, MissingFieldIsMalformedInput) {
    auto violations = violationsFor(bodyWith({{"power_t_2", ""}}));
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].field, "power_t_2");
    EXPECT_EQ(violations[0].type, "missing");
    EXPECT_TRUE(violations[0].inputJson.empty());
}

TEST(RequestValidatorTest, WrongTypesAreMalformedInput) {
    auto violations = violationsFor(bodyWith({{"temperature", "\"warm\""}, {"humidity", "true"}, {"ghi", "null"},
                                              {"hour_sin", "[1]"}}));
    ASSERT_EQ(violations.size(), 4u);
    for (const auto& v : violations) {
        EXPECT_EQ(v.type, "float_parsing") << v.field;
    }
    EXPECT_EQ(violations[0].inputJson, "\"warm\"");
}

TEST(RequestValidatorTest, NumericStringsAreCoerced) {
    const FeatureRecord r = RequestValidator::validateBody(bodyWith({{"temperature", "\" 30.5 \""}}));
    EXPECT_DOUBLE_EQ(r.temperature, 30.5);
    EXPECT_FALSE(accepted("temperature", "\"61\""));
    EXPECT_TRUE(accepted("ghi", "\"6.005e2\""));
    EXPECT_TRUE(accepted("hour_sin", "\"-.5\""));
}

// "0x3C" would read as 60 through strtod; only decimal literals are coerced.
TEST(RequestValidatorTest, NonDecimalStringsAreMalformedInput) {
    for (const std::string text : {"\"0x3C\"", "\"0X1p4\"", "\"\"", "\"1e\"", "\".\"", "\"12abc\"", "\"--1\""}) {
        auto violations = violationsFor(bodyWith({{"temperature", text}}));
        ASSERT_EQ(violations.size(), 1u) << text;
        EXPECT_EQ(violations[0].type, "float_parsing") << text;
    }
}

TEST(RequestValidatorTest, NonFiniteValuesAreRejected) {
    auto overflow = violationsFor(bodyWith({{"ghi", "1e999"}}));
    ASSERT_EQ(overflow.size(), 1u);
    EXPECT_EQ(overflow[0].type, "finite_number");

    auto nanString = violationsFor(bodyWith({{"hour_sin", "\"nan\""}}));
    ASSERT_EQ(nanString.size(), 1u);
    EXPECT_EQ(nanString[0].type, "finite_number");
}

TEST(RequestValidatorTest, InvalidJsonAndNonObjectBodies) {
    auto broken = violationsFor("{\"temperature\": ");
    ASSERT_EQ(broken.size(), 1u);
    EXPECT_EQ(broken[0].type, "json_invalid");

    auto array = violationsFor("[1,2,3]");
    ASSERT_EQ(array.size(), 1u);
    EXPECT_EQ(array[0].type, "model_attributes_type");
}

TEST(RequestValidatorTest, ExtraFieldsAreIgnored) {
    std::string body = bodyWith({});
    body.insert(1, "\"station\":\"roof-3\",");
    EXPECT_NO_THROW(RequestValidator::validateBody(body));
}
