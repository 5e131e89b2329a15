#include <gtest/gtest.h>

#include "HeliosExceptions.h"
#include "JsonValue.h"

#include <string>

TEST(JsonValueTest, ParsesNestedDocument) {
    const JsonValue doc = JsonValue::parse(R"( {"a": [1, 2.5, -3e2], "b": {"c": true, "d": null}, "e": "x"} )");
    ASSERT_TRUE(doc.isObject());

    const JsonValue* a = doc.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    ASSERT_EQ(a->arrayValue.size(), 3u);
    EXPECT_DOUBLE_EQ(a->arrayValue[1].numberValue, 2.5);
    EXPECT_DOUBLE_EQ(a->arrayValue[2].numberValue, -300.0);

    const JsonValue* b = doc.find("b");
    ASSERT_NE(b, nullptr);
    EXPECT_TRUE(b->find("c")->isBool());
    EXPECT_TRUE(b->find("c")->booleanValue);
    EXPECT_TRUE(b->find("d")->isNull());
    EXPECT_EQ(doc.find("e")->stringValue, "x");
    EXPECT_EQ(doc.find("missing"), nullptr);
}

TEST(JsonValueTest, DecodesEscapesAndSurrogatePairs) {
    const JsonValue v = JsonValue::parse(R"("tab\there \u00e9 \ud83d\ude00 \"q\"")");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(v.stringValue, "tab\there \xC3\xA9 \xF0\x9F\x98\x80 \"q\"");
}

TEST(JsonValueTest, RejectsMalformedInput) {
    EXPECT_THROW(JsonValue::parse(""), Helios::JsonException);
    EXPECT_THROW(JsonValue::parse("{\"a\":1,}"), Helios::JsonException);
    EXPECT_THROW(JsonValue::parse("[1 2]"), Helios::JsonException);
    EXPECT_THROW(JsonValue::parse("01"), Helios::JsonException);
    EXPECT_THROW(JsonValue::parse("1."), Helios::JsonException);
    EXPECT_THROW(JsonValue::parse("NaN"), Helios::JsonException);
    EXPECT_THROW(JsonValue::parse("{} extra"), Helios::JsonException);
    EXPECT_THROW(JsonValue::parse("\"\\ud83d\""), Helios::JsonException);
}

TEST(JsonValueTest, ErrorsReportOffset) {
    try {
        JsonValue::parse("[1, ?]");
        FAIL() << "expected JsonException";
    } catch (const Helios::JsonException& e) {
        EXPECT_NE(std::string(e.what()).find("offset 4"), std::string::npos) << e.what();
    }
}

TEST(JsonValueTest, EnforcesNestingLimit) {
    EXPECT_NO_THROW(JsonValue::parse(std::string(60, '[') + std::string(60, ']')));
    EXPECT_THROW(JsonValue::parse(std::string(200, '[') + std::string(200, ']')), Helios::JsonException);
}

TEST(JsonValueTest, DumpEscapesAndFormatsNumbers) {
    JsonValue s;
    s.type = JsonValue::Type::String;
    s.stringValue = "line\n\"quoted\"\x01";
    EXPECT_EQ(s.dump(), "\"line\\n\\\"quoted\\\"\\u0001\"");

    JsonValue n;
    n.type = JsonValue::Type::Number;
    n.numberValue = 400.0;
    EXPECT_EQ(n.dump(), "400");
    n.numberValue = -0.866;
    EXPECT_EQ(n.dump(), "-0.866");

    EXPECT_EQ(JsonValue::parse("[true,null,\"a\"]").dump(), "[true,null,\"a\"]");
}

TEST(JsonValueTest, LastDuplicateKeyWins) {
    const JsonValue doc = JsonValue::parse(R"({"k": 1, "k": 2})");
    EXPECT_DOUBLE_EQ(doc.find("k")->numberValue, 2.0);
}
