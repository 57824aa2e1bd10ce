#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "tuiobridge/Logging.h"
#include "tuiobridge/TypeCoercion.h"

using namespace tuiobridge;
using nlohmann::json;

// Records warnings emitted while a test runs
class CoercionWarnings : public ::testing::Test {
   protected:
    void SetUp() override {
        Logging::setCallback([this](LogLevel level, const std::string& message) {
            if (level == LogLevel::Warning) {
                warnings.push_back(message);
            }
        });
    }

    void TearDown() override { Logging::setCallback(nullptr); }

    std::vector<std::string> warnings;
};

TEST(TypeCoercion, StringStaysString) {
    Value value = TypeCoercion::classify(json("alive"));
    EXPECT_EQ(value.typeTag(), 's');
    EXPECT_EQ(value.asString(), "alive");
}

TEST(TypeCoercion, NumericLookingStringIsNotSniffed) {
    Value value = TypeCoercion::classify(json("5"));
    EXPECT_EQ(value.typeTag(), 's');
    EXPECT_EQ(value.asString(), "5");

    Value fractional = TypeCoercion::classify(json("-0.25"));
    EXPECT_EQ(fractional.typeTag(), 's');
    EXPECT_EQ(fractional.asString(), "-0.25");
}

TEST(TypeCoercion, BooleansBecomeIntegers) {
    Value yes = TypeCoercion::classify(json(true));
    EXPECT_EQ(yes.typeTag(), 'i');
    EXPECT_EQ(yes.asInt32(), 1);

    Value no = TypeCoercion::classify(json(false));
    EXPECT_EQ(no.typeTag(), 'i');
    EXPECT_EQ(no.asInt32(), 0);
}

TEST(TypeCoercion, IntegersKeepValue) {
    EXPECT_EQ(TypeCoercion::classify(json(42)).asInt32(), 42);
    EXPECT_EQ(TypeCoercion::classify(json(-7)).asInt32(), -7);
    EXPECT_EQ(TypeCoercion::classify(json(0)).typeTag(), 'i');
    EXPECT_EQ(TypeCoercion::classify(json(std::numeric_limits<int32_t>::max())).asInt32(),
              std::numeric_limits<int32_t>::max());
    EXPECT_EQ(TypeCoercion::classify(json(std::numeric_limits<int32_t>::min())).asInt32(),
              std::numeric_limits<int32_t>::min());
}

TEST(TypeCoercion, WideIntegersKeepLow32Bits) {
    // 2^32 + 5
    Value value = TypeCoercion::classify(json::parse("4294967301"));
    EXPECT_EQ(value.typeTag(), 'i');
    EXPECT_EQ(value.asInt32(), 5);

    // 2^31 wraps to the most negative int32
    EXPECT_EQ(TypeCoercion::classify(json::parse("2147483648")).asInt32(),
              std::numeric_limits<int32_t>::min());

    // -2^32 - 1 keeps its low word 0xFFFFFFFF
    EXPECT_EQ(TypeCoercion::classify(json::parse("-4294967297")).asInt32(), -1);
}

TEST(TypeCoercion, FloatsBecomeSinglePrecision) {
    Value value = TypeCoercion::classify(json(0.5));
    EXPECT_EQ(value.typeTag(), 'f');
    EXPECT_FLOAT_EQ(value.asFloat(), 0.5f);

    Value third = TypeCoercion::classify(json(1.0 / 3.0));
    EXPECT_EQ(third.typeTag(), 'f');
    EXPECT_FLOAT_EQ(third.asFloat(), static_cast<float>(1.0 / 3.0));
}

TEST(TypeCoercion, WholeFloatStaysFloat) {
    // The JSON number 2.0 is a float, not an integer
    Value value = TypeCoercion::classify(json::parse("2.0"));
    EXPECT_EQ(value.typeTag(), 'f');
    EXPECT_FLOAT_EQ(value.asFloat(), 2.0f);
}

TEST(TypeCoercion, FloatOverflowBecomesInfinity) {
    Value value = TypeCoercion::classify(json(1.0e300));
    EXPECT_EQ(value.typeTag(), 'f');
    EXPECT_TRUE(std::isinf(value.asFloat()));
    EXPECT_GT(value.asFloat(), 0.0f);

    EXPECT_LT(TypeCoercion::classify(json(-1.0e300)).asFloat(), 0.0f);
}

TEST_F(CoercionWarnings, NullFallsBackToStringWithWarning) {
    Value value = TypeCoercion::classify(json(nullptr));
    EXPECT_EQ(value.typeTag(), 's');
    EXPECT_EQ(value.asString(), "null");

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("null"), std::string::npos);
}

TEST_F(CoercionWarnings, ContainersFallBackToCompactJson) {
    Value array = TypeCoercion::classify(json::parse("[1, 2]"));
    EXPECT_EQ(array.typeTag(), 's');
    EXPECT_EQ(array.asString(), "[1,2]");

    Value object = TypeCoercion::classify(json::parse("{\"x\": 1}"));
    EXPECT_EQ(object.typeTag(), 's');
    EXPECT_EQ(object.asString(), "{\"x\":1}");

    EXPECT_EQ(warnings.size(), 2u);
}

TEST_F(CoercionWarnings, ScalarsDoNotWarn) {
    TypeCoercion::classify(json("text"));
    TypeCoercion::classify(json(true));
    TypeCoercion::classify(json(3));
    TypeCoercion::classify(json(3.5));
    EXPECT_TRUE(warnings.empty());
}

TEST(TypeCoercion, ParseNumeric) {
    auto whole = TypeCoercion::parseNumeric("12");
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->typeTag(), 'i');
    EXPECT_EQ(whole->asInt32(), 12);

    auto wholeWithFraction = TypeCoercion::parseNumeric("3.0");
    ASSERT_TRUE(wholeWithFraction.has_value());
    EXPECT_EQ(wholeWithFraction->typeTag(), 'i');
    EXPECT_EQ(wholeWithFraction->asInt32(), 3);

    auto fractional = TypeCoercion::parseNumeric("-1.5");
    ASSERT_TRUE(fractional.has_value());
    EXPECT_EQ(fractional->typeTag(), 'f');
    EXPECT_FLOAT_EQ(fractional->asFloat(), -1.5f);

    EXPECT_FALSE(TypeCoercion::parseNumeric("").has_value());
    EXPECT_FALSE(TypeCoercion::parseNumeric("null").has_value());
    EXPECT_FALSE(TypeCoercion::parseNumeric("12abc").has_value());
    EXPECT_FALSE(TypeCoercion::parseNumeric("[1]").has_value());
    EXPECT_FALSE(TypeCoercion::parseNumeric("inf").has_value());
    EXPECT_FALSE(TypeCoercion::parseNumeric("nan").has_value());
}

TEST(TypeCoercion, TruncateToInt32) {
    EXPECT_EQ(TypeCoercion::truncateToInt32(0), 0);
    EXPECT_EQ(TypeCoercion::truncateToInt32(0xFFFFFFFFULL), -1);
    EXPECT_EQ(TypeCoercion::truncateToInt32(0x100000005ULL), 5);
    EXPECT_EQ(TypeCoercion::truncateToInt32(0x7FFFFFFFULL), std::numeric_limits<int32_t>::max());
}
