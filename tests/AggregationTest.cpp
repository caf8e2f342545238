#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "shared/Aggregation.h"

using namespace scatter;

namespace {
constexpr Value kMax = std::numeric_limits<Value>::max();

Value gcd(Value a, Value b) {
    while (b != 0) {
        Value t = a % b;
        a = b;
        b = t;
    }
    return a;
}
} // namespace

TEST(AggregationTest, BuiltinIdentities) {
    EXPECT_EQ(AggregationFunction::sum().identity, 0u);
    EXPECT_EQ(AggregationFunction::product().identity, 1u);
    EXPECT_EQ(AggregationFunction::min().identity, kMax);
    EXPECT_EQ(AggregationFunction::max().identity, 0u);
    EXPECT_EQ(AggregationFunction::bitAnd().identity, kMax);
    EXPECT_EQ(AggregationFunction::bitOr().identity, 0u);
    EXPECT_EQ(AggregationFunction::bitXor().identity, 0u);
}

TEST(AggregationTest, IdentityIsNeutral) {
    const std::vector<Value> samples{0, 1, 7, 12345, kMax};
    for (const auto& name : AggregationFunction::builtinNames()) {
        auto op = AggregationFunction::byName(name);
        ASSERT_TRUE(op.has_value()) << name;
        for (Value v : samples) {
            EXPECT_EQ((*op)(op->identity, v), v) << name << " " << v;
            EXPECT_EQ((*op)(v, op->identity), v) << name << " " << v;
        }
    }
}

TEST(AggregationTest, FoldOfEmptyRangeIsIdentity) {
    const std::vector<Value> empty;
    EXPECT_EQ(fold(AggregationFunction::sum(), empty), 0u);
    EXPECT_EQ(fold(AggregationFunction::min(), empty), kMax);
    EXPECT_EQ(fold(AggregationFunction::product(), empty), 1u);
}

TEST(AggregationTest, FoldBuiltins) {
    const std::vector<Value> values{6, 3, 9, 12};
    EXPECT_EQ(fold(AggregationFunction::sum(), values), 30u);
    EXPECT_EQ(fold(AggregationFunction::product(), values), 1944u);
    EXPECT_EQ(fold(AggregationFunction::min(), values), 3u);
    EXPECT_EQ(fold(AggregationFunction::max(), values), 12u);
    EXPECT_EQ(fold(AggregationFunction::bitAnd(), values), 0u);
    EXPECT_EQ(fold(AggregationFunction::bitOr(), values), 15u);
    EXPECT_EQ(fold(AggregationFunction::bitXor(), values), 6u ^ 3u ^ 9u ^ 12u);
}

TEST(AggregationTest, SumWrapsOnOverflow) {
    const std::vector<Value> values{kMax, 2};
    EXPECT_EQ(fold(AggregationFunction::sum(), values), 1u);
}

TEST(AggregationTest, FoldOverIteratorWindow) {
    const std::vector<Value> values{1, 2, 3, 4, 5, 6, 7};
    EXPECT_EQ(fold(AggregationFunction::sum(), values.begin() + 2, values.begin() + 5), 12u);
}

TEST(AggregationTest, ByNameRejectsUnknown) {
    EXPECT_FALSE(AggregationFunction::byName("average").has_value());
    EXPECT_FALSE(AggregationFunction::byName("").has_value());
    EXPECT_STREQ(AggregationFunction::byName("bit_xor")->name, "bit_xor");
}

TEST(AggregationTest, CustomFunction) {
    auto op = AggregationFunction::custom("gcd", &gcd, 0);
    const std::vector<Value> values{84, 36, 120};
    EXPECT_EQ(fold(op, values), 12u);
    EXPECT_STREQ(op.name, "gcd");
}
