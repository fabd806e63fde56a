#include <gtest/gtest.h>
#include "anneal/codec.hh"
#include <cmath>
#include <limits>

using namespace coanneal;

// ============================================================================
// Number Formatting
// ============================================================================

TEST(CodecTest, FormatShortest) {
    EXPECT_EQ(format_double(0.1), "0.1");
    EXPECT_EQ(format_double(-2.5), "-2.5");
    EXPECT_EQ(format_double(3.0), "3");
}

TEST(CodecTest, FormatPreservesValue) {
    const double values[] = {1.0 / 3.0, 1e-300, 123456789.123456789, -0.0001};
    for (double v : values) {
        auto parsed = parse_double(format_double(v));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, v);
    }
}

TEST(CodecTest, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_double("").has_value());
    EXPECT_FALSE(parse_double("abc").has_value());
    EXPECT_FALSE(parse_double("1.5x").has_value());
    EXPECT_FALSE(parse_double("nan").has_value());
    EXPECT_FALSE(parse_double("inf").has_value());
}

// ============================================================================
// Parameter Messages
// ============================================================================

TEST(CodecTest, EncodeParameters) {
    std::vector<double> beta = {0.1, 0.2, 0.3};
    EXPECT_EQ(encode_parameters(42, beta), "42;0.1,0.2,0.3");
}

TEST(CodecTest, DecodeParameters) {
    auto msg = decode_parameters("7;1,-0.5,2e-3");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->round, 7);
    ASSERT_EQ(msg->beta.size(), 3);
    EXPECT_DOUBLE_EQ(msg->beta[0], 1.0);
    EXPECT_DOUBLE_EQ(msg->beta[1], -0.5);
    EXPECT_DOUBLE_EQ(msg->beta[2], 0.002);
}

TEST(CodecTest, DecodeParametersMalformed) {
    EXPECT_FALSE(decode_parameters("").has_value());
    EXPECT_FALSE(decode_parameters("0.1,0.2").has_value());         // No round
    EXPECT_FALSE(decode_parameters(";0.1").has_value());
    EXPECT_FALSE(decode_parameters("x;0.1").has_value());
    EXPECT_FALSE(decode_parameters("3;").has_value());              // No values
    EXPECT_FALSE(decode_parameters("3;0.1,,0.2").has_value());
    EXPECT_FALSE(decode_parameters("3;0.1,").has_value());
    EXPECT_FALSE(decode_parameters("3;error").has_value());
}

// ============================================================================
// Cost Messages
// ============================================================================

TEST(CodecTest, CostMessage) {
    EXPECT_EQ(encode_cost(5, 1.25), "5;1.25");

    auto msg = decode_cost("5;1.25");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->round, 5);
    EXPECT_FALSE(msg->failed());
    EXPECT_DOUBLE_EQ(*msg->cost, 1.25);
}

TEST(CodecTest, FailureMarker) {
    EXPECT_EQ(encode_failure(9), "9;error");

    auto msg = decode_cost("9;error");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->round, 9);
    EXPECT_TRUE(msg->failed());
}

TEST(CodecTest, NonFiniteCostBecomesFailure) {
    EXPECT_EQ(encode_cost(2, std::numeric_limits<double>::quiet_NaN()), "2;error");
    EXPECT_EQ(encode_cost(2, std::numeric_limits<double>::infinity()), "2;error");
}

TEST(CodecTest, DecodeCostMalformed) {
    EXPECT_FALSE(decode_cost("1.5").has_value());
    EXPECT_FALSE(decode_cost("1;").has_value());
    EXPECT_FALSE(decode_cost("1;1.5;2").has_value());
    EXPECT_FALSE(decode_cost("-1;1.5").has_value());
}

TEST(CodecTest, PeekRound) {
    EXPECT_EQ(peek_round("12;0.1,0.2"), 12u);
    EXPECT_EQ(peek_round("12;error"), 12u);
    EXPECT_FALSE(peek_round("0.1,0.2").has_value());
}

TEST(CodecTest, LargeRoundIds) {
    const round_t round = std::numeric_limits<round_t>::max();
    auto msg = decode_cost(encode_cost(round, 0.5));
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->round, round);
}
