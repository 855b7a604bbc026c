// tick_math_test.cpp: tick index, sqrtPriceX96 and decimal conversions.

#include <gtest/gtest.h>

#include <cmath>

#include "errors.hpp"
#include "tick_math.hpp"

using namespace clmm;
using namespace clmm::tick_math;

TEST(TickMath, UnitPriceIsTickZero) {
    EXPECT_EQ(tick_of(1.0), 0);
}

TEST(TickMath, ExactPowersMapToTheirExponent) {
    for (int32_t k : {-200000, -69082, -1, 1, 2, 10, 1000, 76012, 200000, 887000}) {
        EXPECT_EQ(tick_of(price_at_tick(k)), k) << "k=" << k;
    }
}

TEST(TickMath, JustBelowAPowerRoundsDown) {
    const double p = price_at_tick(5000);
    EXPECT_EQ(tick_of(std::nextafter(p, 0.0)), 4999);
}

TEST(TickMath, MonotoneInPrice) {
    int32_t prev = tick_of(0.001);
    for (double p = 0.001; p < 1e6; p *= 1.37) {
        const int32_t t = tick_of(p);
        EXPECT_GE(t, prev);
        EXPECT_LE(price_at_tick(t), p);
        EXPECT_GT(price_at_tick(t + 1), p);
        prev = t;
    }
}

TEST(TickMath, RejectsNonPositiveAndOffGridPrices) {
    EXPECT_THROW(tick_of(0.0), InvalidRange);
    EXPECT_THROW(tick_of(-5.0), InvalidRange);
    EXPECT_THROW(tick_of(1e300), InvalidRange);
    EXPECT_THROW(tick_of(1e-300), InvalidRange);
}

TEST(TickMath, SqrtPriceX96RoundTrip) {
    for (double raw : {5e-16, 1e-6, 0.0005, 1.0, 3.5, 1e9}) {
        const uint256 sp = sqrt_x96_from_raw_price(raw);
        EXPECT_NEAR(raw_price_from_sqrt_x96(sp) / raw, 1.0, 1e-12) << "raw=" << raw;
    }
    EXPECT_THROW(sqrt_x96_from_raw_price(0.0), InvalidRange);
}

TEST(TickMath, Q96IsUnitPrice) {
    EXPECT_DOUBLE_EQ(raw_price_from_sqrt_x96(uint256(1) << 96), 1.0);
}

TEST(TickMath, HumanPriceAppliesDecimals) {
    // WETH (18) / USDC (6): 1 WETH = 2000 USDC.
    const double raw = raw_from_human(2000.0, 18, 6);
    EXPECT_NEAR(raw, 5e-16, 1e-28);
    EXPECT_NEAR(human_from_raw(raw, 18, 6), 2000.0, 1e-9);
    EXPECT_DOUBLE_EQ(human_from_raw(0.0005, 18, 18), 2000.0);
}

TEST(TickMath, X128ToDouble) {
    EXPECT_DOUBLE_EQ(x128_to_double(bigint(1) << 128), 1.0);
    EXPECT_DOUBLE_EQ(x128_to_double(bigint(3) << 127), 1.5);
    EXPECT_DOUBLE_EQ(x128_to_double(-(bigint(1) << 129)), -2.0);
    EXPECT_DOUBLE_EQ(x128_to_double(bigint(0)), 0.0);
}
