#ifndef CLMM_LIQUIDITY_SIZER_HPP
#define CLMM_LIQUIDITY_SIZER_HPP

#include <array>

namespace clmm {

struct PriceRange {
    double lower{0.0};
    double upper{0.0};

    bool contains(double price) const { return price > lower && price < upper; }
};

// Builds [price * lower_factor, price * upper_factor]; throws InvalidRange
// unless 0 < lower < upper.
PriceRange make_range(double center, double lower_factor, double upper_factor);

// Concentrated-liquidity sizing and valuation in human (decimal-adjusted)
// units, quote per base.
class LiquiditySizer {
public:
    // L such that a position over [lower, upper] opened at `price` is worth
    // `capital` in quote:
    //   L = capital / ((1/sqrt(p) - 1/sqrt(upper)) * p + (sqrt(p) - sqrt(lower)))
    static double size_liquidity(double capital, double price, double lower, double upper);

    // Mark-to-market in quote. Below the range the position is all base,
    // above it all quote; inside it holds both.
    static double position_value(double liquidity, double lower, double upper, double price);

    // Token amounts held at `price`: {base, quote}.
    static std::array<double, 2> amounts(double liquidity, double lower, double upper, double price);
};

} // namespace clmm

#endif // CLMM_LIQUIDITY_SIZER_HPP
