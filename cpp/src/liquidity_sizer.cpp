#include "liquidity_sizer.hpp"

#include <cmath>
#include <string>

#include "errors.hpp"

namespace clmm {

PriceRange make_range(double center, double lower_factor, double upper_factor) {
    if (!(center > 0.0)) {
        throw InvalidRange("current price must be positive, got " + std::to_string(center));
    }
    PriceRange r{center * lower_factor, center * upper_factor};
    if (!(r.lower > 0.0) || !(r.lower < r.upper)) {
        throw InvalidRange("invalid bounds: lower bound must be positive and below upper bound");
    }
    return r;
}

double LiquiditySizer::size_liquidity(double capital, double price, double lower, double upper) {
    if (!(price > 0.0)) {
        throw InvalidRange("current price must be positive");
    }
    if (!(lower < upper)) {
        throw InvalidRange("lower bound must be less than upper bound");
    }

    const double sp = std::sqrt(price);
    const double token0_cost = (1.0 / sp - 1.0 / std::sqrt(upper)) * price;
    const double token1_cost = sp - std::sqrt(lower);
    const double denom = token0_cost + token1_cost;
    if (denom == 0.0) {
        throw DegenerateRange("liquidity denominator is zero; check price parameters");
    }
    return capital / denom;
}

std::array<double, 2> LiquiditySizer::amounts(double liquidity, double lower, double upper, double price) {
    const double sa = std::sqrt(lower);
    const double sb = std::sqrt(upper);
    if (price <= lower) {
        return {liquidity * (1.0 / sa - 1.0 / sb), 0.0};
    }
    if (price >= upper) {
        return {0.0, liquidity * (sb - sa)};
    }
    const double sp = std::sqrt(price);
    return {liquidity * (1.0 / sp - 1.0 / sb), liquidity * (sp - sa)};
}

double LiquiditySizer::position_value(double liquidity, double lower, double upper, double price) {
    const auto held = amounts(liquidity, lower, upper, price);
    return held[0] * price + held[1];
}

} // namespace clmm
