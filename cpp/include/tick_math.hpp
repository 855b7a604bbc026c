#ifndef CLMM_TICK_MATH_HPP
#define CLMM_TICK_MATH_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <cmath>
#include <cstdint>

#include "errors.hpp"

namespace clmm {

using uint256 = boost::multiprecision::uint256_t;
// Unbounded signed integer for raw fee-growth differences.
using bigint = boost::multiprecision::cpp_int;

constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;
constexpr double TICK_BASE = 1.0001;

namespace tick_math {

// 2^96 and 2^128 as doubles (exact powers of two).
inline double q96() { return std::ldexp(1.0, 96); }
inline double q128() { return std::ldexp(1.0, 128); }

// Largest tick t with 1.0001^t <= price. The log estimate is corrected
// against std::pow so exact powers map to their own exponent.
inline int32_t tick_of(double price) {
    if (!(price > 0.0) || !std::isfinite(price)) {
        throw InvalidRange("tick_of: price must be positive and finite");
    }
    const double estimate = std::floor(std::log(price) / std::log(TICK_BASE));
    if (estimate < static_cast<double>(MIN_TICK) - 1.0 || estimate > static_cast<double>(MAX_TICK) + 1.0) {
        throw InvalidRange("tick_of: price outside the tick grid");
    }
    int32_t t = static_cast<int32_t>(estimate);
    while (std::pow(TICK_BASE, t + 1) <= price) ++t;
    while (std::pow(TICK_BASE, t) > price) --t;
    if (t < MIN_TICK || t > MAX_TICK) {
        throw InvalidRange("tick_of: price outside the tick grid");
    }
    return t;
}

inline double price_at_tick(int32_t tick) {
    return std::pow(TICK_BASE, tick);
}

// slot0.sqrtPriceX96 -> token1/token0 price in raw token units.
inline double raw_price_from_sqrt_x96(const uint256& sqrt_price_x96) {
    const double sp = sqrt_price_x96.convert_to<double>() / q96();
    return sp * sp;
}

// Inverse of raw_price_from_sqrt_x96, rounded down.
inline uint256 sqrt_x96_from_raw_price(double raw_price) {
    if (!(raw_price > 0.0)) {
        throw InvalidRange("sqrt_x96_from_raw_price: price must be positive");
    }
    const long double scaled = std::sqrt(static_cast<long double>(raw_price)) *
                               static_cast<long double>(q96());
    return uint256(boost::multiprecision::cpp_int(scaled));
}

// Decimal-adjusted mid price quoted the way the pool reports it:
// (1 / raw) * 10^(d1 - d0).
inline double human_from_raw(double raw_price, int token0_decimals, int token1_decimals) {
    return (1.0 / raw_price) * std::pow(10.0, token1_decimals - token0_decimals);
}

inline double raw_from_human(double human_price, int token0_decimals, int token1_decimals) {
    return std::pow(10.0, token1_decimals - token0_decimals) / human_price;
}

// Fee-growth X128 fixed point -> fee per unit of liquidity.
inline double x128_to_double(const bigint& v) {
    return v.convert_to<double>() / q128();
}

} // namespace tick_math

} // namespace clmm

#endif // CLMM_TICK_MATH_HPP
