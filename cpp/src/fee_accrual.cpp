#include "fee_accrual.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "errors.hpp"
#include "liquidity_sizer.hpp"
#include "time_utils.hpp"

namespace clmm {

FeeAccrualCalculator::FeeAccrualCalculator(ChainStateProvider& chain, const SimConfig& cfg)
    : chain_(chain), cfg_(cfg), resolver_(chain, cfg.verbose) {}

BlockSearchOptions FeeAccrualCalculator::search_options() const {
    BlockSearchOptions opts;
    opts.approx_block_time = cfg_.effective_block_time();
    opts.tolerance_seconds = cfg_.tolerance_seconds;
    opts.max_tries = cfg_.max_search_tries;
    return opts;
}

TokenDecimals FeeAccrualCalculator::decimals() const {
    // Token decimals are immutable on chain; read once.
    if (!decimals_) decimals_ = chain_.token_decimals();
    return *decimals_;
}

ChainStateSnapshot FeeAccrualCalculator::snapshot_at(const BlockId& block,
                                                     std::optional<double> fixed_raw_price) const {
    ChainStateSnapshot s;
    const TokenDecimals d = decimals();
    s.token0_decimals = d.token0;
    s.token1_decimals = d.token1;

    if (fixed_raw_price) {
        s.raw_price = *fixed_raw_price;
    } else {
        s.raw_price = tick_math::raw_price_from_sqrt_x96(chain_.slot0_sqrt_price_x96(block));
    }
    if (s.raw_price == 0.0) {
        throw InvalidInput("invalid price reading (zero) at block " + block.str());
    }
    s.human_price = tick_math::human_from_raw(s.raw_price, s.token0_decimals, s.token1_decimals);

    const PriceRange range = make_range(s.human_price, cfg_.lower_bound_factor, cfg_.upper_bound_factor);
    s.lower_tick = tick_math::tick_of(range.lower);
    s.upper_tick = tick_math::tick_of(range.upper);

    const FeeGrowthPair global = chain_.fee_growth_globals(block);
    s.fee_growth_global0 = global.token0;
    s.fee_growth_global1 = global.token1;
    s.lower_outside = chain_.tick_fee_growth_outside(block, s.lower_tick);
    s.upper_outside = chain_.tick_fee_growth_outside(block, s.upper_tick);

    const BlockHeader header = chain_.block_header(block);
    s.block_number = header.number;
    s.block_timestamp = header.timestamp;
    return s;
}

FeeGrowthDelta FeeAccrualCalculator::delta(const ChainStateSnapshot& s0, const ChainStateSnapshot& s1) {
    auto inside = [](const uint256& global, const uint256& lower, const uint256& upper) {
        return bigint(global) - bigint(lower) - bigint(upper);
    };

    FeeGrowthDelta d;
    d.token0 = inside(s1.fee_growth_global0, s1.lower_outside.token0, s1.upper_outside.token0) -
               inside(s0.fee_growth_global0, s0.lower_outside.token0, s0.upper_outside.token0);
    d.token1 = inside(s1.fee_growth_global1, s1.lower_outside.token1, s1.upper_outside.token1) -
               inside(s0.fee_growth_global1, s0.lower_outside.token1, s0.upper_outside.token1);
    return d;
}

double FeeAccrualCalculator::simulated_liquidity(const ChainStateSnapshot& reference, double capital) const {
    const double p = reference.raw_price;
    const double sp = std::sqrt(p);
    const double sa = std::sqrt(p * cfg_.lower_bound_factor);
    const double sb = std::sqrt(p * cfg_.upper_bound_factor);

    const double token0_cost = ((sb - sp) / (sp * sb)) / std::pow(10.0, reference.token0_decimals);
    const double token1_cost = (sp - sa) * reference.human_price / std::pow(10.0, reference.token1_decimals);
    const double denom = token0_cost + token1_cost;
    if (denom == 0.0) {
        throw DegenerateRange("liquidity denominator is zero; check price parameters");
    }
    return capital / denom;
}

FeeResult FeeAccrualCalculator::compute_fees_and_apr(const ChainStateSnapshot& s0,
                                                     const ChainStateSnapshot& s1,
                                                     double liquidity,
                                                     double capital,
                                                     std::optional<double> conversion_price) const {
    FeeResult r;
    r.period_seconds = s1.block_timestamp - s0.block_timestamp;
    if (r.period_seconds <= 0) {
        throw InvalidPeriod("invalid snapshot period: " + std::to_string(r.period_seconds) +
                            "s between blocks " + std::to_string(s0.block_number) + " and " +
                            std::to_string(s1.block_number));
    }

    const FeeGrowthDelta d = delta(s0, s1);
    r.liquidity = liquidity;
    r.start_block = s0.block_number;
    r.end_block = s1.block_number;
    r.fees_token0_raw = tick_math::x128_to_double(d.token0) * liquidity;
    r.fees_token1_raw = tick_math::x128_to_double(d.token1) * liquidity;

    const double fees_token0 = r.fees_token0_raw / std::pow(10.0, s1.token0_decimals);
    const double fees_token1 = r.fees_token1_raw / std::pow(10.0, s1.token1_decimals) *
                               conversion_price.value_or(s1.human_price);
    r.total_fees_usd = fees_token0 + fees_token1;

    const double annualization = static_cast<double>(time_utils::SECONDS_PER_YEAR) /
                                 static_cast<double>(r.period_seconds);
    r.apr_percent = capital != 0.0 ? (r.total_fees_usd / capital) * annualization * 100.0 : 0.0;
    return r;
}

FeeResult FeeAccrualCalculator::calculate_fees(int64_t start_ts,
                                               int64_t end_ts,
                                               double capital,
                                               std::optional<double> close_price) const {
    const BlockSearchOptions opts = search_options();
    const uint64_t start_block = resolver_.resolve(start_ts, opts);
    const uint64_t end_block = resolver_.resolve(end_ts, opts);

    const ChainStateSnapshot s0 = snapshot_at(start_block);

    double pinned_raw = s0.raw_price;
    if (close_price) {
        if (!(*close_price > 0.0)) {
            throw InvalidRange("close price must be positive");
        }
        pinned_raw = tick_math::raw_from_human(*close_price, s0.token0_decimals, s0.token1_decimals);
    }
    const ChainStateSnapshot s1 = snapshot_at(end_block, pinned_raw);

    const double liquidity = simulated_liquidity(s0, capital);
    FeeResult r = compute_fees_and_apr(s0, s1, liquidity, capital, s0.human_price);

    if (cfg_.verbose) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << "Fees " << time_utils::format_utc(start_ts) << " -> " << time_utils::format_utc(end_ts)
            << " (blocks " << start_block << " -> " << end_block << "): "
            << r.total_fees_usd << " USD, APR " << r.apr_percent << "%\n";
        std::cout << oss.str();
    }
    return r;
}

} // namespace clmm
