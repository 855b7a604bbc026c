#pragma once

#include <cstdint>
#include <optional>

#include "block_resolver.hpp"
#include "chain_state.hpp"
#include "config.hpp"
#include "tick_math.hpp"

namespace clmm {

// Pool state captured at one block. Never mutated after construction.
struct ChainStateSnapshot {
    uint64_t block_number{0};
    int64_t block_timestamp{0};
    uint256 fee_growth_global0{0};
    uint256 fee_growth_global1{0};
    int32_t lower_tick{0};
    int32_t upper_tick{0};
    FeeGrowthPair lower_outside{};
    FeeGrowthPair upper_outside{};
    int token0_decimals{18};
    int token1_decimals{18};
    double raw_price{0.0};    // token1/token0 in raw units
    double human_price{0.0};  // decimal-adjusted mid price
};

// Signed X128 fee growth accrued inside the range between two snapshots.
struct FeeGrowthDelta {
    bigint token0;
    bigint token1;
};

struct FeeResult {
    double fees_token0_raw{0.0};
    double fees_token1_raw{0.0};
    double total_fees_usd{0.0};
    double liquidity{0.0};
    int64_t period_seconds{0};
    double apr_percent{0.0};
    uint64_t start_block{0};
    uint64_t end_block{0};
};

// Fee-growth-inside accounting over a configured range.
//
// Fee growth inside [lower, upper] at a block is
//   feeGrowthGlobal - feeGrowthOutside(lower) - feeGrowthOutside(upper)
// per token, and the growth accrued to one unit of liquidity over a period is
// the difference of that quantity between the period's end and start blocks.
// Differences are taken in unbounded signed arithmetic with no modular
// correction: the calculation assumes the 256-bit counters do not wrap within
// one backtest period, and a negative delta is reported as-is.
class FeeAccrualCalculator {
public:
    FeeAccrualCalculator(ChainStateProvider& chain, const SimConfig& cfg);

    // Reads pool state at `block`. A fixed raw price replaces slot0 for the
    // range/tick derivation; fee counters always come from the block itself.
    ChainStateSnapshot snapshot_at(const BlockId& block,
                                   std::optional<double> fixed_raw_price = std::nullopt) const;

    static FeeGrowthDelta delta(const ChainStateSnapshot& s0, const ChainStateSnapshot& s1);

    // Liquidity that `capital` buys over the configured range around the
    // reference snapshot's raw price, with decimal-scaled cost factors.
    double simulated_liquidity(const ChainStateSnapshot& reference, double capital) const;

    // Token1 fees are converted at `conversion_price` (human units), by
    // default the end snapshot's price.
    FeeResult compute_fees_and_apr(const ChainStateSnapshot& s0,
                                   const ChainStateSnapshot& s1,
                                   double liquidity,
                                   double capital,
                                   std::optional<double> conversion_price = std::nullopt) const;

    // Resolves both times to blocks and prices the period. The end snapshot
    // is pinned to the start snapshot's price unless `close_price` (human
    // units) is given. Liquidity and the token1 conversion both use the
    // start snapshot.
    FeeResult calculate_fees(int64_t start_ts,
                             int64_t end_ts,
                             double capital,
                             std::optional<double> close_price = std::nullopt) const;

    BlockSearchOptions search_options() const;

private:
    TokenDecimals decimals() const;

    ChainStateProvider& chain_;
    const SimConfig& cfg_;
    BlockResolver resolver_;
    mutable std::optional<TokenDecimals> decimals_;
};

} // namespace clmm
