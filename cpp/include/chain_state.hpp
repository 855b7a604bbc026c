#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "config.hpp"
#include "tick_math.hpp"

namespace clmm {

// Block selector for view calls: a concrete number or the "latest" sentinel.
class BlockId {
public:
    BlockId() = default;
    BlockId(uint64_t number) : number_(number) {}

    static BlockId latest() { return BlockId(); }

    bool is_latest() const { return !number_.has_value(); }
    uint64_t number() const { return *number_; }

    std::string str() const {
        return number_ ? std::to_string(*number_) : std::string("latest");
    }

private:
    std::optional<uint64_t> number_;
};

struct BlockHeader {
    uint64_t number{0};
    int64_t timestamp{0};
};

struct FeeGrowthPair {
    uint256 token0{0};
    uint256 token1{0};
};

struct TokenDecimals {
    int token0{18};
    int token1{18};
};

// View-function surface of a concentrated-liquidity pool and its chain.
// Every call is one blocking round-trip; failures surface as
// UpstreamUnavailable.
class ChainStateProvider {
public:
    virtual ~ChainStateProvider() = default;

    virtual BlockHeader latest_block() = 0;
    virtual int64_t block_timestamp(uint64_t number) = 0;
    virtual BlockHeader block_header(const BlockId& block) = 0;
    virtual FeeGrowthPair fee_growth_globals(const BlockId& block) = 0;
    virtual FeeGrowthPair tick_fee_growth_outside(const BlockId& block, int32_t tick) = 0;
    virtual uint256 slot0_sqrt_price_x96(const BlockId& block) = 0;
    virtual TokenDecimals token_decimals() = 0;
};

// Replays a recorded dump of pool state. Block timestamps follow a linear
// clock (genesis_timestamp + number * block_time). Pool state at a block is
// the most recent recorded write at or before it; ticks never written read as
// zero, like uninitialised ticks on chain.
//
// {
//   "chain":    {"genesis_timestamp": 1686789347, "block_time": 2, "latest_block": 21000000},
//   "decimals": [18, 6],
//   "states": [
//     {"block": 20000000, "sqrt_price_x96": "...",
//      "fee_growth_global": ["...", "..."],
//      "ticks": {"-200100": ["...", "..."]}}
//   ]
// }
class RecordedChainState final : public ChainStateProvider {
public:
    struct PoolState {
        uint256 sqrt_price_x96{0};
        FeeGrowthPair fee_growth_global{};
        std::map<int32_t, FeeGrowthPair> ticks;
    };

    RecordedChainState(int64_t genesis_timestamp,
                       double block_time,
                       uint64_t latest_block,
                       TokenDecimals decimals);

    static RecordedChainState from_json(const boost::json::value& root);
    static RecordedChainState load(const std::filesystem::path& path);

    // Records pool state as written at `block`; later blocks inherit it.
    void record(uint64_t block, PoolState state);

    BlockHeader latest_block() override;
    int64_t block_timestamp(uint64_t number) override;
    BlockHeader block_header(const BlockId& block) override;
    FeeGrowthPair fee_growth_globals(const BlockId& block) override;
    FeeGrowthPair tick_fee_growth_outside(const BlockId& block, int32_t tick) override;
    uint256 slot0_sqrt_price_x96(const BlockId& block) override;
    TokenDecimals token_decimals() override { return decimals_; }

    size_t reads() const { return reads_; }

private:
    uint64_t resolve(const BlockId& block) const;
    const PoolState& state_at(const BlockId& block);

    int64_t genesis_timestamp_;
    double block_time_;
    uint64_t latest_block_;
    TokenDecimals decimals_;
    std::map<uint64_t, PoolState> states_;
    size_t reads_{0};
};

// Decorator retrying UpstreamUnavailable from the wrapped provider with a
// fixed delay. Other errors pass straight through.
class RetryingChainStateProvider final : public ChainStateProvider {
public:
    RetryingChainStateProvider(ChainStateProvider& inner, RetryPolicy policy)
        : inner_(inner), policy_(policy) {}

    BlockHeader latest_block() override;
    int64_t block_timestamp(uint64_t number) override;
    BlockHeader block_header(const BlockId& block) override;
    FeeGrowthPair fee_growth_globals(const BlockId& block) override;
    FeeGrowthPair tick_fee_growth_outside(const BlockId& block, int32_t tick) override;
    uint256 slot0_sqrt_price_x96(const BlockId& block) override;
    TokenDecimals token_decimals() override;

    size_t retries() const { return retries_; }

private:
    template <typename Fn>
    auto call(const char* what, Fn&& fn) -> decltype(fn());

    ChainStateProvider& inner_;
    RetryPolicy policy_;
    size_t retries_{0};
};

} // namespace clmm
