#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <boost/json.hpp>

namespace clmm {

// Bounded fixed-delay retry. Applied by transport collaborators only; the
// core never retries a read.
struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds delay{1000};
};

struct ChainPreset {
    const char* name;
    double block_time;  // average seconds per block
};

// Known chains and their average block time.
const ChainPreset* find_chain_preset(const std::string& name);

struct SimConfig {
    // Pool identity
    std::string pool_name{"WETH/USDC"};
    std::string pool_address{"0x6c561b446416e1a00e8e93e221854d6ea4171372"};
    std::string chain{"base"};
    double fee_tier{0.003};

    // Liquidity range around the reference price
    double lower_bound_factor{0.85};
    double upper_bound_factor{1.15};

    // Rebalance policy
    double initial_capital{10000.0};
    double buffer_pct{0.01};
    double wick_threshold{0.08};
    double wick_lookback_hours{12.0};
    double wick_cooldown_hours{4.0};
    double slippage_factor{0.001};

    // Block search
    int64_t tolerance_seconds{5};
    int max_search_tries{50};
    std::optional<double> approx_block_time_seconds;

    RetryPolicy retry{};
    bool verbose{true};

    std::string base_asset() const;
    std::string quote_asset() const;

    // Explicit approx_block_time_seconds, else the chain preset, else none.
    std::optional<double> effective_block_time() const;

    // Throws std::runtime_error naming the offending key.
    void validate() const;
};

// Overlays keys present in `obj` onto `cfg`. Accepts either a flat object or
// one with "pool", "range", "simulation", "search" and "retry" sections.
void apply_config(const boost::json::object& obj, SimConfig& cfg);

SimConfig load_config(const std::filesystem::path& path);

boost::json::object config_to_json(const SimConfig& cfg);

std::string read_file(const std::filesystem::path& path);

} // namespace clmm
