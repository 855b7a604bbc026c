#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include <boost/json.hpp>

#include "config.hpp"
#include "position_manager.hpp"
#include "price_source.hpp"
#include "recorder.hpp"

namespace clmm {

struct SimulationState {
    std::optional<int64_t> cooldown_until;
    size_t rebalance_count{0};
    size_t skipped_in_cooldown{0};
    size_t wick_count{0};
};

struct BacktestResult {
    size_t steps{0};
    size_t rebalances{0};
    size_t skipped_in_cooldown{0};
    size_t wicks{0};
    double final_value{0.0};
    double final_capital{0.0};
    double last_price{0.0};
    int64_t last_timestamp{0};

    boost::json::object to_json() const;
};

// Drives one position through a price series: open when flat, watch for
// wicks to arm a cooldown, rebalance on buffered range breaches outside the
// cooldown, and record every step.
class BacktestLoop {
public:
    BacktestLoop(const SimConfig& cfg, PositionLifecycleManager& manager, Recorder& recorder);

    BacktestResult run(const PriceSeries& series);

    // Processes series.samples()[index]; the wick lookback sees samples up to
    // and including it.
    void step(const PriceSeries& series, size_t index);

    const SimulationState& state() const { return state_; }

    // Price outside [lower * (1 - buffer), upper * (1 + buffer)].
    static bool breaches_buffer(const PriceRange& range, double price, double buffer_pct);

private:
    void detect_wick(const PriceSeries& series, size_t index);
    bool in_cooldown(int64_t ts) const;

    const SimConfig& cfg_;
    PositionLifecycleManager& manager_;
    Recorder& recorder_;
    SimulationState state_;
    int64_t lookback_seconds_;
    int64_t cooldown_seconds_;
};

} // namespace clmm
