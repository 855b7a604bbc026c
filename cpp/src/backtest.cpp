#include "backtest.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "time_utils.hpp"

namespace json = boost::json;

namespace clmm {

namespace {

int64_t hours_to_seconds(double hours) {
    return static_cast<int64_t>(std::llround(hours * static_cast<double>(time_utils::SECONDS_PER_HOUR)));
}

} // namespace

json::object BacktestResult::to_json() const {
    json::object out;
    out["steps"] = static_cast<uint64_t>(steps);
    out["rebalances"] = static_cast<uint64_t>(rebalances);
    out["skipped_in_cooldown"] = static_cast<uint64_t>(skipped_in_cooldown);
    out["wicks"] = static_cast<uint64_t>(wicks);
    out["final_value"] = final_value;
    out["final_capital"] = final_capital;
    out["last_price"] = last_price;
    out["last_timestamp"] = last_timestamp;
    return out;
}

BacktestLoop::BacktestLoop(const SimConfig& cfg, PositionLifecycleManager& manager, Recorder& recorder)
    : cfg_(cfg),
      manager_(manager),
      recorder_(recorder),
      lookback_seconds_(hours_to_seconds(cfg.wick_lookback_hours)),
      cooldown_seconds_(hours_to_seconds(cfg.wick_cooldown_hours)) {}

bool BacktestLoop::breaches_buffer(const PriceRange& range, double price, double buffer_pct) {
    return price < range.lower * (1.0 - buffer_pct) || price > range.upper * (1.0 + buffer_pct);
}

bool BacktestLoop::in_cooldown(int64_t ts) const {
    return state_.cooldown_until && ts < *state_.cooldown_until;
}

void BacktestLoop::detect_wick(const PriceSeries& series, size_t index) {
    const PriceSample& now = series.samples()[index];
    const auto past = series.at_or_before(now.timestamp - lookback_seconds_, index + 1);
    if (!past || !(past->price > 0.0)) return;

    const double change = std::abs(now.price - past->price) / past->price;
    if (change >= cfg_.wick_threshold && !in_cooldown(now.timestamp)) {
        state_.cooldown_until = now.timestamp + cooldown_seconds_;
        ++state_.wick_count;
        if (cfg_.verbose) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2)
                << "Price wick at " << time_utils::format_utc(now.timestamp) << ": " << change * 100.0
                << "% change. Cooldown until " << time_utils::format_utc(*state_.cooldown_until) << ".\n";
            std::cout << oss.str();
        }
    }
}

void BacktestLoop::step(const PriceSeries& series, size_t index) {
    const PriceSample& sample = series.samples()[index];
    if (!(sample.price > 0.0)) {
        std::cerr << "warning: no usable price at " << time_utils::format_utc(sample.timestamp) << "\n";
        return;
    }

    if (!manager_.is_open()) {
        manager_.open(sample.price, sample.timestamp);
    }

    detect_wick(series, index);

    const Position* pos = manager_.position();
    if (pos && breaches_buffer(pos->range, sample.price, cfg_.buffer_pct)) {
        if (in_cooldown(sample.timestamp)) {
            ++state_.skipped_in_cooldown;
            if (cfg_.verbose) {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(4)
                    << "Rebalance condition met at " << time_utils::format_utc(sample.timestamp)
                    << " (price: " << sample.price << ") but in cooldown until "
                    << time_utils::format_utc(*state_.cooldown_until) << ".\n";
                std::cout << oss.str();
            }
        } else {
            if (cfg_.verbose) {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(4)
                    << "Price " << sample.price << " at " << time_utils::format_utc(sample.timestamp)
                    << " is outside the buffered range. Rebalancing...\n";
                std::cout << oss.str();
            }
            manager_.rebalance(sample.price, sample.timestamp);
            ++state_.rebalance_count;
            recorder_.record_rebalance(sample.timestamp, manager_.value(sample.price), sample.price);
        }
    }

    recorder_.record_sample(sample.timestamp, manager_.value(sample.price), sample.price);
}

BacktestResult BacktestLoop::run(const PriceSeries& series) {
    BacktestResult result;
    const auto& samples = series.samples();
    for (size_t i = 0; i < samples.size(); ++i) {
        step(series, i);
        ++result.steps;
        if (samples[i].price > 0.0) {
            result.last_price = samples[i].price;
            result.last_timestamp = samples[i].timestamp;
        }
    }
    result.rebalances = state_.rebalance_count;
    result.skipped_in_cooldown = state_.skipped_in_cooldown;
    result.wicks = state_.wick_count;
    result.final_value = manager_.value(result.last_price);
    result.final_capital = manager_.current_capital();
    return result;
}

} // namespace clmm
