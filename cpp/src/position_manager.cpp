#include "position_manager.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

#include "errors.hpp"
#include "time_utils.hpp"

namespace clmm {

PositionLifecycleManager::PositionLifecycleManager(const SimConfig& cfg, const FeeAccrualCalculator& fees)
    : cfg_(cfg), fees_(fees), current_capital_(cfg.initial_capital) {}

// ------------------------------ internals -----------------------------------

Position PositionLifecycleManager::build(double capital, double price, int64_t ts) const {
    const PriceRange range = make_range(price, cfg_.lower_bound_factor, cfg_.upper_bound_factor);

    // Size at a reference inside the range even if the caller's price is not.
    const double reference = std::max(std::min(price, range.upper), range.lower);

    Position pos;
    pos.open_price = price;
    pos.range = range;
    pos.open_timestamp = ts;
    pos.capital_deployed = capital;
    pos.liquidity = LiquiditySizer::size_liquidity(capital, reference, range.lower, range.upper);
    return pos;
}

CloseReport PositionLifecycleManager::settle(const Position& pos, double price, int64_t ts) const {
    CloseReport report;
    report.value_before_slippage =
        LiquiditySizer::position_value(pos.liquidity, pos.range.lower, pos.range.upper, price);
    report.value_after_slippage = report.value_before_slippage * (1.0 - cfg_.slippage_factor);
    report.fees = fees_.calculate_fees(pos.open_timestamp, ts, current_capital_, price);
    report.capital_after = report.value_after_slippage + report.fees.total_fees_usd;
    return report;
}

void PositionLifecycleManager::log_open(const Position& pos) const {
    if (!cfg_.verbose) return;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4)
        << "Opened position at " << time_utils::format_utc(pos.open_timestamp)
        << " (price=" << pos.open_price << "), range=(" << pos.range.lower << "," << pos.range.upper << ")"
        << std::setprecision(6) << ", minted L=" << pos.liquidity
        << std::setprecision(2) << ", capital=" << pos.capital_deployed << "\n";
    std::cout << oss.str();
}

void PositionLifecycleManager::log_close(const CloseReport& report, double price, int64_t ts) const {
    if (!cfg_.verbose) return;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4)
        << "Closing position at " << time_utils::format_utc(ts) << ", price=" << price
        << std::setprecision(2) << ". Value before slippage=" << report.value_before_slippage
        << ", after slippage=" << report.value_after_slippage
        << ", slippage_factor=" << std::defaultfloat << cfg_.slippage_factor << "\n"
        << std::fixed << std::setprecision(2)
        << "Calculated fees for the period: " << report.fees.total_fees_usd << " USD\n";
    std::cout << oss.str();
}

// ------------------------------ operations ----------------------------------

const Position& PositionLifecycleManager::open(double price, int64_t ts) {
    if (is_open()) {
        throw InvalidInput("a position is already open; close or rebalance it first");
    }
    Position pos = build(current_capital_, price, ts);
    state_ = pos;
    log_open(pos);
    return std::get<Position>(state_);
}

double PositionLifecycleManager::close(double price, int64_t ts) {
    const Position* pos = position();
    if (!pos) {
        if (cfg_.verbose) std::cout << "No active position to close.\n";
        return current_capital_;
    }
    CloseReport report = settle(*pos, price, ts);
    log_close(report, price, ts);

    current_capital_ = report.capital_after;
    state_ = NoPosition{};
    last_close_ = std::move(report);
    return current_capital_;
}

const Position& PositionLifecycleManager::rebalance(double price, int64_t ts) {
    const Position* pos = position();
    if (!pos) {
        // Nothing to settle: behaves as a plain open.
        return open(price, ts);
    }
    CloseReport report = settle(*pos, price, ts);
    Position next = build(report.capital_after, price, ts);

    log_close(report, price, ts);
    current_capital_ = report.capital_after;
    last_close_ = std::move(report);
    state_ = next;
    log_open(next);
    return std::get<Position>(state_);
}

const Position& PositionLifecycleManager::open(double price, const std::string& ts) {
    return open(price, time_utils::to_epoch_assume_utc(ts));
}

double PositionLifecycleManager::close(double price, const std::string& ts) {
    return close(price, time_utils::to_epoch_assume_utc(ts));
}

const Position& PositionLifecycleManager::rebalance(double price, const std::string& ts) {
    return rebalance(price, time_utils::to_epoch_assume_utc(ts));
}

double PositionLifecycleManager::value(double price) const {
    return std::visit(
        [price](const auto& s) -> double {
            using S = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<S, Position>) {
                return LiquiditySizer::position_value(s.liquidity, s.range.lower, s.range.upper, price);
            } else {
                return 0.0;
            }
        },
        state_);
}

} // namespace clmm
