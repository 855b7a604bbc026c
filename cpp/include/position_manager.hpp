#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "config.hpp"
#include "fee_accrual.hpp"
#include "liquidity_sizer.hpp"

namespace clmm {

struct Position {
    double open_price{0.0};
    PriceRange range{};
    int64_t open_timestamp{0};  // UTC epoch seconds
    double capital_deployed{0.0};
    double liquidity{0.0};
};

struct NoPosition {};

// Empty | Open
using PositionState = std::variant<NoPosition, Position>;

struct CloseReport {
    double value_before_slippage{0.0};
    double value_after_slippage{0.0};
    FeeResult fees{};
    double capital_after{0.0};
};

// Owns the single simulated position and the capital it was funded from.
// Every operation either completes or leaves position and capital untouched.
class PositionLifecycleManager {
public:
    PositionLifecycleManager(const SimConfig& cfg, const FeeAccrualCalculator& fees);

    // Empty -> Open. Throws InvalidInput if a position is already open.
    const Position& open(double price, int64_t ts);
    const Position& open(double price, const std::string& ts);

    // Open -> Empty. Returns the new capital; a no-op when already Empty.
    double close(double price, int64_t ts);
    double close(double price, const std::string& ts);

    // Close then open with the proceeds, committed together.
    const Position& rebalance(double price, int64_t ts);
    const Position& rebalance(double price, const std::string& ts);

    // Mark-to-market at `price`; 0 when Empty.
    double value(double price) const;

    bool is_open() const { return std::holds_alternative<Position>(state_); }
    const Position* position() const { return std::get_if<Position>(&state_); }
    const PositionState& state() const { return state_; }
    double current_capital() const { return current_capital_; }
    const std::optional<CloseReport>& last_close() const { return last_close_; }

private:
    Position build(double capital, double price, int64_t ts) const;
    CloseReport settle(const Position& pos, double price, int64_t ts) const;
    void log_open(const Position& pos) const;
    void log_close(const CloseReport& report, double price, int64_t ts) const;

    const SimConfig& cfg_;
    const FeeAccrualCalculator& fees_;
    PositionState state_{NoPosition{}};
    double current_capital_;
    std::optional<CloseReport> last_close_;
};

} // namespace clmm
