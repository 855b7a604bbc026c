#pragma once

#include <cstdint>
#include <vector>

#include <boost/json.hpp>

namespace clmm {

struct ValueRecord {
    int64_t timestamp{0};
    double position_value{0.0};
    double price{0.0};
};

// Receives per-step samples and rebalance events from the backtest loop.
class Recorder {
public:
    virtual ~Recorder() = default;
    virtual void record_sample(int64_t timestamp, double value, double price) = 0;
    virtual void record_rebalance(int64_t timestamp, double value, double price) = 0;
};

class SeriesRecorder final : public Recorder {
public:
    void record_sample(int64_t timestamp, double value, double price) override {
        samples_.push_back({timestamp, value, price});
    }
    void record_rebalance(int64_t timestamp, double value, double price) override {
        rebalances_.push_back({timestamp, value, price});
    }

    const std::vector<ValueRecord>& samples() const { return samples_; }
    const std::vector<ValueRecord>& rebalances() const { return rebalances_; }

    // {"samples": [[ts, value, price], ...], "rebalances": [...]}
    boost::json::object to_json() const;

private:
    std::vector<ValueRecord> samples_;
    std::vector<ValueRecord> rebalances_;
};

} // namespace clmm
