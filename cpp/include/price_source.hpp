#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include <boost/json.hpp>

namespace clmm {

struct PriceSample {
    int64_t timestamp{0};  // UTC epoch seconds
    double price{0.0};
};

// Ordered (timestamp, price) series at a fixed cadence.
class HistoricalPriceSource {
public:
    virtual ~HistoricalPriceSource() = default;
    virtual const std::vector<PriceSample>& samples() const = 0;
};

// In-memory series; sorts by timestamp on construction.
class PriceSeries final : public HistoricalPriceSource {
public:
    PriceSeries() = default;
    explicit PriceSeries(std::vector<PriceSample> samples);

    const std::vector<PriceSample>& samples() const override { return samples_; }

    // Last sample with timestamp <= ts, searching samples_[0, end).
    std::optional<PriceSample> at_or_before(int64_t ts, size_t end) const;
    std::optional<PriceSample> at_or_before(int64_t ts) const { return at_or_before(ts, samples_.size()); }

    // Restricts to [start_ts, end_ts].
    PriceSeries window(int64_t start_ts, int64_t end_ts) const;

    // Accepts an array of klines ([open_time, open, high, low, close, volume, ...])
    // or of objects carrying "timestamp"/"ts" and "price"/"close", optionally
    // wrapped in {"data": [...]} or {"candles": [...]}. Timestamps may be epoch
    // seconds, epoch milliseconds or ISO-8601 strings (naive means UTC).
    // Rows without a positive price are dropped with a warning.
    static PriceSeries from_json(const boost::json::value& root, size_t limit = 0);
    static PriceSeries load(const std::filesystem::path& path, size_t limit = 0);

private:
    std::vector<PriceSample> samples_;
};

} // namespace clmm
