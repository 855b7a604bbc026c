#include "recorder.hpp"

namespace json = boost::json;

namespace clmm {

namespace {

json::array to_rows(const std::vector<ValueRecord>& records) {
    json::array rows;
    rows.reserve(records.size());
    for (const auto& r : records) {
        rows.push_back(json::array{r.timestamp, r.position_value, r.price});
    }
    return rows;
}

} // namespace

json::object SeriesRecorder::to_json() const {
    json::object out;
    out["samples"] = to_rows(samples_);
    out["rebalances"] = to_rows(rebalances_);
    return out;
}

} // namespace clmm
