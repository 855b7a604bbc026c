#include "price_source.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "time_utils.hpp"

namespace json = boost::json;

namespace clmm {

namespace {

std::optional<double> to_real(const json::value& v) {
    if (v.is_double()) return v.as_double();
    if (v.is_int64())  return static_cast<double>(v.as_int64());
    if (v.is_uint64()) return static_cast<double>(v.as_uint64());
    if (v.is_string()) {
        const std::string s = v.as_string().c_str();
        char* end = nullptr;
        const double out = std::strtod(s.c_str(), &end);
        if (end != s.c_str() && *end == '\0') return out;
    }
    return std::nullopt;
}

// Rows whose timestamp is missing or unreadable are dropped like rows
// without a price.
std::optional<int64_t> parse_timestamp(const json::value* v) {
    if (!v) return std::nullopt;
    if (v->is_int64())  return time_utils::normalize_epoch(v->as_int64());
    if (v->is_uint64()) return time_utils::normalize_epoch(static_cast<int64_t>(v->as_uint64()));
    if (v->is_double()) {
        const double d = v->as_double();
        if (!std::isfinite(d) || std::fabs(d) > 9e15) return std::nullopt;
        return time_utils::normalize_epoch(static_cast<int64_t>(d));
    }
    if (v->is_string()) {
        const std::string s = v->as_string().c_str();
        if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos) {
            if (s.size() > 16) return std::nullopt;
            return time_utils::normalize_epoch(std::stoll(s));
        }
        const auto parsed = time_utils::parse_iso8601(s);
        if (!parsed) return std::nullopt;
        return parsed->epoch;
    }
    return std::nullopt;
}

const json::array& rows_of(const json::value& root) {
    if (root.is_array()) return root.as_array();
    if (root.is_object()) {
        const auto& obj = root.as_object();
        for (const char* key : {"data", "candles", "prices"}) {
            if (auto* v = obj.if_contains(key)) {
                if (v->is_array()) return v->as_array();
            }
        }
    }
    throw std::runtime_error("expected price array or object with 'data'/'candles'/'prices' array");
}

} // namespace

PriceSeries::PriceSeries(std::vector<PriceSample> samples) : samples_(std::move(samples)) {
    std::stable_sort(samples_.begin(), samples_.end(),
                     [](const PriceSample& a, const PriceSample& b) { return a.timestamp < b.timestamp; });
}

std::optional<PriceSample> PriceSeries::at_or_before(int64_t ts, size_t end) const {
    end = std::min(end, samples_.size());
    auto it = std::upper_bound(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(end), ts,
                               [](int64_t t, const PriceSample& s) { return t < s.timestamp; });
    if (it == samples_.begin()) return std::nullopt;
    return *(it - 1);
}

PriceSeries PriceSeries::window(int64_t start_ts, int64_t end_ts) const {
    std::vector<PriceSample> out;
    for (const auto& s : samples_) {
        if (s.timestamp >= start_ts && s.timestamp <= end_ts) out.push_back(s);
    }
    return PriceSeries(std::move(out));
}

PriceSeries PriceSeries::from_json(const json::value& root, size_t limit) {
    const json::array& arr = rows_of(root);
    const size_t count = limit ? std::min(limit, arr.size()) : arr.size();

    std::vector<PriceSample> out;
    out.reserve(count);
    size_t dropped = 0;
    for (size_t i = 0; i < count; ++i) {
        const auto& row = arr[i];
        std::optional<int64_t> ts;
        std::optional<double> price;
        if (row.is_array()) {
            const auto& a = row.as_array();
            if (a.size() >= 5) {
                // kline: close is column 4
                ts = parse_timestamp(&a[0]);
                price = to_real(a[4]);
            } else if (a.size() >= 2) {
                ts = parse_timestamp(&a[0]);
                price = to_real(a[1]);
            }
        } else if (row.is_object()) {
            const auto& o = row.as_object();
            const json::value* vt = o.if_contains("timestamp");
            ts = parse_timestamp(vt ? vt : o.if_contains("ts"));
            if (auto* vp = o.if_contains("price")) price = to_real(*vp);
            else if (auto* vc = o.if_contains("close")) price = to_real(*vc);
        }
        if (!ts || !price || !(*price > 0.0)) {
            ++dropped;
            continue;
        }
        out.push_back(PriceSample{*ts, *price});
    }
    if (dropped) {
        std::cerr << "warning: dropped " << dropped << " price rows without a usable timestamp and close price\n";
    }
    return PriceSeries(std::move(out));
}

PriceSeries PriceSeries::load(const std::filesystem::path& path, size_t limit) {
    std::string text;
    try {
        text = read_file(path);
    } catch (const std::runtime_error& e) {
        throw UpstreamUnavailable(std::string("price source unreadable: ") + e.what());
    }
    boost::system::error_code ec;
    const json::value root = json::parse(text, ec);
    if (ec) {
        throw UpstreamUnavailable("price source " + path.string() + " is not valid JSON: " + ec.message());
    }
    return from_json(root, limit);
}

} // namespace clmm
