#include "config.hpp"

// Boost.JSON is used header-only; its implementation is compiled in this TU.
#include <boost/json/src.hpp>

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace json = boost::json;

namespace clmm {

namespace {

constexpr std::array<ChainPreset, 3> kChainPresets{{
    {"ethereum", 13.0},
    {"base", 2.0},
    {"arbitrum", 0.5},
}};

double parse_plain_real(const json::value& v, const char* key) {
    if (v.is_double()) return v.as_double();
    if (v.is_int64())  return static_cast<double>(v.as_int64());
    if (v.is_uint64()) return static_cast<double>(v.as_uint64());
    if (v.is_string()) {
        const std::string s = v.as_string().c_str();
        char* end = nullptr;
        const double out = std::strtod(s.c_str(), &end);
        if (end != s.c_str() && *end == '\0') return out;
    }
    throw std::runtime_error(std::string("config key '") + key + "' must be numeric");
}

int64_t parse_int(const json::value& v, const char* key) {
    if (v.is_int64())  return v.as_int64();
    if (v.is_uint64()) return static_cast<int64_t>(v.as_uint64());
    return static_cast<int64_t>(parse_plain_real(v, key));
}

std::string parse_string(const json::value& v, const char* key) {
    if (!v.is_string()) {
        throw std::runtime_error(std::string("config key '") + key + "' must be a string");
    }
    return v.as_string().c_str();
}

bool parse_bool(const json::value& v, const char* key) {
    if (!v.is_bool()) {
        throw std::runtime_error(std::string("config key '") + key + "' must be a boolean");
    }
    return v.as_bool();
}

const json::object& section(const json::object& root, const char* name) {
    if (auto* v = root.if_contains(name)) {
        if (!v->is_object()) {
            throw std::runtime_error(std::string("config section '") + name + "' must be an object");
        }
        return v->as_object();
    }
    return root;
}

} // namespace

const ChainPreset* find_chain_preset(const std::string& name) {
    for (const auto& p : kChainPresets) {
        if (name == p.name) return &p;
    }
    return nullptr;
}

std::string SimConfig::base_asset() const {
    const auto slash = pool_name.find('/');
    return slash == std::string::npos ? pool_name : pool_name.substr(0, slash);
}

std::string SimConfig::quote_asset() const {
    const auto slash = pool_name.find('/');
    return slash == std::string::npos ? std::string() : pool_name.substr(slash + 1);
}

std::optional<double> SimConfig::effective_block_time() const {
    if (approx_block_time_seconds) return approx_block_time_seconds;
    if (const auto* preset = find_chain_preset(chain)) return preset->block_time;
    return std::nullopt;
}

void SimConfig::validate() const {
    if (!(lower_bound_factor > 0.0)) {
        throw std::runtime_error("config key 'lower_bound_factor' must be positive");
    }
    if (!(upper_bound_factor > lower_bound_factor)) {
        throw std::runtime_error("config key 'upper_bound_factor' must exceed lower_bound_factor");
    }
    if (initial_capital < 0.0) {
        throw std::runtime_error("config key 'initial_capital' must not be negative");
    }
    if (buffer_pct < 0.0) {
        throw std::runtime_error("config key 'buffer_pct' must not be negative");
    }
    if (slippage_factor < 0.0 || slippage_factor >= 1.0) {
        throw std::runtime_error("config key 'slippage_factor' must be in [0, 1)");
    }
    if (wick_lookback_hours < 0.0 || wick_cooldown_hours < 0.0) {
        throw std::runtime_error("config keys 'wick_lookback_hours'/'wick_cooldown_hours' must not be negative");
    }
    if (tolerance_seconds < 0) {
        throw std::runtime_error("config key 'tolerance_seconds' must not be negative");
    }
    if (max_search_tries < 0) {
        throw std::runtime_error("config key 'max_search_tries' must not be negative");
    }
    if (approx_block_time_seconds && !(*approx_block_time_seconds > 0.0)) {
        throw std::runtime_error("config key 'approx_block_time_seconds' must be positive");
    }
    if (retry.max_attempts < 1) {
        throw std::runtime_error("config key 'retry.max_attempts' must be at least 1");
    }
}

void apply_config(const json::object& root, SimConfig& cfg) {
    const json::object& pool = section(root, "pool");
    if (auto* v = pool.if_contains("pool_name")) cfg.pool_name = parse_string(*v, "pool_name");
    if (auto* v = pool.if_contains("pool_address")) cfg.pool_address = parse_string(*v, "pool_address");
    if (auto* v = pool.if_contains("chain")) cfg.chain = parse_string(*v, "chain");
    if (auto* v = pool.if_contains("fee_tier")) cfg.fee_tier = parse_plain_real(*v, "fee_tier");

    const json::object& range = section(root, "range");
    if (auto* v = range.if_contains("lower_bound_factor")) cfg.lower_bound_factor = parse_plain_real(*v, "lower_bound_factor");
    if (auto* v = range.if_contains("upper_bound_factor")) cfg.upper_bound_factor = parse_plain_real(*v, "upper_bound_factor");

    const json::object& sim = section(root, "simulation");
    if (auto* v = sim.if_contains("initial_capital")) cfg.initial_capital = parse_plain_real(*v, "initial_capital");
    if (auto* v = sim.if_contains("buffer_pct")) cfg.buffer_pct = parse_plain_real(*v, "buffer_pct");
    if (auto* v = sim.if_contains("wick_threshold")) cfg.wick_threshold = parse_plain_real(*v, "wick_threshold");
    if (auto* v = sim.if_contains("wick_lookback_hours")) cfg.wick_lookback_hours = parse_plain_real(*v, "wick_lookback_hours");
    if (auto* v = sim.if_contains("wick_cooldown_hours")) cfg.wick_cooldown_hours = parse_plain_real(*v, "wick_cooldown_hours");
    if (auto* v = sim.if_contains("slippage_factor")) cfg.slippage_factor = parse_plain_real(*v, "slippage_factor");
    if (auto* v = sim.if_contains("verbose")) cfg.verbose = parse_bool(*v, "verbose");

    const json::object& search = section(root, "search");
    if (auto* v = search.if_contains("tolerance_seconds")) cfg.tolerance_seconds = parse_int(*v, "tolerance_seconds");
    if (auto* v = search.if_contains("max_search_tries")) cfg.max_search_tries = static_cast<int>(parse_int(*v, "max_search_tries"));
    if (auto* v = search.if_contains("approx_block_time_seconds")) {
        if (v->is_null()) cfg.approx_block_time_seconds.reset();
        else cfg.approx_block_time_seconds = parse_plain_real(*v, "approx_block_time_seconds");
    }

    if (auto* r = root.if_contains("retry")) {
        if (!r->is_object()) throw std::runtime_error("config section 'retry' must be an object");
        const auto& ro = r->as_object();
        if (auto* v = ro.if_contains("max_attempts")) cfg.retry.max_attempts = static_cast<int>(parse_int(*v, "retry.max_attempts"));
        if (auto* v = ro.if_contains("delay_ms")) cfg.retry.delay = std::chrono::milliseconds(parse_int(*v, "retry.delay_ms"));
    }
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open file: " + path.string());
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

SimConfig load_config(const std::filesystem::path& path) {
    const json::value root = json::parse(read_file(path));
    if (!root.is_object()) {
        throw std::runtime_error("config must be a JSON object: " + path.string());
    }
    SimConfig cfg;
    apply_config(root.as_object(), cfg);
    cfg.validate();
    return cfg;
}

json::object config_to_json(const SimConfig& cfg) {
    json::object out;
    out["pool_name"] = cfg.pool_name;
    out["pool_address"] = cfg.pool_address;
    out["chain"] = cfg.chain;
    out["fee_tier"] = cfg.fee_tier;
    out["lower_bound_factor"] = cfg.lower_bound_factor;
    out["upper_bound_factor"] = cfg.upper_bound_factor;
    out["initial_capital"] = cfg.initial_capital;
    out["buffer_pct"] = cfg.buffer_pct;
    out["wick_threshold"] = cfg.wick_threshold;
    out["wick_lookback_hours"] = cfg.wick_lookback_hours;
    out["wick_cooldown_hours"] = cfg.wick_cooldown_hours;
    out["slippage_factor"] = cfg.slippage_factor;
    out["tolerance_seconds"] = cfg.tolerance_seconds;
    out["max_search_tries"] = cfg.max_search_tries;
    if (const auto bt = cfg.effective_block_time()) out["approx_block_time_seconds"] = *bt;
    else out["approx_block_time_seconds"] = nullptr;
    return out;
}

} // namespace clmm
