#include "chain_state.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace json = boost::json;

namespace clmm {

namespace {

uint256 parse_u256(const json::value& v) {
    if (v.is_string()) return uint256(v.as_string().c_str());
    if (v.is_uint64()) return uint256(v.as_uint64());
    if (v.is_int64() && v.as_int64() >= 0) return uint256(v.as_int64());
    throw std::runtime_error("expected unsigned integer or decimal string");
}

FeeGrowthPair parse_pair(const json::value& v) {
    const auto& arr = v.as_array();
    if (arr.size() < 2) throw std::runtime_error("fee growth pair must have two entries");
    return FeeGrowthPair{parse_u256(arr[0]), parse_u256(arr[1])};
}

int64_t to_int(const json::value& v) {
    if (v.is_int64())  return v.as_int64();
    if (v.is_uint64()) return static_cast<int64_t>(v.as_uint64());
    if (v.is_double()) return static_cast<int64_t>(v.as_double());
    if (v.is_string()) return std::stoll(std::string(v.as_string().c_str()));
    throw std::runtime_error("expected integer");
}

double to_real(const json::value& v) {
    if (v.is_double()) return v.as_double();
    return static_cast<double>(to_int(v));
}

} // namespace

// ----------------------------- RecordedChainState ---------------------------

RecordedChainState::RecordedChainState(int64_t genesis_timestamp,
                                       double block_time,
                                       uint64_t latest_block,
                                       TokenDecimals decimals)
    : genesis_timestamp_(genesis_timestamp),
      block_time_(block_time),
      latest_block_(latest_block),
      decimals_(decimals) {
    if (!(block_time_ > 0.0)) {
        throw std::invalid_argument("block_time must be positive");
    }
}

RecordedChainState RecordedChainState::from_json(const json::value& root) {
    const auto& obj = root.as_object();
    const auto& chain = obj.at("chain").as_object();

    TokenDecimals decimals;
    if (auto* d = obj.if_contains("decimals")) {
        const auto& arr = d->as_array();
        if (arr.size() < 2) throw std::runtime_error("decimals must have two entries");
        decimals.token0 = static_cast<int>(to_int(arr[0]));
        decimals.token1 = static_cast<int>(to_int(arr[1]));
    }

    RecordedChainState out(to_int(chain.at("genesis_timestamp")),
                           to_real(chain.at("block_time")),
                           static_cast<uint64_t>(to_int(chain.at("latest_block"))),
                           decimals);

    if (auto* states = obj.if_contains("states")) {
        for (const auto& entry : states->as_array()) {
            const auto& so = entry.as_object();
            PoolState st;
            st.sqrt_price_x96 = parse_u256(so.at("sqrt_price_x96"));
            st.fee_growth_global = parse_pair(so.at("fee_growth_global"));
            if (auto* ticks = so.if_contains("ticks")) {
                for (const auto& kv : ticks->as_object()) {
                    const int32_t tick = static_cast<int32_t>(std::stol(std::string(kv.key().data(), kv.key().size())));
                    st.ticks[tick] = parse_pair(kv.value());
                }
            }
            out.record(static_cast<uint64_t>(to_int(so.at("block"))), std::move(st));
        }
    }
    return out;
}

RecordedChainState RecordedChainState::load(const std::filesystem::path& path) {
    return from_json(json::parse(read_file(path)));
}

void RecordedChainState::record(uint64_t block, PoolState state) {
    if (block > latest_block_) {
        throw std::invalid_argument("recorded block " + std::to_string(block) +
                                    " is past latest block " + std::to_string(latest_block_));
    }
    states_[block] = std::move(state);
}

uint64_t RecordedChainState::resolve(const BlockId& block) const {
    if (block.is_latest()) return latest_block_;
    if (block.number() > latest_block_) {
        throw UpstreamUnavailable("block " + block.str() + " not found (latest is " +
                                  std::to_string(latest_block_) + ")");
    }
    return block.number();
}

const RecordedChainState::PoolState& RecordedChainState::state_at(const BlockId& block) {
    const uint64_t n = resolve(block);
    auto it = states_.upper_bound(n);
    if (it == states_.begin()) {
        throw UpstreamUnavailable("no pool state recorded at or before block " + std::to_string(n));
    }
    --it;
    return it->second;
}

BlockHeader RecordedChainState::latest_block() {
    ++reads_;
    return BlockHeader{latest_block_, block_timestamp(latest_block_)};
}

int64_t RecordedChainState::block_timestamp(uint64_t number) {
    ++reads_;
    const uint64_t n = resolve(BlockId(number));
    return genesis_timestamp_ + static_cast<int64_t>(std::floor(static_cast<double>(n) * block_time_));
}

BlockHeader RecordedChainState::block_header(const BlockId& block) {
    const uint64_t n = resolve(block);
    return BlockHeader{n, block_timestamp(n)};
}

FeeGrowthPair RecordedChainState::fee_growth_globals(const BlockId& block) {
    ++reads_;
    return state_at(block).fee_growth_global;
}

FeeGrowthPair RecordedChainState::tick_fee_growth_outside(const BlockId& block, int32_t tick) {
    ++reads_;
    const auto& st = state_at(block);
    auto it = st.ticks.find(tick);
    if (it == st.ticks.end()) return FeeGrowthPair{};
    return it->second;
}

uint256 RecordedChainState::slot0_sqrt_price_x96(const BlockId& block) {
    ++reads_;
    return state_at(block).sqrt_price_x96;
}

// ------------------------- RetryingChainStateProvider -----------------------

template <typename Fn>
auto RetryingChainStateProvider::call(const char* what, Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const UpstreamUnavailable& e) {
            if (attempt >= policy_.max_attempts) throw;
            ++retries_;
            std::cerr << "warning: " << what << " failed (attempt " << attempt << "/"
                      << policy_.max_attempts << "): " << e.what() << "\n";
            if (policy_.delay.count() > 0) {
                std::this_thread::sleep_for(policy_.delay);
            }
        }
    }
}

BlockHeader RetryingChainStateProvider::latest_block() {
    return call("latest_block", [&] { return inner_.latest_block(); });
}

int64_t RetryingChainStateProvider::block_timestamp(uint64_t number) {
    return call("block_timestamp", [&] { return inner_.block_timestamp(number); });
}

BlockHeader RetryingChainStateProvider::block_header(const BlockId& block) {
    return call("block_header", [&] { return inner_.block_header(block); });
}

FeeGrowthPair RetryingChainStateProvider::fee_growth_globals(const BlockId& block) {
    return call("fee_growth_globals", [&] { return inner_.fee_growth_globals(block); });
}

FeeGrowthPair RetryingChainStateProvider::tick_fee_growth_outside(const BlockId& block, int32_t tick) {
    return call("ticks", [&] { return inner_.tick_fee_growth_outside(block, tick); });
}

uint256 RetryingChainStateProvider::slot0_sqrt_price_x96(const BlockId& block) {
    return call("slot0", [&] { return inner_.slot0_sqrt_price_x96(block); });
}

TokenDecimals RetryingChainStateProvider::token_decimals() {
    return call("decimals", [&] { return inner_.token_decimals(); });
}

} // namespace clmm
