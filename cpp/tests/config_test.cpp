#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <stdexcept>

#include "config.hpp"

namespace json = boost::json;
using namespace clmm;

namespace {

SimConfig applied(const char* text) {
    SimConfig cfg;
    apply_config(json::parse(text).as_object(), cfg);
    return cfg;
}

}  // namespace

TEST(Config, Defaults) {
    SimConfig cfg;
    EXPECT_EQ(cfg.pool_name, "WETH/USDC");
    EXPECT_EQ(cfg.chain, "base");
    EXPECT_DOUBLE_EQ(cfg.lower_bound_factor, 0.85);
    EXPECT_DOUBLE_EQ(cfg.upper_bound_factor, 1.15);
    EXPECT_DOUBLE_EQ(cfg.initial_capital, 10000.0);
    EXPECT_DOUBLE_EQ(cfg.buffer_pct, 0.01);
    EXPECT_DOUBLE_EQ(cfg.wick_threshold, 0.08);
    EXPECT_DOUBLE_EQ(cfg.wick_lookback_hours, 12.0);
    EXPECT_DOUBLE_EQ(cfg.wick_cooldown_hours, 4.0);
    EXPECT_DOUBLE_EQ(cfg.slippage_factor, 0.001);
    EXPECT_EQ(cfg.tolerance_seconds, 5);
    EXPECT_EQ(cfg.max_search_tries, 50);
    EXPECT_EQ(cfg.retry.max_attempts, 3);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(Config, FlatKeys) {
    const SimConfig cfg = applied(R"({"pool_name": "WBTC/USDT", "lower_bound_factor": 0.9,
                                      "upper_bound_factor": "1.1", "initial_capital": 500,
                                      "tolerance_seconds": 2, "verbose": false})");
    EXPECT_EQ(cfg.base_asset(), "WBTC");
    EXPECT_EQ(cfg.quote_asset(), "USDT");
    EXPECT_DOUBLE_EQ(cfg.lower_bound_factor, 0.9);
    EXPECT_DOUBLE_EQ(cfg.upper_bound_factor, 1.1);
    EXPECT_DOUBLE_EQ(cfg.initial_capital, 500.0);
    EXPECT_EQ(cfg.tolerance_seconds, 2);
    EXPECT_FALSE(cfg.verbose);
}

TEST(Config, SectionedKeys) {
    const SimConfig cfg = applied(R"({
        "pool": {"pool_name": "ARB/WETH", "chain": "arbitrum"},
        "range": {"lower_bound_factor": 0.8, "upper_bound_factor": 1.25},
        "simulation": {"buffer_pct": 0.02, "wick_cooldown_hours": 6},
        "search": {"max_search_tries": 30, "approx_block_time_seconds": 0.25},
        "retry": {"max_attempts": 5, "delay_ms": 10}
    })");
    EXPECT_EQ(cfg.chain, "arbitrum");
    EXPECT_DOUBLE_EQ(cfg.lower_bound_factor, 0.8);
    EXPECT_DOUBLE_EQ(cfg.buffer_pct, 0.02);
    EXPECT_DOUBLE_EQ(cfg.wick_cooldown_hours, 6.0);
    EXPECT_EQ(cfg.max_search_tries, 30);
    ASSERT_TRUE(cfg.effective_block_time().has_value());
    EXPECT_DOUBLE_EQ(*cfg.effective_block_time(), 0.25);
    EXPECT_EQ(cfg.retry.max_attempts, 5);
    EXPECT_EQ(cfg.retry.delay.count(), 10);
}

TEST(Config, BlockTimeFromChainPreset) {
    SimConfig cfg;
    cfg.chain = "ethereum";
    EXPECT_DOUBLE_EQ(*cfg.effective_block_time(), 13.0);
    cfg.chain = "base";
    EXPECT_DOUBLE_EQ(*cfg.effective_block_time(), 2.0);
    cfg.chain = "somechain";
    EXPECT_FALSE(cfg.effective_block_time().has_value());
    EXPECT_EQ(find_chain_preset("somechain"), nullptr);
}

TEST(Config, NullBlockTimeClearsOverride) {
    SimConfig cfg;
    cfg.approx_block_time_seconds = 7.0;
    apply_config(json::parse(R"({"approx_block_time_seconds": null})").as_object(), cfg);
    EXPECT_FALSE(cfg.approx_block_time_seconds.has_value());
}

TEST(Config, RejectsWrongTypes) {
    EXPECT_THROW(applied(R"({"initial_capital": "lots"})"), std::runtime_error);
    EXPECT_THROW(applied(R"({"pool_name": 3})"), std::runtime_error);
    EXPECT_THROW(applied(R"({"verbose": "yes"})"), std::runtime_error);
    EXPECT_THROW(applied(R"({"retry": 3})"), std::runtime_error);
}

TEST(Config, ValidateNamesBadKeys) {
    SimConfig cfg;
    cfg.upper_bound_factor = 0.8;
    EXPECT_THROW(cfg.validate(), std::runtime_error);

    cfg = SimConfig{};
    cfg.slippage_factor = 1.0;
    EXPECT_THROW(cfg.validate(), std::runtime_error);

    cfg = SimConfig{};
    cfg.retry.max_attempts = 0;
    EXPECT_THROW(cfg.validate(), std::runtime_error);

    cfg = SimConfig{};
    cfg.approx_block_time_seconds = 0.0;
    try {
        cfg.validate();
        FAIL() << "expected validate() to throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("approx_block_time_seconds"), std::string::npos);
    }
}

TEST(Config, JsonRoundTripPreservesRunParameters) {
    SimConfig cfg;
    cfg.lower_bound_factor = 0.9;
    cfg.wick_threshold = 0.05;
    cfg.max_search_tries = 17;

    const json::object out = config_to_json(cfg);
    SimConfig back;
    apply_config(out, back);
    EXPECT_DOUBLE_EQ(back.lower_bound_factor, 0.9);
    EXPECT_DOUBLE_EQ(back.wick_threshold, 0.05);
    EXPECT_EQ(back.max_search_tries, 17);
    EXPECT_DOUBLE_EQ(*back.approx_block_time_seconds, 2.0);
}
