#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "errors.hpp"
#include "price_source.hpp"

namespace json = boost::json;
using namespace clmm;

TEST(PriceSeries, SortsOnConstruction) {
    PriceSeries s({{300, 3.0}, {100, 1.0}, {200, 2.0}});
    ASSERT_EQ(s.samples().size(), 3u);
    EXPECT_EQ(s.samples()[0].timestamp, 100);
    EXPECT_EQ(s.samples()[2].timestamp, 300);
}

TEST(PriceSeries, AtOrBefore) {
    PriceSeries s({{100, 1.0}, {200, 2.0}, {300, 3.0}});
    EXPECT_FALSE(s.at_or_before(99).has_value());
    EXPECT_DOUBLE_EQ(s.at_or_before(100)->price, 1.0);
    EXPECT_DOUBLE_EQ(s.at_or_before(250)->price, 2.0);
    EXPECT_DOUBLE_EQ(s.at_or_before(1000)->price, 3.0);
    // Restricted to the first two samples.
    EXPECT_DOUBLE_EQ(s.at_or_before(1000, 2)->price, 2.0);
    EXPECT_FALSE(s.at_or_before(1000, 0).has_value());
}

TEST(PriceSeries, Window) {
    PriceSeries s({{100, 1.0}, {200, 2.0}, {300, 3.0}, {400, 4.0}});
    const PriceSeries w = s.window(200, 300);
    ASSERT_EQ(w.samples().size(), 2u);
    EXPECT_EQ(w.samples().front().timestamp, 200);
    EXPECT_EQ(w.samples().back().timestamp, 300);
}

TEST(PriceSeries, KlinesUseCloseAndMilliseconds) {
    const auto s = PriceSeries::from_json(json::parse(R"([
        [1700003600000, "2000", "2050", "1990", "2010.5", "12.3", 1700007199999],
        [1700000000000, "1990", "2005", "1980", "2000.0", "10.0", 1700003599999]
    ])"));
    ASSERT_EQ(s.samples().size(), 2u);
    EXPECT_EQ(s.samples()[0].timestamp, 1700000000);
    EXPECT_DOUBLE_EQ(s.samples()[0].price, 2000.0);
    EXPECT_EQ(s.samples()[1].timestamp, 1700003600);
    EXPECT_DOUBLE_EQ(s.samples()[1].price, 2010.5);
}

TEST(PriceSeries, PairsAndObjects) {
    const auto pairs = PriceSeries::from_json(json::parse(R"([[1700000000, 2000.5], [1700003600, 2001]])"));
    ASSERT_EQ(pairs.samples().size(), 2u);
    EXPECT_DOUBLE_EQ(pairs.samples()[1].price, 2001.0);

    const auto objs = PriceSeries::from_json(json::parse(R"({"data": [
        {"timestamp": "2023-11-14 22:13:20", "close": "2000"},
        {"ts": "1700003600", "price": 2100}
    ]})"));
    ASSERT_EQ(objs.samples().size(), 2u);
    EXPECT_EQ(objs.samples()[0].timestamp, 1700000000);
    EXPECT_EQ(objs.samples()[1].timestamp, 1700003600);
    EXPECT_DOUBLE_EQ(objs.samples()[1].price, 2100.0);
}

TEST(PriceSeries, DropsRowsWithoutUsablePrice) {
    const auto s = PriceSeries::from_json(json::parse(R"({"candles": [
        [1700000000, 0],
        [1700003600, "n/a"],
        [1700007200, -3],
        [1700010800, 1999.0]
    ]})"));
    ASSERT_EQ(s.samples().size(), 1u);
    EXPECT_EQ(s.samples()[0].timestamp, 1700010800);
}

TEST(PriceSeries, DropsRowsWithoutUsableTimestamp) {
    const auto s = PriceSeries::from_json(json::parse(R"([
        {"price": 2000},
        {"timestamp": null, "price": 2000},
        {"timestamp": true, "close": "2001"},
        {"ts": "2024-02-31", "price": 2002},
        [null, 2003],
        {"timestamp": 1700003600, "price": 2004}
    ])"));
    ASSERT_EQ(s.samples().size(), 1u);
    EXPECT_EQ(s.samples()[0].timestamp, 1700003600);
    EXPECT_DOUBLE_EQ(s.samples()[0].price, 2004.0);
}

TEST(PriceSeries, LimitKeepsLeadingRows) {
    const auto s = PriceSeries::from_json(json::parse(R"([[1, 1.0], [2, 2.0], [3, 3.0]])"), 2);
    ASSERT_EQ(s.samples().size(), 2u);
    EXPECT_EQ(s.samples()[1].timestamp, 2);
}

TEST(PriceSeries, RejectsUnknownShapes) {
    EXPECT_THROW(PriceSeries::from_json(json::parse(R"({"rows": []})")), std::runtime_error);
    EXPECT_THROW(PriceSeries::from_json(json::parse("42")), std::runtime_error);
}

TEST(PriceSeries, UnreadableFileIsUpstreamUnavailable) {
    EXPECT_THROW(PriceSeries::load("/nonexistent/prices.json"), UpstreamUnavailable);

    const auto path = std::filesystem::temp_directory_path() / "clmm_prices_truncated.json";
    {
        std::ofstream out(path);
        out << "[[1700000000, 2000.0], [17000";
    }
    EXPECT_THROW(PriceSeries::load(path), UpstreamUnavailable);
    std::filesystem::remove(path);
}
