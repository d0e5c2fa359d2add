#include <catch2/catch_all.hpp>
#include "qsim/errors.hpp"
#include "qsim/indicators.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace qsim;
using Catch::Approx;

TEST_CASE("SMA is NaN during warm-up") {
    auto v = sma({1, 2, 3, 4, 5}, 3);
    REQUIRE(v.size() == 5);
    REQUIRE(std::isnan(v[0]));
    REQUIRE(std::isnan(v[1]));
    REQUIRE(v[2] == Approx(2.0));
    REQUIRE(v[3] == Approx(3.0));
    REQUIRE(v[4] == Approx(4.0));
    REQUIRE_THROWS_AS(sma({1.0}, 0), ConfigError);
}

TEST_CASE("EMA is seeded with the first value") {
    auto v = ema({1, 2, 3}, 3);
    REQUIRE(v[0] == 1.0);
    REQUIRE(v[1] == Approx(1.5));
    REQUIRE(v[2] == Approx(2.25));
    REQUIRE(ema({}, 3).empty());
}

TEST_CASE("RSI from rolling gains and losses") {
    SECTION("alternating moves balance at 50") {
        auto v = rsi({1, 2, 1, 2, 1}, 2);
        REQUIRE(std::isnan(v[0]));
        REQUIRE(std::isnan(v[1]));
        REQUIRE(v[2] == Approx(50.0));
        REQUIRE(v[3] == Approx(50.0));
        REQUIRE(v[4] == Approx(50.0));
    }
    SECTION("only gains reads 100") {
        std::vector<double> up;
        for (int i = 0; i < 20; ++i) up.push_back(100.0 + i);
        auto v = rsi(up, 14);
        REQUIRE(std::isnan(v[13]));
        REQUIRE(v[14] == 100.0);
        REQUIRE(v[19] == 100.0);
    }
    SECTION("a flat series is undefined") {
        auto v = rsi(std::vector<double>(20, 50.0), 14);
        for (double x : v) REQUIRE(std::isnan(x));
    }
    SECTION("known value") {
        // gains 2 + 1, losses 1 over three moves
        auto v = rsi({10, 12, 11, 12}, 3);
        REQUIRE(v[3] == Approx(100.0 - 100.0 / (1.0 + 3.0)));
    }
}

TEST_CASE("MACD of a constant series is exactly zero") {
    auto m = macd(std::vector<double>(60, 100.0));
    for (std::size_t i = 0; i < 60; ++i) {
        REQUIRE(m.macd[i] == 0.0);
        REQUIRE(m.signal_line[i] == 0.0);
    }
}

TEST_CASE("Standard indicators are appended as new columns") {
    auto s = test::makeSeries(std::vector<double>(60, 10.0));
    auto t = addStandardIndicators(s);
    REQUIRE(s.schema().empty());
    REQUIRE(t.schema() == std::vector<std::string>{"MACD", "RSI", "SMA_20", "SMA_50", "Signal_Line"});
    REQUIRE(std::isnan(t[48].value("SMA_50")));
    REQUIRE(t[49].value("SMA_50") == Approx(10.0));
}

TEST_CASE("Standard indicators keep columns the input already has") {
    auto s = test::makeSeries(std::vector<double>(60, 10.0), {{"RSI", std::vector<double>(60, 42.0)}});
    auto t = addStandardIndicators(s);
    REQUIRE(t.schema() == std::vector<std::string>{"MACD", "RSI", "SMA_20", "SMA_50", "Signal_Line"});
    REQUIRE(t[59].value("RSI") == 42.0);
    REQUIRE(addStandardIndicators(t).schema() == t.schema());
}

TEST_CASE("Moving averages for the rotation strategy") {
    auto s = test::makeSeries({1, 2, 3, 4, 5, 6});
    auto t = addMovingAverages(s, {2, 3});
    REQUIRE(t.hasField("SMA_2"));
    REQUIRE(t.hasField("SMA_3"));
    REQUIRE(t[5].value("SMA_3") == Approx(5.0));
    // existing columns are kept as they are
    auto u = addMovingAverages(t, {2, 4});
    REQUIRE(u.schema().size() == 3);
    REQUIRE_THROWS_AS(addMovingAverages(s, {0}), ConfigError);
}

TEST_CASE("Indicators on an empty series still declare their columns") {
    Series empty;
    auto t = addMovingAverages(empty, {30, 60});
    REQUIRE(t.hasField("SMA_30"));
    REQUIRE(t.hasField("SMA_60"));
    REQUIRE(t.dropIncomplete({"SMA_30", "SMA_60"}).empty());
}
