#include <catch2/catch_all.hpp>
#include "qsim/errors.hpp"
#include "qsim/metrics.hpp"
#include "qsim/statistics.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace qsim;
using qsim::test::makeReturns;
using Catch::Approx;

namespace {

std::vector<Signal> holds(std::size_t n) { return std::vector<Signal>(n, Signal::Hold); }

} // namespace

TEST_CASE("Statistics helpers") {
    std::vector<double> v{1, 2, 3, 4};
    REQUIRE(Statistics::mean(v) == Approx(2.5));
    REQUIRE(Statistics::variance(v) == Approx(5.0 / 3.0));
    REQUIRE(Statistics::mean(std::vector<double>{}) == 0.0);
    REQUIRE(Statistics::standard_deviation(std::vector<double>{1.0}) == 0.0);
    REQUIRE(RiskMetrics::max_drawdown({1.0, 2.0, 1.0, 3.0}) == Approx(-0.5));
}

TEST_CASE("Empty input gives an empty report") {
    MetricsCalculator calc(BacktestConfig{});
    auto report = calc.compute(ReturnSeries{}, {});
    REQUIRE(report.empty());
}

TEST_CASE("A run that never trades") {
    MetricsCalculator calc(BacktestConfig{});
    auto report = calc.compute(makeReturns({0, 0, 0, 0}), holds(5));
    REQUIRE(report.at(metric::kTotalReturn) == 0.0);
    REQUIRE(report.at(metric::kAnnualReturn) == 0.0);
    REQUIRE(report.at(metric::kAnnualVolatility) == 0.0);
    REQUIRE(report.at(metric::kSharpe) == 0.0);
    REQUIRE(report.at(metric::kMaxDrawdown) == 0.0);
    REQUIRE(report.at(metric::kTradeCount) == 0.0);
    REQUIRE(report.at(metric::kWinRate) == 0.0);
    REQUIRE(report.at(metric::kObservations) == 4.0);
    REQUIRE(report.at(metric::kCalmar) == 0.0);
    REQUIRE_FALSE(report.contains(metric::kBeta));
}

TEST_CASE("Constant returns have no volatility and a zero Sharpe") {
    MetricsCalculator calc(BacktestConfig{});
    auto report = calc.compute(makeReturns({0.01, 0.01, 0.01, 0.01}), holds(5));
    REQUIRE(report.at(metric::kAnnualVolatility) == Approx(0.0).margin(1e-12));
    REQUIRE(report.at(metric::kSharpe) == 0.0);
    REQUIRE(report.at(metric::kTotalReturn) == Approx(std::pow(1.01, 4) - 1.0));
}

TEST_CASE("Annualised figures") {
    BacktestConfig c{};
    c.periods_per_year = 4;
    MetricsCalculator calc(c);
    auto report = calc.compute(makeReturns({0.1, -0.05, 0.1, -0.05}), holds(5));
    const double total = 1.1 * 0.95 * 1.1 * 0.95 - 1.0;
    REQUIRE(report.at(metric::kTotalReturn) == Approx(total));
    REQUIRE(report.at(metric::kAnnualReturn) == Approx(total));   // four periods is one year
    const double sd = std::sqrt(4 * 0.075 * 0.075 / 3.0);
    REQUIRE(report.at(metric::kAnnualVolatility) == Approx(sd * 2.0));
    REQUIRE(report.at(metric::kSharpe) == Approx((total - 0.02) / (sd * 2.0)));
}

TEST_CASE("Drawdown depth and duration") {
    MetricsCalculator calc(BacktestConfig{});
    auto report = calc.compute(makeReturns({0.1, -0.2, 0.05}), holds(4));
    REQUIRE(report.at(metric::kMaxDrawdown) == Approx(-0.2));
    REQUIRE(report.at(metric::kMaxDrawdownDuration) == 2.0);
    REQUIRE(report.at(metric::kCalmar) == Approx(report.at(metric::kAnnualReturn) / 0.2));

    auto rising = calc.compute(makeReturns({0.01, 0.0, 0.02}), holds(4));
    REQUIRE(rising.at(metric::kMaxDrawdown) == 0.0);
    REQUIRE(rising.at(metric::kMaxDrawdownDuration) == 0.0);
}

TEST_CASE("Drawdown is floored") {
    const auto crash = makeReturns({-0.9, -0.9, -0.9});  // curve 1 -> 0.001

    auto floored = MetricsCalculator(BacktestConfig{}).compute(crash, holds(4));
    REQUIRE(floored.at(metric::kMaxDrawdown) == Approx(-0.99));

    BacktestConfig c{};
    c.clips.max_drawdown_floor = 1.0;
    auto raw = MetricsCalculator(c).compute(crash, holds(4));
    REQUIRE(raw.at(metric::kMaxDrawdown) == Approx(-0.999));
    REQUIRE(raw.at(metric::kMaxDrawdown) < floored.at(metric::kMaxDrawdown));
}

TEST_CASE("Win rate counts winning bars per trade signal") {
    MetricsCalculator calc(BacktestConfig{});

    SECTION("capped at one") {
        auto report = calc.compute(makeReturns({0.01, 0.01, 0.01}),
                                   {Signal::Buy, Signal::Hold, Signal::Hold, Signal::Hold});
        REQUIRE(report.at(metric::kTradeCount) == 1.0);
        REQUIRE(report.at(metric::kWinRate) == 1.0);
    }
    SECTION("half") {
        auto report = calc.compute(makeReturns({0.01, -0.01}),
                                   {Signal::Hold, Signal::Buy, Signal::Sell});
        REQUIRE(report.at(metric::kTradeCount) == 2.0);
        REQUIRE(report.at(metric::kWinRate) == Approx(0.5));
    }
}

TEST_CASE("Cumulative figures are bounded") {
    BacktestConfig c{};
    c.clips.cumulative_bound = 10.0;
    MetricsCalculator calc(c);
    auto report = calc.compute(makeReturns({10.0, 10.0}), holds(3));
    REQUIRE(report.at(metric::kTotalReturn) == 10.0);
    REQUIRE(report.at(metric::kAnnualReturn) == 10.0);
}

TEST_CASE("Relative metrics against a benchmark") {
    MetricsCalculator calc(BacktestConfig{});
    auto strat = makeReturns({0.01, -0.02, 0.03, 0.0});

    SECTION("identical benchmark") {
        auto report = calc.compute(strat, holds(5), &strat);
        REQUIRE(report.at(metric::kTrackingError) == Approx(0.0).margin(1e-12));
        REQUIRE(report.at(metric::kInformationRatio) == 0.0);
        REQUIRE(report.at(metric::kBeta) == Approx(1.0));
    }
    SECTION("flat benchmark has no beta") {
        auto flat = makeReturns({0, 0, 0, 0});
        auto report = calc.compute(strat, holds(5), &flat);
        REQUIRE(report.contains(metric::kTrackingError));
        REQUIRE_FALSE(report.contains(metric::kBeta));
    }
    SECTION("misaligned benchmark") {
        auto shorter = makeReturns({0.01});
        REQUIRE_THROWS_AS(calc.compute(strat, holds(5), &shorter), AlignmentError);
    }
}

TEST_CASE("Signals must line up with returns") {
    MetricsCalculator calc(BacktestConfig{});
    REQUIRE_THROWS_AS(calc.compute(makeReturns({0.01}), holds(5)), AlignmentError);
}

TEST_CASE("Reports compare by value") {
    PerformanceReport a{PerformanceReport::Map{{"x", 1.0}}};
    auto b = a.withMetric("y", 2.0);
    REQUIRE(a != b);
    REQUIRE(b.size() == 2);
    REQUIRE(a.size() == 1);
    REQUIRE(b.withMetric("y", 2.0) == b);
    REQUIRE_THROWS_AS(a.at("missing"), std::out_of_range);
}
