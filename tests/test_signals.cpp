#include <catch2/catch_all.hpp>
#include "qsim/errors.hpp"
#include "qsim/signals.hpp"
#include "test_helpers.hpp"

#include <limits>

using namespace qsim;
using qsim::test::makeSeries;
using qsim::test::repeat;

namespace {

const double nan = std::numeric_limits<double>::quiet_NaN();

// Oscillator inputs with neutral defaults: RSI 50, MACD on its signal line,
// fast MA on the slow MA.
struct OscInputs {
    std::vector<double> rsi, macd, sl, fast, slow;
    explicit OscInputs(std::size_t n)
        : rsi(repeat(50, n)), macd(repeat(0, n)), sl(repeat(0, n)),
          fast(repeat(100, n)), slow(repeat(100, n)) {}
    Series series() const {
        return makeSeries(repeat(100, rsi.size()),
                          {{"RSI", rsi}, {"MACD", macd}, {"Signal_Line", sl},
                           {"SMA_20", fast}, {"SMA_50", slow}});
    }
};

Series rotationSeries(const std::vector<double>& closes, const std::vector<double>& ma) {
    return makeSeries(closes, {{"SMA_30", ma}, {"SMA_60", ma}, {"SMA_120", ma}, {"SMA_200", ma}});
}

} // namespace

TEST_CASE("RSI thresholds produce Buy and Sell") {
    OscInputs in(4);
    in.rsi = {25, 50, 75, 30};
    OscillatorCrossoverSignal gen(70, 30);
    auto sig = gen.generate(in.series());
    REQUIRE(sig == std::vector<Signal>{Signal::Buy, Signal::Hold, Signal::Sell, Signal::Hold});
}

TEST_CASE("MACD crossing its signal line") {
    OscInputs in(4);
    in.macd = {-1, 1, 1, -1};
    OscillatorCrossoverSignal gen(70, 30);
    auto sig = gen.generate(in.series());
    REQUIRE(sig[0] == Signal::Hold);   // no previous bar
    REQUIRE(sig[1] == Signal::Buy);
    REQUIRE(sig[2] == Signal::Hold);   // still above, no new cross
    REQUIRE(sig[3] == Signal::Sell);
}

TEST_CASE("A cross from equality counts, touching does not") {
    OscInputs in(3);
    in.fast = {100, 101, 101};  // equal then above: cross up
    OscillatorCrossoverSignal gen(70, 30);
    auto sig = gen.generate(in.series());
    REQUIRE(sig[1] == Signal::Buy);
    REQUIRE(sig[2] == Signal::Hold);

    OscInputs touch(3);
    touch.fast = {99, 100, 99};  // touches the slow MA, never above
    auto sig2 = gen.generate(touch.series());
    REQUIRE(sig2 == std::vector<Signal>(3, Signal::Hold));
}

TEST_CASE("Later rules overwrite earlier ones on the same bar") {
    OscillatorCrossoverSignal gen(70, 30);

    SECTION("MACD cross beats RSI") {
        OscInputs in(2);
        in.rsi = {50, 20};          // RSI says Buy
        in.macd = {1, -1};          // MACD crosses down: Sell
        REQUIRE(gen.generate(in.series())[1] == Signal::Sell);
    }
    SECTION("MA cross beats MACD cross") {
        OscInputs in(2);
        in.macd = {-1, 1};          // MACD crosses up: Buy
        in.fast = {101, 99};        // MA crosses down: Sell
        REQUIRE(gen.generate(in.series())[1] == Signal::Sell);
    }
    SECTION("MA cross beats RSI") {
        OscInputs in(2);
        in.rsi = {50, 80};          // RSI says Sell
        in.fast = {99, 101};        // MA crosses up: Buy
        REQUIRE(gen.generate(in.series())[1] == Signal::Buy);
    }
}

TEST_CASE("Warm-up bars never report a cross") {
    OscInputs in(4);
    in.rsi = {nan, nan, 50, 50};
    in.fast = {nan, nan, 101, 99};  // first defined bar is above, then crosses down
    in.slow = {nan, nan, 100, 100};
    in.macd = {nan, 5, 5, 5};       // first defined MACD bar is above its line
    OscillatorCrossoverSignal gen(70, 30);
    auto sig = gen.generate(in.series());
    REQUIRE(sig[0] == Signal::Hold);
    REQUIRE(sig[1] == Signal::Hold);
    REQUIRE(sig[2] == Signal::Hold);
    REQUIRE(sig[3] == Signal::Sell);
}

TEST_CASE("Constant indicators give no signals") {
    OscInputs in(30);
    in.rsi = repeat(nan, 30);
    OscillatorCrossoverSignal gen(70, 30);
    auto sig = gen.generate(in.series());
    REQUIRE(sig == std::vector<Signal>(30, Signal::Hold));
}

TEST_CASE("Missing indicator fields are a DataError") {
    auto s = makeSeries({1, 2, 3}, {{"RSI", {50, 50, 50}}});
    OscillatorCrossoverSignal osc(70, 30);
    TrendRotationSignal rot;
    REQUIRE_THROWS_AS(osc.generate(s), DataError);
    REQUIRE_THROWS_AS(rot.generate(s), DataError);
    REQUIRE(osc.generate(Series{}).empty());
}

TEST_CASE("Trend rotation is Buy only above every moving average") {
    auto s = makeSeries({110, 100, 90, 110},
                        {{"SMA_30", {100, 100, 100, 100}},
                         {"SMA_60", {100, 100, 100, 100}},
                         {"SMA_120", {100, 100, 100, 100}},
                         {"SMA_200", {100, 100, 100, 120}}});
    TrendRotationSignal gen;
    auto sig = gen.generate(s);
    REQUIRE(sig == std::vector<Signal>{Signal::Buy, Signal::Sell, Signal::Sell, Signal::Sell});
}

TEST_CASE("Trend rotation refuses undefined averages") {
    auto s = rotationSeries({110, 110}, {nan, 100});
    TrendRotationSignal gen;
    REQUIRE_THROWS_AS(gen.generate(s), DataError);
    auto trimmed = s.dropIncomplete(StrategyParams{}.rotationFields());
    REQUIRE(gen.generate(trimmed) == std::vector<Signal>{Signal::Buy});
}

TEST_CASE("Trend rotation can read its regime from a benchmark") {
    auto traded = makeSeries({50, 50, 50});
    auto bench = rotationSeries({110, 90, 110}, {100, 100, 100});
    TrendRotationSignal gen;
    REQUIRE(gen.generate(traded, &bench) ==
            std::vector<Signal>{Signal::Buy, Signal::Sell, Signal::Buy});

    auto short_bench = rotationSeries({110, 90}, {100, 100});
    REQUIRE_THROWS_AS(gen.generate(traded, &short_bench), AlignmentError);
}

TEST_CASE("Generators are built from the strategy kind") {
    BacktestConfig c{};
    auto osc = makeSignalGenerator(StrategyKind::Oscillator, c);
    auto rot = makeSignalGenerator(StrategyKind::TrendRotation, c);
    REQUIRE(osc->kind() == StrategyKind::Oscillator);
    REQUIRE(rot->kind() == StrategyKind::TrendRotation);
    REQUIRE(osc->getName() == "OscillatorCrossover");
    REQUIRE(parseStrategyKind("rotation") == StrategyKind::TrendRotation);
    REQUIRE_THROWS_AS(parseStrategyKind("momentum"), ConfigError);
    REQUIRE_THROWS_AS(OscillatorCrossoverSignal(30, 70), ConfigError);
}
