#include "qsim/backtester.hpp"
#include "qsim/data_source.hpp"
#include "qsim/errors.hpp"
#include "qsim/indicators.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

using namespace qsim;

// RSI/MACD/MA crossover strategy on a CSV file of daily bars.
int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "data/SPY.csv";
    try {
        CsvBarSource source(path);
        auto series = addStandardIndicators(source.load("SPY"));

        BacktestConfig config{};
        config.transaction_cost_rate = 0.001;
        config.slippage_rate = 0.0005;

        Backtester bt(StrategyKind::Oscillator, config);
        auto res = bt.run(series);
        for (const auto& kv : res.report) std::cout << kv.first << ": " << kv.second << "\n";
    } catch (const Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
