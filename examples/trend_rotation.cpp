#include "qsim/backtester.hpp"
#include "qsim/data_source.hpp"
#include "qsim/errors.hpp"
#include "qsim/indicators.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

using namespace qsim;

// Leveraged/defensive rotation: trade TQQQ while QQQ is above its 30, 60,
// 120 and 200 day averages, hold the defensive asset otherwise.
int main(int argc, char** argv) {
    const std::string dir = argc > 1 ? argv[1] : "data";
    try {
        RetryingBarSource source(std::make_unique<CsvBarSource>(dir));
        StrategyParams params{};

        auto qqq = addMovingAverages(source.load("QQQ"), params.rotation_ma_periods)
                       .dropIncomplete(params.rotationFields());
        auto tqqq = source.load("TQQQ");
        if (qqq.empty()) {
            spdlog::error("QQQ has no bars past the longest average");
            return 1;
        }

        // keep the leveraged bars that line up with the trimmed benchmark
        std::vector<Bar> bars;
        for (const auto& b : tqqq) {
            if (b.timestamp >= qqq[0].timestamp) bars.push_back(b);
        }
        Series traded{tqqq.symbol(), std::move(bars)};

        BacktestConfig config{};
        config.transaction_cost_rate = 0.001;
        Backtester bt(StrategyKind::TrendRotation, config, params);
        auto res = bt.run(traded, &qqq);
        for (const auto& kv : res.report) std::cout << kv.first << ": " << kv.second << "\n";
    } catch (const Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
