#include <benchmark/benchmark.h>
#include <qsim/backtester.hpp>
#include <qsim/indicators.hpp>

#include <spdlog/spdlog.h>

#include <random>

// Random-walk daily bars with the indicator columns both strategies read.
class SeriesFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        spdlog::set_level(spdlog::level::warn);

        const auto n = static_cast<std::size_t>(state.range(0));
        std::mt19937 rng(42);
        std::normal_distribution<double> step(0.0003, 0.012);

        std::vector<qsim::Bar> bars(n);
        double px = 100.0;
        for (std::size_t i = 0; i < n; ++i) {
            px *= 1.0 + step(rng);
            auto& b = bars[i];
            b.timestamp = 1577836800 + static_cast<qsim::Timestamp>(i) * 86400;
            b.open = b.high = b.low = b.close = px;
            b.volume = 1e6;
        }
        series = qsim::addStandardIndicators(qsim::Series{"BENCH", std::move(bars)});
        rotation = qsim::addMovingAverages(series, qsim::StrategyParams{}.rotation_ma_periods)
                       .dropIncomplete(qsim::StrategyParams{}.rotationFields());

        config.transaction_cost_rate = 0.001;
        config.slippage_rate = 0.0005;
    }

    void TearDown(const ::benchmark::State&) override {
        series = qsim::Series{};
        rotation = qsim::Series{};
    }

protected:
    qsim::Series series;
    qsim::Series rotation;
    qsim::BacktestConfig config;
};

BENCHMARK_DEFINE_F(SeriesFixture, OscillatorSignals)(benchmark::State& state) {
    qsim::OscillatorCrossoverSignal gen(config.rsi_overbought, config.rsi_oversold);
    for (auto _ : state) {
        auto sig = gen.generate(series);
        benchmark::DoNotOptimize(sig.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(series.size()));
}
BENCHMARK_REGISTER_F(SeriesFixture, OscillatorSignals)->Arg(2520)->Arg(25200);

BENCHMARK_DEFINE_F(SeriesFixture, Simulate)(benchmark::State& state) {
    qsim::PositionSimulator sim(qsim::PositionPolicy::investOrFlat(), config);
    const auto sig = qsim::OscillatorCrossoverSignal(70, 30).generate(series);
    for (auto _ : state) {
        auto states = sim.simulate(series, sig);
        benchmark::DoNotOptimize(states.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(series.size()));
}
BENCHMARK_REGISTER_F(SeriesFixture, Simulate)->Arg(2520)->Arg(25200);

BENCHMARK_DEFINE_F(SeriesFixture, AggregateAndMeasure)(benchmark::State& state) {
    qsim::PositionSimulator sim(qsim::PositionPolicy::investOrFlat(), config);
    qsim::ReturnAggregator agg(config);
    qsim::MetricsCalculator calc(config);
    const auto sig = qsim::OscillatorCrossoverSignal(70, 30).generate(series);
    const auto states = sim.simulate(series, sig);
    for (auto _ : state) {
        auto rets = agg.aggregate(states, series);
        auto report = calc.compute(rets, sig);
        benchmark::DoNotOptimize(report.size());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(series.size()));
}
BENCHMARK_REGISTER_F(SeriesFixture, AggregateAndMeasure)->Arg(2520)->Arg(25200);

BENCHMARK_DEFINE_F(SeriesFixture, FullOscillatorRun)(benchmark::State& state) {
    qsim::Backtester bt(qsim::StrategyKind::Oscillator, config);
    for (auto _ : state) {
        auto res = bt.run(series);
        benchmark::DoNotOptimize(res.report.size());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(series.size()));
}
BENCHMARK_REGISTER_F(SeriesFixture, FullOscillatorRun)->Arg(2520)->Arg(25200);

BENCHMARK_DEFINE_F(SeriesFixture, FullRotationRun)(benchmark::State& state) {
    qsim::Backtester bt(qsim::StrategyKind::TrendRotation, config);
    for (auto _ : state) {
        auto res = bt.run(rotation);
        benchmark::DoNotOptimize(res.report.size());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rotation.size()));
}
BENCHMARK_REGISTER_F(SeriesFixture, FullRotationRun)->Arg(2520)->Arg(25200);

// Independent jobs spread over worker threads
static void BatchThroughput(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    std::vector<qsim::BacktestJob> jobs;
    std::mt19937 rng(7);
    std::normal_distribution<double> step(0.0, 0.01);
    for (int j = 0; j < 16; ++j) {
        std::vector<qsim::Bar> bars(2520);
        double px = 50.0;
        for (std::size_t i = 0; i < bars.size(); ++i) {
            px *= 1.0 + step(rng);
            bars[i].timestamp = static_cast<qsim::Timestamp>(i);
            bars[i].open = bars[i].high = bars[i].low = bars[i].close = px;
        }
        qsim::BacktestJob job;
        job.name = "job" + std::to_string(j);
        job.series = qsim::addStandardIndicators(qsim::Series{job.name, std::move(bars)});
        jobs.push_back(std::move(job));
    }
    qsim::BatchRunner runner(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto results = runner.run(jobs);
        benchmark::DoNotOptimize(results.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(jobs.size()));
}
BENCHMARK(BatchThroughput)->Arg(1)->Arg(4)->UseRealTime();

BENCHMARK_MAIN();
