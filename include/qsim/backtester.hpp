#pragma once

#include "qsim/config.hpp"
#include "qsim/metrics.hpp"
#include "qsim/returns.hpp"
#include "qsim/series.hpp"
#include "qsim/signals.hpp"
#include "qsim/simulator.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qsim {

// Wall-clock time spent in each pipeline stage of one run.
struct StageTimings {
    std::chrono::nanoseconds signals{0};
    std::chrono::nanoseconds simulation{0};
    std::chrono::nanoseconds aggregation{0};
    std::chrono::nanoseconds metrics{0};

    [[nodiscard]] std::chrono::nanoseconds total() const noexcept {
        return signals + simulation + aggregation + metrics;
    }
};

// Everything one run produced.  Each stage's output is kept as its own
// value; nothing is rewritten in place.
struct BacktestResult {
    std::vector<Signal> signals;
    std::vector<SimulationState> states;
    ReturnSeries returns;
    PerformanceReport report;
    StageTimings timings;
};

// Runs bars -> signals -> positions -> returns -> metrics for one series.
// A Backtester holds only configuration, so run() may be called repeatedly
// and yields bit-identical results for identical inputs.
class Backtester {
public:
    explicit Backtester(StrategyKind kind = StrategyKind::Oscillator,
                        const BacktestConfig& config = {},
                        StrategyParams params = {});

    // With a benchmark, its close-to-close returns feed the
    // benchmark-relative metrics, and for TrendRotation its moving averages
    // drive the signals.  The benchmark must share the series timestamps.
    // An empty series gives an empty report.
    [[nodiscard]] BacktestResult run(const Series& series, const Series* benchmark = nullptr) const;

    [[nodiscard]] StrategyKind kind() const noexcept { return kind_; }
    [[nodiscard]] const BacktestConfig& config() const noexcept { return config_; }
    [[nodiscard]] const StrategyParams& params() const noexcept { return params_; }
    [[nodiscard]] const SignalGenerator& signalGenerator() const noexcept { return *generator_; }

private:
    StrategyKind kind_;
    BacktestConfig config_;
    StrategyParams params_;
    std::unique_ptr<SignalGenerator> generator_;
    PositionSimulator simulator_;
    ReturnAggregator aggregator_;
    MetricsCalculator metrics_;
};

// One independent run for the batch runner.
struct BacktestJob {
    std::string name;
    StrategyKind kind{StrategyKind::Oscillator};
    BacktestConfig config{};
    StrategyParams params{};
    Series series;
    std::optional<Series> benchmark;
};

// Runs independent jobs on worker threads.  Jobs share no mutable state;
// results come back in submission order.  If any job fails, the exception
// of the first failed job (in submission order) is rethrown once every job
// has finished.
class BatchRunner {
public:
    explicit BatchRunner(std::size_t max_workers = 0);  // 0 = hardware concurrency

    [[nodiscard]] std::vector<BacktestResult> run(const std::vector<BacktestJob>& jobs) const;
    [[nodiscard]] std::size_t maxWorkers() const noexcept { return max_workers_; }

private:
    std::size_t max_workers_;
};

} // namespace qsim
