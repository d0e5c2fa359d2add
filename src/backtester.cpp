#include "qsim/backtester.hpp"
#include "qsim/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <thread>

namespace qsim {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::nanoseconds since(Clock::time_point t0) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t0);
}

void logDiagnostics(const std::string& symbol, const AggregationDiagnostics& d, std::size_t degraded) {
    if (d.clean() && degraded == 0) return;
    spdlog::warn("{}: stability guards fired (leverage clips={}, wipeout clamps={}, "
                 "undefined returns={}, cost drag skipped={}, degraded states={})",
                 symbol, d.leverage_clips, d.wipeout_clamps, d.undefined_returns,
                 d.cost_drag_skipped, degraded);
}

} // namespace

// -------- Backtester ----------

Backtester::Backtester(StrategyKind kind, const BacktestConfig& config, StrategyParams params)
    : kind_(kind),
      config_(config),
      params_(std::move(params)),
      generator_(makeSignalGenerator(kind, config, params_)),
      simulator_(PositionPolicy::forStrategy(kind), config),
      aggregator_(config),
      metrics_(config) {}

BacktestResult Backtester::run(const Series& series, const Series* benchmark) const {
    BacktestResult r{};
    if (series.empty()) {
        spdlog::debug("{}: empty series, nothing to simulate", series.symbol());
        return r;
    }
    if (benchmark && !series.alignedWith(*benchmark)) {
        throw AlignmentError(series.symbol() + ": benchmark " + benchmark->symbol() +
                             " does not share the series timestamps");
    }
    spdlog::debug("{}: running {} over {} bars", series.symbol(), generator_->getName(), series.size());

    auto t0 = Clock::now();
    r.signals = generator_->generate(series, benchmark);
    r.timings.signals = since(t0);

    t0 = Clock::now();
    r.states = simulator_.simulate(series, r.signals);
    r.timings.simulation = since(t0);

    t0 = Clock::now();
    r.returns = aggregator_.aggregate(r.states, series);
    r.timings.aggregation = since(t0);

    t0 = Clock::now();
    std::optional<ReturnSeries> bench;
    if (benchmark) bench = benchmarkReturns(*benchmark, config_);
    const auto degraded = static_cast<std::size_t>(std::count_if(
        r.states.begin(), r.states.end(), [](const SimulationState& s) { return s.degraded; }));
    r.report = metrics_.compute(r.returns, r.signals, bench ? &*bench : nullptr)
                   .withMetric(metric::kDegradedStates, static_cast<double>(degraded))
                   .withMetric(metric::kFinalEquity,
                               config_.initial_capital * r.returns.records.back().cumulative_return);
    r.timings.metrics = since(t0);

    logDiagnostics(series.symbol(), r.returns.diagnostics, degraded);
    spdlog::info("{}: {} total_return={:.4f} sharpe={:.3f} max_drawdown={:.4f} trades={}",
                 series.symbol(), toString(kind_),
                 r.report.at(metric::kTotalReturn), r.report.at(metric::kSharpe),
                 r.report.at(metric::kMaxDrawdown), r.report.at(metric::kTradeCount));
    return r;
}

// -------- BatchRunner ----------

BatchRunner::BatchRunner(std::size_t max_workers)
    : max_workers_(max_workers > 0 ? max_workers
                                   : std::max<std::size_t>(1, std::thread::hardware_concurrency())) {}

std::vector<BacktestResult> BatchRunner::run(const std::vector<BacktestJob>& jobs) const {
    std::vector<BacktestResult> results(jobs.size());
    std::vector<std::exception_ptr> errors(jobs.size());
    std::atomic<std::size_t> next{0};

    // each worker claims the next unclaimed job; results land in their own slot
    auto worker = [&]() {
        for (std::size_t i = next++; i < jobs.size(); i = next++) {
            const auto& job = jobs[i];
            try {
                Backtester bt{job.kind, job.config, job.params};
                results[i] = bt.run(job.series, job.benchmark ? &*job.benchmark : nullptr);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };

    const std::size_t n_workers = std::min(max_workers_, jobs.size());
    std::vector<std::future<void>> futures;
    futures.reserve(n_workers);
    for (std::size_t w = 0; w < n_workers; ++w) futures.push_back(std::async(std::launch::async, worker));
    for (auto& f : futures) f.get();

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        if (errors[i]) {
            spdlog::error("batch job {} ({}) failed", i, jobs[i].name);
            std::rethrow_exception(errors[i]);
        }
    }
    return results;
}

} // namespace qsim
