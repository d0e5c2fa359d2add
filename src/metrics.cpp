#include "qsim/metrics.hpp"
#include "qsim/errors.hpp"
#include "qsim/statistics.hpp"

#include <algorithm>
#include <cmath>

namespace qsim {

PerformanceReport PerformanceReport::withMetric(const std::string& name, double value) const {
    Map copy = values_;
    copy[name] = value;
    return PerformanceReport{std::move(copy)};
}

MetricsCalculator::MetricsCalculator(const BacktestConfig& config) : config_(config) {
    config_.validate();
}

double MetricsCalculator::clipCumulative(double v) const noexcept {
    if (std::isnan(v)) return 0.0;
    const double b = config_.clips.cumulative_bound;
    return std::clamp(v, -b, b);
}

PerformanceReport MetricsCalculator::compute(const ReturnSeries& returns,
                                             const std::vector<Signal>& signals,
                                             const ReturnSeries* benchmark) const {
    if (signals.size() != returns.size()) {
        throw AlignmentError(std::to_string(signals.size()) + " signals for " +
                             std::to_string(returns.size()) + " returns");
    }
    if (returns.empty()) return {};

    const double ppy = config_.periods_per_year;
    const auto obs = returns.observedReturns();
    const auto curve = returns.cumulativeReturns();
    const std::size_t n = obs.size();

    PerformanceReport::Map m;

    const double total = clipCumulative(curve.back() - 1.0);
    const double annual = n > 0
        ? clipCumulative(std::pow(1.0 + total, ppy / static_cast<double>(n)) - 1.0)
        : 0.0;
    const double vol = Statistics::standard_deviation(obs) * std::sqrt(ppy);

    m[metric::kTotalReturn] = total;
    m[metric::kAnnualReturn] = annual;
    m[metric::kAnnualVolatility] = vol;
    // zero volatility reports a Sharpe of 0 rather than dividing by zero
    m[metric::kSharpe] = vol > kZeroVolatility ? (annual - config_.risk_free_rate) / vol : 0.0;

    const double rf_period = config_.periodRiskFreeYield();
    const double downside = RiskMetrics::downside_deviation(obs, rf_period) * std::sqrt(ppy);
    m[metric::kSortino] = downside > kZeroVolatility
        ? (Statistics::mean(obs) - rf_period) * ppy / downside
        : 0.0;

    const double mdd = std::max(RiskMetrics::max_drawdown(curve), -config_.clips.max_drawdown_floor);
    m[metric::kMaxDrawdown] = mdd;
    m[metric::kMaxDrawdownDuration] = static_cast<double>(RiskMetrics::max_drawdown_duration(curve));
    m[metric::kCalmar] = mdd < 0.0 ? annual / -mdd : 0.0;

    const auto trades = std::count_if(signals.begin(), signals.end(),
                                      [](Signal s) { return s != Signal::Hold; });
    const auto wins = std::count_if(obs.begin(), obs.end(), [](double r) { return r > 0.0; });
    m[metric::kTradeCount] = static_cast<double>(trades);
    // more winning bars than signalled bars is possible when a position is
    // held through several bars, so the ratio is capped at 1
    m[metric::kWinRate] = trades > 0
        ? std::min(1.0, static_cast<double>(wins) / static_cast<double>(trades))
        : 0.0;
    m[metric::kObservations] = static_cast<double>(n);

    if (benchmark) addBenchmarkMetrics(m, returns, *benchmark);
    return PerformanceReport{std::move(m)};
}

void MetricsCalculator::addBenchmarkMetrics(PerformanceReport::Map& m,
                                            const ReturnSeries& returns,
                                            const ReturnSeries& benchmark) const {
    if (benchmark.size() != returns.size()) {
        throw AlignmentError(std::to_string(benchmark.size()) + " benchmark returns for " +
                             std::to_string(returns.size()) + " strategy returns");
    }
    std::vector<double> s, b, excess;
    s.reserve(returns.size()); b.reserve(returns.size()); excess.reserve(returns.size());
    for (std::size_t i = 0; i < returns.size(); ++i) {
        const auto& rs = returns.records[i];
        const auto& rb = benchmark.records[i];
        if (!rs.observed || !rb.observed) continue;
        s.push_back(rs.period_return);
        b.push_back(rb.period_return);
        excess.push_back(rs.period_return - rb.period_return);
    }

    const double ppy = config_.periods_per_year;
    const double te = Statistics::standard_deviation(excess) * std::sqrt(ppy);
    m[metric::kTrackingError] = te;
    m[metric::kInformationRatio] = te > kZeroVolatility
        ? Statistics::mean(excess) * ppy / te
        : 0.0;

    // beta is left out when the benchmark never moves
    const double var_b = Statistics::variance(b);
    if (std::sqrt(var_b) > kZeroVolatility) {
        m[metric::kBeta] = Statistics::covariance(s, b) / var_b;
    }
}

} // namespace qsim
