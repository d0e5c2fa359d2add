#pragma once

#include "qsim/config.hpp"
#include "qsim/returns.hpp"
#include "qsim/signals.hpp"

#include <map>
#include <string>
#include <vector>

namespace qsim {

// Metric names used in a PerformanceReport.
namespace metric {
inline constexpr const char* kTotalReturn         = "total_return";
inline constexpr const char* kAnnualReturn        = "annual_return";
inline constexpr const char* kAnnualVolatility    = "annualized_volatility";
inline constexpr const char* kSharpe              = "sharpe_ratio";
inline constexpr const char* kSortino             = "sortino_ratio";
inline constexpr const char* kMaxDrawdown         = "max_drawdown";
inline constexpr const char* kMaxDrawdownDuration = "max_drawdown_duration";
inline constexpr const char* kCalmar              = "calmar_ratio";
inline constexpr const char* kTradeCount          = "trade_count";
inline constexpr const char* kWinRate             = "win_rate";
inline constexpr const char* kObservations        = "observations";
inline constexpr const char* kTrackingError       = "tracking_error";
inline constexpr const char* kInformationRatio    = "information_ratio";
inline constexpr const char* kBeta                = "beta";
inline constexpr const char* kDegradedStates      = "degraded_state_count";
inline constexpr const char* kFinalEquity         = "final_equity";
} // namespace metric

// Immutable metric name -> value mapping produced once per run.  Names are
// kept sorted so that printing and comparing reports is deterministic.
class PerformanceReport {
public:
    using Map = std::map<std::string, double>;

    PerformanceReport() = default;
    explicit PerformanceReport(Map values) : values_(std::move(values)) {}

    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool contains(const std::string& name) const { return values_.count(name) != 0; }
    // Throws std::out_of_range for an absent metric.
    [[nodiscard]] double at(const std::string& name) const { return values_.at(name); }
    [[nodiscard]] const Map& values() const noexcept { return values_; }
    auto begin() const noexcept { return values_.begin(); }
    auto end() const noexcept { return values_.end(); }

    // Copy of this report with one metric added or replaced.
    [[nodiscard]] PerformanceReport withMetric(const std::string& name, double value) const;

    bool operator==(const PerformanceReport& other) const { return values_ == other.values_; }
    bool operator!=(const PerformanceReport& other) const { return !(*this == other); }

private:
    Map values_;
};

// Reduces a simulated run to scalar risk/return figures.
class MetricsCalculator {
public:
    // Standard deviations below this are treated as zero.
    static constexpr double kZeroVolatility = 1e-12;

    explicit MetricsCalculator(const BacktestConfig& config);

    // `returns` carries both per-bar and cumulative returns.  Signals must
    // line up with the returns, as must the benchmark when given; otherwise
    // AlignmentError.  Empty returns give an empty report.
    [[nodiscard]] PerformanceReport compute(const ReturnSeries& returns,
                                            const std::vector<Signal>& signals,
                                            const ReturnSeries* benchmark = nullptr) const;

private:
    BacktestConfig config_;

    [[nodiscard]] double clipCumulative(double v) const noexcept;
    void addBenchmarkMetrics(PerformanceReport::Map& out,
                             const ReturnSeries& returns,
                             const ReturnSeries& benchmark) const;
};

} // namespace qsim
