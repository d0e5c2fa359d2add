#pragma once

#include "qsim/config.hpp"
#include "qsim/series.hpp"
#include "qsim/simulator.hpp"

#include <cstddef>
#include <vector>

namespace qsim {

// Return of one bar and the compounded growth of 1 unit up to that bar.
// Bar 0 has no prior close, so its return is reported as 0 and marked as
// not observed; it does not count as an observation in the metrics.
struct ReturnRecord {
    double period_return{0.0};
    double cumulative_return{1.0};
    bool observed{false};
};

// How often a stability guard fired while aggregating.  Non-zero counts
// mean the input was degenerate somewhere.
struct AggregationDiagnostics {
    std::size_t leverage_clips{0};        // |leveraged return| hit the bound
    std::size_t wipeout_clamps{0};        // 1 + r <= 0 was clamped
    std::size_t cost_drag_skipped{0};     // cost charged against zero capital
    std::size_t undefined_returns{0};     // NaN / inf price ratio replaced by 0

    [[nodiscard]] bool clean() const noexcept {
        return leverage_clips == 0 && wipeout_clamps == 0 &&
               cost_drag_skipped == 0 && undefined_returns == 0;
    }
};

struct ReturnSeries {
    std::vector<ReturnRecord> records;
    AggregationDiagnostics diagnostics;

    [[nodiscard]] std::size_t size() const noexcept { return records.size(); }
    [[nodiscard]] bool empty() const noexcept { return records.empty(); }
    [[nodiscard]] std::vector<double> periodReturns() const;
    [[nodiscard]] std::vector<double> cumulativeReturns() const;
    // Period returns of observed bars only.
    [[nodiscard]] std::vector<double> observedReturns() const;
};

// Turns simulated holdings into per-bar returns.  The return of bar i is
// earned by the asset held over (i-1, i]:
//   Cash        0
//   Defensive   (1 + risk_free_rate)^(1/periods_per_year) - 1
//   Underlying  close[i]/close[i-1] - 1
//   Leveraged   leverage * (close[i]/close[i-1] - 1), clipped to +-bound
// minus the cost charged at bar i relative to capital[i-1].
class ReturnAggregator {
public:
    explicit ReturnAggregator(const BacktestConfig& config);

    // Throws AlignmentError when states and series differ in length.
    [[nodiscard]] ReturnSeries aggregate(const std::vector<SimulationState>& states,
                                         const Series& series) const;

private:
    double leverage_;
    double leverage_bound_;
    double wipeout_floor_;
    double defensive_yield_;
};

// Close-to-close returns of a benchmark in the same record layout.
ReturnSeries benchmarkReturns(const Series& series, const BacktestConfig& config);

} // namespace qsim
