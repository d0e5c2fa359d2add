#include "qsim/returns.hpp"
#include "qsim/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace qsim {

namespace {

double priceChange(double prev, double cur) noexcept {
    if (!(prev > 0.0) || !std::isfinite(prev) || !std::isfinite(cur)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return cur / prev - 1.0;
}

// Appends bar i to `out`, clamping a wipeout so the product stays positive.
void compound(ReturnSeries& out, double r, double wipeout_floor) {
    if (1.0 + r <= 0.0) {
        r = -wipeout_floor;
        ++out.diagnostics.wipeout_clamps;
    }
    const double prev_cum = out.records.empty() ? 1.0 : out.records.back().cumulative_return;
    out.records.push_back(ReturnRecord{r, prev_cum * (1.0 + r), true});
}

} // namespace

std::vector<double> ReturnSeries::periodReturns() const {
    std::vector<double> v; v.reserve(records.size());
    for (const auto& r : records) v.push_back(r.period_return);
    return v;
}

std::vector<double> ReturnSeries::cumulativeReturns() const {
    std::vector<double> v; v.reserve(records.size());
    for (const auto& r : records) v.push_back(r.cumulative_return);
    return v;
}

std::vector<double> ReturnSeries::observedReturns() const {
    std::vector<double> v; v.reserve(records.size());
    for (const auto& r : records) if (r.observed) v.push_back(r.period_return);
    return v;
}

ReturnAggregator::ReturnAggregator(const BacktestConfig& config)
    : leverage_(config.leverage),
      leverage_bound_(config.clips.leveraged_return_bound),
      wipeout_floor_(config.clips.wipeout_return_floor),
      defensive_yield_(config.periodRiskFreeYield()) {
    config.validate();
}

ReturnSeries ReturnAggregator::aggregate(const std::vector<SimulationState>& states,
                                         const Series& series) const {
    if (states.size() != series.size()) {
        throw AlignmentError(series.symbol() + ": " + std::to_string(states.size()) +
                             " states for " + std::to_string(series.size()) + " bars");
    }
    ReturnSeries out;
    if (states.empty()) return out;
    out.records.reserve(states.size());
    out.records.push_back(ReturnRecord{0.0, 1.0, false});

    for (std::size_t i = 1; i < states.size(); ++i) {
        const auto& prev = states[i - 1];
        double r = 0.0;
        switch (prev.held_asset) {
            case Asset::Cash:
                break;
            case Asset::Defensive:
                r = defensive_yield_;
                break;
            case Asset::Underlying:
                // an unsized position (no usable entry price) is flat
                if (prev.position_size > 0.0) r = priceChange(series[i - 1].close, series[i].close);
                break;
            case Asset::Leveraged: {
                if (!(prev.position_size > 0.0)) break;
                const double raw = leverage_ * priceChange(series[i - 1].close, series[i].close);
                if (std::isfinite(raw) && std::abs(raw) > leverage_bound_) {
                    ++out.diagnostics.leverage_clips;
                }
                r = std::isfinite(raw) ? std::clamp(raw, -leverage_bound_, leverage_bound_) : raw;
                break;
            }
        }
        if (!std::isfinite(r)) {
            ++out.diagnostics.undefined_returns;
            r = 0.0;
        }

        const double cost = states[i].transaction_cost_charged;
        if (cost > 0.0) {
            if (std::isfinite(prev.capital) && prev.capital > 0.0) {
                r -= cost / prev.capital;
            } else {
                ++out.diagnostics.cost_drag_skipped;
            }
        }
        compound(out, r, wipeout_floor_);
    }
    return out;
}

ReturnSeries benchmarkReturns(const Series& series, const BacktestConfig& config) {
    ReturnSeries out;
    if (series.empty()) return out;
    out.records.reserve(series.size());
    out.records.push_back(ReturnRecord{0.0, 1.0, false});
    for (std::size_t i = 1; i < series.size(); ++i) {
        double r = priceChange(series[i - 1].close, series[i].close);
        if (!std::isfinite(r)) {
            ++out.diagnostics.undefined_returns;
            r = 0.0;
        }
        compound(out, r, config.clips.wipeout_return_floor);
    }
    return out;
}

} // namespace qsim
