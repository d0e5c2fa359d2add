#include "qsim/simulator.hpp"
#include "qsim/errors.hpp"

#include <cmath>

namespace qsim {

namespace {

double sizeAt(Asset asset, double capital, double price) noexcept {
    if (asset == Asset::Cash) return 0.0;
    // a missing or non-positive price cannot size a position
    if (!std::isfinite(price) || price <= 0.0) return 0.0;
    return capital / price;
}

} // namespace

const char* toString(Asset a) noexcept {
    switch (a) {
        case Asset::Cash:       return "CASH";
        case Asset::Underlying: return "UNDERLYING";
        case Asset::Leveraged:  return "LEVERAGED";
        case Asset::Defensive:  return "DEFENSIVE";
    }
    return "CASH";
}

// -------- PositionPolicy ----------

Asset PositionPolicy::desired(Signal s, Asset current) const noexcept {
    switch (s) {
        case Signal::Buy:  return on_buy;
        case Signal::Sell: return on_sell;
        case Signal::Hold: return current;
    }
    return current;
}

PositionPolicy PositionPolicy::investOrFlat() noexcept {
    return PositionPolicy{Asset::Underlying, Asset::Cash, false};
}

PositionPolicy PositionPolicy::leveragedOrDefensive() noexcept {
    return PositionPolicy{Asset::Leveraged, Asset::Defensive, true};
}

PositionPolicy PositionPolicy::forStrategy(StrategyKind kind) noexcept {
    return kind == StrategyKind::TrendRotation ? leveragedOrDefensive() : investOrFlat();
}

// -------- PositionSimulator ----------

PositionSimulator::PositionSimulator(PositionPolicy policy, const BacktestConfig& config)
    : policy_(policy),
      initial_capital_(config.initial_capital),
      cost_rate_(config.switchCostRate()) {
    config.validate();
}

SimulationState PositionSimulator::initial(const Bar& bar, Signal signal) const {
    SimulationState s{};
    s.capital = initial_capital_;
    if (policy_.positioned_at_start) {
        s.held_asset = policy_.desired(signal, Asset::Cash);
        s.position_size = sizeAt(s.held_asset, s.capital, bar.close);
    }
    return s;
}

SimulationState PositionSimulator::transition(const SimulationState& prev,
                                              const Bar& bar,
                                              Signal signal) const {
    const Asset want = policy_.desired(signal, prev.held_asset);
    if (want == prev.held_asset) {
        SimulationState s = prev;
        s.transaction_cost_charged = 0.0;
        s.degraded = false;
        return s;
    }

    SimulationState s{};
    s.held_asset = want;
    double cost = prev.capital * cost_rate_;
    if (cost > prev.capital) {
        cost = prev.capital;
        s.degraded = true;
    }
    s.transaction_cost_charged = cost;
    s.capital = prev.capital - cost;
    s.position_size = sizeAt(want, s.capital, bar.close);
    return s;
}

std::vector<SimulationState> PositionSimulator::simulate(const Series& series,
                                                         const std::vector<Signal>& signals) const {
    if (signals.size() != series.size()) {
        throw AlignmentError(series.symbol() + ": " + std::to_string(signals.size()) +
                             " signals for " + std::to_string(series.size()) + " bars");
    }
    std::vector<SimulationState> out;
    if (series.empty()) return out;
    out.reserve(series.size());
    out.push_back(initial(series[0], signals[0]));
    for (std::size_t i = 1; i < series.size(); ++i) {
        out.push_back(transition(out.back(), series[i], signals[i]));
    }
    return out;
}

} // namespace qsim
