#pragma once

#include "qsim/config.hpp"
#include "qsim/series.hpp"
#include "qsim/signals.hpp"

#include <cstdint>
#include <vector>

namespace qsim {

// What the account holds over a bar.
enum class Asset : std::uint8_t {
    Cash,        // no position, earns nothing
    Underlying,  // the series itself, unleveraged
    Leveraged,   // leverage x the underlying's return
    Defensive    // interest-bearing, earns the risk-free yield
};

[[nodiscard]] const char* toString(Asset a) noexcept;

// Per-bar account record.  Each state depends only on the previous state
// and the current bar's signal and close.
struct SimulationState {
    Asset held_asset{Asset::Cash};
    double position_size{0.0};             // units of the held asset, >= 0
    double capital{0.0};                   // account value in currency, >= 0
    double transaction_cost_charged{0.0};  // this bar only, >= 0
    bool degraded{false};                  // the cost had to be clamped to capital
};

// How a strategy turns signals into holdings.  Fixed per strategy kind.
struct PositionPolicy {
    Asset on_buy{Asset::Underlying};
    Asset on_sell{Asset::Cash};
    // Hold always keeps the current asset: flat stays flat and an open
    // position stays invested.
    // When true, bar 0 already holds the asset of signal[0] at no cost.
    bool positioned_at_start{false};

    [[nodiscard]] Asset desired(Signal s, Asset current) const noexcept;

    // Buy -> Underlying, Sell -> Cash, flat at bar 0.
    [[nodiscard]] static PositionPolicy investOrFlat() noexcept;
    // Buy -> Leveraged, Sell -> Defensive, positioned from bar 0.
    [[nodiscard]] static PositionPolicy leveragedOrDefensive() noexcept;
    [[nodiscard]] static PositionPolicy forStrategy(StrategyKind kind) noexcept;
};

// Converts signals into holdings with a strict left fold over the bars.
class PositionSimulator {
public:
    PositionSimulator(PositionPolicy policy, const BacktestConfig& config);

    // State of bar 0.
    [[nodiscard]] SimulationState initial(const Bar& bar, Signal signal) const;

    // One step of the fold: (previous state, bar, signal) -> new state.  A
    // switch of asset charges capital * (transaction cost + slippage) and
    // resizes the position at the bar's close; otherwise the previous
    // position and capital carry forward unchanged.
    [[nodiscard]] SimulationState transition(const SimulationState& prev,
                                             const Bar& bar,
                                             Signal signal) const;

    // Throws AlignmentError when signals and series differ in length.
    [[nodiscard]] std::vector<SimulationState> simulate(const Series& series,
                                                        const std::vector<Signal>& signals) const;

    [[nodiscard]] const PositionPolicy& policy() const noexcept { return policy_; }

private:
    PositionPolicy policy_;
    double initial_capital_;
    double cost_rate_;
};

} // namespace qsim
