#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace qsim {

// Stability guards applied to degenerate inputs.  None of these is a
// modelling claim; each time one fires it is counted in the diagnostics.
struct ClipBounds {
    double leveraged_return_bound{0.3};   // |leverage * underlying| per bar
    double cumulative_bound{1e6};         // |total_return| and |annual_return|
    double wipeout_return_floor{0.99};    // a bar never loses more than this
    double max_drawdown_floor{0.99};      // reported drawdown never below -floor
};

// Run-wide parameters shared by every stage of a backtest.
struct BacktestConfig {
    double initial_capital{100000.0};
    double transaction_cost_rate{0.0};
    double slippage_rate{0.0};
    double risk_free_rate{0.02};          // annualised
    double periods_per_year{252.0};
    double rsi_overbought{70.0};
    double rsi_oversold{30.0};
    double leverage{3.0};
    ClipBounds clips{};

    // Combined cost rate charged on every asset switch.
    [[nodiscard]] double switchCostRate() const noexcept {
        return transaction_cost_rate + slippage_rate;
    }

    // Per-period yield of the defensive asset: (1+r)^(1/ppy) - 1.
    [[nodiscard]] double periodRiskFreeYield() const;

    // Throws ConfigError on the first out-of-range value.
    void validate() const;

    // Build a config from name/value pairs.  Names not listed here are
    // rejected so that a typo in a config file cannot go unnoticed.
    [[nodiscard]] static BacktestConfig fromParameters(
        const std::unordered_map<std::string, double>& params);
};

// Indicator column names consumed by the signal generators.
struct StrategyParams {
    std::string rsi_field{"RSI"};
    std::string macd_field{"MACD"};
    std::string signal_line_field{"Signal_Line"};
    std::string fast_ma_field{"SMA_20"};
    std::string slow_ma_field{"SMA_50"};
    std::vector<int> rotation_ma_periods{30, 60, 120, 200};

    // Column names "SMA_<period>" for the rotation moving averages.
    [[nodiscard]] std::vector<std::string> rotationFields() const;
};

// Parse "key = value" lines (blank lines and '#' comments allowed).
// Throws ConfigError on a malformed line or an unreadable file.
std::unordered_map<std::string, double> parseParameters(const std::string& text);
std::unordered_map<std::string, double> loadParameters(const std::string& path);

} // namespace qsim
