#pragma once

#include "qsim/config.hpp"
#include "qsim/series.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace qsim {

// Discrete trading decision for one bar.
enum class Signal : std::int8_t {
    Sell = -1,
    Hold = 0,
    Buy = 1
};

[[nodiscard]] inline int toInt(Signal s) noexcept { return static_cast<int>(s); }
[[nodiscard]] const char* toString(Signal s) noexcept;

// The closed set of strategy variants.  Each kind has exactly one signal
// generator and one position policy.
enum class StrategyKind : std::uint8_t {
    Oscillator,     // RSI / MACD / MA crossovers, Sell means flatten to cash
    TrendRotation   // close vs moving averages, Sell means hold the defensive asset
};

[[nodiscard]] const char* toString(StrategyKind k) noexcept;
// Accepts "oscillator" and "rotation" (or "trend_rotation").  Throws ConfigError.
[[nodiscard]] StrategyKind parseStrategyKind(const std::string& name);

// Abstract base class for signal generators.  generate() is pure: the same
// series always yields the same signals, one per bar.
class SignalGenerator {
public:
    virtual ~SignalGenerator() = default;
    [[nodiscard]] virtual std::vector<Signal> generate(const Series& series,
                                                       const Series* benchmark = nullptr) const = 0;
    [[nodiscard]] virtual std::string getName() const = 0;
    [[nodiscard]] virtual StrategyKind kind() const noexcept = 0;
    // Indicator columns the generator reads.
    [[nodiscard]] virtual std::vector<std::string> requiredFields() const = 0;
};

// Oscillator / crossover rules.  For each bar, starting from Hold, the
// rules run in a fixed order and the last one that fires wins:
//   1. RSI below oversold -> Buy, above overbought -> Sell
//   2. MACD crossing its signal line (up -> Buy, down -> Sell)
//   3. fast MA crossing the slow MA (up -> Buy, down -> Sell)
// A cross compares bar i with bar i-1 and needs all four values defined, so
// bar 0 and the first bar after a warm-up window never report a cross.
class OscillatorCrossoverSignal final : public SignalGenerator {
public:
    OscillatorCrossoverSignal(double rsi_overbought, double rsi_oversold,
                              StrategyParams params = {});
    [[nodiscard]] std::vector<Signal> generate(const Series& series,
                                               const Series* benchmark = nullptr) const override;
    [[nodiscard]] std::string getName() const override { return "OscillatorCrossover"; }
    [[nodiscard]] StrategyKind kind() const noexcept override { return StrategyKind::Oscillator; }
    [[nodiscard]] std::vector<std::string> requiredFields() const override;

private:
    double overbought_;
    double oversold_;
    StrategyParams params_;
};

// Trend-following rotation: Buy (hold the leveraged asset) while the close
// is strictly above every configured moving average, Sell (hold the
// defensive asset) otherwise.  Never emits Hold.  Bars whose averages are
// still warming up must be removed by the caller; meeting one is a
// DataError.  With a benchmark the regime is read from the benchmark.
class TrendRotationSignal final : public SignalGenerator {
public:
    explicit TrendRotationSignal(StrategyParams params = {});
    [[nodiscard]] std::vector<Signal> generate(const Series& series,
                                               const Series* benchmark = nullptr) const override;
    [[nodiscard]] std::string getName() const override { return "TrendRotation"; }
    [[nodiscard]] StrategyKind kind() const noexcept override { return StrategyKind::TrendRotation; }
    [[nodiscard]] std::vector<std::string> requiredFields() const override;

private:
    StrategyParams params_;
};

[[nodiscard]] std::unique_ptr<SignalGenerator> makeSignalGenerator(
    StrategyKind kind, const BacktestConfig& config, const StrategyParams& params = {});

} // namespace qsim
