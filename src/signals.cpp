#include "qsim/signals.hpp"
#include "qsim/errors.hpp"

#include <cmath>

namespace qsim {

namespace {

bool defined(const std::vector<double>& a, const std::vector<double>& b, std::size_t i) {
    return std::isfinite(a[i]) && std::isfinite(b[i]);
}

// a moves from <= b to > b between bar i-1 and bar i
bool crossesAbove(const std::vector<double>& a, const std::vector<double>& b, std::size_t i) {
    if (i == 0 || !defined(a, b, i) || !defined(a, b, i - 1)) return false;
    return a[i] > b[i] && a[i - 1] <= b[i - 1];
}

bool crossesBelow(const std::vector<double>& a, const std::vector<double>& b, std::size_t i) {
    if (i == 0 || !defined(a, b, i) || !defined(a, b, i - 1)) return false;
    return a[i] < b[i] && a[i - 1] >= b[i - 1];
}

} // namespace

const char* toString(Signal s) noexcept {
    switch (s) {
        case Signal::Buy:  return "BUY";
        case Signal::Sell: return "SELL";
        case Signal::Hold: return "HOLD";
    }
    return "HOLD";
}

const char* toString(StrategyKind k) noexcept {
    switch (k) {
        case StrategyKind::Oscillator:    return "oscillator";
        case StrategyKind::TrendRotation: return "rotation";
    }
    return "oscillator";
}

StrategyKind parseStrategyKind(const std::string& name) {
    if (name == "oscillator") return StrategyKind::Oscillator;
    if (name == "rotation" || name == "trend_rotation") return StrategyKind::TrendRotation;
    throw ConfigError("unknown strategy: " + name);
}

// ---------- OscillatorCrossover ----------

OscillatorCrossoverSignal::OscillatorCrossoverSignal(double overbought, double oversold,
                                                     StrategyParams params)
    : overbought_(overbought), oversold_(oversold), params_(std::move(params)) {
    if (!(overbought_ > oversold_)) {
        throw ConfigError("rsi_overbought must be greater than rsi_oversold");
    }
}

std::vector<std::string> OscillatorCrossoverSignal::requiredFields() const {
    return {params_.rsi_field, params_.macd_field, params_.signal_line_field,
            params_.fast_ma_field, params_.slow_ma_field};
}

std::vector<Signal> OscillatorCrossoverSignal::generate(const Series& series, const Series*) const {
    if (series.empty()) return {};
    series.requireFields(requiredFields());

    const auto rsi_v  = series.column(params_.rsi_field);
    const auto macd_v = series.column(params_.macd_field);
    const auto sl_v   = series.column(params_.signal_line_field);
    const auto fast_v = series.column(params_.fast_ma_field);
    const auto slow_v = series.column(params_.slow_ma_field);

    std::vector<Signal> out(series.size(), Signal::Hold);
    for (std::size_t i = 0; i < series.size(); ++i) {
        Signal s = Signal::Hold;
        // NaN never satisfies either comparison
        if (rsi_v[i] < oversold_) s = Signal::Buy;
        if (rsi_v[i] > overbought_) s = Signal::Sell;

        if (crossesAbove(macd_v, sl_v, i)) s = Signal::Buy;
        if (crossesBelow(macd_v, sl_v, i)) s = Signal::Sell;

        if (crossesAbove(fast_v, slow_v, i)) s = Signal::Buy;
        if (crossesBelow(fast_v, slow_v, i)) s = Signal::Sell;

        out[i] = s;
    }
    return out;
}

// ---------- TrendRotation ----------

TrendRotationSignal::TrendRotationSignal(StrategyParams params) : params_(std::move(params)) {
    if (params_.rotation_ma_periods.empty()) {
        throw ConfigError("trend rotation needs at least one moving average period");
    }
}

std::vector<std::string> TrendRotationSignal::requiredFields() const {
    return params_.rotationFields();
}

std::vector<Signal> TrendRotationSignal::generate(const Series& series, const Series* benchmark) const {
    if (series.empty()) return {};
    if (benchmark && !series.alignedWith(*benchmark)) {
        throw AlignmentError(series.symbol() + ": benchmark " + benchmark->symbol() +
                             " does not share the series timestamps");
    }
    const Series& source = benchmark ? *benchmark : series;
    const auto fields = requiredFields();
    source.requireFields(fields);

    std::vector<std::vector<double>> mas;
    mas.reserve(fields.size());
    for (const auto& f : fields) mas.push_back(source.column(f));
    const auto close = source.closes();

    std::vector<Signal> out(source.size(), Signal::Sell);
    for (std::size_t i = 0; i < source.size(); ++i) {
        if (!std::isfinite(close[i])) {
            throw DataError(source.symbol() + ": undefined close at bar " + std::to_string(i));
        }
        bool above_all = true;
        for (std::size_t k = 0; k < mas.size(); ++k) {
            if (!std::isfinite(mas[k][i])) {
                throw DataError(source.symbol() + ": " + fields[k] + " undefined at bar " +
                                std::to_string(i) + "; drop warm-up bars before generating signals");
            }
            above_all = above_all && close[i] > mas[k][i];
        }
        out[i] = above_all ? Signal::Buy : Signal::Sell;
    }
    return out;
}

std::unique_ptr<SignalGenerator> makeSignalGenerator(StrategyKind kind, const BacktestConfig& config,
                                                     const StrategyParams& params) {
    switch (kind) {
        case StrategyKind::Oscillator:
            return std::make_unique<OscillatorCrossoverSignal>(config.rsi_overbought,
                                                               config.rsi_oversold, params);
        case StrategyKind::TrendRotation:
            return std::make_unique<TrendRotationSignal>(params);
    }
    throw ConfigError("unknown strategy kind");
}

} // namespace qsim
