#include "qsim/indicators.hpp"
#include "qsim/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace qsim {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> sma(const std::vector<double>& v, std::size_t p) {
    if (p == 0) throw ConfigError("sma period must be > 0");
    std::vector<double> out(v.size(), kNaN);
    double sum = 0.0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        sum += v[i];
        if (i >= p) sum -= v[i - p];
        if (i + 1 >= p) out[i] = sum / static_cast<double>(p);
    }
    return out;
}

std::vector<double> ema(const std::vector<double>& v, std::size_t span) {
    if (span == 0) throw ConfigError("ema span must be > 0");
    std::vector<double> out(v.size(), kNaN);
    if (v.empty()) return out;
    const double k = 2.0 / (static_cast<double>(span) + 1.0);
    double e = v[0];
    out[0] = e;
    for (std::size_t i = 1; i < v.size(); ++i) {
        // same as v*k + e*(1-k), but a constant input stays exactly constant
        e += k * (v[i] - e);
        out[i] = e;
    }
    return out;
}

std::vector<double> rsi(const std::vector<double>& v, std::size_t p) {
    if (p == 0) throw ConfigError("rsi period must be > 0");
    std::vector<double> out(v.size(), kNaN);
    // the first difference exists at index 1, so a full window ends at index p
    double g = 0.0, l = 0.0;
    for (std::size_t i = 1; i < v.size(); ++i) {
        const double d = v[i] - v[i - 1];
        g += d > 0.0 ? d : 0.0;
        l += d < 0.0 ? -d : 0.0;
        if (i > p) {
            const double old = v[i - p] - v[i - p - 1];
            g -= old > 0.0 ? old : 0.0;
            l -= old < 0.0 ? -old : 0.0;
        }
        if (i < p) continue;
        // rolling sums drift slightly below zero after long flat stretches
        const double gain = std::max(0.0, g) / static_cast<double>(p);
        const double loss = std::max(0.0, l) / static_cast<double>(p);
        if (loss == 0.0) {
            out[i] = gain > 0.0 ? 100.0 : kNaN;
        } else {
            out[i] = 100.0 - 100.0 / (1.0 + gain / loss);
        }
    }
    return out;
}

MacdLines macd(const std::vector<double>& v, std::size_t fast, std::size_t slow, std::size_t signal) {
    const auto ef = ema(v, fast);
    const auto es = ema(v, slow);
    MacdLines r;
    r.macd.resize(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) r.macd[i] = ef[i] - es[i];
    r.signal_line = ema(r.macd, signal);
    return r;
}

namespace {

// Columns already present in the input are kept as they are.
Series withMissingColumn(const Series& s, const std::string& name, const std::vector<double>& values) {
    return s.hasField(name) ? s : s.withColumn(name, values);
}

} // namespace

Series addStandardIndicators(const Series& series) {
    const auto c = series.closes();
    const auto m = macd(c);
    Series out = withMissingColumn(series, "SMA_20", sma(c, 20));
    out = withMissingColumn(out, "SMA_50", sma(c, 50));
    out = withMissingColumn(out, "RSI", rsi(c, 14));
    out = withMissingColumn(out, "MACD", m.macd);
    return withMissingColumn(out, "Signal_Line", m.signal_line);
}

Series addMovingAverages(const Series& series, const std::vector<int>& periods) {
    const auto c = series.closes();
    Series out = series;
    for (int p : periods) {
        if (p <= 0) throw ConfigError("moving average period must be > 0");
        const std::string name = "SMA_" + std::to_string(p);
        if (out.hasField(name)) continue;
        out = out.withColumn(name, sma(c, static_cast<std::size_t>(p)));
    }
    return out;
}

} // namespace qsim
