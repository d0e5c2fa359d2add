#pragma once

#include "qsim/series.hpp"

#include <cstddef>
#include <vector>

namespace qsim {

// Reference indicator provider.  Every function is pure, returns one value
// per input value and marks warm-up positions with NaN.

// Simple moving average over `period` values.
std::vector<double> sma(const std::vector<double>& values, std::size_t period);

// Exponential moving average with alpha = 2/(span+1), seeded with the
// first value (no warm-up).
std::vector<double> ema(const std::vector<double>& values, std::size_t span);

// Relative strength index from rolling means of gains and losses.
std::vector<double> rsi(const std::vector<double>& values, std::size_t period = 14);

struct MacdLines {
    std::vector<double> macd;
    std::vector<double> signal_line;
};

MacdLines macd(const std::vector<double>& values,
               std::size_t fast_span = 12,
               std::size_t slow_span = 26,
               std::size_t signal_span = 9);

// Appends SMA_20, SMA_50, RSI, MACD and Signal_Line computed from closes.
// Columns the series already carries are left untouched.
Series addStandardIndicators(const Series& series);

// Appends SMA_<p> for every period not already present.
Series addMovingAverages(const Series& series, const std::vector<int>& periods);

} // namespace qsim
