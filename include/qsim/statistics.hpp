#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace qsim {

/// Statistical utilities for performance metrics
class Statistics {
public:
    /// Mean of a vector, 0 when empty
    template<typename T>
    static double mean(const std::vector<T>& values) noexcept {
        if (values.empty()) return 0.0;
        double sum = std::accumulate(values.begin(), values.end(), 0.0);
        return sum / values.size();
    }

    /// Sample covariance (n - 1 denominator), 0 with fewer than two points
    template<typename T, typename U>
    static double covariance(const std::vector<T>& x, const std::vector<U>& y) noexcept {
        if (x.size() != y.size() || x.size() < 2) return 0.0;

        double mean_x = mean(x);
        double mean_y = mean(y);
        double acc = 0.0;
        for (std::size_t i = 0; i < x.size(); ++i) {
            acc += (static_cast<double>(x[i]) - mean_x) * (static_cast<double>(y[i]) - mean_y);
        }
        return acc / (x.size() - 1);
    }

    /// Sample variance
    template<typename T>
    static double variance(const std::vector<T>& values) noexcept {
        return covariance(values, values);
    }

    /// Sample standard deviation
    template<typename T>
    static double standard_deviation(const std::vector<T>& values) noexcept {
        return std::sqrt(std::max(0.0, variance(values)));
    }
};

/// Drawdown and downside risk on cumulative-return curves
class RiskMetrics {
public:
    /// Most negative value of curve[i] / running_peak - 1, so always <= 0.
    static double max_drawdown(const std::vector<double>& curve) noexcept {
        if (curve.empty()) return 0.0;

        double peak = curve[0];
        double max_dd = 0.0;
        for (double v : curve) {
            peak = std::max(peak, v);
            if (peak <= 0.0) continue;
            max_dd = std::min(max_dd, v / peak - 1.0);
        }
        return max_dd;
    }

    /// Longest stretch of bars spent below the running peak
    static std::size_t max_drawdown_duration(const std::vector<double>& curve) noexcept {
        if (curve.size() < 2) return 0;

        double peak_value = curve[0];
        std::size_t peak_index = 0;
        std::size_t max_duration = 0;
        for (std::size_t i = 1; i < curve.size(); ++i) {
            if (curve[i] >= peak_value) {
                peak_value = curve[i];
                peak_index = i;
            } else {
                max_duration = std::max(max_duration, i - peak_index);
            }
        }
        return max_duration;
    }

    /// Root mean square of returns below target (for Sortino ratio)
    static double downside_deviation(const std::vector<double>& returns,
                                     double target_return = 0.0) noexcept {
        if (returns.size() < 2) return 0.0;

        double sum_sq = 0.0;
        for (double ret : returns) {
            if (ret < target_return) {
                double diff = ret - target_return;
                sum_sq += diff * diff;
            }
        }
        return std::sqrt(sum_sq / returns.size());
    }
};

} // namespace qsim
