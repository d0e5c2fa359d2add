#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace qsim {

using Timestamp = std::int64_t;  // seconds since epoch (any strictly increasing key works)

// One time step of market data.  Indicator values that are not yet defined
// (warm-up windows) are stored as NaN.
struct Bar {
    Timestamp timestamp{};
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
    std::unordered_map<std::string, double> indicators;

    // Value of an OHLCV field or indicator by name.  Throws DataError when
    // the name is unknown.
    [[nodiscard]] double value(const std::string& name) const;
};

// Ordered, immutable sequence of bars sharing one indicator schema.
// Timestamps are strictly increasing.  Operations that derive new columns
// or drop rows return a new Series and leave this one untouched.
class Series {
public:
    Series() = default;
    Series(std::string symbol, std::vector<Bar> bars);

    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }
    [[nodiscard]] std::size_t size() const noexcept { return bars_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bars_.empty(); }
    [[nodiscard]] const Bar& operator[](std::size_t i) const { return bars_[i]; }
    [[nodiscard]] const std::vector<Bar>& bars() const noexcept { return bars_; }
    auto begin() const noexcept { return bars_.begin(); }
    auto end() const noexcept { return bars_.end(); }

    // Indicator names carried by every bar, sorted.
    [[nodiscard]] const std::vector<std::string>& schema() const noexcept { return schema_; }

    [[nodiscard]] bool hasField(const std::string& name) const;
    // Throws DataError naming every field that is absent.
    void requireFields(const std::vector<std::string>& names) const;

    [[nodiscard]] std::vector<double> column(const std::string& name) const;
    [[nodiscard]] std::vector<double> closes() const { return column("close"); }
    [[nodiscard]] std::vector<Timestamp> timestamps() const;

    // True when both series have the same length and identical timestamps.
    [[nodiscard]] bool alignedWith(const Series& other) const;

    // New series with one more indicator column.
    [[nodiscard]] Series withColumn(const std::string& name, const std::vector<double>& values) const;
    // New series keeping only bars whose listed fields are all finite.
    [[nodiscard]] Series dropIncomplete(const std::vector<std::string>& names) const;

private:
    std::string symbol_;
    std::vector<Bar> bars_;
    std::vector<std::string> schema_;
};

} // namespace qsim
