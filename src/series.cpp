#include "qsim/series.hpp"
#include "qsim/errors.hpp"

#include <algorithm>
#include <cmath>

namespace qsim {

namespace {

bool isPriceField(const std::string& name) {
    return name == "open" || name == "high" || name == "low" ||
           name == "close" || name == "volume";
}

std::vector<std::string> sortedKeys(const std::unordered_map<std::string, double>& m) {
    std::vector<std::string> keys;
    keys.reserve(m.size());
    for (const auto& kv : m) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace

double Bar::value(const std::string& name) const {
    if (name == "open") return open;
    if (name == "high") return high;
    if (name == "low") return low;
    if (name == "close") return close;
    if (name == "volume") return volume;
    auto it = indicators.find(name);
    if (it == indicators.end()) throw DataError("unknown field: " + name);
    return it->second;
}

Series::Series(std::string symbol, std::vector<Bar> bars)
    : symbol_(std::move(symbol)), bars_(std::move(bars)) {
    if (bars_.empty()) return;
    schema_ = sortedKeys(bars_.front().indicators);

    for (std::size_t i = 0; i < bars_.size(); ++i) {
        const auto& b = bars_[i];
        if (i > 0 && b.timestamp <= bars_[i - 1].timestamp) {
            throw DataError(symbol_ + ": timestamps not strictly increasing at bar " +
                            std::to_string(i));
        }
        if (b.indicators.size() != schema_.size()) {
            throw DataError(symbol_ + ": inconsistent indicator schema at bar " +
                            std::to_string(i));
        }
        for (const auto& name : schema_) {
            if (b.indicators.find(name) == b.indicators.end()) {
                throw DataError(symbol_ + ": bar " + std::to_string(i) +
                                " lacks indicator " + name);
            }
        }
    }
}

bool Series::hasField(const std::string& name) const {
    return isPriceField(name) || std::binary_search(schema_.begin(), schema_.end(), name);
}

void Series::requireFields(const std::vector<std::string>& names) const {
    std::string missing;
    for (const auto& n : names) {
        if (hasField(n)) continue;
        if (!missing.empty()) missing += ", ";
        missing += n;
    }
    if (!missing.empty()) {
        throw DataError(symbol_ + ": missing required field(s): " + missing);
    }
}

std::vector<double> Series::column(const std::string& name) const {
    if (!empty() && !hasField(name)) throw DataError(symbol_ + ": unknown field: " + name);
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& b : bars_) out.push_back(b.value(name));
    return out;
}

std::vector<Timestamp> Series::timestamps() const {
    std::vector<Timestamp> out;
    out.reserve(bars_.size());
    for (const auto& b : bars_) out.push_back(b.timestamp);
    return out;
}

bool Series::alignedWith(const Series& other) const {
    if (size() != other.size()) return false;
    for (std::size_t i = 0; i < bars_.size(); ++i) {
        if (bars_[i].timestamp != other.bars_[i].timestamp) return false;
    }
    return true;
}

Series Series::withColumn(const std::string& name, const std::vector<double>& values) const {
    if (values.size() != bars_.size()) {
        throw DataError(symbol_ + ": column " + name + " has " + std::to_string(values.size()) +
                        " values for " + std::to_string(bars_.size()) + " bars");
    }
    if (hasField(name)) throw DataError(symbol_ + ": field already present: " + name);
    std::vector<Bar> bars = bars_;
    for (std::size_t i = 0; i < bars.size(); ++i) bars[i].indicators.emplace(name, values[i]);
    Series out{symbol_, std::move(bars)};
    if (out.empty()) {
        // no bar to carry the schema, so record the column name directly
        out.schema_ = schema_;
        out.schema_.insert(std::upper_bound(out.schema_.begin(), out.schema_.end(), name), name);
    }
    return out;
}

Series Series::dropIncomplete(const std::vector<std::string>& names) const {
    requireFields(names);
    std::vector<Bar> kept;
    kept.reserve(bars_.size());
    for (const auto& b : bars_) {
        const bool complete = std::all_of(names.begin(), names.end(),
            [&b](const std::string& n) { return std::isfinite(b.value(n)); });
        if (complete) kept.push_back(b);
    }
    Series out{symbol_, std::move(kept)};
    // an all-dropped series still remembers its schema
    if (out.empty()) out.schema_ = schema_;
    return out;
}

} // namespace qsim
