#include "qsim/data_source.hpp"
#include "qsim/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <thread>
#include <vector>

namespace qsim {

namespace {

std::vector<std::string> splitCSV(const std::string& s) {
    std::vector<std::string> out;
    std::string cur; cur.reserve(64);
    bool in_q = false;
    for (char c : s) {
        if (c == '"') { in_q = !in_q; continue; }
        if (c == ',' && !in_q) { out.push_back(cur); cur.clear(); }
        else if (c != '\r') cur.push_back(c);
    }
    out.push_back(cur);
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

double parseCell(const std::string& cell, std::size_t line_no, const std::string& column) {
    if (cell.empty() || lower(cell) == "nan") return std::numeric_limits<double>::quiet_NaN();
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(cell, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != cell.size()) {
        throw DataError("line " + std::to_string(line_no) + ": bad value '" + cell +
                        "' in column " + column);
    }
    return v;
}

} // namespace

Series parseCsv(std::istream& in, const std::string& symbol) {
    std::string line;
    if (!std::getline(in, line)) throw DataError(symbol + ": empty CSV input");
    const auto header = splitCSV(line);

    const std::vector<std::string> base{"timestamp", "open", "high", "low", "close", "volume"};
    std::vector<int> base_idx(base.size(), -1);
    std::vector<std::size_t> indicator_idx;
    for (std::size_t c = 0; c < header.size(); ++c) {
        const auto name = lower(header[c]);
        auto it = std::find(base.begin(), base.end(), name);
        if (it != base.end()) base_idx[static_cast<std::size_t>(it - base.begin())] = static_cast<int>(c);
        else indicator_idx.push_back(c);
    }
    for (std::size_t k = 0; k < base.size(); ++k) {
        if (base_idx[k] < 0) throw DataError(symbol + ": CSV header lacks column " + base[k]);
    }

    std::vector<Bar> bars;
    std::size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        const auto cols = splitCSV(line);
        if (cols.size() != header.size()) {
            throw DataError(symbol + ": line " + std::to_string(line_no) + " has " +
                            std::to_string(cols.size()) + " columns, expected " +
                            std::to_string(header.size()));
        }
        Bar b{};
        const auto& ts = cols[static_cast<std::size_t>(base_idx[0])];
        std::size_t used = 0;
        try {
            b.timestamp = static_cast<Timestamp>(std::stoll(ts, &used));
        } catch (const std::exception&) {
            used = 0;
        }
        // the whole cell must be an integer; "2019-12-31" is not 2019
        if (used == 0 || used != ts.size()) {
            throw DataError(symbol + ": line " + std::to_string(line_no) + ": bad timestamp '" + ts + "'");
        }
        double* fields[] = {&b.open, &b.high, &b.low, &b.close, &b.volume};
        for (std::size_t k = 1; k < base.size(); ++k) {
            *fields[k - 1] = parseCell(cols[static_cast<std::size_t>(base_idx[k])], line_no, base[k]);
        }
        for (auto c : indicator_idx) b.indicators.emplace(header[c], parseCell(cols[c], line_no, header[c]));
        bars.push_back(std::move(b));
    }
    return Series{symbol, std::move(bars)};
}

// -------- CsvBarSource ----------

CsvBarSource::CsvBarSource(std::string path) : path_(std::move(path)) {}

Series CsvBarSource::load(const std::string& symbol) {
    namespace fs = std::filesystem;
    fs::path p(path_);
    if (fs::is_directory(p)) p /= symbol + ".csv";
    std::ifstream file(p);
    if (!file) throw DataError("cannot open " + p.string());
    return parseCsv(file, symbol);
}

// -------- RetryingBarSource ----------

RetryingBarSource::RetryingBarSource(std::unique_ptr<BarSource> inner, RetryOptions options,
                                     Sleeper sleeper)
    : inner_(std::move(inner)), options_(options), sleeper_(std::move(sleeper)) {
    if (!inner_) throw DataError("RetryingBarSource needs an inner source");
    if (options_.max_retries < 1) options_.max_retries = 1;
    if (!sleeper_) sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

Series RetryingBarSource::load(const std::string& symbol) {
    std::string last_error = "empty series";
    for (int attempt = 1; attempt <= options_.max_retries; ++attempt) {
        last_attempts_ = attempt;
        try {
            Series s = inner_->load(symbol);
            if (!s.empty()) return s;
            last_error = "empty series";
        } catch (const std::exception& e) {
            // any provider failure is retried; the caller only ever sees DataError
            last_error = e.what();
        }
        spdlog::warn("load {} attempt {}/{} failed: {}", symbol, attempt, options_.max_retries, last_error);
        if (attempt < options_.max_retries) sleeper_(options_.delay);
    }
    spdlog::error("failed to load {} after {} attempts", symbol, options_.max_retries);
    throw DataError("failed to load " + symbol + " after " + std::to_string(options_.max_retries) +
                    " attempts: " + last_error);
}

} // namespace qsim
