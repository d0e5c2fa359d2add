#include "qsim/backtester.hpp"
#include "qsim/data_source.hpp"
#include "qsim/errors.hpp"
#include "qsim/indicators.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace qsim;

namespace {

void usage() {
    std::cerr << "usage: qsim <bars.csv> [--strategy oscillator|rotation] [--benchmark <bars.csv>]\n"
                 "            [--config <file>] [--compute-indicators] [--verbose] [key=value ...]\n";
}

struct Options {
    std::string data_path;
    std::string benchmark_path;
    std::string config_path;
    StrategyKind kind{StrategyKind::Oscillator};
    bool compute_indicators{false};
    bool verbose{false};
    std::unordered_map<std::string, double> overrides;
};

std::optional<Options> parseArgs(int argc, char** argv) {
    Options o;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };
        if (a == "--strategy") {
            auto v = next(); if (!v) return std::nullopt;
            o.kind = parseStrategyKind(*v);
        } else if (a == "--benchmark") {
            auto v = next(); if (!v) return std::nullopt;
            o.benchmark_path = *v;
        } else if (a == "--config") {
            auto v = next(); if (!v) return std::nullopt;
            o.config_path = *v;
        } else if (a == "--compute-indicators") {
            o.compute_indicators = true;
        } else if (a == "--verbose") {
            o.verbose = true;
        } else if (a.find('=') != std::string::npos) {
            for (const auto& kv : parseParameters(a)) o.overrides[kv.first] = kv.second;
        } else if (o.data_path.empty() && a.rfind("--", 0) != 0) {
            o.data_path = a;
        } else {
            return std::nullopt;
        }
    }
    if (o.data_path.empty()) return std::nullopt;
    return o;
}

Series prepare(const Series& raw, StrategyKind kind, const StrategyParams& params, bool compute) {
    if (kind == StrategyKind::TrendRotation) {
        const Series s = compute ? addMovingAverages(raw, params.rotation_ma_periods) : raw;
        return s.dropIncomplete(params.rotationFields());
    }
    return compute ? addStandardIndicators(raw) : raw;
}

Series trimBefore(const Series& s, Timestamp first) {
    std::vector<Bar> bars;
    for (const auto& b : s) {
        if (b.timestamp >= first) bars.push_back(b);
    }
    return Series{s.symbol(), std::move(bars)};
}

Series loadSeries(const std::string& path) {
    const std::string symbol = std::filesystem::path(path).stem().string();
    RetryingBarSource source{std::make_unique<CsvBarSource>(path), RetryOptions{1, {}}};
    return source.load(symbol);
}

void printReport(const std::string& symbol, StrategyKind kind, const PerformanceReport& report) {
    std::cout << "==================== " << symbol << " (" << toString(kind) << ") ====================\n";
    for (const auto& kv : report) {
        std::cout << std::left << std::setw(24) << kv.first << std::right
                  << std::fixed << std::setprecision(6) << kv.second << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::optional<Options> opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const Error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    if (!opts) { usage(); return 1; }
    spdlog::set_level(opts->verbose ? spdlog::level::debug : spdlog::level::warn);

    try {
        auto params = opts->config_path.empty() ? std::unordered_map<std::string, double>{}
                                                : loadParameters(opts->config_path);
        for (const auto& kv : opts->overrides) params[kv.first] = kv.second;
        const BacktestConfig config = BacktestConfig::fromParameters(params);
        const StrategyParams strategy_params{};

        const bool regime_from_benchmark =
            opts->kind == StrategyKind::TrendRotation && !opts->benchmark_path.empty();
        Series series = loadSeries(opts->data_path);
        if (!regime_from_benchmark) {
            series = prepare(series, opts->kind, strategy_params, opts->compute_indicators);
        }
        std::optional<Series> benchmark;
        if (!opts->benchmark_path.empty()) {
            Series b = loadSeries(opts->benchmark_path);
            if (regime_from_benchmark) {
                // the regime is read from the benchmark, so it carries the averages and
                // the traded series starts where the benchmark's warm-up ends
                b = prepare(b, opts->kind, strategy_params, opts->compute_indicators);
                if (b.empty()) throw DataError(b.symbol() + ": no bars past the moving-average warm-up");
                series = trimBefore(series, b[0].timestamp);
            }
            benchmark = std::move(b);
        }

        Backtester bt{opts->kind, config, strategy_params};
        auto res = bt.run(series, benchmark ? &*benchmark : nullptr);
        if (res.report.empty()) {
            std::cerr << "no bars to simulate in " << opts->data_path << "\n";
            return 2;
        }
        printReport(series.symbol(), opts->kind, res.report);
    } catch (const Error& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
    return 0;
}
