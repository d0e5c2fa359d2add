#include "qsim/config.hpp"
#include "qsim/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace qsim {

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

void require(bool ok, const std::string& what) {
    if (!ok) throw ConfigError(what);
}

} // namespace

double BacktestConfig::periodRiskFreeYield() const {
    return std::pow(1.0 + risk_free_rate, 1.0 / periods_per_year) - 1.0;
}

void BacktestConfig::validate() const {
    require(std::isfinite(initial_capital) && initial_capital > 0.0,
            "initial_capital must be > 0");
    require(std::isfinite(transaction_cost_rate) && transaction_cost_rate >= 0.0,
            "transaction_cost_rate must be >= 0");
    require(std::isfinite(slippage_rate) && slippage_rate >= 0.0,
            "slippage_rate must be >= 0");
    require(std::isfinite(risk_free_rate) && risk_free_rate > -1.0,
            "risk_free_rate must be > -1");
    require(std::isfinite(periods_per_year) && periods_per_year > 0.0,
            "periods_per_year must be > 0");
    require(std::isfinite(rsi_overbought) && std::isfinite(rsi_oversold) &&
            rsi_overbought > rsi_oversold,
            "rsi_overbought must be greater than rsi_oversold");
    require(std::isfinite(leverage) && leverage > 0.0, "leverage must be > 0");
    require(clips.leveraged_return_bound > 0.0, "leveraged_return_bound must be > 0");
    require(clips.cumulative_bound > 0.0, "cumulative_bound must be > 0");
    require(clips.wipeout_return_floor > 0.0 && clips.wipeout_return_floor < 1.0,
            "wipeout_return_floor must be in (0, 1)");
    require(clips.max_drawdown_floor > 0.0 && clips.max_drawdown_floor <= 1.0,
            "max_drawdown_floor must be in (0, 1]");
}

BacktestConfig BacktestConfig::fromParameters(
        const std::unordered_map<std::string, double>& params) {
    BacktestConfig c{};
    const std::unordered_map<std::string, double*> fields{
        {"initial_capital",        &c.initial_capital},
        {"transaction_cost_rate",  &c.transaction_cost_rate},
        {"slippage_rate",          &c.slippage_rate},
        {"risk_free_rate",         &c.risk_free_rate},
        {"periods_per_year",       &c.periods_per_year},
        {"rsi_overbought",         &c.rsi_overbought},
        {"rsi_oversold",           &c.rsi_oversold},
        {"leverage",               &c.leverage},
        {"leveraged_return_bound", &c.clips.leveraged_return_bound},
        {"cumulative_bound",       &c.clips.cumulative_bound},
        {"wipeout_return_floor",   &c.clips.wipeout_return_floor},
        {"max_drawdown_floor",     &c.clips.max_drawdown_floor},
    };
    for (const auto& kv : params) {
        auto it = fields.find(kv.first);
        if (it == fields.end()) throw ConfigError("unknown parameter: " + kv.first);
        *it->second = kv.second;
    }
    c.validate();
    return c;
}

std::vector<std::string> StrategyParams::rotationFields() const {
    std::vector<std::string> out;
    out.reserve(rotation_ma_periods.size());
    for (int p : rotation_ma_periods) out.push_back("SMA_" + std::to_string(p));
    return out;
}

std::unordered_map<std::string, double> parseParameters(const std::string& text) {
    std::unordered_map<std::string, double> out;
    std::istringstream in(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("line " + std::to_string(line_no) + ": expected key = value");
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string val = trim(line.substr(eq + 1));
        if (key.empty() || val.empty()) {
            throw ConfigError("line " + std::to_string(line_no) + ": expected key = value");
        }
        std::size_t used = 0;
        double v = 0.0;
        try {
            v = std::stod(val, &used);
        } catch (const std::exception&) {
            throw ConfigError("line " + std::to_string(line_no) + ": not a number: " + val);
        }
        if (used != val.size()) {
            throw ConfigError("line " + std::to_string(line_no) + ": not a number: " + val);
        }
        out[key] = v;
    }
    return out;
}

std::unordered_map<std::string, double> loadParameters(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw ConfigError("cannot open config file: " + path);
    std::ostringstream ss;
    ss << file.rdbuf();
    return parseParameters(ss.str());
}

} // namespace qsim
