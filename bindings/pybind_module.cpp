#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "qsim/backtester.hpp"
#include "qsim/data_source.hpp"
#include "qsim/errors.hpp"
#include "qsim/indicators.hpp"

#include <map>
#include <unordered_map>
#include <vector>

namespace py = pybind11;
using namespace qsim;

namespace {

// Build a Series from parallel columns; open/high/low default to close.
Series seriesFromColumns(const std::string& symbol,
                         const std::vector<Timestamp>& timestamps,
                         const std::vector<double>& close,
                         const std::map<std::string, std::vector<double>>& indicators,
                         const std::vector<double>& volume) {
    if (close.size() != timestamps.size()) {
        throw DataError(symbol + ": close and timestamps differ in length");
    }
    if (!volume.empty() && volume.size() != close.size()) {
        throw DataError(symbol + ": volume and close differ in length");
    }
    std::vector<Bar> bars(close.size());
    for (std::size_t i = 0; i < close.size(); ++i) {
        auto& b = bars[i];
        b.timestamp = timestamps[i];
        b.open = b.high = b.low = b.close = close[i];
        b.volume = volume.empty() ? 0.0 : volume[i];
        for (const auto& kv : indicators) {
            if (kv.second.size() != close.size()) {
                throw DataError(symbol + ": column " + kv.first + " differs in length");
            }
            b.indicators.emplace(kv.first, kv.second[i]);
        }
    }
    return Series{symbol, std::move(bars)};
}

} // namespace

PYBIND11_MODULE(qsimpy, m) {
    m.doc() = "C++17 rules-based strategy backtester bindings";

    auto base = py::register_exception<Error>(m, "Error");
    py::register_exception<DataError>(m, "DataError", base.ptr());
    py::register_exception<AlignmentError>(m, "AlignmentError", base.ptr());
    py::register_exception<ConfigError>(m, "ConfigError", base.ptr());

    py::enum_<StrategyKind>(m, "StrategyKind")
        .value("OSCILLATOR", StrategyKind::Oscillator)
        .value("TREND_ROTATION", StrategyKind::TrendRotation);

    py::class_<Series>(m, "Series")
        .def(py::init(&seriesFromColumns),
             py::arg("symbol"), py::arg("timestamps"), py::arg("close"),
             py::arg("indicators") = std::map<std::string, std::vector<double>>{},
             py::arg("volume") = std::vector<double>{})
        .def_static("from_csv", [](const std::string& path, const std::string& symbol) {
            return CsvBarSource{path}.load(symbol);
        }, py::arg("path"), py::arg("symbol"))
        .def("__len__", &Series::size)
        .def_property_readonly("symbol", &Series::symbol)
        .def("schema", &Series::schema)
        .def("column", &Series::column)
        .def("closes", &Series::closes)
        .def("with_standard_indicators", [](const Series& s) { return addStandardIndicators(s); })
        .def("with_moving_averages", [](const Series& s, const std::vector<int>& periods) {
            return addMovingAverages(s, periods);
        })
        .def("drop_incomplete", &Series::dropIncomplete);

    py::class_<Backtester>(m, "Backtester")
        .def(py::init([](StrategyKind kind, const std::unordered_map<std::string, double>& params) {
                 return Backtester{kind, BacktestConfig::fromParameters(params)};
             }),
             py::arg("kind") = StrategyKind::Oscillator,
             py::arg("params") = std::unordered_map<std::string, double>{})
        .def("run", [](const Backtester& bt, const Series& series, const Series* benchmark) {
                 auto res = bt.run(series, benchmark);
                 py::dict out;
                 std::vector<int> signals;
                 signals.reserve(res.signals.size());
                 for (auto s : res.signals) signals.push_back(toInt(s));
                 out["signals"] = signals;
                 out["period_returns"] = res.returns.periodReturns();
                 out["cumulative_returns"] = res.returns.cumulativeReturns();
                 out["report"] = res.report.values();
                 return out;
             },
             py::arg("series"), py::arg("benchmark") = nullptr);
}
