#pragma once

#include "qsim/series.hpp"

#include <chrono>
#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace qsim {

// Supplier of historical bars.  Remote providers live outside this library;
// anything that can produce a validated Series implements this interface.
class BarSource {
public:
    virtual ~BarSource() = default;
    // Throws DataError when the symbol cannot be loaded.
    [[nodiscard]] virtual Series load(const std::string& symbol) = 0;
};

// Parse CSV text with a header row.  Required columns: timestamp, open,
// high, low, close, volume; every other column becomes an indicator.  Empty
// cells and "nan" are read as NaN.  Throws DataError on malformed input.
Series parseCsv(std::istream& in, const std::string& symbol);

// CSV file data source.  When constructed with a directory, load(symbol)
// reads <dir>/<symbol>.csv; with a file path it always reads that file.
class CsvBarSource : public BarSource {
public:
    explicit CsvBarSource(std::string path);
    [[nodiscard]] Series load(const std::string& symbol) override;

private:
    std::string path_;
};

struct RetryOptions {
    int max_retries{3};
    std::chrono::milliseconds delay{2000};
};

// Wraps another source and retries failed loads.  Any exception from the
// inner source and an empty series both count as a failed attempt.  After the last attempt a DataError is raised.
class RetryingBarSource : public BarSource {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryingBarSource(std::unique_ptr<BarSource> inner, RetryOptions options = {},
                      Sleeper sleeper = {});
    [[nodiscard]] Series load(const std::string& symbol) override;

    [[nodiscard]] int lastAttempts() const noexcept { return last_attempts_; }

private:
    std::unique_ptr<BarSource> inner_;
    RetryOptions options_;
    Sleeper sleeper_;
    int last_attempts_{0};
};

} // namespace qsim
