#pragma once

#include <string>
#include <vector>
#include <map>
#include "common/Types.h"
#include "backtest/PerformanceAnalyzer.h"

namespace quantsim {
namespace backtest {

class DataHistory {
public:
    // Load bars from a CSV file. A header row selects columns by name
    // (date|timestamp, open, high, low, close, volume[, amount]); without one the
    // columns are taken in that order. Throws DataLoadError if the file can't be read.
    static BarSeries loadCSV(const std::string& file_path);

    // Load bars from a JSON array of objects using the same field names
    static BarSeries loadJSON(const std::string& file_path);

    // Throws EmptyDataError on an empty series and ValidationError unless
    // dates are strictly ascending and prices are finite and non-negative
    static void validateSeries(const BarSeries& bars, const std::string& label = "");

    // Inclusive YYYY-MM-DD range; an empty bound is open
    static BarSeries filterByDate(const BarSeries& bars,
                                  const std::string& start_date,
                                  const std::string& end_date);

    // close[i] / close[i-1] - 1 keyed by calendar day, for benchmark series
    static BenchmarkReturns closeReturns(const BarSeries& bars);
};

} // namespace backtest
} // namespace quantsim
