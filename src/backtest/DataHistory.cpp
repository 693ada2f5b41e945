#include "backtest/DataHistory.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace quantsim {
namespace backtest {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Column positions within a CSV row; -1 when absent
struct ColumnMap {
    int timestamp = 0;
    int open = 1;
    int high = 2;
    int low = 3;
    int close = 4;
    int volume = 5;
    int amount = 6;

    int required() const {
        return std::max({timestamp, open, high, low, close, volume}) + 1;
    }
};

bool looksLikeHeader(const std::vector<std::string>& row) {
    if (row.empty() || row[0].empty()) {
        return false;
    }
    const unsigned char c = static_cast<unsigned char>(row[0][0]);
    return !std::isdigit(c) && c != '-';
}

ColumnMap mapHeader(const std::vector<std::string>& header) {
    ColumnMap columns;
    columns.timestamp = columns.open = columns.high = columns.low = -1;
    columns.close = columns.volume = columns.amount = -1;

    for (size_t i = 0; i < header.size(); ++i) {
        const std::string name = toLower(header[i]);
        const int idx = static_cast<int>(i);
        if (name == "date" || name == "timestamp" || name == "time" || name == "datetime" ||
            name == "trade_date") {
            columns.timestamp = idx;
        } else if (name == "open") {
            columns.open = idx;
        } else if (name == "high") {
            columns.high = idx;
        } else if (name == "low") {
            columns.low = idx;
        } else if (name == "close") {
            columns.close = idx;
        } else if (name == "volume" || name == "vol") {
            columns.volume = idx;
        } else if (name == "amount") {
            columns.amount = idx;
        }
    }

    if (columns.timestamp < 0 || columns.open < 0 || columns.high < 0 ||
        columns.low < 0 || columns.close < 0 || columns.volume < 0) {
        throw DataLoadError("CSV header lacks one of date, open, high, low, close, volume");
    }
    return columns;
}

Timestamp jsonTimestamp(const nlohmann::json& item) {
    for (const char* key : {"timestamp", "date", "time", "t"}) {
        if (!item.contains(key)) {
            continue;
        }
        const auto& value = item.at(key);
        if (value.is_number_integer()) {
            return value.get<long long>();
        }
        if (value.is_string()) {
            return utils::parseTimestamp(value.get<std::string>());
        }
    }
    throw DataLoadError("bar object without timestamp/date field");
}

double jsonNumber(const nlohmann::json& item, const char* key, const char* alt, bool required) {
    if (item.contains(key) && item.at(key).is_number()) {
        return item.at(key).get<double>();
    }
    if (alt && item.contains(alt) && item.at(alt).is_number()) {
        return item.at(alt).get<double>();
    }
    if (required) {
        throw DataLoadError(std::string("bar object without numeric '") + key + "'");
    }
    return 0.0;
}

void sortByTime(BarSeries& bars) {
    std::sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });
}

} // namespace

BarSeries DataHistory::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataLoadError("Failed to open CSV file: " + file_path);
    }

    BarSeries bars;
    ColumnMap columns;
    bool first_row = true;
    std::string line;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;
        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }
        if (row.empty() || row[0].empty()) {
            continue;
        }

        if (first_row) {
            first_row = false;
            if (looksLikeHeader(row)) {
                columns = mapHeader(row);
                continue;
            }
        }

        if (static_cast<int>(row.size()) < columns.required()) {
            LOG_WARN("Skipping short CSV row: {}", line);
            continue;
        }

        try {
            Bar bar;
            bar.timestamp = utils::parseTimestamp(row[columns.timestamp]);
            bar.open = std::stod(row[columns.open]);
            bar.high = std::stod(row[columns.high]);
            bar.low = std::stod(row[columns.low]);
            bar.close = std::stod(row[columns.close]);
            bar.volume = std::stod(row[columns.volume]);
            if (columns.amount >= 0 && columns.amount < static_cast<int>(row.size()) &&
                !row[columns.amount].empty()) {
                bar.amount = std::stod(row[columns.amount]);
            }
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTime(bars);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

BarSeries DataHistory::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataLoadError("Failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw DataLoadError("Error parsing JSON file: " + file_path + " - " + e.what());
    }
    if (!j.is_array()) {
        throw DataLoadError("JSON bar file must hold an array: " + file_path);
    }

    BarSeries bars;
    bars.reserve(j.size());
    for (const auto& item : j) {
        Bar bar;
        bar.timestamp = jsonTimestamp(item);
        bar.open = jsonNumber(item, "open", "o", true);
        bar.high = jsonNumber(item, "high", "h", true);
        bar.low = jsonNumber(item, "low", "l", true);
        bar.close = jsonNumber(item, "close", "c", true);
        bar.volume = jsonNumber(item, "volume", "v", false);
        bar.amount = jsonNumber(item, "amount", nullptr, false);
        bars.push_back(bar);
    }

    sortByTime(bars);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

void DataHistory::validateSeries(const BarSeries& bars, const std::string& label) {
    const std::string name = label.empty() ? std::string("series") : label;
    if (bars.empty()) {
        throw EmptyDataError(name + ": bar series is empty");
    }

    long long prev_day = 0;
    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        if (!std::isfinite(bar.close) || bar.close < 0.0) {
            throw ValidationError(name + ": invalid close price on " + utils::formatDate(bar.timestamp));
        }
        const long long day = utils::dayKey(bar.timestamp);
        if (i > 0 && day <= prev_day) {
            throw ValidationError(name + ": bars must have strictly ascending dates (" +
                                  utils::formatDate(bar.timestamp) + ")");
        }
        prev_day = day;
    }
}

BarSeries DataHistory::filterByDate(const BarSeries& bars,
                                    const std::string& start_date,
                                    const std::string& end_date) {
    const long long start_day = start_date.empty()
        ? std::numeric_limits<long long>::min()
        : utils::dayKey(utils::parseDate(start_date));
    const long long end_day = end_date.empty()
        ? std::numeric_limits<long long>::max()
        : utils::dayKey(utils::parseDate(end_date));

    BarSeries filtered;
    for (const auto& bar : bars) {
        const long long day = utils::dayKey(bar.timestamp);
        if (day >= start_day && day <= end_day) {
            filtered.push_back(bar);
        }
    }
    return filtered;
}

BenchmarkReturns DataHistory::closeReturns(const BarSeries& bars) {
    BenchmarkReturns returns;
    for (size_t i = 1; i < bars.size(); ++i) {
        const double prev = bars[i - 1].close;
        if (prev <= 0.0) {
            continue;
        }
        returns[utils::dayKey(bars[i].timestamp)] = bars[i].close / prev - 1.0;
    }
    return returns;
}

} // namespace backtest
} // namespace quantsim
