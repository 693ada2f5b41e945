#pragma once

#include "common/Types.h"
#include "common/Logger.h"
#include "engine/EngineConfig.h"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quantsim {
namespace risk {

class PositionManager;

// 리스크 등급
enum class RiskLevel {
    SAFE,
    LOW,
    MEDIUM,
    HIGH
};

const char* riskLevelToString(RiskLevel level);

// Derived per call, never stored
struct RiskMetrics {
    engine::RiskLimits limits;
    double current_position_ratio = 0.0;
    double current_daily_pnl_ratio = 0.0;   // negative on a losing day
    double current_drawdown_ratio = 0.0;    // positive fraction below peak
    int risk_score = 0;
    RiskLevel risk_level = RiskLevel::SAFE;
};

struct RiskReport {
    RiskLevel risk_level = RiskLevel::SAFE;
    int risk_score = 0;
    double position_ratio = 0.0;
    double daily_pnl_ratio = 0.0;
    double drawdown_ratio = 0.0;
    std::vector<std::string> warnings;
    bool should_reduce = false;
};

nlohmann::json toJson(const RiskReport& report);

// Threshold evaluator with a little running state: the peak value
// (high-water mark) and the value at the start of the current day.
class RiskManager {
public:
    // Throws ValidationError when a limit is not in (0, 1]
    explicit RiskManager(const engine::RiskLimits& limits = engine::RiskLimits(),
                         Quantity lot_size = 100,
                         LoggerHandle logger = nullptr);

    void initialize(double initial_capital);

    // Resets the daily start value the first time a new calendar day is seen
    void onNewDay(Timestamp timestamp, double current_value);
    void updateDailyStart(double current_value);
    // Raises the high-water mark
    void updateValue(double current_value);

    double calculatePositionRatio(double position_value, double total_value) const;
    double calculateSingleStockRatio(double stock_value, double total_value) const;
    double calculateDailyPnlRatio(double current_value) const;
    double calculateDrawdownRatio(double current_value) const;

    bool checkPositionLimit(double position_value, double total_value) const;
    bool checkSingleStockLimit(double stock_value, double total_value) const;
    bool checkDailyLossLimit(double current_value) const;
    bool checkDrawdownLimit(double current_value) const;
    bool checkStopLoss(double average_cost, double current_price) const;
    bool checkTakeProfit(double average_cost, double current_price) const;

    // stock_values: market value per held symbol
    RiskMetrics getRiskMetrics(double position_value, double total_value,
                               const std::map<std::string, double>& stock_values) const;

    bool shouldReducePosition(double current_value, double position_value) const;

    // Lot-rounded share count keeping one stock within the single-stock limit
    Quantity calculateMaxPositionSize(double total_value, double price) const;

    RiskReport getRiskReport(double total_value, double position_value,
                             const std::map<std::string, double>& stock_values) const;
    RiskReport getRiskReport(const PositionManager& positions) const;

    const engine::RiskLimits& limits() const { return limits_; }
    double initialCapital() const { return initial_capital_; }
    double peakValue() const { return peak_value_; }
    double dailyStartValue() const { return daily_start_value_; }

private:
    engine::RiskLimits limits_;
    Quantity lot_size_;
    LoggerHandle logger_;

    double initial_capital_;
    double peak_value_;
    double daily_start_value_;
    long long current_day_;
    bool has_day_;
};

} // namespace risk
} // namespace quantsim
