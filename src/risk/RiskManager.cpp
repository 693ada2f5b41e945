#include "risk/RiskManager.h"
#include "risk/PositionManager.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "execution/FrictionModel.h"

#include <cmath>
#include <cstdio>

namespace quantsim {
namespace risk {

namespace {

void requireRatio(double value, const char* name) {
    if (!(value > 0.0) || value > 1.0) {
        throw ValidationError(std::string(name) + " must be in (0, 1]");
    }
}

std::string percent(double ratio) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%%", ratio * 100.0);
    return buf;
}

} // namespace

const char* riskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::SAFE: return "SAFE";
        case RiskLevel::LOW: return "LOW";
        case RiskLevel::MEDIUM: return "MEDIUM";
        case RiskLevel::HIGH: return "HIGH";
    }
    return "SAFE";
}

RiskManager::RiskManager(const engine::RiskLimits& limits, Quantity lot_size, LoggerHandle logger)
    : limits_(limits)
    , lot_size_(lot_size)
    , logger_(Logger::orDefault(std::move(logger)))
    , initial_capital_(0.0)
    , peak_value_(0.0)
    , daily_start_value_(0.0)
    , current_day_(0)
    , has_day_(false)
{
    requireRatio(limits_.max_position_ratio, "max_position_ratio");
    requireRatio(limits_.max_single_stock_ratio, "max_single_stock_ratio");
    requireRatio(limits_.max_daily_loss_ratio, "max_daily_loss_ratio");
    requireRatio(limits_.max_drawdown_ratio, "max_drawdown_ratio");
    requireRatio(limits_.stop_loss_ratio, "stop_loss_ratio");
    if (!(limits_.take_profit_ratio > 0.0)) {
        throw ValidationError("take_profit_ratio must be positive");
    }
    if (lot_size_ <= 0) {
        throw ValidationError("lot_size must be positive");
    }
}

void RiskManager::initialize(double initial_capital) {
    initial_capital_ = initial_capital;
    peak_value_ = initial_capital;
    daily_start_value_ = initial_capital;
    has_day_ = false;
}

void RiskManager::onNewDay(Timestamp timestamp, double current_value) {
    const long long day = utils::dayKey(timestamp);
    if (has_day_ && day == current_day_) {
        return;
    }
    current_day_ = day;
    has_day_ = true;
    updateDailyStart(current_value);
}

void RiskManager::updateDailyStart(double current_value) {
    daily_start_value_ = current_value;
}

void RiskManager::updateValue(double current_value) {
    if (current_value > peak_value_) {
        peak_value_ = current_value;
    }
}

double RiskManager::calculatePositionRatio(double position_value, double total_value) const {
    return (total_value == 0.0) ? 0.0 : position_value / total_value;
}

double RiskManager::calculateSingleStockRatio(double stock_value, double total_value) const {
    return (total_value == 0.0) ? 0.0 : stock_value / total_value;
}

double RiskManager::calculateDailyPnlRatio(double current_value) const {
    if (daily_start_value_ == 0.0) {
        return 0.0;
    }
    return (current_value - daily_start_value_) / daily_start_value_;
}

double RiskManager::calculateDrawdownRatio(double current_value) const {
    if (peak_value_ == 0.0) {
        return 0.0;
    }
    return (peak_value_ - current_value) / peak_value_;
}

bool RiskManager::checkPositionLimit(double position_value, double total_value) const {
    return calculatePositionRatio(position_value, total_value) <= limits_.max_position_ratio;
}

bool RiskManager::checkSingleStockLimit(double stock_value, double total_value) const {
    return calculateSingleStockRatio(stock_value, total_value) <= limits_.max_single_stock_ratio;
}

bool RiskManager::checkDailyLossLimit(double current_value) const {
    return calculateDailyPnlRatio(current_value) >= -limits_.max_daily_loss_ratio;
}

bool RiskManager::checkDrawdownLimit(double current_value) const {
    return calculateDrawdownRatio(current_value) <= limits_.max_drawdown_ratio;
}

bool RiskManager::checkStopLoss(double average_cost, double current_price) const {
    if (average_cost == 0.0) {
        return false;
    }
    return (current_price - average_cost) / average_cost <= -limits_.stop_loss_ratio;
}

bool RiskManager::checkTakeProfit(double average_cost, double current_price) const {
    if (average_cost == 0.0) {
        return false;
    }
    return (current_price - average_cost) / average_cost >= limits_.take_profit_ratio;
}

RiskMetrics RiskManager::getRiskMetrics(double position_value, double total_value,
                                        const std::map<std::string, double>& stock_values) const {
    RiskMetrics metrics;
    metrics.limits = limits_;
    metrics.current_position_ratio = calculatePositionRatio(position_value, total_value);
    metrics.current_daily_pnl_ratio = calculateDailyPnlRatio(total_value);
    metrics.current_drawdown_ratio = calculateDrawdownRatio(total_value);

    int score = 0;
    if (metrics.current_position_ratio > limits_.max_position_ratio) {
        score += 2;
    } else if (metrics.current_position_ratio >= limits_.max_position_ratio * 0.8) {
        score += 1;
    }

    const double daily_loss = -metrics.current_daily_pnl_ratio;
    if (daily_loss > limits_.max_daily_loss_ratio) {
        score += 3;
    } else if (daily_loss >= limits_.max_daily_loss_ratio * 0.5) {
        score += 1;
    }

    if (metrics.current_drawdown_ratio > limits_.max_drawdown_ratio) {
        score += 3;
    } else if (metrics.current_drawdown_ratio >= limits_.max_drawdown_ratio * 0.5) {
        score += 1;
    }

    for (const auto& [symbol, value] : stock_values) {
        if (calculateSingleStockRatio(value, total_value) > limits_.max_single_stock_ratio) {
            score += 1;
        }
    }

    metrics.risk_score = score;
    if (score >= 5) {
        metrics.risk_level = RiskLevel::HIGH;
    } else if (score >= 3) {
        metrics.risk_level = RiskLevel::MEDIUM;
    } else if (score >= 1) {
        metrics.risk_level = RiskLevel::LOW;
    } else {
        metrics.risk_level = RiskLevel::SAFE;
    }
    return metrics;
}

bool RiskManager::shouldReducePosition(double current_value, double position_value) const {
    return !checkDailyLossLimit(current_value) ||
           !checkDrawdownLimit(current_value) ||
           !checkPositionLimit(position_value, current_value);
}

Quantity RiskManager::calculateMaxPositionSize(double total_value, double price) const {
    if (price <= 0.0 || total_value <= 0.0) {
        return 0;
    }
    const double max_value = total_value * limits_.max_single_stock_ratio;
    return execution::FrictionModel::roundToLot(max_value / price, lot_size_);
}

RiskReport RiskManager::getRiskReport(double total_value, double position_value,
                                      const std::map<std::string, double>& stock_values) const {
    const RiskMetrics metrics = getRiskMetrics(position_value, total_value, stock_values);

    RiskReport report;
    report.risk_level = metrics.risk_level;
    report.risk_score = metrics.risk_score;
    report.position_ratio = metrics.current_position_ratio;
    report.daily_pnl_ratio = metrics.current_daily_pnl_ratio;
    report.drawdown_ratio = metrics.current_drawdown_ratio;

    if (metrics.current_position_ratio > limits_.max_position_ratio) {
        report.warnings.push_back("position ratio " + percent(metrics.current_position_ratio) +
                                  " exceeds limit " + percent(limits_.max_position_ratio));
    }
    if (metrics.current_daily_pnl_ratio < -limits_.max_daily_loss_ratio) {
        report.warnings.push_back("daily loss " + percent(metrics.current_daily_pnl_ratio) +
                                  " exceeds limit " + percent(limits_.max_daily_loss_ratio));
    }
    if (metrics.current_drawdown_ratio > limits_.max_drawdown_ratio) {
        report.warnings.push_back("drawdown " + percent(metrics.current_drawdown_ratio) +
                                  " exceeds limit " + percent(limits_.max_drawdown_ratio));
    }
    for (const auto& [symbol, value] : stock_values) {
        const double ratio = calculateSingleStockRatio(value, total_value);
        if (ratio > limits_.max_single_stock_ratio) {
            report.warnings.push_back(symbol + " weight " + percent(ratio) +
                                      " exceeds limit " + percent(limits_.max_single_stock_ratio));
        }
    }

    report.should_reduce = shouldReducePosition(total_value, position_value);

    for (const auto& warning : report.warnings) {
        logger_->warn("[Risk] {}", warning);
    }
    return report;
}

RiskReport RiskManager::getRiskReport(const PositionManager& positions) const {
    std::map<std::string, double> stock_values;
    for (const auto& view : positions.getAllPositions()) {
        stock_values[view.symbol] = view.market_value;
    }
    return getRiskReport(positions.getTotalValue(), positions.getTotalPositionValue(), stock_values);
}

nlohmann::json toJson(const RiskReport& report) {
    return {
        {"risk_level", riskLevelToString(report.risk_level)},
        {"risk_score", report.risk_score},
        {"position_ratio", report.position_ratio},
        {"daily_pnl_ratio", report.daily_pnl_ratio},
        {"drawdown_ratio", report.drawdown_ratio},
        {"warnings", report.warnings},
        {"should_reduce", report.should_reduce}
    };
}

} // namespace risk
} // namespace quantsim
