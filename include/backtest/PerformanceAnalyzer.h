#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/TradeRecord.h"

namespace quantsim {
namespace backtest {

// Benchmark daily returns keyed by calendar day (utils::dayKey)
using BenchmarkReturns = std::map<long long, double>;

struct TradeStatistics {
    int total_trades = 0;           // sell trades
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double profit_factor = 0.0;
    double avg_profit = 0.0;        // mean of winning profits
    double avg_loss = 0.0;          // mean of losing profits (<= 0)
    double total_profit = 0.0;
    double total_loss = 0.0;        // absolute value
    int max_consecutive_wins = 0;
    int max_consecutive_losses = 0;
};

struct PerformanceReport {
    double total_return = 0.0;
    double annualized_return = 0.0;
    double volatility = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;
    double sortino_ratio = 0.0;
    double calmar_ratio = 0.0;
    double var_95 = 0.0;
    double cvar_95 = 0.0;

    bool has_benchmark = false;
    double beta = 0.0;
    double alpha = 0.0;
    double information_ratio = 0.0;

    TradeStatistics trades;

    int trading_days = 0;
    std::string start_date;
    std::string end_date;
};

// Infinite ratios are written as "inf" / "-inf"
nlohmann::json toJson(const PerformanceReport& report);

// Risk/return statistics over a daily snapshot series. Every metric returns a
// sentinel instead of failing on short input or zero denominators.
class PerformanceAnalyzer {
public:
    static constexpr int TRADING_DAYS_PER_YEAR = 252;

    explicit PerformanceAnalyzer(double risk_free_rate = 0.03);

    double riskFreeRate() const { return risk_free_rate_; }

    // value[i] / value[i-1] - 1 for i >= 1
    static std::vector<double> dailyReturns(const std::vector<DailySnapshot>& snapshots);
    static std::vector<double> cumulativeReturns(const std::vector<DailySnapshot>& snapshots,
                                                 double initial_capital);

    static double totalReturn(const std::vector<DailySnapshot>& snapshots, double initial_capital);
    static double annualizedReturn(const std::vector<DailySnapshot>& snapshots, double initial_capital);
    static double volatility(const std::vector<DailySnapshot>& snapshots);
    static double maxDrawdown(const std::vector<DailySnapshot>& snapshots);

    double sharpeRatio(const std::vector<DailySnapshot>& snapshots, double initial_capital) const;
    double sortinoRatio(const std::vector<DailySnapshot>& snapshots, double initial_capital) const;
    static double calmarRatio(const std::vector<DailySnapshot>& snapshots, double initial_capital);

    // Linear-interpolated (1 - confidence) percentile of daily returns
    static double valueAtRisk(const std::vector<DailySnapshot>& snapshots, double confidence = 0.95);
    // Mean of daily returns at or below VaR
    static double conditionalValueAtRisk(const std::vector<DailySnapshot>& snapshots,
                                         double confidence = 0.95);

    // Benchmark-relative metrics use the dates present in both series
    static double beta(const std::vector<DailySnapshot>& snapshots, const BenchmarkReturns& benchmark);
    double alpha(const std::vector<DailySnapshot>& snapshots, double initial_capital,
                 const BenchmarkReturns& benchmark) const;
    static double informationRatio(const std::vector<DailySnapshot>& snapshots,
                                   const BenchmarkReturns& benchmark);

    // Sell trades only
    static TradeStatistics analyzeTrades(const std::vector<TradeRecord>& trades);

    PerformanceReport generateReport(const std::vector<DailySnapshot>& snapshots,
                                     const std::vector<TradeRecord>& trades,
                                     double initial_capital,
                                     const BenchmarkReturns* benchmark = nullptr) const;

private:
    double risk_free_rate_;
};

} // namespace backtest
} // namespace quantsim
