#include "backtest/PerformanceAnalyzer.h"
#include "common/DateUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace quantsim {
namespace backtest {

namespace {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Sample (n - 1) standard deviation, 0 below two observations
double sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double sampleCovariance(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() < 2 || a.size() != b.size()) {
        return 0.0;
    }
    const double ma = mean(a);
    const double mb = mean(b);
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += (a[i] - ma) * (b[i] - mb);
    }
    return sum / static_cast<double>(a.size() - 1);
}

// numpy-style linear percentile, q in [0, 1]
double linearPercentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    q = std::min(1.0, std::max(0.0, q));
    const double pos = q * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(pos));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double frac = pos - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * frac;
}

// Daily returns paired with the benchmark on dates both series cover
void alignWithBenchmark(const std::vector<DailySnapshot>& snapshots,
                        const BenchmarkReturns& benchmark,
                        std::vector<double>& returns_out,
                        std::vector<double>& benchmark_out) {
    returns_out.clear();
    benchmark_out.clear();
    const auto returns = PerformanceAnalyzer::dailyReturns(snapshots);
    for (size_t i = 0; i < returns.size(); ++i) {
        const auto it = benchmark.find(utils::dayKey(snapshots[i + 1].timestamp));
        if (it == benchmark.end() || !std::isfinite(it->second)) {
            continue;
        }
        returns_out.push_back(returns[i]);
        benchmark_out.push_back(it->second);
    }
}

double annualize(double mean_daily_return) {
    return std::pow(1.0 + mean_daily_return, PerformanceAnalyzer::TRADING_DAYS_PER_YEAR) - 1.0;
}

nlohmann::json ratioToJson(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    if (std::isnan(value)) {
        return nullptr;
    }
    return value;
}

} // namespace

PerformanceAnalyzer::PerformanceAnalyzer(double risk_free_rate)
    : risk_free_rate_(risk_free_rate) {
}

std::vector<double> PerformanceAnalyzer::dailyReturns(const std::vector<DailySnapshot>& snapshots) {
    std::vector<double> returns;
    if (snapshots.size() < 2) {
        return returns;
    }
    returns.reserve(snapshots.size() - 1);
    for (size_t i = 1; i < snapshots.size(); ++i) {
        const double prev = snapshots[i - 1].total_value;
        returns.push_back(prev > 0.0 ? snapshots[i].total_value / prev - 1.0 : 0.0);
    }
    return returns;
}

std::vector<double> PerformanceAnalyzer::cumulativeReturns(const std::vector<DailySnapshot>& snapshots,
                                                           double initial_capital) {
    std::vector<double> cumulative;
    if (initial_capital <= 0.0) {
        cumulative.assign(snapshots.size(), 0.0);
        return cumulative;
    }
    cumulative.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
        cumulative.push_back(snapshot.total_value / initial_capital - 1.0);
    }
    return cumulative;
}

double PerformanceAnalyzer::totalReturn(const std::vector<DailySnapshot>& snapshots, double initial_capital) {
    if (snapshots.empty() || initial_capital <= 0.0) {
        return 0.0;
    }
    return snapshots.back().total_value / initial_capital - 1.0;
}

double PerformanceAnalyzer::annualizedReturn(const std::vector<DailySnapshot>& snapshots,
                                             double initial_capital) {
    if (snapshots.size() < 2) {
        return 0.0;
    }
    const double growth = 1.0 + totalReturn(snapshots, initial_capital);
    if (growth <= 0.0) {
        return -1.0;
    }
    const double years = static_cast<double>(snapshots.size()) / TRADING_DAYS_PER_YEAR;
    return std::pow(growth, 1.0 / years) - 1.0;
}

double PerformanceAnalyzer::volatility(const std::vector<DailySnapshot>& snapshots) {
    return sampleStdDev(dailyReturns(snapshots)) * std::sqrt(static_cast<double>(TRADING_DAYS_PER_YEAR));
}

double PerformanceAnalyzer::maxDrawdown(const std::vector<DailySnapshot>& snapshots) {
    double peak = 0.0;
    double worst = 0.0;
    for (const auto& snapshot : snapshots) {
        peak = std::max(peak, snapshot.total_value);
        if (peak <= 0.0) {
            continue;
        }
        worst = std::min(worst, (snapshot.total_value - peak) / peak);
    }
    return worst;
}

double PerformanceAnalyzer::sharpeRatio(const std::vector<DailySnapshot>& snapshots,
                                        double initial_capital) const {
    const double vol = volatility(snapshots);
    if (vol == 0.0) {
        return 0.0;
    }
    return (annualizedReturn(snapshots, initial_capital) - risk_free_rate_) / vol;
}

double PerformanceAnalyzer::sortinoRatio(const std::vector<DailySnapshot>& snapshots,
                                         double initial_capital) const {
    if (snapshots.empty()) {
        return 0.0;
    }
    std::vector<double> negative;
    for (double r : dailyReturns(snapshots)) {
        if (r < 0.0) {
            negative.push_back(r);
        }
    }
    if (negative.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    const double downside = sampleStdDev(negative) * std::sqrt(static_cast<double>(TRADING_DAYS_PER_YEAR));
    if (downside == 0.0) {
        return 0.0;
    }
    return (annualizedReturn(snapshots, initial_capital) - risk_free_rate_) / downside;
}

double PerformanceAnalyzer::calmarRatio(const std::vector<DailySnapshot>& snapshots, double initial_capital) {
    if (snapshots.empty()) {
        return 0.0;
    }
    const double drawdown = std::fabs(maxDrawdown(snapshots));
    if (drawdown == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return annualizedReturn(snapshots, initial_capital) / drawdown;
}

double PerformanceAnalyzer::valueAtRisk(const std::vector<DailySnapshot>& snapshots, double confidence) {
    return linearPercentile(dailyReturns(snapshots), 1.0 - confidence);
}

double PerformanceAnalyzer::conditionalValueAtRisk(const std::vector<DailySnapshot>& snapshots,
                                                   double confidence) {
    const auto returns = dailyReturns(snapshots);
    if (returns.empty()) {
        return 0.0;
    }
    const double var = linearPercentile(returns, 1.0 - confidence);
    std::vector<double> tail;
    for (double r : returns) {
        if (r <= var) {
            tail.push_back(r);
        }
    }
    return mean(tail);
}

double PerformanceAnalyzer::beta(const std::vector<DailySnapshot>& snapshots,
                                 const BenchmarkReturns& benchmark) {
    std::vector<double> returns;
    std::vector<double> bench;
    alignWithBenchmark(snapshots, benchmark, returns, bench);
    if (returns.size() < 2) {
        return 0.0;
    }
    const double sd = sampleStdDev(bench);
    const double variance = sd * sd;
    if (variance == 0.0) {
        return 0.0;
    }
    return sampleCovariance(returns, bench) / variance;
}

double PerformanceAnalyzer::alpha(const std::vector<DailySnapshot>& snapshots, double initial_capital,
                                  const BenchmarkReturns& benchmark) const {
    std::vector<double> returns;
    std::vector<double> bench;
    alignWithBenchmark(snapshots, benchmark, returns, bench);
    if (bench.empty()) {
        return 0.0;
    }
    const double b = beta(snapshots, benchmark);
    const double benchmark_annualized = annualize(mean(bench));
    return annualizedReturn(snapshots, initial_capital) -
           (risk_free_rate_ + b * (benchmark_annualized - risk_free_rate_));
}

double PerformanceAnalyzer::informationRatio(const std::vector<DailySnapshot>& snapshots,
                                             const BenchmarkReturns& benchmark) {
    std::vector<double> returns;
    std::vector<double> bench;
    alignWithBenchmark(snapshots, benchmark, returns, bench);
    if (returns.size() < 2) {
        return 0.0;
    }
    std::vector<double> excess(returns.size());
    for (size_t i = 0; i < returns.size(); ++i) {
        excess[i] = returns[i] - bench[i];
    }
    const double tracking_error = sampleStdDev(excess) * std::sqrt(static_cast<double>(TRADING_DAYS_PER_YEAR));
    if (tracking_error == 0.0) {
        return 0.0;
    }
    return annualize(mean(excess)) / tracking_error;
}

TradeStatistics PerformanceAnalyzer::analyzeTrades(const std::vector<TradeRecord>& trades) {
    TradeStatistics stats;
    std::vector<double> wins;
    std::vector<double> losses;
    int win_streak = 0;
    int loss_streak = 0;

    for (const auto& trade : trades) {
        if (trade.direction != OrderSide::SELL) {
            continue;
        }
        stats.total_trades++;
        const double profit = trade.profit.value_or(0.0);
        if (profit > 0.0) {
            wins.push_back(profit);
            ++win_streak;
            loss_streak = 0;
        } else if (profit < 0.0) {
            losses.push_back(profit);
            ++loss_streak;
            win_streak = 0;
        } else {
            win_streak = 0;
            loss_streak = 0;
        }
        stats.max_consecutive_wins = std::max(stats.max_consecutive_wins, win_streak);
        stats.max_consecutive_losses = std::max(stats.max_consecutive_losses, loss_streak);
    }

    if (stats.total_trades == 0) {
        return stats;
    }

    stats.winning_trades = static_cast<int>(wins.size());
    stats.losing_trades = static_cast<int>(losses.size());
    stats.win_rate = static_cast<double>(stats.winning_trades) / stats.total_trades;
    stats.total_profit = std::accumulate(wins.begin(), wins.end(), 0.0);
    stats.total_loss = std::fabs(std::accumulate(losses.begin(), losses.end(), 0.0));
    stats.avg_profit = mean(wins);
    stats.avg_loss = mean(losses);

    // No losing sells at all counts as an unbounded profit factor, break-even sells included
    if (stats.total_loss > 0.0) {
        stats.profit_factor = stats.total_profit / stats.total_loss;
    } else {
        stats.profit_factor = std::numeric_limits<double>::infinity();
    }
    return stats;
}

PerformanceReport PerformanceAnalyzer::generateReport(const std::vector<DailySnapshot>& snapshots,
                                                      const std::vector<TradeRecord>& trades,
                                                      double initial_capital,
                                                      const BenchmarkReturns* benchmark) const {
    PerformanceReport report;
    report.trades = analyzeTrades(trades);
    report.trading_days = static_cast<int>(snapshots.size());
    if (snapshots.empty()) {
        return report;
    }

    report.start_date = utils::formatDate(snapshots.front().timestamp);
    report.end_date = utils::formatDate(snapshots.back().timestamp);

    report.total_return = totalReturn(snapshots, initial_capital);
    report.annualized_return = annualizedReturn(snapshots, initial_capital);
    report.volatility = volatility(snapshots);
    report.sharpe_ratio = sharpeRatio(snapshots, initial_capital);
    report.max_drawdown = maxDrawdown(snapshots);
    report.sortino_ratio = sortinoRatio(snapshots, initial_capital);
    report.calmar_ratio = calmarRatio(snapshots, initial_capital);
    report.var_95 = valueAtRisk(snapshots, 0.95);
    report.cvar_95 = conditionalValueAtRisk(snapshots, 0.95);

    if (benchmark && !benchmark->empty()) {
        report.has_benchmark = true;
        report.beta = beta(snapshots, *benchmark);
        report.alpha = alpha(snapshots, initial_capital, *benchmark);
        report.information_ratio = informationRatio(snapshots, *benchmark);
    }
    return report;
}

nlohmann::json toJson(const PerformanceReport& report) {
    nlohmann::json j;
    j["total_return"] = report.total_return;
    j["annualized_return"] = report.annualized_return;
    j["volatility"] = report.volatility;
    j["sharpe_ratio"] = ratioToJson(report.sharpe_ratio);
    j["max_drawdown"] = report.max_drawdown;
    j["sortino_ratio"] = ratioToJson(report.sortino_ratio);
    j["calmar_ratio"] = ratioToJson(report.calmar_ratio);
    j["var_95"] = report.var_95;
    j["cvar_95"] = report.cvar_95;
    if (report.has_benchmark) {
        j["beta"] = report.beta;
        j["alpha"] = report.alpha;
        j["information_ratio"] = ratioToJson(report.information_ratio);
    }

    const auto& t = report.trades;
    j["total_trades"] = t.total_trades;
    j["winning_trades"] = t.winning_trades;
    j["losing_trades"] = t.losing_trades;
    j["win_rate"] = t.win_rate;
    j["profit_factor"] = ratioToJson(t.profit_factor);
    j["avg_profit"] = t.avg_profit;
    j["avg_loss"] = t.avg_loss;
    j["total_profit"] = t.total_profit;
    j["total_loss"] = t.total_loss;
    j["max_consecutive_wins"] = t.max_consecutive_wins;
    j["max_consecutive_losses"] = t.max_consecutive_losses;

    j["trading_days"] = report.trading_days;
    j["start_date"] = report.start_date;
    j["end_date"] = report.end_date;
    return j;
}

} // namespace backtest
} // namespace quantsim
